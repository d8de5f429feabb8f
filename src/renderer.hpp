#pragma once
/*
 * Renderer
 *
 * Purpose: draw one page of rows, the progress status line and the quit hint.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a Session snapshot from Pager to render.
 */
#include <string>
#include "iterminal.hpp"
#include "types.hpp"

std::string status_text(const Session& s);

class Renderer {
public:
  void render(ITerminal& term, const Viewport& vp, const Session& s, bool show_hint);
};
