#pragma once
/*
 * Pager
 *
 * Purpose: page through one file: open it, take over the terminal, render a
 * screenful at a time with read progress, advance on a key, quit on q.
 * Dependency: ITerminal (ncurses or headless), Document, Renderer, Input.
 * Note: never throws; failures come back as Error and are reported by the
 * caller after TerminalSession has already restored the terminal.
 */
#include <filesystem>
#include <string>
#include "config.hpp"
#include "document.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "terminal_session.hpp"
#include "types.hpp"

// round(100 * consumed / total), held below 100 until everything is shown
int progress_percent(size_t consumed, size_t total);

class Pager {
public:
  Pager(ITerminal& term, const PagerOptions& opts);

  // shown on the status line of the first page (rc-file diagnostics)
  void set_startup_message(const std::string& m) { startup_message_ = m; }

  bool open(const std::filesystem::path& path, Document& doc, Error& err);
  bool init_terminal(TerminalSession& ts, Viewport& vp, Error& err);
  bool measure(Viewport& vp, Error& err) const;
  bool render_next_page(Document& doc, Session& s, const Viewport& vp, Error& err);
  void redraw(const Session& s, const Viewport& vp);
  Command wait_for_command();
  bool run(const std::filesystem::path& path, Error& err);

private:
  ITerminal& term_;
  PagerOptions opts_;
  Renderer renderer_;
  Input input_;
  std::string startup_message_;
};
