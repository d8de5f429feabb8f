#pragma once
/*
 * Layout
 *
 * Purpose: place the content rectangle and status row inside the terminal.
 * Constraint: content needs at least one row, and the status line plus quit
 * hint must fit beside each other; anything smaller is rejected.
 */
#include <string>
#include "iterminal.hpp"
#include "types.hpp"

constexpr int kMinContentRows = 1;
constexpr int kMinContentCols = 24;

int min_terminal_rows(int padding);
int min_terminal_cols(int padding);

bool compute_viewport(TermSize size, int padding, Viewport& vp, std::string& msg);
