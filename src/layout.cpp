#include "layout.hpp"

// one row below the content is always reserved for the status line
int min_terminal_rows(int padding) { return padding + kMinContentRows + 1; }
int min_terminal_cols(int padding) { return padding + kMinContentCols; }

bool compute_viewport(TermSize size, int padding, Viewport& vp, std::string& msg) {
  int need_rows = min_terminal_rows(padding);
  int need_cols = min_terminal_cols(padding);
  if (size.rows < need_rows || size.cols < need_cols) {
    msg = "terminal is " + std::to_string(size.cols) + "x" + std::to_string(size.rows) +
          ", need at least " + std::to_string(need_cols) + "x" + std::to_string(need_rows);
    return false;
  }
  int inset = padding / 2;
  vp.rows = size.rows;
  vp.cols = size.cols;
  vp.top = inset;
  vp.left = inset;
  vp.height = size.rows - padding - 1;
  vp.width = size.cols - padding;
  vp.status_row = size.rows - 1;
  return true;
}
