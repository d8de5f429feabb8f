#include "renderer.hpp"
#include <algorithm>
#include "text_width.hpp"

static const std::string kQuitHint = "Exit: 'q'";

// rows arrive display-ready: tabs expanded, control bytes in caret form
static std::string clip_columns(const std::string& s, int width) {
  int col = 0;
  size_t i = 0;
  while (i < s.size()) {
    size_t len = utf8_seq_len(s, i);
    int w = char_columns(s, i, len);
    if (col + w > width) break;
    col += w;
    i += len;
  }
  return s.substr(0, i);
}

std::string status_text(const Session& s) {
  if (s.at_eof) return "(END)";
  return "--More--(" + std::to_string(s.progress) + "%)";
}

void Renderer::render(ITerminal& term, const Viewport& vp, const Session& s, bool show_hint) {
  term.clear();
  int n = std::min(static_cast<int>(s.page.size()), vp.height);
  for (int i = 0; i < n; ++i) {
    std::string line = clip_columns(s.page[i], vp.width);
    term.draw_text(vp.top + i, vp.left, line);
  }

  int hint_col = vp.left + vp.width - static_cast<int>(kQuitHint.size());
  // the bottom-right cell can not be written without scrolling
  if (vp.left + vp.width == vp.cols) hint_col--;
  int status_room = show_hint ? hint_col - 1 : vp.cols;
  std::string status = status_text(s);
  if (!s.message.empty()) status += "  " + s.message;
  status = clip_columns(status, std::max(0, status_room));
  term.draw_highlighted(vp.status_row, 0, status, 0, static_cast<int>(status.size()));
  term.clear_to_eol(vp.status_row, static_cast<int>(status.size()));
  if (show_hint) term.draw_text(vp.status_row, hint_col, kQuitHint);
  term.refresh();
}
