#include "headless_terminal.hpp"
#include <algorithm>
#include <ncurses.h>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols), grid_(rows, std::string(cols, ' ')) {}

void HeadlessTerminal::push_key(int ch) { script_.push_back({ch, 0, 0}); }

void HeadlessTerminal::push_keys(const std::vector<int>& keys) {
  for (int k : keys) push_key(k);
}

void HeadlessTerminal::push_resize(int rows, int cols) { script_.push_back({KEY_RESIZE, rows, cols}); }

bool HeadlessTerminal::enter(std::string& msg) {
  enter_calls_++;
  if (!enter_error_.empty()) { msg = enter_error_; return false; }
  raw_ = true;
  return true;
}

void HeadlessTerminal::leave() {
  leave_calls_++;
  raw_ = false;
}

void HeadlessTerminal::clear() {
  for (auto& r : grid_) r.assign(cols_, ' ');
}

void HeadlessTerminal::put(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    grid_[row][c] = text[i];
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text); }

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  put(row, col, text);
  int len = static_cast<int>(text.size());
  int s = std::clamp(hl_start, 0, len);
  int e = std::clamp(s + std::max(0, hl_len), s, len);
  last_highlight_ = text.substr(s, e - s);
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  for (int c = std::max(0, col); c < cols_; ++c) grid_[row][c] = ' ';
}

void HeadlessTerminal::refresh() { frames_.push_back(grid_); }

int HeadlessTerminal::read_key() {
  keys_read_++;
  if (script_.empty()) return 'q';
  Event ev = script_.front();
  script_.pop_front();
  if (ev.key == KEY_RESIZE) {
    rows_ = ev.rows;
    cols_ = ev.cols;
    grid_.assign(rows_, std::string(cols_, ' '));
  }
  return ev.key;
}

std::string HeadlessTerminal::frame_row(int row) const {
  if (frames_.empty() || row < 0 || row >= static_cast<int>(frames_.back().size())) return std::string();
  std::string s = frames_.back()[row];
  size_t end = s.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}
