#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render checks.
 * Records every refreshed frame and every enter/leave call, and replays a
 * scripted key sequence (optionally resizing the screen when a key is read).
 * Note: once the script runs out read_key returns 'q' so a loop always ends.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  void push_key(int ch);
  void push_keys(const std::vector<int>& keys);
  void push_resize(int rows, int cols);
  void fail_enter(const std::string& msg) { enter_error_ = msg; }

  bool enter(std::string& msg) override;
  void leave() override;
  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void clear_to_eol(int row, int col) override;
  void refresh() override;
  int read_key() override;

  int enter_calls() const { return enter_calls_; }
  int leave_calls() const { return leave_calls_; }
  bool in_raw_mode() const { return raw_; }
  int keys_read() const { return keys_read_; }
  const std::vector<std::vector<std::string>>& frames() const { return frames_; }
  // row of the last refreshed frame, trailing blanks removed
  std::string frame_row(int row) const;
  const std::string& last_highlight() const { return last_highlight_; }

private:
  struct Event { int key; int rows; int cols; };
  void put(int row, int col, const std::string& text);

  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::vector<std::vector<std::string>> frames_;
  std::deque<Event> script_;
  std::string enter_error_;
  std::string last_highlight_;
  bool raw_ = false;
  int enter_calls_ = 0;
  int leave_calls_ = 0;
  int keys_read_ = 0;
};
