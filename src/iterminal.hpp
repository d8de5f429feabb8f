#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (mode, size, clear, draw, refresh, keys).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <string>

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  // full-screen raw mode; enter returns false with msg when unavailable
  virtual bool enter(std::string& msg) = 0;
  virtual void leave() = 0;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  virtual void refresh() = 0;
  // blocks for one key; returns a negative value when input is gone
  virtual int read_key() = 0;
};
