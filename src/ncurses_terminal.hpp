#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing, key input and
 * the raw/full-screen mode switch.
 * Note: uses newterm so a bad $TERM is reported instead of exiting the process.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal() = default;
  ~NcursesTerminal() override;
  NcursesTerminal(const NcursesTerminal&) = delete;
  NcursesTerminal& operator=(const NcursesTerminal&) = delete;

  bool enter(std::string& msg) override;
  void leave() override;
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void clear_to_eol(int row, int col) override;
  void refresh() override;
  int read_key() override;
private:
  SCREEN* screen_ = nullptr;
};
