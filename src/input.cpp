#include "input.hpp"
#include <ncurses.h>

static constexpr int CTRL_c = 'C' - 64;

Command Input::map_key(int ch) const {
  // raw mode delivers ^C as a key; a negative code means stdin is gone
  if (ch < 0 || ch == 'q' || ch == 'Q' || ch == CTRL_c) return Command::Quit;
  if (ch == KEY_RESIZE) return Command::Redraw;
  return Command::Advance;
}
