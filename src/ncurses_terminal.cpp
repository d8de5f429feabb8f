#include "ncurses_terminal.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <locale.h>
#include <unistd.h>

NcursesTerminal::~NcursesTerminal() {
  leave();
}

bool NcursesTerminal::enter(std::string& msg) {
  if (screen_) return true;
  if (!::isatty(STDIN_FILENO) || !::isatty(STDOUT_FILENO)) {
    msg = "standard input and output must be a terminal";
    return false;
  }
  setlocale(LC_ALL, "");
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) {
    const char* t = std::getenv("TERM");
    msg = std::string("can not initialize terminal type: ") + (t ? t : "(unset)");
    return false;
  }
  set_term(screen_);
  raw();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  set_escdelay(25);
  return true;
}

void NcursesTerminal::leave() {
  if (!screen_) return;
  endwin();
  delscreen(screen_);
  screen_ = nullptr;
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  if (hl_start > 0) {
    mvaddnstr(row, col, text.c_str(), hl_start);
    col += hl_start;
  }
  if (hl_end > hl_start) {
    attron(A_REVERSE);
    mvaddnstr(row, col, text.c_str() + hl_start, hl_end - hl_start);
    attroff(A_REVERSE);
    col += hl_end - hl_start;
  }
  if (hl_end < len) {
    mvaddnstr(row, col, text.c_str() + hl_end, len - hl_end);
  }
}

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

void NcursesTerminal::refresh() { ::refresh(); }

int NcursesTerminal::read_key() {
  for (;;) {
    errno = 0;
    int ch = wgetch(stdscr);
    if (ch != ERR) return ch;
    if (errno != EINTR) return -1;
  }
}
