#include "layout.hpp"
#include "input.hpp"
#include "renderer.hpp"
#include <cassert>
#include <ncurses.h>
#include <string>

static void test_viewport_geometry() {
  Viewport vp; std::string msg;
  assert(compute_viewport({15, 40}, 4, vp, msg));
  assert(vp.top == 2 && vp.left == 2);
  assert(vp.height == 10);
  assert(vp.width == 36);
  assert(vp.status_row == 14);

  assert(compute_viewport({24, 80}, 0, vp, msg));
  assert(vp.top == 0 && vp.left == 0);
  assert(vp.height == 23 && vp.width == 80);
}

static void test_minimum_viewport() {
  Viewport vp; std::string msg;
  assert(min_terminal_rows(4) == 6);
  assert(min_terminal_cols(4) == 28);
  assert(compute_viewport({6, 28}, 4, vp, msg));
  assert(vp.height == 1);
  assert(!compute_viewport({5, 80}, 4, vp, msg));
  assert(msg == "terminal is 80x5, need at least 28x6");
  assert(!compute_viewport({24, 27}, 4, vp, msg));
  assert(compute_viewport({2, 24}, 0, vp, msg));
  assert(!compute_viewport({1, 80}, 0, vp, msg));
}

static void test_key_mapping() {
  Input in;
  assert(in.map_key('q') == Command::Quit);
  assert(in.map_key('Q') == Command::Quit);
  assert(in.map_key(3) == Command::Quit);
  assert(in.map_key(-1) == Command::Quit);
  assert(in.map_key(KEY_RESIZE) == Command::Redraw);
  assert(in.map_key(' ') == Command::Advance);
  assert(in.map_key('\n') == Command::Advance);
  assert(in.map_key(KEY_DOWN) == Command::Advance);
  assert(in.map_key('w') == Command::Advance);
  assert(in.map_key(27) == Command::Advance);
}

static void test_status_text() {
  Session s;
  s.progress = 42;
  assert(status_text(s) == "--More--(42%)");
  s.at_eof = true;
  s.progress = 100;
  assert(status_text(s) == "(END)");
}

int main() {
  test_viewport_geometry();
  test_minimum_viewport();
  test_key_mapping();
  test_status_text();
  return 0;
}
