#include "config.hpp"
#include "test_util.hpp"
#include <cassert>
#include <string>
#include <vector>

static void test_defaults() {
  Config c;
  assert(c.options().padding == 4);
  assert(c.options().tab_width == 8);
  assert(!c.options().quit_at_eof);
  assert(c.options().show_hint);
}

static void test_set_commands() {
  Config c; std::string msg;
  assert(c.execute("set padding 2", msg));
  assert(c.options().padding == 2);
  assert(c.execute(":set tabstop=4", msg));
  assert(c.options().tab_width == 4);
  assert(msg == "tabstop=4");
  assert(c.execute("set ts 2", msg));
  assert(c.options().tab_width == 2);
  assert(c.execute("set quitateof", msg));
  assert(c.options().quit_at_eof);
  assert(msg == "quitateof on");
  assert(c.execute("set quitateof off", msg));
  assert(!c.options().quit_at_eof);
  assert(c.execute("  set hint off  ", msg));
  assert(!c.options().show_hint);
}

static void test_comments_and_blanks() {
  Config c; std::string msg;
  assert(c.execute("", msg));
  assert(c.execute("   ", msg));
  assert(c.execute("# set padding 0", msg));
  assert(c.execute("\" set padding 0", msg));
  assert(c.execute("// set padding 0", msg));
  assert(c.options().padding == 4);
}

static void test_rejects_bad_values() {
  Config c; std::string msg;
  assert(!c.execute("set padding 3", msg));
  assert(!c.execute("set padding 10", msg));
  assert(!c.execute("set padding two", msg));
  assert(!c.execute("set padding", msg));
  assert(c.options().padding == 4);
  assert(!c.execute("set tabstop 0", msg));
  assert(!c.execute("set hint maybe", msg));
  assert(c.options().show_hint);
  assert(!c.execute("set colour on", msg));
  assert(msg == "unknown command: set colour");
  assert(!c.execute("search foo", msg));
  assert(msg == "unknown command: search");
}

static void test_load_rc_collects_notes() {
  TempFile rc("# pager options\nset padding 0\nset bogus 1\n:set quitateof on\r\nset tabstop 99\n", "rc");
  Config c;
  std::vector<std::string> notes;
  assert(!c.load_rc(rc.path(), notes));
  assert(c.options().padding == 0);
  assert(c.options().quit_at_eof);
  assert(c.options().tab_width == 8);
  assert(notes.size() == 2);
  assert(notes[0].find(":3: unknown command: set bogus") != std::string::npos);
  assert(notes[1].find(":5: set tabstop") != std::string::npos);
}

static void test_load_rc_missing_file() {
  Config c;
  std::vector<std::string> notes;
  assert(!c.load_rc("/nonexistent/mpager/pagerrc", notes));
  assert(notes.size() == 1);
  assert(c.options().padding == 4);
}

int main() {
  test_defaults();
  test_set_commands();
  test_comments_and_blanks();
  test_rejects_bad_values();
  test_load_rc_collects_notes();
  test_load_rc_missing_file();
  return 0;
}
