#include <iostream>
#include <string>
#include <vector>
#include "cli.hpp"
#include "config.hpp"
#include "ncurses_terminal.hpp"
#include "pager.hpp"
#include "types.hpp"

int main(int argc, char** argv) {
  CliOptions cli;
  std::string msg;
  if (!parse_args(argc, argv, cli, msg)) {
    std::cerr << "pager: " << msg << "\n" << usage_text();
    return exit_code_for(ErrorKind::Usage);
  }
  if (cli.help) { std::cout << usage_text(); return 0; }

  Config cfg;
  std::vector<std::string> notes;
  auto rc = cli.rc ? cli.rc : Config::default_rc_path();
  bool rc_ok = !rc || cfg.load_rc(*rc, notes);

  NcursesTerminal term;
  Pager pager(term, cfg.options());
  if (!rc_ok && !notes.empty()) {
    std::string first = notes.front();
    if (notes.size() > 1) first += " (+" + std::to_string(notes.size() - 1) + " more)";
    pager.set_startup_message(first);
  }
  Error err;
  if (!pager.run(cli.file, err)) {
    std::cerr << "pager: " << error_kind_name(err.kind) << ": " << err.msg << "\n";
    return exit_code_for(err.kind);
  }
  return 0;
}
