#include "cli.hpp"
#include <string_view>

const char* usage_text() {
  return "usage: pager --fname <path> [--rc <file>]\n"
         "  --fname <path>  file to page through (required)\n"
         "  --rc <file>     read options from <file> instead of ~/.pagerrc\n"
         "  -h, --help      show this help\n"
         "keys: q quits, any other key shows the next page\n";
}

// accepts "--opt value" and "--opt=value"
static bool take_value(std::string_view arg, std::string_view opt, int& i, int argc, char** argv,
                       std::string& value, bool& matched, std::string& msg) {
  matched = false;
  if (arg == opt) {
    matched = true;
    if (i + 1 >= argc) { msg = std::string("missing value for ") + std::string(opt); return false; }
    value = argv[++i];
  } else if (arg.size() > opt.size() && arg.substr(0, opt.size()) == opt && arg[opt.size()] == '=') {
    matched = true;
    value = std::string(arg.substr(opt.size() + 1));
  } else {
    return true;
  }
  if (value.empty()) { msg = std::string("empty value for ") + std::string(opt); return false; }
  return true;
}

bool parse_args(int argc, char** argv, CliOptions& out, std::string& msg) {
  out = CliOptions{};
  bool have_file = false;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") { out.help = true; return true; }
    std::string value;
    bool matched = false;
    if (!take_value(arg, "--fname", i, argc, argv, value, matched, msg)) return false;
    if (matched) {
      if (have_file) { msg = "--fname given more than once"; return false; }
      out.file = value;
      have_file = true;
      continue;
    }
    if (!take_value(arg, "--rc", i, argc, argv, value, matched, msg)) return false;
    if (matched) { out.rc = std::filesystem::path(value); continue; }
    msg = "unknown argument: " + std::string(arg);
    return false;
  }
  if (!have_file) { msg = "the --fname option is required"; return false; }
  return true;
}
