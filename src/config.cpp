#include "config.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include "file_reader.hpp"

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

static bool parse_int(const std::string& s, int& out) {
  const char* first = s.data();
  const char* last = s.data() + s.size();
  auto [p, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && p == last;
}

// no argument toggles; otherwise on|off
static bool parse_switch(const std::string& name, const std::vector<std::string>& args,
                         bool& value, std::string& msg) {
  if (args.empty()) value = !value;
  else if (args[0] == "on") value = true;
  else if (args[0] == "off") value = false;
  else { msg = "set " + name + ": use :set " + name + " on|off"; return false; }
  msg = name + (value ? " on" : " off");
  return true;
}

Config::Config() {
  register_commands();
}

void Config::register_commands() {
  registry_.register_command("set padding", [this](const std::vector<std::string>& args, std::string& msg){
    int v = 0;
    if (args.empty() || !parse_int(args[0], v) || v < 0 || v > 8 || v % 2 != 0) {
      msg = "set padding: use an even number 0..8";
      return false;
    }
    opts_.padding = v;
    msg = "padding=" + std::to_string(v);
    return true;
  });
  auto tabstop = [this](const std::vector<std::string>& args, std::string& msg){
    int v = 0;
    if (args.empty() || !parse_int(args[0], v) || v < 1 || v > 16) {
      msg = "set tabstop: use a number 1..16";
      return false;
    }
    opts_.tab_width = v;
    msg = "tabstop=" + std::to_string(v);
    return true;
  };
  registry_.register_command("set tabstop", tabstop);
  registry_.register_command("set ts", tabstop);
  registry_.register_command("set quitateof", [this](const std::vector<std::string>& args, std::string& msg){
    return parse_switch("quitateof", args, opts_.quit_at_eof, msg);
  });
  registry_.register_command("set hint", [this](const std::vector<std::string>& args, std::string& msg){
    return parse_switch("hint", args, opts_.show_hint, msg);
  });
}

bool Config::execute(const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string name = opt;
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      name = opt.substr(0, eq);
      value = opt.substr(eq + 1);
    }
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    return registry_.execute("set " + name, subargs, msg);
  }
  return registry_.execute(cmd, args, msg);
}

bool Config::load_rc(const std::filesystem::path& path, std::vector<std::string>& notes) {
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(path, lines, msg)) { notes.push_back(msg); return false; }
  bool ok = true;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string m;
    if (!execute(lines[i], m)) {
      notes.push_back(path.filename().string() + ":" + std::to_string(i + 1) + ": " + m);
      ok = false;
    }
  }
  return ok;
}

std::optional<std::filesystem::path> Config::default_rc_path() {
  std::error_code ec;
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  auto p = std::filesystem::path(home) / MPAGER_RC_NAME;
  if (!std::filesystem::exists(p, ec)) return std::nullopt;
  return p;
}
