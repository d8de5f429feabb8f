#include "cli.hpp"
#include <cassert>
#include <string>
#include <vector>

static bool parse(std::vector<std::string> args, CliOptions& out, std::string& msg) {
  args.insert(args.begin(), "pager");
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(a.data());
  argv.push_back(nullptr);
  return parse_args(static_cast<int>(args.size()), argv.data(), out, msg);
}

int main() {
  CliOptions o; std::string msg;
  assert(parse({"--fname", "notes.txt"}, o, msg));
  assert(o.file == "notes.txt");
  assert(!o.rc);
  assert(!o.help);

  assert(parse({"--fname=a b.txt", "--rc", "my.rc"}, o, msg));
  assert(o.file == "a b.txt");
  assert(o.rc && *o.rc == "my.rc");

  assert(parse({"--rc=x", "--fname", "f"}, o, msg));
  assert(o.rc && *o.rc == "x");

  assert(parse({"-h"}, o, msg));
  assert(o.help);
  assert(parse({"--help", "--bogus"}, o, msg));
  assert(o.help);

  assert(!parse({}, o, msg));
  assert(msg == "the --fname option is required");
  assert(!parse({"--fname"}, o, msg));
  assert(msg == "missing value for --fname");
  assert(!parse({"--fname="}, o, msg));
  assert(!parse({"--fname", "a", "--fname", "b"}, o, msg));
  assert(!parse({"notes.txt"}, o, msg));
  assert(msg == "unknown argument: notes.txt");
  assert(!parse({"--fnamex=1"}, o, msg));

  assert(std::string(usage_text()).find("--fname <path>") != std::string::npos);
  return 0;
}
