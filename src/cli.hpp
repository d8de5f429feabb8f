#pragma once
/*
 * Cli
 *
 * Purpose: parse the pager command line (--fname <path>, --rc <file>, --help).
 */
#include <filesystem>
#include <optional>
#include <string>

struct CliOptions {
  std::filesystem::path file;
  std::optional<std::filesystem::path> rc;
  bool help = false;
};

bool parse_args(int argc, char** argv, CliOptions& out, std::string& msg);
const char* usage_text();
