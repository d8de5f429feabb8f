#pragma once
/*
 * Config
 *
 * Purpose: pager options and the rc-file loader that sets them.
 * Usage: Config cfg; cfg.load_rc(path, notes); pass cfg.options() to Pager.
 * Note: rc lines are ":set name value" style commands; the file is never written.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"

/*compile-time defaults, overridable with -D*/

#ifndef MPAGER_DEFAULT_PADDING
#define MPAGER_DEFAULT_PADDING 4
#endif

#ifndef MPAGER_DEFAULT_TABSTOP
#define MPAGER_DEFAULT_TABSTOP 8
#endif

#define MPAGER_RC_NAME ".pagerrc"

struct PagerOptions {
  int padding = MPAGER_DEFAULT_PADDING;
  int tab_width = MPAGER_DEFAULT_TABSTOP;
  bool quit_at_eof = false;
  bool show_hint = true;
};

class Config {
public:
  Config();
  PagerOptions& options() { return opts_; }
  const PagerOptions& options() const { return opts_; }

  // runs one rc line; blank lines and comments succeed without effect
  bool execute(const std::string& line, std::string& msg);
  // missing or unreadable file and bad lines are reported in notes, never fatal
  bool load_rc(const std::filesystem::path& path, std::vector<std::string>& notes);
  static std::optional<std::filesystem::path> default_rc_path();

private:
  void register_commands();
  PagerOptions opts_;
  CommandRegistry registry_;
};
