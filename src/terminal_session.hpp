#pragma once
/*
 * TerminalSession
 *
 * Purpose: RAII guard around ITerminal enter/leave.
 * Usage: construct in Pager::run, call open(); destructor restores terminal
 * on every exit path, including early error returns.
 */
#include <string>
#include "iterminal.hpp"

class TerminalSession {
public:
  explicit TerminalSession(ITerminal& term) : term_(term) {}
  ~TerminalSession();
  TerminalSession(const TerminalSession&) = delete;
  TerminalSession& operator=(const TerminalSession&) = delete;

  bool open(std::string& msg);
  void close();
  bool active() const { return active_; }

private:
  ITerminal& term_;
  bool active_ = false;
};
