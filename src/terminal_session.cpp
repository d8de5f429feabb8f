#include "terminal_session.hpp"

bool TerminalSession::open(std::string& msg) {
  if (active_) return true;
  active_ = term_.enter(msg);
  return active_;
}

void TerminalSession::close() {
  if (!active_) return;
  term_.leave();
  active_ = false;
}

TerminalSession::~TerminalSession() {
  close();
}
