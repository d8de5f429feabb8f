#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Viewport/Session/Command/Error).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>
#include <string>
#include <vector>

enum class Command { Advance, Quit, Redraw };

enum class ErrorKind { None, File, Terminal, ViewportTooSmall, Usage };

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string msg;
};

const char* error_kind_name(ErrorKind kind);
// process exit status for an error kind; None maps to 0
int exit_code_for(ErrorKind kind);

// rows/cols: whole terminal. top/left/height/width: content rectangle.
struct Viewport {
  int rows = 0;
  int cols = 0;
  int top = 0;
  int left = 0;
  int height = 0;
  int width = 0;
  int status_row = 0;
};

struct Session {
  size_t offset = 0;
  int progress = 0;
  int pages = 0;
  bool at_eof = false;
  bool done = false;
  std::vector<std::string> page;
  std::string message;
};
