#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return "ok";
    case ErrorKind::File: return "file error";
    case ErrorKind::Terminal: return "terminal error";
    case ErrorKind::ViewportTooSmall: return "viewport too small";
    case ErrorKind::Usage: return "usage error";
  }
  return "unknown error";
}

int exit_code_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return 0;
    case ErrorKind::File: return 1;
    case ErrorKind::Terminal: return 2;
    case ErrorKind::ViewportTooSmall: return 3;
    case ErrorKind::Usage: return 64;
  }
  return 1;
}
