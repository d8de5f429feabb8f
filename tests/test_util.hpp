#pragma once
/*
 * Test helpers: temporary files removed on scope exit, and line generators.
 */
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <unistd.h>

class TempFile {
public:
  explicit TempFile(const std::string& content, const std::string& tag = "doc") {
    static int seq = 0;
    path_ = std::filesystem::temp_directory_path() /
            ("mpager_" + tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(seq++));
    std::ofstream out(path_, std::ios::binary);
    out << content;
  }
  ~TempFile() { std::error_code ec; std::filesystem::remove(path_, ec); }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;
  const std::filesystem::path& path() const { return path_; }
private:
  std::filesystem::path path_;
};

// "line 01\n" .. "line NN\n": 8 bytes per line for n < 100
inline std::string numbered_lines(int n) {
  std::string s;
  for (int i = 1; i <= n; ++i) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "line %02d\n", i);
    s += buf;
  }
  return s;
}

// descriptor number this process holds open on path, or -1
inline int open_fd_for(const std::filesystem::path& path) {
  std::error_code ec;
  auto want = std::filesystem::canonical(path, ec);
  if (ec) return -1;
  for (const auto& e : std::filesystem::directory_iterator("/proc/self/fd", ec)) {
    std::error_code lec;
    auto target = std::filesystem::read_symlink(e.path(), lec);
    if (!lec && target == want) return std::stoi(e.path().filename().string());
  }
  return -1;
}
