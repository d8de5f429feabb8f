#pragma once
/*
 * Document
 *
 * Purpose: the file being paged; owns the descriptor, knows the total size
 * and how many bytes have been displayed so far.
 * Usage: open(path, msg); then read_rows() once per page until at_eof().
 * Note: rows are display-ready (tabs expanded, control bytes as ^X) and never
 * wider than the requested width; line terminators count toward offset().
 */
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "posix_fd.hpp"

class Document {
public:
  bool open(const std::filesystem::path& path, std::string& msg);
  bool is_open() const { return fd_.valid(); }
  void close();

  const std::filesystem::path& path() const { return path_; }
  size_t size() const { return size_; }
  size_t offset() const { return consumed_; }
  bool at_eof() const { return consumed_ >= size_; }

  bool read_rows(int max_rows, int width, int tab_width,
                 std::vector<std::string>& out, std::string& msg);

private:
  bool fill(size_t limit, std::string& msg);
  size_t next_row(int width, int tab_width, std::string& row) const;
  size_t terminator_at(size_t i) const;

  UniqueFd fd_;
  std::filesystem::path path_;
  size_t size_ = 0;
  size_t read_pos_ = 0;
  size_t consumed_ = 0;
  std::string pending_;
  size_t head_ = 0;
};
