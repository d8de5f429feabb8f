#pragma once
/*
 * UniqueFd
 *
 * Purpose: sole owner of a POSIX descriptor; closes it on every exit path.
 * Note: read_some retries on EINTR so a resize signal never looks like EOF.
 */
#include <cerrno>
#include <cstddef>
#include <sys/types.h>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { reset(other.fd_); other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { reset(); }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }

  ssize_t read_some(char* dst, size_t n) const {
    for (;;) {
      ssize_t r = ::read(fd_, dst, n);
      if (r >= 0 || errno != EINTR) return r;
    }
  }

private:
  int fd_ = -1;
};
