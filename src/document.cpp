#include "document.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <utility>
#include "text_width.hpp"

static constexpr size_t kReadChunk = 64 * 1024;

bool Document::open(const std::filesystem::path& path, std::string& msg) {
  close();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.valid()) {
    msg = std::string("can not open file: ") + path.string() + " (" + std::strerror(errno) + ")";
    return false;
  }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) {
    msg = std::string("can not read file stat: ") + path.string();
    return false;
  }
  if (S_ISDIR(st.st_mode)) { msg = std::string("is a directory: ") + path.string(); return false; }
  if (!S_ISREG(st.st_mode)) { msg = std::string("not a regular file: ") + path.string(); return false; }
  (void)::posix_fadvise(fd.get(), 0, 0, POSIX_FADV_SEQUENTIAL);
  fd_ = std::move(fd);
  path_ = path;
  size_ = static_cast<size_t>(st.st_size);
  return true;
}

void Document::close() {
  fd_.reset();
  path_.clear();
  size_ = read_pos_ = consumed_ = head_ = 0;
  pending_.clear();
}

// Reads until the buffered bytes hold a '\n', reach limit, or the size seen at
// open has been read. A file that shrinks underneath us ends early.
bool Document::fill(size_t limit, std::string& msg) {
  while (read_pos_ < size_ && pending_.size() - head_ < limit &&
         pending_.find('\n', head_) == std::string::npos) {
    if (head_ > 0) { pending_.erase(0, head_); head_ = 0; }
    size_t want = std::min(kReadChunk, size_ - read_pos_);
    size_t old = pending_.size();
    pending_.resize(old + want);
    ssize_t r = fd_.read_some(&pending_[old], want);
    if (r < 0) {
      pending_.resize(old);
      msg = std::string("read failed: ") + path_.string() + " (" + std::strerror(errno) + ")";
      return false;
    }
    pending_.resize(old + static_cast<size_t>(r));
    read_pos_ += static_cast<size_t>(r);
    if (r == 0) size_ = read_pos_;
  }
  return true;
}

size_t Document::terminator_at(size_t i) const {
  if (i >= pending_.size()) return 0;
  if (pending_[i] == '\n') return 1;
  if (pending_[i] == '\r') return (i + 1 < pending_.size() && pending_[i + 1] == '\n') ? 2 : 1;
  return 0;
}

size_t Document::next_row(int width, int tab_width, std::string& row) const {
  row.clear();
  size_t i = head_;
  size_t n = pending_.size();
  int col = 0;
  while (i < n) {
    if (size_t t = terminator_at(i)) return i + t - head_;
    unsigned char c = static_cast<unsigned char>(pending_[i]);
    size_t len = 1;
    int w = 1;
    if (c == '\t') w = std::min(tab_width - col % tab_width, width);
    else if (c < 0x20 || c == 0x7f) w = 2;
    else if (c >= 0x80) { len = utf8_seq_len(pending_, i); w = char_columns(pending_, i, len); }
    if (col + w > width) return i - head_;
    if (c == '\t') row.append(static_cast<size_t>(w), ' ');
    else if (c < 0x20 || c == 0x7f) { row += '^'; row += static_cast<char>(c ^ 0x40); }
    else row.append(pending_, i, len);
    col += w;
    i += len;
    if (col == width) return i + terminator_at(i) - head_;
  }
  return i - head_;
}

bool Document::read_rows(int max_rows, int width, int tab_width,
                         std::vector<std::string>& out, std::string& msg) {
  out.clear();
  if (!fd_.valid()) { msg = "no file open"; return false; }
  width = std::max(width, 2);
  tab_width = std::max(tab_width, 1);
  // a full row spans at most 4 bytes per column, plus a CRLF terminator
  const size_t limit = static_cast<size_t>(width) * 4 + 2;
  std::string row;
  while (static_cast<int>(out.size()) < max_rows) {
    if (!fill(limit, msg)) return false;
    if (head_ >= pending_.size()) break;
    size_t used = next_row(width, tab_width, row);
    if (used == 0) break;
    head_ += used;
    consumed_ += used;
    out.push_back(row);
  }
  return true;
}
