#include "text_width.hpp"
#include <cwchar>

size_t utf8_seq_len(const std::string& s, size_t i) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  size_t len = 1;
  if ((c & 0xE0) == 0xC0) len = 2;
  else if ((c & 0xF0) == 0xE0) len = 3;
  else if ((c & 0xF8) == 0xF0) len = 4;
  if (i + len > s.size()) return 1;
  for (size_t k = 1; k < len; ++k) {
    if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return 1;
  }
  return len;
}

int char_columns(const std::string& s, size_t i, size_t len) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  if (len == 1) return 1;
  static const unsigned char lead_mask[] = {0, 0, 0x1F, 0x0F, 0x07};
  unsigned long cp = c & lead_mask[len];
  for (size_t k = 1; k < len; ++k) cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
  int w = ::wcwidth(static_cast<wchar_t>(cp));
  if (w < 0) return 1;
  return w > 2 ? 2 : w;
}
