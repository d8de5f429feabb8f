#pragma once
/*
 * TextWidth
 *
 * Purpose: UTF-8 sequence length and terminal column width of one character.
 * Note: widths come from wcwidth, so they follow LC_CTYPE; bytes the locale
 * can not classify count as one column.
 */
#include <cstddef>
#include <string>

size_t utf8_seq_len(const std::string& s, size_t i);
// columns taken by the len-byte character starting at s[i] (0, 1 or 2)
int char_columns(const std::string& s, size_t i, size_t len);
