#include "csv_reflow/utf8.hpp"
#include <cctype>

namespace cr {

static inline bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

std::size_t utf8_length(std::string_view s) noexcept {
  std::size_t n = 0;
  for (unsigned char c : s) if (!is_continuation(c)) ++n;
  return n;
}

std::size_t utf8_prefix_bytes(std::string_view s, std::size_t n_chars) noexcept {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (!is_continuation(static_cast<unsigned char>(s[i]))) {
      if (seen == n_chars) return i;
      ++seen;
    }
  }
  return s.size();
}

void append_padded(std::string& out, std::string_view s, std::size_t width) {
  out.append(s.data(), s.size());
  const std::size_t len = utf8_length(s);
  if (len < width) out.append(width - len, ' ');
}

bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i)
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

}
