#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace cr {

// All widths in the report are measured in code points of well-formed UTF-8.
std::size_t utf8_length(std::string_view s) noexcept;

// Byte length of the first `n_chars` code points of `s` (clamped to s.size()).
std::size_t utf8_prefix_bytes(std::string_view s, std::size_t n_chars) noexcept;

// Append `s` to `out` and pad with spaces to `width` code points.
void append_padded(std::string& out, std::string_view s, std::size_t width);

// ASCII case-insensitive comparison for option names and labels.
bool iequals(std::string_view a, std::string_view b) noexcept;

}
