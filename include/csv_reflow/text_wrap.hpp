#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cr {

// Greedy word wrap measured in code points. Every whitespace character (and
// `extra_space`, when given) counts as a space; whitespace at wrap points is
// dropped; words longer than `width` are split. Never returns a segment
// longer than `width`, and never an empty vector: blank text yields {""}.
std::vector<std::string> wrap_text(std::string_view text, std::size_t width,
                                   char extra_space = '\0');

}
