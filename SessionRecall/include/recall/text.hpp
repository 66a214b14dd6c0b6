#pragma once

#include <cstddef>
#include <string>

namespace recall {

// Removes leading and trailing ASCII whitespace.
std::string strip(const std::string& text);

// Keeps at most max_code_points UTF-8 code points.
std::string truncate_utf8(const std::string& text, std::size_t max_code_points);

std::string lower_ascii(std::string text);

// Case-insensitive (ASCII) substring test. needle must already be lowercase.
bool contains_lowered(const std::string& haystack, const std::string& needle);

} // namespace recall
