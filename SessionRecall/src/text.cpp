#include "../include/recall/text.hpp"

#include <algorithm>
#include <cctype>

namespace recall {

std::string strip(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (begin >= end) {
        return std::string();
    }
    return std::string(begin, end);
}

std::string truncate_utf8(const std::string& text, std::size_t max_code_points) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto byte = static_cast<unsigned char>(text[i]);
        if ((byte & 0xC0) != 0x80) {
            if (count == max_code_points) {
                return text.substr(0, i);
            }
            ++count;
        }
    }
    return text;
}

std::string lower_ascii(std::string text) {
    for (char& c : text) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return text;
}

bool contains_lowered(const std::string& haystack, const std::string& needle) {
    return lower_ascii(haystack).find(needle) != std::string::npos;
}

} // namespace recall
