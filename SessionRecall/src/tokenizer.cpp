#include "../include/recall/tokenizer.hpp"

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <unordered_set>

namespace recall {

namespace {

constexpr std::uint32_t kHangulFirst = 0xAC00;
constexpr std::uint32_t kHangulLast = 0xD7A3;

const std::unordered_set<std::string>& stopwords() {
    static const std::unordered_set<std::string> words = {
        // English
        "the", "a", "an", "is", "are", "was", "were", "be", "been", "being",
        "have", "has", "had", "do", "does", "did", "will", "would", "could", "should",
        "may", "might", "must", "shall", "can", "need", "dare", "ought", "used",
        "to", "of", "in", "for", "on", "with", "at", "by", "from", "as", "into",
        "through", "during", "before", "after", "above", "below", "between",
        "and", "but", "or", "nor", "so", "yet", "both", "either", "neither",
        "not", "only", "own", "same", "than", "too", "very", "just",
        "this", "that", "these", "those", "it", "its",
        // Korean particles and pronouns
        "이", "그", "저", "것", "수", "등", "들", "및", "에", "의", "를", "을",
        "은", "는", "가", "와", "과", "로", "으로", "에서", "까지", "부터",
        // Source-code keywords
        "const", "let", "var", "function", "return", "import", "export",
        "true", "false", "null", "undefined", "new", "class", "extends",
        "async", "await", "try", "catch", "if", "else", "while",
    };
    return words;
}

struct CodePoint {
    std::uint32_t value = 0;
    std::size_t length = 1;
    bool valid = false;
};

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

CodePoint decode_at(std::string_view text, std::size_t pos) {
    CodePoint cp;
    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    const std::size_t remaining = text.size() - pos;
    if (lead < 0x80) {
        cp.value = lead;
        cp.valid = true;
        return cp;
    }
    std::size_t length = 0;
    std::uint32_t value = 0;
    if ((lead >> 5) == 0x6) {
        length = 2;
        value = lead & 0x1F;
    } else if ((lead >> 4) == 0xE) {
        length = 3;
        value = lead & 0x0F;
    } else if ((lead >> 3) == 0x1E) {
        length = 4;
        value = lead & 0x07;
    } else {
        return cp;
    }
    if (remaining < length) {
        return cp;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const unsigned char next = static_cast<unsigned char>(text[pos + i]);
        if (!is_continuation(next)) {
            return cp;
        }
        value = (value << 6) | (next & 0x3F);
    }
    cp.value = value;
    cp.length = length;
    cp.valid = true;
    return cp;
}

bool is_word_code_point(std::uint32_t value) {
    if (value < 0x80) {
        const char c = static_cast<char>(value);
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    }
    return value >= kHangulFirst && value <= kHangulLast;
}

char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool ascii_upper(char c) {
    return c >= 'A' && c <= 'Z';
}

bool ascii_lower_letter(char c) {
    return c >= 'a' && c <= 'z';
}

bool ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::size_t code_point_count(std::string_view text) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return !is_continuation(static_cast<unsigned char>(c));
    }));
}

bool all_digits(const std::string& token) {
    return !token.empty() && std::all_of(token.begin(), token.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string strip_extension(std::string segment) {
    const auto dot = segment.rfind('.');
    if (dot != std::string::npos && dot + 1 < segment.size()) {
        segment.erase(dot);
    }
    return segment;
}

std::string split_camel_case(const std::string& segment) {
    std::string result;
    result.reserve(segment.size() + 4);
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (i > 0 && ascii_lower_letter(segment[i - 1]) && ascii_upper(segment[i])) {
            result.push_back(' ');
        }
        result.push_back(segment[i]);
    }
    return result;
}

} // namespace

bool is_stopword(const std::string& word) {
    return stopwords().count(word) != 0;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    std::size_t current_length = 0;

    auto flush = [&]() {
        if (current_length >= 2 && !is_stopword(current) && !all_digits(current)) {
            tokens.push_back(current);
        }
        current.clear();
        current_length = 0;
    };

    const std::string_view view(text);
    std::size_t pos = 0;
    while (pos < view.size()) {
        const CodePoint cp = decode_at(view, pos);
        if (cp.valid && is_word_code_point(cp.value)) {
            if (cp.value < 0x80) {
                current.push_back(ascii_lower(static_cast<char>(cp.value)));
            } else {
                current.append(view.substr(pos, cp.length));
            }
            ++current_length;
        } else {
            flush();
        }
        pos += cp.length;
    }
    flush();
    return tokens;
}

std::vector<std::string> tokenize(const char* text) {
    if (text == nullptr) {
        return {};
    }
    return tokenize(std::string(text));
}

std::vector<std::string> tokenize_path(const std::string& path) {
    std::vector<std::string> tokens;
    if (path.empty()) {
        return tokens;
    }

    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    std::size_t start = 0;
    while (start <= normalized.size()) {
        const auto slash = normalized.find('/', start);
        const std::size_t end = slash == std::string::npos ? normalized.size() : slash;
        const std::string segment = strip_extension(normalized.substr(start, end - start));
        start = end + 1;

        if (code_point_count(segment) <= 1) {
            continue;
        }

        const std::string spaced = split_camel_case(segment);
        std::string word;
        auto emit = [&]() {
            if (code_point_count(word) > 1 && !is_stopword(word)) {
                tokens.push_back(word);
            }
            word.clear();
        };
        for (char c : spaced) {
            if (c == '-' || c == '_' || ascii_space(c)) {
                emit();
            } else {
                word.push_back(ascii_lower(c));
            }
        }
        emit();
    }
    return tokens;
}

} // namespace recall
