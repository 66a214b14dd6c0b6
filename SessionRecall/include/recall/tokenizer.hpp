#pragma once

#include <string>
#include <vector>

namespace recall {

// Splits free text into normalized keywords. Lowercases ASCII letters; every
// code point that is neither an ASCII word character nor a Hangul syllable
// separates tokens. Tokens shorter than two code points, stopwords and
// digit-only tokens are dropped.
std::vector<std::string> tokenize(const std::string& text);
std::vector<std::string> tokenize(const char* text);

// Splits a file or directory path into keywords: separators are normalized,
// each segment loses its last extension, camelCase, kebab-case and snake_case
// words are split apart, and short tokens and stopwords are dropped.
// "src/handleUserLogin.js" yields {"src", "handle", "user", "login"}.
std::vector<std::string> tokenize_path(const std::string& path);

bool is_stopword(const std::string& word);

} // namespace recall
