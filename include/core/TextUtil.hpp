#pragma once
#include <string>
#include <vector>

namespace textutil {

// ASCII punctuation -> space, ASCII letters lowercased, whitespace collapsed and trimmed.
// Whitespace is Unicode White_Space in UTF-8 (NBSP, U+2000..U+200A, U+3000, ...).
// Other non-ASCII bytes pass through untouched.
std::string normalize(const std::string& s);

// split normalized text on (Unicode) whitespace, keeping order
std::vector<std::string> tokenize(const std::string& normalized);

// sentence boundary = one of . ! ? followed by whitespace or end of text
std::vector<std::string> split_sentences(const std::string& text);

std::string trim(const std::string& s);

}
