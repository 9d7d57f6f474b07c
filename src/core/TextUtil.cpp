#include "core/TextUtil.hpp"

namespace textutil {

// Byte length of the White_Space code point starting at s[i], 0 if none.
// Covers ASCII controls plus U+0085, U+00A0, U+1680, U+2000..U+200A,
// U+2028, U+2029, U+202F, U+205F and U+3000 in UTF-8.
static size_t space_len(const std::string& s, size_t i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (c == ' ' || (c >= '\t' && c <= '\r')) return 1;
    if (c < 0xC2) return 0;

    const size_t n = s.size();
    const unsigned char c1 = i + 1 < n ? static_cast<unsigned char>(s[i + 1]) : 0;
    if (c == 0xC2) return (c1 == 0x85 || c1 == 0xA0) ? 2 : 0;

    if (i + 2 >= n) return 0;
    const unsigned char c2 = static_cast<unsigned char>(s[i + 2]);
    switch (c) {
    case 0xE1:
        return (c1 == 0x9A && c2 == 0x80) ? 3 : 0;
    case 0xE2:
        if (c1 == 0x80 && (c2 <= 0x8A || c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF)) return 3;
        if (c1 == 0x81 && c2 == 0x9F) return 3;
        return 0;
    case 0xE3:
        return (c1 == 0x80 && c2 == 0x80) ? 3 : 0;
    default:
        return 0;
    }
}

// Whitespace code point that ends at s[e - 1], 0 if none.
static size_t space_len_before(const std::string& s, size_t e) {
    if (e >= 1 && space_len(s, e - 1) == 1) return 1;
    if (e >= 2 && space_len(s, e - 2) == 2) return 2;
    if (e >= 3 && space_len(s, e - 3) == 3) return 3;
    return 0;
}

static bool is_ascii_punct(unsigned char c) {
    return (c >= '!' && c <= '/') ||
           (c >= ':' && c <= '@') ||
           (c >= '[' && c <= '`') ||
           (c >= '{' && c <= '~');
}

static bool is_sentence_end(unsigned char c) {
    return c == '.' || c == '!' || c == '?';
}

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    size_t i = 0;
    while (i < s.size()) {
        const unsigned char ch = static_cast<unsigned char>(s[i]);
        size_t sp = space_len(s, i);
        if (sp == 0 && is_ascii_punct(ch)) sp = 1;
        if (sp > 0) {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
            i += sp;
            continue;
        }

        unsigned char c = ch;
        if (c >= 'A' && c <= 'Z') c = static_cast<unsigned char>(c - 'A' + 'a');
        out.push_back(static_cast<char>(c));
        prev_space = false;
        ++i;
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::string cur;

    size_t i = 0;
    while (i < normalized.size()) {
        const size_t sp = space_len(normalized, i);
        if (sp > 0) {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
            i += sp;
        } else {
            cur.push_back(normalized[i]);
            ++i;
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size()) {
        const size_t sp = space_len(s, a);
        if (sp == 0) break;
        a += sp;
    }

    size_t b = s.size();
    while (b > a) {
        const size_t sp = space_len_before(s, b);
        if (sp == 0) break;
        b -= sp;
    }

    return s.substr(a, b - a);
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    if (trim(text).empty()) return sentences;

    size_t last_end = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_sentence_end(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }

        size_t j = i + 1;
        while (j < text.size()) {
            const size_t sp = space_len(text, j);
            if (sp == 0) break;
            j += sp;
        }

        // punctuation glued to the next word ("3.5", "e.g.x") is not a boundary
        if (j == i + 1 && j < text.size()) {
            ++i;
            continue;
        }

        std::string sentence = trim(text.substr(last_end, i + 1 - last_end));
        if (!sentence.empty()) sentences.push_back(std::move(sentence));

        last_end = j;
        i = j;
    }

    if (last_end < text.size()) {
        std::string rest = trim(text.substr(last_end));
        if (!rest.empty()) sentences.push_back(std::move(rest));
    }

    return sentences;
}

}
