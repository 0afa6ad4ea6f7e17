#pragma once
#include <cctype>
#include <string>
#include <vector>

namespace bayestext {

inline std::string to_lower_ascii(std::string s) {
    for (char &c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

// Bytes >= 0x80 belong to UTF-8 sequences and are kept inside words
inline bool is_word_byte(unsigned char uc) {
    return uc >= 0x80 || std::isalnum(uc);
}

// Splits on whitespace and punctuation, keeps [a-z0-9] and non-ASCII runs, lowercases
inline std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> out;
    std::string cur;
    cur.reserve(32);

    for (unsigned char uc : text) {
        if (is_word_byte(uc)) {
            cur.push_back(uc < 0x80 ? (char)std::tolower(uc) : (char)uc);
        } else {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

} // namespace bayestext
