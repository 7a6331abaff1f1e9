#pragma once
// Primitives: the normalized string tokens that fill a triple's slots
//
// A primitive is either a value (opaque, case-insensitive) or a variable
// (a token starting with '?'). Normalization trims, strips one level of
// matching quotes and lowercases. Tokens made only of punctuation are
// rejected so that "..." never becomes a subject.

#include "error.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

namespace factum {

constexpr char VARIABLE_PREFIX = '?';

inline bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

inline std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// ASCII case-insensitive comparison
inline bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Decode the UTF-8 sequence starting at input[i] and advance i past it.
// A malformed sequence yields its lead byte and advances by one.
inline char32_t next_code_point(const std::string& input, size_t& i) {
    unsigned char c = static_cast<unsigned char>(input[i]);
    auto cont = [&](size_t k) {
        return i + k < input.size() &&
               (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
    };
    auto tail = [&](size_t k) {
        return static_cast<char32_t>(static_cast<unsigned char>(input[i + k]) & 0x3F);
    };

    char32_t cp = c;
    if ((c & 0xE0) == 0xC0 && cont(1)) {
        cp = (static_cast<char32_t>(c & 0x1F) << 6) | tail(1);
        i += 2;
    } else if ((c & 0xF0) == 0xE0 && cont(1) && cont(2)) {
        cp = (static_cast<char32_t>(c & 0x0F) << 12) | (tail(1) << 6) | tail(2);
        i += 3;
    } else if ((c & 0xF8) == 0xF0 && cont(1) && cont(2) && cont(3)) {
        cp = (static_cast<char32_t>(c & 0x07) << 18) | (tail(1) << 12) |
             (tail(2) << 6) | tail(3);
        i += 4;
    } else {
        ++i;
    }
    return cp;
}

// Letters, digits and connector punctuation ('_', U+203F, ...). Outside
// ASCII, the Latin-1, general punctuation, symbol, CJK punctuation and
// fullwidth punctuation blocks are non-word; everything else is a word.
inline bool is_word_code_point(char32_t cp) {
    if (cp < 0x80) {
        return std::isalnum(static_cast<int>(cp)) || cp == '_';
    }
    if (cp <= 0xBF) {
        return cp == 0xAA || cp == 0xB5 || cp == 0xBA;
    }
    if (cp == 0xD7 || cp == 0xF7) return false;
    if (cp >= 0x2000 && cp <= 0x206F) {
        return cp == 0x203F || cp == 0x2040 || cp == 0x2054;
    }
    if (cp >= 0x20A0 && cp <= 0x20CF) return false;  // currency
    if (cp >= 0x2190 && cp <= 0x23FF) return false;  // arrows, math, technical
    if (cp >= 0x2500 && cp <= 0x27BF) return false;  // box drawing, shapes, dingbats
    if (cp >= 0x3000 && cp <= 0x303F) {
        return (cp >= 0x3005 && cp <= 0x3007) || (cp >= 0x3021 && cp <= 0x302F) ||
               (cp >= 0x3031 && cp <= 0x303C);
    }
    if (cp >= 0xFE30 && cp <= 0xFE4F) {
        return cp == 0xFE33 || cp == 0xFE34 || cp >= 0xFE4D;
    }
    if (cp >= 0xFF01 && cp <= 0xFF65) {
        return (cp >= 0xFF10 && cp <= 0xFF19) || (cp >= 0xFF21 && cp <= 0xFF3A) ||
               cp == 0xFF3F || (cp >= 0xFF41 && cp <= 0xFF5A);
    }
    return true;
}

inline bool has_word_char(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        if (is_word_code_point(next_code_point(text, i))) return true;
    }
    return false;
}

inline bool is_variable(const std::string& token) {
    for (char c : token) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        return c == VARIABLE_PREFIX;
    }
    return false;
}

// Canonical variable name: trimmed, with the '?' prefix
inline std::string as_variable(const std::string& name) {
    if (is_blank(name)) {
        throw MissingArgumentError("Variable name must be non-empty");
    }
    std::string trimmed = trim(name);
    if (trimmed.front() != VARIABLE_PREFIX) {
        trimmed.insert(trimmed.begin(), VARIABLE_PREFIX);
    }
    return trimmed;
}

inline std::string normalize_primitive(const std::string& raw) {
    if (is_blank(raw)) {
        throw FormatError("Primitive must be non-empty");
    }

    std::string primitive = to_lower(trim(raw));

    char quote = primitive.front();
    if (quote == '"' || quote == '\'') {
        if (primitive.size() > 2 && primitive.back() == quote) {
            primitive = trim(primitive.substr(1, primitive.size() - 2));
        } else {
            throw FormatError("Malformed quoted primitive: " + raw);
        }
    }

    if (!has_word_char(primitive)) {
        throw FormatError(
            "Primitive must not contain only special characters: " + raw);
    }
    return primitive;
}

} // namespace factum
