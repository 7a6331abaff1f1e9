#pragma once
// Statement codec: triples in the store's N-Triples-like text form
//
//   <em:alice> <em:likes> "cake" .
//   ?a <em:likes> ?b .
//
// Ids and predicates are URIs; a slot that is not already an absolute URI
// is placed under the default "em:" scheme. Objects are string literals.
// Variables are written verbatim.

#include "primitive.hpp"
#include "triple.hpp"
#include <cctype>
#include <string>

namespace factum {

constexpr const char* DEFAULT_URN_PREFIX = "em:";

// scheme ":" rest, scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
inline bool is_absolute_uri(const std::string& s) {
    size_t colon = s.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == s.size()) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(s[0]))) return false;
    for (size_t i = 1; i < colon; ++i) {
        auto c = static_cast<unsigned char>(s[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    for (size_t i = colon + 1; i < s.size(); ++i) {
        auto c = static_cast<unsigned char>(s[i]);
        if (std::isspace(c) || c == '<' || c == '>' || c == '"') return false;
    }
    return true;
}

inline std::string encode_uri(const std::string& slot) {
    if (is_variable(slot)) return slot;
    return "<" + (is_absolute_uri(slot) ? slot : DEFAULT_URN_PREFIX + slot) + ">";
}

inline std::string encode_literal(const std::string& slot) {
    if (is_variable(slot)) return slot;

    std::string out = "\"";
    for (char c : slot) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

inline std::string to_statement(const Triple& triple) {
    return encode_uri(triple.id()) + " " + encode_uri(triple.predicate()) + " " +
           encode_literal(triple.object()) + " .";
}

} // namespace factum
