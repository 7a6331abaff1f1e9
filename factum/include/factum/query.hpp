#pragma once
// Query strings: "?a likes ?b . ?b likes cake"
//
// Clauses are separated by " . " and each clause holds exactly three tokens.
// A token quoted with " or ' may contain spaces. Clause order is kept: it
// decides which pattern's bindings win in a conjunction.

#include "error.hpp"
#include "primitive.hpp"
#include "triple.hpp"
#include <regex>
#include <string>
#include <vector>

namespace factum {

constexpr const char* CLAUSE_SEPARATOR = " . ";

inline std::vector<std::string> tokenize_clause(const std::string& clause) {
    static const std::regex token_pattern{"([\"'][^\"']+[\"']|[^\\s\"]+)"};

    std::vector<std::string> tokens;
    auto begin = std::sregex_iterator(clause.begin(), clause.end(), token_pattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        tokens.push_back(it->str());
    }
    return tokens;
}

inline Triple parse_clause(const std::string& clause) {
    if (is_blank(clause)) {
        throw MissingArgumentError("Query clause must be non-empty");
    }

    auto tokens = tokenize_clause(trim(clause));
    if (tokens.size() != SLOT_COUNT) {
        throw FormatError("Malformed query: '" + trim(clause) + "' has " +
                          std::to_string(tokens.size()) + " tokens, expected 3");
    }
    return Triple(tokens[0], tokens[1], tokens[2]);
}

inline std::vector<Triple> parse_clauses(const std::string& text) {
    if (is_blank(text)) {
        throw MissingArgumentError("Query string must be non-empty");
    }

    std::string lowered = to_lower(text);
    const std::string separator = CLAUSE_SEPARATOR;

    std::vector<Triple> clauses;
    size_t start = 0;
    while (true) {
        size_t pos = lowered.find(separator, start);
        std::string clause = lowered.substr(
            start, pos == std::string::npos ? std::string::npos : pos - start);
        if (is_blank(clause)) {
            throw FormatError("Malformed query: empty clause in '" + text + "'");
        }
        clauses.push_back(parse_clause(clause));
        if (pos == std::string::npos) break;
        start = pos + separator.size();
    }
    return clauses;
}

} // namespace factum
