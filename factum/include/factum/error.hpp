#pragma once
// Error types raised by the core.
//
// Only malformed input throws. A pattern that does not match a fact is an
// ordinary result (bool / std::nullopt), never an exception.

#include <stdexcept>
#include <string>

namespace factum {

// Malformed primitive or query clause
class FormatError : public std::invalid_argument {
public:
    explicit FormatError(const std::string& message)
        : std::invalid_argument(message) {}
};

// A required argument is blank
class MissingArgumentError : public std::invalid_argument {
public:
    explicit MissingArgumentError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace factum
