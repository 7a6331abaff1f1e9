#pragma once
// Triple: (id, predicate, object)
//
// A triple with at least one variable slot is a pattern; one without is a
// fact. Slots are normalized at construction (see primitive.hpp) and the
// triple is immutable afterwards. Equality and hashing ignore case.

#include "primitive.hpp"
#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace factum {

class Bindings;
class Triple;

// Defined in matcher.hpp
inline Triple substitute(const Triple& pattern, const Bindings& bindings);

enum class Slot : size_t {
    Id = 0,
    Predicate = 1,
    Object = 2,
};

constexpr size_t SLOT_COUNT = 3;

class Triple {
public:
    Triple(const std::string& id, const std::string& predicate,
           const std::string& object)
        : slots_{checked(id, "id"), checked(predicate, "predicate"),
                 checked(object, "object")} {
        slots_[0] = normalize_primitive(slots_[0]);
        slots_[1] = normalize_primitive(slots_[1]);
        slots_[2] = normalize_primitive(slots_[2]);
        is_pattern_ = derive_is_pattern();
    }

    const std::string& id() const { return slots_[0]; }
    const std::string& predicate() const { return slots_[1]; }
    const std::string& object() const { return slots_[2]; }

    const std::string& slot(Slot s) const { return slots_[static_cast<size_t>(s)]; }
    const std::string& slot(size_t i) const { return slots_[i]; }

    bool is_pattern() const { return is_pattern_; }

    // Distinct variables in slot order
    std::vector<std::string> variables() const {
        std::vector<std::string> vars;
        for (const auto& s : slots_) {
            if (!is_variable(s)) continue;
            bool seen = false;
            for (const auto& v : vars) {
                if (iequals(v, s)) { seen = true; break; }
            }
            if (!seen) vars.push_back(s);
        }
        return vars;
    }

    std::string to_string() const {
        return "<" + slots_[0] + ", " + slots_[1] + ", " + slots_[2] + ">";
    }

    bool operator==(const Triple& other) const {
        return iequals(slots_[0], other.slots_[0]) &&
               iequals(slots_[1], other.slots_[1]) &&
               iequals(slots_[2], other.slots_[2]);
    }
    bool operator!=(const Triple& other) const { return !(*this == other); }

private:
    friend Triple substitute(const Triple& pattern, const Bindings& bindings);

    struct Normalized {};

    // Slots are taken as-is
    Triple(Normalized, std::string id, std::string predicate, std::string object)
        : slots_{std::move(id), std::move(predicate), std::move(object)},
          is_pattern_(derive_is_pattern()) {}

    static const std::string& checked(const std::string& raw, const char* which) {
        if (is_blank(raw)) {
            throw FormatError(std::string("Triple ") + which + " must be non-empty");
        }
        return raw;
    }

    bool derive_is_pattern() const {
        return is_variable(slots_[0]) || is_variable(slots_[1]) ||
               is_variable(slots_[2]);
    }

    std::array<std::string, SLOT_COUNT> slots_;
    bool is_pattern_ = false;
};

// Case-insensitive, consistent with Triple::operator==
struct TripleHash {
    size_t operator()(const Triple& t) const {
        size_t hash = 9949;
        for (size_t i = 0; i < SLOT_COUNT; ++i) {
            size_t h = std::hash<std::string>{}(to_lower(t.slot(i)));
            hash ^= h + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
        }
        return hash;
    }
};

} // namespace factum
