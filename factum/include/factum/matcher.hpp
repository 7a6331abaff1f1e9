#pragma once
// Matcher and binder
//
// matches_fact      does a pattern match a fact?
// derive_bindings   bindings implied by a successful match, layered under
//                   the bindings already established
// substitute        pattern + bindings -> concrete triple
// derive_conjunction
//                   re-derive the bindings of an ordered pattern list from
//                   the facts that answered it
//
// All functions are pure. The only mutable state is the ScratchTable of a
// single matching attempt, which the caller may own and reuse across facts.

#include "bindings.hpp"
#include "error.hpp"
#include "primitive.hpp"
#include "triple.hpp"
#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace factum {

// Variable values seen so far within one matching attempt. A pattern has at
// most three slots, so a flat list beats a hash map here.
class ScratchTable {
public:
    ScratchTable() { values_.reserve(SLOT_COUNT); }

    void clear() { values_.clear(); }
    bool empty() const { return values_.empty(); }
    size_t size() const { return values_.size(); }

    const std::string* find(const std::string& variable) const {
        for (const auto& [name, value] : values_) {
            if (name == variable) return &value;
        }
        return nullptr;
    }

    void set(const std::string& variable, const std::string& value) {
        for (auto& [name, current] : values_) {
            if (name == variable) {
                current = value;
                return;
            }
        }
        values_.emplace_back(variable, value);
    }

private:
    std::vector<std::pair<std::string, std::string>> values_;
};

namespace detail {

inline bool matches_slot(const std::string& pattern_slot,
                         const std::string& fact_slot,
                         ScratchTable& scratch) {
    if (!is_variable(pattern_slot)) {
        return iequals(pattern_slot, fact_slot);
    }

    // A variable used twice in one pattern must see the same value
    const std::string* bound = scratch.find(pattern_slot);
    if (bound && !iequals(*bound, fact_slot)) {
        return false;
    }
    scratch.set(pattern_slot, fact_slot);
    return true;
}

} // namespace detail

// scratch is cleared on entry; nothing leaks between calls
inline bool matches_fact(const Triple& pattern, const Triple& fact,
                         ScratchTable& scratch) {
    scratch.clear();
    return detail::matches_slot(pattern.id(), fact.id(), scratch) &&
           detail::matches_slot(pattern.predicate(), fact.predicate(), scratch) &&
           detail::matches_slot(pattern.object(), fact.object(), scratch);
}

inline bool matches_fact(const Triple& pattern, const Triple& fact) {
    ScratchTable scratch;
    return matches_fact(pattern, fact, scratch);
}

inline std::optional<Bindings> derive_bindings(const Triple& pattern,
                                               const Triple& fact,
                                               const Bindings& existing,
                                               ScratchTable& scratch) {
    if (!matches_fact(pattern, fact, scratch)) {
        return std::nullopt;
    }

    std::vector<Binding> additions;
    for (size_t i = 0; i < SLOT_COUNT; ++i) {
        const std::string& slot = pattern.slot(i);
        if (is_variable(slot) && !existing.contains(slot)) {
            additions.emplace_back(slot, fact.slot(i));
        }
    }
    return Bindings(existing, additions);
}

inline std::optional<Bindings> derive_bindings(const Triple& pattern,
                                               const Triple& fact,
                                               const Bindings& existing) {
    ScratchTable scratch;
    return derive_bindings(pattern, fact, existing, scratch);
}

inline Triple substitute(const Triple& pattern, const Bindings& bindings) {
    std::array<std::string, SLOT_COUNT> slots;
    bool changed = false;

    for (size_t i = 0; i < SLOT_COUNT; ++i) {
        const std::string& slot = pattern.slot(i);
        std::optional<std::string> value;
        if (is_variable(slot)) {
            value = bindings.lookup(slot);
        }
        slots[i] = value ? *value : slot;
        changed |= !iequals(slot, slots[i]);
    }

    if (!changed) return pattern;
    return Triple(Triple::Normalized{}, std::move(slots[0]),
                  std::move(slots[1]), std::move(slots[2]));
}

// facts[i] is the fact that answered patterns[i]. Each pattern is first
// narrowed by the bindings accumulated so far, so a later pattern can only
// add variables, never rebind one.
inline std::optional<Bindings> derive_conjunction(const std::vector<Triple>& patterns,
                                                  const std::vector<Triple>& facts,
                                                  const Bindings& seed = Bindings()) {
    if (patterns.size() != facts.size()) {
        throw MissingArgumentError("Every pattern needs exactly one fact (" +
                                   std::to_string(patterns.size()) + " patterns, " +
                                   std::to_string(facts.size()) + " facts)");
    }

    ScratchTable scratch;
    Bindings accumulated = seed;
    for (size_t i = 0; i < patterns.size(); ++i) {
        Triple narrowed = substitute(patterns[i], accumulated);
        auto next = derive_bindings(narrowed, facts[i], accumulated, scratch);
        if (!next) return std::nullopt;
        accumulated = std::move(*next);
    }
    return accumulated;
}

} // namespace factum
