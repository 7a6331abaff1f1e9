#pragma once
// Bindings: immutable variable -> value maps
//
// A Bindings set is accumulated while a conjunction of patterns is matched.
// It is built once and never mutated. Layering a set of additions atop an
// existing set keeps every existing key: a binding fixed by an earlier
// pattern is never overridden by a later one.

#include "error.hpp"
#include "primitive.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace factum {

// A single (variable, value) pair. The name always carries the '?' prefix.
class Binding {
public:
    Binding(const std::string& name, const std::string& value)
        : name_(checked_name(name)), value_(checked_value(value)) {}

    const std::string& name() const { return name_; }
    const std::string& value() const { return value_; }

    std::string to_string() const { return name_ + " = " + value_; }

    bool operator==(const Binding& other) const {
        return name_ == other.name_ && value_ == other.value_;
    }
    bool operator!=(const Binding& other) const { return !(*this == other); }

private:
    static std::string checked_name(const std::string& name) {
        if (is_blank(name)) {
            throw MissingArgumentError("Binding name must be non-empty");
        }
        return as_variable(name);
    }

    static const std::string& checked_value(const std::string& value) {
        if (is_blank(value)) {
            throw MissingArgumentError("Binding value must be non-empty");
        }
        return value;
    }

    std::string name_;
    std::string value_;
};

class Bindings {
public:
    using const_iterator = std::vector<Binding>::const_iterator;

    Bindings() = default;

    // Duplicate names: the first occurrence is kept
    explicit Bindings(const std::vector<Binding>& bindings) {
        entries_.reserve(bindings.size());
        for (const auto& binding : bindings) {
            insert_if_absent(binding);
        }
    }

    // Layer additions atop base. Base entries are copied first, then each
    // addition is inserted only if its name is still free.
    Bindings(const Bindings& base, const std::vector<Binding>& additions)
        : entries_(base.entries_), index_(base.index_) {
        entries_.reserve(entries_.size() + additions.size());
        for (const auto& binding : additions) {
            insert_if_absent(binding);
        }
    }

    std::optional<std::string> lookup(const std::string& name) const {
        auto it = index_.find(as_variable(name));
        if (it == index_.end()) return std::nullopt;
        return entries_[it->second].value();
    }

    bool contains(const std::string& name) const {
        return index_.count(as_variable(name)) > 0;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Insertion order
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    std::string to_string() const {
        std::string out = "{";
        for (size_t i = 0; i < entries_.size(); ++i) {
            if (i > 0) out += ", ";
            out += entries_[i].to_string();
        }
        out += "}";
        return out;
    }

    // Same name -> value pairs, regardless of order
    bool operator==(const Bindings& other) const {
        if (entries_.size() != other.entries_.size()) return false;
        for (const auto& binding : entries_) {
            auto it = other.index_.find(binding.name());
            if (it == other.index_.end() ||
                other.entries_[it->second].value() != binding.value()) {
                return false;
            }
        }
        return true;
    }
    bool operator!=(const Bindings& other) const { return !(*this == other); }

private:
    void insert_if_absent(const Binding& binding) {
        if (index_.count(binding.name())) return;
        index_.emplace(binding.name(), entries_.size());
        entries_.push_back(binding);
    }

    std::vector<Binding> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace factum
