#pragma once
// FactBackend: the store that holds facts and answers conjunctive queries
//
// The core never joins patterns itself. A backend receives the parsed
// pattern list and returns the bindings that satisfy all of it, computed
// however it likes (factum's SQLite backend turns it into one SELECT).
//
// Failures stay inside the backend: they are logged and reported as
// false / no results.

#include "bindings.hpp"
#include "triple.hpp"
#include <vector>

namespace factum {

class FactBackend {
public:
    virtual ~FactBackend() = default;

    // Bindings satisfying every pattern. A satisfied variable-free
    // conjunction yields one empty Bindings; no match yields none.
    virtual std::vector<Bindings> enumerate(const std::vector<Triple>& patterns) = 0;

    // Persist one concrete triple. Patterns are rejected.
    virtual bool insert(const Triple& fact) = 0;

    // Delete one concrete triple; false if it was not stored
    virtual bool erase(const Triple& fact) = 0;

    // Delete every fact
    virtual bool clear() = 0;
};

} // namespace factum
