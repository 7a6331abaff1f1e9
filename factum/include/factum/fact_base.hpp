#pragma once
// FactBase: the public face of a fact store
//
// Adds, queries and removes facts through a FactBackend. Queries are handed
// to the backend whole; the answers come back as Bindings and are turned
// into concrete facts again by substituting them into the query patterns.

#include "backend.hpp"
#include "bindings.hpp"
#include "error.hpp"
#include "log.hpp"
#include "matcher.hpp"
#include "primitive.hpp"
#include "query.hpp"
#include "triple.hpp"
#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace factum {

using TripleSet = std::unordered_set<Triple, TripleHash>;

class FactBase {
public:
    explicit FactBase(std::shared_ptr<FactBackend> backend)
        : backend_(std::move(backend)) {
        if (!backend_) {
            throw MissingArgumentError("FactBase requires a backend");
        }
    }

    FactBackend& backend() { return *backend_; }

    bool add(const Triple& fact) {
        if (fact.is_pattern()) {
            log_error("factbase", "Cannot add pattern %s", fact.to_string().c_str());
            return false;
        }
        bool ok = backend_->insert(fact);
        log_debug("factbase", "add %s -> %s", fact.to_string().c_str(), ok ? "ok" : "failed");
        return ok;
    }

    bool add(const std::string& id, const std::string& predicate,
             const std::string& object) {
        return add(Triple(id, predicate, object));
    }

    // True iff the fact itself is stored. A pattern is never "contained".
    bool contains(const Triple& fact) {
        auto results = backend_->enumerate({fact});
        return results.size() == 1 && results[0].empty();
    }

    std::vector<Bindings> query(const std::vector<Triple>& patterns) {
        return backend_->enumerate(patterns);
    }

    std::vector<Bindings> query(const Triple& pattern) {
        return backend_->enumerate({pattern});
    }

    std::vector<Bindings> query(const std::string& id, const std::string& predicate,
                                const std::string& object) {
        return query(Triple(id, predicate, object));
    }

    std::vector<Bindings> query(const std::string& query_string) {
        return query(parse_clauses(query_string));
    }

    // Facts actually removed
    TripleSet remove(const std::vector<Triple>& patterns) {
        if (patterns.size() == 1) {
            return remove(patterns.front());
        }

        TripleSet removed;
        if (patterns.empty()) return removed;

        for (const auto& bindings : backend_->enumerate(patterns)) {
            for (const auto& pattern : patterns) {
                Triple fact = substitute(pattern, bindings);
                if (remove_fact(fact)) {
                    removed.insert(std::move(fact));
                }
            }
        }
        return removed;
    }

    TripleSet remove(const Triple& pattern) {
        TripleSet removed;

        if (!pattern.is_pattern()) {
            if (remove_fact(pattern)) removed.insert(pattern);
            return removed;
        }

        // Three distinct variables match every fact
        if (pattern.variables().size() == SLOT_COUNT) {
            removed = all();
            if (!backend_->clear()) {
                log_error("factbase", "Failed to clear store");
                return {};
            }
            return removed;
        }

        for (const auto& bindings : backend_->enumerate({pattern})) {
            Triple fact = substitute(pattern, bindings);
            if (remove_fact(fact)) {
                removed.insert(std::move(fact));
            }
        }
        return removed;
    }

    TripleSet remove(const std::string& id, const std::string& predicate,
                     const std::string& object) {
        return remove(Triple(id, predicate, object));
    }

    TripleSet remove(const std::string& query_string) {
        return remove(parse_clauses(query_string));
    }

    TripleSet all() {
        Triple everything(as_variable("a"), as_variable("b"), as_variable("c"));

        TripleSet facts;
        for (const auto& bindings : backend_->enumerate({everything})) {
            facts.insert(substitute(everything, bindings));
        }
        return facts;
    }

    size_t count() { return all().size(); }

    bool clear() { return backend_->clear(); }

private:
    // Contains-then-erase; the backend serializes each call on its own
    bool remove_fact(const Triple& fact) {
        if (fact.is_pattern() || !contains(fact)) return false;
        return backend_->erase(fact);
    }

    std::shared_ptr<FactBackend> backend_;
};

} // namespace factum
