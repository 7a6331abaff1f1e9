#pragma once
// JSON views of triples and bindings
//
//   {"id": "alice", "predicate": "likes", "object": "cake"}
//   {"?a": "alice", "?b": "cake"}

#include "bindings.hpp"
#include "triple.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace factum {

using json = nlohmann::json;

inline void to_json(json& j, const Triple& triple) {
    j = json{
        {"id", triple.id()},
        {"predicate", triple.predicate()},
        {"object", triple.object()}
    };
}

inline void to_json(json& j, const Bindings& bindings) {
    j = json::object();
    for (const auto& binding : bindings) {
        j[binding.name()] = binding.value();
    }
}

inline json bindings_to_json(const std::vector<Bindings>& results) {
    json out = json::array();
    for (const auto& bindings : results) {
        out.push_back(json(bindings));
    }
    return out;
}

inline json triples_to_json(const std::vector<Triple>& triples) {
    json out = json::array();
    for (const auto& triple : triples) {
        out.push_back(json(triple));
    }
    return out;
}

} // namespace factum
