#pragma once
// Factum: triple pattern matching
//
// - Primitives: normalized slot tokens, '?' marks a variable
// - Triple: (id, predicate, object), a fact or a pattern
// - Bindings: immutable variable -> value maps, first write wins
// - Matcher: match, derive bindings, substitute
// - Query: "?a likes ?b . ?b likes cake" -> patterns
// - FactBase: add / query / remove over a FactBackend (SQLite)

#include "version.hpp"
#include "error.hpp"
#include "primitive.hpp"
#include "triple.hpp"
#include "bindings.hpp"
#include "matcher.hpp"
#include "query.hpp"
#include "codec.hpp"
#include "backend.hpp"
#include "fact_base.hpp"
