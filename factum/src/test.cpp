#include <factum/factum.hpp>
#include <factum/json.hpp>
#include <factum/sqlite_backend.hpp>
#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace factum;

template<typename E, typename F>
bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

std::shared_ptr<SqliteBackend> open_memory_backend() {
    auto backend = std::make_shared<SqliteBackend>(StoreConfig::in_memory());
    bool opened = backend->open();
    assert(opened);
    (void)opened;
    return backend;
}

// Values bound to one variable across a result list
std::multiset<std::string> values_of(const std::vector<Bindings>& results,
                                     const std::string& variable) {
    std::multiset<std::string> values;
    for (const auto& bindings : results) {
        auto value = bindings.lookup(variable);
        if (value) values.insert(*value);
    }
    return values;
}

void test_normalize_primitive() {
    std::cout << "Testing primitive normalization..." << std::endl;

    assert(normalize_primitive("  Alice ") == "alice");
    assert(normalize_primitive("\"New York\"") == "new york");
    assert(normalize_primitive("'  padded  '") == "padded");
    assert(normalize_primitive("?Who") == "?who");
    assert(normalize_primitive("snake_case") == "snake_case");
    assert(normalize_primitive("café") == "café");

    // Idempotent
    for (const char* raw : {"Alice", "'New York'", "?x", "a.b", "em:thing"}) {
        std::string once = normalize_primitive(raw);
        assert(normalize_primitive(once) == once);
    }

    assert(throws<FormatError>([] { normalize_primitive(""); }));
    assert(throws<FormatError>([] { normalize_primitive("   "); }));
    assert(throws<FormatError>([] { normalize_primitive("..."); }));
    assert(throws<FormatError>([] { normalize_primitive("?"); }));
    assert(throws<FormatError>([] { normalize_primitive("\"unterminated"); }));
    assert(throws<FormatError>([] { normalize_primitive("'mismatched\""); }));
    assert(throws<FormatError>([] { normalize_primitive("\"\""); }));
    assert(throws<FormatError>([] { normalize_primitive("'\"\"'"); }));
    assert(throws<FormatError>([] { normalize_primitive("' '"); }));

    // Non-ASCII punctuation is not a word character
    assert(throws<FormatError>([] { normalize_primitive("«»"); }));
    assert(throws<FormatError>([] { normalize_primitive("—"); }));
    assert(throws<FormatError>([] { normalize_primitive("“…”"); }));
    assert(throws<FormatError>([] { normalize_primitive("。、"); }));
    assert(normalize_primitive("日本") == "日本");
    assert(normalize_primitive("«naïve»") == "«naïve»");
    assert(normalize_primitive("a—b") == "a—b");

    std::cout << "  PASS" << std::endl;
}

void test_variables() {
    std::cout << "Testing variable recognition..." << std::endl;

    assert(is_variable("?a"));
    assert(is_variable("  ?a"));
    assert(!is_variable("a?"));
    assert(!is_variable(""));

    assert(as_variable("a") == "?a");
    assert(as_variable("?a") == "?a");
    assert(as_variable("  b ") == "?b");
    assert(throws<MissingArgumentError>([] { as_variable(" "); }));

    std::cout << "  PASS" << std::endl;
}

void test_triple() {
    std::cout << "Testing Triple..." << std::endl;

    Triple upper("Alice", "Likes", "Cake");
    Triple lower("alice", "likes", "cake");
    assert(upper == lower);
    assert(TripleHash{}(upper) == TripleHash{}(lower));
    assert(upper.id() == "alice");
    assert(!upper.is_pattern());
    assert(upper.to_string() == "<alice, likes, cake>");

    Triple pattern("?a", "likes", "?a");
    assert(pattern.is_pattern());
    assert(pattern.variables() == std::vector<std::string>{"?a"});
    assert(pattern.slot(Slot::Object) == "?a");
    assert(pattern != lower);

    assert(throws<FormatError>([] { Triple("", "likes", "cake"); }));
    assert(throws<FormatError>([] { Triple("alice", "  ", "cake"); }));
    assert(throws<FormatError>([] { Triple("alice", "likes", "!!"); }));

    TripleSet set{upper, lower, Triple("bob", "likes", "cake")};
    assert(set.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_bindings() {
    std::cout << "Testing Bindings..." << std::endl;

    Binding b("a", "alice");
    assert(b.name() == "?a");
    assert(b.to_string() == "?a = alice");
    assert(throws<MissingArgumentError>([] { Binding("", "x"); }));
    assert(throws<MissingArgumentError>([] { Binding("?a", " "); }));

    Bindings empty;
    assert(empty.empty());
    assert(!empty.contains("a"));
    assert(!empty.lookup("?a"));

    // Duplicates: first wins
    Bindings raw({Binding("?a", "x"), Binding("a", "y"), Binding("?b", "z")});
    assert(raw.size() == 2);
    assert(*raw.lookup("a") == "x");
    assert(*raw.lookup("?a") == "x");
    assert(raw.contains("b"));
    assert(throws<MissingArgumentError>([&] { raw.lookup(""); }));

    // Layering: existing keys win, base untouched
    Bindings layered(raw, {Binding("?a", "other"), Binding("?c", "w")});
    assert(layered.size() == 3);
    assert(*layered.lookup("a") == "x");
    assert(*layered.lookup("c") == "w");
    assert(raw.size() == 2);
    assert(!raw.contains("c"));

    // Insertion order
    std::vector<std::string> names;
    for (const auto& binding : layered) names.push_back(binding.name());
    assert((names == std::vector<std::string>{"?a", "?b", "?c"}));
    assert(layered.to_string() == "{?a = x, ?b = z, ?c = w}");

    Bindings reordered({Binding("?c", "w"), Binding("?b", "z"), Binding("?a", "x")});
    assert(reordered == layered);

    std::cout << "  PASS" << std::endl;
}

void test_matches_fact() {
    std::cout << "Testing matches_fact..." << std::endl;

    Triple fact("alice", "likes", "cake");
    assert(matches_fact(Triple("alice", "likes", "cake"), fact));
    assert(matches_fact(Triple("ALICE", "likes", "?what"), fact));
    assert(matches_fact(Triple("?a", "?b", "?c"), fact));
    assert(!matches_fact(Triple("bob", "likes", "?what"), fact));
    assert(!matches_fact(Triple("?a", "hates", "?b"), fact));

    // Repeated variable: id and object must agree
    Triple same("?a", "?p", "?a");
    assert(matches_fact(same, Triple("narcissus", "loves", "Narcissus")));
    assert(matches_fact(same, Triple("x", "anything", "x")));
    assert(!matches_fact(same, Triple("narcissus", "loves", "echo")));

    // A reused scratch table is cleared on entry
    ScratchTable scratch;
    assert(!matches_fact(same, Triple("a", "p", "b"), scratch));
    assert(matches_fact(same, Triple("c", "p", "c"), scratch));
    assert(*scratch.find("?a") == "c");
    assert(matches_fact(Triple("alice", "likes", "cake"), fact, scratch));
    assert(scratch.empty());

    std::cout << "  PASS" << std::endl;
}

void test_derive_bindings() {
    std::cout << "Testing derive_bindings..." << std::endl;

    Triple pattern("?a", "likes", "?b");
    Triple fact("alice", "likes", "cake");

    auto derived = derive_bindings(pattern, fact, Bindings());
    assert(derived);
    assert(derived->size() == 2);
    assert(*derived->lookup("a") == "alice");
    assert(*derived->lookup("b") == "cake");

    // Existing bindings are never overwritten
    Bindings existing({Binding("?a", "x")});
    auto layered = derive_bindings(pattern, fact, existing);
    assert(layered);
    assert(*layered->lookup("a") == "x");
    assert(*layered->lookup("b") == "cake");

    // No match is not an error
    assert(!derive_bindings(Triple("?a", "hates", "?b"), fact, existing));
    assert(!derive_bindings(Triple("?x", "?p", "?x"), fact, Bindings()));

    // Concrete pattern: empty additions
    auto none = derive_bindings(fact, fact, Bindings());
    assert(none && none->empty());

    std::cout << "  PASS" << std::endl;
}

void test_substitute() {
    std::cout << "Testing substitute..." << std::endl;

    // substitute(P, derive_bindings(P, F)) == F
    std::vector<Triple> facts = {
        Triple("alice", "likes", "cake"),
        Triple("bob", "is", "bob"),
        Triple("'the moon'", "orbits", "earth"),
    };
    std::vector<Triple> patterns = {
        Triple("?a", "?b", "?c"),
        Triple("?a", "likes", "?b"),
        Triple("?x", "?p", "?x"),
        Triple("bob", "?p", "?o"),
        Triple("?s", "orbits", "earth"),
        Triple("alice", "likes", "cake"),
    };
    size_t matched = 0;
    for (const auto& p : patterns) {
        for (const auto& f : facts) {
            auto bindings = derive_bindings(p, f, Bindings());
            if (!bindings) continue;
            ++matched;
            Triple bound = substitute(p, *bindings);
            assert(bound == f);
            assert(!bound.is_pattern());
        }
    }
    assert(matched == 8);

    // Partial bindings leave a pattern
    Triple pattern("?a", "likes", "?b");
    Triple partial = substitute(pattern, Bindings({Binding("a", "alice")}));
    assert(partial.id() == "alice");
    assert(partial.object() == "?b");
    assert(partial.is_pattern());

    // Nothing bound: same triple back
    Triple untouched = substitute(pattern, Bindings({Binding("z", "zed")}));
    assert(untouched == pattern);

    std::cout << "  PASS" << std::endl;
}

void test_derive_conjunction() {
    std::cout << "Testing derive_conjunction..." << std::endl;

    auto patterns = parse_clauses("?a likes ?b . ?b likes cake");
    auto bindings = derive_conjunction(patterns, {
        Triple("alice", "likes", "bob"),
        Triple("bob", "likes", "cake"),
    });
    assert(bindings);
    assert(bindings->size() == 2);
    assert(*bindings->lookup("a") == "alice");
    assert(*bindings->lookup("b") == "bob");

    // Second fact contradicts ?b from the first pattern
    assert(!derive_conjunction(patterns, {
        Triple("alice", "likes", "bob"),
        Triple("carol", "likes", "cake"),
    }));

    // Seed bindings take precedence
    assert(!derive_conjunction(patterns, {
        Triple("alice", "likes", "bob"),
        Triple("bob", "likes", "cake"),
    }, Bindings({Binding("a", "dave")})));

    assert(throws<MissingArgumentError>([&] {
        derive_conjunction(patterns, {Triple("alice", "likes", "bob")});
    }));

    std::cout << "  PASS" << std::endl;
}

void test_parse_clauses() {
    std::cout << "Testing parse_clauses..." << std::endl;

    auto clauses = parse_clauses("?a likes ?b . ?b likes cake");
    assert(clauses.size() == 2);
    assert(clauses[0] == Triple("?a", "likes", "?b"));
    assert(clauses[1] == Triple("?b", "likes", "cake"));

    auto quoted = parse_clauses("?who \"lives in\" 'New York'");
    assert(quoted.size() == 1);
    assert(quoted[0].predicate() == "lives in");
    assert(quoted[0].object() == "new york");

    auto mixed_case = parse_clauses("Alice LIKES ?What");
    assert(mixed_case[0] == Triple("alice", "likes", "?what"));

    assert(throws<FormatError>([] { parse_clauses("a b"); }));
    assert(throws<FormatError>([] { parse_clauses("a b c d"); }));
    assert(throws<FormatError>([] { parse_clauses("a b c . a b"); }));
    assert(throws<FormatError>([] { parse_clauses("a b c .  . d e f"); }));
    assert(throws<FormatError>([] { parse_clauses("a b ..."); }));
    assert(throws<MissingArgumentError>([] { parse_clauses("  "); }));

    std::cout << "  PASS" << std::endl;
}

void test_codec() {
    std::cout << "Testing statement codec..." << std::endl;

    assert(to_statement(Triple("alice", "likes", "cake")) ==
           "<em:alice> <em:likes> \"cake\" .");
    assert(to_statement(Triple("?a", "likes", "?b")) == "?a <em:likes> ?b .");
    assert(to_statement(Triple("http://example.org/a", "urn:p", "say \\hi\\")) ==
           "<http://example.org/a> <urn:p> \"say \\\\hi\\\\\" .");

    assert(is_absolute_uri("em:alice"));
    assert(!is_absolute_uri("alice"));
    assert(!is_absolute_uri("1a:b"));

    std::cout << "  PASS" << std::endl;
}

void test_json() {
    std::cout << "Testing JSON..." << std::endl;

    json t = Triple("Alice", "likes", "cake");
    assert(t["id"] == "alice");
    assert(t["object"] == "cake");

    json b = Bindings({Binding("a", "alice"), Binding("b", "cake")});
    assert(b["?a"] == "alice");
    assert(b.size() == 2);

    json list = bindings_to_json({Bindings(), Bindings({Binding("x", "y")})});
    assert(list.is_array() && list.size() == 2);
    assert(list[0].empty());

    json facts = triples_to_json({Triple("a", "b", "c")});
    assert(facts.size() == 1 && facts[0]["predicate"] == "b");

    std::cout << "  PASS" << std::endl;
}

void test_sqlite_backend() {
    std::cout << "Testing SqliteBackend..." << std::endl;

    auto backend = open_memory_backend();
    assert(backend->insert(Triple("alice", "likes", "bob")));
    assert(backend->insert(Triple("bob", "likes", "cake")));
    assert(backend->insert(Triple("carol", "likes", "dave")));
    assert(backend->insert(Triple("dave", "likes", "pie")));
    assert(backend->insert(Triple("erin", "likes", "erin")));
    assert(backend->insert(Triple("Alice", "LIKES", "Bob")));  // duplicate, no-op
    assert(backend->count() == 5);
    assert(!backend->insert(Triple("?a", "likes", "cake")));

    // Single pattern
    auto likers = backend->enumerate({Triple("?who", "likes", "?what")});
    assert(likers.size() == 5);

    // Conjunction, joined by SQLite
    auto chain = backend->enumerate(parse_clauses("?a likes ?b . ?b likes cake"));
    assert(chain.size() == 1);
    assert(*chain[0].lookup("a") == "alice");
    assert(*chain[0].lookup("b") == "bob");

    auto two_hop = backend->enumerate(parse_clauses("?a likes ?b . ?b likes ?c"));
    assert((values_of(two_hop, "a") == std::multiset<std::string>{"alice", "carol", "erin"}));

    // Repeated variable
    auto self = backend->enumerate({Triple("?x", "likes", "?x")});
    assert(self.size() == 1);
    assert(*self[0].lookup("x") == "erin");

    // Variable-free: one empty Bindings, or nothing
    auto yes = backend->enumerate({Triple("alice", "likes", "bob")});
    assert(yes.size() == 1 && yes[0].empty());
    assert(backend->enumerate({Triple("alice", "likes", "pie")}).empty());
    assert(backend->enumerate({}).empty());

    assert(backend->erase(Triple("dave", "likes", "pie")));
    assert(!backend->erase(Triple("dave", "likes", "pie")));
    assert(backend->count() == 4);

    assert(backend->clear());
    assert(backend->count() == 0);

    backend->close();
    assert(!backend->is_open());
    assert(!backend->insert(Triple("a", "b", "c")));
    assert(backend->enumerate({Triple("?a", "?b", "?c")}).empty());

    std::cout << "  PASS" << std::endl;
}

void test_sqlite_persistence() {
    std::cout << "Testing SqliteBackend persistence..." << std::endl;

    auto dir = std::filesystem::temp_directory_path() /
               ("factum_test_" + std::to_string(std::hash<std::thread::id>{}(
                                     std::this_thread::get_id())));
    std::filesystem::remove_all(dir);
    std::string path = (dir / "facts.db").string();

    {
        SqliteBackend backend(StoreConfig::at(path));
        assert(backend.open());
        assert(backend.insert(Triple("alice", "likes", "cake")));
    }
    {
        SqliteBackend backend(StoreConfig::at(path));
        assert(backend.open());
        assert(backend.count() == 1);
    }
    {
        // A blank value written by another tool
        sqlite3* raw = nullptr;
        assert(sqlite3_open(path.c_str(), &raw) == SQLITE_OK);
        assert(sqlite3_exec(raw,
                            "INSERT INTO facts VALUES ('', 'likes', 'pie')",
                            nullptr, nullptr, nullptr) == SQLITE_OK);
        sqlite3_close(raw);

        SqliteBackend backend(StoreConfig::at(path));
        assert(backend.open());
        assert(backend.count() == 2);
        auto likes = backend.enumerate({Triple("?who", "likes", "?what")});
        assert(likes.size() == 1);
        assert(*likes[0].lookup("who") == "alice");
    }
    {
        StoreConfig config = StoreConfig::at(path);
        config.clear_on_open = true;
        SqliteBackend backend(config);
        assert(backend.open());
        assert(backend.count() == 0);
    }

    std::filesystem::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_fact_base() {
    std::cout << "Testing FactBase..." << std::endl;

    assert(throws<MissingArgumentError>([] { FactBase(nullptr); }));

    auto backend = open_memory_backend();
    FactBase facts(backend);

    assert(facts.add("alice", "likes", "bob"));
    assert(facts.add(Triple("bob", "likes", "cake")));
    assert(facts.add("carol", "likes", "cake"));
    assert(facts.add("carol", "knows", "alice"));
    assert(!facts.add(Triple("?x", "likes", "cake")));
    assert(facts.count() == 4);

    assert(facts.contains(Triple("ALICE", "likes", "bob")));
    assert(!facts.contains(Triple("alice", "likes", "cake")));
    assert(!facts.contains(Triple("?a", "likes", "bob")));

    auto cake = facts.query("?who likes cake");
    assert((values_of(cake, "who") == std::multiset<std::string>{"bob", "carol"}));
    assert(facts.query("carol", "?p", "alice").size() == 1);
    assert(facts.query("dave likes ?x").empty());
    assert(throws<FormatError>([&] { facts.query("alice likes"); }));

    auto everything = facts.all();
    assert(everything.size() == 4);
    assert(everything.count(Triple("carol", "knows", "alice")));

    // Concrete triple
    auto removed = facts.remove("carol", "knows", "alice");
    assert(removed.size() == 1);
    assert(facts.remove("carol", "knows", "alice").empty());

    // Conjunction: every fact taking part in an answer
    removed = facts.remove("?a likes ?b . ?b likes cake");
    assert(removed.size() == 2);
    assert(removed.count(Triple("alice", "likes", "bob")));
    assert(removed.count(Triple("bob", "likes", "cake")));
    assert(facts.count() == 1);

    // Single pattern
    facts.add("dave", "likes", "cake");
    facts.add("dave", "likes", "pie");
    removed = facts.remove(Triple("?x", "likes", "cake"));
    assert(removed.size() == 2);
    assert(facts.count() == 1);

    // A repeated variable only matches equal slots
    facts.add("erin", "knows", "dave");
    facts.add("x", "x", "x");
    assert(facts.query("?x ?x ?x").size() == 1);
    removed = facts.remove("?x ?x ?x");
    assert(removed.size() == 1);
    assert(removed.count(Triple("x", "x", "x")));
    assert(facts.count() == 2);
    assert(facts.contains(Triple("erin", "knows", "dave")));
    assert(facts.contains(Triple("dave", "likes", "pie")));

    // Three distinct variables clear the store
    removed = facts.remove("?a ?b ?c");
    assert(removed.size() == 2);
    assert(facts.count() == 0);

    assert(facts.add("x", "y", "z"));
    assert(facts.clear());
    assert(facts.all().empty());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Core Tests ===" << std::endl;
    test_normalize_primitive();
    test_variables();
    test_triple();
    test_bindings();
    test_matches_fact();
    test_derive_bindings();
    test_substitute();
    test_derive_conjunction();
    test_parse_clauses();
    test_codec();
    test_json();

    std::cout << std::endl;
    std::cout << "=== Store Tests ===" << std::endl;
    test_sqlite_backend();
    test_sqlite_persistence();
    test_fact_base();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
