// factum: command-line interface to a fact store
//
// Usage: factum [options] <command> [args]
//
// Commands:
//   add        Store a fact
//   query      Answer a query string with variable bindings
//   remove     Remove the facts a query string matches
//   all        List every fact
//   count      Number of stored facts
//   clear      Remove every fact
//   export     Every fact as a statement line
//   help       Show this help

#include <factum/factum.hpp>
#include <factum/config.hpp>
#include <factum/json.hpp>
#include <factum/log.hpp>
#include <factum/sqlite_backend.hpp>
#include <algorithm>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace factum;

const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "factum " << FACTUM_VERSION << " - Triple store\n\n"
              << "Usage: " << name << " [options] <command> [args]\n\n"
              << "Commands:\n"
              << "  add ID PREDICATE OBJECT   Store a fact\n"
              << "  query \"CLAUSES\"           Bindings answering the query\n"
              << "  remove \"CLAUSES\"          Remove matching facts\n"
              << "  all                       List every fact\n"
              << "  count                     Number of stored facts\n"
              << "  clear                     Remove every fact\n"
              << "  export                    Every fact as a statement\n"
              << "  help                      Show this help\n\n"
              << "Clauses are separated by ' . ', e.g.\n"
              << "  " << name << " query \"?a likes ?b . ?b likes cake\"\n\n"
              << "Options:\n"
              << "  --path PATH        Store file (default: $FACTUM_PATH or ~/.factum/facts.db)\n"
              << "  --clear            Clear the store when opening it\n"
              << "  --json             Output as JSON\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -h, --help         Show this help\n"
              << "  -v, --version      Show version\n";
}

// Sorted so output is stable
std::vector<Triple> sorted(const TripleSet& facts) {
    std::vector<Triple> out(facts.begin(), facts.end());
    std::sort(out.begin(), out.end(), [](const Triple& a, const Triple& b) {
        if (a.id() != b.id()) return a.id() < b.id();
        if (a.predicate() != b.predicate()) return a.predicate() < b.predicate();
        return a.object() < b.object();
    });
    return out;
}

void print_facts(const TripleSet& facts, bool json_output) {
    auto ordered = sorted(facts);
    if (json_output) {
        std::cout << triples_to_json(ordered).dump(2) << "\n";
        return;
    }
    for (const auto& t : ordered) {
        std::cout << t.id() << " " << t.predicate() << " " << t.object() << "\n";
    }
}

int cmd_add(FactBase& facts, const std::vector<std::string>& args, bool json_output) {
    if (args.size() != 3) {
        std::cerr << "Usage: factum add ID PREDICATE OBJECT\n";
        return 1;
    }

    Triple fact(args[0], args[1], args[2]);
    if (fact.is_pattern()) {
        std::cerr << "Error: cannot store a pattern: " << fact.to_string() << "\n";
        return 1;
    }
    bool ok = facts.add(fact);
    if (json_output) {
        std::cout << json{{"added", ok}, {"fact", fact}}.dump(2) << "\n";
    } else if (ok) {
        std::cout << "Added " << fact.to_string() << "\n";
    }
    return ok ? 0 : 1;
}

int cmd_query(FactBase& facts, const std::string& query_string, bool json_output) {
    auto results = facts.query(query_string);
    if (json_output) {
        std::cout << bindings_to_json(results).dump(2) << "\n";
        return 0;
    }

    if (results.empty()) {
        std::cout << "No matches\n";
        return 0;
    }
    for (const auto& bindings : results) {
        std::cout << (bindings.empty() ? "yes" : bindings.to_string()) << "\n";
    }
    return 0;
}

int cmd_remove(FactBase& facts, const std::string& query_string, bool json_output) {
    auto removed = facts.remove(query_string);
    if (json_output) {
        print_facts(removed, true);
        return 0;
    }
    print_facts(removed, false);
    std::cout << "Removed " << removed.size() << " fact"
              << (removed.size() == 1 ? "" : "s") << "\n";
    return 0;
}

int cmd_count(SqliteBackend& backend, bool json_output) {
    size_t n = backend.count();
    if (json_output) {
        std::cout << json{{"count", n}}.dump() << "\n";
    } else {
        std::cout << n << "\n";
    }
    return 0;
}

int cmd_export(FactBase& facts) {
    for (const auto& t : sorted(facts.all())) {
        std::cout << to_statement(t) << "\n";
    }
    return 0;
}

int run(const std::string& command, const std::vector<std::string>& args,
        const StoreConfig& config, bool json_output) {
    auto backend = std::make_shared<SqliteBackend>(config);
    if (!backend->open()) {
        std::cerr << "Error: Failed to open store at " << config.path << "\n";
        return 1;
    }
    FactBase facts(backend);

    if (command == "add") {
        return cmd_add(facts, args, json_output);
    }
    if (command == "query" || command == "remove") {
        if (args.size() != 1) {
            std::cerr << "Usage: factum " << command << " \"CLAUSES\"\n";
            return 1;
        }
        return command == "query" ? cmd_query(facts, args[0], json_output)
                                  : cmd_remove(facts, args[0], json_output);
    }
    if (command == "all") {
        print_facts(facts.all(), json_output);
        return 0;
    }
    if (command == "count") {
        return cmd_count(*backend, json_output);
    }
    if (command == "clear") {
        if (!facts.clear()) {
            std::cerr << "Error: Failed to clear store\n";
            return 1;
        }
        return 0;
    }
    if (command == "export") {
        return cmd_export(facts);
    }

    std::cerr << "Unknown command: " << command << "\n";
    return 1;
}

int main(int argc, char* argv[]) {
    StoreConfig config = StoreConfig::at(default_store_path());
    std::string command;
    std::vector<std::string> args;
    bool json_output = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
            config.path = argv[++i];
        } else if (strcmp(argv[i], "--clear") == 0) {
            config.clear_on_open = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "factum " << FACTUM_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else {
                args.emplace_back(argv[i]);
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    set_verbose(config.verbose);
    log_debug("cli", "command=%s store=%s", command.c_str(), config.path.c_str());

    try {
        return run(command, args, config, json_output);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
