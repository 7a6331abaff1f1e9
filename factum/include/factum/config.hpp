#pragma once
// Store configuration

#include <cstdlib>
#include <string>
#include <utility>

namespace factum {

constexpr const char* MEMORY_STORE = ":memory:";

// $FACTUM_PATH, else ~/.factum/facts.db
inline std::string default_store_path() {
    if (const char* path = std::getenv("FACTUM_PATH")) {
        if (*path) return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) home = ".";
    return std::string(home) + "/.factum/facts.db";
}

struct StoreConfig {
    std::string path = MEMORY_STORE;  // SQLite file, or ":memory:"
    bool clear_on_open = false;       // Drop every fact when opening
    bool verbose = false;             // Debug logging

    static StoreConfig in_memory() { return StoreConfig{}; }

    static StoreConfig at(std::string p) {
        StoreConfig config;
        config.path = std::move(p);
        return config;
    }
};

} // namespace factum
