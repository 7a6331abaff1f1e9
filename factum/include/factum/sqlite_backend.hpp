#pragma once
// SqliteBackend: facts in one SQLite table
//
// Schema:
//   facts(subject, predicate, object)   all TEXT COLLATE NOCASE,
//                                       primary key over the three columns
//
// A conjunction of patterns becomes a single SELECT over aliases f0..fn of
// the facts table, so SQLite performs the join:
//
//   ?a likes ?b . ?b likes cake
//   ->
//   SELECT DISTINCT f0.subject, f0.object
//   FROM facts AS f0, facts AS f1
//   WHERE f0.predicate = ?1 AND f1.subject = f0.object
//     AND f1.predicate = ?2 AND f1.object = ?3
//
// Literals are bound as parameters. The first occurrence of a variable is
// projected; later occurrences become equality constraints.
//
// One connection per backend, guarded by a mutex.

#include "backend.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "log.hpp"
#include "version.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace factum {

class SqliteBackend : public FactBackend {
public:
    explicit SqliteBackend(StoreConfig config = {})
        : config_(std::move(config)) {}

    ~SqliteBackend() override { close(); }

    SqliteBackend(const SqliteBackend&) = delete;
    SqliteBackend& operator=(const SqliteBackend&) = delete;

    bool open() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_) return true;

        if (config_.path != MEMORY_STORE) {
            std::error_code ec;
            auto parent = std::filesystem::path(config_.path).parent_path();
            if (!parent.empty()) std::filesystem::create_directories(parent, ec);
            if (ec) {
                log_error("sqlite", "Cannot create %s: %s",
                          parent.c_str(), ec.message().c_str());
                return false;
            }
        }

        if (sqlite3_open_v2(config_.path.c_str(), &db_,
                            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                            nullptr) != SQLITE_OK) {
            log_error("sqlite", "Error opening %s: %s", config_.path.c_str(),
                      db_ ? sqlite3_errmsg(db_) : "out of memory");
            close_locked();
            return false;
        }

        if (!check_schema_version() || !exec(SCHEMA_SQL)) {
            close_locked();
            return false;
        }

        if (config_.clear_on_open) {
            if (!exec("DELETE FROM facts")) {
                close_locked();
                return false;
            }
            log_info("sqlite", "Cleared store at %s", config_.path.c_str());
        }

        log_debug("sqlite", "Opened store at %s", config_.path.c_str());
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        close_locked();
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return db_ != nullptr;
    }

    const StoreConfig& config() const { return config_; }

    std::vector<Bindings> enumerate(const std::vector<Triple>& patterns) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!require_open() || patterns.empty()) return {};

        SelectPlan plan = plan_select(patterns);
        log_debug("sqlite", "Executing query: %s", plan.sql.c_str());

        auto stmt = prepare(plan.sql);
        if (!stmt) return {};
        for (size_t i = 0; i < plan.params.size(); ++i) {
            sqlite3_bind_text(stmt.get(), static_cast<int>(i + 1),
                              plan.params[i].c_str(), -1, SQLITE_TRANSIENT);
        }

        std::vector<Bindings> results;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            std::vector<Binding> row;
            row.reserve(plan.variables.size());
            bool valid = true;
            for (size_t i = 0; i < plan.variables.size(); ++i) {
                const char* value = reinterpret_cast<const char*>(
                    sqlite3_column_text(stmt.get(), static_cast<int>(i)));
                // Rows written by other tools may hold NULL or blank text
                if (!value || is_blank(value)) {
                    valid = false;
                    break;
                }
                row.emplace_back(plan.variables[i], value);
            }
            if (!valid) {
                log_error("sqlite", "Skipping row with blank %s in %s",
                          plan.variables[row.size()].c_str(),
                          config_.path.c_str());
                continue;
            }
            results.emplace_back(row);
        }

        if (rc != SQLITE_DONE) {
            log_error("sqlite", "Query failed (%s): %s",
                      plan.sql.c_str(), sqlite3_errmsg(db_));
            return {};
        }
        return results;
    }

    bool insert(const Triple& fact) override {
        if (fact.is_pattern()) {
            log_error("sqlite", "Refusing to store pattern %s",
                      fact.to_string().c_str());
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (!require_open()) return false;
        return run_on_fact(
            "INSERT OR IGNORE INTO facts (subject, predicate, object) VALUES (?1, ?2, ?3)",
            fact);
    }

    bool erase(const Triple& fact) override {
        if (fact.is_pattern()) {
            log_error("sqlite", "Refusing to delete pattern %s",
                      fact.to_string().c_str());
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (!require_open()) return false;
        if (!run_on_fact(
                "DELETE FROM facts WHERE subject = ?1 AND predicate = ?2 AND object = ?3",
                fact)) {
            return false;
        }
        return sqlite3_changes(db_) > 0;
    }

    bool clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!require_open()) return false;
        return exec("DELETE FROM facts");
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!require_open()) return 0;

        auto stmt = prepare("SELECT COUNT(*) FROM facts");
        if (!stmt || sqlite3_step(stmt.get()) != SQLITE_ROW) return 0;
        return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }

private:
    using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    static constexpr const char* SCHEMA_SQL =
        "CREATE TABLE IF NOT EXISTS facts ("
        "  subject   TEXT NOT NULL COLLATE NOCASE,"
        "  predicate TEXT NOT NULL COLLATE NOCASE,"
        "  object    TEXT NOT NULL COLLATE NOCASE,"
        "  PRIMARY KEY (subject, predicate, object)"
        ") WITHOUT ROWID";

    static constexpr const char* COLUMNS[SLOT_COUNT] = {"subject", "predicate", "object"};

    struct SelectPlan {
        std::string sql;
        std::vector<std::string> params;     // ?1..?n, in order
        std::vector<std::string> variables;  // projected columns, in order
    };

    static SelectPlan plan_select(const std::vector<Triple>& patterns) {
        SelectPlan plan;
        std::vector<std::string> projections;  // parallel to plan.variables
        std::vector<std::string> constraints;

        for (size_t p = 0; p < patterns.size(); ++p) {
            std::string alias = "f" + std::to_string(p);
            for (size_t s = 0; s < SLOT_COUNT; ++s) {
                std::string column = alias + "." + COLUMNS[s];
                const std::string& slot = patterns[p].slot(s);

                if (!is_variable(slot)) {
                    plan.params.push_back(slot);
                    constraints.push_back(column + " = ?" +
                                          std::to_string(plan.params.size()));
                    continue;
                }

                size_t v = 0;
                while (v < plan.variables.size() && plan.variables[v] != slot) ++v;
                if (v == plan.variables.size()) {
                    plan.variables.push_back(slot);
                    projections.push_back(column);
                } else {
                    constraints.push_back(column + " = " + projections[v]);
                }
            }
        }

        plan.sql = projections.empty() ? "SELECT 1" : "SELECT DISTINCT ";
        for (size_t i = 0; i < projections.size(); ++i) {
            if (i > 0) plan.sql += ", ";
            plan.sql += projections[i];
        }
        plan.sql += " FROM ";
        for (size_t p = 0; p < patterns.size(); ++p) {
            if (p > 0) plan.sql += ", ";
            plan.sql += "facts AS f" + std::to_string(p);
        }
        for (size_t i = 0; i < constraints.size(); ++i) {
            plan.sql += (i == 0 ? " WHERE " : " AND ");
            plan.sql += constraints[i];
        }
        if (projections.empty()) plan.sql += " LIMIT 1";
        return plan;
    }

    bool check_schema_version() {
        auto stmt = prepare("PRAGMA user_version");
        if (!stmt || sqlite3_step(stmt.get()) != SQLITE_ROW) return false;
        int schema = sqlite3_column_int(stmt.get(), 0);
        stmt.reset();

        if (schema == 0) {
            return exec("PRAGMA user_version = " + std::to_string(FACTUM_SCHEMA_VERSION));
        }
        if (!version::schema_compatible(schema)) {
            log_error("sqlite", "Store %s has schema version %d, expected %d",
                      config_.path.c_str(), schema, FACTUM_SCHEMA_VERSION);
            return false;
        }
        return true;
    }

    bool run_on_fact(const char* sql, const Triple& fact) {
        auto stmt = prepare(sql);
        if (!stmt) return false;
        for (size_t s = 0; s < SLOT_COUNT; ++s) {
            sqlite3_bind_text(stmt.get(), static_cast<int>(s + 1),
                              fact.slot(s).c_str(), -1, SQLITE_TRANSIENT);
        }
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            log_error("sqlite", "Failed on %s: %s",
                      to_statement(fact).c_str(), sqlite3_errmsg(db_));
            return false;
        }
        return true;
    }

    StatementPtr prepare(const std::string& sql) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            log_error("sqlite", "Error preparing '%s': %s", sql.c_str(),
                      sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return StatementPtr(nullptr, &sqlite3_finalize);
        }
        return StatementPtr(stmt, &sqlite3_finalize);
    }

    bool exec(const std::string& sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            log_error("sqlite", "'%s' failed: %s", sql.c_str(), err ? err : "unknown error");
            sqlite3_free(err);
            return false;
        }
        return true;
    }

    bool require_open() const {
        if (db_) return true;
        log_error("sqlite", "Store %s is not open", config_.path.c_str());
        return false;
    }

    void close_locked() {
        if (!db_) return;
        sqlite3_close(db_);
        db_ = nullptr;
    }

    StoreConfig config_;
    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
};

} // namespace factum
