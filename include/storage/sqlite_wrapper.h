#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "storage/value.h"

struct sqlite3;

namespace fiscus {
namespace storage {

/// Driver-level failure (prepare, bind or step) with the SQLite result code
class SQLiteError : public std::runtime_error {
public:
    SQLiteError(const std::string& message, int code)
        : std::runtime_error(message)
        , code_(code)
    {}

    int code() const { return code_; }

private:
    int code_;
};

/// Thin RAII wrapper over one sqlite3 handle. Not thread-safe; the
/// ConnectionManager serializes access.
class SQLiteWrapper {
public:
    struct Config {
        std::string db_path = "./data/fiscus.db";   // ":memory:" for tests
        int busy_timeout_ms = 5000;
        bool enable_wal = true;                    // ignored for :memory:
        bool enable_foreign_keys = true;
        bool create_if_missing = true;
    };

    explicit SQLiteWrapper(const Config& config);
    ~SQLiteWrapper();

    // Disable copy, allow move
    SQLiteWrapper(const SQLiteWrapper&) = delete;
    SQLiteWrapper& operator=(const SQLiteWrapper&) = delete;
    SQLiteWrapper(SQLiteWrapper&&) noexcept;
    SQLiteWrapper& operator=(SQLiteWrapper&&) noexcept;

    /// Open the database and apply connection pragmas
    bool open();

    /// Close the database
    void close();

    /// Check if database is open
    bool isOpen() const { return db_ != nullptr; }

    /// Last open() failure
    const std::string& lastError() const { return last_error_; }

    const Config& getConfig() const { return config_; }

    // ===== Statements =====

    /// Run a statement and collect all rows. Throws SQLiteError.
    std::vector<Row> query(const std::string& sql, const Params& params = {});

    /// Run a single write statement. Throws SQLiteError.
    CommandResult execute(const std::string& sql, const Params& params = {});

    /// Run raw SQL text (may hold several statements, no parameters).
    /// Throws SQLiteError.
    void exec(const std::string& sql);

    /// True while an explicit transaction is open on this handle
    bool inTransaction() const;

    /// Direct access to the sqlite3 handle (hooks, authorizers)
    sqlite3* getRawDB() { return db_; }

private:
    Config config_;
    sqlite3* db_ = nullptr;
    std::string last_error_;

    std::string errorMessage(int rc) const;
};

} // namespace storage
} // namespace fiscus
