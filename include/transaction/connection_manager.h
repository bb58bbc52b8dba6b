#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "storage/ledger_errors.h"
#include "storage/sqlite_wrapper.h"
#include "storage/value.h"

namespace fiscus {

/// Lifecycle of the single store handle
enum class ConnectionState {
    Uninitialized,
    Connecting,
    Ready,
    Failed,     // open() failed; next operation retries
    Closing,
    Closed      // next operation re-opens
};

const char* toString(ConnectionState state);

/// One result per statement on commit, otherwise the error. Never partial.
using TransactionOutcome = std::variant<std::vector<storage::CommandResult>, TransactionError>;

/// ConnectionManager: owns the one SQLite handle and serializes every
/// query, write and transaction on it behind a mutex.
class ConnectionManager {
public:
    struct Config {
        storage::SQLiteWrapper::Config db;
        bool apply_migrations = true;
        int64_t slow_query_threshold_ms = 50;
        bool enable_query_logging = true;
    };

    struct Stats {
        uint64_t opens = 0;
        uint64_t queries = 0;
        uint64_t commands = 0;
        uint64_t transactions_committed = 0;
        uint64_t transactions_rolled_back = 0;
        uint64_t rollback_failures = 0;
        uint64_t slow_statements = 0;
        uint64_t max_statement_ms = 0;
    };

    explicit ConnectionManager(Config config);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// Opens lazily, applies pragmas and pending migrations. Idempotent.
    /// Throws ConnectionError.
    storage::SQLiteWrapper& open();

    /// Idempotent; safe at shutdown
    void close();

    ConnectionState state() const { return state_.load(); }
    bool isReady() const { return state_.load() == ConnectionState::Ready; }

    // ===== Reads =====

    /// Throws QueryError (statement + params) or ConnectionError
    std::vector<storage::Row> query(const std::string& statement, const storage::Params& params = {});

    template<typename T>
    std::vector<T> query(const std::string& statement,
                         const storage::Params& params,
                         const std::function<T(const storage::Row&)>& mapper) {
        auto rows = query(statement, params);
        std::vector<T> out;
        out.reserve(rows.size());
        for (const auto& r : rows) {
            out.push_back(mapper(r));
        }
        return out;
    }

    /// First row or std::nullopt
    std::optional<storage::Row> queryOne(const std::string& statement, const storage::Params& params = {});

    // ===== Writes =====

    /// Throws CommandError or ConnectionError
    storage::CommandResult execute(const std::string& statement, const storage::Params& params = {});

    /// BEGIN, statements in order, COMMIT. On failure rolls back and returns
    /// the statement error; a failed rollback is attached, not substituted.
    TransactionOutcome runTransaction(const std::vector<storage::Statement>& statements);

    /// runTransaction, throwing the TransactionError
    std::vector<storage::CommandResult> runTransactionOrThrow(const std::vector<storage::Statement>& statements);

    // ===== Status (never throw) =====

    bool healthCheck() noexcept;
    int schemaVersion() noexcept;

    Stats getStats() const;
    const Config& getConfig() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    Config config_;
    mutable std::mutex mutex_;
    std::unique_ptr<storage::SQLiteWrapper> db_;
    std::atomic<ConnectionState> state_{ConnectionState::Uninitialized};

    // Statistics
    std::atomic<uint64_t> opens_{0};
    std::atomic<uint64_t> queries_{0};
    std::atomic<uint64_t> commands_{0};
    std::atomic<uint64_t> committed_{0};
    std::atomic<uint64_t> rolled_back_{0};
    std::atomic<uint64_t> rollback_failures_{0};
    std::atomic<uint64_t> slow_statements_{0};
    std::atomic<uint64_t> max_statement_ms_{0};

    void throwIfClosing() const;
    // Caller holds mutex_
    storage::SQLiteWrapper& ensureOpenLocked();
    void logStatement(const char* kind, const std::string& statement,
                      const storage::Params& params, Clock::time_point start);
    std::optional<std::string> rollbackLocked();
};

} // namespace fiscus
