#include "transaction/connection_manager.h"
#include "storage/schema_migrations.h"
#include "utils/input_validator.h"
#include "utils/logger.h"

namespace fiscus {

using storage::CommandResult;
using storage::Params;
using storage::Row;
using storage::SQLiteError;
using storage::SQLiteWrapper;
using storage::Statement;

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Uninitialized: return "uninitialized";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Ready: return "ready";
        case ConnectionState::Failed: return "failed";
        case ConnectionState::Closing: return "closing";
        case ConnectionState::Closed: return "closed";
    }
    return "unknown";
}

ConnectionManager::ConnectionManager(Config config)
    : config_(std::move(config)) {}

ConnectionManager::~ConnectionManager() {
    close();
}

void ConnectionManager::throwIfClosing() const {
    if (state_.load() == ConnectionState::Closing) {
        throw ConnectionError("Connection is closing");
    }
}

SQLiteWrapper& ConnectionManager::open() {
    throwIfClosing();
    std::lock_guard<std::mutex> lock(mutex_);
    return ensureOpenLocked();
}

SQLiteWrapper& ConnectionManager::ensureOpenLocked() {
    if (state_.load() == ConnectionState::Ready && db_ && db_->isOpen()) {
        return *db_;
    }

    state_ = ConnectionState::Connecting;
    FISCUS_DEBUG("Opening ledger database {}", config_.db.db_path);

    auto db = std::make_unique<SQLiteWrapper>(config_.db);
    if (!db->open()) {
        state_ = ConnectionState::Failed;
        throw ConnectionError("Cannot open database '" + config_.db.db_path + "': " + db->lastError());
    }

    if (config_.apply_migrations) {
        try {
            const int applied = storage::SchemaMigrations::apply(*db);
            if (applied > 0) {
                FISCUS_INFO("Applied {} schema migration(s), schema version now {}",
                            applied, storage::SchemaMigrations::currentVersion(*db));
            }
        } catch (const ConnectionError&) {
            db->close();
            state_ = ConnectionState::Failed;
            throw;
        }
    }

    db_ = std::move(db);
    ++opens_;
    state_ = ConnectionState::Ready;
    return *db_;
}

void ConnectionManager::close() {
    ConnectionState current = state_.load();
    if (current == ConnectionState::Closing || current == ConnectionState::Closed ||
        current == ConnectionState::Uninitialized) {
        return;
    }
    state_ = ConnectionState::Closing;
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        db_->close();
        db_.reset();
        FISCUS_INFO("Ledger database closed ({})", config_.db.db_path);
    }
    state_ = ConnectionState::Closed;
}

void ConnectionManager::logStatement(const char* kind, const std::string& statement,
                                     const Params& params, Clock::time_point start) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    const auto ms = static_cast<uint64_t>(elapsed < 0 ? 0 : elapsed);

    uint64_t prev = max_statement_ms_.load();
    while (ms > prev && !max_statement_ms_.compare_exchange_weak(prev, ms)) {
    }

    if (config_.enable_query_logging && utils::Logger::shouldLog(utils::Logger::Level::DEBUG)) {
        FISCUS_DEBUG("{} ({} ms): {} params={}", kind, ms,
                     utils::InputValidator::sanitizeForLogs(statement, 256),
                     utils::InputValidator::sanitizeForLogs(storage::renderParams(params), 256));
    }
    if (config_.slow_query_threshold_ms > 0 && elapsed >= config_.slow_query_threshold_ms) {
        ++slow_statements_;
        FISCUS_WARN("Slow {} ({} ms >= {} ms): {}", kind, ms, config_.slow_query_threshold_ms,
                    utils::InputValidator::sanitizeForLogs(statement, 256));
    }
}

std::vector<Row> ConnectionManager::query(const std::string& statement, const Params& params) {
    throwIfClosing();
    std::lock_guard<std::mutex> lock(mutex_);
    SQLiteWrapper& db = ensureOpenLocked();

    const auto start = Clock::now();
    try {
        auto rows = db.query(statement, params);
        ++queries_;
        logStatement("query", statement, params, start);
        return rows;
    } catch (const SQLiteError& e) {
        FISCUS_ERROR("Query failed: {} | statement: {} | params: {}", e.what(),
                     utils::InputValidator::sanitizeForLogs(statement),
                     utils::InputValidator::sanitizeForLogs(storage::renderParams(params)));
        throw QueryError(e.what(), statement, storage::renderParams(params));
    }
}

std::optional<Row> ConnectionManager::queryOne(const std::string& statement, const Params& params) {
    auto rows = query(statement, params);
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

CommandResult ConnectionManager::execute(const std::string& statement, const Params& params) {
    throwIfClosing();
    std::lock_guard<std::mutex> lock(mutex_);
    SQLiteWrapper& db = ensureOpenLocked();

    const auto start = Clock::now();
    try {
        auto result = db.execute(statement, params);
        ++commands_;
        logStatement("command", statement, params, start);
        return result;
    } catch (const SQLiteError& e) {
        FISCUS_ERROR("Command failed: {} | statement: {} | params: {}", e.what(),
                     utils::InputValidator::sanitizeForLogs(statement),
                     utils::InputValidator::sanitizeForLogs(storage::renderParams(params)));
        throw CommandError(e.what(), statement, storage::renderParams(params));
    }
}

std::optional<std::string> ConnectionManager::rollbackLocked() {
    if (!db_ || !db_->inTransaction()) {
        // SQLite already rolled back (e.g. on SQLITE_FULL); nothing left to undo
        return std::nullopt;
    }
    try {
        db_->exec("ROLLBACK");
        return std::nullopt;
    } catch (const SQLiteError& e) {
        ++rollback_failures_;
        FISCUS_CRITICAL("ROLLBACK failed: {}", e.what());
        return std::string(e.what());
    }
}

TransactionOutcome ConnectionManager::runTransaction(const std::vector<Statement>& statements) {
    throwIfClosing();
    std::lock_guard<std::mutex> lock(mutex_);
    SQLiteWrapper& db = ensureOpenLocked();

    const auto start = Clock::now();
    try {
        db.exec("BEGIN IMMEDIATE TRANSACTION");
    } catch (const SQLiteError& e) {
        FISCUS_ERROR("BEGIN failed: {}", e.what());
        ++rolled_back_;
        return TransactionError(e.what(), 0, "BEGIN IMMEDIATE TRANSACTION", "[]");
    }

    std::vector<CommandResult> results;
    results.reserve(statements.size());
    for (size_t i = 0; i < statements.size(); ++i) {
        const Statement& st = statements[i];
        try {
            results.push_back(db.execute(st.sql, st.params));
            ++commands_;
        } catch (const SQLiteError& e) {
            const std::string params = storage::renderParams(st.params);
            FISCUS_ERROR("Transaction statement {} of {} failed: {} | statement: {} | params: {}",
                         i + 1, statements.size(), e.what(),
                         utils::InputValidator::sanitizeForLogs(st.sql),
                         utils::InputValidator::sanitizeForLogs(params));
            auto note = rollbackLocked();
            ++rolled_back_;
            return TransactionError(e.what(), i, st.sql, params, std::move(note));
        }
    }

    try {
        db.exec("COMMIT");
    } catch (const SQLiteError& e) {
        FISCUS_ERROR("COMMIT failed: {}", e.what());
        auto note = rollbackLocked();
        ++rolled_back_;
        return TransactionError(e.what(), statements.size(), "COMMIT", "[]", std::move(note));
    }

    ++committed_;
    logStatement("transaction", std::to_string(statements.size()) + " statement(s)", {}, start);
    return std::move(results);
}

std::vector<CommandResult> ConnectionManager::runTransactionOrThrow(const std::vector<Statement>& statements) {
    auto outcome = runTransaction(statements);
    if (auto* err = std::get_if<TransactionError>(&outcome)) {
        throw *err;
    }
    return std::get<std::vector<CommandResult>>(std::move(outcome));
}

bool ConnectionManager::healthCheck() noexcept {
    try {
        auto rows = query("SELECT 1 AS ok");
        return !rows.empty() && rows.front().getInt("ok") == 1;
    } catch (const LedgerError& e) {
        FISCUS_WARN("Health check failed: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        FISCUS_WARN("Health check failed: {}", e.what());
        return false;
    }
}

int ConnectionManager::schemaVersion() noexcept {
    try {
        auto row = queryOne("PRAGMA user_version");
        return row ? static_cast<int>(row->getInt("user_version", 0)) : 0;
    } catch (const LedgerError& e) {
        FISCUS_WARN("Reading schema version failed: {}", e.what());
        return 0;
    } catch (const std::exception& e) {
        FISCUS_WARN("Reading schema version failed: {}", e.what());
        return 0;
    }
}

ConnectionManager::Stats ConnectionManager::getStats() const {
    Stats stats;
    stats.opens = opens_.load();
    stats.queries = queries_.load();
    stats.commands = commands_.load();
    stats.transactions_committed = committed_.load();
    stats.transactions_rolled_back = rolled_back_.load();
    stats.rollback_failures = rollback_failures_.load();
    stats.slow_statements = slow_statements_.load();
    stats.max_statement_ms = max_statement_ms_.load();
    return stats;
}

} // namespace fiscus
