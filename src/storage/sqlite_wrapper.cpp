#include "storage/sqlite_wrapper.h"
#include "utils/logger.h"

#include <sqlite3.h>
#include <filesystem>

namespace fiscus {
namespace storage {

namespace {

// Finalizes the prepared statement on every exit path
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() {
        if (stmt) sqlite3_finalize(stmt);
    }
};

void bindParams(sqlite3* db, sqlite3_stmt* stmt, const Params& params) {
    const int expected = sqlite3_bind_parameter_count(stmt);
    if (expected != static_cast<int>(params.size())) {
        throw SQLiteError("parameter count mismatch: statement expects " + std::to_string(expected) +
                          ", got " + std::to_string(params.size()), SQLITE_RANGE);
    }
    for (size_t i = 0; i < params.size(); ++i) {
        const int pos = static_cast<int>(i) + 1;
        const Value& v = params[i];
        int rc = SQLITE_OK;
        if (std::holds_alternative<std::monostate>(v)) {
            rc = sqlite3_bind_null(stmt, pos);
        } else if (auto b = std::get_if<bool>(&v)) {
            rc = sqlite3_bind_int64(stmt, pos, *b ? 1 : 0);
        } else if (auto n = std::get_if<int64_t>(&v)) {
            rc = sqlite3_bind_int64(stmt, pos, *n);
        } else if (auto d = std::get_if<double>(&v)) {
            rc = sqlite3_bind_double(stmt, pos, *d);
        } else if (auto s = std::get_if<std::string>(&v)) {
            rc = sqlite3_bind_text(stmt, pos, s->c_str(), static_cast<int>(s->size()), SQLITE_TRANSIENT);
        }
        if (rc != SQLITE_OK) {
            throw SQLiteError("bind of parameter " + std::to_string(pos) + " failed: " +
                              sqlite3_errmsg(db), rc);
        }
    }
}

Value readColumn(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return Value{static_cast<int64_t>(sqlite3_column_int64(stmt, col))};
        case SQLITE_FLOAT:
            return Value{sqlite3_column_double(stmt, col)};
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            const int len = sqlite3_column_bytes(stmt, col);
            return Value{std::string(text ? text : "", static_cast<size_t>(len))};
        }
        case SQLITE_BLOB: {
            const auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt, col));
            const int len = sqlite3_column_bytes(stmt, col);
            return Value{std::string(blob ? blob : "", static_cast<size_t>(len))};
        }
        default:
            return Value{};
    }
}

} // namespace

SQLiteWrapper::SQLiteWrapper(const Config& config) : config_(config) {}

SQLiteWrapper::~SQLiteWrapper() {
    close();
}

SQLiteWrapper::SQLiteWrapper(SQLiteWrapper&& other) noexcept
    : config_(std::move(other.config_))
    , db_(other.db_)
    , last_error_(std::move(other.last_error_)) {
    other.db_ = nullptr;
}

SQLiteWrapper& SQLiteWrapper::operator=(SQLiteWrapper&& other) noexcept {
    if (this != &other) {
        close();
        config_ = std::move(other.config_);
        db_ = other.db_;
        last_error_ = std::move(other.last_error_);
        other.db_ = nullptr;
    }
    return *this;
}

bool SQLiteWrapper::open() {
    if (db_) {
        return true;
    }
    last_error_.clear();

    const bool in_memory = config_.db_path == ":memory:" || config_.db_path.empty();
    if (!in_memory && config_.create_if_missing) {
        std::error_code ec;
        auto parent = std::filesystem::path(config_.db_path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                FISCUS_WARN("Could not create database directory {}: {}", parent.string(), ec.message());
            }
        }
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
    if (config_.create_if_missing) flags |= SQLITE_OPEN_CREATE;

    const std::string path = in_memory ? ":memory:" : config_.db_path;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        last_error_ = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        FISCUS_ERROR("Failed to open SQLite database {}: {}", path, last_error_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    try {
        if (config_.enable_foreign_keys) {
            exec("PRAGMA foreign_keys = ON");
        }
        if (config_.enable_wal && !in_memory) {
            exec("PRAGMA journal_mode = WAL");
            exec("PRAGMA synchronous = NORMAL");
        }
        // Fails fast on files that are not databases
        query("SELECT count(*) AS n FROM sqlite_master");
    } catch (const SQLiteError& e) {
        last_error_ = e.what();
        FISCUS_ERROR("SQLite database {} is not usable: {}", path, last_error_);
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    FISCUS_INFO("SQLite database opened: {} (wal={}, foreign_keys={})",
                path, config_.enable_wal && !in_memory, config_.enable_foreign_keys);
    return true;
}

void SQLiteWrapper::close() {
    if (!db_) {
        return;
    }
    // sqlite3_close_v2 defers until outstanding statements are finalized
    int rc = sqlite3_close_v2(db_);
    if (rc != SQLITE_OK) {
        FISCUS_WARN("sqlite3_close_v2 returned {}", rc);
    }
    db_ = nullptr;
}

std::string SQLiteWrapper::errorMessage(int rc) const {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    return msg + " (sqlite code " + std::to_string(rc) + ")";
}

std::vector<Row> SQLiteWrapper::query(const std::string& sql, const Params& params) {
    if (!db_) {
        throw SQLiteError("database is not open", SQLITE_MISUSE);
    }
    StmtGuard guard;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &guard.stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw SQLiteError(errorMessage(rc), rc);
    }
    // Writes go through execute() so they show up in CommandResult
    if (guard.stmt && !sqlite3_stmt_readonly(guard.stmt)) {
        throw SQLiteError("query() accepts read-only statements only; use execute()", SQLITE_MISUSE);
    }
    bindParams(db_, guard.stmt, params);

    std::vector<Row> rows;
    const int cols = sqlite3_column_count(guard.stmt);
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        Row row;
        for (int c = 0; c < cols; ++c) {
            const char* name = sqlite3_column_name(guard.stmt, c);
            row.set(name ? name : std::to_string(c), readColumn(guard.stmt, c));
        }
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        throw SQLiteError(errorMessage(rc), rc);
    }
    return rows;
}

CommandResult SQLiteWrapper::execute(const std::string& sql, const Params& params) {
    if (!db_) {
        throw SQLiteError("database is not open", SQLITE_MISUSE);
    }
    StmtGuard guard;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &guard.stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw SQLiteError(errorMessage(rc), rc);
    }
    bindParams(db_, guard.stmt, params);

    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        // RETURNING rows or pragmas are discarded
    }
    if (rc != SQLITE_DONE) {
        throw SQLiteError(errorMessage(rc), rc);
    }
    CommandResult result;
    result.rows_affected = sqlite3_changes(db_);
    result.last_insert_id = sqlite3_last_insert_rowid(db_);
    return result;
}

void SQLiteWrapper::exec(const std::string& sql) {
    if (!db_) {
        throw SQLiteError("database is not open", SQLITE_MISUSE);
    }
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw SQLiteError(msg + " (sqlite code " + std::to_string(rc) + ")", rc);
    }
}

bool SQLiteWrapper::inTransaction() const {
    return db_ != nullptr && sqlite3_get_autocommit(db_) == 0;
}

} // namespace storage
} // namespace fiscus
