#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "validation/validation_result.h"

namespace fiscus {

/// Base of every error raised by the ledger core. toEnvelope() yields the
/// {message, code, details} object handed to the presentation layer.
class LedgerError : public std::runtime_error {
public:
    LedgerError(std::string code, const std::string& message)
        : std::runtime_error(message)
        , code_(std::move(code))
    {}

    const std::string& code() const { return code_; }

    virtual nlohmann::json details() const { return nlohmann::json::object(); }

    nlohmann::json toEnvelope() const {
        return {
            {"message", what()},
            {"code", code_},
            {"details", details()}
        };
    }

private:
    std::string code_;
};

/// Store could not be opened, is closing, or a migration failed
class ConnectionError : public LedgerError {
public:
    explicit ConnectionError(const std::string& message)
        : LedgerError("CONNECTION_ERROR", message)
    {}
};

/// Shared shape of QueryError / CommandError: the driver message plus the
/// failing statement and its rendered parameters.
class StatementError : public LedgerError {
public:
    StatementError(std::string code, const std::string& driver_message,
                   std::string statement, std::string params)
        : LedgerError(std::move(code), driver_message)
        , statement_(std::move(statement))
        , params_(std::move(params))
    {}

    const std::string& statement() const { return statement_; }
    const std::string& params() const { return params_; }

    nlohmann::json details() const override {
        return {{"statement", statement_}, {"params", params_}};
    }

private:
    std::string statement_;
    std::string params_;
};

class QueryError : public StatementError {
public:
    QueryError(const std::string& driver_message, std::string statement, std::string params)
        : StatementError("QUERY_ERROR", driver_message, std::move(statement), std::move(params))
    {}
};

class CommandError : public StatementError {
public:
    CommandError(const std::string& driver_message, std::string statement, std::string params)
        : StatementError("COMMAND_ERROR", driver_message, std::move(statement), std::move(params))
    {}
};

/// Failed atomic batch. The statement error is always the primary message;
/// a failed rollback only adds rollbackNote() and switches the kind.
class TransactionError : public LedgerError {
public:
    enum class Kind { StatementFailed, RollbackFailed };

    TransactionError(const std::string& cause, size_t failed_index,
                     std::string statement, std::string params,
                     std::optional<std::string> rollback_note = std::nullopt)
        : LedgerError("TRANSACTION_ERROR", cause)
        , failed_index_(failed_index)
        , statement_(std::move(statement))
        , params_(std::move(params))
        , rollback_note_(std::move(rollback_note))
    {}

    Kind kind() const { return rollback_note_ ? Kind::RollbackFailed : Kind::StatementFailed; }
    size_t failedIndex() const { return failed_index_; }
    const std::string& statement() const { return statement_; }
    const std::string& params() const { return params_; }
    const std::optional<std::string>& rollbackNote() const { return rollback_note_; }

    nlohmann::json details() const override {
        nlohmann::json d = {
            {"failed_index", failed_index_},
            {"statement", statement_},
            {"params", params_}
        };
        if (rollback_note_) d["rollback_error"] = *rollback_note_;
        return d;
    }

private:
    size_t failed_index_;
    std::string statement_;
    std::string params_;
    std::optional<std::string> rollback_note_;
};

/// Raised by repositories before any statement is issued
class ValidationFailed : public LedgerError {
public:
    explicit ValidationFailed(validation::ValidationResult result)
        : LedgerError("VALIDATION_ERROR", "Validation failed: " + result.summary())
        , result_(std::move(result))
    {}

    const validation::ValidationResult& result() const { return result_; }

    nlohmann::json details() const override { return result_.toJson(); }

private:
    validation::ValidationResult result_;
};

class NotFoundError : public LedgerError {
public:
    NotFoundError(std::string entity, std::string id)
        : LedgerError("NOT_FOUND", entity + " not found: " + id)
        , entity_(std::move(entity))
        , id_(std::move(id))
    {}

    const std::string& entity() const { return entity_; }
    const std::string& id() const { return id_; }

    nlohmann::json details() const override { return {{"entity", entity_}, {"id", id_}}; }

private:
    std::string entity_;
    std::string id_;
};

/// Request is well-formed but contradicts stored state (cycles, ownership)
class ConflictError : public LedgerError {
public:
    explicit ConflictError(const std::string& message)
        : LedgerError("CONFLICT", message)
    {}
};

} // namespace fiscus
