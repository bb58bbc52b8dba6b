#include "ledger/repository_support.h"
#include "transaction/connection_manager.h"
#include "utils/input_validator.h"
#include "validation/validator.h"

#include <algorithm>
#include <cctype>

namespace fiscus {
namespace ledger {

const char* const kBalanceDeltaSql =
    "CASE WHEN status = 'cancelled' THEN 0 "
    "WHEN transaction_type = 'expense' THEN -amount "
    "ELSE amount END";

const char* toString(RemoveOutcome outcome) {
    switch (outcome) {
        case RemoveOutcome::Deleted: return "deleted";
        case RemoveOutcome::Deactivated: return "deactivated";
    }
    return "deleted";
}

void requireValid(validation::ValidationResult result) {
    if (!result.isValid) {
        throw ValidationFailed(std::move(result));
    }
}

void requireUuid(const std::string& value, const std::string& field) {
    requireValid(validation::ValidationResult::fromErrors(validation::validateUUID(value, field)));
}

void requireUser(ConnectionManager& conn, const std::string& user_id) {
    if (!conn.queryOne("SELECT id FROM users WHERE id = ?", {storage::toValue(user_id)})) {
        throw NotFoundError("User", user_id);
    }
}

void requireOwned(ConnectionManager& conn, const char* table, const std::string& entity,
                  const std::string& id, const std::string& user_id) {
    const std::string sql = std::string("SELECT id FROM ") + table + " WHERE id = ? AND user_id = ?";
    if (!conn.queryOne(sql, {storage::toValue(id), storage::toValue(user_id)})) {
        throw NotFoundError(entity, id);
    }
}

std::optional<std::string> cleanText(const std::optional<std::string>& text) {
    if (!text) return std::nullopt;
    auto cleaned = utils::InputValidator::sanitizeString(*text);
    if (cleaned.empty()) return std::nullopt;
    return cleaned;
}

std::string orderClause(const std::optional<std::string>& sort_by,
                        const std::optional<std::string>& sort_direction,
                        const std::vector<std::string>& allow_list,
                        const std::string& alias,
                        const std::string& fallback) {
    validation::ValidationErrors errors;
    if (sort_by && !utils::InputValidator::validateSortField(*sort_by, allow_list)) {
        errors.push_back({"sort_by", "Invalid sort field: " + utils::InputValidator::sanitizeForLogs(*sort_by, 64),
                          validation::ValidationCode::InvalidFormat});
    }
    if (sort_direction && !utils::InputValidator::validateSortDirection(*sort_direction)) {
        errors.push_back({"sort_direction", "Sort direction must be ASC or DESC",
                          validation::ValidationCode::InvalidFormat});
    }
    requireValid(validation::ValidationResult::fromErrors(std::move(errors)));

    if (!sort_by) return fallback;
    std::string dir = sort_direction.value_or("ASC");
    std::transform(dir.begin(), dir.end(), dir.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return alias + "." + *sort_by + " " + dir + ", " + alias + ".id ASC";
}

void UpdateBuilder::set(const std::string& column, storage::Value value) {
    columns_.push_back(column);
    params_.push_back(std::move(value));
}

storage::Statement UpdateBuilder::build(const char* table, const std::string& id,
                                        const std::string& user_id) const {
    storage::Statement stmt;
    stmt.sql = std::string("UPDATE ") + table + " SET ";
    for (const auto& column : columns_) {
        stmt.sql += column + " = ?, ";
    }
    stmt.sql += "updated_at = CURRENT_TIMESTAMP WHERE id = ? AND user_id = ?";
    stmt.params = params_;
    stmt.params.push_back(storage::toValue(id));
    stmt.params.push_back(storage::toValue(user_id));
    return stmt;
}

} // namespace ledger
} // namespace fiscus
