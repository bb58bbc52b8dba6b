#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "query/pagination.h"
#include "storage/ledger_errors.h"
#include "storage/value.h"
#include "validation/request_validators.h"
#include "validation/validation_result.h"

namespace fiscus {

class ConnectionManager;

namespace ledger {

/// Paging and bulk limits shared by all repositories
struct RepositoryOptions {
    int64_t default_page_size = query::kDefaultPageSize;
    int64_t max_page_size = query::kMaxPageSize;
    size_t max_bulk_items = validation::kMaxBulkItems;
};

/// Result of remove() on entities that are soft-deleted while referenced
enum class RemoveOutcome {
    Deleted,        // row removed
    Deactivated     // still referenced; is_active cleared
};

const char* toString(RemoveOutcome outcome);

/// Signed balance effect of a stored transaction row, as a SQL expression
/// over the columns of `transactions`. Mirrors balanceDelta(); cancelled
/// rows contribute nothing.
extern const char* const kBalanceDeltaSql;

/// Throws ValidationFailed when the result carries errors
void requireValid(validation::ValidationResult result);

/// Single-field INVALID_FORMAT failure (e.g. an id passed outside a request)
void requireUuid(const std::string& value, const std::string& field);

/// Throws NotFoundError("User", id)
void requireUser(ConnectionManager& conn, const std::string& user_id);

/// Row owned by user_id in table, else NotFoundError(entity, id).
/// table is always a literal from the calling repository.
void requireOwned(ConnectionManager& conn, const char* table, const std::string& entity,
                  const std::string& id, const std::string& user_id);

/// Stored free text: sanitized, empty after sanitizing becomes NULL
std::optional<std::string> cleanText(const std::optional<std::string>& text);

/// "<alias>.<field> <DIR>, <alias>.id ASC" for an allow-listed field,
/// fallback when sort_by is absent. Direction defaults to ASC.
/// Throws ValidationFailed (INVALID_FORMAT on sort_by / sort_direction)
std::string orderClause(const std::optional<std::string>& sort_by,
                        const std::optional<std::string>& sort_direction,
                        const std::vector<std::string>& allow_list,
                        const std::string& alias,
                        const std::string& fallback);

/// Accumulates "column = ?" assignments of a partial update
class UpdateBuilder {
public:
    void set(const std::string& column, storage::Value value);
    bool empty() const { return columns_.empty(); }

    /// UPDATE <table> SET ..., updated_at = CURRENT_TIMESTAMP
    /// WHERE id = ? AND user_id = ?
    storage::Statement build(const char* table, const std::string& id,
                             const std::string& user_id) const;

private:
    std::vector<std::string> columns_;
    storage::Params params_;
};

} // namespace ledger
} // namespace fiscus
