#pragma once

#include <string>
#include <vector>
#include "query/pagination.h"
#include "query/query_filter.h"
#include "storage/value.h"

namespace fiscus {
namespace query {

/// Columns a caller may sort transaction listings by
extern const std::vector<std::string> kTransactionSortFields;

/// Validated, allow-listed translation of a TransactionFilter. The same
/// where/params pair drives listing, counting and statistics.
struct QueryPlan {
    std::string where;          // "t.user_id = ? AND ...", never empty
    storage::Params params;
    std::string order_by;       // "t.<field> <DIR>, t.id ASC"
    PageRequest page;
    std::string search_term;    // sanitized search text, empty when unused
};

class TransactionQueryBuilder {
public:
    struct Options {
        int64_t default_page_size = kDefaultPageSize;
        int64_t max_page_size = kMaxPageSize;
    };

    TransactionQueryBuilder() = default;
    explicit TransactionQueryBuilder(Options options) : options_(options) {}

    /// Throws ValidationFailed for malformed ids, unknown enum values,
    /// inverted ranges or a sort field/direction outside the allow-list.
    QueryPlan build(const TransactionFilter& filter) const;

    /// SELECT ... FROM transactions t WHERE ... ORDER BY ... LIMIT ? OFFSET ?
    std::string selectSql(const QueryPlan& plan) const;
    storage::Params selectParams(const QueryPlan& plan) const;

    /// SELECT COUNT(*) AS total FROM transactions t WHERE ...
    std::string countSql(const QueryPlan& plan) const;

    const Options& options() const { return options_; }

    static const char* selectColumns();

private:
    Options options_;
};

} // namespace query
} // namespace fiscus
