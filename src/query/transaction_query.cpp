#include "query/transaction_query.h"
#include "storage/ledger_errors.h"
#include "utils/input_validator.h"
#include "validation/request_validators.h"

#include <algorithm>
#include <cctype>

namespace fiscus {
namespace query {

using storage::toValue;

const std::vector<std::string> kTransactionSortFields = {
    "amount", "transaction_date", "description", "payee", "status",
    "transaction_type", "created_at", "updated_at"
};

const char* TransactionQueryBuilder::selectColumns() {
    return "t.id, t.user_id, t.account_id, t.category_id, t.amount, t.description, t.notes, "
           "t.transaction_date, t.transaction_type, t.status, t.reference_number, t.payee, t.tags, "
           "t.created_at, t.updated_at";
}

QueryPlan TransactionQueryBuilder::build(const TransactionFilter& filter) const {
    auto check = validation::validateTransactionFilter(filter, kTransactionSortFields);
    if (!check.isValid) {
        throw ValidationFailed(std::move(check));
    }

    QueryPlan plan;
    std::vector<std::string> conds;

    conds.emplace_back("t.user_id = ?");
    plan.params.push_back(toValue(filter.user_id));

    if (filter.account_id && !filter.account_id->empty()) {
        conds.emplace_back("t.account_id = ?");
        plan.params.push_back(toValue(*filter.account_id));
    }
    if (filter.category_id && !filter.category_id->empty()) {
        conds.emplace_back("t.category_id = ?");
        plan.params.push_back(toValue(*filter.category_id));
    }
    if (filter.transaction_type) {
        conds.emplace_back("t.transaction_type = ?");
        plan.params.push_back(toValue(*filter.transaction_type));
    }
    if (filter.status) {
        conds.emplace_back("t.status = ?");
        plan.params.push_back(toValue(*filter.status));
    }
    if (filter.start_date) {
        conds.emplace_back("DATE(t.transaction_date) >= DATE(?)");
        plan.params.push_back(toValue(*filter.start_date));
    }
    if (filter.end_date) {
        conds.emplace_back("DATE(t.transaction_date) <= DATE(?)");
        plan.params.push_back(toValue(*filter.end_date));
    }
    if (filter.min_amount) {
        conds.emplace_back("ABS(t.amount) >= ?");
        plan.params.push_back(toValue(*filter.min_amount));
    }
    if (filter.max_amount) {
        conds.emplace_back("ABS(t.amount) <= ?");
        plan.params.push_back(toValue(*filter.max_amount));
    }
    if (filter.search) {
        plan.search_term = utils::InputValidator::sanitizeSearchQuery(*filter.search);
        if (!plan.search_term.empty()) {
            // SQLite LIKE folds ASCII case
            const std::string pattern = "%" + utils::InputValidator::escapeLike(plan.search_term) + "%";
            conds.emplace_back("(t.description LIKE ? ESCAPE '\\' OR t.payee LIKE ? ESCAPE '\\' "
                               "OR t.notes LIKE ? ESCAPE '\\')");
            plan.params.push_back(toValue(pattern));
            plan.params.push_back(toValue(pattern));
            plan.params.push_back(toValue(pattern));
        }
    }

    for (size_t i = 0; i < conds.size(); ++i) {
        if (i > 0) plan.where += " AND ";
        plan.where += conds[i];
    }

    // Only allow-listed identifiers reach the ORDER BY text
    if (filter.sort_by) {
        std::string dir = filter.sort_direction.value_or("DESC");
        std::transform(dir.begin(), dir.end(), dir.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        plan.order_by = "t." + *filter.sort_by + " " + dir + ", t.id ASC";
    } else {
        std::string dir = "DESC";
        if (filter.sort_direction) {
            dir = *filter.sort_direction;
            std::transform(dir.begin(), dir.end(), dir.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        }
        plan.order_by = "t.transaction_date " + dir + ", t.created_at " + dir + ", t.id ASC";
    }

    plan.page = PageRequest::normalize(filter.offset, filter.limit,
                                       options_.default_page_size, options_.max_page_size);
    return plan;
}

std::string TransactionQueryBuilder::selectSql(const QueryPlan& plan) const {
    return std::string("SELECT ") + selectColumns() + " FROM transactions t WHERE " + plan.where +
           " ORDER BY " + plan.order_by + " LIMIT ? OFFSET ?";
}

storage::Params TransactionQueryBuilder::selectParams(const QueryPlan& plan) const {
    storage::Params params = plan.params;
    params.push_back(toValue(plan.page.limit));
    params.push_back(toValue(plan.page.offset));
    return params;
}

std::string TransactionQueryBuilder::countSql(const QueryPlan& plan) const {
    return "SELECT COUNT(*) AS total FROM transactions t WHERE " + plan.where;
}

} // namespace query
} // namespace fiscus
