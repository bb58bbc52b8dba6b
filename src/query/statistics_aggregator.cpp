#include "query/statistics_aggregator.h"
#include "transaction/connection_manager.h"
#include "utils/logger.h"

#include <algorithm>

namespace fiscus {
namespace query {

nlohmann::json TransactionStatistics::toJson() const {
    nlohmann::json j = {
        {"total_transactions", total_transactions},
        {"total_income", total_income},
        {"total_expenses", total_expenses},
        {"net_income", net_income},
        {"average_transaction_amount", average_transaction_amount},
        {"largest_income", nullptr},
        {"largest_expense", nullptr},
        {"most_frequent_category", nullptr},
        {"transactions_by_type", transactions_by_type},
        {"transactions_by_status", transactions_by_status}
    };
    if (largest_income) j["largest_income"] = *largest_income;
    if (largest_expense) j["largest_expense"] = *largest_expense;
    if (most_frequent_category_id) j["most_frequent_category"] = *most_frequent_category_id;
    return j;
}

nlohmann::json CategorySpending::toJson() const {
    return {
        {"category_id", category_id},
        {"category_name", category_name},
        {"total_spent", total_spent},
        {"transaction_count", transaction_count}
    };
}

nlohmann::json MonthlySummary::toJson() const {
    return {
        {"month", month},
        {"total_income", total_income},
        {"total_expenses", total_expenses},
        {"net_income", net_income}
    };
}

StatisticsAggregator::StatisticsAggregator(ConnectionManager& conn, TransactionQueryBuilder builder)
    : conn_(conn)
    , builder_(builder) {}

TransactionStatistics StatisticsAggregator::compute(const TransactionFilter& filter) const {
    const QueryPlan plan = builder_.build(filter);

    // One statement so every figure reads the same snapshot
    const std::string sql =
        "SELECT t.transaction_type AS transaction_type, t.status AS status, COUNT(*) AS n, "
        "SUM(t.amount) AS sum_amount, SUM(ABS(t.amount)) AS sum_abs, "
        "MAX(t.amount) AS max_amount, MAX(ABS(t.amount)) AS max_abs "
        "FROM transactions t WHERE " + plan.where +
        " GROUP BY t.transaction_type, t.status";

    TransactionStatistics stats;
    double sum_abs_all = 0.0;
    for (const auto& row : conn_.query(sql, plan.params)) {
        const std::string type = row.getString("transaction_type");
        const std::string status = row.getString("status");
        const int64_t n = row.getInt("n");

        stats.total_transactions += n;
        stats.transactions_by_type[type] += n;
        stats.transactions_by_status[status] += n;
        sum_abs_all += row.getDouble("sum_abs");

        if (type == "income") {
            stats.total_income += row.getDouble("sum_amount");
            const double max_amount = row.getDouble("max_amount");
            if (!stats.largest_income || max_amount > *stats.largest_income) {
                stats.largest_income = max_amount;
            }
        } else if (type == "expense") {
            stats.total_expenses += row.getDouble("sum_abs");
            const double max_abs = row.getDouble("max_abs");
            if (!stats.largest_expense || max_abs > *stats.largest_expense) {
                stats.largest_expense = max_abs;
            }
        }
    }
    stats.net_income = stats.total_income - stats.total_expenses;
    if (stats.total_transactions > 0) {
        stats.average_transaction_amount = sum_abs_all / static_cast<double>(stats.total_transactions);
    }

    const std::string top_category_sql =
        "SELECT t.category_id AS category_id, COUNT(*) AS n FROM transactions t WHERE " + plan.where +
        " AND t.category_id IS NOT NULL GROUP BY t.category_id ORDER BY n DESC, t.category_id ASC LIMIT 1";
    if (auto row = conn_.queryOne(top_category_sql, plan.params)) {
        stats.most_frequent_category_id = row->getOptionalString("category_id");
    }

    FISCUS_DEBUG("Statistics for user {}: {} transactions, net {}", filter.user_id,
                 stats.total_transactions, stats.net_income);
    return stats;
}

std::vector<CategorySpending> StatisticsAggregator::categorySpending(const TransactionFilter& filter) const {
    const QueryPlan plan = builder_.build(filter);
    const std::string sql =
        "SELECT c.id AS category_id, c.name AS category_name, "
        "SUM(ABS(t.amount)) AS total_spent, COUNT(t.id) AS transaction_count "
        "FROM transactions t JOIN categories c ON t.category_id = c.id "
        "WHERE " + plan.where + " AND t.transaction_type = 'expense' "
        "GROUP BY c.id, c.name ORDER BY total_spent DESC, c.name ASC";

    return conn_.query<CategorySpending>(sql, plan.params, [](const storage::Row& row) {
        CategorySpending cs;
        cs.category_id = row.getString("category_id");
        cs.category_name = row.getString("category_name");
        cs.total_spent = row.getDouble("total_spent");
        cs.transaction_count = row.getInt("transaction_count");
        return cs;
    });
}

std::vector<MonthlySummary> StatisticsAggregator::monthlySeries(const TransactionFilter& filter) const {
    const QueryPlan plan = builder_.build(filter);
    const std::string sql =
        "SELECT strftime('%Y-%m', t.transaction_date) AS month, "
        "COALESCE(SUM(CASE WHEN t.transaction_type = 'income' THEN t.amount ELSE 0 END), 0) AS total_income, "
        "COALESCE(SUM(CASE WHEN t.transaction_type = 'expense' THEN ABS(t.amount) ELSE 0 END), 0) AS total_expenses "
        "FROM transactions t WHERE " + plan.where +
        " GROUP BY strftime('%Y-%m', t.transaction_date) ORDER BY month ASC";

    return conn_.query<MonthlySummary>(sql, plan.params, [](const storage::Row& row) {
        MonthlySummary m;
        m.month = row.getString("month");
        m.total_income = row.getDouble("total_income");
        m.total_expenses = row.getDouble("total_expenses");
        m.net_income = m.total_income - m.total_expenses;
        return m;
    });
}

} // namespace query
} // namespace fiscus
