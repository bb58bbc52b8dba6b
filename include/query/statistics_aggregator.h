#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "query/query_filter.h"
#include "query/transaction_query.h"

namespace fiscus {

class ConnectionManager;

namespace query {

/**
 * @brief Aggregates over one filtered transaction set.
 *
 * Invariants: sum(transactions_by_type) == total_transactions and
 * net_income == total_income - total_expenses.
 */
struct TransactionStatistics {
    int64_t total_transactions = 0;
    double total_income = 0.0;
    double total_expenses = 0.0;            // absolute
    double net_income = 0.0;
    double average_transaction_amount = 0.0; // mean of |amount|
    std::optional<double> largest_income;
    std::optional<double> largest_expense;  // absolute
    std::map<std::string, int64_t> transactions_by_type;
    std::map<std::string, int64_t> transactions_by_status;
    std::optional<std::string> most_frequent_category_id;

    nlohmann::json toJson() const;
};

struct CategorySpending {
    std::string category_id;
    std::string category_name;
    double total_spent = 0.0;
    int64_t transaction_count = 0;

    nlohmann::json toJson() const;
};

/// One calendar month (YYYY-MM)
struct MonthlySummary {
    std::string month;
    double total_income = 0.0;
    double total_expenses = 0.0;
    double net_income = 0.0;

    nlohmann::json toJson() const;
};

/**
 * @brief Statistics Aggregator
 *
 * Uses the exact WHERE clause and parameters of the listing plan, so
 * listings and statistics agree for identical filters. Pagination and
 * sorting in the filter are ignored.
 */
class StatisticsAggregator {
public:
    StatisticsAggregator(ConnectionManager& conn, TransactionQueryBuilder builder = {});

    /**
     * @brief Totals, histograms and extremes over the filtered set
     * @throws ValidationFailed on an invalid filter, QueryError on storage failure
     */
    TransactionStatistics compute(const TransactionFilter& filter) const;

    /**
     * @brief Expense totals per category, largest first
     */
    std::vector<CategorySpending> categorySpending(const TransactionFilter& filter) const;

    /**
     * @brief Income/expense per month, ascending
     */
    std::vector<MonthlySummary> monthlySeries(const TransactionFilter& filter) const;

private:
    ConnectionManager& conn_;
    TransactionQueryBuilder builder_;
};

} // namespace query
} // namespace fiscus
