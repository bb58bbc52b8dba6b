#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ledger/models.h"

namespace fiscus {

class ConnectionManager;

namespace ledger {

/// Lookback windows of the history reports
constexpr int kDefaultHistoryDays = 30;
constexpr int kMaxHistoryDays = 365;
constexpr int kDefaultProgressionMonths = 12;
constexpr int kMaxProgressionMonths = 24;

/**
 * @brief Balances, budgets and goals as of now; income and expenses over
 * the optional date range.
 *
 * Transfers are excluded from income, expenses and transaction_count.
 */
struct FinancialOverview {
    std::optional<std::string> start_date;
    std::optional<std::string> end_date;
    AccountSummary accounts;
    BudgetSummary budgets;
    GoalProgressSummary goals;
    double total_income = 0.0;
    double total_expenses = 0.0;     // absolute
    double net_income = 0.0;
    int64_t transaction_count = 0;

    nlohmann::json toJson() const;
};

/// One account on one day. Cancelled rows are left out.
struct BalanceHistoryEntry {
    std::string date;               // YYYY-MM-DD
    std::string account_id;
    std::string account_name;
    double daily_inflow = 0.0;
    double daily_outflow = 0.0;     // absolute
    double net_change = 0.0;
    double closing_balance = 0.0;   // derived back from current_balance
    int64_t transaction_count = 0;

    nlohmann::json toJson() const;
};

/// One calendar month of income minus expenses
struct NetWorthPoint {
    std::string month;              // YYYY-MM
    double net_change = 0.0;
    double net_worth = 0.0;         // estimated at month end
    int64_t transaction_count = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Cross-entity reports for one user.
 *
 * History figures are reconstructed from current balances by undoing
 * later transactions; administrative balance corrections are not tracked.
 */
class ReportRepository {
public:
    explicit ReportRepository(ConnectionManager& conn);

    /// Dates are inclusive YYYY-MM-DD.
    /// Throws ValidationFailed, NotFoundError (user)
    FinancialOverview financialOverview(const std::string& user_id,
                                        const std::optional<std::string>& start_date = std::nullopt,
                                        const std::optional<std::string>& end_date = std::nullopt);

    /// Days with activity within the last `days` (clamped to [1, 365]),
    /// newest first, then by account name.
    /// Throws ValidationFailed, NotFoundError (user or account)
    std::vector<BalanceHistoryEntry> accountBalanceHistory(const std::string& user_id,
                                                           const std::optional<std::string>& account_id = std::nullopt,
                                                           std::optional<int> days = std::nullopt);

    /// Months with income or expenses within the last `months` (clamped to
    /// [1, 24]), oldest first. Only active accounts count.
    /// Throws ValidationFailed, NotFoundError (user)
    std::vector<NetWorthPoint> netWorthProgression(const std::string& user_id,
                                                   std::optional<int> months = std::nullopt);

private:
    ConnectionManager& conn_;
};

} // namespace ledger
} // namespace fiscus
