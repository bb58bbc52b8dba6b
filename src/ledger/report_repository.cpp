#include "ledger/report_repository.h"
#include "ledger/account_repository.h"
#include "ledger/budget_repository.h"
#include "ledger/goal_repository.h"
#include "ledger/repository_support.h"
#include "query/statistics_aggregator.h"
#include "transaction/connection_manager.h"
#include "utils/logger.h"

#include <algorithm>
#include <map>

namespace fiscus {
namespace ledger {

using storage::toValue;

namespace {

nlohmann::json optionalText(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json FinancialOverview::toJson() const {
    return {
        {"start_date", optionalText(start_date)},
        {"end_date", optionalText(end_date)},
        {"total_assets", accounts.total_assets},
        {"total_liabilities", accounts.total_liabilities},
        {"net_worth", accounts.net_worth},
        {"total_income", total_income},
        {"total_expenses", total_expenses},
        {"net_income", net_income},
        {"transaction_count", transaction_count},
        {"accounts", accounts.toJson()},
        {"budgets", budgets.toJson()},
        {"goals", goals.toJson()}
    };
}

nlohmann::json BalanceHistoryEntry::toJson() const {
    return {
        {"date", date},
        {"account_id", account_id},
        {"account_name", account_name},
        {"daily_inflow", daily_inflow},
        {"daily_outflow", daily_outflow},
        {"net_change", net_change},
        {"closing_balance", closing_balance},
        {"transaction_count", transaction_count}
    };
}

nlohmann::json NetWorthPoint::toJson() const {
    return {
        {"month", month},
        {"net_change", net_change},
        {"net_worth", net_worth},
        {"transaction_count", transaction_count}
    };
}

ReportRepository::ReportRepository(ConnectionManager& conn)
    : conn_(conn) {}

FinancialOverview ReportRepository::financialOverview(const std::string& user_id,
                                                      const std::optional<std::string>& start_date,
                                                      const std::optional<std::string>& end_date) {
    requireUuid(user_id, "user_id");
    requireUser(conn_, user_id);

    query::TransactionFilter filter;
    filter.user_id = user_id;
    filter.start_date = start_date;
    filter.end_date = end_date;
    // Validates the dates before anything else is read
    const auto stats = query::StatisticsAggregator(conn_).compute(filter);

    FinancialOverview overview;
    overview.start_date = start_date;
    overview.end_date = end_date;
    overview.total_income = stats.total_income;
    overview.total_expenses = stats.total_expenses;
    overview.net_income = stats.net_income;
    overview.transaction_count = stats.total_transactions;
    auto transfers = stats.transactions_by_type.find(toString(TransactionType::Transfer));
    if (transfers != stats.transactions_by_type.end()) {
        overview.transaction_count -= transfers->second;
    }

    overview.accounts = AccountRepository(conn_).summary(user_id);
    overview.budgets = BudgetRepository(conn_).summary(user_id);
    overview.goals = GoalRepository(conn_).progressSummary(user_id);

    FISCUS_DEBUG("Overview for user {}: net worth {}, net income {}", user_id,
                 overview.accounts.net_worth, overview.net_income);
    return overview;
}

std::vector<BalanceHistoryEntry> ReportRepository::accountBalanceHistory(const std::string& user_id,
                                                                         const std::optional<std::string>& account_id,
                                                                         std::optional<int> days) {
    requireUuid(user_id, "user_id");
    requireUser(conn_, user_id);
    if (account_id) {
        requireUuid(*account_id, "account_id");
        requireOwned(conn_, "accounts", "Account", *account_id, user_id);
    }
    const int window = std::clamp(days.value_or(kDefaultHistoryDays), 1, kMaxHistoryDays);

    std::string inner =
        std::string("SELECT account_id, transaction_date, ") + kBalanceDeltaSql + " AS delta "
        "FROM transactions WHERE user_id = ? AND status != 'cancelled' "
        "AND DATE(transaction_date) >= DATE('now', ?)";
    storage::Params params{toValue(user_id), toValue("-" + std::to_string(window) + " days")};
    if (account_id) {
        inner += " AND account_id = ?";
        params.push_back(toValue(*account_id));
    }

    const std::string sql =
        "SELECT DATE(d.transaction_date) AS day, d.account_id AS account_id, a.name AS account_name, "
        "a.current_balance AS current_balance, "
        "COALESCE(SUM(CASE WHEN d.delta > 0 THEN d.delta ELSE 0 END), 0) AS inflow, "
        "COALESCE(SUM(CASE WHEN d.delta < 0 THEN -d.delta ELSE 0 END), 0) AS outflow, "
        "COUNT(*) AS n "
        "FROM (" + inner + ") d JOIN accounts a ON a.id = d.account_id "
        "GROUP BY DATE(d.transaction_date), d.account_id, a.name, a.current_balance "
        "ORDER BY day DESC, a.name ASC, d.account_id ASC";

    std::vector<BalanceHistoryEntry> history;
    // Balance after every row seen so far, per account
    std::map<std::string, double> running;
    for (const auto& row : conn_.query(sql, params)) {
        BalanceHistoryEntry e;
        e.date = row.getString("day");
        e.account_id = row.getString("account_id");
        e.account_name = row.getString("account_name");
        e.daily_inflow = row.getDouble("inflow");
        e.daily_outflow = row.getDouble("outflow");
        e.net_change = e.daily_inflow - e.daily_outflow;
        e.transaction_count = row.getInt("n");

        auto it = running.find(e.account_id);
        if (it == running.end()) {
            it = running.emplace(e.account_id, row.getDouble("current_balance")).first;
        }
        e.closing_balance = it->second;
        it->second -= e.net_change;
        history.push_back(std::move(e));
    }
    return history;
}

std::vector<NetWorthPoint> ReportRepository::netWorthProgression(const std::string& user_id,
                                                                 std::optional<int> months) {
    requireUuid(user_id, "user_id");
    requireUser(conn_, user_id);
    const int window = std::clamp(months.value_or(kDefaultProgressionMonths), 1, kMaxProgressionMonths);

    // The current month counts as one of the window's months
    const std::string sql =
        "SELECT strftime('%Y-%m', d.transaction_date) AS month, "
        "COALESCE(SUM(d.delta), 0) AS net_change, COUNT(*) AS n "
        "FROM (SELECT t.transaction_date AS transaction_date, " + std::string(kBalanceDeltaSql) + " AS delta "
        "      FROM transactions t JOIN accounts a ON a.id = t.account_id "
        "      WHERE t.user_id = ? AND a.is_active = 1 AND t.transaction_type != 'transfer' "
        "      AND t.status != 'cancelled' "
        "      AND DATE(t.transaction_date) >= DATE('now', 'start of month', ?)) d "
        "GROUP BY strftime('%Y-%m', d.transaction_date) ORDER BY month ASC";

    auto points = conn_.query<NetWorthPoint>(
        sql, {toValue(user_id), toValue("-" + std::to_string(window - 1) + " months")},
        [](const storage::Row& row) {
            NetWorthPoint p;
            p.month = row.getString("month");
            p.net_change = row.getDouble("net_change");
            p.transaction_count = row.getInt("n");
            return p;
        });

    // Walk back from today's net worth, undoing each later month
    double running = AccountRepository(conn_).summary(user_id).net_worth;
    for (auto it = points.rbegin(); it != points.rend(); ++it) {
        it->net_worth = running;
        running -= it->net_change;
    }
    return points;
}

} // namespace ledger
} // namespace fiscus
