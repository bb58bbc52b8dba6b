#pragma once

#include <optional>
#include <string>
#include <vector>
#include "ledger/models.h"
#include "validation/requests.h"

namespace fiscus {

class ConnectionManager;

namespace ledger {

/// Budget periods and the per-category budgets inside them.
/// spent_amount is maintained by TransactionRepository::create().
class BudgetRepository {
public:
    explicit BudgetRepository(ConnectionManager& conn);

    // ===== Periods =====

    BudgetPeriod createPeriod(const validation::CreateBudgetPeriodRequest& request);
    std::optional<BudgetPeriod> findPeriod(const std::string& id, const std::string& user_id);
    /// Newest start date first
    std::vector<BudgetPeriod> listPeriods(const std::string& user_id, bool active_only = false);

    // ===== Budgets =====

    /// Throws ValidationFailed, NotFoundError (period, category),
    /// ConflictError when the category is already budgeted in the period
    Budget create(const validation::CreateBudgetRequest& request);

    std::optional<Budget> findById(const std::string& id, const std::string& user_id);
    Budget getById(const std::string& id, const std::string& user_id);

    std::vector<Budget> listForPeriod(const std::string& budget_period_id, const std::string& user_id);

    /// Allocated amount and notes; spent_amount is never written here
    Budget update(const std::string& id, const std::string& user_id,
                  const validation::UpdateBudgetRequest& request);

    void remove(const std::string& id, const std::string& user_id);

    /// Across all periods, or one period when given
    BudgetSummary summary(const std::string& user_id,
                          const std::optional<std::string>& budget_period_id = std::nullopt);

private:
    ConnectionManager& conn_;
};

} // namespace ledger
} // namespace fiscus
