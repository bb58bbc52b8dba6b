#include "ledger/budget_repository.h"
#include "ledger/repository_support.h"
#include "transaction/connection_manager.h"
#include "utils/id_generator.h"
#include "utils/input_validator.h"
#include "utils/logger.h"
#include "validation/request_validators.h"

namespace fiscus {
namespace ledger {

using storage::toValue;

namespace {

const char* kPeriodColumns = "id, user_id, name, start_date, end_date, is_active, created_at, updated_at";

const char* kBudgetColumns =
    "id, user_id, budget_period_id, category_id, allocated_amount, spent_amount, notes, "
    "created_at, updated_at";

} // namespace

BudgetRepository::BudgetRepository(ConnectionManager& conn)
    : conn_(conn) {}

// ===== Periods =====

BudgetPeriod BudgetRepository::createPeriod(const validation::CreateBudgetPeriodRequest& request) {
    requireValid(validation::validateCreateBudgetPeriodRequest(request));
    requireUser(conn_, request.user_id);

    const std::string id = utils::IdGenerator::uuidV4();
    conn_.runTransactionOrThrow({
        {"INSERT INTO budget_periods (id, user_id, name, start_date, end_date, is_active) "
         "VALUES (?, ?, ?, ?, ?, ?)",
         {toValue(id), toValue(request.user_id), toValue(utils::InputValidator::sanitizeString(request.name)),
          toValue(request.start_date), toValue(request.end_date), toValue(request.is_active)}}
    });

    auto period = findPeriod(id, request.user_id);
    if (!period) {
        throw NotFoundError("BudgetPeriod", id);
    }
    return *period;
}

std::optional<BudgetPeriod> BudgetRepository::findPeriod(const std::string& id, const std::string& user_id) {
    requireUuid(id, "budget_period_id");
    auto row = conn_.queryOne(
        std::string("SELECT ") + kPeriodColumns + " FROM budget_periods WHERE id = ? AND user_id = ?",
        {toValue(id), toValue(user_id)});
    if (!row) return std::nullopt;
    return BudgetPeriod::fromRow(*row);
}

std::vector<BudgetPeriod> BudgetRepository::listPeriods(const std::string& user_id, bool active_only) {
    requireUuid(user_id, "user_id");
    std::string sql = std::string("SELECT ") + kPeriodColumns + " FROM budget_periods WHERE user_id = ?";
    if (active_only) {
        sql += " AND is_active = 1";
    }
    sql += " ORDER BY start_date DESC, id ASC";
    return conn_.query<BudgetPeriod>(sql, {toValue(user_id)}, &BudgetPeriod::fromRow);
}

// ===== Budgets =====

Budget BudgetRepository::create(const validation::CreateBudgetRequest& request) {
    requireValid(validation::validateCreateBudgetRequest(request));
    requireUser(conn_, request.user_id);
    requireOwned(conn_, "budget_periods", "BudgetPeriod", request.budget_period_id, request.user_id);
    requireOwned(conn_, "categories", "Category", request.category_id, request.user_id);

    if (conn_.queryOne("SELECT id FROM budgets WHERE budget_period_id = ? AND category_id = ?",
                       {toValue(request.budget_period_id), toValue(request.category_id)})) {
        throw ConflictError("Budget already exists for this category and period");
    }

    const std::string id = utils::IdGenerator::uuidV4();
    conn_.runTransactionOrThrow({
        {"INSERT INTO budgets (id, user_id, budget_period_id, category_id, allocated_amount, "
         "spent_amount, notes) VALUES (?, ?, ?, ?, ?, 0, ?)",
         {toValue(id), toValue(request.user_id), toValue(request.budget_period_id),
          toValue(request.category_id), toValue(*request.allocated_amount), toValue(cleanText(request.notes))}}
    });

    FISCUS_DEBUG("Created budget {} in period {}", id, request.budget_period_id);
    return getById(id, request.user_id);
}

std::optional<Budget> BudgetRepository::findById(const std::string& id, const std::string& user_id) {
    requireUuid(id, "budget_id");
    auto row = conn_.queryOne(
        std::string("SELECT ") + kBudgetColumns + " FROM budgets WHERE id = ? AND user_id = ?",
        {toValue(id), toValue(user_id)});
    if (!row) return std::nullopt;
    return Budget::fromRow(*row);
}

Budget BudgetRepository::getById(const std::string& id, const std::string& user_id) {
    auto budget = findById(id, user_id);
    if (!budget) {
        throw NotFoundError("Budget", id);
    }
    return *budget;
}

std::vector<Budget> BudgetRepository::listForPeriod(const std::string& budget_period_id,
                                                    const std::string& user_id) {
    requireUuid(budget_period_id, "budget_period_id");
    requireOwned(conn_, "budget_periods", "BudgetPeriod", budget_period_id, user_id);
    return conn_.query<Budget>(
        std::string("SELECT ") + kBudgetColumns +
            " FROM budgets WHERE budget_period_id = ? AND user_id = ? ORDER BY created_at, id",
        {toValue(budget_period_id), toValue(user_id)}, &Budget::fromRow);
}

Budget BudgetRepository::update(const std::string& id, const std::string& user_id,
                                const validation::UpdateBudgetRequest& request) {
    requireValid(validation::validateUpdateBudgetRequest(request));
    getById(id, user_id);

    UpdateBuilder changes;
    if (request.allocated_amount) changes.set("allocated_amount", toValue(*request.allocated_amount));
    if (request.notes) changes.set("notes", toValue(cleanText(request.notes)));
    if (!changes.empty()) {
        conn_.runTransactionOrThrow({changes.build("budgets", id, user_id)});
    }
    return getById(id, user_id);
}

void BudgetRepository::remove(const std::string& id, const std::string& user_id) {
    getById(id, user_id);
    conn_.runTransactionOrThrow({
        {"DELETE FROM budgets WHERE id = ? AND user_id = ?", {toValue(id), toValue(user_id)}}
    });
}

BudgetSummary BudgetRepository::summary(const std::string& user_id,
                                        const std::optional<std::string>& budget_period_id) {
    requireUuid(user_id, "user_id");
    requireUser(conn_, user_id);

    std::string sql =
        "SELECT COUNT(*) AS n, COALESCE(SUM(allocated_amount), 0) AS allocated, "
        "COALESCE(SUM(spent_amount), 0) AS spent, "
        "COALESCE(SUM(CASE WHEN spent_amount > allocated_amount THEN 1 ELSE 0 END), 0) AS over_count "
        "FROM budgets WHERE user_id = ?";
    storage::Params params{toValue(user_id)};
    if (budget_period_id) {
        requireUuid(*budget_period_id, "budget_period_id");
        sql += " AND budget_period_id = ?";
        params.push_back(toValue(*budget_period_id));
    }

    BudgetSummary s;
    if (auto row = conn_.queryOne(sql, params)) {
        s.budget_count = row->getInt("n");
        s.total_allocated = row->getDouble("allocated");
        s.total_spent = row->getDouble("spent");
        s.over_budget_count = row->getInt("over_count");
    }
    s.under_budget_count = s.budget_count - s.over_budget_count;
    s.remaining = s.total_allocated - s.total_spent;
    return s;
}

} // namespace ledger
} // namespace fiscus
