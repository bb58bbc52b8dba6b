#include <gtest/gtest.h>
#include "ledger_test_fixture.h"
#include "ledger/budget_repository.h"
#include "ledger/goal_repository.h"
#include "ledger/transaction_repository.h"

using namespace fiscus;
using namespace fiscus::ledger;

// ============================================================================
// Budgets
// ============================================================================

class BudgetRepositoryTest : public test::LedgerTestBase {
protected:
    void SetUp() override {
        LedgerTestBase::SetUp();
        food_ = createCategory("Food");
        fun_ = createCategory("Fun");
        period_ = createPeriod("March", "2024-03-01", "2024-03-31");
    }

    std::string createPeriod(const std::string& name, const std::string& start, const std::string& end,
                             bool active = true) {
        BudgetRepository repo(*conn_);
        validation::CreateBudgetPeriodRequest req;
        req.user_id = user_id_;
        req.name = name;
        req.start_date = start;
        req.end_date = end;
        req.is_active = active;
        return repo.createPeriod(req).id;
    }

    validation::CreateBudgetRequest budgetRequest(const std::string& category, double allocated) {
        validation::CreateBudgetRequest req;
        req.user_id = user_id_;
        req.budget_period_id = period_;
        req.category_id = category;
        req.allocated_amount = allocated;
        return req;
    }

    void spend(const std::string& category, double amount) {
        const std::string account = createAccount("Card", 0.0);
        TransactionRepository transactions(*conn_);
        validation::CreateTransactionRequest tx;
        tx.user_id = user_id_;
        tx.account_id = account;
        tx.category_id = category;
        tx.amount = amount;
        tx.description = "Spend";
        tx.transaction_date = "2024-03-10";
        tx.transaction_type = "expense";
        transactions.create(tx);
    }

    std::string food_;
    std::string fun_;
    std::string period_;
};

TEST_F(BudgetRepositoryTest, PeriodsNewestFirst) {
    BudgetRepository repo(*conn_);
    createPeriod("April", "2024-04-01", "2024-04-30");
    createPeriod("Old", "2023-01-01", "2023-01-31", false);

    auto all = repo.listPeriods(user_id_);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].name, "April");
    EXPECT_EQ(all[2].name, "Old");
    EXPECT_EQ(repo.listPeriods(user_id_, true).size(), 2u);
}

TEST_F(BudgetRepositoryTest, PeriodWithInvertedRangeIsRejected) {
    BudgetRepository repo(*conn_);
    validation::CreateBudgetPeriodRequest req;
    req.user_id = user_id_;
    req.name = "Broken";
    req.start_date = "2024-05-31";
    req.end_date = "2024-05-01";
    EXPECT_THROW(repo.createPeriod(req), ValidationFailed);
}

TEST_F(BudgetRepositoryTest, CreateStartsWithNothingSpent) {
    BudgetRepository repo(*conn_);
    auto budget = repo.create(budgetRequest(food_, 300.0));
    EXPECT_DOUBLE_EQ(budget.allocated_amount, 300.0);
    EXPECT_DOUBLE_EQ(budget.spent_amount, 0.0);
    EXPECT_DOUBLE_EQ(budget.remaining(), 300.0);
    EXPECT_FALSE(budget.isOverBudget());
}

TEST_F(BudgetRepositoryTest, DuplicateCategoryInPeriodConflicts) {
    BudgetRepository repo(*conn_);
    repo.create(budgetRequest(food_, 300.0));
    EXPECT_THROW(repo.create(budgetRequest(food_, 100.0)), ConflictError);
}

TEST_F(BudgetRepositoryTest, AllocationMustBePositive) {
    BudgetRepository repo(*conn_);
    EXPECT_THROW(repo.create(budgetRequest(food_, 0.0)), ValidationFailed);
}

TEST_F(BudgetRepositoryTest, UnknownPeriodIsNotFound) {
    BudgetRepository repo(*conn_);
    auto req = budgetRequest(food_, 10.0);
    req.budget_period_id = "77777777-7777-4777-8777-777777777777";
    EXPECT_THROW(repo.create(req), NotFoundError);
}

TEST_F(BudgetRepositoryTest, UpdateNeverTouchesSpent) {
    BudgetRepository repo(*conn_);
    auto budget = repo.create(budgetRequest(food_, 100.0));
    spend(food_, 40.0);

    validation::UpdateBudgetRequest upd;
    upd.allocated_amount = 30.0;
    upd.notes = std::string("tighter");
    auto updated = repo.update(budget.id, user_id_, upd);
    EXPECT_DOUBLE_EQ(updated.spent_amount, 40.0);
    EXPECT_TRUE(updated.isOverBudget());
    EXPECT_EQ(updated.notes.value_or(""), "tighter");
}

TEST_F(BudgetRepositoryTest, SummaryCountsOverAndUnder) {
    BudgetRepository repo(*conn_);
    repo.create(budgetRequest(food_, 100.0));
    repo.create(budgetRequest(fun_, 50.0));
    spend(food_, 120.0);
    spend(fun_, 20.0);

    auto s = repo.summary(user_id_);
    EXPECT_EQ(s.budget_count, 2);
    EXPECT_DOUBLE_EQ(s.total_allocated, 150.0);
    EXPECT_DOUBLE_EQ(s.total_spent, 140.0);
    EXPECT_DOUBLE_EQ(s.remaining, 10.0);
    EXPECT_EQ(s.over_budget_count, 1);
    EXPECT_EQ(s.under_budget_count, 1);

    const std::string april = createPeriod("April", "2024-04-01", "2024-04-30");
    EXPECT_EQ(repo.summary(user_id_, april).budget_count, 0);
}

TEST_F(BudgetRepositoryTest, RemoveAndList) {
    BudgetRepository repo(*conn_);
    auto a = repo.create(budgetRequest(food_, 100.0));
    repo.create(budgetRequest(fun_, 50.0));
    repo.remove(a.id, user_id_);
    auto remaining = repo.listForPeriod(period_, user_id_);
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].category_id, fun_);
    EXPECT_THROW(repo.remove(a.id, user_id_), NotFoundError);
}

// ============================================================================
// Goals
// ============================================================================

class GoalRepositoryTest : public test::LedgerTestBase {
protected:
    Goal createGoal(const std::string& name, double target, int priority = 1,
                    const std::optional<std::string>& date = std::nullopt) {
        GoalRepository repo(*conn_);
        validation::CreateGoalRequest req;
        req.user_id = user_id_;
        req.name = name;
        req.target_amount = target;
        req.priority = priority;
        req.target_date = date;
        return repo.create(req);
    }
};

TEST_F(GoalRepositoryTest, CreateStartsActiveAtZero) {
    auto goal = createGoal("Vacation", 2000.0, 3, std::string("2025-06-01"));
    EXPECT_EQ(goal.status, GoalStatus::Active);
    EXPECT_DOUBLE_EQ(goal.current_amount, 0.0);
    EXPECT_EQ(goal.priority, 3);
    EXPECT_EQ(goal.target_date.value_or(""), "2025-06-01");
    EXPECT_DOUBLE_EQ(goal.progressPercent(), 0.0);
}

TEST_F(GoalRepositoryTest, ContributionCompletesGoal) {
    GoalRepository repo(*conn_);
    auto goal = createGoal("Bike", 500.0);

    auto partial = repo.addContribution(goal.id, user_id_, 200.0);
    EXPECT_EQ(partial.status, GoalStatus::Active);
    EXPECT_DOUBLE_EQ(partial.progressPercent(), 40.0);

    auto done = repo.addContribution(goal.id, user_id_, 300.0);
    EXPECT_DOUBLE_EQ(done.current_amount, 500.0);
    EXPECT_EQ(done.status, GoalStatus::Completed);
}

TEST_F(GoalRepositoryTest, PausedGoalStaysPausedWhenReached) {
    GoalRepository repo(*conn_);
    auto goal = createGoal("Laptop", 100.0);
    validation::UpdateGoalRequest pause;
    pause.status = std::string("paused");
    repo.update(goal.id, user_id_, pause);

    auto after = repo.addContribution(goal.id, user_id_, 150.0);
    EXPECT_EQ(after.status, GoalStatus::Paused);
    EXPECT_DOUBLE_EQ(after.progressPercent(), 100.0);
}

TEST_F(GoalRepositoryTest, ContributionMustBePositive) {
    GoalRepository repo(*conn_);
    auto goal = createGoal("Fund", 100.0);
    EXPECT_THROW(repo.addContribution(goal.id, user_id_, 0.0), ValidationFailed);
    EXPECT_THROW(repo.addContribution(goal.id, user_id_, -5.0), ValidationFailed);
    EXPECT_THROW(repo.addContribution(goal.id, user_id_, std::nullopt), ValidationFailed);
}

TEST_F(GoalRepositoryTest, DefaultOrderByPriorityThenDate) {
    GoalRepository repo(*conn_);
    createGoal("Low", 100.0, 1);
    createGoal("High undated", 100.0, 5);
    createGoal("High soon", 100.0, 5, std::string("2024-12-01"));

    auto goals = repo.listForUser(user_id_);
    ASSERT_EQ(goals.size(), 3u);
    EXPECT_EQ(goals[0].name, "High soon");
    EXPECT_EQ(goals[1].name, "High undated");
    EXPECT_EQ(goals[2].name, "Low");
}

TEST_F(GoalRepositoryTest, ListByStatusAndInvalidStatus) {
    GoalRepository repo(*conn_);
    auto goal = createGoal("Done", 10.0);
    createGoal("Open", 10.0);
    repo.addContribution(goal.id, user_id_, 10.0);

    GoalRepository::ListOptions options;
    options.status = std::string("completed");
    EXPECT_EQ(repo.listForUser(user_id_, options).size(), 1u);

    options.status = std::string("finished");
    EXPECT_THROW(repo.listForUser(user_id_, options), ValidationFailed);
}

TEST_F(GoalRepositoryTest, UpdateClearsTargetDate) {
    GoalRepository repo(*conn_);
    auto goal = createGoal("Car", 9000.0, 2, std::string("2026-01-01"));
    validation::UpdateGoalRequest upd;
    upd.target_date = std::string("");
    upd.priority = 4;
    auto updated = repo.update(goal.id, user_id_, upd);
    EXPECT_FALSE(updated.target_date.has_value());
    EXPECT_EQ(updated.priority, 4);

    validation::UpdateGoalRequest bad;
    bad.priority = 9;
    EXPECT_THROW(repo.update(goal.id, user_id_, bad), ValidationFailed);
}

TEST_F(GoalRepositoryTest, ProgressSummary) {
    GoalRepository repo(*conn_);
    auto a = createGoal("A", 100.0);
    auto b = createGoal("B", 200.0);
    repo.addContribution(a.id, user_id_, 150.0);
    repo.addContribution(b.id, user_id_, 50.0);

    auto s = repo.progressSummary(user_id_);
    EXPECT_EQ(s.total_goals, 2);
    EXPECT_EQ(s.completed_goals, 1);
    EXPECT_EQ(s.active_goals, 1);
    EXPECT_DOUBLE_EQ(s.total_target, 300.0);
    EXPECT_DOUBLE_EQ(s.total_saved, 200.0);
    // capped at 100 per goal: (100 + 25) / 2
    EXPECT_DOUBLE_EQ(s.average_progress_percent, 62.5);
}

TEST_F(GoalRepositoryTest, RemoveAndOwnership) {
    GoalRepository repo(*conn_);
    auto goal = createGoal("Temp", 10.0);
    const std::string bob = createUser("bob");
    EXPECT_THROW(repo.remove(goal.id, bob), NotFoundError);
    repo.remove(goal.id, user_id_);
    EXPECT_FALSE(repo.findById(goal.id, user_id_).has_value());
}
