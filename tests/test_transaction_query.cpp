#include <gtest/gtest.h>
#include "ledger_test_fixture.h"
#include "ledger/transaction_repository.h"
#include "query/transaction_query.h"

using namespace fiscus;
using namespace fiscus::query;

namespace {
const std::string kUser = "11111111-1111-4111-8111-111111111111";
const std::string kAccount = "22222222-2222-4222-8222-222222222222";
}

// ============================================================================
// Plan construction
// ============================================================================

TEST(TransactionQueryBuilderTest, UserOnlyFilter) {
    TransactionQueryBuilder builder;
    TransactionFilter filter;
    filter.user_id = kUser;
    auto plan = builder.build(filter);
    EXPECT_EQ(plan.where, "t.user_id = ?");
    ASSERT_EQ(plan.params.size(), 1u);
    EXPECT_EQ(plan.order_by, "t.transaction_date DESC, t.created_at DESC, t.id ASC");
    EXPECT_EQ(plan.page.limit, kDefaultPageSize);
}

TEST(TransactionQueryBuilderTest, CriteriaCombineWithAnd) {
    TransactionQueryBuilder builder;
    TransactionFilter filter;
    filter.user_id = kUser;
    filter.account_id = kAccount;
    filter.transaction_type = std::string("expense");
    filter.min_amount = 10.0;
    auto plan = builder.build(filter);
    EXPECT_EQ(plan.where, "t.user_id = ? AND t.account_id = ? AND t.transaction_type = ? AND ABS(t.amount) >= ?");
    EXPECT_EQ(plan.params.size(), 4u);
}

TEST(TransactionQueryBuilderTest, SearchIsSanitizedAndEscaped) {
    TransactionQueryBuilder builder;
    TransactionFilter filter;
    filter.user_id = kUser;
    filter.search = std::string("'100%'");
    auto plan = builder.build(filter);
    EXPECT_EQ(plan.search_term, "100%");
    ASSERT_EQ(plan.params.size(), 4u);
    EXPECT_EQ(std::get<std::string>(plan.params[1]), "%100\\%%");
}

TEST(TransactionQueryBuilderTest, BlankSearchAddsNoCondition) {
    TransactionQueryBuilder builder;
    TransactionFilter filter;
    filter.user_id = kUser;
    filter.search = std::string("  ;; ");
    auto plan = builder.build(filter);
    EXPECT_EQ(plan.where, "t.user_id = ?");
}

TEST(TransactionQueryBuilderTest, SortFieldAndDirection) {
    TransactionQueryBuilder builder;
    TransactionFilter filter;
    filter.user_id = kUser;
    filter.sort_by = std::string("amount");
    filter.sort_direction = std::string("asc");
    EXPECT_EQ(builder.build(filter).order_by, "t.amount ASC, t.id ASC");

    filter.sort_direction.reset();
    EXPECT_EQ(builder.build(filter).order_by, "t.amount DESC, t.id ASC");
}

TEST(TransactionQueryBuilderTest, InvalidSortFieldThrows) {
    TransactionQueryBuilder builder;
    TransactionFilter filter;
    filter.user_id = kUser;
    filter.sort_by = std::string("user_id");
    try {
        builder.build(filter);
        FAIL() << "expected ValidationFailed";
    } catch (const ValidationFailed& e) {
        EXPECT_TRUE(e.result().hasError("sort_by", validation::ValidationCode::InvalidFormat));
        EXPECT_EQ(e.code(), "VALIDATION_ERROR");
    }
}

TEST(TransactionQueryBuilderTest, MalformedUserIdThrows) {
    TransactionQueryBuilder builder;
    TransactionFilter filter;
    filter.user_id = "not-a-uuid";
    EXPECT_THROW(builder.build(filter), ValidationFailed);
}

TEST(TransactionQueryBuilderTest, SelectSqlAppendsPaging) {
    TransactionQueryBuilder builder(TransactionQueryBuilder::Options{25, 200});
    TransactionFilter filter;
    filter.user_id = kUser;
    filter.offset = 75;
    auto plan = builder.build(filter);
    auto params = builder.selectParams(plan);
    ASSERT_EQ(params.size(), 3u);
    EXPECT_EQ(std::get<int64_t>(params[1]), 25);
    EXPECT_EQ(std::get<int64_t>(params[2]), 75);
    EXPECT_NE(builder.selectSql(plan).find("LIMIT ? OFFSET ?"), std::string::npos);
    EXPECT_EQ(builder.countSql(plan), "SELECT COUNT(*) AS total FROM transactions t WHERE t.user_id = ?");
}

// ============================================================================
// Filter semantics against stored rows
// ============================================================================

class TransactionFilterTest : public test::LedgerTestBase {
protected:
    void SetUp() override {
        LedgerTestBase::SetUp();
        checking_ = createAccount("Checking", 1000.0);
        savings_ = createAccount("Savings", 0.0, "savings");
        food_ = createCategory("Food");

        add(checking_, 12.50, "Coffee beans", "2024-01-05T08:00:00", "expense", food_, "Roastery");
        add(checking_, 80.00, "Weekly groceries", "2024-01-20", "expense", food_, "Market");
        add(checking_, 2500.00, "Salary January", "2024-01-31", "income", std::nullopt, "Employer");
        add(savings_, 150.00, "Interest 100_percent", "2024-02-01", "income", std::nullopt, std::nullopt);
        add(checking_, 45.00, "Cancelled order", "2024-02-10", "expense", food_, "Shop", "cancelled");
    }

    void add(const std::string& account, double amount, const std::string& description,
             const std::string& date, const std::string& type,
             const std::optional<std::string>& category, const std::optional<std::string>& payee,
             const std::optional<std::string>& status = std::nullopt) {
        ledger::TransactionRepository repo(*conn_);
        validation::CreateTransactionRequest req;
        req.user_id = user_id_;
        req.account_id = account;
        req.category_id = category;
        req.amount = amount;
        req.description = description;
        req.transaction_date = date;
        req.transaction_type = type;
        req.payee = payee;
        req.status = status;
        repo.create(req);
    }

    int64_t count(const TransactionFilter& filter) {
        ledger::TransactionRepository repo(*conn_);
        return repo.list(filter).total;
    }

    TransactionFilter base() {
        TransactionFilter f;
        f.user_id = user_id_;
        return f;
    }

    std::string checking_;
    std::string savings_;
    std::string food_;
};

TEST_F(TransactionFilterTest, ByAccountAndCategory) {
    auto f = base();
    f.account_id = savings_;
    EXPECT_EQ(count(f), 1);

    f = base();
    f.category_id = food_;
    EXPECT_EQ(count(f), 3);
}

TEST_F(TransactionFilterTest, DateRangeIsInclusiveOnDays) {
    auto f = base();
    f.start_date = std::string("2024-01-05");
    f.end_date = std::string("2024-01-31");
    EXPECT_EQ(count(f), 3);

    f.end_date = std::string("2024-01-05");
    EXPECT_EQ(count(f), 1);
}

TEST_F(TransactionFilterTest, AmountBoundsUseMagnitude) {
    auto f = base();
    f.min_amount = 45.0;
    f.max_amount = 150.0;
    EXPECT_EQ(count(f), 3);
}

TEST_F(TransactionFilterTest, SearchMatchesDescriptionPayeeAndNotes) {
    auto f = base();
    f.search = std::string("market");
    EXPECT_EQ(count(f), 1);

    f.search = std::string("SALARY");
    EXPECT_EQ(count(f), 1);
}

TEST_F(TransactionFilterTest, SearchTreatsWildcardsLiterally) {
    auto f = base();
    f.search = std::string("100_percent");
    EXPECT_EQ(count(f), 1);
    f.search = std::string("_");
    EXPECT_EQ(count(f), 1);
}

TEST_F(TransactionFilterTest, StatusFilter) {
    auto f = base();
    f.status = std::string("cancelled");
    EXPECT_EQ(count(f), 1);
    f.status = std::string("completed");
    EXPECT_EQ(count(f), 4);
}

TEST_F(TransactionFilterTest, SortByAmountAscending) {
    ledger::TransactionRepository repo(*conn_);
    auto f = base();
    f.sort_by = std::string("amount");
    f.sort_direction = std::string("ASC");
    auto page = repo.list(f);
    ASSERT_EQ(page.data.size(), 5u);
    EXPECT_DOUBLE_EQ(page.data.front().amount, 12.50);
    EXPECT_DOUBLE_EQ(page.data.back().amount, 2500.00);
}

TEST_F(TransactionFilterTest, OtherUsersRowsAreInvisible) {
    const std::string bob = createUser("bob");
    auto f = base();
    f.user_id = bob;
    EXPECT_EQ(count(f), 0);
}

TEST_F(TransactionFilterTest, UnknownUserIsNotFound) {
    ledger::TransactionRepository repo(*conn_);
    auto f = base();
    f.user_id = "99999999-9999-4999-8999-999999999999";
    EXPECT_THROW(repo.list(f), NotFoundError);
}
