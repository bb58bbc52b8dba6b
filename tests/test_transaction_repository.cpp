#include <gtest/gtest.h>
#include "ledger_test_fixture.h"
#include "ledger/budget_repository.h"
#include "ledger/transaction_repository.h"

#include <nlohmann/json.hpp>

using namespace fiscus;
using namespace fiscus::ledger;

class TransactionRepositoryTest : public test::LedgerTestBase {
protected:
    void SetUp() override {
        LedgerTestBase::SetUp();
        checking_ = createAccount("Checking", 1000.0);
        savings_ = createAccount("Savings", 500.0, "savings");
        repo_ = std::make_unique<TransactionRepository>(*conn_);
    }

    validation::CreateTransactionRequest request(double amount, const std::string& type,
                                                 const std::string& description = "Entry") {
        validation::CreateTransactionRequest req;
        req.user_id = user_id_;
        req.account_id = checking_;
        req.amount = amount;
        req.description = description;
        req.transaction_date = "2024-03-15T12:00:00";
        req.transaction_type = type;
        return req;
    }

    validation::CreateTransferRequest transferRequest(double amount) {
        validation::CreateTransferRequest req;
        req.user_id = user_id_;
        req.from_account_id = checking_;
        req.to_account_id = savings_;
        req.amount = amount;
        req.description = "Monthly savings";
        req.transfer_date = "2024-03-01";
        return req;
    }

    validation::BulkTransactionRequest bulk(const std::vector<std::string>& ids) {
        validation::BulkTransactionRequest req;
        req.user_id = user_id_;
        req.transaction_ids = ids;
        return req;
    }

    std::string createMarchBudget(const std::string& category) {
        BudgetRepository budgets(*conn_);
        validation::CreateBudgetPeriodRequest period;
        period.user_id = user_id_;
        period.name = "March 2024";
        period.start_date = "2024-03-01";
        period.end_date = "2024-03-31";
        validation::CreateBudgetRequest req;
        req.user_id = user_id_;
        req.budget_period_id = budgets.createPeriod(period).id;
        req.category_id = category;
        req.allocated_amount = 400.0;
        return budgets.create(req).id;
    }

    std::string checking_;
    std::string savings_;
    std::unique_ptr<TransactionRepository> repo_;
};

// ============================================================================
// Create
// ============================================================================

TEST_F(TransactionRepositoryTest, ExpenseLowersBalance) {
    auto tx = repo_->create(request(125.40, "expense", "Electricity"));
    EXPECT_EQ(tx.transaction_type, TransactionType::Expense);
    EXPECT_EQ(tx.status, TransactionStatus::Completed);
    EXPECT_DOUBLE_EQ(tx.amount, 125.40);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 874.60);
}

TEST_F(TransactionRepositoryTest, IncomeRaisesBalance) {
    repo_->create(request(2000.0, "income"));
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 3000.0);
}

TEST_F(TransactionRepositoryTest, CancelledHasNoBalanceEffect) {
    auto req = request(300.0, "expense");
    req.status = std::string("cancelled");
    repo_->create(req);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 1000.0);
}

TEST_F(TransactionRepositoryTest, PendingCountsTowardsBalance) {
    auto req = request(100.0, "expense");
    req.status = std::string("pending");
    repo_->create(req);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 900.0);
}

TEST_F(TransactionRepositoryTest, TextFieldsAreSanitizedAndTagsStored) {
    auto req = request(10.0, "expense", "<script>Books</script>");
    req.payee = std::string("  ");
    req.notes = std::string("onclick=steal() paperback");
    req.tags = std::vector<std::string>{"reading", "<gift>"};
    auto tx = repo_->create(req);
    EXPECT_EQ(tx.description, "scriptBooks/script");
    EXPECT_FALSE(tx.payee.has_value());
    EXPECT_EQ(tx.notes.value_or(""), "steal() paperback");
    ASSERT_EQ(tx.tags.size(), 2u);
    EXPECT_EQ(tx.tags[1], "gift");
}

TEST_F(TransactionRepositoryTest, ValidationFailureWritesNothing) {
    auto req = request(10.0, "expense");
    req.amount.reset();
    req.transaction_date = "tomorrow";
    try {
        repo_->create(req);
        FAIL() << "expected ValidationFailed";
    } catch (const ValidationFailed& e) {
        EXPECT_TRUE(e.result().hasError("amount", validation::ValidationCode::InvalidType));
        EXPECT_TRUE(e.result().hasError("transaction_date", validation::ValidationCode::InvalidFormat));
        EXPECT_EQ(e.toEnvelope()["code"], "VALIDATION_ERROR");
    }
    EXPECT_EQ(countRows("transactions"), 0);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 1000.0);
}

TEST_F(TransactionRepositoryTest, ForeignAccountIsNotFound) {
    const std::string bob = createUser("bob");
    const std::string bobs = createAccount("Bob's", 0.0, "checking", bob);
    auto req = request(10.0, "expense");
    req.account_id = bobs;
    EXPECT_THROW(repo_->create(req), NotFoundError);
    EXPECT_EQ(countRows("transactions"), 0);
}

// ============================================================================
// Update / remove
// ============================================================================

TEST_F(TransactionRepositoryTest, UpdateAmountRebalances) {
    auto tx = repo_->create(request(100.0, "expense"));
    validation::UpdateTransactionRequest upd;
    upd.amount = 40.0;
    repo_->update(tx.id, user_id_, upd);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 960.0);
}

TEST_F(TransactionRepositoryTest, UpdateTypeFlipsSign) {
    auto tx = repo_->create(request(50.0, "expense"));
    validation::UpdateTransactionRequest upd;
    upd.transaction_type = std::string("income");
    repo_->update(tx.id, user_id_, upd);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 1050.0);
}

TEST_F(TransactionRepositoryTest, UpdateAccountMovesEffect) {
    auto tx = repo_->create(request(70.0, "expense"));
    validation::UpdateTransactionRequest upd;
    upd.account_id = savings_;
    auto moved = repo_->update(tx.id, user_id_, upd);
    EXPECT_EQ(moved.account_id, savings_);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 1000.0);
    EXPECT_DOUBLE_EQ(balanceOf(savings_), 430.0);
}

TEST_F(TransactionRepositoryTest, UpdateToCancelledRestoresBalance) {
    auto tx = repo_->create(request(80.0, "expense"));
    validation::UpdateTransactionRequest upd;
    upd.status = std::string("cancelled");
    repo_->update(tx.id, user_id_, upd);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 1000.0);
}

TEST_F(TransactionRepositoryTest, UpdateClearsCategoryWithEmptyString) {
    const std::string food = createCategory("Food");
    auto req = request(20.0, "expense");
    req.category_id = food;
    auto tx = repo_->create(req);

    validation::UpdateTransactionRequest upd;
    upd.category_id = std::string("");
    EXPECT_FALSE(repo_->update(tx.id, user_id_, upd).category_id.has_value());
}

TEST_F(TransactionRepositoryTest, RemoveReversesBalance) {
    auto tx = repo_->create(request(250.0, "expense"));
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 750.0);
    repo_->remove(tx.id, user_id_);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 1000.0);
    EXPECT_FALSE(repo_->findById(tx.id, user_id_).has_value());
}

TEST_F(TransactionRepositoryTest, RemoveUnknownIsNotFound) {
    EXPECT_THROW(repo_->remove("44444444-4444-4444-8444-444444444444", user_id_), NotFoundError);
    EXPECT_THROW(repo_->remove("garbage", user_id_), ValidationFailed);
}

// ============================================================================
// Budget bookkeeping
// ============================================================================

TEST_F(TransactionRepositoryTest, CategorizedExpenseAddsToBudgetSpent) {
    const std::string food = createCategory("Food");
    BudgetRepository budgets(*conn_);

    validation::CreateBudgetPeriodRequest period;
    period.user_id = user_id_;
    period.name = "March 2024";
    period.start_date = "2024-03-01";
    period.end_date = "2024-03-31";
    const std::string march = budgets.createPeriod(period).id;

    validation::CreateBudgetRequest budgetReq;
    budgetReq.user_id = user_id_;
    budgetReq.budget_period_id = march;
    budgetReq.category_id = food;
    budgetReq.allocated_amount = 400.0;
    const std::string budget = budgets.create(budgetReq).id;

    auto inMarch = request(55.0, "expense");
    inMarch.category_id = food;
    repo_->create(inMarch);

    auto inApril = request(99.0, "expense");
    inApril.category_id = food;
    inApril.transaction_date = "2024-04-02";
    repo_->create(inApril);

    auto cancelled = request(10.0, "expense");
    cancelled.category_id = food;
    cancelled.status = std::string("cancelled");
    repo_->create(cancelled);

    auto income = request(10.0, "income");
    income.category_id = food;
    repo_->create(income);

    EXPECT_DOUBLE_EQ(budgets.getById(budget, user_id_).spent_amount, 55.0);
}

TEST_F(TransactionRepositoryTest, RefundDoesNotAddToBudgetSpent) {
    const std::string food = createCategory("Food");
    const std::string budget = createMarchBudget(food);

    auto purchase = request(80.0, "expense");
    purchase.category_id = food;
    repo_->create(purchase);

    auto refund = request(-20.0, "expense", "Returned groceries");
    refund.category_id = food;
    repo_->create(refund);

    BudgetRepository budgets(*conn_);
    EXPECT_DOUBLE_EQ(budgets.getById(budget, user_id_).spent_amount, 80.0);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 940.0);
}

// ============================================================================
// Dates with compact zone offsets
// ============================================================================

TEST_F(TransactionRepositoryTest, CompactOffsetIsStoredInCanonicalForm) {
    const std::string food = createCategory("Food");
    const std::string budget = createMarchBudget(food);

    auto req = request(30.0, "expense");
    req.category_id = food;
    req.transaction_date = "2024-03-15T10:00:00+0530";
    auto tx = repo_->create(req);
    EXPECT_EQ(tx.transaction_date, "2024-03-15T10:00:00+05:30");

    query::TransactionFilter march;
    march.user_id = user_id_;
    march.start_date = std::string("2024-03-01");
    march.end_date = std::string("2024-03-31");
    EXPECT_EQ(repo_->list(march).total, 1);
    EXPECT_EQ(repo_->statistics(march).total_transactions, 1);

    auto months = repo_->monthlySeries(march);
    ASSERT_EQ(months.size(), 1u);
    EXPECT_EQ(months[0].month, "2024-03");

    BudgetRepository budgets(*conn_);
    EXPECT_DOUBLE_EQ(budgets.getById(budget, user_id_).spent_amount, 30.0);
}

TEST_F(TransactionRepositoryTest, UpdateAndTransferNormalizeDates) {
    auto tx = repo_->create(request(10.0, "expense"));
    validation::UpdateTransactionRequest upd;
    upd.transaction_date = std::string("2024-03-20T08:00:00-0100");
    EXPECT_EQ(repo_->update(tx.id, user_id_, upd).transaction_date, "2024-03-20T08:00:00-01:00");

    auto req = transferRequest(50.0);
    req.transfer_date = "2024-03-02T09:30:00+0200";
    auto transfer = repo_->createTransfer(req);
    EXPECT_EQ(transfer.transfer_date, "2024-03-02T09:30:00+02:00");
    EXPECT_EQ(repo_->getById(transfer.to_transaction_id, user_id_).transaction_date,
              "2024-03-02T09:30:00+02:00");
}

// ============================================================================
// Transfers
// ============================================================================

TEST_F(TransactionRepositoryTest, TransferIsNetZero) {
    auto transfer = repo_->createTransfer(transferRequest(200.0));
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 800.0);
    EXPECT_DOUBLE_EQ(balanceOf(savings_), 700.0);
    EXPECT_DOUBLE_EQ(balanceOf(checking_) + balanceOf(savings_), 1500.0);

    auto from = repo_->getById(transfer.from_transaction_id, user_id_);
    auto to = repo_->getById(transfer.to_transaction_id, user_id_);
    EXPECT_DOUBLE_EQ(from.amount, -200.0);
    EXPECT_DOUBLE_EQ(to.amount, 200.0);
    EXPECT_EQ(from.transaction_type, TransactionType::Transfer);
    EXPECT_EQ(to.status, TransactionStatus::Completed);
    EXPECT_EQ(from.description, "Transfer to account: Monthly savings");
    EXPECT_EQ(to.description, "Transfer from account: Monthly savings");
}

TEST_F(TransactionRepositoryTest, TransferValidation) {
    auto same = transferRequest(10.0);
    same.to_account_id = checking_;
    EXPECT_THROW(repo_->createTransfer(same), ValidationFailed);

    auto zero = transferRequest(0.0);
    EXPECT_THROW(repo_->createTransfer(zero), ValidationFailed);
    EXPECT_EQ(countRows("transactions"), 0);
    EXPECT_EQ(countRows("transfers"), 0);
}

TEST_F(TransactionRepositoryTest, TransferLegsCannotBeEditedAlone) {
    auto transfer = repo_->createTransfer(transferRequest(50.0));
    validation::UpdateTransactionRequest upd;
    upd.amount = 1.0;
    EXPECT_THROW(repo_->update(transfer.from_transaction_id, user_id_, upd), ConflictError);
    EXPECT_THROW(repo_->remove(transfer.to_transaction_id, user_id_), ConflictError);
    EXPECT_DOUBLE_EQ(balanceOf(savings_), 550.0);
}

TEST_F(TransactionRepositoryTest, SingleTransferRowIsRejected) {
    EXPECT_THROW(repo_->create(request(40.0, "transfer")), ConflictError);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 1000.0);
    EXPECT_EQ(countRows("transactions"), 0);
    EXPECT_EQ(countRows("transfers"), 0);
}

TEST_F(TransactionRepositoryTest, UpdateCannotTurnRowIntoTransfer) {
    auto tx = repo_->create(request(40.0, "expense"));
    validation::UpdateTransactionRequest upd;
    upd.transaction_type = std::string("transfer");
    EXPECT_THROW(repo_->update(tx.id, user_id_, upd), ConflictError);
    EXPECT_EQ(repo_->getById(tx.id, user_id_).transaction_type, TransactionType::Expense);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 960.0);
}

TEST_F(TransactionRepositoryTest, RemoveTransferRestoresBothAccounts) {
    auto transfer = repo_->createTransfer(transferRequest(75.0));
    repo_->removeTransfer(transfer.id, user_id_);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 1000.0);
    EXPECT_DOUBLE_EQ(balanceOf(savings_), 500.0);
    EXPECT_EQ(countRows("transfers"), 0);
    EXPECT_EQ(countRows("transactions"), 0);
    EXPECT_THROW(repo_->removeTransfer(transfer.id, user_id_), NotFoundError);
}

TEST_F(TransactionRepositoryTest, ListTransfersByAccount) {
    const std::string cash = createAccount("Cash", 0.0, "cash");
    repo_->createTransfer(transferRequest(10.0));
    auto other = transferRequest(5.0);
    other.from_account_id = savings_;
    other.to_account_id = cash;
    other.transfer_date = "2024-03-05";
    repo_->createTransfer(other);

    auto all = repo_->listTransfers(user_id_);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].transfer_date, "2024-03-05");
    EXPECT_EQ(repo_->listTransfers(user_id_, checking_).size(), 1u);
    EXPECT_EQ(repo_->listTransfers(user_id_, savings_).size(), 2u);
}

// ============================================================================
// Bulk operations
// ============================================================================

TEST_F(TransactionRepositoryTest, BulkDeleteReversesEveryBalance) {
    auto a = repo_->create(request(100.0, "expense"));
    auto b = repo_->create(request(50.0, "income"));
    auto c = repo_->create(request(30.0, "expense"));
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 920.0);

    EXPECT_EQ(repo_->bulkDelete(bulk({a.id, b.id, a.id})), 2u);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 970.0);
    EXPECT_TRUE(repo_->findById(c.id, user_id_).has_value());
}

TEST_F(TransactionRepositoryTest, BulkOverLimitIsRejected) {
    std::vector<std::string> ids;
    for (int i = 0; i < 101; ++i) {
        ids.push_back(repo_->create(request(1.0, "expense")).id);
    }
    try {
        repo_->bulkDelete(bulk(ids));
        FAIL() << "expected ValidationFailed";
    } catch (const ValidationFailed& e) {
        EXPECT_TRUE(e.result().hasError("transaction_ids", validation::ValidationCode::MaxValue));
    }
    EXPECT_EQ(countRows("transactions"), 101);
}

TEST_F(TransactionRepositoryTest, BulkEmptyIsRejected) {
    EXPECT_THROW(repo_->bulkDelete(bulk({})), ValidationFailed);
}

TEST_F(TransactionRepositoryTest, BulkWithUnknownIdChangesNothing) {
    auto a = repo_->create(request(100.0, "expense"));
    EXPECT_THROW(repo_->bulkDelete(bulk({a.id, "55555555-5555-4555-8555-555555555555"})), NotFoundError);
    EXPECT_TRUE(repo_->findById(a.id, user_id_).has_value());
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 900.0);
}

TEST_F(TransactionRepositoryTest, BulkDeleteRejectsTransferLegs) {
    auto a = repo_->create(request(10.0, "expense"));
    auto transfer = repo_->createTransfer(transferRequest(20.0));
    EXPECT_THROW(repo_->bulkDelete(bulk({a.id, transfer.from_transaction_id})), ConflictError);
    EXPECT_EQ(countRows("transactions"), 3);
}

TEST_F(TransactionRepositoryTest, BulkStatusReevaluatesBalances) {
    auto a = repo_->create(request(100.0, "expense"));
    auto b = repo_->create(request(200.0, "expense"));
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 700.0);

    EXPECT_EQ(repo_->bulkUpdateStatus(bulk({a.id, b.id}), "cancelled"), 2u);
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 1000.0);

    repo_->bulkUpdateStatus(bulk({a.id}), "completed");
    EXPECT_DOUBLE_EQ(balanceOf(checking_), 900.0);

    EXPECT_THROW(repo_->bulkUpdateStatus(bulk({a.id}), "archived"), ValidationFailed);
}

TEST_F(TransactionRepositoryTest, BulkCategoryAssignsAndClears) {
    const std::string food = createCategory("Food");
    auto a = repo_->create(request(10.0, "expense"));
    auto transfer = repo_->createTransfer(transferRequest(20.0));

    EXPECT_EQ(repo_->bulkUpdateCategory(bulk({a.id, transfer.to_transaction_id}), food), 2u);
    EXPECT_EQ(repo_->getById(a.id, user_id_).category_id.value_or(""), food);

    repo_->bulkUpdateCategory(bulk({a.id}), std::nullopt);
    EXPECT_FALSE(repo_->getById(a.id, user_id_).category_id.has_value());

    EXPECT_THROW(repo_->bulkUpdateCategory(bulk({a.id}), std::string("66666666-6666-4666-8666-666666666666")),
                 NotFoundError);
}

// ============================================================================
// Export
// ============================================================================

TEST_F(TransactionRepositoryTest, CsvExportFormatsRows) {
    auto req = request(1234.5, "expense", "Rent, March");
    req.payee = std::string("Landlord");
    req.notes = std::string("line one\nline two");
    auto tx = repo_->create(req);

    const std::string csv = repo_->exportTransactions(bulk({tx.id}), ExportFormat::Csv);
    const std::string expected =
        std::string(TransactionRepository::csvHeader()) + "\n" +
        tx.id + "," + checking_ + ",,1234.50,Rent; March,2024-03-15 12:00:00,expense,completed,Landlord,"
        "line one line two\n";
    EXPECT_EQ(csv, expected);
}

TEST_F(TransactionRepositoryTest, CsvExportPadsDateOnlyValues) {
    auto req = request(5.0, "income");
    req.transaction_date = "2024-03-02";
    auto tx = repo_->create(req);
    const std::string csv = repo_->exportTransactions(bulk({tx.id}), ExportFormat::Csv);
    EXPECT_NE(csv.find(",2024-03-02 00:00:00,income,"), std::string::npos);
}

TEST_F(TransactionRepositoryTest, JsonExportKeepsRequestOrder) {
    auto a = repo_->create(request(1.0, "expense", "First"));
    auto b = repo_->create(request(2.0, "expense", "Second"));
    const std::string text = repo_->exportTransactions(bulk({b.id, a.id}), ExportFormat::Json);
    auto j = nlohmann::json::parse(text);
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["description"], "Second");
    EXPECT_EQ(j[1]["id"], a.id);
    EXPECT_EQ(j[0]["transaction_type"], "expense");
}

TEST_F(TransactionRepositoryTest, FilteredExportIsUnpaginated) {
    for (int i = 0; i < 60; ++i) {
        repo_->create(request(1.0 + i, "expense"));
    }
    query::TransactionFilter filter;
    filter.user_id = user_id_;
    filter.limit = 10;
    auto j = nlohmann::json::parse(repo_->exportFiltered(filter, ExportFormat::Json));
    EXPECT_EQ(j.size(), 60u);
}

TEST_F(TransactionRepositoryTest, ExportFormatParsing) {
    EXPECT_EQ(exportFormatFromString("CSV"), ExportFormat::Csv);
    EXPECT_EQ(exportFormatFromString("json"), ExportFormat::Json);
    EXPECT_FALSE(exportFormatFromString("xml").has_value());
    EXPECT_STREQ(toString(ExportFormat::Json), "json");
}
