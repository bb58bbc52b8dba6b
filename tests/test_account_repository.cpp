#include <gtest/gtest.h>
#include "ledger_test_fixture.h"
#include "ledger/account_repository.h"
#include "ledger/transaction_repository.h"

using namespace fiscus;
using namespace fiscus::ledger;

class AccountRepositoryTest : public test::LedgerTestBase {};

TEST_F(AccountRepositoryTest, SeededAccountTypes) {
    AccountRepository repo(*conn_);
    auto types = repo.listAccountTypes();
    EXPECT_EQ(types.size(), 8u);

    auto card = repo.findAccountTypeByCode("credit_card");
    ASSERT_TRUE(card.has_value());
    EXPECT_FALSE(card->is_asset);
    EXPECT_FALSE(repo.findAccountTypeByCode("piggy_bank").has_value());
}

TEST_F(AccountRepositoryTest, CreateSetsBothBalances) {
    AccountRepository repo(*conn_);
    validation::CreateAccountRequest req;
    req.user_id = user_id_;
    req.account_type_id = accountTypeId("savings");
    req.name = "  <b>Rainy day</b> ";
    req.currency = "EUR";
    req.balance = 250.75;
    req.institution_name = std::string("Sparkasse");

    auto account = repo.create(req);
    EXPECT_EQ(account.name, "bRainy day/b");
    EXPECT_DOUBLE_EQ(account.initial_balance, 250.75);
    EXPECT_DOUBLE_EQ(account.current_balance, 250.75);
    EXPECT_EQ(account.currency, "EUR");
    EXPECT_TRUE(account.is_active);
    EXPECT_EQ(account.institution_name.value_or(""), "Sparkasse");
    EXPECT_FALSE(account.description.has_value());
}

TEST_F(AccountRepositoryTest, CreateRejectsInvalidRequestBeforeWriting) {
    AccountRepository repo(*conn_);
    validation::CreateAccountRequest req;
    req.user_id = user_id_;
    req.account_type_id = "checking";
    req.name = "";
    try {
        repo.create(req);
        FAIL() << "expected ValidationFailed";
    } catch (const ValidationFailed& e) {
        EXPECT_TRUE(e.result().hasError("name", validation::ValidationCode::Required));
        EXPECT_TRUE(e.result().hasError("account_type_id", validation::ValidationCode::InvalidFormat));
    }
    EXPECT_EQ(countRows("accounts"), 0);
}

TEST_F(AccountRepositoryTest, CreateUnknownTypeOrUser) {
    AccountRepository repo(*conn_);
    validation::CreateAccountRequest req;
    req.user_id = user_id_;
    req.account_type_id = "aaaaaaaa-aaaa-4aaa-8aaa-aaaaaaaaaaaa";
    req.name = "Ghost";
    EXPECT_THROW(repo.create(req), NotFoundError);

    req.account_type_id = accountTypeId("cash");
    req.user_id = "bbbbbbbb-bbbb-4bbb-8bbb-bbbbbbbbbbbb";
    EXPECT_THROW(repo.create(req), NotFoundError);
}

TEST_F(AccountRepositoryTest, OwnershipIsEnforced) {
    AccountRepository repo(*conn_);
    const std::string id = createAccount("Mine", 10.0);
    const std::string bob = createUser("bob");
    EXPECT_FALSE(repo.findById(id, bob).has_value());
    EXPECT_THROW(repo.getById(id, bob), NotFoundError);
    EXPECT_THROW(repo.remove(id, bob), NotFoundError);
}

TEST_F(AccountRepositoryTest, ListFiltersAndSorts) {
    AccountRepository repo(*conn_);
    createAccount("Zeta", 5.0);
    createAccount("Alpha", 500.0, "savings");
    const std::string closed = createAccount("Old", 0.0);

    validation::UpdateAccountRequest deactivate;
    deactivate.is_active = false;
    repo.update(closed, user_id_, deactivate);

    AccountRepository::ListOptions options;
    options.is_active = true;
    options.sort_by = std::string("name");
    auto page = repo.listForUser(user_id_, options);
    ASSERT_EQ(page.total, 2);
    EXPECT_EQ(page.data[0].name, "Alpha");
    EXPECT_EQ(page.data[1].name, "Zeta");

    options.sort_by = std::string("current_balance");
    options.sort_direction = std::string("desc");
    page = repo.listForUser(user_id_, options);
    EXPECT_EQ(page.data[0].name, "Alpha");

    AccountRepository::ListOptions bySavings;
    bySavings.account_type_id = accountTypeId("savings");
    EXPECT_EQ(repo.listForUser(user_id_, bySavings).total, 1);
}

TEST_F(AccountRepositoryTest, ListRejectsUnknownSortField) {
    AccountRepository repo(*conn_);
    AccountRepository::ListOptions options;
    options.sort_by = std::string("user_id");
    EXPECT_THROW(repo.listForUser(user_id_, options), ValidationFailed);
}

TEST_F(AccountRepositoryTest, UpdateLeavesBalancesAlone) {
    AccountRepository repo(*conn_);
    const std::string id = createAccount("Checking", 100.0);
    validation::UpdateAccountRequest req;
    req.name = std::string("Main checking");
    req.description = std::string("");
    auto account = repo.update(id, user_id_, req);
    EXPECT_EQ(account.name, "Main checking");
    EXPECT_FALSE(account.description.has_value());
    EXPECT_DOUBLE_EQ(account.current_balance, 100.0);
}

TEST_F(AccountRepositoryTest, UpdateBalanceIsAdministrative) {
    AccountRepository repo(*conn_);
    const std::string id = createAccount("Checking", 100.0);
    auto account = repo.updateBalance(id, user_id_, -42.0);
    EXPECT_DOUBLE_EQ(account.current_balance, -42.0);
    EXPECT_DOUBLE_EQ(account.initial_balance, 100.0);
    EXPECT_EQ(countRows("transactions"), 0);

    EXPECT_THROW(repo.updateBalance(id, user_id_, std::nullopt), ValidationFailed);
}

TEST_F(AccountRepositoryTest, RemoveWithoutTransactionsDeletes) {
    AccountRepository repo(*conn_);
    const std::string id = createAccount("Temp", 0.0);
    EXPECT_EQ(repo.remove(id, user_id_), RemoveOutcome::Deleted);
    EXPECT_FALSE(repo.findById(id, user_id_).has_value());
}

TEST_F(AccountRepositoryTest, RemoveWithTransactionsDeactivates) {
    AccountRepository repo(*conn_);
    const std::string id = createAccount("Used", 0.0);

    TransactionRepository transactions(*conn_);
    validation::CreateTransactionRequest tx;
    tx.user_id = user_id_;
    tx.account_id = id;
    tx.amount = 20.0;
    tx.description = "Lunch";
    tx.transaction_date = "2024-05-01";
    tx.transaction_type = "expense";
    transactions.create(tx);

    EXPECT_EQ(repo.remove(id, user_id_), RemoveOutcome::Deactivated);
    auto account = repo.getById(id, user_id_);
    EXPECT_FALSE(account.is_active);
    EXPECT_EQ(countRows("transactions"), 1);
    EXPECT_STREQ(toString(RemoveOutcome::Deactivated), "deactivated");
}

TEST_F(AccountRepositoryTest, SummarySeparatesAssetsAndLiabilities) {
    AccountRepository repo(*conn_);
    createAccount("Checking", 1200.0);
    createAccount("Savings", 800.0, "savings");
    createAccount("Visa", -300.0, "credit_card");
    const std::string closed = createAccount("Closed", 5000.0);
    validation::UpdateAccountRequest deactivate;
    deactivate.is_active = false;
    repo.update(closed, user_id_, deactivate);

    auto s = repo.summary(user_id_);
    EXPECT_EQ(s.account_count, 3);
    EXPECT_DOUBLE_EQ(s.total_assets, 2000.0);
    EXPECT_DOUBLE_EQ(s.total_liabilities, 300.0);
    EXPECT_DOUBLE_EQ(s.net_worth, 1700.0);
}
