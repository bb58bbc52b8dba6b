#include <gtest/gtest.h>
#include "ledger_test_fixture.h"
#include "ledger/category_repository.h"
#include "ledger/transaction_repository.h"

using namespace fiscus;
using namespace fiscus::ledger;

class CategoryRepositoryTest : public test::LedgerTestBase {
protected:
    void addExpense(const std::string& category) {
        const std::string account = createAccount("Checking " + category.substr(0, 8), 0.0);
        TransactionRepository transactions(*conn_);
        validation::CreateTransactionRequest tx;
        tx.user_id = user_id_;
        tx.account_id = account;
        tx.category_id = category;
        tx.amount = 9.99;
        tx.description = "Snack";
        tx.transaction_date = "2024-04-01";
        tx.transaction_type = "expense";
        transactions.create(tx);
    }
};

// ===== Create / read =====

TEST_F(CategoryRepositoryTest, CreateWithParent) {
    CategoryRepository repo(*conn_);
    const std::string food = createCategory("Food");

    validation::CreateCategoryRequest req;
    req.user_id = user_id_;
    req.name = "Restaurants";
    req.color = std::string("#ff8800");
    req.parent_category_id = food;
    auto child = repo.create(req);
    EXPECT_EQ(child.parent_category_id.value_or(""), food);
    EXPECT_EQ(child.color.value_or(""), "#ff8800");
    EXPECT_FALSE(child.is_income);
}

TEST_F(CategoryRepositoryTest, ParentOfAnotherUserIsNotFound) {
    CategoryRepository repo(*conn_);
    const std::string bob = createUser("bob");
    validation::CreateCategoryRequest foreign;
    foreign.user_id = bob;
    foreign.name = "Bob's";
    const std::string bobs = repo.create(foreign).id;

    validation::CreateCategoryRequest req;
    req.user_id = user_id_;
    req.name = "Mine";
    req.parent_category_id = bobs;
    EXPECT_THROW(repo.create(req), NotFoundError);
}

TEST_F(CategoryRepositoryTest, ListFiltersIncomeAndInactive) {
    CategoryRepository repo(*conn_);
    createCategory("Groceries");
    validation::CreateCategoryRequest salary;
    salary.user_id = user_id_;
    salary.name = "Salary";
    salary.is_income = true;
    repo.create(salary);
    const std::string old = createCategory("Old");
    validation::UpdateCategoryRequest off;
    off.is_active = false;
    repo.update(old, user_id_, off);

    EXPECT_EQ(repo.listForUser(user_id_).size(), 2u);
    EXPECT_EQ(repo.listForUser(user_id_, true).size(), 1u);
    EXPECT_EQ(repo.listForUser(user_id_, false).size(), 1u);
    EXPECT_EQ(repo.listForUser(user_id_, std::nullopt, true).size(), 3u);
}

// ===== Hierarchy =====

TEST_F(CategoryRepositoryTest, SelfParentIsRejected) {
    CategoryRepository repo(*conn_);
    const std::string a = createCategory("A");
    validation::UpdateCategoryRequest req;
    req.parent_category_id = a;
    EXPECT_THROW(repo.update(a, user_id_, req), ConflictError);
}

TEST_F(CategoryRepositoryTest, DescendantParentIsRejected) {
    CategoryRepository repo(*conn_);
    const std::string a = createCategory("A");
    const std::string b = createCategory("B", a);
    const std::string c = createCategory("C", b);

    validation::UpdateCategoryRequest req;
    req.parent_category_id = c;
    try {
        repo.update(a, user_id_, req);
        FAIL() << "expected ConflictError";
    } catch (const ConflictError& e) {
        EXPECT_EQ(e.code(), "CONFLICT");
    }
    EXPECT_FALSE(repo.getById(a, user_id_).parent_category_id.has_value());
}

TEST_F(CategoryRepositoryTest, MoveAndDetach) {
    CategoryRepository repo(*conn_);
    const std::string a = createCategory("A");
    const std::string b = createCategory("B");
    const std::string c = createCategory("C", a);

    validation::UpdateCategoryRequest move;
    move.parent_category_id = b;
    EXPECT_EQ(repo.update(c, user_id_, move).parent_category_id.value_or(""), b);

    validation::UpdateCategoryRequest detach;
    detach.parent_category_id = std::string("");
    EXPECT_FALSE(repo.update(c, user_id_, detach).parent_category_id.has_value());
}

TEST_F(CategoryRepositoryTest, HierarchyBuildsSortedForest) {
    CategoryRepository repo(*conn_);
    const std::string transport = createCategory("Transport");
    const std::string food = createCategory("Food");
    createCategory("Restaurants", food);
    createCategory("Groceries", food);
    createCategory("Fuel", transport);

    auto forest = repo.hierarchy(user_id_);
    ASSERT_EQ(forest.size(), 2u);
    EXPECT_EQ(forest[0].category.name, "Food");
    ASSERT_EQ(forest[0].children.size(), 2u);
    EXPECT_EQ(forest[0].children[0].category.name, "Groceries");
    EXPECT_EQ(forest[1].children.size(), 1u);

    auto j = forest[0].toJson();
    EXPECT_EQ(j["children"].size(), 2u);
}

TEST_F(CategoryRepositoryTest, HierarchyPromotesOrphansOfInactiveParents) {
    CategoryRepository repo(*conn_);
    const std::string parent = createCategory("Parent");
    createCategory("Child", parent);
    validation::UpdateCategoryRequest off;
    off.is_active = false;
    repo.update(parent, user_id_, off);

    auto forest = repo.hierarchy(user_id_);
    ASSERT_EQ(forest.size(), 1u);
    EXPECT_EQ(forest[0].category.name, "Child");
}

// ===== Remove =====

TEST_F(CategoryRepositoryTest, UnreferencedCategoryIsDeleted) {
    CategoryRepository repo(*conn_);
    const std::string id = createCategory("Unused");
    EXPECT_EQ(repo.remove(id, user_id_), RemoveOutcome::Deleted);
    EXPECT_FALSE(repo.findById(id, user_id_).has_value());
}

TEST_F(CategoryRepositoryTest, CategoryWithTransactionsIsDeactivated) {
    CategoryRepository repo(*conn_);
    const std::string id = createCategory("Snacks");
    addExpense(id);
    EXPECT_EQ(repo.remove(id, user_id_), RemoveOutcome::Deactivated);
    EXPECT_FALSE(repo.getById(id, user_id_).is_active);
}

TEST_F(CategoryRepositoryTest, CategoryWithActiveChildIsDeactivated) {
    CategoryRepository repo(*conn_);
    const std::string parent = createCategory("Parent");
    createCategory("Child", parent);
    EXPECT_EQ(repo.remove(parent, user_id_), RemoveOutcome::Deactivated);
}

TEST_F(CategoryRepositoryTest, DeleteDetachesInactiveChildren) {
    CategoryRepository repo(*conn_);
    const std::string parent = createCategory("Parent");
    const std::string child = createCategory("Child", parent);
    validation::UpdateCategoryRequest off;
    off.is_active = false;
    repo.update(child, user_id_, off);

    EXPECT_EQ(repo.remove(parent, user_id_), RemoveOutcome::Deleted);
    auto orphan = repo.getById(child, user_id_);
    EXPECT_FALSE(orphan.parent_category_id.has_value());
}
