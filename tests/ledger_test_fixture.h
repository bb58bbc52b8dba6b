#pragma once

#include <gtest/gtest.h>
#include "ledger/account_repository.h"
#include "ledger/category_repository.h"
#include "ledger/models.h"
#include "transaction/connection_manager.h"
#include "utils/id_generator.h"

#include <memory>
#include <optional>
#include <string>

namespace fiscus {
namespace test {

/// In-memory store with the schema applied and one user.
class LedgerTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        ConnectionManager::Config cfg;
        cfg.db.db_path = ":memory:";
        cfg.enable_query_logging = false;
        conn_ = std::make_unique<ConnectionManager>(cfg);
        conn_->open();
        user_id_ = createUser("alice");
    }

    void TearDown() override {
        conn_->close();
        conn_.reset();
    }

    // Users are inserted directly; password hashing has its own tests
    std::string createUser(const std::string& username) {
        const std::string id = utils::IdGenerator::uuidV4();
        conn_->execute("INSERT INTO users (id, username, password_hash) VALUES (?, ?, ?)",
                       {storage::toValue(id), storage::toValue(username), storage::toValue("x")});
        return id;
    }

    std::string accountTypeId(const std::string& code) {
        ledger::AccountRepository accounts(*conn_);
        auto type = accounts.findAccountTypeByCode(code);
        EXPECT_TRUE(type.has_value()) << code;
        return type ? type->id : std::string();
    }

    std::string createAccount(const std::string& name, double balance,
                              const std::string& code = "checking",
                              const std::optional<std::string>& user = std::nullopt) {
        ledger::AccountRepository accounts(*conn_);
        validation::CreateAccountRequest req;
        req.user_id = user.value_or(user_id_);
        req.account_type_id = accountTypeId(code);
        req.name = name;
        req.balance = balance;
        return accounts.create(req).id;
    }

    std::string createCategory(const std::string& name,
                               const std::optional<std::string>& parent = std::nullopt) {
        ledger::CategoryRepository categories(*conn_);
        validation::CreateCategoryRequest req;
        req.user_id = user_id_;
        req.name = name;
        req.parent_category_id = parent;
        return categories.create(req).id;
    }

    double balanceOf(const std::string& account_id) {
        auto row = conn_->queryOne("SELECT current_balance FROM accounts WHERE id = ?",
                                   {storage::toValue(account_id)});
        EXPECT_TRUE(row.has_value());
        return row ? row->getDouble("current_balance") : 0.0;
    }

    int64_t countRows(const std::string& table) {
        auto row = conn_->queryOne("SELECT COUNT(*) AS n FROM " + table);
        return row ? row->getInt("n") : -1;
    }

    std::unique_ptr<ConnectionManager> conn_;
    std::string user_id_;
};

} // namespace test
} // namespace fiscus
