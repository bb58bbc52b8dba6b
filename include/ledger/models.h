#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "storage/value.h"

namespace fiscus {
namespace ledger {

enum class TransactionType { Income, Expense, Transfer };
enum class TransactionStatus { Pending, Completed, Cancelled };
enum class GoalStatus { Active, Completed, Paused, Cancelled };

const char* toString(TransactionType t);
const char* toString(TransactionStatus s);
const char* toString(GoalStatus s);
std::optional<TransactionType> transactionTypeFromString(const std::string& s);
std::optional<TransactionStatus> transactionStatusFromString(const std::string& s);
std::optional<GoalStatus> goalStatusFromString(const std::string& s);

/// Signed effect of a transaction on its account balance:
/// income +amount, expense -amount, transfer leg +amount (legs carry the sign).
double balanceDelta(TransactionType type, double amount);

struct User {
    std::string id;
    std::string username;
    std::optional<std::string> email;
    std::string password_hash;
    std::string created_at;
    std::string updated_at;

    static User fromRow(const storage::Row& row);
    /// Never includes password_hash
    nlohmann::json toJson() const;
};

struct AccountType {
    std::string id;
    std::string code;           // checking, savings, credit_card, ...
    std::string name;
    std::optional<std::string> description;
    bool is_asset = true;

    static AccountType fromRow(const storage::Row& row);
    nlohmann::json toJson() const;
};

struct Account {
    std::string id;
    std::string user_id;
    std::string account_type_id;
    std::string name;
    std::optional<std::string> description;
    double initial_balance = 0.0;
    double current_balance = 0.0;
    std::string currency = "USD";
    bool is_active = true;
    std::optional<std::string> institution_name;
    std::optional<std::string> account_number;
    std::string created_at;
    std::string updated_at;

    static Account fromRow(const storage::Row& row);
    nlohmann::json toJson() const;
};

struct Category {
    std::string id;
    std::string user_id;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> color;
    std::optional<std::string> icon;
    std::optional<std::string> parent_category_id;
    bool is_income = false;
    bool is_active = true;
    std::string created_at;
    std::string updated_at;

    static Category fromRow(const storage::Row& row);
    nlohmann::json toJson() const;
};

struct Transaction {
    std::string id;
    std::string user_id;
    std::string account_id;
    std::optional<std::string> category_id;
    double amount = 0.0;
    std::string description;
    std::optional<std::string> notes;
    std::string transaction_date;
    TransactionType transaction_type = TransactionType::Expense;
    TransactionStatus status = TransactionStatus::Completed;
    std::optional<std::string> reference_number;
    std::optional<std::string> payee;
    std::vector<std::string> tags;
    std::string created_at;
    std::string updated_at;

    static Transaction fromRow(const storage::Row& row);
    nlohmann::json toJson() const;
};

struct Transfer {
    std::string id;
    std::string user_id;
    std::string from_account_id;
    std::string to_account_id;
    std::string from_transaction_id;
    std::string to_transaction_id;
    double amount = 0.0;
    std::optional<std::string> description;
    std::string transfer_date;
    std::string created_at;

    static Transfer fromRow(const storage::Row& row);
    nlohmann::json toJson() const;
};

struct BudgetPeriod {
    std::string id;
    std::string user_id;
    std::string name;
    std::string start_date;
    std::string end_date;
    bool is_active = true;
    std::string created_at;
    std::string updated_at;

    static BudgetPeriod fromRow(const storage::Row& row);
    nlohmann::json toJson() const;
};

struct Budget {
    std::string id;
    std::string user_id;
    std::string budget_period_id;
    std::string category_id;
    double allocated_amount = 0.0;
    double spent_amount = 0.0;
    std::optional<std::string> notes;
    std::string created_at;
    std::string updated_at;

    double remaining() const { return allocated_amount - spent_amount; }
    bool isOverBudget() const { return spent_amount > allocated_amount; }

    static Budget fromRow(const storage::Row& row);
    nlohmann::json toJson() const;
};

struct Goal {
    std::string id;
    std::string user_id;
    std::string name;
    std::optional<std::string> description;
    double target_amount = 0.0;
    double current_amount = 0.0;
    std::optional<std::string> target_date;
    int priority = 1;
    GoalStatus status = GoalStatus::Active;
    std::optional<std::string> category;
    std::string created_at;
    std::string updated_at;

    /// 0..100
    double progressPercent() const;

    static Goal fromRow(const storage::Row& row);
    nlohmann::json toJson() const;
};

// ===== Summaries =====

struct AccountSummary {
    double total_assets = 0.0;
    double total_liabilities = 0.0;  // absolute
    double net_worth = 0.0;
    int64_t account_count = 0;

    nlohmann::json toJson() const;
};

struct BudgetSummary {
    double total_allocated = 0.0;
    double total_spent = 0.0;
    double remaining = 0.0;
    int64_t budget_count = 0;
    int64_t over_budget_count = 0;
    int64_t under_budget_count = 0;

    nlohmann::json toJson() const;
};

struct GoalProgressSummary {
    int64_t total_goals = 0;
    int64_t active_goals = 0;
    int64_t completed_goals = 0;
    int64_t paused_goals = 0;
    double total_target = 0.0;
    double total_saved = 0.0;
    double average_progress_percent = 0.0;  // over goals with a positive target

    nlohmann::json toJson() const;
};

} // namespace ledger
} // namespace fiscus
