#pragma once

#include <optional>
#include <string>
#include <vector>

namespace fiscus {
namespace validation {

// Inbound command payloads. Enumerated fields stay strings here so that
// out-of-set values can be reported instead of failing to parse.

struct CreateUserRequest {
    std::string username;
    std::optional<std::string> email;
    std::string password;
};

struct CreateAccountRequest {
    std::string user_id;
    std::string account_type_id;
    std::string name;
    std::optional<std::string> description;
    std::string currency = "USD";
    std::optional<double> balance;          // initial balance, may be negative
    std::optional<std::string> institution_name;
    std::optional<std::string> account_number;
};

struct UpdateAccountRequest {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> institution_name;
    std::optional<std::string> account_number;
    std::optional<bool> is_active;
};

struct CreateCategoryRequest {
    std::string user_id;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> color;
    std::optional<std::string> icon;
    std::optional<std::string> parent_category_id;
    bool is_income = false;
};

struct UpdateCategoryRequest {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> color;
    std::optional<std::string> icon;
    std::optional<std::string> parent_category_id;
    std::optional<bool> is_active;
};

struct CreateTransactionRequest {
    std::string user_id;
    std::string account_id;
    std::optional<std::string> category_id;
    std::optional<double> amount;
    std::string description;
    std::optional<std::string> notes;
    std::string transaction_date;
    std::string transaction_type;           // income | expense | transfer
    std::optional<std::string> status;      // defaults to completed
    std::optional<std::string> reference_number;
    std::optional<std::string> payee;
    std::optional<std::vector<std::string>> tags;
};

/// Only present fields are validated and written.
struct UpdateTransactionRequest {
    std::optional<std::string> account_id;
    std::optional<std::string> category_id;
    std::optional<double> amount;
    std::optional<std::string> description;
    std::optional<std::string> notes;
    std::optional<std::string> transaction_date;
    std::optional<std::string> transaction_type;
    std::optional<std::string> status;
    std::optional<std::string> reference_number;
    std::optional<std::string> payee;
    std::optional<std::vector<std::string>> tags;
};

struct CreateTransferRequest {
    std::string user_id;
    std::string from_account_id;
    std::string to_account_id;
    std::optional<double> amount;
    std::string description;
    std::string transfer_date;
};

struct CreateBudgetPeriodRequest {
    std::string user_id;
    std::string name;
    std::string start_date;
    std::string end_date;
    bool is_active = true;
};

struct CreateBudgetRequest {
    std::string user_id;
    std::string budget_period_id;
    std::string category_id;
    std::optional<double> allocated_amount;
    std::optional<std::string> notes;
};

struct UpdateBudgetRequest {
    std::optional<double> allocated_amount;
    std::optional<std::string> notes;
};

struct CreateGoalRequest {
    std::string user_id;
    std::string name;
    std::optional<std::string> description;
    std::optional<double> target_amount;
    std::optional<std::string> target_date;
    std::optional<int> priority;
    std::optional<std::string> category;
};

struct UpdateGoalRequest {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<double> target_amount;
    std::optional<std::string> target_date;
    std::optional<int> priority;
    std::optional<std::string> status;      // active | completed | paused | cancelled
    std::optional<std::string> category;
};

/// Bulk operation over a set of transaction ids owned by one user.
struct BulkTransactionRequest {
    std::string user_id;
    std::vector<std::string> transaction_ids;
};

} // namespace validation
} // namespace fiscus
