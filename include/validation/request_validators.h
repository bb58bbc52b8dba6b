#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "validation/validation_result.h"
#include "validation/requests.h"
#include "query/query_filter.h"

namespace fiscus {
namespace validation {

constexpr size_t kMaxBulkItems = 100;

extern const std::vector<std::string> kTransactionTypes;   // income, expense, transfer
extern const std::vector<std::string> kTransactionStatuses; // pending, completed, cancelled
extern const std::vector<std::string> kGoalStatuses;        // active, completed, paused, cancelled

// ===== Composite validators =====

ValidationResult validateCreateUserRequest(const CreateUserRequest& request);
ValidationResult validateCreateAccountRequest(const CreateAccountRequest& request);
ValidationResult validateUpdateAccountRequest(const UpdateAccountRequest& request);
ValidationResult validateCreateCategoryRequest(const CreateCategoryRequest& request);
ValidationResult validateUpdateCategoryRequest(const UpdateCategoryRequest& request);
ValidationResult validateCreateTransactionRequest(const CreateTransactionRequest& request);
ValidationResult validateUpdateTransactionRequest(const UpdateTransactionRequest& request);
/// Reports SAME_ACCOUNT on to_account_id when both ids are equal.
ValidationResult validateCreateTransferRequest(const CreateTransferRequest& request);
/// end_date before start_date reports INVALID_RANGE on end_date.
ValidationResult validateCreateBudgetPeriodRequest(const CreateBudgetPeriodRequest& request);
ValidationResult validateCreateBudgetRequest(const CreateBudgetRequest& request);
ValidationResult validateUpdateBudgetRequest(const UpdateBudgetRequest& request);
/// Priority outside 1..5 reports INVALID_RANGE.
ValidationResult validateCreateGoalRequest(const CreateGoalRequest& request);
ValidationResult validateUpdateGoalRequest(const UpdateGoalRequest& request);

/// 1..maxItems well-formed transaction ids.
ValidationResult validateBulkRequest(const BulkTransactionRequest& request,
                                     size_t maxItems = kMaxBulkItems);

/// Ids, enumerations, date and amount ranges, sort field and direction.
ValidationResult validateTransactionFilter(const query::TransactionFilter& filter,
                                           const std::vector<std::string>& sortAllowList);

} // namespace validation
} // namespace fiscus
