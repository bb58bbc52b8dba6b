#include "validation/request_validators.h"
#include "validation/validator.h"
#include "utils/input_validator.h"

#include <algorithm>
#include <unordered_set>

namespace fiscus {
namespace validation {

const std::vector<std::string> kTransactionTypes = {"income", "expense", "transfer"};
const std::vector<std::string> kTransactionStatuses = {"pending", "completed", "cancelled"};
const std::vector<std::string> kGoalStatuses = {"active", "completed", "paused", "cancelled"};

namespace {

void append(ValidationErrors& into, const ValidationErrors& from) {
    into.insert(into.end(), from.begin(), from.end());
}

bool contains(const std::vector<std::string>& set, const std::string& v) {
    return std::find(set.begin(), set.end(), v) != set.end();
}

void checkEnum(ValidationErrors& errors, const std::string& field, const std::string& value,
               const std::vector<std::string>& allowed, const char* label) {
    if (!contains(allowed, value)) {
        errors.push_back({field, std::string("Invalid ") + label, ValidationCode::InvalidFormat});
    }
}

void checkPriority(ValidationErrors& errors, const std::optional<int>& priority) {
    if (priority && (*priority < 1 || *priority > 5)) {
        errors.push_back({"priority", "Priority must be between 1 and 5", ValidationCode::InvalidRange});
    }
}

void checkOptionalDescription(ValidationErrors& errors, const std::optional<std::string>& description) {
    if (description && !description->empty()) {
        append(errors, validateString(*description, "description", 0, 500, false));
    }
}

// Optional id: an empty string counts as absent
void checkOptionalUUID(ValidationErrors& errors, const std::optional<std::string>& id, const std::string& field) {
    if (id && !id->empty()) {
        append(errors, validateUUID(*id, field));
    }
}

} // namespace

ValidationResult validateCreateUserRequest(const CreateUserRequest& request) {
    ValidationErrors errors;
    append(errors, validateString(request.username, "username", 3, 50));
    if (request.email && !request.email->empty()) {
        append(errors, validateEmail(*request.email));
    }
    append(errors, validatePassword(request.password));
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateCreateAccountRequest(const CreateAccountRequest& request) {
    ValidationErrors errors;
    append(errors, validateUUID(request.user_id, "user_id"));
    append(errors, validateUUID(request.account_type_id, "account_type_id"));
    append(errors, validateString(request.name, "name", 1, 100));
    checkOptionalDescription(errors, request.description);
    append(errors, validateCurrency(request.currency));
    if (request.balance) {
        // credit and loan accounts start below zero
        append(errors, validateAmount(request.balance, "balance", true));
    }
    if (request.institution_name) {
        append(errors, validateString(*request.institution_name, "institution_name", 0, 100, false));
    }
    if (request.account_number) {
        append(errors, validateString(*request.account_number, "account_number", 0, 50, false));
    }
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateUpdateAccountRequest(const UpdateAccountRequest& request) {
    ValidationErrors errors;
    if (request.name) append(errors, validateString(*request.name, "name", 1, 100));
    checkOptionalDescription(errors, request.description);
    if (request.institution_name) {
        append(errors, validateString(*request.institution_name, "institution_name", 0, 100, false));
    }
    if (request.account_number) {
        append(errors, validateString(*request.account_number, "account_number", 0, 50, false));
    }
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateCreateCategoryRequest(const CreateCategoryRequest& request) {
    ValidationErrors errors;
    append(errors, validateUUID(request.user_id, "user_id"));
    append(errors, validateString(request.name, "name", 1, 100));
    checkOptionalDescription(errors, request.description);
    checkOptionalUUID(errors, request.parent_category_id, "parent_category_id");
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateUpdateCategoryRequest(const UpdateCategoryRequest& request) {
    ValidationErrors errors;
    if (request.name) append(errors, validateString(*request.name, "name", 1, 100));
    checkOptionalDescription(errors, request.description);
    checkOptionalUUID(errors, request.parent_category_id, "parent_category_id");
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateCreateTransactionRequest(const CreateTransactionRequest& request) {
    ValidationErrors errors;
    append(errors, validateUUID(request.user_id, "user_id"));
    append(errors, validateUUID(request.account_id, "account_id"));
    checkOptionalUUID(errors, request.category_id, "category_id");
    // negative amounts are corrections
    append(errors, validateAmount(request.amount, "amount", true));
    append(errors, validateString(request.description, "description", 1, 255));
    append(errors, validateDateTime(request.transaction_date, "transaction_date"));
    checkEnum(errors, "transaction_type", request.transaction_type, kTransactionTypes, "transaction type");
    if (request.status) {
        checkEnum(errors, "status", *request.status, kTransactionStatuses, "transaction status");
    }
    if (request.notes) append(errors, validateString(*request.notes, "notes", 0, 1000, false));
    if (request.payee) append(errors, validateString(*request.payee, "payee", 0, 255, false));
    if (request.reference_number) {
        append(errors, validateString(*request.reference_number, "reference_number", 0, 100, false));
    }
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateUpdateTransactionRequest(const UpdateTransactionRequest& request) {
    ValidationErrors errors;
    if (request.account_id) append(errors, validateUUID(*request.account_id, "account_id"));
    checkOptionalUUID(errors, request.category_id, "category_id");
    if (request.amount) append(errors, validateAmount(request.amount, "amount", true));
    if (request.description) {
        append(errors, validateString(*request.description, "description", 1, 255));
    }
    if (request.transaction_date) {
        append(errors, validateDateTime(*request.transaction_date, "transaction_date"));
    }
    if (request.transaction_type) {
        checkEnum(errors, "transaction_type", *request.transaction_type, kTransactionTypes, "transaction type");
    }
    if (request.status) {
        checkEnum(errors, "status", *request.status, kTransactionStatuses, "transaction status");
    }
    if (request.notes) append(errors, validateString(*request.notes, "notes", 0, 1000, false));
    if (request.payee) append(errors, validateString(*request.payee, "payee", 0, 255, false));
    if (request.reference_number) {
        append(errors, validateString(*request.reference_number, "reference_number", 0, 100, false));
    }
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateCreateTransferRequest(const CreateTransferRequest& request) {
    ValidationErrors errors;
    append(errors, validateUUID(request.user_id, "user_id"));
    append(errors, validateUUID(request.from_account_id, "from_account_id"));
    append(errors, validateUUID(request.to_account_id, "to_account_id"));
    if (request.from_account_id == request.to_account_id) {
        errors.push_back({"to_account_id", "Cannot transfer to the same account", ValidationCode::SameAccount});
    }
    append(errors, validateAmount(request.amount, "amount", false, false));
    append(errors, validateString(request.description, "description", 1, 255));
    append(errors, validateDateTime(request.transfer_date, "transfer_date"));
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateCreateBudgetPeriodRequest(const CreateBudgetPeriodRequest& request) {
    ValidationErrors errors;
    append(errors, validateUUID(request.user_id, "user_id"));
    append(errors, validateString(request.name, "name", 1, 100));
    auto start = validateDate(request.start_date, "start_date");
    auto end = validateDate(request.end_date, "end_date");
    const bool datesOk = start.empty() && end.empty();
    append(errors, start);
    append(errors, end);
    // YYYY-MM-DD compares chronologically as text
    if (datesOk && request.end_date < request.start_date) {
        errors.push_back({"end_date", "end_date cannot be before start_date", ValidationCode::InvalidRange});
    }
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateCreateBudgetRequest(const CreateBudgetRequest& request) {
    ValidationErrors errors;
    append(errors, validateUUID(request.user_id, "user_id"));
    append(errors, validateUUID(request.budget_period_id, "budget_period_id"));
    append(errors, validateUUID(request.category_id, "category_id"));
    append(errors, validateAmount(request.allocated_amount, "allocated_amount", false, false));
    if (request.notes) append(errors, validateString(*request.notes, "notes", 0, 500, false));
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateUpdateBudgetRequest(const UpdateBudgetRequest& request) {
    ValidationErrors errors;
    if (request.allocated_amount) {
        append(errors, validateAmount(request.allocated_amount, "allocated_amount", false, false));
    }
    if (request.notes) append(errors, validateString(*request.notes, "notes", 0, 500, false));
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateCreateGoalRequest(const CreateGoalRequest& request) {
    ValidationErrors errors;
    append(errors, validateUUID(request.user_id, "user_id"));
    append(errors, validateString(request.name, "name", 1, 100));
    checkOptionalDescription(errors, request.description);
    append(errors, validateAmount(request.target_amount, "target_amount", false, false));
    if (request.target_date && !request.target_date->empty()) {
        append(errors, validateDate(*request.target_date, "target_date", false));
    }
    checkPriority(errors, request.priority);
    if (request.category) append(errors, validateString(*request.category, "category", 0, 50, false));
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateUpdateGoalRequest(const UpdateGoalRequest& request) {
    ValidationErrors errors;
    if (request.name) append(errors, validateString(*request.name, "name", 1, 100));
    checkOptionalDescription(errors, request.description);
    if (request.target_amount) {
        append(errors, validateAmount(request.target_amount, "target_amount", false, false));
    }
    if (request.target_date && !request.target_date->empty()) {
        append(errors, validateDate(*request.target_date, "target_date", false));
    }
    checkPriority(errors, request.priority);
    if (request.status) checkEnum(errors, "status", *request.status, kGoalStatuses, "goal status");
    if (request.category) append(errors, validateString(*request.category, "category", 0, 50, false));
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateBulkRequest(const BulkTransactionRequest& request, size_t maxItems) {
    ValidationErrors errors;
    append(errors, validateUUID(request.user_id, "user_id"));
    if (request.transaction_ids.empty()) {
        errors.push_back({"transaction_ids", "At least one transaction id is required",
                          ValidationCode::Required});
    } else if (request.transaction_ids.size() > maxItems) {
        errors.push_back({"transaction_ids",
                          "Cannot process more than " + std::to_string(maxItems) + " transactions at once",
                          ValidationCode::MaxValue});
    }
    std::unordered_set<std::string> seen;
    for (const auto& id : request.transaction_ids) {
        if (!seen.insert(id).second) continue;
        append(errors, validateUUID(id, "transaction_ids"));
    }
    return ValidationResult::fromErrors(std::move(errors));
}

ValidationResult validateTransactionFilter(const query::TransactionFilter& filter,
                                           const std::vector<std::string>& sortAllowList) {
    ValidationErrors errors;
    append(errors, validateUUID(filter.user_id, "user_id"));
    checkOptionalUUID(errors, filter.account_id, "account_id");
    checkOptionalUUID(errors, filter.category_id, "category_id");
    if (filter.transaction_type) {
        checkEnum(errors, "transaction_type", *filter.transaction_type, kTransactionTypes, "transaction type");
    }
    if (filter.status) {
        checkEnum(errors, "status", *filter.status, kTransactionStatuses, "transaction status");
    }

    bool datesOk = true;
    if (filter.start_date) {
        auto e = validateDateTime(*filter.start_date, "start_date");
        datesOk = datesOk && e.empty();
        append(errors, e);
    }
    if (filter.end_date) {
        auto e = validateDateTime(*filter.end_date, "end_date");
        datesOk = datesOk && e.empty();
        append(errors, e);
    }
    if (datesOk && filter.start_date && filter.end_date &&
        filter.end_date->substr(0, 10) < filter.start_date->substr(0, 10)) {
        errors.push_back({"end_date", "end_date cannot be before start_date", ValidationCode::InvalidRange});
    }

    if (filter.min_amount) append(errors, validateAmount(filter.min_amount, "min_amount"));
    if (filter.max_amount) append(errors, validateAmount(filter.max_amount, "max_amount"));
    if (filter.min_amount && filter.max_amount && *filter.max_amount < *filter.min_amount) {
        errors.push_back({"max_amount", "max_amount cannot be less than min_amount", ValidationCode::InvalidRange});
    }

    if (filter.sort_by && !utils::InputValidator::validateSortField(*filter.sort_by, sortAllowList)) {
        errors.push_back({"sort_by", "Invalid sort field", ValidationCode::InvalidFormat});
    }
    if (filter.sort_direction && !utils::InputValidator::validateSortDirection(*filter.sort_direction)) {
        errors.push_back({"sort_direction", "Invalid sort direction", ValidationCode::InvalidFormat});
    }
    return ValidationResult::fromErrors(std::move(errors));
}

} // namespace validation
} // namespace fiscus
