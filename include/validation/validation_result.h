#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fiscus {
namespace validation {

/// Closed, machine-readable error taxonomy shared with the presentation layer.
enum class ValidationCode {
    Required,
    MinLength,
    MaxLength,
    InvalidFormat,
    InvalidType,
    NegativeValue,
    ZeroValue,
    MaxValue,
    InvalidDate,
    SameAccount,
    InvalidRange,
    MissingUppercase,
    MissingLowercase,
    MissingNumber,
    MissingSpecial
};

/// Wire name, e.g. "REQUIRED", "SAME_ACCOUNT".
const char* codeToString(ValidationCode code);
std::optional<ValidationCode> codeFromString(const std::string& name);

struct ValidationError {
    std::string field;
    std::string message;
    ValidationCode code = ValidationCode::InvalidFormat;

    nlohmann::json toJson() const;
};

using ValidationErrors = std::vector<ValidationError>;

struct ValidationResult {
    bool isValid = true;
    ValidationErrors errors;

    static ValidationResult fromErrors(ValidationErrors errs);

    /// Append errors and refresh isValid
    void merge(const ValidationErrors& more);

    bool hasCode(ValidationCode code) const;
    bool hasError(const std::string& field, ValidationCode code) const;
    /// Comma separated "field: message" list, used for exception texts
    std::string summary() const;

    nlohmann::json toJson() const;
};

/// Result of a composite validator plus the first message per field.
struct FormValidationResult {
    bool isValid = true;
    ValidationErrors errors;
    std::map<std::string, std::string> fieldErrors;

    nlohmann::json toJson() const;
};

FormValidationResult toFormResult(const ValidationResult& result);

/// Wraps a composite validator so a form can bind messages by field name.
template<typename Request>
std::function<FormValidationResult(const Request&)> createFormValidator(
    std::function<ValidationResult(const Request&)> validator)
{
    return [validator = std::move(validator)](const Request& request) {
        return toFormResult(validator(request));
    };
}

} // namespace validation
} // namespace fiscus
