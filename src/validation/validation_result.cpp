#include "validation/validation_result.h"

#include <algorithm>
#include <sstream>

namespace fiscus {
namespace validation {

namespace {

struct CodeName {
    ValidationCode code;
    const char* name;
};

constexpr CodeName kCodeNames[] = {
    {ValidationCode::Required, "REQUIRED"},
    {ValidationCode::MinLength, "MIN_LENGTH"},
    {ValidationCode::MaxLength, "MAX_LENGTH"},
    {ValidationCode::InvalidFormat, "INVALID_FORMAT"},
    {ValidationCode::InvalidType, "INVALID_TYPE"},
    {ValidationCode::NegativeValue, "NEGATIVE_VALUE"},
    {ValidationCode::ZeroValue, "ZERO_VALUE"},
    {ValidationCode::MaxValue, "MAX_VALUE"},
    {ValidationCode::InvalidDate, "INVALID_DATE"},
    {ValidationCode::SameAccount, "SAME_ACCOUNT"},
    {ValidationCode::InvalidRange, "INVALID_RANGE"},
    {ValidationCode::MissingUppercase, "MISSING_UPPERCASE"},
    {ValidationCode::MissingLowercase, "MISSING_LOWERCASE"},
    {ValidationCode::MissingNumber, "MISSING_NUMBER"},
    {ValidationCode::MissingSpecial, "MISSING_SPECIAL"},
};

} // namespace

const char* codeToString(ValidationCode code) {
    for (const auto& cn : kCodeNames) {
        if (cn.code == code) return cn.name;
    }
    return "INVALID_FORMAT";
}

std::optional<ValidationCode> codeFromString(const std::string& name) {
    for (const auto& cn : kCodeNames) {
        if (name == cn.name) return cn.code;
    }
    return std::nullopt;
}

nlohmann::json ValidationError::toJson() const {
    return {
        {"field", field},
        {"message", message},
        {"code", codeToString(code)}
    };
}

ValidationResult ValidationResult::fromErrors(ValidationErrors errs) {
    ValidationResult r;
    r.isValid = errs.empty();
    r.errors = std::move(errs);
    return r;
}

void ValidationResult::merge(const ValidationErrors& more) {
    errors.insert(errors.end(), more.begin(), more.end());
    isValid = errors.empty();
}

bool ValidationResult::hasCode(ValidationCode code) const {
    return std::any_of(errors.begin(), errors.end(),
                       [code](const ValidationError& e) { return e.code == code; });
}

bool ValidationResult::hasError(const std::string& field, ValidationCode code) const {
    return std::any_of(errors.begin(), errors.end(), [&](const ValidationError& e) {
        return e.field == field && e.code == code;
    });
}

std::string ValidationResult::summary() const {
    std::ostringstream os;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) os << ", ";
        os << errors[i].field << ": " << errors[i].message;
    }
    return os.str();
}

nlohmann::json ValidationResult::toJson() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : errors) arr.push_back(e.toJson());
    return {{"isValid", isValid}, {"errors", std::move(arr)}};
}

nlohmann::json FormValidationResult::toJson() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : errors) arr.push_back(e.toJson());
    return {
        {"isValid", isValid},
        {"errors", std::move(arr)},
        {"fieldErrors", fieldErrors}
    };
}

FormValidationResult toFormResult(const ValidationResult& result) {
    FormValidationResult form;
    form.isValid = result.isValid;
    form.errors = result.errors;
    for (const auto& e : result.errors) {
        // emplace keeps the first message for a field
        form.fieldErrors.emplace(e.field, e.message);
    }
    return form;
}

} // namespace validation
} // namespace fiscus
