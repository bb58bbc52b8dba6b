#include "validation/validator.h"

#include <cctype>
#include <cmath>
#include <cstring>
#include <regex>

namespace fiscus {
namespace validation {

namespace {

ValidationError makeError(const std::string& field, std::string message, ValidationCode code) {
    return ValidationError{field, std::move(message), code};
}

const std::regex& uuidPattern() {
    static const std::regex re(
        "^[0-9a-f]{8}-[0-9a-f]{4}-[1-5][0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& emailPattern() {
    static const std::regex re(
        "^[a-zA-Z0-9.!#$%&'*+/=?^_`{|}~-]+@"
        "[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?"
        "(?:\\.[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?)*$");
    return re;
}

const std::regex& currencyPattern() {
    static const std::regex re("^[A-Z]{3}$");
    return re;
}

// YYYY-MM-DD[THH:MM[:SS[.fff]]][Z|+HH:MM|-HH:MM]
const std::regex& dateTimePattern() {
    static const std::regex re(
        "^(\\d{4})-(\\d{2})-(\\d{2})"
        "(?:[T ](\\d{2}):(\\d{2})(?::(\\d{2})(?:\\.\\d{1,9})?)?"
        "(Z|[+-](\\d{2}):?(\\d{2}))?)?$");
    return re;
}

constexpr const char* kPasswordSpecials = "!@#$%^&*()_+=[]{};':\"\\|,.<>/?-";

} // namespace

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

size_t utf8Length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

bool isCalendarDate(int year, int month, int day) {
    if (year < 1 || month < 1 || month > 12 || day < 1) return false;
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int max_day = kDays[month - 1];
    const bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    if (month == 2 && leap) max_day = 29;
    return day <= max_day;
}

bool isIsoDate(const std::string& value) {
    static const std::regex re("^(\\d{4})-(\\d{2})-(\\d{2})$");
    std::smatch m;
    if (!std::regex_match(value, m, re)) return false;
    return isCalendarDate(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()));
}

bool isIsoDateTime(const std::string& value) {
    std::smatch m;
    if (!std::regex_match(value, m, dateTimePattern())) return false;
    if (!isCalendarDate(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()))) {
        return false;
    }
    if (m[4].matched) {
        if (std::stoi(m[4].str()) > 23 || std::stoi(m[5].str()) > 59) return false;
        if (m[6].matched && std::stoi(m[6].str()) > 59) return false;
    }
    if (m[8].matched) {
        if (std::stoi(m[8].str()) > 23 || std::stoi(m[9].str()) > 59) return false;
    }
    return true;
}

std::string normalizeDateTime(const std::string& value) {
    std::smatch m;
    if (!isIsoDateTime(value) || !std::regex_match(value, m, dateTimePattern()) || !m[8].matched) {
        return value;
    }
    const std::string zone = m[7].str();
    return value.substr(0, static_cast<size_t>(m.position(7))) + zone[0] + m[8].str() + ":" + m[9].str();
}

bool isUUID(const std::string& value) {
    return std::regex_match(value, uuidPattern());
}

ValidationErrors validateString(const std::string& value,
                                const std::string& field,
                                size_t minLength,
                                size_t maxLength,
                                bool required) {
    ValidationErrors errors;
    const std::string trimmed = trim(value);
    if (trimmed.empty()) {
        if (required) {
            errors.push_back(makeError(field, field + " is required", ValidationCode::Required));
        }
        return errors;
    }

    const size_t len = utf8Length(trimmed);
    if (len < minLength) {
        errors.push_back(makeError(field,
            field + " must be at least " + std::to_string(minLength) + " characters",
            ValidationCode::MinLength));
    }
    if (len > maxLength) {
        errors.push_back(makeError(field,
            field + " cannot exceed " + std::to_string(maxLength) + " characters",
            ValidationCode::MaxLength));
    }
    return errors;
}

ValidationErrors validateEmail(const std::string& email, bool required) {
    ValidationErrors errors;
    const std::string trimmed = trim(email);
    if (trimmed.empty()) {
        if (required) {
            errors.push_back(makeError("email", "Email is required", ValidationCode::Required));
        }
        return errors;
    }
    if (trimmed.find("..") != std::string::npos || !std::regex_match(trimmed, emailPattern())) {
        errors.push_back(makeError("email", "Invalid email format", ValidationCode::InvalidFormat));
    }
    return errors;
}

ValidationErrors validateUUID(const std::string& value, const std::string& field) {
    ValidationErrors errors;
    const std::string trimmed = trim(value);
    if (trimmed.empty()) {
        errors.push_back(makeError(field, field + " is required", ValidationCode::Required));
        return errors;
    }
    if (!isUUID(trimmed)) {
        errors.push_back(makeError(field, "Invalid " + field + " format", ValidationCode::InvalidFormat));
    }
    return errors;
}

ValidationErrors validateAmount(std::optional<double> amount,
                                const std::string& field,
                                bool allowNegative,
                                bool allowZero) {
    ValidationErrors errors;
    if (!amount || !std::isfinite(*amount)) {
        errors.push_back(makeError(field, field + " must be a valid number", ValidationCode::InvalidType));
        return errors;
    }
    const double v = *amount;
    if (!allowNegative && v < 0) {
        errors.push_back(makeError(field, field + " cannot be negative", ValidationCode::NegativeValue));
    }
    if (!allowZero && v == 0) {
        errors.push_back(makeError(field, field + " must be greater than zero", ValidationCode::ZeroValue));
    }
    if (std::fabs(v) > kMaxAmount) {
        errors.push_back(makeError(field, field + " exceeds maximum allowed value", ValidationCode::MaxValue));
    }
    return errors;
}

ValidationErrors validateDate(const std::string& value, const std::string& field, bool required) {
    ValidationErrors errors;
    if (trim(value).empty()) {
        if (required) {
            errors.push_back(makeError(field, field + " is required", ValidationCode::Required));
        }
        return errors;
    }

    static const std::regex shape("^\\d{4}-\\d{2}-\\d{2}$");
    if (!std::regex_match(value, shape)) {
        errors.push_back(makeError(field, field + " must be in YYYY-MM-DD format", ValidationCode::InvalidFormat));
        return errors;
    }
    if (!isIsoDate(value)) {
        errors.push_back(makeError(field, field + " is not a valid date", ValidationCode::InvalidDate));
    }
    return errors;
}

ValidationErrors validateDateTime(const std::string& value, const std::string& field) {
    ValidationErrors errors;
    if (trim(value).empty()) {
        errors.push_back(makeError(field, field + " is required", ValidationCode::Required));
        return errors;
    }
    if (!isIsoDateTime(value)) {
        errors.push_back(makeError(field, field + " must be a valid ISO 8601 datetime",
                                   ValidationCode::InvalidFormat));
    }
    return errors;
}

ValidationErrors validateCurrency(const std::string& currency) {
    ValidationErrors errors;
    const std::string trimmed = trim(currency);
    if (trimmed.empty()) {
        errors.push_back(makeError("currency", "Currency is required", ValidationCode::Required));
        return errors;
    }
    if (!std::regex_match(trimmed, currencyPattern())) {
        errors.push_back(makeError("currency", "Currency must be a 3-letter ISO code (e.g., USD)",
                                   ValidationCode::InvalidFormat));
    }
    return errors;
}

ValidationErrors validatePassword(const std::string& password) {
    ValidationErrors errors;
    if (password.empty()) {
        errors.push_back(makeError("password", "Password is required", ValidationCode::Required));
        return errors;
    }

    const size_t len = utf8Length(password);
    if (len < kPasswordMinLength) {
        errors.push_back(makeError("password", "Password must be at least 8 characters",
                                   ValidationCode::MinLength));
    }
    if (len > kPasswordMaxLength) {
        errors.push_back(makeError("password", "Password cannot exceed 128 characters",
                                   ValidationCode::MaxLength));
    }

    bool upper = false, lower = false, digit = false, special = false;
    for (char c : password) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc >= 'A' && uc <= 'Z') upper = true;
        else if (uc >= 'a' && uc <= 'z') lower = true;
        else if (uc >= '0' && uc <= '9') digit = true;
        else if (uc != 0 && std::strchr(kPasswordSpecials, c) != nullptr) special = true;
    }

    if (!upper) {
        errors.push_back(makeError("password", "Password must contain at least one uppercase letter",
                                   ValidationCode::MissingUppercase));
    }
    if (!lower) {
        errors.push_back(makeError("password", "Password must contain at least one lowercase letter",
                                   ValidationCode::MissingLowercase));
    }
    if (!digit) {
        errors.push_back(makeError("password", "Password must contain at least one number",
                                   ValidationCode::MissingNumber));
    }
    if (!special) {
        errors.push_back(makeError("password", "Password must contain at least one special character",
                                   ValidationCode::MissingSpecial));
    }
    return errors;
}

} // namespace validation
} // namespace fiscus
