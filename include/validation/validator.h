#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "validation/validation_result.h"

namespace fiscus {
namespace validation {

/// Largest accepted monetary magnitude.
constexpr double kMaxAmount = 999999999999.0;

constexpr size_t kPasswordMinLength = 8;
constexpr size_t kPasswordMaxLength = 128;

// ===== Primitive field validators =====
// Each returns an empty list when the value is acceptable.

/// Length checks run on the trimmed value, counted in code points.
ValidationErrors validateString(const std::string& value,
                                const std::string& field,
                                size_t minLength,
                                size_t maxLength,
                                bool required = true);

ValidationErrors validateEmail(const std::string& email, bool required = false);

/// RFC 4122 textual form, version 1-5, variant 8/9/a/b, case-insensitive.
ValidationErrors validateUUID(const std::string& value, const std::string& field);

/// std::nullopt, NaN and infinities report INVALID_TYPE.
ValidationErrors validateAmount(std::optional<double> amount,
                                const std::string& field,
                                bool allowNegative = false,
                                bool allowZero = true);

/// YYYY-MM-DD naming a real calendar day.
ValidationErrors validateDate(const std::string& value,
                              const std::string& field,
                              bool required = true);

/// ISO-8601 date or date-time, optional fraction and zone designator.
ValidationErrors validateDateTime(const std::string& value, const std::string& field);

ValidationErrors validateCurrency(const std::string& currency);

/// Every missing character class yields its own error.
ValidationErrors validatePassword(const std::string& password);

// ===== Helpers =====

std::string trim(const std::string& s);
size_t utf8Length(const std::string& s);
bool isCalendarDate(int year, int month, int day);
bool isIsoDate(const std::string& value);
bool isIsoDateTime(const std::string& value);

/// Rewrites a valid ISO 8601 datetime into the form SQLite's date functions
/// parse: zone offsets become +HH:MM. Invalid input is returned unchanged.
std::string normalizeDateTime(const std::string& value);
bool isUUID(const std::string& value);

} // namespace validation
} // namespace fiscus
