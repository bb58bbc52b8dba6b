#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace fiscus {
namespace query {

/// Transaction listing criteria. Everything except user_id is optional;
/// present criteria combine with AND.
struct TransactionFilter {
    std::string user_id;
    std::optional<std::string> account_id;
    std::optional<std::string> category_id;
    std::optional<std::string> transaction_type;
    std::optional<std::string> status;
    std::optional<std::string> start_date;     // inclusive, compared on DATE()
    std::optional<std::string> end_date;       // inclusive, compared on DATE()
    std::optional<double> min_amount;          // compared on ABS(amount)
    std::optional<double> max_amount;
    std::optional<std::string> search;         // description, payee, notes
    std::optional<std::string> sort_by;
    std::optional<std::string> sort_direction;
    std::optional<int64_t> offset;
    std::optional<int64_t> limit;
};

} // namespace query
} // namespace fiscus
