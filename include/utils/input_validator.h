#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace fiscus {
namespace utils {

/// Defense-in-depth string scrubbing and allow-list checks. None of this
/// replaces parameter binding; it only keeps markup and stray query syntax
/// out of stored text and dynamic ORDER BY clauses.
class InputValidator {
public:
    static constexpr size_t kMaxSearchLength = 100;

    /// Strips '<' '>', "javascript:" (any case) and on<word>= handler
    /// patterns, then trims.
    static std::string sanitizeString(const std::string& input);

    /// Strips '<' '>' quotes and ';', trims, truncates to kMaxSearchLength
    /// code points.
    static std::string sanitizeSearchQuery(const std::string& query);

    /// Exact, case-sensitive membership in allowList.
    static bool validateSortField(const std::string& field, const std::vector<std::string>& allowList);

    /// ASC or DESC, any case.
    static bool validateSortDirection(const std::string& direction);

    /// Escapes LIKE wildcards ('%', '_') and the escape char itself with '\'.
    static std::string escapeLike(const std::string& input);

    /// Sanitize strings for logs (strip control chars and truncate)
    static std::string sanitizeForLogs(const std::string& input, size_t max_len = 512);
};

} // namespace utils
} // namespace fiscus
