#include "utils/input_validator.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace fiscus {
namespace utils {

namespace {

bool isAsciiControl(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return (uc < 0x20) || (uc == 0x7F);
}

std::string trimWhitespace(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Cut after max_chars code points without splitting a UTF-8 sequence
std::string truncateUtf8(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (chars == max_chars) return s.substr(0, i);
            ++chars;
        }
    }
    return s;
}

std::string removeChars(const std::string& s, const char* chars) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        bool drop = false;
        for (const char* p = chars; *p; ++p) {
            if (c == *p) { drop = true; break; }
        }
        if (!drop) out.push_back(c);
    }
    return out;
}

} // namespace

std::string InputValidator::sanitizeString(const std::string& input) {
    if (input.empty()) return {};
    static const std::regex js_scheme("javascript:", std::regex::ECMAScript | std::regex::icase);
    static const std::regex handler("on\\w+=", std::regex::ECMAScript | std::regex::icase);

    std::string out = removeChars(input, "<>");
    out = std::regex_replace(out, js_scheme, "");
    out = std::regex_replace(out, handler, "");
    return trimWhitespace(out);
}

std::string InputValidator::sanitizeSearchQuery(const std::string& query) {
    if (query.empty()) return {};
    std::string out = removeChars(query, "<>'\";");
    return truncateUtf8(trimWhitespace(out), kMaxSearchLength);
}

bool InputValidator::validateSortField(const std::string& field, const std::vector<std::string>& allowList) {
    return std::find(allowList.begin(), allowList.end(), field) != allowList.end();
}

bool InputValidator::validateSortDirection(const std::string& direction) {
    std::string upper = direction;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper == "ASC" || upper == "DESC";
}

std::string InputValidator::escapeLike(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        if (c == '%' || c == '_' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string InputValidator::sanitizeForLogs(const std::string& input, size_t max_len) {
    std::string out;
    out.reserve(std::min(input.size(), max_len));
    for (char c : input) {
        if (out.size() >= max_len) break;
        if (c == '\n' || c == '\t' || c == '\r') {
            if (!out.empty() && out.back() != ' ') out.push_back(' ');
            continue;
        }
        if (!isAsciiControl(c)) out.push_back(c);
    }
    return out;
}

} // namespace utils
} // namespace fiscus
