#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace fiscus {
namespace query {

constexpr int64_t kDefaultPageSize = 50;
constexpr int64_t kMaxPageSize = 1000;

/// Normalized offset/limit window
struct PageRequest {
    int64_t offset = 0;
    int64_t limit = kDefaultPageSize;

    /// 1-based page containing offset
    int64_t page() const { return offset / limit + 1; }

    /// Negative offsets clamp to 0, limit to [1, max_limit], missing limit
    /// falls back to default_limit.
    static PageRequest normalize(std::optional<int64_t> offset,
                                 std::optional<int64_t> limit,
                                 int64_t default_limit = kDefaultPageSize,
                                 int64_t max_limit = kMaxPageSize);
};

inline int64_t totalPages(int64_t total, int64_t limit) {
    if (total <= 0 || limit <= 0) return 0;
    return (total + limit - 1) / limit;
}

/// Paginated envelope {data, total, page, total_pages, limit}
template<typename T>
struct Page {
    std::vector<T> data;
    int64_t total = 0;
    int64_t page = 1;
    int64_t total_pages = 0;
    int64_t limit = kDefaultPageSize;
    int64_t offset = 0;

    static Page make(std::vector<T> items, int64_t total, const PageRequest& req) {
        Page p;
        p.data = std::move(items);
        p.total = total;
        p.page = req.page();
        p.limit = req.limit;
        p.offset = req.offset;
        p.total_pages = totalPages(total, req.limit);
        return p;
    }

    bool hasMore() const { return offset + static_cast<int64_t>(data.size()) < total; }

    nlohmann::json toJson() const {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& item : data) {
            items.push_back(item.toJson());
        }
        return {
            {"data", std::move(items)},
            {"total", total},
            {"page", page},
            {"total_pages", total_pages},
            {"limit", limit},
            {"has_more", hasMore()}
        };
    }
};

} // namespace query
} // namespace fiscus
