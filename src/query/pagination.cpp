#include "query/pagination.h"

#include <algorithm>

namespace fiscus {
namespace query {

PageRequest PageRequest::normalize(std::optional<int64_t> offset,
                                   std::optional<int64_t> limit,
                                   int64_t default_limit,
                                   int64_t max_limit) {
    PageRequest req;
    const int64_t cap = std::max<int64_t>(1, max_limit);
    req.limit = std::clamp<int64_t>(limit.value_or(default_limit), 1, cap);
    req.offset = std::max<int64_t>(0, offset.value_or(0));
    return req;
}

} // namespace query
} // namespace fiscus
