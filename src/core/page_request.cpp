#include "core/page_request.hpp"

#include <algorithm>
#include <format>

namespace sqlgate {

Result<PageRequest> PageRequest::make(std::optional<int64_t> limit,
                                      std::optional<int64_t> offset,
                                      const PaginationConfig& config) {
    int64_t effective_limit = limit.value_or(config.default_limit);
    int64_t effective_offset = offset.value_or(0);

    if (config.bounds_policy == BoundsPolicy::CLAMP) {
        effective_limit = std::clamp<int64_t>(effective_limit, 1, config.max_limit);
        effective_offset = std::max<int64_t>(effective_offset, 0);
        return Result<PageRequest>::ok(PageRequest(effective_limit, effective_offset));
    }

    if (effective_limit <= 0) {
        return Result<PageRequest>::error(ErrorKind::BOUNDS_ERROR,
            std::format("limit must be greater than 0, got {}", effective_limit));
    }
    if (effective_limit > config.max_limit) {
        return Result<PageRequest>::error(ErrorKind::BOUNDS_ERROR,
            std::format("limit cannot exceed {}, got {}", config.max_limit, effective_limit));
    }
    if (effective_offset < 0) {
        return Result<PageRequest>::error(ErrorKind::BOUNDS_ERROR,
            std::format("offset cannot be negative, got {}", effective_offset));
    }

    return Result<PageRequest>::ok(PageRequest(effective_limit, effective_offset));
}

} // namespace sqlgate
