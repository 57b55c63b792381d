#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <optional>

namespace sqlgate {

/**
 * @brief What to do with an explicit limit/offset outside the accepted range
 *
 * REJECT fails the request with BOUNDS_ERROR. CLAMP moves the value into
 * range; the response echo then shows the value actually used.
 */
enum class BoundsPolicy : uint8_t { REJECT, CLAMP };

inline constexpr const char* bounds_policy_to_string(BoundsPolicy policy) {
    switch (policy) {
        case BoundsPolicy::REJECT: return "reject";
        case BoundsPolicy::CLAMP:  return "clamp";
    }
    return "reject";
}

struct PaginationConfig {
    int64_t default_limit = 100;
    int64_t max_limit = 10000;
    BoundsPolicy bounds_policy = BoundsPolicy::REJECT;
};

/**
 * @brief Effective limit/offset for one paginated read
 *
 * Invariant: 1 <= limit <= max_limit, offset >= 0. Built only by make().
 */
class PageRequest {
public:
    /**
     * @brief Fill defaults and apply the bounds policy
     * @param limit Caller limit (nullopt = default_limit)
     * @param offset Caller offset (nullopt = 0)
     */
    [[nodiscard]] static Result<PageRequest> make(std::optional<int64_t> limit,
                                                  std::optional<int64_t> offset,
                                                  const PaginationConfig& config);

    [[nodiscard]] int64_t limit() const { return limit_; }
    [[nodiscard]] int64_t offset() const { return offset_; }

private:
    PageRequest(int64_t limit, int64_t offset) : limit_(limit), offset_(offset) {}

    int64_t limit_;
    int64_t offset_;
};

} // namespace sqlgate
