#pragma once

#include "core/types.hpp"
#include <string>

namespace personaguard {

/**
 * @brief Abstract keyed rate limiter
 *
 * Keys are "<operation>:<identity>"; the operation selects the limit.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /// Admits (and consumes a token) or denies with retry_after
    [[nodiscard]] virtual RateLimitResult check_limit(const std::string& key) = 0;

    virtual void reset(const std::string& key) = 0;

    virtual void reset_all() = 0;
};

} // namespace personaguard
