#pragma once

#include "core/types.hpp"
#include "security/irate_limiter.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace personaguard {

class SecurityLog;

struct RateLimitConfig {
    uint32_t capacity = 100;
    std::chrono::milliseconds window{60'000};
    std::chrono::milliseconds min_delay{0};
};

namespace rate_limits {

inline constexpr std::string_view kDefault = "default";
inline constexpr std::string_view kCredentialValidation = "credential-validation";
inline constexpr std::string_view kGithubApi = "github-api";
inline constexpr std::string_view kUpdateCheck = "update-check";
inline constexpr std::string_view kStrict = "strict";

inline RateLimitConfig credential_validation() { return {10, std::chrono::hours(1), std::chrono::milliseconds(0)}; }
inline RateLimitConfig github_api() { return {60, std::chrono::hours(1), std::chrono::seconds(1)}; }
inline RateLimitConfig update_check() { return {10, std::chrono::hours(1), std::chrono::seconds(30)}; }
inline RateLimitConfig strict() { return {5, std::chrono::hours(1), std::chrono::seconds(60)}; }

} // namespace rate_limits

/**
 * @brief Token bucket with lazy refill and a minimum admission spacing
 *
 * tokens = min(capacity, tokens + elapsed / window * capacity), computed on
 * each call from the monotonic clock (no background timer). A bounded log
 * of the last `capacity` admission times additionally guarantees that no
 * sliding window of length `window` holds more than `capacity` admissions.
 *
 * Thread-safe via a per-bucket mutex.
 */
class TokenBucket {
public:
    TokenBucket(const RateLimitConfig& config, int64_t now_ns);

    /// Admit and consume one token, or deny with retry_after
    RateLimitResult try_acquire_at(int64_t now_ns);

    /// Same decision without consuming
    [[nodiscard]] RateLimitResult peek_at(int64_t now_ns) const;

    void reset(int64_t now_ns);

    [[nodiscard]] double tokens() const;

    [[nodiscard]] int64_t last_access_ns() const {
        return last_access_ns_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const RateLimitConfig& config() const { return config_; }

private:
    void refill(int64_t now_ns);
    RateLimitResult decide(int64_t now_ns, double tokens) const;

    const RateLimitConfig config_;
    const int64_t window_ns_;
    const int64_t min_delay_ns_;

    mutable std::mutex mutex_;
    double tokens_;
    int64_t last_refill_ns_;
    int64_t last_admit_ns_ = -1;
    std::deque<int64_t> admissions_;     // Oldest first, at most capacity entries
    std::atomic<int64_t> last_access_ns_;
};

/**
 * @brief Keyed token-bucket limiter ("<operation>:<identity>" keys)
 *
 * The operation prefix selects a named limit (presets plus configured
 * overrides), falling back to the default limit. Idle buckets are evicted
 * opportunistically every eviction_check_interval checks.
 */
class RateLimiter : public IRateLimiter {
public:
    struct Config {
        RateLimitConfig default_limit;
        std::unordered_map<std::string, RateLimitConfig> operation_limits;
        std::chrono::seconds idle_eviction{3600};
        uint32_t eviction_check_interval = 1024;

        /// Default limit plus credential-validation, github-api, update-check, strict
        static Config with_presets();
    };

    explicit RateLimiter(SecurityLog& log) : RateLimiter(log, Config::with_presets()) {}
    RateLimiter(SecurityLog& log, Config config);

    [[nodiscard]] RateLimitResult check_limit(const std::string& key) override;

    [[nodiscard]] RateLimitResult check_limit_at(const std::string& key, int64_t now_ns);

    /// Alias of check_limit: an admitted check consumes a token
    [[nodiscard]] RateLimitResult consume(const std::string& key) { return check_limit(key); }

    [[nodiscard]] RateLimitResult peek(const std::string& key) const;

    void set_limit(const std::string& operation, const RateLimitConfig& limit);

    void reset(const std::string& key) override;
    void reset_all() override;

    [[nodiscard]] size_t bucket_count() const;
    [[nodiscard]] RateLimitConfig limit_for(std::string_view key) const;

    /// "credential-validation:abc" -> "credential-validation"
    [[nodiscard]] static std::string_view operation_of(std::string_view key);

private:
    std::shared_ptr<TokenBucket> get_or_create(const std::string& key, int64_t now_ns);
    void evict_idle(int64_t now_ns);

    SecurityLog& log_;
    Config config_;
    mutable std::shared_mutex limits_mutex_;

    std::unordered_map<std::string, std::shared_ptr<TokenBucket>> buckets_;
    mutable std::shared_mutex buckets_mutex_;

    std::atomic<uint64_t> checks_{0};
};

} // namespace personaguard
