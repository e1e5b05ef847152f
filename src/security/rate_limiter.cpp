#include "security/rate_limiter.hpp"
#include "audit/security_log.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <vector>

namespace personaguard {

namespace {

std::chrono::milliseconds ns_to_retry(int64_t ns) {
    // Round up; a denial always carries a positive delay
    const int64_t ms = (ns + 999'999) / 1'000'000;
    return std::chrono::milliseconds(std::max<int64_t>(ms, 1));
}

} // anonymous namespace

// ============================================================================
// TokenBucket
// ============================================================================

TokenBucket::TokenBucket(const RateLimitConfig& config, int64_t now_ns)
    : config_(config),
      window_ns_(std::chrono::duration_cast<std::chrono::nanoseconds>(config.window).count()),
      min_delay_ns_(std::chrono::duration_cast<std::chrono::nanoseconds>(config.min_delay).count()),
      tokens_(static_cast<double>(config.capacity)),
      last_refill_ns_(now_ns),
      last_access_ns_(now_ns) {}

void TokenBucket::refill(int64_t now_ns) {
    if (now_ns <= last_refill_ns_ || window_ns_ <= 0) return;
    const double elapsed = static_cast<double>(now_ns - last_refill_ns_);
    const double added = elapsed / static_cast<double>(window_ns_) * config_.capacity;
    tokens_ = std::min(static_cast<double>(config_.capacity), tokens_ + added);
    last_refill_ns_ = now_ns;
}

RateLimitResult TokenBucket::decide(int64_t now_ns, double tokens) const {
    if (config_.capacity == 0) {
        return {false, 0, ns_to_retry(window_ns_), {}};
    }

    int64_t wait_ns = 0;

    if (last_admit_ns_ >= 0 && min_delay_ns_ > 0) {
        const int64_t since = now_ns - last_admit_ns_;
        if (since < min_delay_ns_) {
            wait_ns = std::max(wait_ns, min_delay_ns_ - since);
        }
    }

    if (tokens < 1.0) {
        const double deficit = 1.0 - tokens;
        const double ns = std::ceil(deficit * static_cast<double>(window_ns_) / config_.capacity);
        wait_ns = std::max(wait_ns, static_cast<int64_t>(ns));
    }

    if (admissions_.size() >= config_.capacity) {
        const int64_t expires = admissions_.front() + window_ns_;
        if (expires > now_ns) {
            wait_ns = std::max(wait_ns, expires - now_ns);
        }
    }

    const auto remaining = static_cast<uint32_t>(std::floor(std::max(tokens, 0.0)));
    if (wait_ns > 0) {
        return {false, remaining, ns_to_retry(wait_ns), {}};
    }
    return {true, remaining, std::chrono::milliseconds(0), {}};
}

RateLimitResult TokenBucket::try_acquire_at(int64_t now_ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_access_ns_.store(now_ns, std::memory_order_relaxed);
    refill(now_ns);

    auto result = decide(now_ns, tokens_);
    if (!result.allowed) return result;

    tokens_ -= 1.0;
    last_admit_ns_ = now_ns;
    admissions_.push_back(now_ns);
    while (admissions_.size() > config_.capacity) {
        admissions_.pop_front();
    }
    result.tokens_remaining = static_cast<uint32_t>(std::floor(std::max(tokens_, 0.0)));
    return result;
}

RateLimitResult TokenBucket::peek_at(int64_t now_ns) const {
    std::lock_guard<std::mutex> lock(mutex_);
    double tokens = tokens_;
    if (now_ns > last_refill_ns_ && window_ns_ > 0) {
        const double elapsed = static_cast<double>(now_ns - last_refill_ns_);
        tokens = std::min(static_cast<double>(config_.capacity),
                          tokens + elapsed / static_cast<double>(window_ns_) * config_.capacity);
    }
    return decide(now_ns, tokens);
}

void TokenBucket::reset(int64_t now_ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = static_cast<double>(config_.capacity);
    last_refill_ns_ = now_ns;
    last_admit_ns_ = -1;
    admissions_.clear();
    last_access_ns_.store(now_ns, std::memory_order_relaxed);
}

double TokenBucket::tokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_;
}

// ============================================================================
// RateLimiter
// ============================================================================

RateLimiter::Config RateLimiter::Config::with_presets() {
    Config config;
    config.operation_limits.emplace(std::string(rate_limits::kCredentialValidation),
                                    rate_limits::credential_validation());
    config.operation_limits.emplace(std::string(rate_limits::kGithubApi),
                                    rate_limits::github_api());
    config.operation_limits.emplace(std::string(rate_limits::kUpdateCheck),
                                    rate_limits::update_check());
    config.operation_limits.emplace(std::string(rate_limits::kStrict),
                                    rate_limits::strict());
    return config;
}

RateLimiter::RateLimiter(SecurityLog& log, Config config)
    : log_(log), config_(std::move(config)) {}

std::string_view RateLimiter::operation_of(std::string_view key) {
    const auto colon = key.find(':');
    return colon == std::string_view::npos ? key : key.substr(0, colon);
}

RateLimitConfig RateLimiter::limit_for(std::string_view key) const {
    std::shared_lock lock(limits_mutex_);
    const auto it = config_.operation_limits.find(std::string(operation_of(key)));
    return it != config_.operation_limits.end() ? it->second : config_.default_limit;
}

void RateLimiter::set_limit(const std::string& operation, const RateLimitConfig& limit) {
    {
        std::unique_lock lock(limits_mutex_);
        config_.operation_limits[operation] = limit;
    }
    // Existing buckets for the operation keep their old limit until rebuilt
    std::unique_lock lock(buckets_mutex_);
    std::erase_if(buckets_, [&](const auto& entry) {
        return operation_of(entry.first) == operation;
    });
}

std::shared_ptr<TokenBucket> RateLimiter::get_or_create(const std::string& key, int64_t now_ns) {
    {
        std::shared_lock lock(buckets_mutex_);
        const auto it = buckets_.find(key);
        if (it != buckets_.end()) return it->second;
    }

    const auto limit = limit_for(key);

    std::unique_lock lock(buckets_mutex_);
    // Double-check after acquiring the exclusive lock
    const auto it = buckets_.find(key);
    if (it != buckets_.end()) return it->second;

    auto bucket = std::make_shared<TokenBucket>(limit, now_ns);
    buckets_.emplace(key, bucket);
    return bucket;
}

RateLimitResult RateLimiter::check_limit(const std::string& key) {
    return check_limit_at(key, utils::steady_now_ns());
}

RateLimitResult RateLimiter::check_limit_at(const std::string& key, int64_t now_ns) {
    const uint64_t n = checks_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (config_.eviction_check_interval > 0 && n % config_.eviction_check_interval == 0) {
        evict_idle(now_ns);
    }

    auto bucket = get_or_create(key, now_ns);
    auto result = bucket->try_acquire_at(now_ns);
    result.key = key;

    if (!result.allowed) {
        log_.record(SecurityEventType::RATE_LIMIT_EXCEEDED, Severity::MEDIUM, "RateLimiter",
                    std::format("Rate limit exceeded for operation '{}'", operation_of(key)),
                    {{"key", key},
                     {"retry_after_ms", std::to_string(result.retry_after.count())}});
        utils::log::debug(std::format("Rate limit denied: {} (retry in {}ms)",
                                      key, result.retry_after.count()));
    }
    return result;
}

RateLimitResult RateLimiter::peek(const std::string& key) const {
    const int64_t now_ns = utils::steady_now_ns();
    std::shared_ptr<TokenBucket> bucket;
    {
        std::shared_lock lock(buckets_mutex_);
        const auto it = buckets_.find(key);
        if (it != buckets_.end()) bucket = it->second;
    }
    if (!bucket) {
        const auto limit = limit_for(key);
        const bool allowed = limit.capacity > 0;
        return {allowed, limit.capacity,
                allowed ? std::chrono::milliseconds(0)
                        : std::chrono::duration_cast<std::chrono::milliseconds>(limit.window),
                key};
    }
    auto result = bucket->peek_at(now_ns);
    result.key = key;
    return result;
}

void RateLimiter::reset(const std::string& key) {
    std::unique_lock lock(buckets_mutex_);
    buckets_.erase(key);
}

void RateLimiter::reset_all() {
    std::unique_lock lock(buckets_mutex_);
    buckets_.clear();
}

size_t RateLimiter::bucket_count() const {
    std::shared_lock lock(buckets_mutex_);
    return buckets_.size();
}

void RateLimiter::evict_idle(int64_t now_ns) {
    const int64_t idle_ns =
        std::chrono::duration_cast<std::chrono::nanoseconds>(config_.idle_eviction).count();

    std::unique_lock lock(buckets_mutex_);
    const size_t before = buckets_.size();
    std::erase_if(buckets_, [&](const auto& entry) {
        const auto& bucket = entry.second;
        // A bucket idle past its window is indistinguishable from a fresh one
        const int64_t window_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
            bucket->config().window).count();
        return now_ns - bucket->last_access_ns() >= std::max(idle_ns, window_ns);
    });
    if (buckets_.size() != before) {
        utils::log::debug(std::format("Rate limiter evicted {} idle buckets",
                                      before - buckets_.size()));
    }
}

} // namespace personaguard
