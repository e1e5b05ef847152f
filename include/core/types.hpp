#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace personaguard {

// ============================================================================
// Severity (shared by validation verdicts, security events and audit findings)
// ============================================================================

enum class Severity : uint8_t {
    NONE,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

[[nodiscard]] inline constexpr const char* severity_to_string(Severity s) {
    switch (s) {
        case Severity::NONE:     return "none";
        case Severity::LOW:      return "low";
        case Severity::MEDIUM:   return "medium";
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<Severity> parse_severity(std::string_view s) {
    if (s == "none")     return Severity::NONE;
    if (s == "low")      return Severity::LOW;
    if (s == "medium")   return Severity::MEDIUM;
    if (s == "high")     return Severity::HIGH;
    if (s == "critical") return Severity::CRITICAL;
    return std::nullopt;
}

[[nodiscard]] inline constexpr Severity max_severity(Severity a, Severity b) {
    return std::to_underlying(a) >= std::to_underlying(b) ? a : b;
}

[[nodiscard]] inline constexpr bool at_least(Severity value, Severity threshold) {
    return std::to_underlying(value) >= std::to_underlying(threshold);
}

// ============================================================================
// Pattern Library Types
// ============================================================================

enum class PatternCategory : uint8_t {
    INJECTION,
    EXFILTRATION,
    EXEC,
    PATH,
    YAML,
    UNICODE
};

[[nodiscard]] inline constexpr const char* pattern_category_to_string(PatternCategory c) {
    switch (c) {
        case PatternCategory::INJECTION:    return "injection";
        case PatternCategory::EXFILTRATION: return "exfiltration";
        case PatternCategory::EXEC:         return "exec";
        case PatternCategory::PATH:         return "path";
        case PatternCategory::YAML:         return "yaml";
        case PatternCategory::UNICODE:      return "unicode";
    }
    return "unknown";
}

// ============================================================================
// Regex Complexity
// ============================================================================

enum class RiskLevel : uint8_t {
    LOW,
    MEDIUM,
    HIGH
};

[[nodiscard]] inline constexpr const char* risk_level_to_string(RiskLevel r) {
    switch (r) {
        case RiskLevel::LOW:    return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::HIGH:   return "high";
    }
    return "unknown";
}

struct ComplexityProfile {
    RiskLevel risk = RiskLevel::LOW;
    size_t max_content_length = 100'000;
    size_t quantifier_count = 0;
    std::string hazard;             // First hazard class found, empty when none
};

// ============================================================================
// Rate Limiting
// ============================================================================

struct RateLimitResult {
    bool allowed;
    uint32_t tokens_remaining;
    std::chrono::milliseconds retry_after;
    std::string key;

    RateLimitResult() : allowed(false), tokens_remaining(0), retry_after(0) {}

    RateLimitResult(bool a, uint32_t tr, std::chrono::milliseconds ra, std::string k)
        : allowed(a), tokens_remaining(tr), retry_after(ra), key(std::move(k)) {}
};

} // namespace personaguard
