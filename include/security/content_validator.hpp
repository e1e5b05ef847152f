#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "security/pattern_library.hpp"
#include "security/unicode_normalizer.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace personaguard {

class SecurityLog;

/**
 * @brief Outcome of validating one piece of text
 *
 * severity is the maximum over every matched pattern and Unicode issue.
 * When accepted, sanitized holds the normalized text with every
 * sub-threshold match stripped; when rejected it is empty.
 */
struct Verdict {
    Severity severity = Severity::NONE;
    std::vector<std::string> matched_patterns;
    std::string sanitized;
    bool accepted = true;
    std::string context;

    [[nodiscard]] bool rejected() const { return !accepted; }
    [[nodiscard]] bool modified() const { return !matched_patterns.empty(); }
};

/**
 * @brief Classifies and sanitizes untrusted text
 *
 * Pipeline: context length limit -> UnicodeNormalizer -> every applicable
 * library pattern (bounded by its complexity ceiling) -> verdict. Matches
 * below reject_threshold are stripped and the result is re-normalized and
 * re-scanned until it is stable, so sanitize() is idempotent. A match at or
 * above the threshold, including one exposed by stripping, rejects.
 *
 * Thread-safe: only reads the shared immutable library.
 */
class ContentValidator {
public:
    struct Config {
        Severity reject_threshold = Severity::HIGH;
        size_t default_max_length = 100'000;
        std::unordered_map<std::string, size_t> context_limits = {
            {"persona-body", 100'000},
            {"metadata-field", 2'000},
            {"display-field", 1'000},
            {"search-query", 200},
        };
        size_t max_sanitize_passes = 16;
    };

    ContentValidator(std::shared_ptr<const PatternLibrary> library, SecurityLog& log)
        : ContentValidator(std::move(library), log, Config{}) {}
    ContentValidator(std::shared_ptr<const PatternLibrary> library, SecurityLog& log,
                     Config config);

    [[nodiscard]] Verdict validate(std::string_view text, std::string_view context) const;

    /// Sanitized text, or empty when the content is rejected
    [[nodiscard]] std::string sanitize(std::string_view text, std::string_view context) const;

    /// Sanitized text, or VALIDATION_REJECTED without echoing the payload
    [[nodiscard]] Result<std::string> require_safe(std::string_view text,
                                                   std::string_view context) const;

    [[nodiscard]] size_t max_length_for(std::string_view context) const;
    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] const PatternLibrary& library() const { return *library_; }

private:
    struct ScanResult {
        Severity severity = Severity::NONE;
        std::vector<std::string> ids;
        std::vector<MatchSpan> strip_spans;
    };

    ScanResult scan(std::string_view text, std::string_view context) const;
    void log_verdict(const Verdict& verdict, size_t input_length) const;

    std::shared_ptr<const PatternLibrary> library_;
    SecurityLog& log_;
    Config config_;
};

} // namespace personaguard
