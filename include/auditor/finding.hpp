#pragma once

#include "core/types.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace personaguard {

enum class Confidence : uint8_t {
    LOW,
    MEDIUM,
    HIGH
};

inline const char* confidence_to_string(Confidence c) {
    switch (c) {
        case Confidence::LOW:    return "low";
        case Confidence::MEDIUM: return "medium";
        case Confidence::HIGH:   return "high";
    }
    return "unknown";
}

/**
 * @brief One static-audit result
 *
 * file is relative to the project root with '/' separators. Unique per
 * (rule_id, file, line) within a run.
 */
struct Finding {
    std::string rule_id;
    std::string rule_name;
    Severity severity = Severity::LOW;
    std::string category;        // "code", "dependency", "configuration"
    std::string reference;       // CWE / OWASP identifier or guideline
    std::string file;
    uint32_t line = 0;           // 1-based; 0 for whole-file findings
    uint32_t column = 0;
    std::string snippet;         // At most 100 bytes
    std::string message;
    std::string remediation;
    Confidence confidence = Confidence::MEDIUM;
};

/**
 * @brief Authorized exclusion of a rule/file combination
 *
 * rule is an id or "*"; file is a glob relative to the project root.
 */
struct Suppression {
    std::string rule;
    std::string file;
    std::string reason;
};

struct SuppressedFinding {
    Finding finding;
    Suppression suppression;
};

struct AuditSummary {
    size_t total = 0;
    std::array<size_t, 5> by_severity{};            // Indexed by Severity
    std::map<std::string, size_t> by_category;

    [[nodiscard]] size_t count(Severity s) const {
        return by_severity[static_cast<size_t>(s)];
    }
};

/**
 * @brief Result of one audit run; immutable once returned
 *
 * Reporters render it without re-running scans.
 */
struct AuditReport {
    std::string timestamp;
    std::chrono::milliseconds duration{0};
    std::string target;
    std::string project_root;
    size_t files_scanned = 0;
    size_t files_skipped = 0;
    std::vector<Finding> findings;              // Unsuppressed, sorted
    std::vector<SuppressedFinding> suppressed;
    std::vector<std::string> errors;            // Unreadable files, scanner failures
    AuditSummary summary;
    Severity fail_on = Severity::CRITICAL;
    bool passed = true;

    /// Unsuppressed findings at or above fail_on
    [[nodiscard]] size_t failing_count() const {
        size_t n = 0;
        for (const auto& f : findings) {
            if (at_least(f.severity, fail_on)) ++n;
        }
        return n;
    }
};

} // namespace personaguard
