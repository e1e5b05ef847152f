#pragma once

#include "core/types.hpp"
#include <string_view>

namespace personaguard {

/**
 * @brief Static backtracking-risk classifier for regular expressions
 *
 * Hazard classes (any one makes the pattern HIGH risk):
 * - nested_quantifier:        repeated group containing a repeat, (a+)+
 * - overlapping_alternation:  repeated group with duplicate/prefix branches, (a|a)*
 * - quantified_alternation:   repeated group with alternation, (a|b)+
 * - quantified_lookaround:    lookaround containing or carrying a repeat
 *
 * Without a hazard, more than kQuantifierThreshold quantifiers is MEDIUM,
 * otherwise LOW. Each risk tier maps to a content-length ceiling.
 *
 * Patterns run on RE2 (linear time), so the ceiling is an input-size bound
 * layered on top of the engine guarantee.
 */
class RegexComplexityAnalyzer {
public:
    static constexpr size_t kQuantifierThreshold = 5;

    static constexpr size_t kLowRiskMaxLength = 100'000;
    static constexpr size_t kMediumRiskMaxLength = 10'000;
    static constexpr size_t kHighRiskMaxLength = 1'000;

    [[nodiscard]] static ComplexityProfile analyze(std::string_view pattern);

    [[nodiscard]] static constexpr size_t max_length_for(RiskLevel risk) {
        switch (risk) {
            case RiskLevel::LOW:    return kLowRiskMaxLength;
            case RiskLevel::MEDIUM: return kMediumRiskMaxLength;
            case RiskLevel::HIGH:   return kHighRiskMaxLength;
        }
        return kHighRiskMaxLength;
    }
};

} // namespace personaguard
