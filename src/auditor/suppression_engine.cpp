#include "auditor/suppression_engine.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <format>
#include <tuple>

namespace personaguard {

Result<SuppressionEngine> SuppressionEngine::create(std::vector<Suppression> suppressions) {
    SuppressionEngine engine;
    engine.entries_.reserve(suppressions.size());

    for (size_t i = 0; i < suppressions.size(); ++i) {
        auto& s = suppressions[i];
        s.rule = utils::trim(s.rule);
        s.file = utils::trim(s.file);
        s.reason = utils::trim(s.reason);

        if (s.rule.empty()) {
            return Result<SuppressionEngine>::error(ErrorCategory::CONFIG_ERROR,
                std::format("suppressions[{}]: rule must not be empty (use \"*\" for all rules)", i));
        }
        if (s.file.empty()) {
            return Result<SuppressionEngine>::error(ErrorCategory::CONFIG_ERROR,
                std::format("suppressions[{}] ({}): file pattern must not be empty", i, s.rule));
        }
        if (s.reason.empty()) {
            return Result<SuppressionEngine>::error(ErrorCategory::CONFIG_ERROR,
                std::format("suppressions[{}] ({} / {}): reason is required", i, s.rule, s.file));
        }

        auto matcher = GlobMatcher::compile(s.file);
        if (!matcher.is_ok()) {
            return Result<SuppressionEngine>::error(ErrorCategory::CONFIG_ERROR,
                std::format("suppressions[{}]: {}", i, matcher.error_message()));
        }
        engine.entries_.push_back(Entry{std::move(s), std::move(matcher.value()), i});
    }

    return Result<SuppressionEngine>::ok(std::move(engine));
}

const Suppression* SuppressionEngine::match(const Finding& finding) const {
    return match(finding.rule_id, finding.file);
}

const Suppression* SuppressionEngine::match(std::string_view rule_id, std::string_view file) const {
    const Entry* best = nullptr;
    auto best_key = std::make_tuple(false, false, size_t{0}, size_t{0}, size_t{0});

    for (const auto& entry : entries_) {
        const bool exact_rule = entry.suppression.rule == rule_id;
        if (!exact_rule && entry.suppression.rule != "*") continue;
        if (!entry.matcher.matches(file)) continue;

        // Larger tuple is more specific; inverted counters keep "fewer is better"
        const auto key = std::make_tuple(
            exact_rule,
            entry.matcher.is_literal(),
            entry.matcher.literal_length(),
            SIZE_MAX - entry.matcher.wildcard_count(),
            SIZE_MAX - entry.order);

        if (!best || key > best_key) {
            best = &entry;
            best_key = key;
        }
    }
    return best ? &best->suppression : nullptr;
}

} // namespace personaguard
