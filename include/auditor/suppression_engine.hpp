#pragma once

#include "auditor/finding.hpp"
#include "auditor/glob_matcher.hpp"
#include "core/error.hpp"
#include <string_view>
#include <vector>

namespace personaguard {

/**
 * @brief Matches findings against the configured suppression list
 *
 * Loaded once; read-only afterwards. An entry without a reason fails
 * creation. When several entries match, the most specific wins: an exact
 * rule id beats "*", then a literal path beats a glob, then the longer
 * literal part, then fewer wildcards, then the earlier entry.
 */
class SuppressionEngine {
public:
    SuppressionEngine() = default;

    [[nodiscard]] static Result<SuppressionEngine> create(std::vector<Suppression> suppressions);

    /// The winning suppression, or nullptr when the finding stands
    [[nodiscard]] const Suppression* match(const Finding& finding) const;

    [[nodiscard]] const Suppression* match(std::string_view rule_id, std::string_view file) const;

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    struct Entry {
        Suppression suppression;
        GlobMatcher matcher;
        size_t order;
    };

    std::vector<Entry> entries_;
};

} // namespace personaguard
