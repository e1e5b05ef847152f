#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace re2 { class RE2; }

namespace personaguard {

/// Backslash-escape every regex metacharacter in text
[[nodiscard]] std::string escape_regex(std::string_view text);

/// @brief Convert a path glob to an anchored RE2 pattern
///
/// The glob is escaped first, then the escaped wildcard tokens are
/// re-expanded:
///   "**" + "/"  ->  (?:.*/)?     zero or more directories
///   "**"        ->  .*
///   "*"         ->  [^/]*
///   "?"         ->  [^/]
/// Every other character matches literally.
[[nodiscard]] std::string glob_to_regex(std::string_view glob);

/**
 * @brief Compiled glob over '/'-separated relative paths
 *
 * Compilation refuses patterns the complexity analyzer rates HIGH risk.
 */
class GlobMatcher {
public:
    [[nodiscard]] static Result<GlobMatcher> compile(std::string glob);

    GlobMatcher(GlobMatcher&&) noexcept;
    GlobMatcher& operator=(GlobMatcher&&) noexcept;
    ~GlobMatcher();

    [[nodiscard]] bool matches(std::string_view path) const;

    [[nodiscard]] const std::string& glob() const { return glob_; }
    [[nodiscard]] const std::string& regex() const { return regex_; }
    [[nodiscard]] const ComplexityProfile& profile() const { return profile_; }

    /// No wildcard characters at all
    [[nodiscard]] bool is_literal() const { return wildcards_ == 0; }
    [[nodiscard]] size_t wildcard_count() const { return wildcards_; }
    [[nodiscard]] size_t literal_length() const { return glob_.size() - wildcards_; }

private:
    GlobMatcher(std::string glob, std::string regex, ComplexityProfile profile,
                std::unique_ptr<re2::RE2> matcher);

    std::string glob_;
    std::string regex_;
    ComplexityProfile profile_;
    std::unique_ptr<re2::RE2> matcher_;
    size_t wildcards_ = 0;
};

} // namespace personaguard
