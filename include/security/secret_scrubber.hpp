#pragma once

#include <string>
#include <string_view>

namespace personaguard {

inline constexpr std::string_view kRedactedMarker = "[REDACTED]";

/**
 * @brief Replace every credential-shaped substring with [REDACTED]
 *
 * Covers GitHub token kinds (ghp_/gho_/ghu_/ghs_/ghr_, github_pat_),
 * "Bearer <value>", "token <value>" authorization forms and
 * GITHUB_TOKEN=<value> assignments. Applied to any text that may
 * carry remote error bodies or caller-supplied details.
 */
[[nodiscard]] std::string redact_secrets(std::string_view text);

/// True if text contains anything redact_secrets would replace
[[nodiscard]] bool contains_secret(std::string_view text);

} // namespace personaguard
