#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace personaguard {

/// Files or directories whose presence marks a project root
[[nodiscard]] const std::vector<std::string>& default_root_markers();

/**
 * @brief Nearest ancestor of start (inclusive) holding any marker
 *
 * Best-effort: in a nested checkout the innermost marked directory wins.
 * An explicit root from the command line or config should be preferred.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_root(
    const std::filesystem::path& start,
    const std::vector<std::string>& markers = default_root_markers());

/**
 * @brief Path of file relative to root with '/' separators
 *
 * Files outside root keep their normalized absolute form.
 */
[[nodiscard]] std::string relative_to_root(const std::filesystem::path& file,
                                           const std::filesystem::path& root);

} // namespace personaguard
