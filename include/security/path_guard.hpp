#pragma once

#include "core/error.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace personaguard {

class SecurityLog;

/**
 * @brief Confines filesystem access to an allow-listed root
 *
 * resolve() rejects empty input, null bytes and ".." segments, resolves
 * symlinks in the existing prefix, and requires the result to sit strictly
 * below the canonical root (component-wise, so "/data/personas2" is not
 * inside "/data/personas"). Persona storage reads and writes go through
 * read_file()/write_file_atomic(), which add extension and size checks.
 */
class PathGuard {
public:
    struct Config {
        std::vector<std::string> allowed_extensions = {".md", ".markdown", ".txt", ".yml", ".yaml"};
        size_t max_file_size = 500 * 1024;
    };

    explicit PathGuard(SecurityLog& log) : PathGuard(log, Config{}) {}
    PathGuard(SecurityLog& log, Config config);

    [[nodiscard]] Result<std::filesystem::path> resolve(std::string_view candidate,
                                                        const std::filesystem::path& root) const;

    [[nodiscard]] Result<std::string> read_file(std::string_view candidate,
                                                const std::filesystem::path& root) const;

    /// Writes to a temp file in the target directory, then renames over the target
    [[nodiscard]] Result<std::filesystem::path> write_file_atomic(
        std::string_view candidate, const std::filesystem::path& root,
        std::string_view content) const;

    /// True if path is strictly below root (both already canonical)
    [[nodiscard]] static bool is_within(const std::filesystem::path& path,
                                        const std::filesystem::path& root);

private:
    Result<std::filesystem::path> violation(std::string reason,
                                            const std::filesystem::path& root) const;
    Result<void> check_extension(const std::filesystem::path& path) const;

    SecurityLog& log_;
    Config config_;
};

} // namespace personaguard
