#include "auditor/project_root.hpp"

#include <system_error>

namespace personaguard {

namespace fs = std::filesystem;

const std::vector<std::string>& default_root_markers() {
    static const std::vector<std::string> markers = {
        ".git", ".persona-audit.toml", "package.json", "CMakeLists.txt",
    };
    return markers;
}

std::optional<fs::path> find_project_root(const fs::path& start,
                                          const std::vector<std::string>& markers) {
    std::error_code ec;
    fs::path dir = fs::weakly_canonical(fs::absolute(start, ec), ec);
    if (ec) return std::nullopt;

    if (!fs::is_directory(dir, ec)) dir = dir.parent_path();

    while (true) {
        for (const auto& marker : markers) {
            if (fs::exists(dir / marker, ec)) {
                return dir;
            }
        }
        const auto parent = dir.parent_path();
        if (parent.empty() || parent == dir) break;
        dir = parent;
    }
    return std::nullopt;
}

std::string relative_to_root(const fs::path& file, const fs::path& root) {
    std::error_code ec;
    const auto abs_file = fs::weakly_canonical(fs::absolute(file, ec), ec);
    const auto abs_root = fs::weakly_canonical(fs::absolute(root, ec), ec);

    const auto rel = abs_file.lexically_relative(abs_root);
    if (rel.empty() || *rel.begin() == "..") {
        return abs_file.generic_string();
    }
    return rel.generic_string();
}

} // namespace personaguard
