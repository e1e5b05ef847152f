#include "security/path_guard.hpp"
#include "audit/security_log.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>

namespace personaguard {

namespace fs = std::filesystem;

namespace {

fs::path strip_trailing_separator(fs::path p) {
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

} // namespace

PathGuard::PathGuard(SecurityLog& log, Config config)
    : log_(log),
      config_(std::move(config)) {}

bool PathGuard::is_within(const fs::path& path, const fs::path& root) {
    auto components = [](const fs::path& p) {
        std::vector<fs::path> parts;
        for (const auto& part : p) {
            if (!part.empty()) parts.push_back(part);
        }
        return parts;
    };
    const auto p_parts = components(path);
    const auto r_parts = components(root);

    // Strictly below: root is a proper component prefix
    if (p_parts.size() <= r_parts.size()) return false;
    return std::equal(r_parts.begin(), r_parts.end(), p_parts.begin());
}

Result<fs::path> PathGuard::violation(std::string reason, const fs::path& root) const {
    log_.record(SecurityEventType::PATH_VIOLATION, Severity::HIGH, "PathGuard",
                reason, {{"root", root.string()}});
    return Result<fs::path>::error(ErrorCategory::PATH_VIOLATION, std::move(reason));
}

Result<fs::path> PathGuard::resolve(std::string_view candidate, const fs::path& root) const {
    if (candidate.empty()) {
        return violation("Empty path", root);
    }
    if (candidate.find('\0') != std::string_view::npos) {
        return violation("Path contains a null byte", root);
    }
    if (root.empty() || !root.is_absolute()) {
        return violation("Root must be an absolute path", root);
    }

    const fs::path requested{std::string(candidate)};
    for (const auto& part : requested) {
        if (part == "..") {
            return violation("Path contains a parent-directory segment", root);
        }
    }

    std::error_code ec;
    const fs::path canonical_root = strip_trailing_separator(fs::weakly_canonical(root, ec));
    if (ec) {
        return Result<fs::path>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot resolve root: {}", ec.message()));
    }

    const fs::path joined = requested.is_absolute() ? requested : canonical_root / requested;
    const fs::path resolved = strip_trailing_separator(fs::weakly_canonical(joined, ec));
    if (ec) {
        return Result<fs::path>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot resolve path: {}", ec.message()));
    }

    if (!is_within(resolved, canonical_root)) {
        return violation("Path resolves outside the allowed root", root);
    }
    return Result<fs::path>::ok(resolved);
}

Result<void> PathGuard::check_extension(const fs::path& path) const {
    if (config_.allowed_extensions.empty()) return Result<void>::ok();

    const auto ext = utils::to_lower(path.extension().string());
    if (std::ranges::find(config_.allowed_extensions, ext) == config_.allowed_extensions.end()) {
        log_.record(SecurityEventType::PATH_VIOLATION, Severity::MEDIUM, "PathGuard",
                    "File extension not allowed", {{"extension", ext}});
        return Result<void>::error(ErrorCategory::PATH_VIOLATION,
            std::format("File extension '{}' is not allowed", ext));
    }
    return Result<void>::ok();
}

Result<std::string> PathGuard::read_file(std::string_view candidate, const fs::path& root) const {
    using R = Result<std::string>;

    auto resolved = resolve(candidate, root);
    if (resolved.is_error()) return R::error(resolved.error_category(), resolved.error_message());
    const auto& path = resolved.value();

    if (auto r = check_extension(path); r.is_error()) {
        return R::error(r.error_category(), r.error_message());
    }

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return R::error(ErrorCategory::IO_ERROR, "Not a regular file");
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return R::error(ErrorCategory::IO_ERROR, "Cannot stat file: " + ec.message());
    }
    if (size > config_.max_file_size) {
        return R::error(ErrorCategory::VALIDATION_REJECTED,
            std::format("File exceeds {} bytes", config_.max_file_size));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return R::error(ErrorCategory::IO_ERROR, "Cannot open file for reading");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return R::ok(buffer.str());
}

Result<fs::path> PathGuard::write_file_atomic(std::string_view candidate, const fs::path& root,
                                              std::string_view content) const {
    using R = Result<fs::path>;

    auto resolved = resolve(candidate, root);
    if (resolved.is_error()) return resolved;
    const fs::path target = resolved.value();

    if (auto r = check_extension(target); r.is_error()) {
        return R::error(r.error_category(), r.error_message());
    }
    if (content.size() > config_.max_file_size) {
        return R::error(ErrorCategory::VALIDATION_REJECTED,
            std::format("Content exceeds {} bytes", config_.max_file_size));
    }

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return R::error(ErrorCategory::IO_ERROR, "Cannot create directory: " + ec.message());
    }

    const fs::path temp = target.parent_path() /
        std::format(".{}.tmp-{}", target.filename().string(), utils::generate_uuid().substr(0, 8));
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return R::error(ErrorCategory::IO_ERROR, "Cannot open temporary file");
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(temp, ec);
            return R::error(ErrorCategory::IO_ERROR, "Write to temporary file failed");
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp, cleanup_ec);
        return R::error(ErrorCategory::IO_ERROR, "Atomic rename failed: " + ec.message());
    }
    return R::ok(target);
}

} // namespace personaguard
