#pragma once

#include "auditor/finding.hpp"
#include "auditor/glob_matcher.hpp"
#include "auditor/scanner.hpp"
#include "auditor/suppression_engine.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace personaguard {

class SecurityLog;

enum class AuditPhase : uint8_t {
    IDLE,
    SCANNING,
    FILTERING,
    REPORTING
};

[[nodiscard]] const char* audit_phase_to_string(AuditPhase phase);

/**
 * @brief Static security audit over a directory tree
 *
 * One run: IDLE -> SCANNING -> FILTERING -> REPORTING -> IDLE.
 *
 * SCANNING walks the target, skips excluded directories and oversized
 * files, and fans the remaining files out to a worker pool; each file is
 * read once and offered to every scanner that wants it. FILTERING and
 * REPORTING run on the calling thread: findings are deduplicated per
 * (rule, file, line), matched against the suppression list, sorted and
 * summarized.
 *
 * A second run() while one is in progress is refused, not queued.
 */
class SecurityAuditor {
public:
    struct Config {
        std::string root;                            // Explicit project root; empty = detect
        std::vector<std::string> root_markers;       // Empty = default_root_markers()
        std::vector<std::string> exclude;            // Extra globs relative to the root
        std::vector<std::string> scanners = {"code", "dependency", "configuration"};
        size_t max_file_size = 1024 * 1024;
        size_t workers = 0;                          // 0 = hardware concurrency
        Severity fail_on = Severity::CRITICAL;
    };

    SecurityAuditor(SecurityLog& log, Config config, SuppressionEngine suppressions = {});

    /// Builtin scanners named in config.scanners; unknown names are a CONFIG_ERROR
    [[nodiscard]] static Result<std::unique_ptr<SecurityAuditor>> create(
        SecurityLog& log, Config config, SuppressionEngine suppressions = {});

    void add_scanner(std::unique_ptr<IScanner> scanner);

    [[nodiscard]] Result<AuditReport> run(const std::filesystem::path& target);

    [[nodiscard]] AuditPhase phase() const { return phase_.load(std::memory_order_acquire); }
    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] const std::vector<std::unique_ptr<IScanner>>& scanners() const { return scanners_; }

    /// Directory names skipped during the walk ("build*" matches any build prefix)
    [[nodiscard]] static bool is_excluded_directory(std::string_view name);

    [[nodiscard]] static std::unique_ptr<IScanner> make_scanner(std::string_view name);

private:
    struct Candidate {
        std::filesystem::path absolute;
        std::string relative;
    };

    struct ScanOutcome {
        std::vector<Finding> findings;
        std::vector<std::string> errors;
        size_t scanned = 0;
    };

    Result<std::vector<Candidate>> collect(const std::filesystem::path& target,
                                           const std::filesystem::path& root,
                                           size_t& skipped,
                                           std::vector<std::string>& errors) const;

    ScanOutcome scan_all(const std::vector<Candidate>& files) const;
    ScanOutcome scan_one(const Candidate& file) const;

    void filter(std::vector<Finding> raw, AuditReport& report) const;
    void summarize(AuditReport& report) const;

    bool excluded_by_glob(const std::string& relative) const;

    SecurityLog& log_;
    Config config_;
    SuppressionEngine suppressions_;
    std::vector<GlobMatcher> exclude_;
    std::vector<std::unique_ptr<IScanner>> scanners_;
    std::atomic<AuditPhase> phase_{AuditPhase::IDLE};
};

} // namespace personaguard
