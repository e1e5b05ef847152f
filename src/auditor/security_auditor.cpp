#include "auditor/security_auditor.hpp"
#include "auditor/project_root.hpp"
#include "audit/security_log.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <iterator>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>
#include <tuple>

namespace personaguard {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 6> kExcludedDirectories = {
    ".git", "node_modules", "dist", "vendor", "third_party", "coverage",
};

constexpr size_t kBinaryProbeBytes = 8192;

/// Resets the phase to IDLE when a run leaves scope
class PhaseGuard {
public:
    explicit PhaseGuard(std::atomic<AuditPhase>& phase) : phase_(phase) {}
    ~PhaseGuard() { phase_.store(AuditPhase::IDLE, std::memory_order_release); }

    PhaseGuard(const PhaseGuard&) = delete;
    PhaseGuard& operator=(const PhaseGuard&) = delete;

private:
    std::atomic<AuditPhase>& phase_;
};

bool looks_binary(std::string_view content) {
    return content.substr(0, kBinaryProbeBytes).find('\0') != std::string_view::npos;
}

int severity_rank(Severity s) { return static_cast<int>(s); }

} // anonymous namespace

const char* audit_phase_to_string(AuditPhase phase) {
    switch (phase) {
        case AuditPhase::IDLE:      return "idle";
        case AuditPhase::SCANNING:  return "scanning";
        case AuditPhase::FILTERING: return "filtering";
        case AuditPhase::REPORTING: return "reporting";
    }
    return "unknown";
}

// ============================================================================
// Construction
// ============================================================================

SecurityAuditor::SecurityAuditor(SecurityLog& log, Config config, SuppressionEngine suppressions)
    : log_(log),
      config_(std::move(config)),
      suppressions_(std::move(suppressions)) {
    for (const auto& glob : config_.exclude) {
        auto compiled = GlobMatcher::compile(glob);
        if (!compiled.is_ok()) {
            utils::log::warn(std::format("Ignoring exclude glob '{}': {}",
                                         glob, compiled.error_message()));
            continue;
        }
        exclude_.push_back(std::move(compiled.value()));
    }
}

Result<std::unique_ptr<SecurityAuditor>> SecurityAuditor::create(
    SecurityLog& log, Config config, SuppressionEngine suppressions) {
    using R = Result<std::unique_ptr<SecurityAuditor>>;

    for (const auto& glob : config.exclude) {
        auto compiled = GlobMatcher::compile(glob);
        if (!compiled.is_ok()) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                std::format("audit.exclude '{}': {}", glob, compiled.error_message()));
        }
    }

    std::vector<std::unique_ptr<IScanner>> scanners;
    for (const auto& name : config.scanners) {
        auto scanner = make_scanner(name);
        if (!scanner) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                std::format("Unknown scanner '{}' (expected code, dependency or configuration)", name));
        }
        scanners.push_back(std::move(scanner));
    }

    auto auditor = std::make_unique<SecurityAuditor>(log, std::move(config), std::move(suppressions));
    for (auto& s : scanners) auditor->add_scanner(std::move(s));
    return R::ok(std::move(auditor));
}

std::unique_ptr<IScanner> SecurityAuditor::make_scanner(std::string_view name) {
    if (name == "code") return std::make_unique<CodeScanner>();
    if (name == "dependency") return std::make_unique<DependencyScanner>();
    if (name == "configuration" || name == "config") return std::make_unique<ConfigScanner>();
    return nullptr;
}

void SecurityAuditor::add_scanner(std::unique_ptr<IScanner> scanner) {
    scanners_.push_back(std::move(scanner));
}

bool SecurityAuditor::is_excluded_directory(std::string_view name) {
    if (name.starts_with("build")) return true;
    return std::ranges::find(kExcludedDirectories, name) != kExcludedDirectories.end();
}

bool SecurityAuditor::excluded_by_glob(const std::string& relative) const {
    return std::ranges::any_of(exclude_, [&](const GlobMatcher& m) { return m.matches(relative); });
}

// ============================================================================
// Run
// ============================================================================

Result<AuditReport> SecurityAuditor::run(const fs::path& target) {
    AuditPhase expected = AuditPhase::IDLE;
    if (!phase_.compare_exchange_strong(expected, AuditPhase::SCANNING,
                                        std::memory_order_acq_rel)) {
        return Result<AuditReport>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Audit already in progress (phase: {})", audit_phase_to_string(expected)));
    }
    PhaseGuard guard(phase_);

    const auto started_wall = utils::now();
    const auto started = std::chrono::steady_clock::now();

    std::error_code ec;
    const fs::path absolute_target = fs::weakly_canonical(fs::absolute(target, ec), ec);
    if (ec || !fs::exists(absolute_target)) {
        return Result<AuditReport>::error(ErrorCategory::IO_ERROR,
            std::format("Audit target not found: {}", target.string()));
    }

    fs::path root;
    if (!config_.root.empty()) {
        root = fs::weakly_canonical(fs::absolute(config_.root, ec), ec);
    } else {
        const auto start = fs::is_directory(absolute_target) ? absolute_target
                                                             : absolute_target.parent_path();
        const auto& markers = config_.root_markers.empty() ? default_root_markers()
                                                           : config_.root_markers;
        root = find_project_root(start, markers).value_or(start);
    }
    utils::log::debug(std::format("Audit root: {}", root.string()));

    AuditReport report;
    report.timestamp = utils::format_timestamp(started_wall);
    report.target = absolute_target.string();
    report.project_root = root.string();
    report.fail_on = config_.fail_on;

    auto files = collect(absolute_target, root, report.files_skipped, report.errors);
    if (!files.is_ok()) {
        return Result<AuditReport>::error(files.error_category(), files.error_message());
    }

    auto outcome = scan_all(files.value());
    report.files_scanned = outcome.scanned;
    report.errors.insert(report.errors.end(),
                         std::make_move_iterator(outcome.errors.begin()),
                         std::make_move_iterator(outcome.errors.end()));

    phase_.store(AuditPhase::FILTERING, std::memory_order_release);
    filter(std::move(outcome.findings), report);

    phase_.store(AuditPhase::REPORTING, std::memory_order_release);
    summarize(report);

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    utils::log::info(std::format(
        "Audit of {}: {} files, {} findings ({} suppressed), {}",
        report.target, report.files_scanned, report.findings.size(),
        report.suppressed.size(), report.passed ? "passed" : "FAILED"));

    return Result<AuditReport>::ok(std::move(report));
}

// ============================================================================
// Scanning
// ============================================================================

Result<std::vector<SecurityAuditor::Candidate>> SecurityAuditor::collect(
    const fs::path& target, const fs::path& root, size_t& skipped,
    std::vector<std::string>& errors) const {

    std::vector<Candidate> files;

    const auto consider = [&](const fs::path& path) {
        std::string relative = relative_to_root(path, root);
        if (excluded_by_glob(relative)) {
            ++skipped;
            return;
        }
        std::error_code size_ec;
        const auto size = fs::file_size(path, size_ec);
        if (size_ec) {
            errors.push_back(std::format("{}: {}", relative, size_ec.message()));
            return;
        }
        if (size > config_.max_file_size) {
            utils::log::debug(std::format("Skipping {} ({} bytes)", relative, size));
            ++skipped;
            return;
        }
        const bool wanted = std::ranges::any_of(scanners_, [&](const auto& s) {
            return s->wants(relative);
        });
        if (wanted) files.push_back({path, std::move(relative)});
    };

    if (fs::is_regular_file(target)) {
        consider(target);
        return Result<std::vector<Candidate>>::ok(std::move(files));
    }

    std::error_code ec;
    fs::recursive_directory_iterator it(target, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Result<std::vector<Candidate>>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot read {}: {}", target.string(), ec.message()));
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            errors.push_back(std::format("Directory walk stopped under {}: {}",
                                         target.string(), ec.message()));
            break;
        }
        const auto& entry = *it;
        if (entry.is_directory(ec)) {
            const auto name = entry.path().filename().string();
            if (is_excluded_directory(name) ||
                excluded_by_glob(relative_to_root(entry.path(), root))) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (entry.is_regular_file(ec) && !entry.is_symlink(ec)) {
            consider(entry.path());
        }
    }

    std::ranges::sort(files, {}, &Candidate::relative);
    return Result<std::vector<Candidate>>::ok(std::move(files));
}

SecurityAuditor::ScanOutcome SecurityAuditor::scan_one(const Candidate& file) const {
    ScanOutcome outcome;

    std::ifstream in(file.absolute, std::ios::binary);
    if (!in) {
        outcome.errors.push_back(std::format("{}: cannot open", file.relative));
        return outcome;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    SourceFile source;
    source.path = file.relative;
    source.kind = file_kind(file.relative);
    source.content = std::move(buffer).str();
    source.is_test = is_test_path(file.relative);

    if (looks_binary(source.content)) return outcome;
    ++outcome.scanned;

    for (const auto& scanner : scanners_) {
        if (!scanner->wants(file.relative)) continue;
        try {
            auto found = scanner->scan(source);
            outcome.findings.insert(outcome.findings.end(),
                                    std::make_move_iterator(found.begin()),
                                    std::make_move_iterator(found.end()));
        } catch (const std::exception& e) {
            outcome.errors.push_back(std::format("{}: {} scanner failed: {}",
                                                 file.relative, scanner->name(), e.what()));
        }
    }
    return outcome;
}

SecurityAuditor::ScanOutcome SecurityAuditor::scan_all(const std::vector<Candidate>& files) const {
    ScanOutcome merged;
    if (files.empty()) return merged;

    size_t workers = config_.workers != 0 ? config_.workers
                                          : std::max<size_t>(1, std::thread::hardware_concurrency());
    workers = std::min(workers, files.size());

    std::atomic<size_t> next{0};
    std::mutex merge_mutex;

    const auto worker = [&]() {
        ScanOutcome local;
        for (size_t i = next.fetch_add(1, std::memory_order_relaxed); i < files.size();
             i = next.fetch_add(1, std::memory_order_relaxed)) {
            auto one = scan_one(files[i]);
            local.scanned += one.scanned;
            std::ranges::move(one.findings, std::back_inserter(local.findings));
            std::ranges::move(one.errors, std::back_inserter(local.errors));
        }
        std::lock_guard lock(merge_mutex);
        merged.scanned += local.scanned;
        std::ranges::move(local.findings, std::back_inserter(merged.findings));
        std::ranges::move(local.errors, std::back_inserter(merged.errors));
    };

    std::vector<std::thread> pool;
    pool.reserve(workers - 1);
    for (size_t i = 1; i < workers; ++i) pool.emplace_back(worker);
    worker();
    for (auto& t : pool) t.join();

    std::ranges::sort(merged.errors);
    return merged;
}

// ============================================================================
// Filtering / Reporting
// ============================================================================

void SecurityAuditor::filter(std::vector<Finding> raw, AuditReport& report) const {
    // Stable order before dedup so the surviving duplicate is deterministic
    std::ranges::sort(raw, [](const Finding& a, const Finding& b) {
        return std::tie(a.file, a.line, a.rule_id, a.column) <
               std::tie(b.file, b.line, b.rule_id, b.column);
    });

    std::set<std::tuple<std::string, std::string, uint32_t>> seen;
    for (auto& finding : raw) {
        if (!seen.emplace(finding.rule_id, finding.file, finding.line).second) continue;

        if (const auto* suppression = suppressions_.match(finding)) {
            report.suppressed.push_back({std::move(finding), *suppression});
        } else {
            report.findings.push_back(std::move(finding));
        }
    }

    std::ranges::stable_sort(report.findings, [](const Finding& a, const Finding& b) {
        return severity_rank(a.severity) > severity_rank(b.severity);
    });
}

void SecurityAuditor::summarize(AuditReport& report) const {
    auto& summary = report.summary;
    summary.total = report.findings.size();
    for (const auto& f : report.findings) {
        ++summary.by_severity[static_cast<size_t>(f.severity)];
        ++summary.by_category[f.category];
    }

    report.passed = report.failing_count() == 0;

    for (const auto& f : report.findings) {
        log_.record(SecurityEventType::AUDIT_FINDING, f.severity, "SecurityAuditor",
                    std::format("{} {} at {}:{}", f.rule_id, f.rule_name, f.file, f.line),
                    {{"rule", f.rule_id}, {"file", f.file}, {"line", std::to_string(f.line)},
                     {"blocking", at_least(f.severity, report.fail_on) ? "true" : "false"}});
    }
    for (const auto& [f, suppression] : report.suppressed) {
        log_.record(SecurityEventType::AUDIT_FINDING, f.severity, "SecurityAuditor",
                    std::format("{} {} at {}:{} (suppressed)", f.rule_id, f.rule_name, f.file, f.line),
                    {{"rule", f.rule_id}, {"file", f.file}, {"line", std::to_string(f.line)},
                     {"blocking", "false"},
                     {"suppressed_by", std::format("{} {}", suppression.rule, suppression.file)},
                     {"reason", suppression.reason}});
    }
}

} // namespace personaguard
