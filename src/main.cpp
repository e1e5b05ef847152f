#include "audit/event_persister.hpp"
#include "audit/jsonl_file_sink.hpp"
#include "audit/security_log.hpp"
#include "auditor/reporter.hpp"
#include "auditor/security_auditor.hpp"
#include "auditor/suppression_engine.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdio>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using namespace personaguard;

namespace {

constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string target;
    std::optional<std::string> suppressions;
    std::string format = "console";
    std::optional<std::string> output;
    std::optional<std::string> config;
    std::optional<std::string> root;
    std::optional<std::string> fail_on;
    bool verbose = false;
    bool help = false;
};

void print_usage() {
    std::fputs(
        "Usage: persona-audit <target> [options]\n"
        "\n"
        "Options:\n"
        "  --suppressions=FILE   TOML file with [[suppressions]] rule/file/reason entries\n"
        "  --format=FORMAT       console (default), json or sarif\n"
        "  --output=FILE         Write the report to FILE instead of stdout\n"
        "  --config=FILE         persona-guard.toml with an [audit] section\n"
        "  --root=DIR            Project root for relative paths (default: auto-detect)\n"
        "  --fail-on=LEVEL       Gate severity: low, medium, high or critical (default)\n"
        "  --verbose             Debug logging\n"
        "\n"
        "Exit status: 0 passed, 1 findings at or above the gate, 2 usage or config error.\n",
        stderr);
}

/// "--name=value" or "--name value"; advances i when the value is separate
std::optional<std::string> flag_value(std::string_view arg, std::string_view name,
                                      int& i, int argc, char* argv[]) {
    if (!arg.starts_with(name)) return std::nullopt;
    const auto rest = arg.substr(name.size());
    if (rest.starts_with("=")) return std::string(rest.substr(1));
    if (rest.empty() && i + 1 < argc) return std::string(argv[++i]);
    return std::nullopt;
}

Result<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") { opts.help = true; continue; }
        if (arg == "--verbose" || arg == "-v") { opts.verbose = true; continue; }

        if (auto v = flag_value(arg, "--suppressions", i, argc, argv)) { opts.suppressions = *v; continue; }
        if (auto v = flag_value(arg, "--format", i, argc, argv)) { opts.format = *v; continue; }
        if (auto v = flag_value(arg, "--output", i, argc, argv)) { opts.output = *v; continue; }
        if (auto v = flag_value(arg, "--config", i, argc, argv)) { opts.config = *v; continue; }
        if (auto v = flag_value(arg, "--root", i, argc, argv)) { opts.root = *v; continue; }
        if (auto v = flag_value(arg, "--fail-on", i, argc, argv)) { opts.fail_on = *v; continue; }

        if (arg.starts_with("-")) {
            return Result<CliOptions>::error(ErrorCategory::CONFIG_ERROR,
                                             std::format("Unknown option: {}", arg));
        }
        if (!opts.target.empty()) {
            return Result<CliOptions>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Only one target is accepted (got '{}' and '{}')", opts.target, arg));
        }
        opts.target = std::string(arg);
    }

    if (!opts.help && opts.target.empty()) {
        return Result<CliOptions>::error(ErrorCategory::CONFIG_ERROR, "Missing target directory");
    }
    if (opts.format != "console" && opts.format != "json" && opts.format != "sarif") {
        return Result<CliOptions>::error(ErrorCategory::CONFIG_ERROR,
            std::format("--format must be console, json or sarif, got '{}'", opts.format));
    }
    return Result<CliOptions>::ok(std::move(opts));
}

std::unique_ptr<SecurityLog> make_security_log(const SecurityLogConfig& cfg) {
    std::unique_ptr<EventPersister> persister;
    if (!cfg.persist_file.empty()) {
        JsonlFileSink::Config sink_cfg;
        sink_cfg.path = cfg.persist_file;
        persister = std::make_unique<EventPersister>(std::make_unique<JsonlFileSink>(sink_cfg));
    }
    return std::make_unique<SecurityLog>(SecurityLog::Config{cfg.capacity}, std::move(persister));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        auto parsed = parse_args(argc, argv);
        if (!parsed.is_ok()) {
            utils::log::error(parsed.error_message());
            print_usage();
            return kExitUsage;
        }
        const auto& opts = parsed.value();
        if (opts.help) {
            print_usage();
            return kExitPassed;
        }

        // [1/4] Configuration
        PlatformConfig config;
        if (opts.config) {
            utils::log::debug(std::format("[1/4] Loading configuration from {}", *opts.config));
            auto loaded = ConfigLoader::load_from_file(*opts.config);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return kExitUsage;
            }
            config = std::move(loaded.config);
        }
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        if (opts.verbose) utils::log::set_level(utils::log::Level::DEBUG);

        SecurityAuditor::Config audit_cfg;
        audit_cfg.fail_on = config.audit.fail_on;
        audit_cfg.root = config.audit.root;
        audit_cfg.root_markers = config.audit.root_markers;
        audit_cfg.exclude = config.audit.exclude;
        audit_cfg.scanners = config.audit.scanners;
        audit_cfg.max_file_size = config.audit.max_file_size;
        audit_cfg.workers = config.audit.workers;

        if (opts.root) audit_cfg.root = *opts.root;
        if (opts.fail_on) {
            const auto gate = parse_severity(utils::to_lower(*opts.fail_on));
            if (!gate || *gate == Severity::NONE) {
                utils::log::error(std::format(
                    "--fail-on must be low, medium, high or critical, got '{}'", *opts.fail_on));
                return kExitUsage;
            }
            audit_cfg.fail_on = *gate;
        }

        // [2/4] Suppressions
        std::vector<Suppression> suppressions = config.audit.suppressions;
        if (opts.suppressions) {
            auto loaded = ConfigLoader::load_suppressions_file(*opts.suppressions);
            if (!loaded.is_ok()) {
                utils::log::error(loaded.error_message());
                return kExitUsage;
            }
            suppressions.insert(suppressions.end(), loaded.value().begin(), loaded.value().end());
        }
        auto engine = SuppressionEngine::create(std::move(suppressions));
        if (!engine.is_ok()) {
            utils::log::error(engine.error_message());
            return kExitUsage;
        }
        utils::log::debug(std::format("[2/4] {} suppressions loaded", engine.value().size()));

        // [3/4] Scan
        auto security_log = make_security_log(config.security_log);
        auto auditor = SecurityAuditor::create(*security_log, std::move(audit_cfg),
                                               std::move(engine.value()));
        if (!auditor.is_ok()) {
            utils::log::error(auditor.error_message());
            return kExitUsage;
        }

        utils::log::debug(std::format("[3/4] Scanning {}", opts.target));
        auto report = auditor.value()->run(opts.target);
        if (!report.is_ok()) {
            utils::log::error(report.error_message());
            return kExitUsage;
        }

        // [4/4] Report
        std::vector<const SecurityRule*> catalog;
        for (const auto& scanner : auditor.value()->scanners()) {
            const auto rules = scanner->rules();
            catalog.insert(catalog.end(), rules.begin(), rules.end());
        }
        const auto reporter = make_reporter(opts.format, std::move(catalog));
        const auto rendered = reporter->render(report.value());

        if (opts.output) {
            std::ofstream out(*opts.output, std::ios::trunc);
            if (!out) {
                utils::log::error(std::format("Cannot write report to {}", *opts.output));
                return kExitUsage;
            }
            out << rendered;
            utils::log::info(std::format("[4/4] {} report written to {}",
                                         reporter->format_name(), *opts.output));
        } else {
            std::cout << rendered;
            std::cout.flush();
        }

        for (const auto& e : report.value().errors) {
            utils::log::warn(e);
        }

        security_log->flush();

        if (!report.value().passed) {
            utils::log::error(std::format("{}: {} unsuppressed finding(s) at or above {}",
                error_category_to_string(ErrorCategory::AUDIT_CRITICAL),
                report.value().failing_count(), severity_to_string(report.value().fail_on)));
            return kExitFailed;
        }
        return kExitPassed;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitUsage;
    }
}
