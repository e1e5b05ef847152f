#include <catch2/catch_test_macros.hpp>
#include "audit/security_log.hpp"
#include "auditor/project_root.hpp"
#include "auditor/security_auditor.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <string>
#include <thread>

using namespace personaguard;

namespace {

constexpr const char* kSqlConcat = "db.query(\"SELECT * FROM users WHERE id = \" + id);\n";

SecurityAuditor::Config config_for(const testing::TempDir& dir) {
    SecurityAuditor::Config cfg;
    cfg.root = dir.path().string();
    cfg.workers = 2;
    return cfg;
}

std::unique_ptr<SecurityAuditor> make_auditor(SecurityLog& log, SecurityAuditor::Config cfg,
                                              SuppressionEngine suppressions = {}) {
    auto auditor = SecurityAuditor::create(log, std::move(cfg), std::move(suppressions));
    REQUIRE(auditor.is_ok());
    return std::move(auditor.value());
}

bool has_file(const std::vector<Finding>& findings, std::string_view file) {
    return std::ranges::any_of(findings, [&](const Finding& f) { return f.file == file; });
}

/// Blocks inside scan() until released
class BlockingScanner : public IScanner {
public:
    mutable std::atomic<bool> started{false};
    std::atomic<bool> release{false};

    [[nodiscard]] const char* name() const override { return "blocking"; }
    [[nodiscard]] bool wants(const std::string&) const override { return true; }
    [[nodiscard]] std::vector<Finding> scan(const SourceFile&) const override {
        started.store(true);
        while (!release.load()) std::this_thread::yield();
        return {};
    }
    [[nodiscard]] std::vector<const SecurityRule*> rules() const override { return {}; }
};

} // anonymous namespace

TEST_CASE("SecurityAuditor: critical finding fails the run", "[auditor]") {
    testing::TempDir dir;
    dir.write("src/db.ts", kSqlConcat);
    dir.write("src/clean.ts", "export const answer = 42;\n");

    SecurityLog log;
    auto auditor = make_auditor(log, config_for(dir));
    auto result = auditor->run(dir.path());
    REQUIRE(result.is_ok());
    const auto& report = result.value();

    CHECK_FALSE(report.passed);
    CHECK(report.files_scanned == 2);
    CHECK(report.failing_count() >= 1);
    REQUIRE_FALSE(report.findings.empty());
    CHECK(report.findings.front().severity == Severity::CRITICAL);
    CHECK(report.findings.front().file == "src/db.ts");
    CHECK(report.summary.total == report.findings.size());
    CHECK(report.summary.count(Severity::CRITICAL) >= 1);
    CHECK(report.summary.by_category.at("code") == report.findings.size());
    CHECK(report.project_root == dir.path().string());
    CHECK_FALSE(report.timestamp.empty());
    CHECK(auditor->phase() == AuditPhase::IDLE);

    const auto events = log.events_by_type(SecurityEventType::AUDIT_FINDING);
    CHECK(events.size() == report.findings.size());
    REQUIRE_FALSE(events.empty());
    CHECK(events[0].metadata.at("file") == "src/db.ts");
    CHECK(events[0].severity == report.findings.front().severity);
    const auto blocking = std::ranges::count_if(events, [](const SecurityEvent& e) {
        return e.metadata.at("blocking") == "true";
    });
    CHECK(static_cast<size_t>(blocking) == report.failing_count());
}

TEST_CASE("SecurityAuditor: suppressed findings do not fail the run", "[auditor]") {
    testing::TempDir dir;
    dir.write("src/db.ts", kSqlConcat);

    auto suppressions = SuppressionEngine::create({{"*", "src/db.ts", "query builder escapes ids"}});
    REQUIRE(suppressions.is_ok());

    SecurityLog log;
    auto auditor = make_auditor(log, config_for(dir), std::move(suppressions.value()));
    auto result = auditor->run(dir.path());
    REQUIRE(result.is_ok());

    CHECK(result.value().passed);
    CHECK(result.value().findings.empty());
    REQUIRE_FALSE(result.value().suppressed.empty());
    CHECK(result.value().suppressed[0].suppression.reason == "query builder escapes ids");

    const auto events = log.events_by_type(SecurityEventType::AUDIT_FINDING);
    REQUIRE(events.size() == result.value().suppressed.size());
    CHECK(events[0].metadata.at("suppressed_by") == "* src/db.ts");
    CHECK(events[0].metadata.at("reason") == "query builder escapes ids");
    CHECK(events[0].metadata.at("blocking") == "false");
}

TEST_CASE("SecurityAuditor: threshold selects failing findings", "[auditor]") {
    testing::TempDir dir;
    dir.write("src/client.ts", "const r = await fetch(url);\n");

    SecurityLog log;
    auto cfg = config_for(dir);

    SECTION("Medium finding under a critical threshold passes") {
        auto result = make_auditor(log, cfg)->run(dir.path());
        REQUIRE(result.is_ok());
        CHECK(result.value().passed);
        CHECK_FALSE(result.value().findings.empty());

        // Recorded even though it does not gate
        const auto events = log.events_by_type(SecurityEventType::AUDIT_FINDING);
        REQUIRE(events.size() == result.value().findings.size());
        CHECK(events[0].severity == result.value().findings.front().severity);
        CHECK(events[0].metadata.at("blocking") == "false");
    }

    SECTION("Same finding under a low threshold fails") {
        cfg.fail_on = Severity::LOW;
        auto result = make_auditor(log, cfg)->run(dir.path());
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().passed);
    }
}

TEST_CASE("SecurityAuditor: file selection", "[auditor]") {
    testing::TempDir dir;
    dir.write("src/ok.ts", "export const a = 1;\n");
    dir.write("node_modules/pkg/index.js", kSqlConcat);
    dir.write("build-debug/gen.cpp", "strcpy(a, b);\n");
    dir.write(".git/hooks/pre-commit.sh", "system(cmd + x)\n");
    dir.write("generated/api.ts", kSqlConcat);
    dir.write("src/big.ts", std::string(2000, 'x'));
    dir.write("src/blob.ts", std::string("abc\0def", 7) + kSqlConcat);
    dir.write("docs/readme.md", kSqlConcat);

    SecurityLog log;
    auto cfg = config_for(dir);
    cfg.exclude = {"generated/**"};
    cfg.max_file_size = 1024;

    auto result = make_auditor(log, cfg)->run(dir.path());
    REQUIRE(result.is_ok());
    const auto& report = result.value();

    CHECK(report.files_scanned == 1);
    CHECK(report.files_skipped == 2);
    CHECK(report.findings.empty());
    CHECK(report.passed);
    CHECK(report.errors.empty());
}

TEST_CASE("SecurityAuditor: duplicate findings collapse", "[auditor]") {
    testing::TempDir dir;
    dir.write("src/db.ts", kSqlConcat);

    SecurityLog log;
    auto cfg = config_for(dir);
    cfg.scanners = {"code"};

    auto single = make_auditor(log, cfg);
    auto once = single->run(dir.path());
    REQUIRE(once.is_ok());

    auto doubled = make_auditor(log, cfg);
    doubled->add_scanner(SecurityAuditor::make_scanner("code"));
    auto twice = doubled->run(dir.path());
    REQUIRE(twice.is_ok());

    CHECK(twice.value().findings.size() == once.value().findings.size());
}

TEST_CASE("SecurityAuditor: single file target", "[auditor]") {
    testing::TempDir dir;
    dir.write("src/db.ts", kSqlConcat);
    dir.write("src/other.ts", kSqlConcat);

    SecurityLog log;
    auto result = make_auditor(log, config_for(dir))->run(dir.path() / "src" / "db.ts");
    REQUIRE(result.is_ok());
    CHECK(result.value().files_scanned == 1);
    CHECK(has_file(result.value().findings, "src/db.ts"));
    CHECK_FALSE(has_file(result.value().findings, "src/other.ts"));
}

TEST_CASE("SecurityAuditor: root detection", "[auditor]") {
    testing::TempDir dir;
    dir.write("proj/package.json", "{}\n");
    dir.write("proj/src/db.ts", kSqlConcat);

    SecurityLog log;
    SecurityAuditor::Config cfg;
    cfg.root_markers = {"package.json"};
    cfg.scanners = {"code"};
    auto result = make_auditor(log, cfg)->run(dir.path() / "proj" / "src");
    REQUIRE(result.is_ok());
    CHECK(result.value().project_root == (dir.path() / "proj").string());
    CHECK(has_file(result.value().findings, "src/db.ts"));

    SECTION("Helpers") {
        const auto found = find_project_root(dir.path() / "proj" / "src" / "db.ts", {"package.json"});
        REQUIRE(found.has_value());
        CHECK(*found == dir.path() / "proj");
        CHECK_FALSE(find_project_root(dir.path(), {"no-such-marker-file"}).has_value());
        CHECK(relative_to_root(dir.path() / "proj" / "src" / "db.ts", dir.path() / "proj") == "src/db.ts");
    }
}

TEST_CASE("SecurityAuditor: errors", "[auditor]") {
    testing::TempDir dir;
    SecurityLog log;

    SECTION("Missing target") {
        auto result = make_auditor(log, config_for(dir))->run(dir.path() / "missing");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::IO_ERROR);
    }

    SECTION("Unknown scanner") {
        auto cfg = config_for(dir);
        cfg.scanners = {"code", "malware"};
        auto created = SecurityAuditor::create(log, cfg);
        REQUIRE(created.is_error());
        CHECK(created.error_category() == ErrorCategory::CONFIG_ERROR);
        CHECK(created.error_message().find("malware") != std::string::npos);
    }

    SECTION("Invalid exclude glob") {
        auto cfg = config_for(dir);
        cfg.exclude = {""};
        CHECK(SecurityAuditor::create(log, cfg).is_error());
    }
}

TEST_CASE("SecurityAuditor: concurrent run is refused", "[auditor]") {
    testing::TempDir dir;
    dir.write("a.txt", "x");

    SecurityLog log;
    auto cfg = config_for(dir);
    cfg.workers = 1;
    SecurityAuditor auditor(log, cfg);
    auto scanner = std::make_unique<BlockingScanner>();
    auto* blocking = scanner.get();
    auditor.add_scanner(std::move(scanner));

    std::atomic<bool> first_ok{false};
    std::thread first([&] {
        first_ok.store(auditor.run(dir.path()).is_ok());
    });
    while (!blocking->started.load()) std::this_thread::yield();

    CHECK(auditor.phase() == AuditPhase::SCANNING);
    auto second = auditor.run(dir.path());
    CHECK(second.is_error());
    CHECK(second.error_category() == ErrorCategory::INTERNAL_ERROR);

    blocking->release.store(true);
    first.join();
    CHECK(first_ok.load());
    CHECK(auditor.phase() == AuditPhase::IDLE);
}

TEST_CASE("SecurityAuditor: excluded directory names", "[auditor]") {
    CHECK(SecurityAuditor::is_excluded_directory(".git"));
    CHECK(SecurityAuditor::is_excluded_directory("node_modules"));
    CHECK(SecurityAuditor::is_excluded_directory("build"));
    CHECK(SecurityAuditor::is_excluded_directory("build-release"));
    CHECK_FALSE(SecurityAuditor::is_excluded_directory("src"));
    CHECK(std::string(audit_phase_to_string(AuditPhase::FILTERING)) == "filtering");
}
