#include <catch2/catch_test_macros.hpp>
#include "audit/security_log.hpp"
#include "security/path_guard.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <string>

using namespace personaguard;

namespace fs = std::filesystem;

TEST_CASE("PathGuard: paths inside the root resolve", "[path_guard]") {
    SecurityLog log;
    PathGuard guard(log);
    testing::TempDir root;
    root.write("personas/reviewer.md", "x");

    SECTION("Existing file") {
        auto r = guard.resolve("personas/reviewer.md", root.path());
        REQUIRE(r.is_ok());
        CHECK(r.value() == root.path() / "personas" / "reviewer.md");
    }

    SECTION("Not-yet-existing file") {
        auto r = guard.resolve("personas/new/draft.md", root.path());
        REQUIRE(r.is_ok());
        CHECK(PathGuard::is_within(r.value(), root.path()));
    }

    SECTION("Absolute path inside the root") {
        auto r = guard.resolve((root.path() / "personas/reviewer.md").string(), root.path());
        REQUIRE(r.is_ok());
    }

    SECTION("Redundant separators and dots") {
        auto r = guard.resolve("personas//./reviewer.md", root.path());
        REQUIRE(r.is_ok());
        CHECK(r.value() == root.path() / "personas" / "reviewer.md");
    }

    CHECK(log.events_by_type(SecurityEventType::PATH_VIOLATION).empty());
}

TEST_CASE("PathGuard: escapes are rejected", "[path_guard]") {
    SecurityLog log;
    PathGuard guard(log);
    testing::TempDir root;

    auto expect_violation = [&](std::string_view candidate) {
        auto r = guard.resolve(candidate, root.path());
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::PATH_VIOLATION);
    };

    SECTION("Parent traversal") {
        expect_violation("../outside.md");
        expect_violation("personas/../../etc/passwd");
        expect_violation("personas/..");
    }

    SECTION("Absolute path elsewhere") {
        expect_violation("/etc/passwd");
    }

    SECTION("Empty path and null byte") {
        expect_violation("");
        expect_violation(std::string_view("a\0b.md", 6));
    }

    SECTION("The root itself is not inside the root") {
        expect_violation(".");
        expect_violation(root.path().string());
    }

    SECTION("Sibling directory sharing a prefix") {
        const fs::path sibling = root.path().string() + "2";
        expect_violation((sibling / "x.md").string());
    }

    SECTION("Symlink pointing outside") {
        testing::TempDir outside;
        outside.write("secret.md", "secret");
        fs::create_directory_symlink(outside.path(), root.path() / "link");
        expect_violation("link/secret.md");
    }

    SECTION("Relative root") {
        auto r = guard.resolve("a.md", "relative/root");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::PATH_VIOLATION);
    }

    auto events = log.events_by_type(SecurityEventType::PATH_VIOLATION);
    REQUIRE_FALSE(events.empty());
    CHECK(events.back().severity == Severity::HIGH);
    CHECK(events.back().source == "PathGuard");
}

TEST_CASE("PathGuard: is_within compares components", "[path_guard]") {
    CHECK(PathGuard::is_within("/data/personas/a.md", "/data/personas"));
    CHECK(PathGuard::is_within("/data/personas/sub/a.md", "/data/personas/"));
    CHECK_FALSE(PathGuard::is_within("/data/personas2/a.md", "/data/personas"));
    CHECK_FALSE(PathGuard::is_within("/data/personas", "/data/personas"));
    CHECK_FALSE(PathGuard::is_within("/data", "/data/personas"));
}

TEST_CASE("PathGuard: read_file", "[path_guard]") {
    SecurityLog log;
    testing::TempDir root;

    SECTION("Reads an allowed file") {
        PathGuard guard(log);
        root.write("personas/a.md", "---\nname: A\n---\n");
        auto r = guard.read_file("personas/a.md", root.path());
        REQUIRE(r.is_ok());
        CHECK(r.value() == "---\nname: A\n---\n");
    }

    SECTION("Extension outside the allow-list") {
        PathGuard guard(log);
        root.write("run.sh", "echo");
        auto r = guard.read_file("run.sh", root.path());
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::PATH_VIOLATION);
    }

    SECTION("Extension check is case-insensitive") {
        PathGuard guard(log);
        root.write("README.MD", "hi");
        CHECK(guard.read_file("README.MD", root.path()).is_ok());
    }

    SECTION("Oversized file") {
        PathGuard::Config cfg;
        cfg.max_file_size = 8;
        PathGuard guard(log, cfg);
        root.write("big.md", std::string(9, 'x'));
        auto r = guard.read_file("big.md", root.path());
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::VALIDATION_REJECTED);
    }

    SECTION("Missing file") {
        PathGuard guard(log);
        auto r = guard.read_file("missing.md", root.path());
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::IO_ERROR);
    }
}

TEST_CASE("PathGuard: write_file_atomic", "[path_guard]") {
    SecurityLog log;
    PathGuard guard(log);
    testing::TempDir root;

    SECTION("Creates directories and replaces content") {
        auto first = guard.write_file_atomic("personas/new/p.md", root.path(), "one");
        REQUIRE(first.is_ok());
        CHECK(root.read("personas/new/p.md") == "one");

        auto second = guard.write_file_atomic("personas/new/p.md", root.path(), "two");
        REQUIRE(second.is_ok());
        CHECK(root.read("personas/new/p.md") == "two");

        size_t entries = 0;
        for ([[maybe_unused]] const auto& e : fs::directory_iterator(root.path() / "personas/new")) {
            ++entries;
        }
        CHECK(entries == 1);
    }

    SECTION("Refuses to write outside the root") {
        auto r = guard.write_file_atomic("../escape.md", root.path(), "x");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::PATH_VIOLATION);
        CHECK_FALSE(fs::exists(root.path().parent_path() / "escape.md"));
    }

    SECTION("Refuses a disallowed extension") {
        auto r = guard.write_file_atomic("hook.js", root.path(), "x");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::PATH_VIOLATION);
    }
}
