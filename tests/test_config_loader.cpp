#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <string>

using namespace personaguard;

namespace {

bool error_mentions(const ConfigLoader::LoadResult& r, std::string_view text) {
    return !r.success && r.error_message.find(text) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("ConfigLoader: defaults from an empty document", "[config]") {
    auto r = ConfigLoader::load_from_string("");
    REQUIRE(r.success);
    const auto& cfg = r.config;

    CHECK(cfg.logging.level == "info");
    CHECK(cfg.content.sanitize_threshold == Severity::HIGH);
    CHECK(cfg.content.max_length == 100'000);
    CHECK(cfg.rate_limits.operations.empty());
    CHECK(cfg.credentials.env_var == "GITHUB_TOKEN");
    CHECK(cfg.credentials.cache_ttl_seconds == 3600);
    CHECK(cfg.paths.allowed_extensions.size() == 5);
    CHECK(cfg.commands.allowed == std::vector<std::string>{"git", "npm", "node"});
    CHECK(cfg.security_log.capacity == 1000);
    CHECK(cfg.audit.fail_on == Severity::CRITICAL);
    CHECK(cfg.audit.scanners.size() == 3);
    CHECK(cfg.audit.suppressions.empty());
}

TEST_CASE("ConfigLoader: full document", "[config]") {
    const std::string toml = R"(
[logging]
level = "DEBUG"

[content]
sanitize_threshold = "critical"
max_length = 50000

[content.context_limits]
display-field = 200

[rate_limits.github-api]
capacity = 5000
window_ms = 3600000
min_delay_ms = 100

[credentials]
env_var = "GH_TOKEN"
identity_endpoint = "https://github.example.com/api/v3"
timeout_seconds = 5
cache_ttl_seconds = 60

[paths]
root = "/srv/personas"
allowed_extensions = [".md"]
max_file_size = 1024

[commands]
allowed = ["git"]

[security_log]
capacity = 50
persist_file = "/var/log/pg/events.jsonl"

[audit]
fail_on = "high"
root = "/src/app"
root_markers = [".git"]
exclude = ["fixtures/**"]
scanners = ["code"]
max_file_size = 2048
workers = 4

[[audit.suppressions]]
rule = "CWE-89-001"
file = "src/db/**"
reason = "query builder escapes values"
)";
    auto r = ConfigLoader::load_from_string(toml);
    REQUIRE(r.success);
    const auto& cfg = r.config;

    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.content.sanitize_threshold == Severity::CRITICAL);
    CHECK(cfg.content.max_length == 50'000);
    CHECK(cfg.content.context_limits.at("display-field") == 200);

    const auto& gh = cfg.rate_limits.operations.at("github-api");
    CHECK(gh.capacity == 5000);
    CHECK(gh.window == std::chrono::milliseconds(3'600'000));
    CHECK(gh.min_delay == std::chrono::milliseconds(100));

    CHECK(cfg.credentials.env_var == "GH_TOKEN");
    CHECK(cfg.credentials.timeout_seconds == 5);
    CHECK(cfg.paths.root == "/srv/personas");
    CHECK(cfg.paths.allowed_extensions == std::vector<std::string>{".md"});
    CHECK(cfg.commands.allowed == std::vector<std::string>{"git"});
    CHECK(cfg.security_log.persist_file == "/var/log/pg/events.jsonl");

    CHECK(cfg.audit.fail_on == Severity::HIGH);
    CHECK(cfg.audit.root == "/src/app");
    CHECK(cfg.audit.exclude == std::vector<std::string>{"fixtures/**"});
    CHECK(cfg.audit.workers == 4);
    REQUIRE(cfg.audit.suppressions.size() == 1);
    CHECK(cfg.audit.suppressions[0].rule == "CWE-89-001");
    CHECK(cfg.audit.suppressions[0].reason == "query builder escapes values");
}

TEST_CASE("ConfigLoader: environment expansion", "[config]") {
    ::setenv("PG_TEST_ROOT", "/data/personas", 1);
    ::unsetenv("PG_TEST_UNSET");

    CHECK(ConfigLoader::expand_env_vars("no vars") == "no vars");
    CHECK(ConfigLoader::expand_env_vars("${PG_TEST_ROOT}/x") == "/data/personas/x");
    CHECK(ConfigLoader::expand_env_vars("a${PG_TEST_UNSET}b") == "ab");
    CHECK_THROWS(ConfigLoader::expand_env_vars("${OPEN"));

    auto r = ConfigLoader::load_from_string("[paths]\nroot = \"${PG_TEST_ROOT}\"\n");
    REQUIRE(r.success);
    CHECK(r.config.paths.root == "/data/personas");

    ::unsetenv("PG_TEST_ROOT");
}

TEST_CASE("ConfigLoader: type errors fail the load", "[config]") {
    CHECK(error_mentions(ConfigLoader::load_from_string("[content]\nmax_length = \"big\"\n"),
                         "content.max_length must be an integer"));
    CHECK(error_mentions(ConfigLoader::load_from_string("[content]\nmax_length = -1\n"),
                         "must not be negative"));
    CHECK(error_mentions(ConfigLoader::load_from_string("[commands]\nallowed = \"git\"\n"),
                         "commands.allowed must be an array of strings"));
    CHECK(error_mentions(ConfigLoader::load_from_string("[commands]\nallowed = [\"git\", 3]\n"),
                         "must contain only strings"));
    CHECK(error_mentions(ConfigLoader::load_from_string("[audit]\nfail_on = \"severe\"\n"),
                         "audit.fail_on must be one of"));
    CHECK(error_mentions(ConfigLoader::load_from_string("[rate_limits]\nstrict = 5\n"),
                         "rate_limits.strict must be a table"));
    CHECK(error_mentions(ConfigLoader::load_from_string("[content.context_limits]\nx = 0\n"),
                         "content.context_limits.x must be a positive integer"));
    CHECK(error_mentions(ConfigLoader::load_from_string("this is = not [ toml"),
                         "Failed to parse config"));
}

TEST_CASE("ConfigLoader: validation errors", "[config]") {
    SECTION("Each problem is reported") {
        auto r = ConfigLoader::load_from_string(R"(
[logging]
level = "verbose"

[credentials]
identity_endpoint = "http://api.github.com"

[commands]
allowed = ["/bin/sh"]

[audit]
scanners = ["code", "malware"]
)");
        REQUIRE_FALSE(r.success);
        CHECK(r.error_message.find("logging.level") != std::string::npos);
        CHECK(r.error_message.find("identity_endpoint must use https") != std::string::npos);
        CHECK(r.error_message.find("bare program name") != std::string::npos);
        CHECK(r.error_message.find("unknown scanner 'malware'") != std::string::npos);
    }

    SECTION("validate_config on a struct") {
        PlatformConfig cfg;
        CHECK(ConfigLoader::validate_config(cfg).empty());

        cfg.content.sanitize_threshold = Severity::NONE;
        cfg.paths.allowed_extensions = {"md"};
        cfg.security_log.capacity = 0;
        cfg.rate_limits.operations["x"] = RateLimitConfig{1, std::chrono::milliseconds(0), {}};
        CHECK(ConfigLoader::validate_config(cfg).size() == 4);
    }

    SECTION("Suppression without a reason") {
        auto r = ConfigLoader::load_from_string(R"(
[[audit.suppressions]]
rule = "R1"
file = "src/a.ts"
)");
        CHECK(error_mentions(r, "audit.suppressions[0].reason is required"));
    }

    SECTION("Localhost endpoint may use http") {
        auto r = ConfigLoader::load_from_string(
            "[credentials]\nidentity_endpoint = \"http://localhost:8080\"\n");
        CHECK(r.success);
    }
}

TEST_CASE("ConfigLoader: suppression files", "[config]") {
    SECTION("Valid list") {
        auto r = ConfigLoader::load_suppressions_string(R"(
[[suppressions]]
rule = "*"
file = "test/**"
reason = "fixtures hold fake secrets"

[[suppressions]]
rule = " OWASP-A01-001 "
file = "docs/example.ts"
reason = "documentation sample"
)");
        REQUIRE(r.is_ok());
        REQUIRE(r.value().size() == 2);
        CHECK(r.value()[1].rule == "OWASP-A01-001");
    }

    SECTION("No suppressions table") {
        auto r = ConfigLoader::load_suppressions_string("title = \"x\"\n");
        REQUIRE(r.is_ok());
        CHECK(r.value().empty());
    }

    SECTION("Missing fields and wrong shapes") {
        auto no_reason = ConfigLoader::load_suppressions_string(
            "[[suppressions]]\nrule = \"R1\"\nfile = \"a.ts\"\n");
        REQUIRE(no_reason.is_error());
        CHECK(no_reason.error_category() == ErrorCategory::CONFIG_ERROR);
        CHECK(no_reason.error_message().find("reason is required") != std::string::npos);

        CHECK(ConfigLoader::load_suppressions_string("suppressions = \"all\"\n").is_error());
        CHECK(ConfigLoader::load_suppressions_string("suppressions = [1, 2]\n").is_error());
    }

    SECTION("From a file") {
        testing::TempDir dir;
        const auto path = dir.write("suppressions.toml",
            "[[suppressions]]\nrule = \"R1\"\nfile = \"src/a.ts\"\nreason = \"reviewed\"\n");
        auto r = ConfigLoader::load_suppressions_file(path.string());
        REQUIRE(r.is_ok());
        CHECK(r.value().size() == 1);

        auto missing = ConfigLoader::load_suppressions_file((dir.path() / "none.toml").string());
        CHECK(missing.is_error());
    }
}

TEST_CASE("ConfigLoader: load from file", "[config]") {
    testing::TempDir dir;
    const auto path = dir.write("persona-guard.toml", "[security_log]\ncapacity = 10\n");

    auto r = ConfigLoader::load_from_file(path.string());
    REQUIRE(r.success);
    CHECK(r.config.security_log.capacity == 10);

    auto missing = ConfigLoader::load_from_file((dir.path() / "missing.toml").string());
    CHECK_FALSE(missing.success);
    CHECK(missing.error_message.find("Failed to load config") != std::string::npos);
}
