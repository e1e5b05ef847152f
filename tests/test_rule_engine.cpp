#include <catch2/catch_test_macros.hpp>
#include "auditor/rule_engine.hpp"
#include "auditor/security_rules.hpp"

#include <algorithm>
#include <set>
#include <string>

using namespace personaguard;

namespace {

SourceFile source(std::string path, std::string content) {
    SourceFile f;
    f.kind = file_kind(path);
    f.is_test = is_test_path(path);
    f.path = std::move(path);
    f.content = std::move(content);
    return f;
}

SecurityRule pattern_rule(std::string id, std::string pattern) {
    SecurityRule r;
    r.id = std::move(id);
    r.name = "Test Rule";
    r.description = "matched";
    r.pattern = std::move(pattern);
    return r;
}

RuleEngine builtin_engine() {
    RuleEngine engine;
    for (auto& rule : rules::code_rules()) {
        REQUIRE(engine.add(std::move(rule)).is_ok());
    }
    return engine;
}

bool has_rule(const std::vector<Finding>& findings, std::string_view id) {
    return std::ranges::any_of(findings, [&](const Finding& f) { return f.rule_id == id; });
}

} // anonymous namespace

TEST_CASE("RuleEngine: file helpers", "[rule_engine]") {
    CHECK(file_kind("src/a.CPP") == ".cpp");
    CHECK(file_kind("config/.env.local") == ".env");
    CHECK(file_kind(".env") == ".env");
    CHECK(file_kind("Makefile").empty());
    CHECK(file_kind(".gitignore").empty());

    CHECK(is_test_path("tests/unit/a.cpp"));
    CHECK(is_test_path("src/__tests__/a.ts"));
    CHECK(is_test_path("src/test_utils.py"));
    CHECK(is_test_path("src/parser_test.go"));
    CHECK(is_test_path("src/app.spec.ts"));
    CHECK_FALSE(is_test_path("src/contest.ts"));
    CHECK_FALSE(is_test_path("src/attestation.cpp"));

    CHECK(make_snippet("   x = 1;   ") == "x = 1;");
    CHECK(make_snippet(std::string(150, 'x')).size() == 100);

    CHECK(make_redacted_snippet(R"(const apiKey = "abcdefghijklmnop1234";)") ==
          R"(const apiKey = "[REDACTED]";)");
    CHECK(make_redacted_snippet("PASSWORD=hunter2hunter2") == "PASSWORD=[REDACTED]");
}

TEST_CASE("RuleEngine: add validation", "[rule_engine]") {
    RuleEngine engine;
    REQUIRE(engine.add(pattern_rule("R1", "bad")).is_ok());
    CHECK(engine.size() == 1);
    CHECK(engine.find("R1") != nullptr);
    CHECK(engine.find("R2") == nullptr);

    CHECK(engine.add(pattern_rule("R1", "other")).is_error());
    CHECK(engine.add(pattern_rule("", "x")).is_error());
    CHECK(engine.add(pattern_rule("R2", "(unclosed")).is_error());

    auto risky = engine.add(pattern_rule("R3", "(a+)+$"));
    REQUIRE(risky.is_error());
    CHECK(risky.error_category() == ErrorCategory::CONFIG_ERROR);
    CHECK(risky.error_message().find("high risk") != std::string::npos);

    SECTION("Exactly one of pattern or check") {
        SecurityRule neither;
        neither.id = "R4";
        CHECK(engine.add(neither).is_error());

        SecurityRule both = pattern_rule("R5", "x");
        both.check = [](const SourceFile&) { return std::vector<RuleHit>{}; };
        CHECK(engine.add(both).is_error());
    }

    CHECK(engine.size() == 1);
}

TEST_CASE("RuleEngine: pattern evaluation", "[rule_engine]") {
    RuleEngine engine;
    auto rule = pattern_rule("R1", "danger\\(");
    rule.severity = Severity::HIGH;
    rule.reference = "CWE-1";
    rule.remediation = "stop";
    REQUIRE(engine.add(rule).is_ok());

    SECTION("Line, column and message") {
        auto findings = engine.evaluate(source("src/a.ts", "ok\r\n  danger(x)\r\nfine\n"));
        REQUIRE(findings.size() == 1);
        const auto& f = findings[0];
        CHECK(f.rule_id == "R1");
        CHECK(f.file == "src/a.ts");
        CHECK(f.line == 2);
        CHECK(f.column == 3);
        CHECK(f.snippet == "danger(x)");
        CHECK(f.message == "Test Rule: matched");
        CHECK(f.severity == Severity::HIGH);
        CHECK(f.reference == "CWE-1");
        CHECK(f.remediation == "stop");
        CHECK(f.confidence == Confidence::MEDIUM);
    }

    SECTION("One finding per line") {
        auto findings = engine.evaluate(source("src/a.ts", "danger(1); danger(2)\ndanger(3)"));
        REQUIRE(findings.size() == 2);
        CHECK(findings[0].line == 1);
        CHECK(findings[1].line == 2);
    }

    SECTION("Case insensitive by default") {
        CHECK(engine.evaluate(source("src/a.ts", "DANGER(x)")).size() == 1);
    }

    SECTION("Example and test lines get low confidence") {
        auto findings = engine.evaluate(source("src/a.ts", "danger(example)"));
        REQUIRE(findings.size() == 1);
        CHECK(findings[0].confidence == Confidence::LOW);

        auto in_test = engine.evaluate(source("tests/a.ts", "danger(x)"));
        REQUIRE(in_test.size() == 1);
        CHECK(in_test[0].confidence == Confidence::LOW);
    }
}

TEST_CASE("RuleEngine: scoping", "[rule_engine]") {
    RuleEngine engine;
    auto cpp_only = pattern_rule("CPP", "strcpy");
    cpp_only.kinds = {".cpp"};
    auto no_tests = pattern_rule("PROD", "strcpy");
    no_tests.skip_tests = true;
    REQUIRE(engine.add(cpp_only).is_ok());
    REQUIRE(engine.add(no_tests).is_ok());

    CHECK(engine.evaluate(source("src/a.cpp", "strcpy")).size() == 2);
    auto ts = engine.evaluate(source("src/a.ts", "strcpy"));
    REQUIRE(ts.size() == 1);
    CHECK(ts[0].rule_id == "PROD");
    auto test = engine.evaluate(source("tests/a.cpp", "strcpy"));
    REQUIRE(test.size() == 1);
    CHECK(test[0].rule_id == "CPP");
}

TEST_CASE("RuleEngine: semantic checks", "[rule_engine]") {
    RuleEngine engine;
    SecurityRule rule;
    rule.id = "SEM";
    rule.name = "Semantic";
    rule.description = "unused";
    rule.check = [](const SourceFile& file) {
        std::vector<RuleHit> hits;
        if (file.content.find("marker") != std::string::npos) {
            hits.push_back(RuleHit{4, 2, "snip", "custom message", Confidence::HIGH});
        }
        return hits;
    };
    REQUIRE(engine.add(std::move(rule)).is_ok());

    auto findings = engine.evaluate(source("src/a.py", "has marker"));
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].line == 4);
    CHECK(findings[0].message == "Semantic: custom message");
    CHECK(findings[0].confidence == Confidence::HIGH);
    CHECK(engine.evaluate(source("src/a.py", "clean")).empty());
}

TEST_CASE("RuleEngine: long lines are skipped past the pattern ceiling", "[rule_engine]") {
    RuleEngine engine;
    REQUIRE(engine.add(pattern_rule("M", "a+b+c+d+e+f+")).is_ok());

    const std::string hit = "abcdef";
    CHECK(engine.evaluate(source("a.ts", hit + std::string(10'000 - hit.size(), 'x'))).size() == 1);
    CHECK(engine.evaluate(source("a.ts", hit + std::string(10'001 - hit.size(), 'x'))).empty());
}

TEST_CASE("Builtin rules: tables load cleanly", "[rule_engine]") {
    auto engine = builtin_engine();
    CHECK(engine.size() == rules::code_rules().size());

    std::set<std::string> ids;
    for (const auto* r : engine.rules()) {
        CHECK_FALSE(r->remediation.empty());
        CHECK_FALSE(r->reference.empty());
        ids.insert(r->id);
    }
    CHECK(ids.contains("OWASP-A01-001"));
    CHECK(ids.contains("CWE-120-001"));
    CHECK(ids.contains("PG-SEC-006"));

    RuleEngine cfg;
    for (auto& rule : rules::configuration()) {
        REQUIRE(cfg.add(std::move(rule)).is_ok());
    }
    CHECK(cfg.size() == 5);

    CHECK(rules::rule_set("OWASP-Top-10").size() == rules::owasp_top10().size());
    CHECK(rules::rule_set("CWE-Top-25").size() == 7);
    CHECK(rules::rule_set("Platform-Security").size() == 6);
    CHECK(rules::rule_set("Unknown").empty());
}

TEST_CASE("Builtin rules: detections", "[rule_engine]") {
    auto engine = builtin_engine();

    SECTION("Hardcoded secret is high confidence and redacted") {
        auto findings = engine.evaluate(source("src/config.ts",
            R"(const api_key = "AbCdEfGhIjKlMnOpQrSt";)"));
        REQUIRE(has_rule(findings, "OWASP-A01-001"));
        const auto& f = *std::ranges::find_if(findings, [](const Finding& x) {
            return x.rule_id == "OWASP-A01-001";
        });
        CHECK(f.severity == Severity::CRITICAL);
        CHECK(f.confidence == Confidence::HIGH);
        CHECK(f.snippet.find("AbCdEfGh") == std::string::npos);
    }

    SECTION("SQL built by concatenation") {
        auto findings = engine.evaluate(source("src/db.ts",
            R"(db.query("SELECT * FROM users WHERE id = " + id);)"));
        CHECK(has_rule(findings, "OWASP-A03-001"));
        CHECK(has_rule(findings, "CWE-89-001"));
    }

    SECTION("Shell execution and unbounded copies in C++") {
        auto findings = engine.evaluate(source("src/run.cpp",
            "system(cmd.c_str());\nstrcpy(buf, src);\n"));
        CHECK(has_rule(findings, "OWASP-A03-002"));
        CHECK(has_rule(findings, "PG-SEC-005"));
        CHECK(has_rule(findings, "CWE-120-001"));
    }

    SECTION("Unbounded copy rule stays out of scripts") {
        CHECK_FALSE(has_rule(engine.evaluate(source("src/a.js", "strcpy(a, b)")), "CWE-120-001"));
    }

    SECTION("Weak hashing and disabled TLS") {
        auto findings = engine.evaluate(source("src/h.py",
            "digest = md5(data)\nrequests_opts = {'verify_ssl': False}\nrejectUnauthorized: false\n"));
        CHECK(has_rule(findings, "OWASP-A07-001"));
        CHECK(has_rule(findings, "OWASP-A05-001"));
    }

    SECTION("YAML parsed outside the secure parser") {
        CHECK(has_rule(engine.evaluate(source("src/load.ts", "const doc = yaml.load(text);")),
                       "PG-SEC-002"));
        CHECK(has_rule(engine.evaluate(source("src/load.cpp", "auto n = YAML::Load(text);")),
                       "PG-SEC-002"));
    }

    SECTION("Remote call without rate limiting") {
        auto bare = engine.evaluate(source("src/client.ts", "const r = await fetch(url);"));
        CHECK(has_rule(bare, "PG-SEC-003"));

        auto guarded = engine.evaluate(source("src/client.ts",
            "if (!rateLimiter.check(key)) return;\nconst r = await fetch(url);"));
        CHECK_FALSE(has_rule(guarded, "PG-SEC-003"));

        auto in_test = engine.evaluate(source("tests/client.ts", "const r = await fetch(url);"));
        CHECK_FALSE(has_rule(in_test, "PG-SEC-003"));
    }

    SECTION("File writes outside PathGuard") {
        auto bare = engine.evaluate(source("src/save.cpp",
            "std::ofstream out(path);\nout << data;\n"));
        CHECK(has_rule(bare, "PG-SEC-004"));

        auto guarded = engine.evaluate(source("src/save.cpp",
            "auto target = guard.resolve_path(name);\nstd::ofstream out(target);\n"));
        CHECK_FALSE(has_rule(guarded, "PG-SEC-004"));
    }

    SECTION("User input without normalization") {
        auto bare = engine.evaluate(source("src/api.js", "const q = req.query.name;"));
        CHECK(has_rule(bare, "PG-SEC-001"));

        auto guarded = engine.evaluate(source("src/api.js",
            "const q = UnicodeNormalizer.normalize(req.query.name);"));
        CHECK_FALSE(has_rule(guarded, "PG-SEC-001"));
    }

    SECTION("Clean code has no findings") {
        CHECK(engine.evaluate(source("src/math.ts",
            "export function add(a: number, b: number) { return a + b; }")).empty());
    }
}
