#include <catch2/catch_test_macros.hpp>
#include "security/regex_complexity_analyzer.hpp"

using namespace personaguard;

TEST_CASE("RegexComplexityAnalyzer: hazard classes are HIGH risk", "[regex_complexity]") {

    SECTION("Nested quantifier") {
        auto p = RegexComplexityAnalyzer::analyze("(a+)+");
        CHECK(p.risk == RiskLevel::HIGH);
        CHECK(p.hazard == "nested_quantifier");
        CHECK(p.max_content_length == RegexComplexityAnalyzer::kHighRiskMaxLength);
    }

    SECTION("Nested counted repetition") {
        auto p = RegexComplexityAnalyzer::analyze("(?:x{2,})*y");
        CHECK(p.risk == RiskLevel::HIGH);
        CHECK(p.hazard == "nested_quantifier");
    }

    SECTION("Overlapping alternation") {
        auto p = RegexComplexityAnalyzer::analyze("(a|a)*");
        CHECK(p.risk == RiskLevel::HIGH);
        CHECK(p.hazard == "overlapping_alternation");
    }

    SECTION("Prefix branches overlap") {
        auto p = RegexComplexityAnalyzer::analyze("(ab|abc)+");
        CHECK(p.hazard == "overlapping_alternation");
    }

    SECTION("Quantified alternation") {
        auto p = RegexComplexityAnalyzer::analyze("(cat|dog)+");
        CHECK(p.risk == RiskLevel::HIGH);
        CHECK(p.hazard == "quantified_alternation");
    }

    SECTION("Quantified lookaround") {
        auto p = RegexComplexityAnalyzer::analyze("(?=a+)b");
        CHECK(p.risk == RiskLevel::HIGH);
        CHECK(p.hazard == "quantified_lookaround");
    }

    SECTION("Hazard deep inside a larger pattern") {
        auto p = RegexComplexityAnalyzer::analyze(R"(^prefix\s+(?:[a-z]+\d+)+suffix$)");
        CHECK(p.risk == RiskLevel::HIGH);
    }
}

TEST_CASE("RegexComplexityAnalyzer: safe patterns", "[regex_complexity]") {

    SECTION("Literal text is LOW") {
        auto p = RegexComplexityAnalyzer::analyze("ignore previous instructions");
        CHECK(p.risk == RiskLevel::LOW);
        CHECK(p.hazard.empty());
        CHECK(p.quantifier_count == 0);
        CHECK(p.max_content_length == RegexComplexityAnalyzer::kLowRiskMaxLength);
    }

    SECTION("Single-level quantifiers are LOW") {
        auto p = RegexComplexityAnalyzer::analyze(R"(\bgh[pousr]_[A-Za-z0-9]{36}\b)");
        CHECK(p.risk == RiskLevel::LOW);
        CHECK(p.quantifier_count == 1);
    }

    SECTION("Unrepeated alternation group is LOW") {
        auto p = RegexComplexityAnalyzer::analyze(R"(\b(?:ignore|disregard)\s+all\b)");
        CHECK(p.risk == RiskLevel::LOW);
    }

    SECTION("Optional group holding a repeat is not nested") {
        auto p = RegexComplexityAnalyzer::analyze(R"((?:\s+x)?)");
        CHECK(p.risk == RiskLevel::LOW);
    }

    SECTION("Quantifier characters inside a class do not count") {
        auto p = RegexComplexityAnalyzer::analyze("[+*?]");
        CHECK(p.quantifier_count == 0);
        CHECK(p.risk == RiskLevel::LOW);
    }

    SECTION("Escaped metacharacters do not count") {
        auto p = RegexComplexityAnalyzer::analyze(R"(\(\+\)\*)");
        CHECK(p.quantifier_count == 0);
    }

    SECTION("Literal brace is not a quantifier") {
        auto p = RegexComplexityAnalyzer::analyze("x{y}");
        CHECK(p.quantifier_count == 0);
    }
}

TEST_CASE("RegexComplexityAnalyzer: many quantifiers are MEDIUM", "[regex_complexity]") {
    auto p = RegexComplexityAnalyzer::analyze(R"(a+b+c+d+e+f+)");
    CHECK(p.quantifier_count == 6);
    CHECK(p.risk == RiskLevel::MEDIUM);
    CHECK(p.max_content_length == RegexComplexityAnalyzer::kMediumRiskMaxLength);

    auto at_threshold = RegexComplexityAnalyzer::analyze(R"(a+b+c+d+e+)");
    CHECK(at_threshold.quantifier_count == RegexComplexityAnalyzer::kQuantifierThreshold);
    CHECK(at_threshold.risk == RiskLevel::LOW);
}

TEST_CASE("RegexComplexityAnalyzer: ceilings per risk tier", "[regex_complexity]") {
    CHECK(RegexComplexityAnalyzer::max_length_for(RiskLevel::LOW) == 100'000);
    CHECK(RegexComplexityAnalyzer::max_length_for(RiskLevel::MEDIUM) == 10'000);
    CHECK(RegexComplexityAnalyzer::max_length_for(RiskLevel::HIGH) == 1'000);
}
