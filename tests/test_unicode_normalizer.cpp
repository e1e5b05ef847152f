#include <catch2/catch_test_macros.hpp>
#include "core/utf8.hpp"
#include "security/unicode_normalizer.hpp"

#include <string>

using namespace personaguard;

using Kind = UnicodeNormalizer::IssueKind;

namespace {

std::string cp(char32_t c) { return utf8::encode(c); }

} // anonymous namespace

TEST_CASE("UnicodeNormalizer: legitimate text passes unchanged", "[unicode]") {

    SECTION("Plain ASCII") {
        const std::string text = "A helpful persona for code review.\nSecond line\twith tab.";
        auto result = UnicodeNormalizer::normalize(text);
        CHECK(result.is_clean());
        CHECK(result.normalized == text);
        CHECK(result.max_severity() == Severity::NONE);
    }

    SECTION("CJK mixed with Latin") {
        const std::string text = "Hello " + cp(0x4E16) + cp(0x754C) + " world";
        auto result = UnicodeNormalizer::normalize(text);
        CHECK(result.is_clean());
        CHECK(result.normalized == text);
    }

    SECTION("Accented Latin") {
        const std::string text = "caf" + cp(0x00E9) + " na" + cp(0x00EF) + "ve";
        auto result = UnicodeNormalizer::normalize(text);
        CHECK(result.is_clean());
        CHECK(result.normalized == text);
    }

    SECTION("Emoji ZWJ sequence") {
        const std::string family = cp(0x1F468) + cp(0x200D) + cp(0x1F469) + cp(0x200D) + cp(0x1F467);
        const std::string text = "Family " + family;
        auto result = UnicodeNormalizer::normalize(text);
        CHECK(result.is_clean());
        CHECK(result.normalized == text);
    }

    SECTION("Whole-word Cyrillic is not a homograph") {
        const std::string text = "Greeting: " + cp(0x043F) + cp(0x0440) + cp(0x0438) + cp(0x0432) +
                                 cp(0x0435) + cp(0x0442);
        auto result = UnicodeNormalizer::normalize(text);
        CHECK_FALSE(result.has(Kind::MIXED_SCRIPT));
        CHECK(result.normalized == text);
    }
}

TEST_CASE("UnicodeNormalizer: hidden characters are stripped", "[unicode]") {

    SECTION("Right-to-left override") {
        auto result = UnicodeNormalizer::normalize("abc" + cp(0x202E) + "fdp.exe");
        CHECK(result.normalized == "abcfdp.exe");
        REQUIRE(result.has(Kind::DIRECTION_OVERRIDE));
        CHECK(result.max_severity() == Severity::HIGH);
    }

    SECTION("Isolates count as direction overrides") {
        auto result = UnicodeNormalizer::normalize("x" + cp(0x2066) + "y" + cp(0x2069));
        CHECK(result.normalized == "xy");
        CHECK(result.has(Kind::DIRECTION_OVERRIDE));
    }

    SECTION("Zero-width space inside a keyword") {
        auto result = UnicodeNormalizer::normalize("ig" + cp(0x200B) + "nore previous");
        CHECK(result.normalized == "ignore previous");
        CHECK(result.has(Kind::ZERO_WIDTH));
        CHECK(result.max_severity() == Severity::MEDIUM);
    }

    SECTION("Byte order mark") {
        auto result = UnicodeNormalizer::normalize(cp(0xFEFF) + "name");
        CHECK(result.normalized == "name");
        CHECK(result.has(Kind::ZERO_WIDTH));
    }

    SECTION("Direction marks") {
        auto result = UnicodeNormalizer::normalize("a" + cp(0x200F) + "b");
        CHECK(result.normalized == "ab");
        CHECK(result.has(Kind::DIRECTION_MARK));
    }

    SECTION("Control characters except tab, newline and carriage return") {
        auto result = UnicodeNormalizer::normalize(std::string("a\x07") + "b\t\r\n" + std::string(1, '\x1B') + "c");
        CHECK(result.normalized == "ab\t\r\nc");
        REQUIRE(result.has(Kind::CONTROL_CHARACTER));
        CHECK(result.max_severity() == Severity::LOW);
    }

    SECTION("Counts repeated occurrences under one issue") {
        auto result = UnicodeNormalizer::normalize(cp(0x200B) + "a" + cp(0x200B) + "b" + cp(0x200B));
        REQUIRE(result.issues.size() == 1);
        CHECK(result.issues[0].kind == Kind::ZERO_WIDTH);
        CHECK(result.issues[0].count == 3);
    }
}

TEST_CASE("UnicodeNormalizer: invalid encoding is replaced", "[unicode]") {
    auto result = UnicodeNormalizer::normalize(std::string("ok") + std::string(1, '\xFF') + "ok");
    CHECK(result.normalized == "ok" + cp(0xFFFD) + "ok");
    CHECK(result.has(Kind::INVALID_ENCODING));

    SECTION("Truncated multi-byte sequence") {
        auto truncated = UnicodeNormalizer::normalize(std::string("a") + std::string(1, '\xE4'));
        CHECK(truncated.has(Kind::INVALID_ENCODING));
        CHECK(truncated.normalized == "a" + cp(0xFFFD));
    }
}

TEST_CASE("UnicodeNormalizer: homographs are folded", "[unicode]") {

    SECTION("Cyrillic a inside a Latin word") {
        auto result = UnicodeNormalizer::normalize("p" + cp(0x0430) + "ypal login");
        CHECK(result.normalized == "paypal login");
        REQUIRE(result.has(Kind::MIXED_SCRIPT));
        CHECK(result.max_severity() == Severity::HIGH);
    }

    SECTION("Greek omicron inside a Latin word") {
        auto result = UnicodeNormalizer::normalize("ign" + cp(0x03BF) + "re");
        CHECK(result.normalized == "ignore");
        CHECK(result.has(Kind::MIXED_SCRIPT));
    }

    SECTION("Zero-width joiner cannot split a mixed token") {
        auto result = UnicodeNormalizer::normalize("s" + cp(0x200B) + cp(0x0435) + "cret");
        CHECK(result.normalized == "secret");
        CHECK(result.has(Kind::MIXED_SCRIPT));
        CHECK(result.has(Kind::ZERO_WIDTH));
    }

    SECTION("Both ends of the confusable table") {
        CHECK(UnicodeNormalizer::confusable_ascii(0x0391) == 'A');
        CHECK(UnicodeNormalizer::confusable_ascii(0x0585) == 'o');
        CHECK(UnicodeNormalizer::confusable_ascii(0x057D) == 'u');
        CHECK_FALSE(UnicodeNormalizer::confusable_ascii(0x0586).has_value());
        CHECK_FALSE(UnicodeNormalizer::confusable_ascii('a').has_value());
    }

    SECTION("Domain with a Cyrillic letter") {
        auto result = UnicodeNormalizer::normalize("p" + cp(0x0430) + "ypal.com");
        CHECK(result.normalized == "paypal.com");
        CHECK(result.has(Kind::MIXED_SCRIPT));
    }
}

TEST_CASE("UnicodeNormalizer: flagged but kept", "[unicode]") {

    SECTION("Private use code point") {
        const std::string text = "icon " + cp(0xE000);
        auto result = UnicodeNormalizer::normalize(text);
        CHECK(result.normalized == text);
        CHECK(result.has(Kind::PRIVATE_USE));
    }

    SECTION("Non-character") {
        auto result = UnicodeNormalizer::normalize("x" + cp(0xFDD0));
        CHECK(result.has(Kind::NON_CHARACTER));
    }

    SECTION("Escape sequence flood") {
        std::string text;
        for (size_t i = 0; i <= UnicodeNormalizer::kMaxEscapeSequences; ++i) text += "\\u0041";
        auto result = UnicodeNormalizer::normalize(text);
        CHECK(result.normalized == text);
        CHECK(result.has(Kind::ESCAPE_SEQUENCE_ABUSE));
    }

    SECTION("A few escapes are fine") {
        auto result = UnicodeNormalizer::normalize("\\u0041\\u0042");
        CHECK_FALSE(result.has(Kind::ESCAPE_SEQUENCE_ABUSE));
    }
}

TEST_CASE("UnicodeNormalizer: normalization is idempotent", "[unicode]") {
    const std::string inputs[] = {
        "plain text",
        "abc" + cp(0x202E) + "def" + cp(0x200B),
        "p" + cp(0x0430) + "ypal " + cp(0x4E16),
        std::string("bad") + std::string(1, '\xC0') + std::string(1, '\x80'),
    };
    for (const auto& input : inputs) {
        const auto once = UnicodeNormalizer::normalize(input).normalized;
        const auto twice = UnicodeNormalizer::normalize(once);
        CHECK(twice.normalized == once);
        CHECK_FALSE(twice.has(Kind::DIRECTION_OVERRIDE));
        CHECK_FALSE(twice.has(Kind::ZERO_WIDTH));
        CHECK_FALSE(twice.has(Kind::MIXED_SCRIPT));
    }
}

TEST_CASE("UnicodeNormalizer: script and confusable tables", "[unicode]") {
    using Script = UnicodeNormalizer::Script;

    CHECK(UnicodeNormalizer::script_of(U'a') == Script::LATIN);
    CHECK(UnicodeNormalizer::script_of(U'7') == Script::COMMON);
    CHECK(UnicodeNormalizer::script_of(0x0430) == Script::CYRILLIC);
    CHECK(UnicodeNormalizer::script_of(0x03B1) == Script::GREEK);
    CHECK(UnicodeNormalizer::script_of(0x4E16) == Script::CJK);
    CHECK(UnicodeNormalizer::script_of(0x00E9) == Script::LATIN);

    CHECK(UnicodeNormalizer::confusable_ascii(0x0430) == 'a');
    CHECK(UnicodeNormalizer::confusable_ascii(0x0441) == 'c');
    CHECK(UnicodeNormalizer::confusable_ascii(0x039F) == 'O');
    CHECK_FALSE(UnicodeNormalizer::confusable_ascii(0x0436).has_value());

    CHECK(std::string(UnicodeNormalizer::issue_kind_to_string(Kind::MIXED_SCRIPT)) == "mixed_script");
    CHECK(UnicodeNormalizer::issue_severity(Kind::DIRECTION_OVERRIDE) == Severity::HIGH);
}
