#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace personaguard {

/**
 * @brief Detects and repairs Unicode abuse in untrusted text
 *
 * Stripped:  bidi overrides/embeds/isolates (U+202A-202E, U+2066-2069),
 *            direction marks (U+200E/F, U+061C), zero-width characters
 *            (U+200B, U+2060, U+FEFF), C0/C1 control characters.
 * Replaced:  invalid UTF-8 bytes become U+FFFD.
 * Flagged:   mixed Latin + Cyrillic/Greek/Armenian letters inside one
 *            whitespace-delimited token (homograph). Confusables inside
 *            such a token are folded to their ASCII look-alike.
 *            Private-use code points, non-characters and excessive
 *            literal \uXXXX escapes are flagged but left in place.
 *
 * Legitimate multilingual text (CJK + Latin, accented Latin, emoji with
 * ZWJ sequences) passes byte-for-byte unchanged. Never throws.
 */
class UnicodeNormalizer {
public:
    enum class IssueKind {
        DIRECTION_OVERRIDE,
        DIRECTION_MARK,
        ZERO_WIDTH,
        CONTROL_CHARACTER,
        INVALID_ENCODING,
        MIXED_SCRIPT,
        PRIVATE_USE,
        NON_CHARACTER,
        ESCAPE_SEQUENCE_ABUSE
    };

    enum class Script {
        COMMON,     // Digits, punctuation, symbols, emoji, combining marks
        LATIN,
        CYRILLIC,
        GREEK,
        ARMENIAN,
        HEBREW,
        ARABIC,
        CJK,
        HANGUL,
        OTHER
    };

    struct Issue {
        IssueKind kind;
        Severity severity;
        size_t count = 0;
    };

    struct NormalizationResult {
        std::string normalized;
        std::vector<Issue> issues;     // At most one entry per kind

        [[nodiscard]] bool has(IssueKind kind) const;
        [[nodiscard]] bool is_clean() const { return issues.empty(); }
        [[nodiscard]] Severity max_severity() const;
    };

    /// More literal \uXXXX escapes than this is treated as obfuscation
    static constexpr size_t kMaxEscapeSequences = 10;

    [[nodiscard]] static NormalizationResult normalize(std::string_view input);

    [[nodiscard]] static Script script_of(char32_t cp);

    /// ASCII look-alike for a visually indistinguishable code point
    [[nodiscard]] static std::optional<char> confusable_ascii(char32_t cp);

    [[nodiscard]] static const char* issue_kind_to_string(IssueKind kind);
    [[nodiscard]] static Severity issue_severity(IssueKind kind);
};

} // namespace personaguard
