#include "security/unicode_normalizer.hpp"
#include "core/utf8.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace personaguard {

namespace {

// Sorted by code point for binary search
constexpr auto kConfusables = std::to_array<std::pair<char32_t, char>>({
    {0x0391, 'A'}, {0x0392, 'B'}, {0x0395, 'E'}, {0x0396, 'Z'}, {0x0397, 'H'},
    {0x0399, 'I'}, {0x039A, 'K'}, {0x039C, 'M'}, {0x039D, 'N'}, {0x039F, 'O'},
    {0x03A1, 'P'}, {0x03A4, 'T'}, {0x03A5, 'Y'}, {0x03A7, 'X'}, {0x03BD, 'v'},
    {0x03BF, 'o'},
    {0x0405, 'S'}, {0x0406, 'I'}, {0x0408, 'J'}, {0x0410, 'A'}, {0x0412, 'B'},
    {0x0415, 'E'}, {0x041A, 'K'}, {0x041C, 'M'}, {0x041D, 'H'}, {0x041E, 'O'},
    {0x0420, 'P'}, {0x0421, 'C'}, {0x0422, 'T'}, {0x0423, 'Y'}, {0x0425, 'X'},
    {0x0430, 'a'}, {0x0435, 'e'}, {0x043E, 'o'}, {0x0440, 'p'}, {0x0441, 'c'},
    {0x0443, 'y'}, {0x0445, 'x'}, {0x0455, 's'}, {0x0456, 'i'}, {0x0458, 'j'},
    {0x04BB, 'h'}, {0x04CF, 'l'},
    {0x0501, 'd'}, {0x051A, 'Q'}, {0x051B, 'q'}, {0x051C, 'W'}, {0x051D, 'w'},
    {0x0570, 'h'}, {0x057D, 'u'}, {0x0585, 'o'},
});

static_assert(std::ranges::is_sorted(kConfusables, {}, &std::pair<char32_t, char>::first),
              "confusable table must be sorted by code point");

bool is_direction_override(char32_t cp) {
    return (cp >= 0x202A && cp <= 0x202E) || (cp >= 0x2066 && cp <= 0x2069);
}

bool is_direction_mark(char32_t cp) {
    return cp == 0x200E || cp == 0x200F || cp == 0x061C;
}

bool is_zero_width(char32_t cp) {
    return cp == 0x200B || cp == 0x2060 || cp == 0xFEFF;
}

bool is_control(char32_t cp) {
    if (cp == '\t' || cp == '\n' || cp == '\r') return false;
    return cp < 0x20 || cp == 0x7F || (cp >= 0x80 && cp <= 0x9F);
}

bool is_private_use(char32_t cp) {
    return (cp >= 0xE000 && cp <= 0xF8FF) || cp >= 0xF0000;
}

bool is_non_character(char32_t cp) {
    return (cp >= 0xFDD0 && cp <= 0xFDEF) || (cp & 0xFFFE) == 0xFFFE;
}

bool is_space(char32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' ||
           cp == 0x00A0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

size_t count_escape_sequences(std::string_view s) {
    size_t count = 0;
    for (size_t i = 0; i + 6 <= s.size(); ++i) {
        if (s[i] != '\\' || (s[i + 1] != 'u' && s[i + 1] != 'U')) continue;
        bool hex = true;
        for (size_t j = 2; j < 6; ++j) {
            if (!std::isxdigit(static_cast<unsigned char>(s[i + j]))) {
                hex = false;
                break;
            }
        }
        if (hex) {
            ++count;
            i += 5;
        }
    }
    return count;
}

class IssueCollector {
public:
    void add(UnicodeNormalizer::IssueKind kind) {
        for (auto& issue : issues_) {
            if (issue.kind == kind) {
                ++issue.count;
                return;
            }
        }
        issues_.push_back({kind, UnicodeNormalizer::issue_severity(kind), 1});
    }

    std::vector<UnicodeNormalizer::Issue> take() { return std::move(issues_); }

private:
    std::vector<UnicodeNormalizer::Issue> issues_;
};

// Folds confusables in [begin, end) when the token mixes Latin with a look-alike script
void check_token(std::vector<char32_t>& cps, size_t begin, size_t end, IssueCollector& issues) {
    bool latin = false;
    bool lookalike_script = false;
    for (size_t i = begin; i < end; ++i) {
        const auto script = UnicodeNormalizer::script_of(cps[i]);
        if (script == UnicodeNormalizer::Script::LATIN) {
            latin = true;
        } else if (script == UnicodeNormalizer::Script::CYRILLIC ||
                   script == UnicodeNormalizer::Script::GREEK ||
                   script == UnicodeNormalizer::Script::ARMENIAN) {
            lookalike_script = true;
        }
    }
    if (!latin || !lookalike_script) return;

    issues.add(UnicodeNormalizer::IssueKind::MIXED_SCRIPT);
    for (size_t i = begin; i < end; ++i) {
        if (const auto ascii = UnicodeNormalizer::confusable_ascii(cps[i])) {
            cps[i] = static_cast<char32_t>(*ascii);
        } else if (cps[i] >= 0xFF21 && cps[i] <= 0xFF5A &&
                   UnicodeNormalizer::script_of(cps[i]) == UnicodeNormalizer::Script::LATIN) {
            cps[i] -= 0xFEE0;  // Fullwidth Latin -> ASCII
        }
    }
}

} // namespace

bool UnicodeNormalizer::NormalizationResult::has(IssueKind kind) const {
    return std::ranges::any_of(issues, [kind](const Issue& i) { return i.kind == kind; });
}

Severity UnicodeNormalizer::NormalizationResult::max_severity() const {
    Severity result = Severity::NONE;
    for (const auto& issue : issues) {
        result = personaguard::max_severity(result, issue.severity);
    }
    return result;
}

UnicodeNormalizer::NormalizationResult UnicodeNormalizer::normalize(std::string_view input) {
    IssueCollector issues;

    std::vector<char32_t> cps;
    cps.reserve(input.size());

    size_t pos = 0;
    while (pos < input.size()) {
        const auto d = utf8::decode(input, pos);
        pos += d.length;

        if (!d.valid) {
            issues.add(IssueKind::INVALID_ENCODING);
            cps.push_back(utf8::kReplacementChar);
            continue;
        }

        const char32_t cp = d.cp;
        if (is_direction_override(cp)) {
            issues.add(IssueKind::DIRECTION_OVERRIDE);
            continue;
        }
        if (is_direction_mark(cp)) {
            issues.add(IssueKind::DIRECTION_MARK);
            continue;
        }
        if (is_zero_width(cp)) {
            issues.add(IssueKind::ZERO_WIDTH);
            continue;
        }
        if (is_control(cp)) {
            issues.add(IssueKind::CONTROL_CHARACTER);
            continue;
        }
        if (is_private_use(cp)) {
            issues.add(IssueKind::PRIVATE_USE);
        } else if (is_non_character(cp)) {
            issues.add(IssueKind::NON_CHARACTER);
        }
        cps.push_back(cp);
    }

    // Token pass runs on the stripped sequence so hidden characters cannot split a token
    size_t token_start = 0;
    for (size_t i = 0; i <= cps.size(); ++i) {
        if (i == cps.size() || is_space(cps[i])) {
            if (i > token_start) {
                check_token(cps, token_start, i, issues);
            }
            token_start = i + 1;
        }
    }

    if (count_escape_sequences(input) > kMaxEscapeSequences) {
        issues.add(IssueKind::ESCAPE_SEQUENCE_ABUSE);
    }

    NormalizationResult result;
    result.normalized.reserve(input.size());
    for (const char32_t cp : cps) {
        utf8::append(result.normalized, cp);
    }
    result.issues = issues.take();
    return result;
}

UnicodeNormalizer::Script UnicodeNormalizer::script_of(char32_t cp) {
    if ((cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z')) return Script::LATIN;
    if (cp < 0x80) return Script::COMMON;
    if ((cp >= 0x00C0 && cp <= 0x024F && cp != 0x00D7 && cp != 0x00F7) ||
        (cp >= 0x1E00 && cp <= 0x1EFF) || (cp >= 0x2C60 && cp <= 0x2C7F) ||
        (cp >= 0xA720 && cp <= 0xA7FF) ||
        (cp >= 0xFF21 && cp <= 0xFF3A) || (cp >= 0xFF41 && cp <= 0xFF5A)) {
        return Script::LATIN;
    }
    if ((cp >= 0x0370 && cp <= 0x03FF) || (cp >= 0x1F00 && cp <= 0x1FFF)) return Script::GREEK;
    if ((cp >= 0x0400 && cp <= 0x052F) || (cp >= 0x1C80 && cp <= 0x1C8F) ||
        (cp >= 0x2DE0 && cp <= 0x2DFF) || (cp >= 0xA640 && cp <= 0xA69F)) {
        return Script::CYRILLIC;
    }
    if (cp >= 0x0530 && cp <= 0x058F) return Script::ARMENIAN;
    if (cp >= 0x0590 && cp <= 0x05FF) return Script::HEBREW;
    if ((cp >= 0x0600 && cp <= 0x06FF) || (cp >= 0x0750 && cp <= 0x077F) ||
        (cp >= 0x08A0 && cp <= 0x08FF) || (cp >= 0xFB50 && cp <= 0xFDFF) ||
        (cp >= 0xFE70 && cp <= 0xFEFC)) {
        return Script::ARABIC;
    }
    if ((cp >= 0x3040 && cp <= 0x30FF) || (cp >= 0x3400 && cp <= 0x4DBF) ||
        (cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0xF900 && cp <= 0xFAFF) ||
        (cp >= 0x20000 && cp <= 0x2FFFF)) {
        return Script::CJK;
    }
    if ((cp >= 0xAC00 && cp <= 0xD7AF) || (cp >= 0x1100 && cp <= 0x11FF) ||
        (cp >= 0x3130 && cp <= 0x318F)) {
        return Script::HANGUL;
    }
    if ((cp >= 0x0900 && cp <= 0x0DFF) || (cp >= 0x0E00 && cp <= 0x0EFF) ||
        (cp >= 0x10A0 && cp <= 0x10FF) || (cp >= 0x13A0 && cp <= 0x13FF)) {
        return Script::OTHER;
    }
    return Script::COMMON;
}

std::optional<char> UnicodeNormalizer::confusable_ascii(char32_t cp) {
    const auto it = std::ranges::lower_bound(kConfusables, cp, {},
        [](const auto& entry) { return entry.first; });
    if (it != kConfusables.end() && it->first == cp) {
        return it->second;
    }
    return std::nullopt;
}

const char* UnicodeNormalizer::issue_kind_to_string(IssueKind kind) {
    switch (kind) {
        case IssueKind::DIRECTION_OVERRIDE:    return "direction_override";
        case IssueKind::DIRECTION_MARK:        return "direction_mark";
        case IssueKind::ZERO_WIDTH:            return "zero_width";
        case IssueKind::CONTROL_CHARACTER:     return "control_character";
        case IssueKind::INVALID_ENCODING:      return "invalid_encoding";
        case IssueKind::MIXED_SCRIPT:          return "mixed_script";
        case IssueKind::PRIVATE_USE:           return "private_use";
        case IssueKind::NON_CHARACTER:         return "non_character";
        case IssueKind::ESCAPE_SEQUENCE_ABUSE: return "escape_sequence_abuse";
    }
    return "unknown";
}

Severity UnicodeNormalizer::issue_severity(IssueKind kind) {
    switch (kind) {
        case IssueKind::DIRECTION_OVERRIDE:
        case IssueKind::MIXED_SCRIPT:
        case IssueKind::ESCAPE_SEQUENCE_ABUSE:
            return Severity::HIGH;
        case IssueKind::ZERO_WIDTH:
        case IssueKind::DIRECTION_MARK:
        case IssueKind::PRIVATE_USE:
            return Severity::MEDIUM;
        case IssueKind::CONTROL_CHARACTER:
        case IssueKind::INVALID_ENCODING:
        case IssueKind::NON_CHARACTER:
            return Severity::LOW;
    }
    return Severity::LOW;
}

} // namespace personaguard
