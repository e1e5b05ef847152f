#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace personaguard::utf8 {

inline constexpr char32_t kReplacementChar = 0xFFFD;

struct Decoded {
    char32_t cp = kReplacementChar;
    size_t length = 1;       // Bytes consumed (>= 1 even when invalid)
    bool valid = false;
};

/**
 * @brief Decode one code point starting at s[pos]
 *
 * Rejects overlong forms, surrogates and values above U+10FFFF.
 * On invalid input consumes a single byte so callers always make progress.
 */
[[nodiscard]] inline Decoded decode(std::string_view s, size_t pos) {
    const auto b0 = static_cast<unsigned char>(s[pos]);
    if (b0 < 0x80) {
        return {b0, 1, true};
    }

    size_t len = 0;
    char32_t cp = 0;
    char32_t min = 0;
    if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; min = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; min = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; min = 0x10000; }
    else return {};

    if (pos + len > s.size()) return {};
    for (size_t i = 1; i < len; ++i) {
        const auto b = static_cast<unsigned char>(s[pos + i]);
        if ((b & 0xC0) != 0x80) return {};
        cp = (cp << 6) | (b & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return {};
    return {cp, len, true};
}

/// Code points in s; each invalid byte counts as one
[[nodiscard]] inline size_t count(std::string_view s) {
    size_t n = 0;
    for (size_t pos = 0; pos < s.size(); pos += decode(s, pos).length) ++n;
    return n;
}

inline void append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

[[nodiscard]] inline std::string encode(char32_t cp) {
    std::string out;
    append(out, cp);
    return out;
}

} // namespace personaguard::utf8
