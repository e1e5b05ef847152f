#include "security/input_validator.hpp"
#include "audit/security_log.hpp"
#include "core/utils.hpp"
#include "security/content_validator.hpp"

#include <arpa/inet.h>
#include <re2/re2.h>

#include <algorithm>
#include <format>
#include <vector>

namespace personaguard {

namespace {

bool full_match(std::string_view text, const RE2& re) {
    return RE2::FullMatch(re2::StringPiece(text.data(), text.size()), re);
}

bool is_stripped_query_char(unsigned char c) {
    if (c < 0x20 || c == 0x7F) return true;
    switch (c) {
        // HTML-significant
        case '<': case '>': case '\'': case '"': case '&':
        // Shell metacharacters
        case ';': case '|': case '`': case '$': case '(': case ')':
        case '!': case '\\': case '~': case '*': case '?': case '{': case '}':
            return true;
        default:
            return false;
    }
}

/// Strip U+202E and U+FEFF encoded as UTF-8
std::string strip_invisible(std::string_view s) {
    static constexpr std::string_view kRlo = "\xE2\x80\xAE";
    static constexpr std::string_view kBom = "\xEF\xBB\xBF";
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        const auto rest = s.substr(i);
        if (rest.starts_with(kRlo) || rest.starts_with(kBom)) {
            i += 3;
            continue;
        }
        out += s[i++];
    }
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Decode %XX sequences; nullopt on a malformed escape
std::optional<std::string> percent_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') {
            out += s[i];
            continue;
        }
        if (i + 2 >= s.size()) return std::nullopt;
        const int hi = hex_value(s[i + 1]);
        const int lo = hex_value(s[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

bool has_control_or_space(std::string_view s) {
    return std::ranges::any_of(s, [](char ch) {
        const auto c = static_cast<unsigned char>(ch);
        return c <= 0x20 || c == 0x7F;
    });
}

/// inet_aton style component: 0x.. hex, leading 0 octal, else decimal
std::optional<uint64_t> parse_ipv4_part(std::string_view part) {
    if (part.empty()) return std::nullopt;
    if (part.size() > 2 && part[0] == '0' && (part[1] == 'x' || part[1] == 'X')) {
        return utils::try_parse_int<uint64_t>(part.substr(2), 16);
    }
    if (part.size() > 1 && part[0] == '0') {
        return utils::try_parse_int<uint64_t>(part.substr(1), 8);
    }
    return utils::try_parse_int<uint64_t>(part, 10);
}

} // anonymous namespace

InputValidator::InputValidator(SecurityLog& log, const ContentValidator& content)
    : log_(log), content_(content) {}

template <typename T>
Result<T> InputValidator::reject(std::string_view operation, std::string message) const {
    log_.record(SecurityEventType::INPUT_REJECTED, Severity::MEDIUM, "InputValidator",
                message, {{"operation", std::string(operation)}});
    return Result<T>::error(ErrorCategory::VALIDATION_REJECTED, std::move(message));
}

// ============================================================================
// Simple fields
// ============================================================================

Result<std::string> InputValidator::validate_search_query(std::string_view query) const {
    if (query.size() < kMinSearchQuery) {
        return reject<std::string>("search-query",
            std::format("Search query too short (minimum {} characters)", kMinSearchQuery));
    }
    if (query.size() > kMaxSearchQuery) {
        return reject<std::string>("search-query",
            std::format("Search query too long (max {} characters)", kMaxSearchQuery));
    }

    std::string stripped;
    for (const char ch : strip_invisible(query)) {
        if (!is_stripped_query_char(static_cast<unsigned char>(ch))) stripped += ch;
    }
    stripped = utils::trim(stripped);

    if (stripped.empty()) {
        return reject<std::string>("search-query", "Search query contains only invalid characters");
    }
    return Result<std::string>::ok(std::move(stripped));
}

Result<std::string> InputValidator::validate_persona_identifier(std::string_view identifier) const {
    static const RE2 kIdentifier("[A-Za-z0-9 ._-]+");

    if (identifier.empty()) {
        return reject<std::string>("persona-identifier", "Persona identifier must not be empty");
    }
    if (identifier.size() > kMaxIdentifier) {
        return reject<std::string>("persona-identifier",
            std::format("Persona identifier too long (max {} characters)", kMaxIdentifier));
    }

    const std::string trimmed = utils::trim(identifier);
    if (trimmed.empty() || !full_match(trimmed, kIdentifier)) {
        return reject<std::string>("persona-identifier",
            "Persona identifier may contain letters, digits, spaces, '.', '-' and '_' only");
    }
    if (trimmed.find("..") != std::string::npos) {
        return reject<std::string>("persona-identifier", "Persona identifier must not contain '..'");
    }
    return Result<std::string>::ok(trimmed);
}

Result<std::string> InputValidator::validate_username(std::string_view username) const {
    // Alphanumerics separated by single hyphens, no leading or trailing hyphen
    static const RE2 kUsername("[A-Za-z0-9](?:[A-Za-z0-9]|-[A-Za-z0-9])*");

    if (username.empty() || username.size() > kMaxUsername) {
        return reject<std::string>("username",
            std::format("Username must be 1-{} characters", kMaxUsername));
    }
    if (!full_match(username, kUsername)) {
        return reject<std::string>("username",
            "Invalid username format. Use letters, digits and single hyphens only");
    }
    return Result<std::string>::ok(utils::to_lower(username));
}

Result<std::string> InputValidator::validate_collection_path(std::string_view path) const {
    static const RE2 kPathChars("[A-Za-z0-9/._-]+");

    if (path.empty()) {
        return reject<std::string>("collection-path", "Collection path must not be empty");
    }
    if (path.size() > kMaxCollectionPath) {
        return reject<std::string>("collection-path",
            std::format("Collection path too long (max {} characters)", kMaxCollectionPath));
    }

    const std::string lower = utils::to_lower(path);
    const auto decoded = percent_decode(lower);
    for (const std::string_view candidate : {std::string_view(lower),
                                              decoded ? std::string_view(*decoded) : std::string_view()}) {
        if (candidate.find("..") != std::string_view::npos ||
            candidate.find("./") != std::string_view::npos ||
            candidate.find('\\') != std::string_view::npos ||
            candidate.find("%2e") != std::string_view::npos ||
            candidate.find("%5c") != std::string_view::npos) {
            return reject<std::string>("collection-path",
                                       "Path traversal not allowed in collection path");
        }
    }

    if (!full_match(path, kPathChars)) {
        return reject<std::string>("collection-path", "Invalid characters in collection path");
    }

    const auto slash = path.find('/');
    const auto section = path.substr(0, slash);
    const bool known_section = std::ranges::find(kCollectionSections, section) != kCollectionSections.end();
    if (!known_section || slash == std::string_view::npos) {
        return reject<std::string>("collection-path",
            "Collection path must start with a known section directory");
    }
    if (!lower.ends_with(".md") || path.ends_with("/") || path.find("//") != std::string_view::npos) {
        return reject<std::string>("collection-path", "Collection path must name a .md file");
    }
    return Result<std::string>::ok(std::string(path));
}

Result<int> InputValidator::validate_expiry_days(int64_t days) const {
    if (days < kMinExpiryDays || days > kMaxExpiryDays) {
        return reject<int>("expiry-days",
            std::format("Expiry days must be between {} and {}", kMinExpiryDays, kMaxExpiryDays));
    }
    return Result<int>::ok(static_cast<int>(days));
}

Result<EditField> InputValidator::validate_edit_field(std::string_view field,
                                                      std::string_view value) const {
    const std::string name = utils::to_lower(utils::trim(field));
    if (std::ranges::find(kEditableFields, std::string_view(name)) == kEditableFields.end()) {
        std::string allowed;
        for (const auto f : kEditableFields) {
            if (!allowed.empty()) allowed += ", ";
            allowed += f;
        }
        return reject<EditField>("edit-field",
            std::format("Invalid field name. Must be one of: {}", allowed));
    }

    const std::string_view context = name == "instructions" ? "persona-body" : "metadata-field";
    auto safe = content_.require_safe(value, context);
    if (!safe.is_ok()) {
        return Result<EditField>::error(safe.error_category(),
            std::format("Value for '{}' rejected: {}", name, safe.error_message()));
    }
    return Result<EditField>::ok(EditField{name, std::move(safe.value())});
}

// ============================================================================
// Import URL / SSRF
// ============================================================================

std::optional<uint32_t> InputValidator::parse_ipv4_literal(std::string_view host) {
    if (host.empty() || host.back() == '.') return std::nullopt;

    std::vector<uint64_t> parts;
    size_t start = 0;
    while (start <= host.size()) {
        const auto dot = host.find('.', start);
        const auto part = host.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        const auto value = parse_ipv4_part(part);
        if (!value) return std::nullopt;
        parts.push_back(*value);
        if (parts.size() > 4) return std::nullopt;
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }

    // a.b.c.d; a.b.c (c is 16 bits); a.b (b is 24 bits); a (32 bits)
    uint64_t address = 0;
    const size_t n = parts.size();
    for (size_t i = 0; i + 1 < n; ++i) {
        if (parts[i] > 0xFF) return std::nullopt;
        address |= parts[i] << (8 * (3 - i));
    }
    const uint64_t last_max = (n == 1) ? 0xFFFFFFFFull : ((1ull << (8 * (5 - n))) - 1);
    if (parts.back() > last_max) return std::nullopt;
    address |= parts.back();
    return static_cast<uint32_t>(address);
}

bool InputValidator::is_blocked_ipv4(uint32_t address) {
    const uint32_t a = address >> 24;
    const uint32_t b = (address >> 16) & 0xFF;

    if (a == 0) return true;                              // 0.0.0.0/8
    if (a == 10) return true;                             // 10.0.0.0/8
    if (a == 127) return true;                            // loopback
    if (a == 169 && b == 254) return true;                // link-local
    if (a == 172 && b >= 16 && b <= 31) return true;      // 172.16.0.0/12
    if (a == 192 && b == 168) return true;                // 192.168.0.0/16
    if (a == 100 && b >= 64 && b <= 127) return true;     // CGNAT 100.64.0.0/10
    if (address == 0xFFFFFFFFu) return true;              // broadcast
    return false;
}

std::optional<InputValidator::Ipv6Address> InputValidator::parse_ipv6_literal(std::string_view host) {
    const std::string text(host);
    Ipv6Address bytes{};
    if (text.find('%') != std::string::npos || ::inet_pton(AF_INET6, text.c_str(), bytes.data()) != 1) {
        return std::nullopt;
    }
    return bytes;
}

bool InputValidator::is_blocked_ipv6(const Ipv6Address& a) {
    const auto embedded_v4 = [&] {
        return (uint32_t{a[12]} << 24) | (uint32_t{a[13]} << 16) | (uint32_t{a[14]} << 8) | a[15];
    };
    const auto zero_through = [&](size_t n) {
        return std::all_of(a.begin(), a.begin() + static_cast<std::ptrdiff_t>(n),
                           [](uint8_t b) { return b == 0; });
    };

    // ::, ::1 and IPv4-compatible ::a.b.c.d
    if (zero_through(12)) return is_blocked_ipv4(embedded_v4());
    // IPv4-mapped ::ffff:a.b.c.d
    if (zero_through(10) && a[10] == 0xff && a[11] == 0xff) return is_blocked_ipv4(embedded_v4());
    // NAT64 64:ff9b::/96
    if (a[0] == 0x00 && a[1] == 0x64 && a[2] == 0xff && a[3] == 0x9b &&
        std::all_of(a.begin() + 4, a.begin() + 12, [](uint8_t b) { return b == 0; })) {
        return is_blocked_ipv4(embedded_v4());
    }
    if ((a[0] & 0xfe) == 0xfc) return true;                     // fc00::/7
    if (a[0] == 0xfe && (a[1] & 0xc0) == 0x80) return true;     // fe80::/10
    if (a[0] == 0xff) return true;                              // multicast
    return false;
}

bool InputValidator::is_blocked_host(std::string_view raw_host) {
    std::string host = utils::to_lower(raw_host);
    while (!host.empty() && host.back() == '.') host.pop_back();

    if (host.empty()) return true;
    if (host == "localhost" || host.ends_with(".localhost")) return true;

    if (host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    if (host.find(':') != std::string::npos) {
        const auto v6 = parse_ipv6_literal(host);
        return !v6 || is_blocked_ipv6(*v6);
    }

    const auto v4 = parse_ipv4_literal(host);
    return v4 && is_blocked_ipv4(*v4);
}

Result<std::string> InputValidator::validate_import_url(std::string_view url) const {
    static const RE2 kHostname("[a-z0-9.-]+");

    if (url.empty()) {
        return reject<std::string>("import-url", "URL must not be empty");
    }
    if (url.size() > kMaxUrl) {
        return reject<std::string>("import-url",
            std::format("URL too long (max {} characters)", kMaxUrl));
    }
    if (url.starts_with("//")) {
        return reject<std::string>("import-url", "Protocol-relative URLs are not allowed");
    }

    // Inspect the decoded form so %-encoding cannot hide a host
    const std::string decoded = percent_decode(url).value_or(std::string(url));
    if (has_control_or_space(decoded)) {
        return reject<std::string>("import-url", "URL contains whitespace or control characters");
    }

    const auto scheme_end = decoded.find("://");
    if (scheme_end == std::string::npos) {
        return reject<std::string>("import-url", "Invalid URL format");
    }
    const std::string scheme = utils::to_lower(std::string_view(decoded).substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        return reject<std::string>("import-url", "Only HTTP(S) URLs are allowed");
    }

    const std::string_view rest = std::string_view(decoded).substr(scheme_end + 3);
    const std::string_view authority = rest.substr(0, rest.find_first_of("/?#"));
    if (authority.find('@') != std::string_view::npos) {
        return reject<std::string>("import-url", "Credentials in URLs are not allowed");
    }

    std::string_view host = authority;
    std::string_view port;
    if (host.starts_with("[")) {
        const auto close = host.find(']');
        if (close == std::string_view::npos) {
            return reject<std::string>("import-url", "Invalid URL format");
        }
        port = host.substr(close + 1);
        host = host.substr(0, close + 1);
    } else if (const auto colon = host.rfind(':'); colon != std::string_view::npos) {
        port = host.substr(colon);
        host = host.substr(0, colon);
    }
    if (!port.empty()) {
        if (!port.starts_with(":") ||
            !utils::try_parse_int<uint16_t>(port.substr(1)).has_value()) {
            return reject<std::string>("import-url", "Invalid port in URL");
        }
    }

    if (host.empty()) {
        return reject<std::string>("import-url", "URL has no host");
    }
    if (is_blocked_host(host)) {
        return reject<std::string>("import-url", "Private network URLs are not allowed");
    }
    if (!host.starts_with("[") && !full_match(utils::to_lower(host), kHostname)) {
        return reject<std::string>("import-url", "Hostname must be ASCII (use the punycode form)");
    }

    return Result<std::string>::ok(std::string(url));
}

} // namespace personaguard
