#pragma once

#include "core/error.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace personaguard {

class ContentValidator;
class SecurityLog;

/// Field accepted by edit operations, with its validated value
struct EditField {
    std::string field;
    std::string value;
};

/**
 * @brief Validators for request fields coming from tool calls
 *
 * Every rejection returns VALIDATION_REJECTED with a message that does not
 * echo the offending input, and records an INPUT_REJECTED event.
 */
class InputValidator {
public:
    static constexpr size_t kMinSearchQuery = 2;
    static constexpr size_t kMaxSearchQuery = 200;
    static constexpr size_t kMaxIdentifier = 100;
    static constexpr size_t kMaxUsername = 39;
    static constexpr size_t kMaxCollectionPath = 500;
    static constexpr size_t kMaxUrl = 2048;
    static constexpr int kMinExpiryDays = 1;
    static constexpr int kMaxExpiryDays = 365;

    static constexpr std::array<std::string_view, 8> kEditableFields = {
        "name", "description", "category", "instructions",
        "triggers", "version", "author", "tags",
    };

    static constexpr std::array<std::string_view, 7> kCollectionSections = {
        "personas", "skills", "agents", "prompts", "templates", "tools", "ensembles",
    };

    InputValidator(SecurityLog& log, const ContentValidator& content);

    /// Strips control, HTML and shell characters; 2-200 chars
    [[nodiscard]] Result<std::string> validate_search_query(std::string_view query) const;

    /// Persona name or filename: alnum, space, '-', '_', '.'; at most 100
    [[nodiscard]] Result<std::string> validate_persona_identifier(std::string_view identifier) const;

    /// GitHub login rules; returned lowercase
    [[nodiscard]] Result<std::string> validate_username(std::string_view username) const;

    /// "<section>/.../<file>.md" inside the collection, no traversal
    [[nodiscard]] Result<std::string> validate_collection_path(std::string_view path) const;

    /// http(s) only, no userinfo, no local/private destinations
    [[nodiscard]] Result<std::string> validate_import_url(std::string_view url) const;

    [[nodiscard]] Result<EditField> validate_edit_field(std::string_view field,
                                                        std::string_view value) const;

    [[nodiscard]] Result<int> validate_expiry_days(int64_t days) const;

    /// Parse an IPv4 literal in dotted, decimal, hex or octal notation
    [[nodiscard]] static std::optional<uint32_t> parse_ipv4_literal(std::string_view host);

    /// Loopback, private, link-local, CGNAT or unspecified
    [[nodiscard]] static bool is_blocked_ipv4(uint32_t address);

    using Ipv6Address = std::array<uint8_t, 16>;

    /// Any textual IPv6 form inet_pton accepts; zone ids are refused
    [[nodiscard]] static std::optional<Ipv6Address> parse_ipv6_literal(std::string_view host);

    /// Loopback, unspecified, unique-local, link-local, multicast, or an
    /// embedded IPv4 address that is itself blocked
    [[nodiscard]] static bool is_blocked_ipv6(const Ipv6Address& address);

    /// Unparseable IPv6 literals are blocked
    [[nodiscard]] static bool is_blocked_host(std::string_view host);

private:
    template <typename T>
    Result<T> reject(std::string_view operation, std::string message) const;

    SecurityLog& log_;
    const ContentValidator& content_;
};

} // namespace personaguard
