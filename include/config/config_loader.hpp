#pragma once

#include "auditor/finding.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "security/rate_limiter.hpp"

#include <toml++/toml.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace personaguard {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Content Validation Config
// ============================================================================

struct ContentConfig {
    Severity sanitize_threshold = Severity::HIGH;
    size_t max_length = 100'000;
    std::map<std::string, size_t> context_limits;   // Overrides per context tag
};

// ============================================================================
// Rate Limiting Config ([rate_limits.<operation>])
// ============================================================================

struct RateLimitsConfig {
    std::map<std::string, RateLimitConfig> operations;
};

// ============================================================================
// Credential Config
// ============================================================================

struct CredentialsConfig {
    std::string env_var = "GITHUB_TOKEN";
    std::string identity_endpoint = "https://api.github.com";
    uint32_t timeout_seconds = 10;
    uint32_t cache_ttl_seconds = 3600;
};

// ============================================================================
// Path / Command Config
// ============================================================================

struct PathsConfig {
    std::string root;
    std::vector<std::string> allowed_extensions = {".md", ".markdown", ".txt", ".yml", ".yaml"};
    size_t max_file_size = 500 * 1024;
};

struct CommandsConfig {
    std::vector<std::string> allowed = {"git", "npm", "node"};
};

// ============================================================================
// Security Log Config
// ============================================================================

struct SecurityLogConfig {
    size_t capacity = 1000;
    std::string persist_file;       // Empty = in-memory only
};

// ============================================================================
// Audit Config
// ============================================================================

struct AuditConfig {
    Severity fail_on = Severity::CRITICAL;
    std::string root;
    std::vector<std::string> root_markers;
    std::vector<std::string> exclude;
    std::vector<std::string> scanners = {"code", "dependency", "configuration"};
    size_t max_file_size = 1024 * 1024;
    size_t workers = 0;
    std::vector<Suppression> suppressions;
};

// ============================================================================
// PlatformConfig - Complete parsed configuration
// ============================================================================

struct PlatformConfig {
    LoggingConfig logging;
    ContentConfig content;
    RateLimitsConfig rate_limits;
    CredentialsConfig credentials;
    PathsConfig paths;
    CommandsConfig commands;
    SecurityLogConfig security_log;
    AuditConfig audit;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads persona-guard.toml
 *
 * String values support ${VAR} environment expansion. Type errors, unknown
 * severities and invalid suppression entries fail the load; nothing is
 * silently skipped.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        PlatformConfig config;

        static LoadResult ok(PlatformConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Standalone suppression file: [[suppressions]] rule / file / reason
    [[nodiscard]] static Result<std::vector<Suppression>> load_suppressions_file(
        const std::string& path);

    [[nodiscard]] static Result<std::vector<Suppression>> load_suppressions_string(
        const std::string& toml_content);

    /// All problems found, empty when valid
    [[nodiscard]] static std::vector<std::string> validate_config(const PlatformConfig& config);

    /// Expands ${VAR}; unset variables expand to ""
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

private:
    static PlatformConfig extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ContentConfig extract_content(const toml::table& root);
    static RateLimitsConfig extract_rate_limits(const toml::table& root);
    static CredentialsConfig extract_credentials(const toml::table& root);
    static PathsConfig extract_paths(const toml::table& root);
    static CommandsConfig extract_commands(const toml::table& root);
    static SecurityLogConfig extract_security_log(const toml::table& root);
    static AuditConfig extract_audit(const toml::table& root);
    static std::vector<Suppression> extract_suppressions(const toml::array& entries,
                                                         std::string_view section);

    static Result<std::vector<Suppression>> suppressions_from_table(const toml::table& tbl,
                                                                    std::string_view source);

    static LoadResult validate_and_return(PlatformConfig config);

    // Helper: severity name to enum, throws on unknown names
    static Severity parse_severity_field(const toml::table& tbl, std::string_view key,
                                         Severity fallback, std::string_view section);
};

} // namespace personaguard
