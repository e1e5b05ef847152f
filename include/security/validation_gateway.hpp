#pragma once

#include "config/config_loader.hpp"
#include "security/command_guard.hpp"
#include "security/content_validator.hpp"
#include "security/credential_guard.hpp"
#include "security/input_validator.hpp"
#include "security/path_guard.hpp"
#include "security/pattern_library.hpp"
#include "security/rate_limiter.hpp"
#include "security/secure_structured_parser.hpp"
#include "security/unicode_normalizer.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace personaguard {

class SecurityLog;

/**
 * @brief The validator API consumed by persona storage, the marketplace
 * client and the sharer
 *
 * Owns one instance of every guard, wired to the injected SecurityLog and
 * configured from PlatformConfig. The scope verifier defaults to the HTTPS
 * identity endpoint; tests inject a mock.
 */
class ValidationGateway {
public:
    ValidationGateway(const PlatformConfig& config, SecurityLog& log,
                      std::shared_ptr<IScopeVerifier> verifier = nullptr);

    ValidationGateway(const ValidationGateway&) = delete;
    ValidationGateway& operator=(const ValidationGateway&) = delete;

    [[nodiscard]] Verdict validate_content(std::string_view text, std::string_view context) const;

    [[nodiscard]] UnicodeNormalizer::NormalizationResult normalize_unicode(std::string_view text) const;

    [[nodiscard]] Result<std::filesystem::path> resolve_path(std::string_view candidate,
                                                             const std::filesystem::path& root) const;

    /// Against the configured paths.root
    [[nodiscard]] Result<std::filesystem::path> resolve_path(std::string_view candidate) const;

    [[nodiscard]] bool is_safe_command(std::string_view executable,
                                       const std::vector<std::string>& args) const;

    [[nodiscard]] RateLimitResult check_rate(const std::string& key);

    [[nodiscard]] std::optional<Credential> get_credential() const;
    [[nodiscard]] std::optional<Credential> get_credential(const std::string& env_var) const;

    [[nodiscard]] static std::string redact(std::string_view token);

    [[nodiscard]] const SecureStructuredParser& parser() const { return *parser_; }
    [[nodiscard]] const InputValidator& input_validator() const { return *inputs_; }
    [[nodiscard]] CredentialGuard& credential_guard() { return *credentials_; }
    [[nodiscard]] const ContentValidator& content_validator() const { return *content_; }
    [[nodiscard]] const PathGuard& path_guard() const { return *paths_; }
    [[nodiscard]] const CommandGuard& command_guard() const { return *commands_; }
    [[nodiscard]] RateLimiter& rate_limiter() { return *limiter_; }

    // Component configs derived from PlatformConfig
    [[nodiscard]] static ContentValidator::Config content_config(const ContentConfig& cfg);
    [[nodiscard]] static RateLimiter::Config rate_limiter_config(const RateLimitsConfig& cfg);

private:
    SecurityLog& log_;
    std::filesystem::path root_;

    std::shared_ptr<const PatternLibrary> library_;
    std::unique_ptr<ContentValidator> content_;
    std::unique_ptr<SecureStructuredParser> parser_;
    std::unique_ptr<PathGuard> paths_;
    std::unique_ptr<CommandGuard> commands_;
    std::unique_ptr<RateLimiter> limiter_;
    std::unique_ptr<CredentialGuard> credentials_;
    std::unique_ptr<InputValidator> inputs_;
};

} // namespace personaguard
