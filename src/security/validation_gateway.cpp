#include "security/validation_gateway.hpp"
#include "audit/security_log.hpp"
#include "core/utils.hpp"

#include <format>

namespace personaguard {

ContentValidator::Config ValidationGateway::content_config(const ContentConfig& cfg) {
    ContentValidator::Config out;
    out.reject_threshold = cfg.sanitize_threshold;
    out.default_max_length = cfg.max_length;
    for (const auto& [context, limit] : cfg.context_limits) {
        out.context_limits[context] = limit;
    }
    return out;
}

RateLimiter::Config ValidationGateway::rate_limiter_config(const RateLimitsConfig& cfg) {
    auto out = RateLimiter::Config::with_presets();
    for (const auto& [operation, limit] : cfg.operations) {
        if (operation == rate_limits::kDefault) {
            out.default_limit = limit;
        } else {
            out.operation_limits[operation] = limit;
        }
    }
    return out;
}

ValidationGateway::ValidationGateway(const PlatformConfig& config, SecurityLog& log,
                                     std::shared_ptr<IScopeVerifier> verifier)
    : log_(log),
      root_(config.paths.root),
      library_(std::make_shared<const PatternLibrary>(PatternLibrary::with_defaults())) {

    content_ = std::make_unique<ContentValidator>(library_, log_, content_config(config.content));
    parser_ = std::make_unique<SecureStructuredParser>(*content_, log_);

    PathGuard::Config path_cfg;
    path_cfg.allowed_extensions = config.paths.allowed_extensions;
    path_cfg.max_file_size = config.paths.max_file_size;
    paths_ = std::make_unique<PathGuard>(log_, std::move(path_cfg));

    CommandGuard::Config command_cfg;
    command_cfg.allowed_executables = config.commands.allowed;
    commands_ = std::make_unique<CommandGuard>(log_, std::move(command_cfg));

    limiter_ = std::make_unique<RateLimiter>(log_, rate_limiter_config(config.rate_limits));

    if (!verifier) {
        HttpScopeVerifier::Config http_cfg;
        http_cfg.endpoint = config.credentials.identity_endpoint;
        http_cfg.timeout = std::chrono::seconds(config.credentials.timeout_seconds);
        verifier = std::make_shared<HttpScopeVerifier>(std::move(http_cfg));
    }
    CredentialGuard::Config cred_cfg;
    cred_cfg.env_var = config.credentials.env_var;
    cred_cfg.cache_ttl = std::chrono::seconds(config.credentials.cache_ttl_seconds);
    credentials_ = std::make_unique<CredentialGuard>(log_, *limiter_, std::move(verifier),
                                                     std::move(cred_cfg));

    inputs_ = std::make_unique<InputValidator>(log_, *content_);

    utils::log::debug(std::format("Validation gateway ready: {} patterns, root '{}'",
                                  library_->size(), root_.string()));
}

Verdict ValidationGateway::validate_content(std::string_view text, std::string_view context) const {
    return content_->validate(text, context);
}

UnicodeNormalizer::NormalizationResult ValidationGateway::normalize_unicode(std::string_view text) const {
    auto result = UnicodeNormalizer::normalize(text);
    if (!result.is_clean()) {
        std::string kinds;
        for (const auto& issue : result.issues) {
            if (!kinds.empty()) kinds += ",";
            kinds += UnicodeNormalizer::issue_kind_to_string(issue.kind);
        }
        log_.record(SecurityEventType::UNICODE_ISSUE, result.max_severity(), "ValidationGateway",
                    "Unicode issues detected", {{"issues", kinds}});
    }
    return result;
}

Result<std::filesystem::path> ValidationGateway::resolve_path(std::string_view candidate,
                                                              const std::filesystem::path& root) const {
    return paths_->resolve(candidate, root);
}

Result<std::filesystem::path> ValidationGateway::resolve_path(std::string_view candidate) const {
    if (root_.empty()) {
        return Result<std::filesystem::path>::error(ErrorCategory::CONFIG_ERROR,
                                                    "paths.root is not configured");
    }
    return paths_->resolve(candidate, root_);
}

bool ValidationGateway::is_safe_command(std::string_view executable,
                                        const std::vector<std::string>& args) const {
    return commands_->is_safe(executable, args);
}

RateLimitResult ValidationGateway::check_rate(const std::string& key) {
    return limiter_->check_limit(key);
}

std::optional<Credential> ValidationGateway::get_credential() const {
    return credentials_->get_credential();
}

std::optional<Credential> ValidationGateway::get_credential(const std::string& env_var) const {
    return credentials_->get_credential(env_var);
}

std::string ValidationGateway::redact(std::string_view token) {
    return CredentialGuard::redact(token);
}

} // namespace personaguard
