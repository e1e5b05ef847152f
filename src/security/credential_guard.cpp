#include "security/credential_guard.hpp"
#include "audit/security_log.hpp"
#include "core/utils.hpp"
#include "security/irate_limiter.hpp"
#include "security/secret_scrubber.hpp"

#include <httplib.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <re2/re2.h>

#include <algorithm>
#include <cstdlib>
#include <format>

namespace personaguard {

namespace {

constexpr std::string_view kScopeCheckKey = "credential-validation:scope-check";

struct KindPattern {
    CredentialKind kind;
    const char* pattern;
};

constexpr KindPattern kKindPatterns[] = {
    {CredentialKind::CLASSIC_PAT,      "ghp_[A-Za-z0-9]{36}"},
    {CredentialKind::OAUTH,            "gho_[A-Za-z0-9]{36}"},
    {CredentialKind::USER_TO_SERVER,   "ghu_[A-Za-z0-9]{36}"},
    {CredentialKind::SERVER_TO_SERVER, "ghs_[A-Za-z0-9]{36}"},
    {CredentialKind::REFRESH,          "ghr_[A-Za-z0-9]{36}"},
    {CredentialKind::FINE_GRAINED,     "github_pat_[A-Za-z0-9_]{82}"},
};

const std::vector<std::unique_ptr<RE2>>& kind_regexes() {
    static const auto regexes = [] {
        std::vector<std::unique_ptr<RE2>> out;
        for (const auto& kp : kKindPatterns) {
            out.push_back(std::make_unique<RE2>(kp.pattern));
        }
        return out;
    }();
    return regexes;
}

/// Split "https://host:port/base" into "https://host:port" and "/base"
std::pair<std::string, std::string> split_endpoint(const std::string& endpoint) {
    const auto scheme_end = endpoint.find("://");
    const size_t host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    const auto path_start = endpoint.find('/', host_start);
    if (path_start == std::string::npos) return {endpoint, ""};
    std::string base = endpoint.substr(path_start);
    while (!base.empty() && base.back() == '/') base.pop_back();
    return {endpoint.substr(0, path_start), base};
}

} // anonymous namespace

const char* credential_kind_to_string(CredentialKind kind) {
    switch (kind) {
        case CredentialKind::CLASSIC_PAT:      return "classic_pat";
        case CredentialKind::OAUTH:            return "oauth";
        case CredentialKind::USER_TO_SERVER:   return "user_to_server";
        case CredentialKind::SERVER_TO_SERVER: return "server_to_server";
        case CredentialKind::REFRESH:          return "refresh";
        case CredentialKind::FINE_GRAINED:     return "fine_grained";
    }
    return "unknown";
}

// ============================================================================
// Credential
// ============================================================================

Credential::Credential(std::string token, CredentialKind kind)
    : token_(std::move(token)),
      kind_(kind),
      redacted_(CredentialGuard::redact(token_)) {}

Credential::~Credential() {
    wipe();
}

Credential::Credential(Credential&& other) noexcept
    : token_(std::move(other.token_)),
      kind_(other.kind_),
      redacted_(std::move(other.redacted_)),
      scopes_(std::move(other.scopes_)) {
    other.wipe();
}

Credential& Credential::operator=(Credential&& other) noexcept {
    if (this != &other) {
        wipe();
        token_ = std::move(other.token_);
        kind_ = other.kind_;
        redacted_ = std::move(other.redacted_);
        scopes_ = std::move(other.scopes_);
        other.wipe();
    }
    return *this;
}

void Credential::wipe() {
    if (!token_.empty()) {
        OPENSSL_cleanse(token_.data(), token_.size());
    }
    token_.clear();
}

// ============================================================================
// HttpScopeVerifier
// ============================================================================

std::set<std::string> HttpScopeVerifier::parse_scope_header(std::string_view header) {
    std::set<std::string> scopes;
    for (const auto& part : utils::split(std::string(header), ',')) {
        auto scope = utils::trim(part);
        if (!scope.empty()) scopes.insert(std::move(scope));
    }
    return scopes;
}

Result<GrantedScopes> HttpScopeVerifier::fetch_scopes(std::string_view token) {
    const auto [scheme_host, base_path] = split_endpoint(config_.endpoint);

    httplib::Client client(scheme_host);
    client.set_connection_timeout(config_.timeout);
    client.set_read_timeout(config_.timeout);

    httplib::Headers headers{
        {"Authorization", std::format("Bearer {}", token)},
        {"User-Agent", config_.user_agent},
        {"Accept", "application/vnd.github+json"},
    };

    auto res = client.Get(base_path + "/user", headers);
    if (!res) {
        return Result<GrantedScopes>::error(ErrorCategory::SCOPE_INSUFFICIENT,
            std::format("Identity endpoint unreachable: {}", httplib::to_string(res.error())));
    }

    if (res->status == 401) {
        return Result<GrantedScopes>::error(ErrorCategory::SCOPE_INSUFFICIENT,
            "Credential rejected by identity endpoint (401)");
    }
    if (res->status == 403) {
        return Result<GrantedScopes>::error(ErrorCategory::SCOPE_INSUFFICIENT,
            "Credential lacks access to identity endpoint (403)");
    }
    if (res->status < 200 || res->status >= 300) {
        // Remote body may echo request headers; never include it
        return Result<GrantedScopes>::error(ErrorCategory::SCOPE_INSUFFICIENT,
            std::format("Identity endpoint returned HTTP {}", res->status));
    }

    GrantedScopes granted;
    if (res->has_header("X-OAuth-Scopes")) {
        granted.scopes = parse_scope_header(res->get_header_value("X-OAuth-Scopes"));
    } else {
        granted.reported = false;
    }
    return Result<GrantedScopes>::ok(std::move(granted));
}

// ============================================================================
// CredentialGuard
// ============================================================================

CredentialGuard::CredentialGuard(SecurityLog& log, IRateLimiter& limiter,
                                 std::shared_ptr<IScopeVerifier> verifier)
    : CredentialGuard(log, limiter, std::move(verifier), Config{}) {}

CredentialGuard::CredentialGuard(SecurityLog& log, IRateLimiter& limiter,
                                 std::shared_ptr<IScopeVerifier> verifier, Config config)
    : log_(log),
      limiter_(limiter),
      verifier_(std::move(verifier)),
      config_(std::move(config)) {}

std::optional<CredentialKind> CredentialGuard::detect_kind(std::string_view token) {
    const auto& regexes = kind_regexes();
    for (size_t i = 0; i < regexes.size(); ++i) {
        if (RE2::FullMatch(re2::StringPiece(token.data(), token.size()), *regexes[i])) {
            return kKindPatterns[i].kind;
        }
    }
    return std::nullopt;
}

bool CredentialGuard::validate_format(std::string_view token) {
    return detect_kind(token).has_value();
}

std::string CredentialGuard::redact(std::string_view token) {
    if (token.size() <= 8) return std::string(kRedactedMarker);
    return std::format("{}...{}", token.substr(0, 4), token.substr(token.size() - 4));
}

std::string CredentialGuard::safe_error_message(std::string_view raw,
                                                std::optional<std::string_view> token) {
    std::string message(raw);

    // Remove the exact token first, even when it is not credential-shaped
    if (token && !token->empty()) {
        const std::string replacement = redact(*token);
        size_t pos = 0;
        while ((pos = message.find(*token, pos)) != std::string::npos) {
            message.replace(pos, token->size(), replacement);
            pos += replacement.size();
        }
    }
    return redact_secrets(message);
}

std::optional<Credential> CredentialGuard::get_credential() const {
    return get_credential(config_.env_var);
}

std::optional<Credential> CredentialGuard::get_credential(const std::string& env_var) const {
    const char* value = std::getenv(env_var.c_str());
    if (!value || *value == '\0') {
        utils::log::debug(std::format("Credential variable {} is not set", env_var));
        return std::nullopt;
    }

    std::string token = utils::trim(value);
    const auto kind = detect_kind(token);
    if (!kind) {
        log_.record(SecurityEventType::TOKEN_VALIDATION_FAILURE, Severity::MEDIUM,
                    "CredentialGuard",
                    std::format("Credential in {} has an unrecognized format", env_var),
                    {{"env_var", env_var}, {"token", redact(token)}});
        OPENSSL_cleanse(token.data(), token.size());
        return std::nullopt;
    }
    return Credential(std::move(token), *kind);
}

std::string CredentialGuard::token_hash(std::string_view token) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx, token.data(), token.size());
    EVP_DigestFinal_ex(ctx, hash, &hash_len);
    EVP_MD_CTX_free(ctx);

    return utils::bytes_to_hex(hash, hash_len);
}

bool CredentialGuard::scope_satisfied(const GrantedScopes& granted, std::string_view required) {
    const auto has = [&](const char* s) { return granted.scopes.contains(s); };

    if (required == "read") {
        // Accepted tokens without a scope header (fine-grained) can read
        return !granted.reported || has("repo") || has("public_repo");
    }
    if (required == "write") return has("repo") || has("public_repo");
    if (required == "admin") return has("repo") && has("admin:org");
    return granted.scopes.contains(std::string(required));
}

Result<void> CredentialGuard::check_scopes(const Credential& credential,
                                           const std::vector<std::string>& required) {
    return check_scopes(credential.expose(), required);
}

Result<void> CredentialGuard::check_scopes(std::string_view token,
                                           const std::vector<std::string>& required) {
    const auto rate = limiter_.check_limit(std::string(kScopeCheckKey));
    if (!rate.allowed) {
        return Result<void>::error(ErrorCategory::RATE_LIMITED,
            std::format("Credential validation rate limit reached, retry in {}ms",
                        rate.retry_after.count()));
    }

    const std::string redacted = redact(token);

    if (!validate_format(token)) {
        log_.record(SecurityEventType::TOKEN_VALIDATION_FAILURE, Severity::MEDIUM,
                    "CredentialGuard", "Credential has an unrecognized format",
                    {{"token", redacted}});
        return Result<void>::error(ErrorCategory::SCOPE_INSUFFICIENT,
                                   "Credential has an unrecognized format");
    }

    const std::string key = token_hash(token);
    if (key.empty()) {
        return Result<void>::error(ErrorCategory::INTERNAL_ERROR, "Failed to hash credential");
    }

    std::optional<GrantedScopes> granted;
    const auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        const auto it = cache_.find(key);
        if (it != cache_.end()) {
            if (it->second.expires > now) {
                granted = it->second.granted;
            } else {
                cache_.erase(it);
            }
        }
    }

    if (!granted) {
        if (!verifier_) {
            return Result<void>::error(ErrorCategory::SCOPE_INSUFFICIENT,
                                       "No identity verifier configured");
        }
        auto fetched = verifier_->fetch_scopes(token);
        if (!fetched.is_ok()) {
            const auto message = safe_error_message(fetched.error_message(), token);
            log_.record(SecurityEventType::TOKEN_VALIDATION_FAILURE, Severity::HIGH,
                        "CredentialGuard", message, {{"token", redacted}});
            return Result<void>::error(ErrorCategory::SCOPE_INSUFFICIENT, message);
        }
        granted = fetched.value();

        std::lock_guard<std::mutex> lock(cache_mutex_);
        cache_[key] = CacheEntry{*granted, now + config_.cache_ttl};
    }

    std::vector<std::string> missing;
    for (const auto& scope : required) {
        if (!scope_satisfied(*granted, scope)) missing.push_back(scope);
    }

    if (!missing.empty()) {
        std::string joined;
        for (const auto& m : missing) {
            if (!joined.empty()) joined += ", ";
            joined += m;
        }
        log_.record(SecurityEventType::SCOPE_INSUFFICIENT, Severity::HIGH, "CredentialGuard",
                    std::format("Credential lacks required scopes: {}", joined),
                    {{"token", redacted}, {"missing", joined}});
        return Result<void>::error(ErrorCategory::SCOPE_INSUFFICIENT,
                                   std::format("Credential lacks required scopes: {}", joined));
    }

    log_.record(SecurityEventType::TOKEN_VALIDATION_SUCCESS, Severity::NONE, "CredentialGuard",
                "Credential scopes verified", {{"token", redacted}});
    return Result<void>::ok();
}

void CredentialGuard::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
}

size_t CredentialGuard::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

} // namespace personaguard
