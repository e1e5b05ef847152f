#pragma once

#include "core/error.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace personaguard {

class IRateLimiter;
class SecurityLog;

enum class CredentialKind {
    CLASSIC_PAT,        // ghp_
    OAUTH,              // gho_
    USER_TO_SERVER,     // ghu_
    SERVER_TO_SERVER,   // ghs_
    REFRESH,            // ghr_
    FINE_GRAINED        // github_pat_
};

[[nodiscard]] const char* credential_kind_to_string(CredentialKind kind);

/**
 * @brief Bearer token held only in memory
 *
 * Move-only. The buffer is wiped with OPENSSL_cleanse on destruction and
 * after a move. to_string() and redacted() never return the full value.
 */
class Credential {
public:
    Credential(std::string token, CredentialKind kind);
    ~Credential();

    Credential(Credential&& other) noexcept;
    Credential& operator=(Credential&& other) noexcept;
    Credential(const Credential&) = delete;
    Credential& operator=(const Credential&) = delete;

    /// Raw value; only for handing to the identity endpoint
    [[nodiscard]] std::string_view expose() const { return token_; }

    [[nodiscard]] CredentialKind kind() const { return kind_; }
    [[nodiscard]] const std::string& redacted() const { return redacted_; }
    [[nodiscard]] std::string to_string() const { return redacted_; }

    [[nodiscard]] const std::vector<std::string>& scopes() const { return scopes_; }
    void set_scopes(std::vector<std::string> scopes) { scopes_ = std::move(scopes); }

private:
    void wipe();

    std::string token_;
    CredentialKind kind_;
    std::string redacted_;
    std::vector<std::string> scopes_;
};

/**
 * @brief Scopes granted to a token as reported by the identity endpoint
 *
 * `reported` is false when the endpoint accepted the token but sent no
 * scope header (fine-grained tokens).
 */
struct GrantedScopes {
    std::set<std::string> scopes;
    bool reported = true;
};

/**
 * @brief Remote identity lookup (mocked in tests)
 *
 * Failures use SCOPE_INSUFFICIENT; messages must not contain the token.
 */
class IScopeVerifier {
public:
    virtual ~IScopeVerifier() = default;

    [[nodiscard]] virtual Result<GrantedScopes> fetch_scopes(std::string_view token) = 0;
};

/**
 * @brief GET {endpoint}/user with a bearer token, reads X-OAuth-Scopes
 *
 * 401 -> invalid credential, 403 -> insufficient, other non-2xx -> error.
 * Connection and read timeouts are bounded; any transport failure denies.
 */
class HttpScopeVerifier : public IScopeVerifier {
public:
    struct Config {
        std::string endpoint = "https://api.github.com";
        std::chrono::seconds timeout{10};
        std::string user_agent = "persona-guard";
    };

    HttpScopeVerifier() : HttpScopeVerifier(Config{}) {}
    explicit HttpScopeVerifier(Config config) : config_(std::move(config)) {}

    [[nodiscard]] Result<GrantedScopes> fetch_scopes(std::string_view token) override;

    /// "repo, gist" -> {"gist", "repo"}
    [[nodiscard]] static std::set<std::string> parse_scope_header(std::string_view header);

private:
    Config config_;
};

/**
 * @brief Credential format checks, redaction and scope verification
 *
 * Tokens come only from the environment. Scope results are cached under
 * SHA-256(token) for cache_ttl; every check_scopes call consumes a
 * credential-validation rate token first.
 */
class CredentialGuard {
public:
    struct Config {
        std::string env_var = "GITHUB_TOKEN";
        std::chrono::seconds cache_ttl{3600};
    };

    CredentialGuard(SecurityLog& log, IRateLimiter& limiter,
                    std::shared_ptr<IScopeVerifier> verifier);
    CredentialGuard(SecurityLog& log, IRateLimiter& limiter,
                    std::shared_ptr<IScopeVerifier> verifier, Config config);

    [[nodiscard]] static bool validate_format(std::string_view token);

    [[nodiscard]] static std::optional<CredentialKind> detect_kind(std::string_view token);

    /// First 4 + "..." + last 4; tokens of 8 chars or less become [REDACTED]
    [[nodiscard]] static std::string redact(std::string_view token);

    /// Strips credential-shaped substrings and the given token, if any
    [[nodiscard]] static std::string safe_error_message(std::string_view raw,
                                                        std::optional<std::string_view> token = std::nullopt);

    /// Reads env_var; nullopt when unset, empty or malformed
    [[nodiscard]] std::optional<Credential> get_credential() const;
    [[nodiscard]] std::optional<Credential> get_credential(const std::string& env_var) const;

    /**
     * @brief Verify the token grants every required scope
     *
     * Requirement names: read/write (repo or public_repo), admin (repo and
     * admin:org), gist, or a literal scope name.
     */
    [[nodiscard]] Result<void> check_scopes(std::string_view token,
                                            const std::vector<std::string>& required);
    [[nodiscard]] Result<void> check_scopes(const Credential& credential,
                                            const std::vector<std::string>& required);

    [[nodiscard]] static bool scope_satisfied(const GrantedScopes& granted, std::string_view required);

    [[nodiscard]] static std::string token_hash(std::string_view token);

    void clear_cache();
    [[nodiscard]] size_t cache_size() const;

private:
    struct CacheEntry {
        GrantedScopes granted;
        std::chrono::steady_clock::time_point expires;
    };

    SecurityLog& log_;
    IRateLimiter& limiter_;
    std::shared_ptr<IScopeVerifier> verifier_;
    Config config_;

    mutable std::mutex cache_mutex_;
    std::unordered_map<std::string, CacheEntry> cache_;
};

} // namespace personaguard
