#include "config/config_loader.hpp"
#include "auditor/glob_matcher.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace personaguard {

// ============================================================================
// TOML Parsing Helpers (env expansion, typed access)
// ============================================================================

namespace {

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Typed extraction helpers (throw on wrong types) -----------------------

std::string key_path(std::string_view section, std::string_view key) {
    return section.empty() ? std::string(key) : std::format("{}.{}", section, key);
}

std::string toml_string(const toml::table& tbl, std::string_view key,
                        std::string fallback, std::string_view section) {
    const auto node = tbl[key];
    if (!node) return fallback;
    if (const auto* s = node.as_string()) return s->get();
    throw std::runtime_error(std::format("{} must be a string", key_path(section, key)));
}

uint64_t toml_uint(const toml::table& tbl, std::string_view key,
                   uint64_t fallback, std::string_view section) {
    const auto node = tbl[key];
    if (!node) return fallback;
    const auto* i = node.as_integer();
    if (!i) {
        throw std::runtime_error(std::format("{} must be an integer", key_path(section, key)));
    }
    if (i->get() < 0) {
        throw std::runtime_error(std::format("{} must not be negative, got {}",
                                             key_path(section, key), i->get()));
    }
    return static_cast<uint64_t>(i->get());
}

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view key,
                                           std::vector<std::string> fallback,
                                           std::string_view section) {
    const auto node = tbl[key];
    if (!node) return fallback;
    const auto* arr = node.as_array();
    if (!arr) {
        throw std::runtime_error(std::format("{} must be an array of strings",
                                             key_path(section, key)));
    }
    std::vector<std::string> result;
    result.reserve(arr->size());
    for (const auto& elem : *arr) {
        const auto* s = elem.as_string();
        if (!s) {
            throw std::runtime_error(std::format("{} must contain only strings",
                                                 key_path(section, key)));
        }
        result.emplace_back(s->get());
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

Severity ConfigLoader::parse_severity_field(const toml::table& tbl, std::string_view key,
                                            Severity fallback, std::string_view section) {
    const auto name = toml_string(tbl, key, severity_to_string(fallback), section);
    const auto severity = parse_severity(utils::to_lower(name));
    if (!severity) {
        throw std::runtime_error(std::format(
            "{} must be one of none, low, medium, high, critical; got '{}'",
            key_path(section, key), name));
    }
    return *severity;
}

// ---- Section extraction ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = utils::to_lower(toml_string(*logging, "level", cfg.level, "logging"));
    return cfg;
}

ContentConfig ConfigLoader::extract_content(const toml::table& root) {
    ContentConfig cfg;
    const auto* content = root["content"].as_table();
    if (!content) return cfg;
    const auto& c = *content;

    cfg.sanitize_threshold = parse_severity_field(c, "sanitize_threshold",
                                                  cfg.sanitize_threshold, "content");
    cfg.max_length = toml_uint(c, "max_length", cfg.max_length, "content");

    if (const auto* limits = c["context_limits"].as_table()) {
        for (const auto& [context, value] : *limits) {
            const auto* n = value.as_integer();
            if (!n || n->get() <= 0) {
                throw std::runtime_error(std::format(
                    "content.context_limits.{} must be a positive integer", context.str()));
            }
            cfg.context_limits[std::string(context.str())] = static_cast<size_t>(n->get());
        }
    }
    return cfg;
}

RateLimitsConfig ConfigLoader::extract_rate_limits(const toml::table& root) {
    RateLimitsConfig cfg;
    const auto* limits = root["rate_limits"].as_table();
    if (!limits) return cfg;

    for (const auto& [operation, value] : *limits) {
        const auto* op = value.as_table();
        const std::string section = std::format("rate_limits.{}", operation.str());
        if (!op) throw std::runtime_error(std::format("{} must be a table", section));

        RateLimitConfig limit;
        limit.capacity = static_cast<uint32_t>(toml_uint(*op, "capacity", limit.capacity, section));
        limit.window = std::chrono::milliseconds(
            toml_uint(*op, "window_ms", static_cast<uint64_t>(limit.window.count()), section));
        limit.min_delay = std::chrono::milliseconds(
            toml_uint(*op, "min_delay_ms", static_cast<uint64_t>(limit.min_delay.count()), section));
        cfg.operations[std::string(operation.str())] = limit;
    }
    return cfg;
}

CredentialsConfig ConfigLoader::extract_credentials(const toml::table& root) {
    CredentialsConfig cfg;
    const auto* creds = root["credentials"].as_table();
    if (!creds) return cfg;
    const auto& c = *creds;

    cfg.env_var = toml_string(c, "env_var", cfg.env_var, "credentials");
    cfg.identity_endpoint = toml_string(c, "identity_endpoint", cfg.identity_endpoint, "credentials");
    cfg.timeout_seconds = static_cast<uint32_t>(
        toml_uint(c, "timeout_seconds", cfg.timeout_seconds, "credentials"));
    cfg.cache_ttl_seconds = static_cast<uint32_t>(
        toml_uint(c, "cache_ttl_seconds", cfg.cache_ttl_seconds, "credentials"));
    return cfg;
}

PathsConfig ConfigLoader::extract_paths(const toml::table& root) {
    PathsConfig cfg;
    const auto* paths = root["paths"].as_table();
    if (!paths) return cfg;
    const auto& p = *paths;

    cfg.root = toml_string(p, "root", cfg.root, "paths");
    cfg.allowed_extensions = toml_string_array(p, "allowed_extensions", cfg.allowed_extensions, "paths");
    cfg.max_file_size = toml_uint(p, "max_file_size", cfg.max_file_size, "paths");
    return cfg;
}

CommandsConfig ConfigLoader::extract_commands(const toml::table& root) {
    CommandsConfig cfg;
    const auto* commands = root["commands"].as_table();
    if (!commands) return cfg;

    cfg.allowed = toml_string_array(*commands, "allowed", cfg.allowed, "commands");
    return cfg;
}

SecurityLogConfig ConfigLoader::extract_security_log(const toml::table& root) {
    SecurityLogConfig cfg;
    const auto* sl = root["security_log"].as_table();
    if (!sl) return cfg;

    cfg.capacity = toml_uint(*sl, "capacity", cfg.capacity, "security_log");
    cfg.persist_file = toml_string(*sl, "persist_file", cfg.persist_file, "security_log");
    return cfg;
}

std::vector<Suppression> ConfigLoader::extract_suppressions(const toml::array& entries,
                                                            std::string_view section) {
    std::vector<Suppression> result;
    result.reserve(entries.size());

    size_t index = 0;
    for (const auto& elem : entries) {
        const auto* entry = elem.as_table();
        const std::string where = std::format("{}[{}]", section, index++);
        if (!entry) throw std::runtime_error(std::format("{} must be a table", where));

        Suppression s;
        s.rule = utils::trim(toml_string(*entry, "rule", ""s, where));
        s.file = utils::trim(toml_string(*entry, "file", ""s, where));
        s.reason = utils::trim(toml_string(*entry, "reason", ""s, where));
        if (s.rule.empty()) throw std::runtime_error(std::format("{}.rule is required", where));
        if (s.file.empty()) throw std::runtime_error(std::format("{}.file is required", where));
        if (s.reason.empty()) {
            throw std::runtime_error(std::format(
                "{}.reason is required: every suppression must document why ({} in {})",
                where, s.rule, s.file));
        }
        result.push_back(std::move(s));
    }
    return result;
}

AuditConfig ConfigLoader::extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.fail_on = parse_severity_field(a, "fail_on", cfg.fail_on, "audit");
    cfg.root = toml_string(a, "root", cfg.root, "audit");
    cfg.root_markers = toml_string_array(a, "root_markers", cfg.root_markers, "audit");
    cfg.exclude = toml_string_array(a, "exclude", cfg.exclude, "audit");
    cfg.scanners = toml_string_array(a, "scanners", cfg.scanners, "audit");
    cfg.max_file_size = toml_uint(a, "max_file_size", cfg.max_file_size, "audit");
    cfg.workers = toml_uint(a, "workers", cfg.workers, "audit");

    if (const auto node = a["suppressions"]) {
        const auto* arr = node.as_array();
        if (!arr) throw std::runtime_error("audit.suppressions must be an array of tables");
        cfg.suppressions = extract_suppressions(*arr, "audit.suppressions");
    }
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

PlatformConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    PlatformConfig config;
    config.logging = extract_logging(tbl);
    config.content = extract_content(tbl);
    config.rate_limits = extract_rate_limits(tbl);
    config.credentials = extract_credentials(tbl);
    config.paths = extract_paths(tbl);
    config.commands = extract_commands(tbl);
    config.security_log = extract_security_log(tbl);
    config.audit = extract_audit(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(PlatformConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

Result<std::vector<Suppression>> ConfigLoader::suppressions_from_table(const toml::table& tbl,
                                                                       std::string_view source) {
    using R = Result<std::vector<Suppression>>;
    const auto node = tbl["suppressions"];
    if (!node) return R::ok({});
    const auto* arr = node.as_array();
    if (!arr) {
        return R::error(ErrorCategory::CONFIG_ERROR,
                        std::format("{}: suppressions must be an array of tables", source));
    }

    auto entries = extract_suppressions(*arr, "suppressions");
    for (const auto& s : entries) {
        auto glob = GlobMatcher::compile(s.file);
        if (!glob.is_ok()) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                std::format("{}: file glob '{}': {}", source, s.file, glob.error_message()));
        }
    }
    return R::ok(std::move(entries));
}

Result<std::vector<Suppression>> ConfigLoader::load_suppressions_string(
    const std::string& toml_content) {
    try {
        return suppressions_from_table(parse_toml_string(toml_content), "suppression config");
    } catch (const std::exception& e) {
        return Result<std::vector<Suppression>>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Invalid suppression config: {}", e.what()));
    }
}

Result<std::vector<Suppression>> ConfigLoader::load_suppressions_file(const std::string& path) {
    try {
        auto result = suppressions_from_table(parse_toml_file(path), path);
        if (result.is_ok()) {
            utils::log::debug(std::format("Loaded {} suppressions from {}",
                                          result.value().size(), path));
        }
        return result;
    } catch (const std::exception& e) {
        return Result<std::vector<Suppression>>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Failed to load suppressions from {}: {}", path, e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const PlatformConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    if (config.content.max_length == 0) {
        errors.push_back("content.max_length must be > 0");
    }
    if (config.content.sanitize_threshold == Severity::NONE) {
        errors.push_back("content.sanitize_threshold must be at least low");
    }

    for (const auto& [operation, limit] : config.rate_limits.operations) {
        if (limit.window.count() <= 0) {
            errors.push_back(std::format("rate_limits.{}.window_ms must be > 0", operation));
        }
    }

    if (config.credentials.env_var.empty()) {
        errors.push_back("credentials.env_var must not be empty");
    }
    if (!config.credentials.identity_endpoint.starts_with("https://") &&
        !config.credentials.identity_endpoint.starts_with("http://localhost")) {
        errors.push_back(std::format("credentials.identity_endpoint must use https, got '{}'",
                                     config.credentials.identity_endpoint));
    }
    if (config.credentials.timeout_seconds == 0) {
        errors.push_back("credentials.timeout_seconds must be > 0");
    }

    for (const auto& ext : config.paths.allowed_extensions) {
        if (!ext.starts_with(".")) {
            errors.push_back(std::format("paths.allowed_extensions entry '{}' must start with '.'", ext));
        }
    }

    for (const auto& exe : config.commands.allowed) {
        if (exe.empty() || exe.find('/') != std::string::npos) {
            errors.push_back(std::format("commands.allowed entry '{}' must be a bare program name", exe));
        }
    }

    if (config.security_log.capacity == 0) {
        errors.push_back("security_log.capacity must be > 0");
    }

    for (const auto& scanner : config.audit.scanners) {
        if (scanner != "code" && scanner != "dependency" &&
            scanner != "configuration" && scanner != "config") {
            errors.push_back(std::format("audit.scanners: unknown scanner '{}'", scanner));
        }
    }
    for (const auto& glob : config.audit.exclude) {
        auto compiled = GlobMatcher::compile(glob);
        if (!compiled.is_ok()) {
            errors.push_back(std::format("audit.exclude '{}': {}", glob, compiled.error_message()));
        }
    }
    for (size_t i = 0; i < config.audit.suppressions.size(); ++i) {
        const auto& s = config.audit.suppressions[i];
        auto compiled = GlobMatcher::compile(s.file);
        if (!compiled.is_ok()) {
            errors.push_back(std::format("audit.suppressions[{}].file '{}': {}",
                                         i, s.file, compiled.error_message()));
        }
    }

    return errors;
}

} // namespace personaguard
