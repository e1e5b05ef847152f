#include "auditor/security_rules.hpp"
#include "core/utils.hpp"

#include <re2/re2.h>

#include <format>
#include <optional>

namespace personaguard::rules {

namespace {

const char* const kOwaspA01 = "https://owasp.org/Top10/A01_2021-Broken_Access_Control/";
const char* const kOwaspA03 = "https://owasp.org/Top10/A03_2021-Injection/";
const char* const kOwaspA05 = "https://owasp.org/Top10/A05_2021-Security_Misconfiguration/";
const char* const kOwaspA07 = "https://owasp.org/Top10/A07_2021-Identification_and_Authentication_Failures/";
const char* const kGuidelines = "persona-guard security guidelines";

std::string cwe_url(int id) {
    return std::format("https://cwe.mitre.org/data/definitions/{}.html", id);
}

// ---- Line helpers for semantic checks ------------------------------------

template <typename Fn>
void for_each_line(std::string_view content, Fn&& fn) {
    uint32_t line_no = 0;
    size_t start = 0;
    while (start <= content.size()) {
        const auto nl = content.find('\n', start);
        const auto end = nl == std::string_view::npos ? content.size() : nl;
        auto line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!fn(++line_no, line)) return;
        if (nl == std::string_view::npos) return;
        start = nl + 1;
    }
}

bool contains(const SourceFile& file, const RE2& re) {
    return RE2::PartialMatch(re2::StringPiece(file.content.data(), file.content.size()), re);
}

std::optional<RuleHit> first_hit(const SourceFile& file, const RE2& re) {
    std::optional<RuleHit> hit;
    for_each_line(file.content, [&](uint32_t line_no, std::string_view line) {
        re2::StringPiece input(line.data(), line.size());
        re2::StringPiece match;
        if (re.Match(input, 0, input.size(), RE2::UNANCHORED, &match, 1)) {
            hit = RuleHit{line_no, static_cast<uint32_t>(match.data() - line.data()) + 1,
                          make_snippet(line), {}, Confidence::MEDIUM};
            return false;
        }
        return true;
    });
    return hit;
}

std::vector<RuleHit> all_hits(const SourceFile& file, const RE2& re) {
    std::vector<RuleHit> hits;
    for_each_line(file.content, [&](uint32_t line_no, std::string_view line) {
        re2::StringPiece input(line.data(), line.size());
        re2::StringPiece match;
        if (re.Match(input, 0, input.size(), RE2::UNANCHORED, &match, 1)) {
            hits.push_back(RuleHit{line_no, static_cast<uint32_t>(match.data() - line.data()) + 1,
                                   make_snippet(line), {}, Confidence::MEDIUM});
        }
        return true;
    });
    return hits;
}

/// "X present without Y" check reported at the first X line
SemanticCheck missing_guard(const RE2& trigger, const RE2& guard, std::string message,
                            Confidence confidence) {
    return [&trigger, &guard, message = std::move(message), confidence](const SourceFile& file) {
        std::vector<RuleHit> hits;
        if (contains(file, guard)) return hits;
        if (auto hit = first_hit(file, trigger)) {
            hit->message = message;
            hit->confidence = confidence;
            hits.push_back(std::move(*hit));
        }
        return hits;
    };
}

bool is_placeholder(std::string_view value) {
    const std::string lower = utils::to_lower(utils::trim(value));
    if (lower.empty() || lower == "\"\"" || lower == "''") return true;
    for (const char* marker : {"${", "{{", "<", "changeme", "change_me", "example", "placeholder",
                               "your_", "your-", "xxxx", "dummy", "redacted", "todo"}) {
        if (lower.find(marker) != std::string::npos) return true;
    }
    return false;
}

// ---- Platform rule regexes -------------------------------------------------

const RE2& user_input_re() {
    static const RE2 re(R"((?i)(?:req\.(?:query|params|body)|request\.(?:args|form|json|body)|argv\[|std::cin|process\.argv|user_?input|untrusted))");
    return re;
}

const RE2& unicode_guard_re() {
    static const RE2 re(R"((?:UnicodeNormalizer|normalize_unicode|normalizeUnicode|UnicodeValidator|ContentValidator|ValidationGateway))");
    return re;
}

const RE2& remote_op_re() {
    static const RE2 re(R"((?:httplib::(?:SSL)?Client|curl_easy_perform|\bfetch\s*\(|axios\.|api\.github\.com|Octokit|requests\.(?:get|post)\s*\())");
    return re;
}

const RE2& rate_guard_re() {
    static const RE2 re(R"((?i)(?:rate_?limit|check_limit|check_rate|token_?bucket))");
    return re;
}

const RE2& fs_write_re() {
    static const RE2 re(R"((?:std::ofstream|\bofstream\s+\w|fopen\s*\([^)]*"[wa]|writeFile(?:Sync)?\s*\(|fs::rename\s*\(|std::filesystem::rename\s*\(|O_CREAT|O_WRONLY))");
    return re;
}

const RE2& path_guard_re() {
    static const RE2 re(R"((?:PathGuard|resolve_path|write_file_atomic|validatePath))");
    return re;
}

const RE2& security_op_re() {
    static const RE2 re(R"((?i)\b(?:authenticate|authorize|validate|sanitize|encrypt|decrypt)\w*\s*\()");
    return re;
}

const RE2& security_log_re() {
    static const RE2 re(R"((?:SecurityLog|SecurityEventType|log_security_event|logSecurityEvent|SecurityMonitor))");
    return re;
}

const RE2& config_secret_re() {
    static const RE2 re(R"((?i)(?:password|passwd|secret|api[_-]?key|access[_-]?token|auth[_-]?token|private[_-]?key|client[_-]?secret)["']?\s*[:=]\s*(.+)$)");
    return re;
}

const RE2& env_assignment_re() {
    static const RE2 re(R"(^\s*(?:export\s+)?([A-Za-z_][A-Za-z0-9_]*)\s*=\s*(.*)$)");
    return re;
}

std::vector<RuleHit> check_config_secrets(const SourceFile& file) {
    std::vector<RuleHit> hits;
    for_each_line(file.content, [&](uint32_t line_no, std::string_view line) {
        const auto trimmed = utils::trim(line);
        if (trimmed.starts_with("#") || trimmed.starts_with(";") || trimmed.starts_with("//")) return true;

        std::string value;
        if (RE2::PartialMatch(re2::StringPiece(line.data(), line.size()), config_secret_re(), &value)) {
            // Strip quotes and trailing separators before judging the value
            std::string v = utils::trim(value);
            while (!v.empty() && (v.back() == ',' || v.back() == '"' || v.back() == '\'')) v.pop_back();
            while (!v.empty() && (v.front() == '"' || v.front() == '\'')) v.erase(v.begin());
            if (v.size() >= 8 && !is_placeholder(v) && v != "true" && v != "false" && v != "null") {
                hits.push_back(RuleHit{line_no, 1, make_redacted_snippet(line),
                                       "Secret value committed in configuration", Confidence::HIGH});
            }
        }
        return true;
    });
    return hits;
}

std::vector<RuleHit> check_env_file(const SourceFile& file) {
    std::vector<RuleHit> hits;
    const std::string name = utils::to_lower(file.filename());
    for (const char* template_suffix : {".example", ".sample", ".template", ".dist"}) {
        if (name.ends_with(template_suffix)) return hits;
    }

    for_each_line(file.content, [&](uint32_t line_no, std::string_view line) {
        if (utils::trim(line).starts_with("#")) return true;
        std::string key;
        std::string value;
        if (RE2::FullMatch(re2::StringPiece(line.data(), line.size()), env_assignment_re(), &key, &value) &&
            !is_placeholder(value)) {
            hits.push_back(RuleHit{line_no, 1, std::format("{}=[REDACTED]", key),
                                   std::format("Committed .env value for {}", key), Confidence::HIGH});
        }
        return true;
    });
    return hits;
}

} // anonymous namespace

const std::vector<std::string>& source_kinds() {
    static const std::vector<std::string> kinds = {
        ".c", ".cc", ".cpp", ".cxx", ".h", ".hh", ".hpp", ".hxx", ".ipp",
        ".js", ".jsx", ".mjs", ".cjs", ".ts", ".tsx",
        ".py", ".rb", ".go", ".rs", ".java", ".php", ".sh",
    };
    return kinds;
}

const std::vector<std::string>& config_kinds() {
    static const std::vector<std::string> kinds = {
        ".yml", ".yaml", ".json", ".toml", ".ini", ".cfg", ".conf", ".properties", ".env",
    };
    return kinds;
}

std::vector<SecurityRule> owasp_top10() {
    std::vector<SecurityRule> out;

    SecurityRule secrets;
    secrets.id = "OWASP-A01-001";
    secrets.name = "Hardcoded Secrets";
    secrets.description = "Potential hardcoded secret or API key detected";
    secrets.severity = Severity::CRITICAL;
    secrets.reference = kOwaspA01;
    secrets.remediation = "Read secrets from the environment or a secret manager instead of source";
    secrets.kinds = source_kinds();
    secrets.pattern = R"((?:api[_-]?key|secret|password|token|private[_-]?key)\s*[:=]\s*["'][A-Za-z0-9+/=]{16,}["'])";
    secrets.high_confidence = true;
    secrets.redact_snippet = true;
    out.push_back(std::move(secrets));

    SecurityRule sql;
    sql.id = "OWASP-A03-001";
    sql.name = "SQL Injection";
    sql.description = "Query text built from interpolated or concatenated values";
    sql.severity = Severity::CRITICAL;
    sql.reference = kOwaspA03;
    sql.remediation = "Use parameterized queries or prepared statements";
    sql.kinds = source_kinds();
    sql.pattern = R"((?:query|execute)\s*\(\s*["'`][^"'`]*(?:\$\{|["']\s*\+\s*[A-Za-z_]))";
    out.push_back(std::move(sql));

    SecurityRule cmd;
    cmd.id = "OWASP-A03-002";
    cmd.name = "Command Injection";
    cmd.description = "Process execution with a command built from variables";
    cmd.severity = Severity::CRITICAL;
    cmd.reference = kOwaspA03;
    cmd.remediation = "Spawn by argument vector and validate every argument against an allow-list";
    cmd.kinds = source_kinds();
    cmd.pattern = R"(\b(?:system|popen|exec|execSync|spawn|spawnSync)\s*\([^)]*(?:\$\{|\+\s*[A-Za-z_]|\.c_str\s*\())";
    cmd.case_sensitive = true;
    out.push_back(std::move(cmd));

    SecurityRule path;
    path.id = "OWASP-A03-003";
    path.name = "Path Traversal";
    path.description = "File operation on a path built from variables";
    path.severity = Severity::HIGH;
    path.reference = kOwaspA03;
    path.remediation = "Resolve paths through PathGuard and confine them to an allowed root";
    path.kinds = source_kinds();
    path.pattern = R"((?:readFile|writeFile|readdir|mkdir|unlink|fopen|ifstream|ofstream)\s*\([^)]*(?:\$\{|\+\s*[A-Za-z_]))";
    out.push_back(std::move(path));

    SecurityRule xss;
    xss.id = "OWASP-A03-004";
    xss.name = "XSS - Direct HTML Injection";
    xss.description = "HTML written from interpolated values";
    xss.severity = Severity::HIGH;
    xss.reference = kOwaspA03;
    xss.remediation = "Use textContent or escape HTML before insertion";
    xss.kinds = source_kinds();
    xss.pattern = R"((?:innerHTML\s*\+?=\s*[^'"`;]*\$\{|dangerouslySetInnerHTML|document\.write\s*\())";
    xss.case_sensitive = true;
    out.push_back(std::move(xss));

    SecurityRule tls;
    tls.id = "OWASP-A05-001";
    tls.name = "Insecure TLS Configuration";
    tls.description = "Certificate verification disabled";
    tls.severity = Severity::MEDIUM;
    tls.reference = kOwaspA05;
    tls.remediation = "Keep TLS certificate verification enabled";
    tls.kinds = source_kinds();
    tls.pattern = R"((?:NODE_TLS_REJECT_UNAUTHORIZED|strictSSL|rejectUnauthorized|verify_ssl|enable_server_certificate_verification)\s*[:=(]\s*(?:false|0|["']false["']|["']0["'])|SSL_VERIFY_NONE|CURLOPT_SSL_VERIFY(?:PEER|HOST)\s*,\s*0)";
    out.push_back(std::move(tls));

    SecurityRule hash;
    hash.id = "OWASP-A07-001";
    hash.name = "Weak Hash Algorithm";
    hash.description = "MD5 or SHA-1 used";
    hash.severity = Severity::HIGH;
    hash.reference = kOwaspA07;
    hash.remediation = "Use SHA-256 or better; use bcrypt, scrypt or Argon2 for passwords";
    hash.kinds = source_kinds();
    hash.pattern = R"(\b(?:md5|sha1|MD5_Init|SHA1_Init|EVP_md5|EVP_sha1)\s*\()";
    out.push_back(std::move(hash));

    return out;
}

std::vector<SecurityRule> cwe_top25() {
    std::vector<SecurityRule> out;

    SecurityRule os_cmd;
    os_cmd.id = "CWE-78-001";
    os_cmd.name = "OS Command from External Input";
    os_cmd.description = "Command execution reading request, argv or environment data";
    os_cmd.severity = Severity::CRITICAL;
    os_cmd.reference = cwe_url(78);
    os_cmd.remediation = "Never pass external input to a shell; use an allow-listed argument vector";
    os_cmd.kinds = source_kinds();
    os_cmd.pattern = R"(\b(?:system|popen|exec|spawn)\s*\([^)]*(?:req\.|request\.|argv\[|getenv\s*\())";
    os_cmd.case_sensitive = true;
    out.push_back(std::move(os_cmd));

    SecurityRule reflected;
    reflected.id = "CWE-79-001";
    reflected.name = "Reflected XSS";
    reflected.description = "User input reflected without encoding";
    reflected.severity = Severity::HIGH;
    reflected.reference = cwe_url(79);
    reflected.remediation = "Encode all user input before reflecting it in responses";
    reflected.kinds = source_kinds();
    reflected.pattern = R"(res\.(?:send|write|end)\s*\([^)]*(?:req\.(?:query|params|body)|request\.))";
    out.push_back(std::move(reflected));

    SecurityRule sql_concat;
    sql_concat.id = "CWE-89-001";
    sql_concat.name = "SQL String Concatenation";
    sql_concat.description = "SQL statement built using string concatenation";
    sql_concat.severity = Severity::CRITICAL;
    sql_concat.reference = cwe_url(89);
    sql_concat.remediation = "Use parameterized queries instead of string concatenation";
    sql_concat.kinds = source_kinds();
    sql_concat.pattern = R"(["'](?:SELECT|INSERT|UPDATE|DELETE|DROP|CREATE|ALTER)\b[^"']*["']\s*\+)";
    out.push_back(std::move(sql_concat));

    SecurityRule path_input;
    path_input.id = "CWE-22-001";
    path_input.name = "Path Manipulation";
    path_input.description = "File path constructed from user input";
    path_input.severity = Severity::HIGH;
    path_input.reference = cwe_url(22);
    path_input.remediation = "Validate paths against an allowed root (PathGuard::resolve)";
    path_input.kinds = source_kinds();
    path_input.pattern = R"((?:path\.join|path\.resolve|fs::path|std::filesystem::path)\s*\([^)]*(?:req\.|request\.|params|query|body|argv\[))";
    out.push_back(std::move(path_input));

    SecurityRule creds;
    creds.id = "CWE-798-001";
    creds.name = "Hardcoded Credentials";
    creds.description = "User name and password literals in source";
    creds.severity = Severity::CRITICAL;
    creds.reference = cwe_url(798);
    creds.remediation = "Store credentials in the environment or a secret manager";
    creds.kinds = source_kinds();
    creds.pattern = R"((?:username|user|login)\s*[:=]\s*["'][^"']+["'].*(?:password|pass|pwd)\s*[:=]\s*["'][^"']+["'])";
    creds.redact_snippet = true;
    out.push_back(std::move(creds));

    SecurityRule crypto;
    crypto.id = "CWE-327-001";
    crypto.name = "Broken Cryptographic Algorithm";
    crypto.description = "DES, RC4 or ECB mode in use";
    crypto.severity = Severity::HIGH;
    crypto.reference = cwe_url(327);
    crypto.remediation = "Use AES-GCM or ChaCha20-Poly1305 through a maintained library";
    crypto.kinds = source_kinds();
    crypto.pattern = R"((?:DES_set_key|EVP_des_|EVP_rc4|RC4_set_key|createCipher\s*\(|EVP_aes_\d+_ecb|AES/ECB))";
    crypto.case_sensitive = true;
    out.push_back(std::move(crypto));

    SecurityRule buffers;
    buffers.id = "CWE-120-001";
    buffers.name = "Unbounded String Copy";
    buffers.description = "C string function without a bound";
    buffers.severity = Severity::HIGH;
    buffers.reference = cwe_url(120);
    buffers.remediation = "Use std::string, snprintf or bounded copies";
    buffers.kinds = {".c", ".cc", ".cpp", ".cxx", ".h", ".hh", ".hpp", ".hxx"};
    buffers.pattern = R"(\b(?:strcpy|strcat|sprintf|vsprintf|gets)\s*\()";
    buffers.case_sensitive = true;
    out.push_back(std::move(buffers));

    return out;
}

std::vector<SecurityRule> platform() {
    std::vector<SecurityRule> out;

    SecurityRule unicode;
    unicode.id = "PG-SEC-001";
    unicode.name = "Unicode Normalization Missing";
    unicode.description = "User input processed without Unicode normalization";
    unicode.severity = Severity::MEDIUM;
    unicode.reference = kGuidelines;
    unicode.remediation = "Route user input through UnicodeNormalizer or ContentValidator";
    unicode.kinds = source_kinds();
    unicode.skip_tests = true;
    unicode.check = missing_guard(user_input_re(), unicode_guard_re(),
                                  "User input processed without Unicode normalization",
                                  Confidence::MEDIUM);
    out.push_back(std::move(unicode));

    SecurityRule yaml;
    yaml.id = "PG-SEC-002";
    yaml.name = "Unvalidated YAML Content";
    yaml.description = "YAML parsed outside the secure structured parser";
    yaml.severity = Severity::HIGH;
    yaml.reference = kGuidelines;
    yaml.remediation = "Use SecureStructuredParser for all YAML parsing";
    yaml.kinds = source_kinds();
    yaml.pattern = R"((?:YAML::Load(?:File)?\s*\(|yaml\.(?:load|unsafe_load|parse)\s*\(|yaml\.load_all\s*\())";
    yaml.case_sensitive = true;
    out.push_back(std::move(yaml));

    SecurityRule rate;
    rate.id = "PG-SEC-003";
    rate.name = "Rate Limiting Missing";
    rate.description = "Remote or token operation without rate limiting";
    rate.severity = Severity::MEDIUM;
    rate.reference = kGuidelines;
    rate.remediation = "Check RateLimiter before remote calls and credential validation";
    rate.kinds = source_kinds();
    rate.skip_tests = true;
    rate.check = missing_guard(remote_op_re(), rate_guard_re(),
                               "Remote operation without rate limiting", Confidence::HIGH);
    out.push_back(std::move(rate));

    SecurityRule writes;
    writes.id = "PG-SEC-004";
    writes.name = "Unguarded Filesystem Write";
    writes.description = "File written without PathGuard confinement";
    writes.severity = Severity::HIGH;
    writes.reference = kGuidelines;
    writes.remediation = "Resolve the target with PathGuard and use write_file_atomic";
    writes.kinds = source_kinds();
    writes.skip_tests = true;
    writes.check = [](const SourceFile& file) {
        if (contains(file, path_guard_re())) return std::vector<RuleHit>{};
        auto hits = all_hits(file, fs_write_re());
        for (auto& hit : hits) hit.message = "File write outside PathGuard";
        return hits;
    };
    out.push_back(std::move(writes));

    SecurityRule shell;
    shell.id = "PG-SEC-005";
    shell.name = "Shell-Based Process Execution";
    shell.description = "Process started through a shell";
    shell.severity = Severity::HIGH;
    shell.reference = cwe_url(78);
    shell.remediation = "Use CommandGuard::run, which spawns by argument vector";
    shell.kinds = source_kinds();
    shell.pattern = R"((?:\bsystem\s*\(|\bpopen\s*\(|execSync\s*\(|shell\s*[:=]\s*true|shell\s*=\s*True|"/bin/sh"\s*,\s*"-c"|"-c"\s*,))";
    shell.case_sensitive = true;
    out.push_back(std::move(shell));

    SecurityRule logging;
    logging.id = "PG-SEC-006";
    logging.name = "Security Event Not Logged";
    logging.description = "Security-relevant operation without SecurityLog events";
    logging.severity = Severity::LOW;
    logging.reference = kGuidelines;
    logging.remediation = "Record a SecurityEvent for every security decision";
    logging.kinds = source_kinds();
    logging.skip_tests = true;
    logging.check = missing_guard(security_op_re(), security_log_re(),
                                  "Security operation without audit logging", Confidence::MEDIUM);
    out.push_back(std::move(logging));

    return out;
}

std::vector<SecurityRule> code_rules() {
    auto out = owasp_top10();
    for (auto& r : cwe_top25()) out.push_back(std::move(r));
    for (auto& r : platform()) out.push_back(std::move(r));
    return out;
}

std::vector<SecurityRule> configuration() {
    std::vector<SecurityRule> out;

    std::vector<std::string> structured = config_kinds();
    std::erase(structured, ".env");

    SecurityRule secret;
    secret.id = "CFG-001";
    secret.name = "Secret in Configuration";
    secret.description = "Credential-like value committed in a configuration file";
    secret.severity = Severity::CRITICAL;
    secret.category = "configuration";
    secret.reference = cwe_url(798);
    secret.remediation = "Reference an environment variable (${VAR}) instead of the value";
    secret.kinds = structured;
    secret.check = check_config_secrets;
    out.push_back(std::move(secret));

    SecurityRule tls;
    tls.id = "CFG-002";
    tls.name = "TLS Verification Disabled";
    tls.description = "Certificate verification turned off in configuration";
    tls.severity = Severity::HIGH;
    tls.category = "configuration";
    tls.reference = kOwaspA05;
    tls.remediation = "Keep certificate verification enabled";
    tls.kinds = config_kinds();
    tls.pattern = R"((?:verify_ssl|ssl_verify|sslverify|strict_ssl|strictSSL|rejectUnauthorized|tls_verify|insecure_skip_verify)["']?\s*[:=]\s*["']?(?:false|0|no|off)\b)";
    out.push_back(std::move(tls));

    SecurityRule debug;
    debug.id = "CFG-003";
    debug.name = "Debug Mode Enabled";
    debug.description = "Debug mode enabled in configuration";
    debug.severity = Severity::MEDIUM;
    debug.category = "configuration";
    debug.reference = kOwaspA05;
    debug.remediation = "Disable debug mode outside development configuration";
    debug.kinds = config_kinds();
    debug.pattern = R"((?:^|[\s"'{,])debug["']?\s*[:=]\s*["']?(?:true|1|yes|on)\b)";
    out.push_back(std::move(debug));

    SecurityRule cors;
    cors.id = "CFG-004";
    cors.name = "Permissive CORS";
    cors.description = "CORS allows any origin";
    cors.severity = Severity::MEDIUM;
    cors.category = "configuration";
    cors.reference = kOwaspA05;
    cors.remediation = "List the allowed origins explicitly";
    cors.kinds = config_kinds();
    cors.pattern = R"((?:cors[_-]?origins?|allow[_-]?origins?|access-control-allow-origin)["']?\s*[:=]\s*\[?\s*["']?\*)";
    out.push_back(std::move(cors));

    SecurityRule env;
    env.id = "CFG-005";
    env.name = "Committed Environment File";
    env.description = "Values committed in a .env file";
    env.severity = Severity::HIGH;
    env.category = "configuration";
    env.reference = cwe_url(538);
    env.remediation = "Commit only .env.example with placeholder values";
    env.kinds = {".env"};
    env.check = check_env_file;
    out.push_back(std::move(env));

    return out;
}

std::vector<SecurityRule> rule_set(std::string_view name) {
    if (name == "OWASP-Top-10") return owasp_top10();
    if (name == "CWE-Top-25") return cwe_top25();
    if (name == "Platform-Security") return platform();
    return {};
}

} // namespace personaguard::rules
