#include "security/pattern_library.hpp"
#include "security/regex_complexity_analyzer.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <format>
#include <stdexcept>

namespace personaguard {

namespace {

// Contexts where free-form prose is not expected
const std::vector<std::string> kFieldContexts = {
    "metadata-field", "display-field", "search-query", "command-argument"
};

} // namespace

// ============================================================================
// CompiledPattern
// ============================================================================

CompiledPattern::CompiledPattern(PatternDefinition definition, ComplexityProfile profile,
                                 std::unique_ptr<re2::RE2> matcher)
    : definition_(std::move(definition)),
      profile_(std::move(profile)),
      matcher_(std::move(matcher)) {}

CompiledPattern::CompiledPattern(CompiledPattern&&) noexcept = default;
CompiledPattern& CompiledPattern::operator=(CompiledPattern&&) noexcept = default;
CompiledPattern::~CompiledPattern() = default;

Result<CompiledPattern> CompiledPattern::compile(PatternDefinition definition) {
    if (definition.id.empty()) {
        return Result<CompiledPattern>::error(ErrorCategory::CONFIG_ERROR, "Pattern id is empty");
    }

    auto profile = RegexComplexityAnalyzer::analyze(definition.source);

    re2::RE2::Options opts;
    opts.set_case_sensitive(false);
    opts.set_log_errors(false);
    auto matcher = std::make_unique<re2::RE2>(definition.source, opts);
    if (!matcher->ok()) {
        return Result<CompiledPattern>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Pattern '{}' does not compile: {}", definition.id, matcher->error()));
    }

    return Result<CompiledPattern>::ok(
        CompiledPattern(std::move(definition), std::move(profile), std::move(matcher)));
}

bool CompiledPattern::applies_to(std::string_view context) const {
    if (definition_.contexts.empty()) return true;
    return std::ranges::any_of(definition_.contexts,
        [context](const std::string& c) { return c == context; });
}

Result<std::vector<MatchSpan>> CompiledPattern::find_all(std::string_view text) const {
    if (text.size() > profile_.max_content_length) {
        return Result<std::vector<MatchSpan>>::error(ErrorCategory::VALIDATION_REJECTED,
            std::format("Input of {} bytes exceeds the {} byte ceiling for pattern '{}' ({} risk)",
                        text.size(), profile_.max_content_length, definition_.id,
                        risk_level_to_string(profile_.risk)));
    }

    std::vector<MatchSpan> spans;
    const re2::StringPiece input(text.data(), text.size());
    size_t pos = 0;
    re2::StringPiece match;
    while (pos <= text.size() &&
           matcher_->Match(input, pos, text.size(), re2::RE2::UNANCHORED, &match, 1)) {
        const auto offset = static_cast<size_t>(match.data() - text.data());
        if (match.empty()) {
            pos = offset + 1;
            continue;
        }
        spans.push_back({offset, match.size()});
        pos = offset + match.size();
    }
    return Result<std::vector<MatchSpan>>::ok(std::move(spans));
}

Result<bool> CompiledPattern::matches(std::string_view text) const {
    auto spans = find_all(text);
    if (spans.is_error()) {
        return Result<bool>::error(spans.error_category(), spans.error_message());
    }
    return Result<bool>::ok(!spans.value().empty());
}

// ============================================================================
// PatternLibrary
// ============================================================================

PatternLibrary PatternLibrary::with_defaults() {
    PatternLibrary library;
    for (const auto& def : builtin_definitions()) {
        // Builtins are covered by tests; a failure here is a programming error
        if (auto r = library.add(def); r.is_error()) {
            throw std::logic_error("Builtin pattern rejected: " + r.error_message());
        }
    }
    return library;
}

Result<void> PatternLibrary::add(PatternDefinition definition) {
    if (ids_.contains(definition.id)) {
        return Result<void>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Duplicate pattern id '{}'", definition.id));
    }

    auto compiled = CompiledPattern::compile(std::move(definition));
    if (compiled.is_error()) {
        return Result<void>::error(compiled.error_category(), compiled.error_message());
    }

    const auto& profile = compiled.value().profile();
    if (profile.risk == RiskLevel::HIGH) {
        return Result<void>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Pattern '{}' refused: backtracking hazard '{}'",
                        compiled.value().definition().id, profile.hazard));
    }

    ids_.insert(compiled.value().definition().id);
    patterns_.push_back(std::move(compiled.value()));
    return Result<void>::ok();
}

const CompiledPattern* PatternLibrary::find(std::string_view id) const {
    const auto it = std::ranges::find_if(patterns_,
        [id](const CompiledPattern& p) { return p.definition().id == id; });
    return it == patterns_.end() ? nullptr : &*it;
}

const std::vector<PatternDefinition>& PatternLibrary::builtin_definitions() {
    using enum PatternCategory;
    static const std::vector<PatternDefinition> defs = {
        // Role / system override markers
        {"role-marker-privileged", INJECTION, Severity::CRITICAL,
         R"(\[\s*(?:system|admin|assistant)\s*:)",
         "Privileged role marker", {}},
        {"role-marker-user", INJECTION, Severity::HIGH,
         R"(\[\s*user\s*:)",
         "User role marker", {}},

        // Instruction override
        {"instruction-override", INJECTION, Severity::CRITICAL,
         R"(\b(?:ignore|disregard|forget)\s+(?:(?:all|any|the)\s+)?(?:previous|prior|above|earlier)\s+(?:instructions|directions|rules|prompts)\b)",
         "Attempt to override prior instructions", {}},
        {"instruction-override-short", INJECTION, Severity::CRITICAL,
         R"(\b(?:ignore|disregard)\s+all\s+(?:instructions|rules)\b)",
         "Attempt to discard all instructions", {}},
        {"role-escalation-you-are-now", INJECTION, Severity::CRITICAL,
         R"(\byou\s+are\s+now\s+(?:(?:a|an)\s+)?(?:admin|administrator|root|system|sudo|superuser)\b)",
         "Privilege escalation phrase", {}},
        {"role-escalation-act-as", INJECTION, Severity::CRITICAL,
         R"(\bact\s+as\s+(?:(?:a|an)\s+)?(?:admin|administrator|root|system|sudo|superuser)\b)",
         "Privilege escalation phrase", {}},

        // Exfiltration
        {"exfiltrate-all", EXFILTRATION, Severity::CRITICAL,
         R"(\b(?:export|send|upload|transmit|forward)\s+all\s+(?:(?:your|the|my)\s+)?(?:files|data|personas|tokens|credentials|secrets|keys)\b)",
         "Bulk exfiltration request", {}},
        {"enumerate-secrets", EXFILTRATION, Severity::HIGH,
         R"(\b(?:list|dump|print|reveal|show me)\s+all\s+(?:tokens|credentials|secrets|passwords|api keys)\b)",
         "Secret enumeration request", {}},
        {"github-token-literal", EXFILTRATION, Severity::CRITICAL,
         R"(\bgh[pousr]_[A-Za-z0-9]{36}\b)",
         "GitHub token literal", {}},
        {"github-pat-literal", EXFILTRATION, Severity::CRITICAL,
         R"(\bgithub_pat_[A-Za-z0-9_]{82}\b)",
         "GitHub fine-grained token literal", {}},
        {"github-token-reference", EXFILTRATION, Severity::HIGH,
         R"(\bGITHUB_TOKEN\b)",
         "Reference to the platform token variable", {}},

        // Command execution
        {"outbound-fetch", EXEC, Severity::CRITICAL,
         R"(\b(?:curl|wget)\s[^\n]{0,120}(?:https?://|ftp://|[a-z0-9-]+\.(?:com|net|org|io|dev|xyz|ru|cn|sh)\b))",
         "Outbound fetch command", {}},
        {"command-substitution", EXEC, Severity::CRITICAL,
         R"(\$\([^)\n]*\))",
         "Shell command substitution", {}},
        {"backtick-shell", EXEC, Severity::CRITICAL,
         R"(`\s*(?:rm|curl|wget|bash|sh|zsh|nc|chmod|sudo|python|perl)\b[^`\n]*`)",
         "Backtick shell execution", {}},
        {"code-eval", EXEC, Severity::CRITICAL,
         R"(\b(?:eval|exec|os\.system|os\.popen|child_process\.exec)\s*\()",
         "Dynamic code execution call", {}},
        {"subprocess-call", EXEC, Severity::CRITICAL,
         R"(\bsubprocess\.(?:run|call|popen|check_output|check_call)\b)",
         "Subprocess invocation", {}},
        {"shell-metacharacters", EXEC, Severity::MEDIUM,
         R"([;&|`$()])",
         "Shell metacharacter", kFieldContexts},

        // Paths
        {"sensitive-file", PATH, Severity::HIGH,
         R"(/etc/(?:passwd|shadow|sudoers)\b|/\.ssh/|\.aws/credentials)",
         "Sensitive system file reference", {}},
        {"deep-traversal", PATH, Severity::HIGH,
         R"((?:\.\.[/\\]){3,})",
         "Chained directory traversal", {}},
        {"path-traversal", PATH, Severity::MEDIUM,
         R"(\.\.[/\\])",
         "Directory traversal segment", {}},
        {"protocol-handler", PATH, Severity::HIGH,
         R"(\b(?:file|php|phar|gopher|expect|jar)://|\bdata:text/html)",
         "Dangerous protocol handler", {}},

        // YAML / deserialization
        {"yaml-constructor-tag", YAML, Severity::CRITICAL,
         R"(!!(?:python|ruby|java|perl|php|js|exec|eval|new|construct|apply|call|invoke)\b)",
         "YAML constructor tag", {}},
        {"yaml-binary-tag", YAML, Severity::HIGH,
         R"(!!binary\b)",
         "YAML binary payload", {}},

        // Markup
        {"html-script", INJECTION, Severity::MEDIUM,
         R"(<\s*/?\s*script\b[^>]*>?)",
         "Script tag", {}},
    };
    return defs;
}

} // namespace personaguard
