#include "auditor/rule_engine.hpp"
#include "core/utils.hpp"
#include "security/secret_scrubber.hpp"
#include "security/regex_complexity_analyzer.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <format>

namespace personaguard {

// ============================================================================
// SourceFile helpers
// ============================================================================

std::string SourceFile::filename() const {
    const auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string file_kind(std::string_view path) {
    const auto slash = path.rfind('/');
    const std::string name = utils::to_lower(slash == std::string_view::npos ? path : path.substr(slash + 1));

    if (name == ".env" || name.starts_with(".env.")) return ".env";

    const auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) return "";
    return name.substr(dot);
}

bool is_test_path(std::string_view path) {
    const std::string lower = utils::to_lower(path);
    for (const auto& part : utils::split(lower, '/')) {
        if (part == "test" || part == "tests" || part == "__tests__" || part == "spec") return true;
        if (part.starts_with("test_") || part.find("_test.") != std::string::npos ||
            part.find(".test.") != std::string::npos || part.find(".spec.") != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string make_snippet(std::string_view line) {
    return utils::truncate_utf8(utils::trim(line), 100);
}

std::string make_redacted_snippet(std::string_view line) {
    static const RE2 kDoubleQuoted(R"("[^"]*")");
    static const RE2 kSingleQuoted(R"('[^']*')");

    std::string masked = redact_secrets(utils::trim(line));
    RE2::GlobalReplace(&masked, kDoubleQuoted, R"("[REDACTED]")");
    RE2::GlobalReplace(&masked, kSingleQuoted, "'[REDACTED]'");

    // Unquoted assignments (KEY=value) keep only the key
    const auto eq = masked.find_first_of("=:");
    if (eq != std::string::npos && masked.find("[REDACTED]", eq) == std::string::npos) {
        masked = masked.substr(0, eq + 1) + std::string(kRedactedMarker);
    }
    return utils::truncate_utf8(masked, 100);
}

// ============================================================================
// RuleEngine
// ============================================================================

RuleEngine::RuleEngine() = default;
RuleEngine::RuleEngine(RuleEngine&&) noexcept = default;
RuleEngine& RuleEngine::operator=(RuleEngine&&) noexcept = default;
RuleEngine::~RuleEngine() = default;

Result<void> RuleEngine::add(SecurityRule rule) {
    if (rule.id.empty()) {
        return Result<void>::error(ErrorCategory::CONFIG_ERROR, "Rule id must not be empty");
    }
    if (find(rule.id)) {
        return Result<void>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Duplicate rule id '{}'", rule.id));
    }
    const bool has_pattern = !rule.pattern.empty();
    const bool has_check = static_cast<bool>(rule.check);
    if (has_pattern == has_check) {
        return Result<void>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Rule '{}' needs exactly one of pattern or check", rule.id));
    }

    CompiledRule compiled;
    if (has_pattern) {
        compiled.profile = RegexComplexityAnalyzer::analyze(rule.pattern);
        if (compiled.profile.risk == RiskLevel::HIGH) {
            return Result<void>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Rule '{}' pattern is high risk ({})", rule.id, compiled.profile.hazard));
        }

        RE2::Options options;
        options.set_case_sensitive(rule.case_sensitive);
        options.set_log_errors(false);
        compiled.matcher = std::make_unique<re2::RE2>(rule.pattern, options);
        if (!compiled.matcher->ok()) {
            return Result<void>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Rule '{}' pattern failed to compile: {}", rule.id, compiled.matcher->error()));
        }
    }

    compiled.rule = std::move(rule);
    rules_.push_back(std::move(compiled));
    return Result<void>::ok();
}

const SecurityRule* RuleEngine::find(std::string_view id) const {
    for (const auto& c : rules_) {
        if (c.rule.id == id) return &c.rule;
    }
    return nullptr;
}

std::vector<const SecurityRule*> RuleEngine::rules() const {
    std::vector<const SecurityRule*> out;
    out.reserve(rules_.size());
    for (const auto& c : rules_) out.push_back(&c.rule);
    return out;
}

bool RuleEngine::applies(const SecurityRule& rule, const SourceFile& file) const {
    if (rule.skip_tests && file.is_test) return false;
    if (rule.kinds.empty()) return true;
    return std::ranges::find(rule.kinds, file.kind) != rule.kinds.end();
}

Finding RuleEngine::make_finding(const SecurityRule& rule, const SourceFile& file, RuleHit hit) {
    Finding f;
    f.rule_id = rule.id;
    f.rule_name = rule.name;
    f.severity = rule.severity;
    f.category = rule.category;
    f.reference = rule.reference;
    f.file = file.path;
    f.line = hit.line;
    f.column = hit.column;
    f.snippet = std::move(hit.snippet);
    f.message = hit.message.empty()
        ? std::format("{}: {}", rule.name, rule.description)
        : std::format("{}: {}", rule.name, hit.message);
    f.remediation = rule.remediation;
    f.confidence = hit.confidence;
    return f;
}

void RuleEngine::evaluate_pattern(const CompiledRule& compiled, const SourceFile& file,
                                  std::vector<Finding>& out) const {
    const auto& rule = compiled.rule;
    const std::string_view content = file.content;

    uint32_t line_no = 0;
    size_t start = 0;
    while (start <= content.size()) {
        const auto nl = content.find('\n', start);
        const auto end = nl == std::string_view::npos ? content.size() : nl;
        auto line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        ++line_no;

        re2::StringPiece input(line.data(), line.size());
        re2::StringPiece match;
        if (line.size() <= compiled.profile.max_content_length &&
            compiled.matcher->Match(input, 0, input.size(), RE2::UNANCHORED, &match, 1)) {
            RuleHit hit;
            hit.line = line_no;
            hit.column = static_cast<uint32_t>(match.data() - line.data()) + 1;
            hit.snippet = rule.redact_snippet ? make_redacted_snippet(line) : make_snippet(line);

            const std::string lower = utils::to_lower(line);
            if (rule.high_confidence) {
                hit.confidence = Confidence::HIGH;
            } else if (file.is_test || lower.find("example") != std::string::npos ||
                       lower.find("test") != std::string::npos ||
                       lower.find("demo") != std::string::npos) {
                hit.confidence = Confidence::LOW;
            }
            out.push_back(make_finding(rule, file, std::move(hit)));
        }

        if (nl == std::string_view::npos) break;
        start = nl + 1;
    }
}

std::vector<Finding> RuleEngine::evaluate(const SourceFile& file) const {
    std::vector<Finding> out;
    for (const auto& compiled : rules_) {
        if (!applies(compiled.rule, file)) continue;

        if (compiled.matcher) {
            evaluate_pattern(compiled, file, out);
        } else {
            for (auto& hit : compiled.rule.check(file)) {
                out.push_back(make_finding(compiled.rule, file, std::move(hit)));
            }
        }
    }
    return out;
}

} // namespace personaguard
