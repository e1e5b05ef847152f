#pragma once

#include "auditor/finding.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace re2 { class RE2; }

namespace personaguard {

/**
 * @brief A file handed to rules and scanners
 *
 * path is relative to the project root. kind is the lowercase extension
 * (".cpp"), or ".env" for dotenv files.
 */
struct SourceFile {
    std::string path;
    std::string kind;
    std::string content;
    bool is_test = false;

    [[nodiscard]] std::string filename() const;
};

/// ".cpp" for "src/a.CPP", ".env" for ".env.local", "" when none
[[nodiscard]] std::string file_kind(std::string_view path);

/// Path has a test/spec directory or file-name component
[[nodiscard]] bool is_test_path(std::string_view path);

/// Trimmed line truncated to 100 bytes on a UTF-8 boundary
[[nodiscard]] std::string make_snippet(std::string_view line);

/// Snippet with quoted literals and credential-shaped text masked
[[nodiscard]] std::string make_redacted_snippet(std::string_view line);

struct RuleHit {
    uint32_t line = 0;
    uint32_t column = 0;
    std::string snippet;
    std::string message;      // Empty: rule description
    Confidence confidence = Confidence::MEDIUM;
};

using SemanticCheck = std::function<std::vector<RuleHit>(const SourceFile&)>;

/**
 * @brief One audit rule: an RE2 line pattern or a semantic check
 */
struct SecurityRule {
    std::string id;
    std::string name;
    std::string description;
    Severity severity = Severity::MEDIUM;
    std::string category = "code";
    std::string reference;
    std::string remediation;
    std::vector<std::string> kinds;     // File kinds in scope; empty = all
    std::string pattern;
    bool case_sensitive = false;
    bool high_confidence = false;
    bool skip_tests = false;
    bool redact_snippet = false;        // Mask quoted literals in the snippet
    SemanticCheck check;
};

/**
 * @brief Evaluates a rule set over one file at a time
 *
 * Pattern rules run per line and report the first match on each line.
 * Lines longer than the pattern's complexity ceiling are skipped.
 * Thread-safe for concurrent evaluate() once populated.
 */
class RuleEngine {
public:
    RuleEngine();
    RuleEngine(RuleEngine&&) noexcept;
    RuleEngine& operator=(RuleEngine&&) noexcept;
    ~RuleEngine();

    /// Refuses duplicate ids, rules with neither or both of pattern/check,
    /// uncompilable patterns and HIGH risk patterns
    Result<void> add(SecurityRule rule);

    [[nodiscard]] bool applies(const SecurityRule& rule, const SourceFile& file) const;

    [[nodiscard]] std::vector<Finding> evaluate(const SourceFile& file) const;

    [[nodiscard]] size_t size() const { return rules_.size(); }
    [[nodiscard]] const SecurityRule* find(std::string_view id) const;
    [[nodiscard]] std::vector<const SecurityRule*> rules() const;

    [[nodiscard]] static Finding make_finding(const SecurityRule& rule, const SourceFile& file,
                                              RuleHit hit);

private:
    struct CompiledRule {
        SecurityRule rule;
        std::unique_ptr<re2::RE2> matcher;
        ComplexityProfile profile;
    };

    void evaluate_pattern(const CompiledRule& compiled, const SourceFile& file,
                          std::vector<Finding>& out) const;

    std::vector<CompiledRule> rules_;
};

} // namespace personaguard
