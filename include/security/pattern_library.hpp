#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace re2 { class RE2; }

namespace personaguard {

/**
 * @brief One threat signature, as data
 *
 * contexts restricts the pattern to specific content contexts
 * ("metadata-field", "search-query", ...). Empty means every context.
 */
struct PatternDefinition {
    std::string id;
    PatternCategory category = PatternCategory::INJECTION;
    Severity severity = Severity::MEDIUM;
    std::string source;                 // RE2 syntax, matched case-insensitively
    std::string description;
    std::vector<std::string> contexts;
};

struct MatchSpan {
    size_t offset = 0;
    size_t length = 0;
};

/**
 * @brief A compiled pattern bound to its complexity profile
 *
 * find_all() refuses input longer than the profile's ceiling before the
 * matcher runs.
 */
class CompiledPattern {
public:
    static Result<CompiledPattern> compile(PatternDefinition definition);

    CompiledPattern(CompiledPattern&&) noexcept;
    CompiledPattern& operator=(CompiledPattern&&) noexcept;
    ~CompiledPattern();

    [[nodiscard]] const PatternDefinition& definition() const { return definition_; }
    [[nodiscard]] const ComplexityProfile& profile() const { return profile_; }

    [[nodiscard]] bool applies_to(std::string_view context) const;

    /// Non-overlapping matches, left to right
    [[nodiscard]] Result<std::vector<MatchSpan>> find_all(std::string_view text) const;

    [[nodiscard]] Result<bool> matches(std::string_view text) const;

private:
    CompiledPattern(PatternDefinition definition, ComplexityProfile profile,
                    std::unique_ptr<re2::RE2> matcher);

    PatternDefinition definition_;
    ComplexityProfile profile_;
    std::unique_ptr<re2::RE2> matcher_;
};

/**
 * @brief Data-driven threat signature library
 *
 * Admission compiles each source with RE2 and classifies it with
 * RegexComplexityAnalyzer; HIGH risk sources and duplicate ids are refused.
 * The library is immutable once shared with validators.
 */
class PatternLibrary {
public:
    PatternLibrary() = default;

    /// Library preloaded with builtin_definitions()
    [[nodiscard]] static PatternLibrary with_defaults();

    [[nodiscard]] static const std::vector<PatternDefinition>& builtin_definitions();

    Result<void> add(PatternDefinition definition);

    [[nodiscard]] const std::vector<CompiledPattern>& patterns() const { return patterns_; }
    [[nodiscard]] size_t size() const { return patterns_.size(); }
    [[nodiscard]] const CompiledPattern* find(std::string_view id) const;

private:
    std::vector<CompiledPattern> patterns_;
    std::unordered_set<std::string> ids_;
};

} // namespace personaguard
