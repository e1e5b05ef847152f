#include "auditor/scanner.hpp"
#include "auditor/security_rules.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace personaguard {

namespace {

void load_rules(RuleEngine& engine, std::vector<SecurityRule> rules) {
    for (auto& rule : rules) {
        const std::string id = rule.id;
        auto added = engine.add(std::move(rule));
        if (!added.is_ok()) {
            // Builtin rule tables are static; failure here is a programming error
            throw std::logic_error(std::format("Builtin rule {} rejected: {}", id, added.error_message()));
        }
    }
}

bool has_kind(const std::vector<std::string>& kinds, const std::string& path) {
    const auto kind = file_kind(path);
    return !kind.empty() && std::ranges::find(kinds, kind) != kinds.end();
}

} // anonymous namespace

// ============================================================================
// CodeScanner
// ============================================================================

CodeScanner::CodeScanner() : CodeScanner(rules::code_rules()) {}

CodeScanner::CodeScanner(std::vector<SecurityRule> rules) {
    load_rules(engine_, std::move(rules));
}

bool CodeScanner::wants(const std::string& relative_path) const {
    return has_kind(rules::source_kinds(), relative_path);
}

std::vector<Finding> CodeScanner::scan(const SourceFile& file) const {
    return engine_.evaluate(file);
}

// ============================================================================
// ConfigScanner
// ============================================================================

ConfigScanner::ConfigScanner() {
    load_rules(engine_, rules::configuration());
}

bool ConfigScanner::wants(const std::string& relative_path) const {
    return has_kind(rules::config_kinds(), relative_path);
}

std::vector<Finding> ConfigScanner::scan(const SourceFile& file) const {
    return engine_.evaluate(file);
}

} // namespace personaguard
