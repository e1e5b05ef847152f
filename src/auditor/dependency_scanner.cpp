#include "auditor/scanner.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>
#include <re2/re2.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <format>

namespace personaguard {

namespace {

constexpr std::array<std::string_view, 4> kPackageSections = {
    "dependencies", "devDependencies", "optionalDependencies", "peerDependencies",
};

constexpr std::array<std::string_view, 7> kMutableRefs = {
    "main", "master", "develop", "dev", "head", "trunk", "latest",
};

bool is_mutable_ref(std::string_view ref) {
    std::string lower = utils::to_lower(ref);
    if (lower.starts_with("origin/")) return true;
    return std::ranges::find(kMutableRefs, std::string_view(lower)) != kMutableRefs.end();
}

bool is_floating_version(std::string_view spec) {
    const std::string s = utils::to_lower(utils::trim(spec));
    if (s.empty() || s == "*" || s == "x" || s == "latest" || s == "next") return true;
    // Open-ended ranges (">=1.0" with no upper bound)
    if ((s.starts_with(">") || s.starts_with(">=")) && s.find('<') == std::string::npos) return true;
    return false;
}

uint32_t line_of_offset(std::string_view content, size_t offset) {
    return static_cast<uint32_t>(std::count(content.begin(),
        content.begin() + static_cast<std::ptrdiff_t>(std::min(offset, content.size())), '\n')) + 1;
}

/// Line of the first occurrence of needle, or 1 when absent
uint32_t line_of(std::string_view content, std::string_view needle) {
    const auto pos = content.find(needle);
    return pos == std::string_view::npos ? 1 : line_of_offset(content, pos);
}

std::string_view line_at(std::string_view content, uint32_t line) {
    size_t start = 0;
    for (uint32_t i = 1; i < line; ++i) {
        const auto nl = content.find('\n', start);
        if (nl == std::string_view::npos) return {};
        start = nl + 1;
    }
    const auto end = content.find('\n', start);
    return content.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
}

SecurityRule dependency_rule(const char* id, const char* name, const char* description,
                             Severity severity, const char* reference, const char* remediation) {
    SecurityRule rule;
    rule.id = id;
    rule.name = name;
    rule.description = description;
    rule.severity = severity;
    rule.category = "dependency";
    rule.reference = reference;
    rule.remediation = remediation;
    return rule;
}

/// Whitespace-separated argument tokens of a CMake command, with offsets
struct CMakeToken {
    std::string text;
    size_t offset;
};

std::vector<CMakeToken> tokenize_cmake_args(std::string_view body, size_t base) {
    std::vector<CMakeToken> tokens;
    size_t i = 0;
    while (i < body.size()) {
        const char c = body[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
        } else if (c == '#') {
            while (i < body.size() && body[i] != '\n') ++i;
        } else if (c == '"') {
            const size_t start = i++;
            std::string text;
            while (i < body.size() && body[i] != '"') text += body[i++];
            ++i;
            tokens.push_back({std::move(text), base + start});
        } else {
            const size_t start = i;
            while (i < body.size() && !std::isspace(static_cast<unsigned char>(body[i]))) ++i;
            tokens.push_back({std::string(body.substr(start, i - start)), base + start});
        }
    }
    return tokens;
}

} // anonymous namespace

DependencyScanner::DependencyScanner() = default;

const std::vector<SecurityRule>& DependencyScanner::dependency_rules() {
    static const std::vector<SecurityRule> rules = {
        dependency_rule("DEP-001", "Floating Dependency Version",
            "Dependency version is a wildcard, 'latest' or an open range", Severity::HIGH,
            "https://owasp.org/Top10/A06_2021-Vulnerable_and_Outdated_Components/",
            "Pin dependencies to an exact version or a bounded range"),
        dependency_rule("DEP-002", "Mutable Git Reference",
            "Dependency fetched from a branch or without any ref", Severity::MEDIUM,
            "https://cwe.mitre.org/data/definitions/829.html",
            "Pin git dependencies to a tag or commit hash"),
        dependency_rule("DEP-003", "Insecure Download URL",
            "Dependency fetched over plain HTTP", Severity::HIGH,
            "https://cwe.mitre.org/data/definitions/319.html",
            "Fetch dependencies over HTTPS"),
        dependency_rule("DEP-004", "Unverified Download",
            "Archive downloaded without an integrity hash", Severity::MEDIUM,
            "https://cwe.mitre.org/data/definitions/494.html",
            "Add URL_HASH (SHA256) for every downloaded archive"),
    };
    return rules;
}

std::vector<const SecurityRule*> DependencyScanner::rules() const {
    std::vector<const SecurityRule*> out;
    for (const auto& r : dependency_rules()) out.push_back(&r);
    return out;
}

bool DependencyScanner::wants(const std::string& relative_path) const {
    const auto slash = relative_path.rfind('/');
    const std::string name = utils::to_lower(
        slash == std::string::npos ? relative_path : relative_path.substr(slash + 1));
    return name == "package.json" || name == "vcpkg.json" || name == "conanfile.txt" ||
           name == "cmakelists.txt" || name.ends_with(".cmake");
}

Finding DependencyScanner::make(std::string_view rule_id, const SourceFile& file, uint32_t line,
                                std::string message) const {
    const auto& all = dependency_rules();
    const auto it = std::ranges::find_if(all, [&](const SecurityRule& r) { return r.id == rule_id; });
    RuleHit hit;
    hit.line = line;
    hit.column = 1;
    hit.snippet = make_snippet(line_at(file.content, line));
    hit.message = std::move(message);
    hit.confidence = Confidence::HIGH;
    return RuleEngine::make_finding(*it, file, std::move(hit));
}

std::vector<Finding> DependencyScanner::scan(const SourceFile& file) const {
    const std::string name = utils::to_lower(file.filename());
    if (name == "package.json") return scan_package_json(file);
    if (name == "vcpkg.json") return scan_vcpkg_json(file);
    if (name == "conanfile.txt") return scan_conanfile(file);
    return scan_cmake(file);
}

std::vector<Finding> DependencyScanner::scan_package_json(const SourceFile& file) const {
    std::vector<Finding> out;
    const auto doc = nlohmann::json::parse(file.content, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        utils::log::debug(std::format("Skipping unparsable manifest {}", file.path));
        return out;
    }

    for (const auto section : kPackageSections) {
        const auto it = doc.find(std::string(section));
        if (it == doc.end() || !it->is_object()) continue;

        for (const auto& [dep, spec_json] : it->items()) {
            if (!spec_json.is_string()) continue;
            const auto spec = spec_json.get<std::string>();
            const uint32_t line = line_of(file.content, std::format("\"{}\"", dep));

            if (spec.find("http://") != std::string::npos) {
                out.push_back(make("DEP-003", file, line,
                    std::format("{} is fetched over plain HTTP", dep)));
                continue;
            }

            const bool git = spec.starts_with("git") || spec.starts_with("github:") ||
                             spec.find(".git") != std::string::npos;
            if (git) {
                const auto hash = spec.find('#');
                if (hash == std::string::npos) {
                    out.push_back(make("DEP-002", file, line,
                        std::format("{} tracks a git repository without a ref", dep)));
                } else if (is_mutable_ref(std::string_view(spec).substr(hash + 1))) {
                    out.push_back(make("DEP-002", file, line,
                        std::format("{} tracks branch '{}'", dep, spec.substr(hash + 1))));
                }
                continue;
            }

            if (spec.starts_with("file:") || spec.starts_with("link:") || spec.starts_with("workspace:")) {
                continue;
            }
            if (is_floating_version(spec)) {
                out.push_back(make("DEP-001", file, line,
                    std::format("{} uses floating version '{}'", dep, spec)));
            }
        }
    }
    return out;
}

std::vector<Finding> DependencyScanner::scan_vcpkg_json(const SourceFile& file) const {
    std::vector<Finding> out;
    const auto doc = nlohmann::json::parse(file.content, nullptr, false);
    if (doc.is_discarded()) {
        utils::log::debug(std::format("Skipping unparsable manifest {}", file.path));
        return out;
    }

    // Plain-http URLs anywhere in the manifest
    const auto walk = [&](const auto& self, const nlohmann::json& node) -> void {
        if (node.is_string()) {
            const auto& s = node.get_ref<const std::string&>();
            if (s.starts_with("http://")) {
                out.push_back(make("DEP-003", file, line_of(file.content, s),
                                   "Registry or port fetched over plain HTTP"));
            }
        } else if (node.is_structured()) {
            for (const auto& child : node) self(self, child);
        }
    };
    walk(walk, doc);

    if (const auto regs = doc.find("registries"); regs != doc.end() && regs->is_array()) {
        for (const auto& reg : *regs) {
            if (!reg.is_object()) continue;
            const auto ref = reg.value("reference", std::string{});
            if (!ref.empty() && is_mutable_ref(ref)) {
                out.push_back(make("DEP-002", file, line_of(file.content, "\"reference\""),
                    std::format("Registry tracks branch '{}'", ref)));
            }
        }
    }
    return out;
}

std::vector<Finding> DependencyScanner::scan_conanfile(const SourceFile& file) const {
    std::vector<Finding> out;
    bool in_requires = false;
    uint32_t line_no = 0;

    for (const auto& raw : utils::split(file.content, '\n')) {
        ++line_no;
        const std::string line = utils::trim(raw);
        if (line.empty() || line.starts_with("#")) continue;
        if (line.starts_with("[")) {
            in_requires = line == "[requires]" || line == "[tool_requires]" || line == "[build_requires]";
            continue;
        }
        if (!in_requires) continue;

        const auto slash = line.find('/');
        if (slash == std::string::npos) {
            out.push_back(make("DEP-001", file, line_no,
                std::format("{} has no version", line)));
            continue;
        }
        std::string version = line.substr(slash + 1);
        version = version.substr(0, version.find('@'));

        const bool open_range = version.starts_with("[") &&
            (version.find('*') != std::string::npos || version.find('<') == std::string::npos);
        if (open_range || is_floating_version(version)) {
            out.push_back(make("DEP-001", file, line_no,
                std::format("{} uses floating version '{}'", line.substr(0, slash), version)));
        }
    }
    return out;
}

std::vector<Finding> DependencyScanner::scan_cmake(const SourceFile& file) const {
    static const RE2 kDeclaration(R"((?i)\b(FetchContent_Declare|ExternalProject_Add)\s*\()");

    std::vector<Finding> out;
    const std::string_view content = file.content;
    re2::StringPiece input(content.data(), content.size());
    re2::StringPiece match[2];

    size_t pos = 0;
    while (pos < content.size() &&
           kDeclaration.Match(input, pos, input.size(), RE2::UNANCHORED, match, 2)) {
        const size_t open = static_cast<size_t>(match[0].data() - content.data()) + match[0].size();
        const uint32_t decl_line = line_of_offset(content, open);

        // Matching close paren, skipping quoted text
        size_t close = open;
        int depth = 1;
        bool quoted = false;
        while (close < content.size() && depth > 0) {
            const char c = content[close];
            if (c == '"') quoted = !quoted;
            else if (!quoted && c == '(') ++depth;
            else if (!quoted && c == ')') --depth;
            if (depth > 0) ++close;
        }

        const auto tokens = tokenize_cmake_args(content.substr(open, close - open), open);
        const std::string dep = tokens.empty() ? std::string("<unnamed>") : tokens.front().text;

        std::optional<CMakeToken> git_repo, git_tag, url;
        bool has_hash = false;
        for (size_t i = 0; i + 1 < tokens.size(); ++i) {
            const auto& key = tokens[i].text;
            if (key == "GIT_REPOSITORY") git_repo = tokens[i + 1];
            else if (key == "GIT_TAG") git_tag = tokens[i + 1];
            else if (key == "URL") url = tokens[i + 1];
            else if (key == "URL_HASH" || key == "URL_MD5") has_hash = true;
        }

        if (git_repo) {
            const uint32_t line = line_of_offset(content, git_repo->offset);
            if (git_repo->text.starts_with("http://") || git_repo->text.starts_with("git://")) {
                out.push_back(make("DEP-003", file, line,
                    std::format("{} is cloned over an unencrypted transport", dep)));
            }
            if (!git_tag) {
                out.push_back(make("DEP-002", file, decl_line,
                    std::format("{} has no GIT_TAG", dep)));
            } else if (is_mutable_ref(git_tag->text)) {
                out.push_back(make("DEP-002", file, line_of_offset(content, git_tag->offset),
                    std::format("{} tracks branch '{}'", dep, git_tag->text)));
            }
        }
        if (url) {
            const uint32_t line = line_of_offset(content, url->offset);
            if (url->text.starts_with("http://")) {
                out.push_back(make("DEP-003", file, line,
                    std::format("{} is downloaded over plain HTTP", dep)));
            }
            if (!has_hash) {
                out.push_back(make("DEP-004", file, line,
                    std::format("{} is downloaded without URL_HASH", dep)));
            }
        }

        pos = close + 1;
    }
    return out;
}

} // namespace personaguard
