#include "auditor/glob_matcher.hpp"
#include "security/regex_complexity_analyzer.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <format>

namespace personaguard {

namespace {

constexpr std::string_view kRegexMeta = "\\.^$|?*+()[]{}";

bool is_regex_meta(char c) {
    return kRegexMeta.find(c) != std::string_view::npos;
}

} // anonymous namespace

std::string escape_regex(std::string_view text) {
    std::string out;
    out.reserve(text.size() * 2);
    for (const char c : text) {
        if (is_regex_meta(c)) out += '\\';
        out += c;
    }
    return out;
}

std::string glob_to_regex(std::string_view glob) {
    // Pass 1: everything literal
    const std::string escaped = escape_regex(glob);

    // Pass 2: re-expand the escaped wildcard tokens
    std::string out = "^";
    out.reserve(escaped.size() + 16);
    const std::string_view e = escaped;
    size_t i = 0;
    while (i < e.size()) {
        const auto rest = e.substr(i);
        if (rest.starts_with("\\*\\*/")) {
            out += "(?:.*/)?";
            i += 5;
        } else if (rest.starts_with("\\*\\*")) {
            out += ".*";
            i += 4;
        } else if (rest.starts_with("\\*")) {
            out += "[^/]*";
            i += 2;
        } else if (rest.starts_with("\\?")) {
            out += "[^/]";
            i += 2;
        } else if (rest.starts_with("\\") && rest.size() > 1) {
            // Escaped literal; copy both characters
            out.append(rest.substr(0, 2));
            i += 2;
        } else {
            out += e[i++];
        }
    }
    out += '$';
    return out;
}

GlobMatcher::GlobMatcher(std::string glob, std::string regex, ComplexityProfile profile,
                         std::unique_ptr<re2::RE2> matcher)
    : glob_(std::move(glob)),
      regex_(std::move(regex)),
      profile_(profile),
      matcher_(std::move(matcher)),
      wildcards_(static_cast<size_t>(std::ranges::count_if(glob_, [](char c) {
          return c == '*' || c == '?';
      }))) {}

GlobMatcher::GlobMatcher(GlobMatcher&&) noexcept = default;
GlobMatcher& GlobMatcher::operator=(GlobMatcher&&) noexcept = default;
GlobMatcher::~GlobMatcher() = default;

Result<GlobMatcher> GlobMatcher::compile(std::string glob) {
    if (glob.empty()) {
        return Result<GlobMatcher>::error(ErrorCategory::CONFIG_ERROR, "Empty glob pattern");
    }

    std::string regex = glob_to_regex(glob);
    const auto profile = RegexComplexityAnalyzer::analyze(regex);
    if (profile.risk == RiskLevel::HIGH) {
        return Result<GlobMatcher>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Glob '{}' converts to a high-risk pattern ({})", glob, profile.hazard));
    }

    RE2::Options options;
    options.set_log_errors(false);
    auto matcher = std::make_unique<re2::RE2>(regex, options);
    if (!matcher->ok()) {
        return Result<GlobMatcher>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Glob '{}' failed to compile: {}", glob, matcher->error()));
    }

    return Result<GlobMatcher>::ok(
        GlobMatcher(std::move(glob), std::move(regex), profile, std::move(matcher)));
}

bool GlobMatcher::matches(std::string_view path) const {
    if (path.size() > profile_.max_content_length) return false;
    return RE2::FullMatch(re2::StringPiece(path.data(), path.size()), *matcher_);
}

} // namespace personaguard
