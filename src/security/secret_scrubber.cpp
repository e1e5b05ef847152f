#include "security/secret_scrubber.hpp"

#include <re2/re2.h>

#include <array>
#include <memory>

namespace personaguard {

namespace {

struct ScrubRule {
    std::unique_ptr<re2::RE2> re;
    std::string rewrite;
};

const std::array<ScrubRule, 6>& scrub_rules() {
    static const auto rules = [] {
        re2::RE2::Options opts;
        opts.set_log_errors(false);

        re2::RE2::Options icase = opts;
        icase.set_case_sensitive(false);

        return std::array<ScrubRule, 6>{{
            {std::make_unique<re2::RE2>(R"(gh[pousr]_[A-Za-z0-9]{20,255})", opts), "[REDACTED]"},
            {std::make_unique<re2::RE2>(R"(github_pat_[A-Za-z0-9_]{20,255})", opts), "[REDACTED]"},
            {std::make_unique<re2::RE2>(R"((bearer)\s+[A-Za-z0-9._~+/=-]+)", icase), "\\1 [REDACTED]"},
            {std::make_unique<re2::RE2>(R"((authorization:\s*token)\s+[A-Za-z0-9._-]+)", icase),
             "\\1 [REDACTED]"},
            // Legacy 40-hex OAuth tokens and other long values after the word token
            {std::make_unique<re2::RE2>(R"(\b(token)\s+[A-Za-z0-9._-]{20,})", icase), "\\1 [REDACTED]"},
            {std::make_unique<re2::RE2>(R"(((?:github|gh)_token)\s*[=:]\s*["']?[^\s"',;]+["']?)", icase),
             "\\1=[REDACTED]"},
        }};
    }();
    return rules;
}

} // namespace

std::string redact_secrets(std::string_view text) {
    std::string out(text);
    for (const auto& rule : scrub_rules()) {
        re2::RE2::GlobalReplace(&out, *rule.re, rule.rewrite);
    }
    return out;
}

bool contains_secret(std::string_view text) {
    const re2::StringPiece input(text.data(), text.size());
    for (const auto& rule : scrub_rules()) {
        if (re2::RE2::PartialMatch(input, *rule.re)) return true;
    }
    return false;
}

} // namespace personaguard
