#include "security/content_validator.hpp"
#include "audit/security_log.hpp"
#include "core/utf8.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace personaguard {

namespace {

void add_unique(std::vector<std::string>& ids, std::string id) {
    if (std::ranges::find(ids, id) == ids.end()) {
        ids.push_back(std::move(id));
    }
}

std::string strip_spans(std::string_view text, std::vector<MatchSpan> spans) {
    std::ranges::sort(spans, {}, &MatchSpan::offset);
    std::string out;
    out.reserve(text.size());
    size_t cursor = 0;
    for (const auto& span : spans) {
        if (span.offset + span.length <= cursor) continue;
        if (span.offset > cursor) {
            out.append(text.substr(cursor, span.offset - cursor));
        }
        cursor = std::max(cursor, span.offset + span.length);
    }
    if (cursor < text.size()) {
        out.append(text.substr(cursor));
    }
    return out;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ',';
        out += item;
    }
    return out;
}

} // namespace

ContentValidator::ContentValidator(std::shared_ptr<const PatternLibrary> library,
                                   SecurityLog& log, Config config)
    : library_(std::move(library)),
      log_(log),
      config_(std::move(config)) {}

size_t ContentValidator::max_length_for(std::string_view context) const {
    if (const auto it = config_.context_limits.find(std::string(context));
        it != config_.context_limits.end()) {
        return it->second;
    }
    return config_.default_max_length;
}

ContentValidator::ScanResult ContentValidator::scan(std::string_view text,
                                                    std::string_view context) const {
    ScanResult result;
    for (const auto& pattern : library_->patterns()) {
        if (!pattern.applies_to(context)) continue;

        const auto& def = pattern.definition();
        auto spans = pattern.find_all(text);
        if (spans.is_error()) {
            // Over the pattern's ceiling: fail closed without running the matcher
            result.severity = max_severity(result.severity, Severity::HIGH);
            add_unique(result.ids, "length-ceiling:" + def.id);
            continue;
        }
        if (spans.value().empty()) continue;

        result.severity = max_severity(result.severity, def.severity);
        add_unique(result.ids, def.id);
        if (!at_least(def.severity, config_.reject_threshold)) {
            result.strip_spans.insert(result.strip_spans.end(),
                                      spans.value().begin(), spans.value().end());
        }
    }
    return result;
}

Verdict ContentValidator::validate(std::string_view text, std::string_view context) const {
    Verdict verdict;
    verdict.context = std::string(context);

    // Limits are in code points; no encoding packs more than 4 bytes into one
    const size_t limit = max_length_for(context);
    if (text.size() > limit && (text.size() / 4 > limit || utf8::count(text) > limit)) {
        verdict.severity = Severity::HIGH;
        verdict.matched_patterns.emplace_back("length-limit");
        verdict.accepted = false;
        log_verdict(verdict, text.size());
        return verdict;
    }

    auto normalized = UnicodeNormalizer::normalize(text);
    for (const auto& issue : normalized.issues) {
        verdict.severity = max_severity(verdict.severity, issue.severity);
        add_unique(verdict.matched_patterns,
                   std::string("unicode:") + UnicodeNormalizer::issue_kind_to_string(issue.kind));
    }

    std::string current = std::move(normalized.normalized);
    bool stable = false;
    for (size_t pass = 0; pass < config_.max_sanitize_passes; ++pass) {
        auto scan_result = scan(current, context);
        verdict.severity = max_severity(verdict.severity, scan_result.severity);
        for (auto& id : scan_result.ids) {
            add_unique(verdict.matched_patterns, std::move(id));
        }

        if (at_least(verdict.severity, config_.reject_threshold)) {
            break;
        }
        if (scan_result.strip_spans.empty()) {
            stable = true;
            break;
        }

        // Stripping can join fragments into new matches or new mixed-script
        // tokens, so re-normalize and re-scan until nothing changes
        auto renormalized = UnicodeNormalizer::normalize(
            strip_spans(current, std::move(scan_result.strip_spans)));
        for (const auto& issue : renormalized.issues) {
            verdict.severity = max_severity(verdict.severity, issue.severity);
            add_unique(verdict.matched_patterns,
                       std::string("unicode:") + UnicodeNormalizer::issue_kind_to_string(issue.kind));
        }
        current = std::move(renormalized.normalized);
    }

    if (!stable && !at_least(verdict.severity, config_.reject_threshold)) {
        // Adversarial input that keeps producing matches
        verdict.severity = max_severity(verdict.severity, config_.reject_threshold);
        add_unique(verdict.matched_patterns, "sanitize-unstable");
    }

    if (at_least(verdict.severity, config_.reject_threshold)) {
        verdict.accepted = false;
    } else {
        verdict.sanitized = std::move(current);
    }

    log_verdict(verdict, text.size());
    return verdict;
}

std::string ContentValidator::sanitize(std::string_view text, std::string_view context) const {
    return validate(text, context).sanitized;
}

Result<std::string> ContentValidator::require_safe(std::string_view text,
                                                   std::string_view context) const {
    auto verdict = validate(text, context);
    if (verdict.rejected()) {
        return Result<std::string>::error(ErrorCategory::VALIDATION_REJECTED,
            std::format("Content rejected ({} severity) in {}",
                        severity_to_string(verdict.severity), verdict.context));
    }
    return Result<std::string>::ok(std::move(verdict.sanitized));
}

void ContentValidator::log_verdict(const Verdict& verdict, size_t input_length) const {
    std::map<std::string, std::string> metadata = {
        {"context", verdict.context},
        {"length", std::to_string(input_length)},
    };
    if (!verdict.matched_patterns.empty()) {
        metadata["patterns"] = join(verdict.matched_patterns);
    }

    if (verdict.rejected()) {
        log_.record(SecurityEventType::CONTENT_INJECTION_ATTEMPT, verdict.severity,
                    "ContentValidator", "Content rejected", std::move(metadata));
    } else if (verdict.modified()) {
        log_.record(SecurityEventType::CONTENT_SANITIZED, verdict.severity,
                    "ContentValidator", "Content sanitized", std::move(metadata));
    } else {
        log_.record(SecurityEventType::CONTENT_ACCEPTED, Severity::NONE,
                    "ContentValidator", "Content accepted", std::move(metadata));
    }
}

} // namespace personaguard
