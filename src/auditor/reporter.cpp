#include "auditor/reporter.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <map>
#include <set>

namespace personaguard {

namespace {

constexpr const char* kToolName = "persona-audit";
constexpr const char* kToolVersion = "1.0.0";
constexpr const char* kSarifSchema =
    "https://json.schemastore.org/sarif-2.1.0.json";

constexpr std::array<Severity, 4> kReportedSeverities = {
    Severity::CRITICAL, Severity::HIGH, Severity::MEDIUM, Severity::LOW,
};

std::string upper(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

nlohmann::json finding_to_json(const Finding& f) {
    return {
        {"rule_id", f.rule_id},
        {"rule_name", f.rule_name},
        {"severity", severity_to_string(f.severity)},
        {"category", f.category},
        {"reference", f.reference},
        {"file", f.file},
        {"line", f.line},
        {"column", f.column},
        {"snippet", f.snippet},
        {"message", f.message},
        {"remediation", f.remediation},
        {"confidence", confidence_to_string(f.confidence)},
    };
}

} // anonymous namespace

// ============================================================================
// Console
// ============================================================================

std::string ConsoleReporter::render(const AuditReport& report) const {
    std::string out;
    out += std::format("Security audit of {}\n", report.target);
    out += std::format("Project root: {}\n", report.project_root);
    out += std::format("Scanned {} files ({} skipped) in {} ms\n\n",
                       report.files_scanned, report.files_skipped, report.duration.count());

    if (report.findings.empty()) {
        out += "No unsuppressed findings.\n";
    }

    for (const auto severity : kReportedSeverities) {
        const auto count = report.summary.count(severity);
        if (count == 0) continue;

        out += std::format("== {} ({}) ==\n", upper(severity_to_string(severity)), count);
        for (const auto& f : report.findings) {
            if (f.severity != severity) continue;
            out += std::format("  [{}] {}:{}:{} {}\n", f.rule_id, f.file, f.line, f.column, f.rule_name);
            if (!f.message.empty()) out += std::format("      {}\n", f.message);
            if (!f.snippet.empty()) out += std::format("      > {}\n", f.snippet);
            if (!f.remediation.empty()) out += std::format("      fix: {}\n", f.remediation);
        }
        out += "\n";
    }

    if (show_suppressed_ && !report.suppressed.empty()) {
        out += std::format("== SUPPRESSED ({}) ==\n", report.suppressed.size());
        for (const auto& s : report.suppressed) {
            out += std::format("  [{}] {}:{} ({})\n", s.finding.rule_id, s.finding.file,
                               s.finding.line, s.suppression.reason);
        }
        out += "\n";
    }

    if (!report.errors.empty()) {
        out += std::format("== ERRORS ({}) ==\n", report.errors.size());
        for (const auto& e : report.errors) out += std::format("  {}\n", e);
        out += "\n";
    }

    out += std::format("Summary: {} critical, {} high, {} medium, {} low\n",
                       report.summary.count(Severity::CRITICAL),
                       report.summary.count(Severity::HIGH),
                       report.summary.count(Severity::MEDIUM),
                       report.summary.count(Severity::LOW));
    out += report.passed
        ? std::format("Result: PASSED (gate: {})\n", severity_to_string(report.fail_on))
        : std::format("Result: FAILED, {} finding(s) at or above {}\n",
                      report.failing_count(), severity_to_string(report.fail_on));
    return out;
}

// ============================================================================
// JSON
// ============================================================================

std::string JsonReporter::render(const AuditReport& report) const {
    nlohmann::json findings = nlohmann::json::array();
    for (const auto& f : report.findings) findings.push_back(finding_to_json(f));

    nlohmann::json suppressed = nlohmann::json::array();
    for (const auto& s : report.suppressed) {
        auto entry = finding_to_json(s.finding);
        entry["suppression"] = {
            {"rule", s.suppression.rule},
            {"file", s.suppression.file},
            {"reason", s.suppression.reason},
        };
        suppressed.push_back(std::move(entry));
    }

    nlohmann::json by_severity = nlohmann::json::object();
    for (const auto severity : kReportedSeverities) {
        by_severity[severity_to_string(severity)] = report.summary.count(severity);
    }

    nlohmann::json doc = {
        {"tool", kToolName},
        {"version", kToolVersion},
        {"timestamp", report.timestamp},
        {"duration_ms", report.duration.count()},
        {"target", report.target},
        {"project_root", report.project_root},
        {"files_scanned", report.files_scanned},
        {"files_skipped", report.files_skipped},
        {"fail_on", severity_to_string(report.fail_on)},
        {"passed", report.passed},
        {"summary", {
            {"total", report.summary.total},
            {"suppressed", report.suppressed.size()},
            {"by_severity", std::move(by_severity)},
            {"by_category", report.summary.by_category},
        }},
        {"findings", std::move(findings)},
        {"suppressed", std::move(suppressed)},
        {"errors", report.errors},
    };
    return doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ============================================================================
// SARIF
// ============================================================================

const char* SarifReporter::sarif_level(Severity severity) {
    switch (severity) {
        case Severity::CRITICAL:
        case Severity::HIGH:     return "error";
        case Severity::MEDIUM:   return "warning";
        case Severity::LOW:      return "note";
        case Severity::NONE:     return "none";
    }
    return "none";
}

const SecurityRule* SarifReporter::lookup(std::string_view rule_id) const {
    const auto it = std::ranges::find_if(catalog_, [&](const SecurityRule* r) {
        return r->id == rule_id;
    });
    return it == catalog_.end() ? nullptr : *it;
}

std::string SarifReporter::render(const AuditReport& report) const {
    // Rules in first-seen order; results reference them by index
    std::vector<const Finding*> exemplars;
    std::set<std::string> seen;
    const auto note_rule = [&](const Finding& f) {
        if (seen.insert(f.rule_id).second) exemplars.push_back(&f);
    };
    for (const auto& f : report.findings) note_rule(f);
    for (const auto& s : report.suppressed) note_rule(s.finding);

    nlohmann::json rules = nlohmann::json::array();
    std::map<std::string, size_t> rule_index;
    for (const auto* f : exemplars) {
        const auto* rule = lookup(f->rule_id);
        nlohmann::json entry = {
            {"id", f->rule_id},
            {"name", f->rule_name},
            {"shortDescription", {{"text", f->rule_name}}},
            {"fullDescription", {{"text", rule ? rule->description : f->message}}},
            {"help", {{"text", f->remediation}}},
            {"defaultConfiguration", {{"level", sarif_level(f->severity)}}},
            {"properties", {
                {"category", f->category},
                {"severity", severity_to_string(f->severity)},
                {"tags", nlohmann::json::array({"security", f->category})},
            }},
        };
        if (f->reference.starts_with("http")) entry["helpUri"] = f->reference;
        else if (!f->reference.empty()) entry["properties"]["reference"] = f->reference;

        rule_index[f->rule_id] = rules.size();
        rules.push_back(std::move(entry));
    }

    const auto make_result = [&](const Finding& f) {
        nlohmann::json region = {{"startLine", std::max<uint32_t>(f.line, 1)}};
        if (f.column > 0) region["startColumn"] = f.column;
        if (!f.snippet.empty()) region["snippet"] = {{"text", f.snippet}};

        return nlohmann::json{
            {"ruleId", f.rule_id},
            {"ruleIndex", rule_index.at(f.rule_id)},
            {"level", sarif_level(f.severity)},
            {"message", {{"text", f.message.empty() ? f.rule_name : f.message}}},
            {"locations", nlohmann::json::array({{
                {"physicalLocation", {
                    {"artifactLocation", {{"uri", f.file}, {"uriBaseId", "%SRCROOT%"}}},
                    {"region", std::move(region)},
                }},
            }})},
            {"properties", {{"confidence", confidence_to_string(f.confidence)}}},
        };
    };

    nlohmann::json results = nlohmann::json::array();
    for (const auto& f : report.findings) results.push_back(make_result(f));
    for (const auto& s : report.suppressed) {
        auto result = make_result(s.finding);
        result["suppressions"] = nlohmann::json::array({{
            {"kind", "external"},
            {"status", "accepted"},
            {"justification", s.suppression.reason},
        }});
        results.push_back(std::move(result));
    }

    nlohmann::json notifications = nlohmann::json::array();
    for (const auto& e : report.errors) {
        notifications.push_back({{"level", "warning"}, {"message", {{"text", e}}}});
    }

    nlohmann::json run = {
        {"tool", {{"driver", {
            {"name", kToolName},
            {"version", kToolVersion},
            {"informationUri", "https://sarifweb.azurewebsites.net/"},
            {"rules", std::move(rules)},
        }}}},
        {"originalUriBaseIds", {{"%SRCROOT%", {{"uri", "file://" + report.project_root + "/"}}}}},
        {"results", std::move(results)},
        {"invocations", nlohmann::json::array({{
            {"executionSuccessful", true},
            {"startTimeUtc", report.timestamp},
            {"toolExecutionNotifications", std::move(notifications)},
        }})},
    };

    nlohmann::json doc = {
        {"$schema", kSarifSchema},
        {"version", "2.1.0"},
        {"runs", nlohmann::json::array({std::move(run)})},
    };
    return doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::unique_ptr<IReporter> make_reporter(std::string_view format,
                                         std::vector<const SecurityRule*> catalog) {
    if (format == "console") return std::make_unique<ConsoleReporter>();
    if (format == "json") return std::make_unique<JsonReporter>();
    if (format == "sarif") return std::make_unique<SarifReporter>(std::move(catalog));
    return nullptr;
}

} // namespace personaguard
