#pragma once

#include "auditor/finding.hpp"
#include "auditor/rule_engine.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace personaguard {

/**
 * @brief Renders a finished AuditReport; never re-runs scans
 */
class IReporter {
public:
    virtual ~IReporter() = default;

    [[nodiscard]] virtual std::string render(const AuditReport& report) const = 0;

    [[nodiscard]] virtual const char* format_name() const = 0;
};

/// Human-readable text grouped by severity, highest first
class ConsoleReporter : public IReporter {
public:
    explicit ConsoleReporter(bool show_suppressed = true) : show_suppressed_(show_suppressed) {}

    [[nodiscard]] std::string render(const AuditReport& report) const override;
    [[nodiscard]] const char* format_name() const override { return "console"; }

private:
    bool show_suppressed_;
};

class JsonReporter : public IReporter {
public:
    [[nodiscard]] std::string render(const AuditReport& report) const override;
    [[nodiscard]] const char* format_name() const override { return "json"; }
};

/**
 * @brief SARIF 2.1.0 log with one run
 *
 * tool.driver.rules lists every rule that produced a finding, described
 * from the rule catalog when available. Suppressed findings are emitted
 * as results carrying an "external" suppression with the reason as
 * justification.
 */
class SarifReporter : public IReporter {
public:
    SarifReporter() = default;
    explicit SarifReporter(std::vector<const SecurityRule*> catalog) : catalog_(std::move(catalog)) {}

    [[nodiscard]] std::string render(const AuditReport& report) const override;
    [[nodiscard]] const char* format_name() const override { return "sarif"; }

    /// SARIF result level for a severity: error, warning, note or none
    [[nodiscard]] static const char* sarif_level(Severity severity);

private:
    [[nodiscard]] const SecurityRule* lookup(std::string_view rule_id) const;

    std::vector<const SecurityRule*> catalog_;
};

/// "console", "json" or "sarif"; nullptr for anything else
[[nodiscard]] std::unique_ptr<IReporter> make_reporter(std::string_view format,
                                                       std::vector<const SecurityRule*> catalog = {});

} // namespace personaguard
