#pragma once

#include "auditor/rule_engine.hpp"
#include <string>
#include <vector>

namespace personaguard::rules {

/// Source kinds the code scanner reads
[[nodiscard]] const std::vector<std::string>& source_kinds();

/// Configuration kinds the configuration scanner reads
[[nodiscard]] const std::vector<std::string>& config_kinds();

/// OWASP Top 10: secrets, injection, XSS, TLS, weak hashing
[[nodiscard]] std::vector<SecurityRule> owasp_top10();

/// CWE Top 25 subset: 78, 79, 89, 22, 798, 327, 120
[[nodiscard]] std::vector<SecurityRule> cwe_top25();

/// Platform rules PG-SEC-001..006
[[nodiscard]] std::vector<SecurityRule> platform();

/// Every code rule set above
[[nodiscard]] std::vector<SecurityRule> code_rules();

/// Rules applied to configuration files (CFG-001..005)
[[nodiscard]] std::vector<SecurityRule> configuration();

/// "OWASP-Top-10", "CWE-Top-25", "Platform-Security"; empty for unknown
[[nodiscard]] std::vector<SecurityRule> rule_set(std::string_view name);

} // namespace personaguard::rules
