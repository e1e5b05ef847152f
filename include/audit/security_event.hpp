#pragma once

#include "core/types.hpp"
#include <chrono>
#include <map>
#include <string>

namespace personaguard {

enum class SecurityEventType {
    CONTENT_INJECTION_ATTEMPT,
    CONTENT_SANITIZED,
    CONTENT_ACCEPTED,
    UNICODE_ISSUE,
    YAML_REJECTED,
    PATH_VIOLATION,
    COMMAND_REJECTED,
    RATE_LIMIT_EXCEEDED,
    TOKEN_VALIDATION_SUCCESS,
    TOKEN_VALIDATION_FAILURE,
    SCOPE_INSUFFICIENT,
    INPUT_REJECTED,
    AUDIT_FINDING
};

[[nodiscard]] const char* security_event_type_to_string(SecurityEventType type);

/**
 * @brief One audit-trail record
 *
 * details and metadata never contain raw credentials or the offending
 * payload; SecurityLog scrubs both on append.
 */
struct SecurityEvent {
    std::string id;
    SecurityEventType type = SecurityEventType::CONTENT_ACCEPTED;
    Severity severity = Severity::NONE;
    std::string source;                 // Component that raised the event
    std::chrono::system_clock::time_point timestamp;
    std::string details;
    std::map<std::string, std::string> metadata;
};

/// Single-line JSON form (JSONL persistence)
[[nodiscard]] std::string to_json_line(const SecurityEvent& event);

} // namespace personaguard
