#pragma once

#include <optional>
#include <string>
#include <utility>

namespace personaguard {

/**
 * @brief Error categories shared by the validation layer and the auditor
 */
enum class ErrorCategory {
    NONE,
    VALIDATION_REJECTED,   // Content blocked (severity >= threshold)
    RATE_LIMITED,          // Retryable; caller should degrade
    PATH_VIOLATION,
    COMMAND_REJECTED,
    SCOPE_INSUFFICIENT,
    AUDIT_CRITICAL,
    PARSE_ERROR,
    CONFIG_ERROR,
    IO_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                return "NONE";
        case ErrorCategory::VALIDATION_REJECTED: return "VALIDATION_REJECTED";
        case ErrorCategory::RATE_LIMITED:        return "RATE_LIMITED";
        case ErrorCategory::PATH_VIOLATION:      return "PATH_VIOLATION";
        case ErrorCategory::COMMAND_REJECTED:    return "COMMAND_REJECTED";
        case ErrorCategory::SCOPE_INSUFFICIENT:  return "SCOPE_INSUFFICIENT";
        case ErrorCategory::AUDIT_CRITICAL:      return "AUDIT_CRITICAL";
        case ErrorCategory::PARSE_ERROR:         return "PARSE_ERROR";
        case ErrorCategory::CONFIG_ERROR:        return "CONFIG_ERROR";
        case ErrorCategory::IO_ERROR:            return "IO_ERROR";
        case ErrorCategory::INTERNAL_ERROR:      return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Result for operations that only succeed or fail
 */
template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace personaguard
