#include "audit/security_log.hpp"
#include "core/utils.hpp"
#include "security/secret_scrubber.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <utility>

namespace personaguard {

const char* security_event_type_to_string(SecurityEventType type) {
    switch (type) {
        case SecurityEventType::CONTENT_INJECTION_ATTEMPT: return "CONTENT_INJECTION_ATTEMPT";
        case SecurityEventType::CONTENT_SANITIZED:         return "CONTENT_SANITIZED";
        case SecurityEventType::CONTENT_ACCEPTED:          return "CONTENT_ACCEPTED";
        case SecurityEventType::UNICODE_ISSUE:             return "UNICODE_ISSUE";
        case SecurityEventType::YAML_REJECTED:             return "YAML_REJECTED";
        case SecurityEventType::PATH_VIOLATION:            return "PATH_VIOLATION";
        case SecurityEventType::COMMAND_REJECTED:          return "COMMAND_REJECTED";
        case SecurityEventType::RATE_LIMIT_EXCEEDED:       return "RATE_LIMIT_EXCEEDED";
        case SecurityEventType::TOKEN_VALIDATION_SUCCESS:  return "TOKEN_VALIDATION_SUCCESS";
        case SecurityEventType::TOKEN_VALIDATION_FAILURE:  return "TOKEN_VALIDATION_FAILURE";
        case SecurityEventType::SCOPE_INSUFFICIENT:        return "SCOPE_INSUFFICIENT";
        case SecurityEventType::INPUT_REJECTED:            return "INPUT_REJECTED";
        case SecurityEventType::AUDIT_FINDING:             return "AUDIT_FINDING";
    }
    return "UNKNOWN";
}

std::string to_json_line(const SecurityEvent& event) {
    nlohmann::json j = {
        {"id", event.id},
        {"type", security_event_type_to_string(event.type)},
        {"severity", severity_to_string(event.severity)},
        {"source", event.source},
        {"timestamp", utils::format_timestamp(event.timestamp)},
        {"details", event.details},
    };
    if (!event.metadata.empty()) {
        j["metadata"] = event.metadata;
    }
    // Replace invalid UTF-8 rather than throwing from the writer thread
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

SecurityLog::SecurityLog(const Config& config, std::unique_ptr<EventPersister> persister)
    : capacity_(std::max<size_t>(config.capacity, 1)),
      persister_(std::move(persister)) {
    ring_.resize(capacity_);
}

SecurityLog::~SecurityLog() {
    if (persister_) {
        persister_->shutdown();
    }
}

void SecurityLog::append(SecurityEvent event) {
    if (event.id.empty()) {
        event.id = utils::generate_uuid();
    }
    if (event.timestamp == std::chrono::system_clock::time_point{}) {
        event.timestamp = utils::now();
    }
    event.details = redact_secrets(event.details);
    for (auto& [key, value] : event.metadata) {
        value = redact_secrets(value);
    }

    if (persister_) {
        persister_->enqueue(event);
    }

    const auto severity_index = std::to_underlying(event.severity);

    std::lock_guard<std::mutex> lock(mutex_);
    const size_t slot = (head_ + count_) % capacity_;
    if (count_ == capacity_) {
        // Full: slot == head_, overwrite the oldest
        ring_[head_] = std::move(event);
        head_ = (head_ + 1) % capacity_;
        ++stats_.evicted;
    } else {
        ring_[slot] = std::move(event);
        ++count_;
    }
    ++stats_.total_appended;
    ++stats_.by_severity[severity_index];
}

void SecurityLog::record(SecurityEventType type, Severity severity, std::string source,
                         std::string details, std::map<std::string, std::string> metadata) {
    SecurityEvent event;
    event.type = type;
    event.severity = severity;
    event.source = std::move(source);
    event.details = std::move(details);
    event.metadata = std::move(metadata);
    append(std::move(event));
}

template <typename Pred>
std::vector<SecurityEvent> SecurityLog::collect(Pred&& pred) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SecurityEvent> out;
    for (size_t i = 0; i < count_; ++i) {
        const auto& event = ring_[(head_ + i) % capacity_];
        if (pred(event)) out.push_back(event);
    }
    return out;
}

std::vector<SecurityEvent> SecurityLog::recent_events(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t take = std::min(n, count_);
    std::vector<SecurityEvent> out;
    out.reserve(take);
    for (size_t i = count_ - take; i < count_; ++i) {
        out.push_back(ring_[(head_ + i) % capacity_]);
    }
    return out;
}

std::vector<SecurityEvent> SecurityLog::events_by_severity(Severity level) const {
    return collect([level](const SecurityEvent& e) { return e.severity == level; });
}

std::vector<SecurityEvent> SecurityLog::events_by_type(SecurityEventType type) const {
    return collect([type](const SecurityEvent& e) { return e.type == type; });
}

size_t SecurityLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

SecurityLog::Stats SecurityLog::stats() const {
    Stats copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = stats_;
    }
    if (persister_) {
        copy.persist_dropped = persister_->stats().dropped;
    }
    return copy;
}

void SecurityLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& event : ring_) {
        event = SecurityEvent{};
    }
    head_ = 0;
    count_ = 0;
}

void SecurityLog::flush() {
    if (persister_) {
        persister_->flush();
    }
}

} // namespace personaguard
