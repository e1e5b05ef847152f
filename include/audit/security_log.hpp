#pragma once

#include "audit/event_persister.hpp"
#include "audit/security_event.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace personaguard {

/**
 * @brief Bounded, append-only security event log
 *
 * Fixed-capacity ring; when full the oldest event is evicted. Appends take
 * a short mutex and never touch I/O. Persistence, when configured, is
 * handed to an EventPersister and is best-effort.
 *
 * Constructed explicitly and passed by reference to every component that
 * records events, so tests get isolated instances.
 */
class SecurityLog {
public:
    struct Config {
        size_t capacity = 1000;
    };

    struct Stats {
        uint64_t total_appended = 0;
        uint64_t evicted = 0;
        uint64_t persist_dropped = 0;
        std::array<uint64_t, 5> by_severity{};   // Indexed by Severity
    };

    SecurityLog() : SecurityLog(Config{}) {}
    explicit SecurityLog(const Config& config, std::unique_ptr<EventPersister> persister = nullptr);
    ~SecurityLog();

    SecurityLog(const SecurityLog&) = delete;
    SecurityLog& operator=(const SecurityLog&) = delete;

    /// Fills id and timestamp when empty, scrubs details and metadata
    void append(SecurityEvent event);

    void record(SecurityEventType type, Severity severity, std::string source,
                std::string details, std::map<std::string, std::string> metadata = {});

    /// Up to n most recent events, oldest first
    [[nodiscard]] std::vector<SecurityEvent> recent_events(size_t n) const;

    [[nodiscard]] std::vector<SecurityEvent> events_by_severity(Severity level) const;

    [[nodiscard]] std::vector<SecurityEvent> events_by_type(SecurityEventType type) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] Stats stats() const;

    /// Drops buffered events (administrative/test hook)
    void clear();

    /// Waits for pending persistence, if any
    void flush();

private:
    template <typename Pred>
    std::vector<SecurityEvent> collect(Pred&& pred) const;

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<SecurityEvent> ring_;
    size_t head_ = 0;        // Index of the oldest event
    size_t count_ = 0;
    Stats stats_;

    std::unique_ptr<EventPersister> persister_;
};

} // namespace personaguard
