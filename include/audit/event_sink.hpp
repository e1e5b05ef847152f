#pragma once

#include <string>
#include <string_view>

namespace personaguard {

/**
 * @brief Destination for persisted security events
 *
 * Only called from the EventPersister writer thread, so implementations
 * need no internal locking.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    /// Write a batch of newline-terminated JSON lines. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view jsonl) = 0;

    virtual void flush() = 0;

    virtual void shutdown() = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace personaguard
