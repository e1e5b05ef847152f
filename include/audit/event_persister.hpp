#pragma once

#include "audit/event_sink.hpp"
#include "audit/mpsc_queue.hpp"
#include "audit/security_event.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace personaguard {

/**
 * @brief Asynchronous, best-effort persistence for security events
 *
 * enqueue() never blocks: events go into a lock-free MPSC queue and a
 * single writer thread serializes batches to the sink. When the queue is
 * full the event is dropped and counted.
 */
class EventPersister {
public:
    struct Stats {
        uint64_t enqueued = 0;
        uint64_t written = 0;
        uint64_t dropped = 0;
        uint64_t sink_failures = 0;
    };

    EventPersister(std::unique_ptr<IEventSink> sink,
                   size_t queue_capacity = 4096,
                   std::chrono::milliseconds flush_interval = std::chrono::milliseconds(100));
    ~EventPersister();

    EventPersister(const EventPersister&) = delete;
    EventPersister& operator=(const EventPersister&) = delete;

    void enqueue(SecurityEvent event);

    /// Blocks until everything enqueued so far has reached the sink
    void flush();

    void shutdown();

    [[nodiscard]] Stats stats() const;

private:
    void writer_loop();
    size_t drain_once();

    static constexpr size_t kMaxBatchSize = 256;

    std::unique_ptr<IEventSink> sink_;
    MpscQueue<SecurityEvent> queue_;
    std::chrono::milliseconds flush_interval_;

    std::atomic<bool> running_{false};
    std::atomic<bool> flush_requested_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::thread writer_;

    std::atomic<uint64_t> enqueued_{0};
    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> sink_failures_{0};
};

} // namespace personaguard
