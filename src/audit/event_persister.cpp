#include "audit/event_persister.hpp"
#include "core/utils.hpp"

#include <format>
#include <vector>

namespace personaguard {

EventPersister::EventPersister(std::unique_ptr<IEventSink> sink,
                               size_t queue_capacity,
                               std::chrono::milliseconds flush_interval)
    : sink_(std::move(sink)),
      queue_(queue_capacity),
      flush_interval_(flush_interval) {
    running_.store(true, std::memory_order_release);
    writer_ = std::thread(&EventPersister::writer_loop, this);
}

EventPersister::~EventPersister() {
    shutdown();
}

void EventPersister::enqueue(SecurityEvent event) {
    if (!running_.load(std::memory_order_acquire)) return;
    if (queue_.try_push(std::move(event))) {
        enqueued_.fetch_add(1, std::memory_order_relaxed);
    }
}

void EventPersister::flush() {
    if (!running_.load(std::memory_order_acquire)) return;
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        flush_requested_.store(true, std::memory_order_release);
    }
    wake_cv_.notify_one();
    while (flush_requested_.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (!running_.load(std::memory_order_acquire)) break;
    }
}

void EventPersister::shutdown() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }
    wake_cv_.notify_one();
    if (writer_.joinable()) {
        writer_.join();
    }
}

EventPersister::Stats EventPersister::stats() const {
    return Stats{
        .enqueued = enqueued_.load(std::memory_order_relaxed),
        .written = written_.load(std::memory_order_relaxed),
        .dropped = queue_.dropped_count(),
        .sink_failures = sink_failures_.load(std::memory_order_relaxed)
    };
}

size_t EventPersister::drain_once() {
    std::vector<SecurityEvent> batch;
    batch.reserve(kMaxBatchSize);
    const size_t n = queue_.drain(batch, kMaxBatchSize);
    if (n == 0) return 0;

    std::string output;
    output.reserve(n * 256);
    for (const auto& event : batch) {
        output += to_json_line(event);
        output += '\n';
    }

    if (!sink_->write(output)) {
        sink_failures_.fetch_add(1, std::memory_order_relaxed);
    }
    written_.fetch_add(n, std::memory_order_relaxed);
    return n;
}

void EventPersister::writer_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, flush_interval_, [this] {
                return flush_requested_.load(std::memory_order_acquire)
                    || !running_.load(std::memory_order_acquire);
            });
        }

        while (drain_once() > 0) {}

        if (flush_requested_.load(std::memory_order_acquire)) {
            // Events enqueued before the request may have arrived after the drain above
            while (drain_once() > 0) {}
            sink_->flush();
            flush_requested_.store(false, std::memory_order_release);
        }

        if (!running_.load(std::memory_order_acquire)) {
            while (drain_once() > 0) {}
            sink_->shutdown();
            utils::log::debug(std::format("Security event persistence stopped ({})", sink_->name()));
            return;
        }
    }
}

} // namespace personaguard
