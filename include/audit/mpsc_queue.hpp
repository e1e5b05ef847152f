#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>
#include <vector>

namespace personaguard {

/**
 * @brief Bounded lock-free multi-producer single-consumer queue
 *
 * Capacity is rounded up to a power of two. Every slot carries a sequence
 * number: a producer may claim position pos only while its slot's
 * sequence equals pos, and claims it with a CAS on write_pos_, so a full
 * queue never hands out a position. Publishing stores pos + 1; the
 * consumer releases a slot by storing pos + capacity. A producer that
 * finds the queue full drops its item and bumps dropped_count(); it
 * never waits.
 */
template <typename T>
class MpscQueue {
    static_assert(std::is_move_constructible_v<T>, "T must be move-constructible");

public:
    explicit MpscQueue(size_t capacity)
        : capacity_(round_up_pow2(capacity)),
          mask_(capacity_ - 1),
          slots_(std::make_unique<Slot[]>(capacity_)) {
        for (size_t i = 0; i < capacity_; ++i) {
            slots_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    MpscQueue(const MpscQueue&) = delete;
    MpscQueue& operator=(const MpscQueue&) = delete;

    /// Producer side, safe from any thread
    [[nodiscard]] bool try_push(T item) {
        size_t pos = write_pos_.load(std::memory_order_relaxed);
        Slot* slot = nullptr;
        for (;;) {
            slot = &slots_[pos & mask_];
            const size_t seq = slot->sequence.load(std::memory_order_acquire);
            const auto diff = static_cast<std::ptrdiff_t>(seq) - static_cast<std::ptrdiff_t>(pos);
            if (diff == 0) {
                if (write_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) break;
            } else if (diff < 0) {
                // Slot still holds an item from the previous lap
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return false;
            } else {
                pos = write_pos_.load(std::memory_order_relaxed);
            }
        }

        slot->value.emplace(std::move(item));
        slot->sequence.store(pos + 1, std::memory_order_release);
        return true;
    }

    /// Consumer side only. Appends up to max_count items to out.
    size_t drain(std::vector<T>& out, size_t max_count) {
        size_t n = 0;
        while (n < max_count) {
            Slot& slot = slots_[read_pos_ & mask_];
            if (slot.sequence.load(std::memory_order_acquire) != read_pos_ + 1) break;

            out.push_back(std::move(*slot.value));
            slot.value.reset();
            slot.sequence.store(read_pos_ + capacity_, std::memory_order_release);
            ++read_pos_;
            ++n;
        }
        return n;
    }

    [[nodiscard]] uint64_t dropped_count() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    static size_t round_up_pow2(size_t n) {
        size_t p = 1;
        while (p < n) p <<= 1;
        return p;
    }

    struct alignas(64) Slot {
        std::atomic<size_t> sequence{0};
        std::optional<T> value;
    };

    const size_t capacity_;
    const size_t mask_;
    std::unique_ptr<Slot[]> slots_;

    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) size_t read_pos_{0};
    alignas(64) std::atomic<uint64_t> dropped_{0};
};

} // namespace personaguard
