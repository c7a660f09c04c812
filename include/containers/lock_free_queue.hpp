#pragma once

#include "common/utils.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <type_traits>

namespace exchange {

/// Single-producer single-consumer ring buffer carrying log entries from the
/// matching thread to the logger's drain thread.
/// Capacity must be a power of 2; one slot is kept free to tell full from empty.
/// The producer publishes tail_ with release, the consumer publishes head_
/// with release; each side reads the other's index with acquire.
template<typename T, size_t Capacity>
class LockFreeRingBuffer {
    static_assert(is_power_of_two(Capacity), "Capacity must be a power of 2");
    static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");

public:
    LockFreeRingBuffer()
        : slots_(std::make_unique<T[]>(Capacity)) {}

    /// Producer side. Returns false (item dropped) when full.
    bool try_push(const T& item) noexcept {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t next = (tail + 1) & MASK;
        if (next == head_.load(std::memory_order_acquire)) {
            return false;
        }
        slots_[tail] = item;
        tail_.store(next, std::memory_order_release);
        return true;
    }

    /// Consumer side. Returns false and leaves `item` untouched when empty.
    bool try_pop(T& item) noexcept {
        const size_t head = head_.load(std::memory_order_relaxed);
        if (head == tail_.load(std::memory_order_acquire)) {
            return false;
        }
        item = slots_[head];
        head_.store((head + 1) & MASK, std::memory_order_release);
        return true;
    }

    /// Approximate while both sides are active.
    size_t size() const noexcept {
        return (tail_.load(std::memory_order_acquire) - head_.load(std::memory_order_acquire)) & MASK;
    }

    bool empty() const noexcept { return size() == 0; }

    static constexpr size_t capacity() noexcept { return Capacity - 1; }

private:
    static constexpr size_t MASK = Capacity - 1;

    // Separate cache lines for head and tail to prevent false sharing
    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};

    std::unique_ptr<T[]> slots_;
};

} // namespace exchange
