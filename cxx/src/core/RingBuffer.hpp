/**
 * @file RingBuffer.hpp
 * @brief Lock-free single-producer single-consumer ring buffer.
 */

#ifndef KEYFALL_RING_BUFFER_HPP
#define KEYFALL_RING_BUFFER_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <optional>

namespace keyfall {

/**
 * @brief A lock-free, single-producer single-consumer RingBuffer.
 *
 * Storage is fixed at compile time so push() and pop() never allocate.
 * One slot is kept empty to tell "full" from "empty", so the usable
 * capacity is Size - 1.
 */
template<typename T, size_t Size>
class LockFreeRingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    bool push(const T& item) {
        size_t h = head_.load(std::memory_order_relaxed);
        size_t t = tail_.load(std::memory_order_acquire);

        if (((h + 1) & mask) == t) {
            return false; // Full
        }

        buffer_[h] = item;
        head_.store((h + 1) & mask, std::memory_order_release);
        return true;
    }

    std::optional<T> pop() {
        size_t t = tail_.load(std::memory_order_relaxed);
        size_t h = head_.load(std::memory_order_acquire);

        if (t == h) {
            return std::nullopt; // Empty
        }

        T item = buffer_[t];
        tail_.store((t + 1) & mask, std::memory_order_release);
        return item;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    static constexpr size_t capacity() { return Size - 1; }

private:
    static constexpr size_t mask = Size - 1;

    std::array<T, Size> buffer_{};
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
};

} // namespace keyfall

#endif // KEYFALL_RING_BUFFER_HPP
