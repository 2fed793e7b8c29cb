// -----------------------------------------------------------------------------
// SPSC ring buffer with compile-time capacity
//
// Carries link events from the transport callback thread (producer) into the
// session's serialized context (consumer). Lock-free and allocation-free on
// the hot path; cacheline-separated head and tail indices.
//
// Notes:
//   - Capacity must be a power of two; one slot is kept free
//   - Single Producer, Single Consumer only
// -----------------------------------------------------------------------------
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <utility>


namespace meshlink::core::lockfree {

template <typename T, std::size_t Capacity>
class alignas(64) SpscRing {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");

public:
    SpscRing() noexcept = default;

    SpscRing(const SpscRing&) = delete;
    SpscRing& operator=(const SpscRing&) = delete;

    // Producer side
    [[nodiscard]] inline bool push(T&& item) noexcept {
        const std::size_t head = head_.index.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & MASK;
        if (next == tail_.index.load(std::memory_order_acquire)) {
            return false; // full
        }
        buffer_[head] = std::move(item);
        head_.index.store(next, std::memory_order_release);
        return true;
    }

    [[nodiscard]] inline bool push(const T& item) noexcept {
        T copy = item;
        return push(std::move(copy));
    }

    // Consumer side
    [[nodiscard]] inline bool pop(T& out) noexcept {
        const std::size_t tail = tail_.index.load(std::memory_order_relaxed);
        if (tail == head_.index.load(std::memory_order_acquire)) {
            return false; // empty
        }
        out = std::move(buffer_[tail]);
        buffer_[tail] = T{};
        tail_.index.store((tail + 1) & MASK, std::memory_order_release);
        return true;
    }

    [[nodiscard]] inline bool empty() const noexcept {
        return head_.index.load(std::memory_order_acquire) ==
               tail_.index.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline std::size_t size() const noexcept {
        const std::size_t head = head_.index.load(std::memory_order_acquire);
        const std::size_t tail = tail_.index.load(std::memory_order_acquire);
        return (head - tail) & MASK;
    }

    [[nodiscard]] static constexpr std::size_t capacity() noexcept {
        return Capacity - 1;
    }

private:
    static constexpr std::size_t MASK = Capacity - 1;

    struct alignas(64) Index {
        std::atomic<std::size_t> index{0};
    };

    Index head_;
    Index tail_;
    std::array<T, Capacity> buffer_{};
};

} // namespace meshlink::core::lockfree
