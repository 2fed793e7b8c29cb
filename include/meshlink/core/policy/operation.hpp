#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>

namespace meshlink::core::policy {

/*
===============================================================================
 Operation Retry Policy
===============================================================================

Defines how the GATT operation queue bounds each operation.

- Every started operation gets a completion deadline (timeout).
- Read and ReliableWrite are retried up to max_attempts in total; a retry
  re-enters at the head of the queue.
- A failed ReliableWrite waits reliable_write_backoff before its retry and
  keeps the in-flight slot meanwhile.
- Write and SetNotify are never retried.

===============================================================================
*/

template<typename P>
concept OperationPolicy = requires {
    { P::max_attempts } -> std::convertible_to<std::uint8_t>;
    { P::timeout } -> std::convertible_to<std::chrono::milliseconds>;
    { P::reliable_write_backoff } -> std::convertible_to<std::chrono::milliseconds>;
};

namespace operation {

template<
    std::uint8_t MaxAttempts = 3,
    std::uint32_t TimeoutMs = 4000,
    std::uint32_t ReliableWriteBackoffMs = 200
>
requires (MaxAttempts >= 1) && (TimeoutMs > 0)
struct Retry {
    static constexpr std::uint8_t max_attempts = MaxAttempts;
    static constexpr std::chrono::milliseconds timeout{TimeoutMs};
    static constexpr std::chrono::milliseconds reliable_write_backoff{ReliableWriteBackoffMs};
};

} // namespace operation

static_assert(OperationPolicy<operation::Retry<>>);

} // namespace meshlink::core::policy
