#pragma once

#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstdint>

namespace meshlink::core::policy {

/*
===============================================================================
 Reconnect Policy
===============================================================================

Backoff applied by the connection lifecycle between reconnect attempts.

  delay(n)     : wait before the n-th attempt (n >= 1), min(n * step, cap)
  max_attempts : attempts allowed before the lifecycle gives up (Failed)

Immediate reconnects (stale service cache, adapter restart) bypass delay()
but still count against max_attempts.

===============================================================================
*/

template<typename P>
concept ReconnectPolicy = requires(std::uint32_t attempt) {
    { P::delay(attempt) } -> std::same_as<std::chrono::milliseconds>;
    { P::max_attempts } -> std::convertible_to<std::uint32_t>;
};

namespace reconnect {

template<
    std::uint32_t StepMs = 1000,
    std::uint32_t CapMs = 10000,
    std::uint32_t MaxAttempts = 10
>
requires (StepMs > 0) && (CapMs >= StepMs) && (MaxAttempts >= 1)
struct Linear {
    static constexpr std::uint32_t max_attempts = MaxAttempts;

    [[nodiscard]]
    static constexpr std::chrono::milliseconds delay(std::uint32_t attempt) noexcept {
        const std::uint64_t raw = static_cast<std::uint64_t>(attempt) * StepMs;
        return std::chrono::milliseconds{std::min<std::uint64_t>(raw, CapMs)};
    }
};

} // namespace reconnect

static_assert(ReconnectPolicy<reconnect::Linear<>>);
static_assert(reconnect::Linear<>::delay(3) == std::chrono::milliseconds{3000});
static_assert(reconnect::Linear<>::delay(42) == std::chrono::milliseconds{10000});

} // namespace meshlink::core::policy
