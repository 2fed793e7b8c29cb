#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>

namespace meshlink::core::policy {

/*
===============================================================================
 Packet Delivery Policy
===============================================================================

Timing and sizing of mesh packet delivery.

  max_message_retries : re-submissions of a tracked packet after its ack timeout
  ack_timeout         : message-level deadline for a mesh acknowledgment
  queue_timeout       : deadline for the radio to accept one packet
  max_packet_size     : largest accepted payload, in bytes

===============================================================================
*/

template<typename P>
concept DeliveryPolicy = requires {
    { P::max_message_retries } -> std::convertible_to<std::uint8_t>;
    { P::ack_timeout } -> std::convertible_to<std::chrono::milliseconds>;
    { P::queue_timeout } -> std::convertible_to<std::chrono::milliseconds>;
    { P::max_packet_size } -> std::convertible_to<std::size_t>;
};

namespace delivery {

template<
    std::uint8_t MaxMessageRetries = 1,
    std::uint32_t AckTimeoutMs = 30000,
    std::uint32_t QueueTimeoutMs = 8000,
    std::size_t MaxPacketSize = 252
>
requires (AckTimeoutMs > 0) && (QueueTimeoutMs > 0) && (MaxPacketSize > 0)
struct Tracking {
    static constexpr std::uint8_t max_message_retries = MaxMessageRetries;
    static constexpr std::chrono::milliseconds ack_timeout{AckTimeoutMs};
    static constexpr std::chrono::milliseconds queue_timeout{QueueTimeoutMs};
    static constexpr std::size_t max_packet_size = MaxPacketSize;
};

} // namespace delivery

static_assert(DeliveryPolicy<delivery::Tracking<>>);

} // namespace meshlink::core::policy
