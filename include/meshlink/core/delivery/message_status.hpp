#pragma once

#include <cstdint>
#include <string_view>


namespace meshlink::core::delivery {

enum class MessageStatus : std::uint8_t {
    Sending,    // submitted, not yet accepted by the radio
    Sent,       // accepted by the radio
    Delivered,  // acknowledged by an intermediate node
    Received,   // acknowledged by the destination
    Failed,     // never left this device, or ran out of retries
    Error       // the mesh reported a routing error
};

[[nodiscard]]
inline constexpr std::string_view to_string(MessageStatus s) noexcept {
    switch (s) {
    case MessageStatus::Sending:   return "Sending";
    case MessageStatus::Sent:      return "Sent";
    case MessageStatus::Delivered: return "Delivered";
    case MessageStatus::Received:  return "Received";
    case MessageStatus::Failed:    return "Failed";
    case MessageStatus::Error:     return "Error";
    default:                       return "Unknown";
    }
}

[[nodiscard]]
inline constexpr bool is_terminal(MessageStatus s) noexcept {
    return s == MessageStatus::Delivered || s == MessageStatus::Received ||
           s == MessageStatus::Failed || s == MessageStatus::Error;
}

// Allowed edges:
//   Sending -> Sent | Failed
//   Sent    -> Delivered | Received | Failed | Error
[[nodiscard]]
inline constexpr bool can_transition(MessageStatus from, MessageStatus to) noexcept {
    switch (from) {
    case MessageStatus::Sending:
        return to == MessageStatus::Sent || to == MessageStatus::Failed;
    case MessageStatus::Sent:
        return to == MessageStatus::Delivered || to == MessageStatus::Received ||
               to == MessageStatus::Failed || to == MessageStatus::Error;
    default:
        return false;
    }
}

static_assert(can_transition(MessageStatus::Sending, MessageStatus::Sent));
static_assert(!can_transition(MessageStatus::Sending, MessageStatus::Delivered));
static_assert(!can_transition(MessageStatus::Delivered, MessageStatus::Failed));

} // namespace meshlink::core::delivery
