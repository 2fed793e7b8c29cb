#pragma once

#include <cstdint>
#include <string_view>


namespace meshlink::core {

enum class Error : std::uint8_t {
    None = 0,
    TransportUnavailable,   // Link is not connected or the characteristic is unavailable
    OperationTimeout,       // Link did not complete the operation in time
    OperationFailed,        // Link completed the operation with a failure status
    HandshakeFailed,        // Setup stage could not complete (see Lifecycle::failed_stage())
    MessageDeliveryFailed,  // Mesh packet exhausted its retries without an acknowledgment
    LinkReset,              // Pending work flushed because the link went away
    InvalidState,           // Call not allowed in the current lifecycle stage
    PacketTooLarge,         // Payload exceeds the maximum mesh packet size
    AuthorizationDeclined,  // Out-of-band pairing/authorization refused
    ReconnectExhausted,     // Reconnect attempts exceeded the configured budget
    InvalidConfig           // Quirk or failure-code table could not be loaded
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error error) noexcept {
    switch (error) {
    case Error::None:                  return "None";
    case Error::TransportUnavailable:  return "TransportUnavailable";
    case Error::OperationTimeout:      return "OperationTimeout";
    case Error::OperationFailed:       return "OperationFailed";
    case Error::HandshakeFailed:       return "HandshakeFailed";
    case Error::MessageDeliveryFailed: return "MessageDeliveryFailed";
    case Error::LinkReset:             return "LinkReset";
    case Error::InvalidState:          return "InvalidState";
    case Error::PacketTooLarge:        return "PacketTooLarge";
    case Error::AuthorizationDeclined: return "AuthorizationDeclined";
    case Error::ReconnectExhausted:    return "ReconnectExhausted";
    case Error::InvalidConfig:         return "InvalidConfig";
    default:                           return "Unknown";
    }
}

} // namespace meshlink::core
