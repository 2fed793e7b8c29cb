#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "meshlink/core/link/endpoint.hpp"


namespace meshlink::core::link {

// Internal lifecycle stage
enum class Stage : std::uint8_t {
    Idle,
    AwaitingAuthorization,
    Connecting,
    LinkEstablished,
    ParameterNegotiation,
    ServiceResolution,
    BacklogDrain,
    HandshakeInProgress,
    Ready,
    WaitingReconnect,
    RestartingAdapter,
    Disconnected,
    Failed
};

[[nodiscard]]
inline constexpr std::string_view to_string(Stage s) noexcept {
    switch (s) {
    case Stage::Idle:                  return "Idle";
    case Stage::AwaitingAuthorization: return "AwaitingAuthorization";
    case Stage::Connecting:            return "Connecting";
    case Stage::LinkEstablished:       return "LinkEstablished";
    case Stage::ParameterNegotiation:  return "ParameterNegotiation";
    case Stage::ServiceResolution:     return "ServiceResolution";
    case Stage::BacklogDrain:          return "BacklogDrain";
    case Stage::HandshakeInProgress:   return "HandshakeInProgress";
    case Stage::Ready:                 return "Ready";
    case Stage::WaitingReconnect:      return "WaitingReconnect";
    case Stage::RestartingAdapter:     return "RestartingAdapter";
    case Stage::Disconnected:          return "Disconnected";
    case Stage::Failed:                return "Failed";
    default:                           return "Unknown";
    }
}

// Stages during which a physical link is up
[[nodiscard]]
inline constexpr bool is_link_active(Stage s) noexcept {
    switch (s) {
    case Stage::LinkEstablished:
    case Stage::ParameterNegotiation:
    case Stage::ServiceResolution:
    case Stage::BacklogDrain:
    case Stage::HandshakeInProgress:
    case Stage::Ready:
        return true;
    default:
        return false;
    }
}

// -----------------------------------------------------------------------------
// ConnectionState (public view)
// -----------------------------------------------------------------------------
struct ConnectionState {
    enum class Kind : std::uint8_t {
        Disconnected,
        Connecting,
        Connected,
        Failed
    };

    Kind kind{Kind::Disconnected};
    Target endpoint{};    // meaningful when Connected
    std::string reason{}; // meaningful when Failed

    [[nodiscard]] static ConnectionState disconnected() { return {}; }
    [[nodiscard]] static ConnectionState connecting() { return {Kind::Connecting, {}, {}}; }
    [[nodiscard]] static ConnectionState connected(Target endpoint) { return {Kind::Connected, std::move(endpoint), {}}; }
    [[nodiscard]] static ConnectionState failed(std::string reason) { return {Kind::Failed, {}, std::move(reason)}; }

    bool operator==(const ConnectionState&) const = default;
};

[[nodiscard]]
inline constexpr std::string_view to_string(ConnectionState::Kind k) noexcept {
    switch (k) {
    case ConnectionState::Kind::Disconnected: return "Disconnected";
    case ConnectionState::Kind::Connecting:   return "Connecting";
    case ConnectionState::Kind::Connected:    return "Connected";
    case ConnectionState::Kind::Failed:       return "Failed";
    default:                                  return "Unknown";
    }
}

// Public projection of an internal stage. Every setup stage reads as Connecting.
[[nodiscard]]
inline constexpr ConnectionState::Kind project(Stage s) noexcept {
    switch (s) {
    case Stage::Idle:
    case Stage::Disconnected:
        return ConnectionState::Kind::Disconnected;
    case Stage::Ready:
        return ConnectionState::Kind::Connected;
    case Stage::Failed:
        return ConnectionState::Kind::Failed;
    default:
        return ConnectionState::Kind::Connecting;
    }
}

} // namespace meshlink::core::link
