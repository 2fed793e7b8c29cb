#pragma once

#include <cstdint>
#include <string_view>


namespace meshlink::core::link {

// -----------------------------------------------------------------------------
// Lifecycle signals
// -----------------------------------------------------------------------------
//
// Edge-triggered, informational. Delivered through poll_signal() after the
// state change they describe has been applied.
//
enum class Signal : std::uint8_t {
    None = 0,
    LinkUp,             // physical link established; setup begins
    Ready,              // setup complete, packets flow
    LinkLost,           // left Ready because the link failed
    RetryImmediate,     // reconnect scheduled without delay
    RetryScheduled,     // reconnect scheduled after backoff
    AdapterRestart,     // local adapter restart requested
    Disconnected,       // closed by the caller
    Failed              // terminal failure, no further retries
};

[[nodiscard]]
inline constexpr std::string_view to_string(Signal s) noexcept {
    switch (s) {
    case Signal::None:           return "None";
    case Signal::LinkUp:         return "LinkUp";
    case Signal::Ready:          return "Ready";
    case Signal::LinkLost:       return "LinkLost";
    case Signal::RetryImmediate: return "RetryImmediate";
    case Signal::RetryScheduled: return "RetryScheduled";
    case Signal::AdapterRestart: return "AdapterRestart";
    case Signal::Disconnected:   return "Disconnected";
    case Signal::Failed:         return "Failed";
    default:                     return "Unknown";
    }
}

} // namespace meshlink::core::link
