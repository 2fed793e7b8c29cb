#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>

namespace meshlink::core::policy {

/*
===============================================================================
 Handshake Policy
===============================================================================

Stage deadlines and pacing for link setup.

  drain_interval          : delay between consecutive backlog reads
  connect_timeout         : Connecting -> LinkUp
  negotiation_timeout     : one MTU request
  discovery_timeout       : service discovery
  handshake_timeout       : config request -> matching config-complete frame
  adapter_restart_timeout : adapter restart -> AdapterRestarted
  requested_mtu           : MTU requested during parameter negotiation

===============================================================================
*/

template<typename P>
concept HandshakePolicy = requires {
    { P::drain_interval } -> std::convertible_to<std::chrono::milliseconds>;
    { P::connect_timeout } -> std::convertible_to<std::chrono::milliseconds>;
    { P::negotiation_timeout } -> std::convertible_to<std::chrono::milliseconds>;
    { P::discovery_timeout } -> std::convertible_to<std::chrono::milliseconds>;
    { P::handshake_timeout } -> std::convertible_to<std::chrono::milliseconds>;
    { P::adapter_restart_timeout } -> std::convertible_to<std::chrono::milliseconds>;
    { P::requested_mtu } -> std::convertible_to<std::uint16_t>;
};

namespace handshake {

template<
    std::uint32_t DrainIntervalMs = 100,
    std::uint32_t ConnectTimeoutMs = 10000,
    std::uint32_t NegotiationTimeoutMs = 3000,
    std::uint32_t DiscoveryTimeoutMs = 10000,
    std::uint32_t HandshakeTimeoutMs = 30000,
    std::uint32_t AdapterRestartTimeoutMs = 5000,
    std::uint16_t RequestedMtu = 512
>
requires (ConnectTimeoutMs > 0) && (HandshakeTimeoutMs > DrainIntervalMs)
struct Staged {
    static constexpr std::chrono::milliseconds drain_interval{DrainIntervalMs};
    static constexpr std::chrono::milliseconds connect_timeout{ConnectTimeoutMs};
    static constexpr std::chrono::milliseconds negotiation_timeout{NegotiationTimeoutMs};
    static constexpr std::chrono::milliseconds discovery_timeout{DiscoveryTimeoutMs};
    static constexpr std::chrono::milliseconds handshake_timeout{HandshakeTimeoutMs};
    static constexpr std::chrono::milliseconds adapter_restart_timeout{AdapterRestartTimeoutMs};
    static constexpr std::uint16_t requested_mtu = RequestedMtu;
};

} // namespace handshake

static_assert(HandshakePolicy<handshake::Staged<>>);

} // namespace meshlink::core::policy
