#pragma once

#include <concepts>
#include <cstdint>

#include "meshlink/core/types.hpp"
#include "meshlink/core/error.hpp"
#include "meshlink/core/link/endpoint.hpp"
#include "meshlink/core/link/event.hpp"


namespace meshlink::core::link {

// -----------------------------------------------------------------------------
// TransportLinkConcept
// -----------------------------------------------------------------------------
//
// Minimal contract of a BLE-style link. Every call only starts the action and
// returns a synchronous start error; outcomes arrive later as Events through
// poll_event():
//
//   connect                 -> LinkUp | LinkDown
//   request_authorization   -> Authorization
//   request_mtu             -> MtuNegotiated
//   discover_services       -> ServicesDiscovered
//   write / read /
//   set_notify /
//   reliable_write          -> OpCompleted{token}
//
// Error::TransportUnavailable from a primitive means the link cannot carry it.
//
template<class L>
concept TransportLinkConcept =
requires(L link, const Target& target, Characteristic c, const Bytes& bytes,
         OpToken token, bool enable, std::uint16_t mtu, Event& ev) {
    { link.connect(target) } noexcept -> std::same_as<Error>;
    { link.disconnect() } noexcept -> std::same_as<void>;
    { link.request_authorization(target) } noexcept -> std::same_as<Error>;
    { link.request_mtu(mtu) } noexcept -> std::same_as<Error>;
    { link.discover_services() } noexcept -> std::same_as<Error>;
    { link.write(c, bytes, token) } noexcept -> std::same_as<Error>;
    { link.read(c, token) } noexcept -> std::same_as<Error>;
    { link.set_notify(c, enable, token) } noexcept -> std::same_as<Error>;
    { link.reliable_write(c, bytes, token) } noexcept -> std::same_as<Error>;
    { link.poll_event(ev) } noexcept -> std::same_as<bool>;
};

// Optional: drop the platform's cached service table before discovery
template<class L>
concept CacheInvalidationCapable = requires(L link) {
    { link.invalidate_cache() } noexcept -> std::same_as<Error>;
};

// Optional: restart the local adapter; completes with AdapterRestarted
template<class L>
concept AdapterRestartCapable = requires(L link) {
    { link.restart_adapter() } noexcept -> std::same_as<Error>;
};

} // namespace meshlink::core::link
