#pragma once

#include "meshlink/core/policy/operation.hpp"
#include "meshlink/core/policy/delivery.hpp"
#include "meshlink/core/policy/reconnect.hpp"
#include "meshlink/core/policy/handshake.hpp"

namespace meshlink::core::policy {

// ============================================================================
// Session policy bundle
// ============================================================================
//
// Groups the compile-time policies a Session is parameterized on.
//
//   using FastRetry = policy::session_bundle<
//       operation::Retry<2, 1000>,
//       delivery::Tracking<>,
//       reconnect::Linear<250, 2000, 20>
//   >;
//
template<
    OperationPolicy OperationT = operation::Retry<>,
    DeliveryPolicy  DeliveryT  = delivery::Tracking<>,
    ReconnectPolicy ReconnectT = reconnect::Linear<>,
    HandshakePolicy HandshakeT = handshake::Staged<>
>
struct session_bundle {
    using operation = OperationT;
    using delivery  = DeliveryT;
    using reconnect = ReconnectT;
    using handshake = HandshakeT;
};

template<typename B>
concept SessionBundle =
    OperationPolicy<typename B::operation> &&
    DeliveryPolicy<typename B::delivery> &&
    ReconnectPolicy<typename B::reconnect> &&
    HandshakePolicy<typename B::handshake>;

} // namespace meshlink::core::policy
