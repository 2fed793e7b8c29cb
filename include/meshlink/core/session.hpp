/*
===============================================================================
Mesh radio Session
===============================================================================

Reliable messaging over a single radio link.

Architecture:
  - timer::Scheduler          → deadline-ordered timers (one serialized context)
  - operation::Queue          → GATT primitives, one in flight, retry/timeout
  - link::Lifecycle           → connect, staged handshake, failure recovery
  - delivery::Queue           → packet ids, status tracking, acks, replay
  - notification::Dispatcher  → inbound frames routed by topic

The Session:
  - Owns every component via composition and wires them together
  - Routes control frames (queue status, routing, config complete) internally
  - Exposes payload topics to callers through on_notification()

Execution model:
  - All state changes happen inside poll(), connect(), disconnect(),
    force_reconnect() and submit_packet(); none of them is thread-safe
  - Transport threads only push into the link's event ring
  - Callbacks run synchronously on the caller of those methods
===============================================================================
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

#include "meshlink/core/clock.hpp"
#include "meshlink/core/error.hpp"
#include "meshlink/core/telemetry.hpp"
#include "meshlink/core/types.hpp"
#include "meshlink/core/config/link.hpp"
#include "meshlink/core/delivery/queue.hpp"
#include "meshlink/core/link/concepts.hpp"
#include "meshlink/core/link/lifecycle.hpp"
#include "meshlink/core/notification/dispatcher.hpp"
#include "meshlink/core/operation/queue.hpp"
#include "meshlink/core/policy/device_quirks.hpp"
#include "meshlink/core/policy/failure_codes.hpp"
#include "meshlink/core/preset/session_default.hpp"
#include "meshlink/core/protocol/frame.hpp"
#include "meshlink/core/telemetry/session.hpp"
#include "meshlink/core/timer/scheduler.hpp"
#include "meshlink/log/logger.hpp"


namespace meshlink::core {

template<
    link::TransportLinkConcept Link,
    protocol::FrameCodecConcept Codec,
    ClockConcept Clock = std::chrono::steady_clock,
    policy::SessionBundle Bundle = preset::SessionDefault
>
class Session {
    using OpQueue        = operation::Queue<Link, Clock, typename Bundle::operation>;
    using LifecycleT     = link::Lifecycle<Link, Codec, Clock, Bundle>;
    using DeliveryQueueT = delivery::Queue<Link, Codec, Clock, Bundle>;
    using DispatcherT    = notification::Dispatcher<protocol::Frame>;

public:
    using PayloadHandler = std::function<void(const protocol::Payload&)>;

    explicit Session(Link& link, Codec codec = Codec{},
                     policy::DeviceQuirkTable quirks = policy::DeviceQuirkTable::defaults(),
                     policy::FailureCodeTable failure_codes = policy::FailureCodeTable::defaults())
        : link_(link)
        , codec_(std::move(codec))
        , ops_(link_, scheduler_, telemetry_.operations)
        , lifecycle_(link_, ops_, scheduler_, codec_, telemetry_.lifecycle, std::move(quirks), std::move(failure_codes))
        , delivery_(ops_, scheduler_, codec_, telemetry_.delivery)
        , dispatcher_(telemetry_.dispatch)
    {
        ops_.set_escalation_handler([this](Error error) {
            lifecycle_.on_operation_escalated(error);
        });

        lifecycle_.set_listener(typename LifecycleT::Listener{
            [this]() { delivery_.on_link_ready(); },
            [this]() { delivery_.on_link_lost(); },
            [this](Error reason) { delivery_.flush(reason); },
            [this](const Bytes& frame) { handle_inbound_(frame); }
        });

        dispatcher_.add(protocol::topic::QUEUE_STATUS, [this](const protocol::Frame& frame) {
            delivery_.on_queue_status(std::get<protocol::QueueStatus>(frame.body));
        });
        dispatcher_.add(protocol::topic::ROUTING, [this](const protocol::Frame& frame) {
            delivery_.on_routing(std::get<protocol::Routing>(frame.body));
        });
        dispatcher_.add(protocol::topic::CONFIG_COMPLETE, [this](const protocol::Frame& frame) {
            lifecycle_.on_config_complete(std::get<protocol::ConfigComplete>(frame.body).nonce);
        });
    }

    ~Session() {
        lifecycle_.disconnect();
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -------------------------------------------------------------------------
    // Connection
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error connect(const link::Target& target) {
        return lifecycle_.connect(target);
    }

    inline void disconnect() {
        lifecycle_.disconnect();
    }

    [[nodiscard]]
    inline Error force_reconnect() {
        return lifecycle_.force_reconnect();
    }

    [[nodiscard]]
    inline const link::ConnectionState& connection_state() const noexcept {
        return lifecycle_.state();
    }

    // Observer is called on every change of the public connection state
    inline std::size_t subscribe_state(typename LifecycleT::StateObserver observer) {
        return lifecycle_.subscribe(std::move(observer));
    }

    inline bool unsubscribe_state(std::size_t id) {
        return lifecycle_.unsubscribe(id);
    }

    // -------------------------------------------------------------------------
    // Messaging
    // -------------------------------------------------------------------------

    // Returns the packet id, or INVALID_PACKET_ID if the payload is too large.
    // Packets submitted before the link is ready are sent once it is.
    inline PacketId submit_packet(Bytes payload, std::uint64_t correlation_id, bool track_for_ack,
                                  delivery::DeliveryCallback on_result = {},
                                  NodeId destination = BROADCAST_NODE) {
        return delivery_.submit(
            delivery::Submission{std::move(payload), correlation_id, track_for_ack, destination},
            std::move(on_result));
    }

    // Register the handler for a payload topic. Reserved control topics are refused.
    [[nodiscard]]
    inline bool on_notification(Topic topic, PayloadHandler handler) {
        if (protocol::topic::is_reserved(topic)) {
            ML_WARN("[SESSION] Topic " << topic << " is reserved");
            return false;
        }
        dispatcher_.add(topic, [handler = std::move(handler)](const protocol::Frame& frame) {
            handler(std::get<protocol::Payload>(frame.body));
        });
        return true;
    }

    inline bool remove_notification(Topic topic) {
        if (protocol::topic::is_reserved(topic)) {
            return false;
        }
        return dispatcher_.remove(topic);
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------

    // Processes pending link events, then expired timers. Returns the amount of work done.
    inline std::size_t poll() {
        std::size_t work = 0;
        link::Event ev;
        while (work < config::link::MAX_EVENTS_PER_POLL && link_.poll_event(ev)) {
            lifecycle_.on_link_event(ev);
            ++work;
        }
        work += scheduler_.poll();
        return work;
    }

    [[nodiscard]]
    inline bool poll_signal(link::Signal& out) noexcept {
        return lifecycle_.poll_signal(out);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] inline const LifecycleT& lifecycle() const noexcept { return lifecycle_; }
    [[nodiscard]] inline const DeliveryQueueT& delivery() const noexcept { return delivery_; }
    [[nodiscard]] inline const OpQueue& operations() const noexcept { return ops_; }
    [[nodiscard]] inline const DispatcherT& dispatcher() const noexcept { return dispatcher_; }
    [[nodiscard]] inline const timer::Scheduler<Clock>& scheduler() const noexcept { return scheduler_; }
    [[nodiscard]] inline const telemetry::Session& telemetry() const noexcept { return telemetry_; }

private:
    Link& link_;
    Codec codec_;
    timer::Scheduler<Clock> scheduler_;
    telemetry::Session telemetry_;
    OpQueue ops_;
    LifecycleT lifecycle_;
    DeliveryQueueT delivery_;
    DispatcherT dispatcher_;

private:
    void handle_inbound_(const Bytes& raw) {
        std::optional<protocol::Frame> frame = codec_.decode(raw);
        if (!frame) {
            ML_WARN("[SESSION] Dropping undecodable frame (" << raw.size() << " bytes)");
            ML_TL1(telemetry_.dispatch.undecodable_total.inc());
            return;
        }
        if (lifecycle_.stage() == link::Stage::HandshakeInProgress) {
            lifecycle_.note_handshake_frame();
        }
        dispatcher_.dispatch(*frame);
    }
};

} // namespace meshlink::core
