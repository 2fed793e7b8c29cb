#pragma once

#include <algorithm>
#include <cstdint>
#include <deque>
#include <utility>

#include "meshlink/core/error.hpp"
#include "meshlink/core/types.hpp"
#include "meshlink/core/link/concepts.hpp"
#include "meshlink/core/link/endpoint.hpp"
#include "meshlink/core/link/event.hpp"
#include "meshlink/core/link/event_ring.hpp"
#include "meshlink/log/logger.hpp"
#include "common/demo_codec.hpp"


namespace meshlink::examples {

/*
===============================================================================
 SimulatedRadio
===============================================================================

In-process stand-in for a mesh radio reached over BLE. Every request
completes on the next Session::poll():

  - connect / authorization / MTU / discovery succeed
  - a configuration request is answered with one node-info payload and the
    matching config complete, read back from FromRadio
  - each outbound packet is accepted (queue status) and, when an ack was
    requested, acknowledged by the destination; FromNum announces the data

drop(code) reports a link loss with the given platform code.

===============================================================================
*/

class SimulatedRadio {
public:
    static constexpr core::Topic NODE_INFO_TOPIC = 4;

    explicit SimulatedRadio(core::NodeId self) noexcept
        : self_(self)
    {}

    core::Error connect(const core::link::Target& target) noexcept {
        ML_DEBUG("[RADIO] Connect to " << target.address);
        connected_ = true;
        push_(core::link::LinkUp{});
        return core::Error::None;
    }

    void disconnect() noexcept {
        connected_ = false;
        from_radio_.clear();
    }

    core::Error request_authorization(const core::link::Target&) noexcept {
        push_(core::link::Authorization{true});
        return core::Error::None;
    }

    core::Error request_mtu(std::uint16_t mtu) noexcept {
        push_(core::link::MtuNegotiated{true, std::min<std::uint16_t>(mtu, 247)});
        return core::Error::None;
    }

    core::Error discover_services() noexcept {
        push_(core::link::ServicesDiscovered{true, {
            core::link::Characteristic::ToRadio,
            core::link::Characteristic::FromRadio,
            core::link::Characteristic::FromNum
        }});
        return core::Error::None;
    }

    core::Error write(core::link::Characteristic, const Bytes&, core::OpToken token) noexcept {
        return complete_(token);
    }

    core::Error read(core::link::Characteristic, core::OpToken token) noexcept {
        if (!connected_) {
            return core::Error::TransportUnavailable;
        }
        Bytes frame;
        if (!from_radio_.empty()) {
            frame = std::move(from_radio_.front());
            from_radio_.pop_front();
        }
        push_(core::link::OpCompleted{token, core::Error::None, 0, std::move(frame)});
        return core::Error::None;
    }

    core::Error set_notify(core::link::Characteristic, bool, core::OpToken token) noexcept {
        return complete_(token);
    }

    core::Error reliable_write(core::link::Characteristic, const Bytes& bytes, core::OpToken token) noexcept {
        if (!connected_) {
            return core::Error::TransportUnavailable;
        }
        on_to_radio_(bytes);
        return complete_(token);
    }

    bool poll_event(core::link::Event& ev) noexcept {
        return ring_.pop(ev);
    }

    core::Error invalidate_cache() noexcept {
        ++cache_invalidations_;
        return core::Error::None;
    }

    core::Error restart_adapter() noexcept {
        ++adapter_restarts_;
        push_(core::link::AdapterRestarted{true});
        return core::Error::None;
    }

    // Simulated link loss
    void drop(int code) noexcept {
        ML_WARN("[RADIO] Dropping link (code " << code << ")");
        connected_ = false;
        from_radio_.clear();
        push_(core::link::LinkDown{code});
    }

    [[nodiscard]] std::uint32_t packets_received() const noexcept { return packets_; }
    [[nodiscard]] std::uint32_t cache_invalidations() const noexcept { return cache_invalidations_; }
    [[nodiscard]] std::uint32_t adapter_restarts() const noexcept { return adapter_restarts_; }

private:
    core::NodeId self_;
    core::link::EventRing ring_;
    std::deque<Bytes> from_radio_;
    bool connected_{false};
    std::uint32_t packets_{0};
    std::uint32_t cache_invalidations_{0};
    std::uint32_t adapter_restarts_{0};

    void push_(core::link::Event ev) noexcept {
        if (!ring_.push(std::move(ev))) {
            ML_ERROR("[RADIO] Event ring full, event lost");
        }
    }

    core::Error complete_(core::OpToken token) noexcept {
        push_(core::link::OpCompleted{token, core::Error::None, 0, {}});
        return core::Error::None;
    }

    void on_to_radio_(const Bytes& frame) {
        if (frame.empty()) {
            return;
        }
        if (frame[0] == 'W' && frame.size() == 5) {
            const std::uint32_t nonce = DemoCodec::get_(frame, 1);
            from_radio_.push_back(DemoCodec::payload(NODE_INFO_TOPIC, self_, Bytes{'n', 'o', 'd', 'e'}));
            from_radio_.push_back(DemoCodec::config_complete(nonce));
            return;
        }
        if (frame[0] == 'P' && frame.size() >= 10) {
            ++packets_;
            const core::PacketId id = DemoCodec::get_(frame, 1);
            const core::NodeId destination = DemoCodec::get_(frame, 5);
            const bool want_ack = frame[9] != 0;
            from_radio_.push_back(DemoCodec::queue_status(0, 8, id));
            if (want_ack) {
                from_radio_.push_back(DemoCodec::routing(id, destination));
            }
            push_(core::link::Notification{core::link::Characteristic::FromNum, {}});
        }
    }
};

static_assert(core::link::TransportLinkConcept<SimulatedRadio>);
static_assert(core::link::CacheInvalidationCapable<SimulatedRadio>);
static_assert(core::link::AdapterRestartCapable<SimulatedRadio>);

} // namespace meshlink::examples
