#pragma once

#include <cstdint>
#include <functional>

#include "meshlink/core/clock.hpp"
#include "meshlink/core/error.hpp"
#include "meshlink/core/types.hpp"
#include "meshlink/core/delivery/message_status.hpp"
#include "meshlink/core/timer/scheduler.hpp"


namespace meshlink::core::delivery {

// Status update reported to the submitter
struct DeliveryResult {
    PacketId packet_id{INVALID_PACKET_ID};
    std::uint64_t correlation_id{0};
    MessageStatus status{MessageStatus::Sending};
    Error error{Error::None};
};

using DeliveryCallback = std::function<void(const DeliveryResult&)>;

struct Submission {
    Bytes payload{};
    std::uint64_t correlation_id{0};
    bool track_for_ack{false};
    NodeId destination{BROADCAST_NODE};
};

// Bookkeeping for one packet between submission and resolution
struct PendingPacket {
    PacketId id{INVALID_PACKET_ID};
    std::uint64_t correlation_id{0};
    NodeId destination{BROADCAST_NODE};
    Bytes payload{};
    bool tracked{false};
    MessageStatus status{MessageStatus::Sending};
    std::uint8_t retry_count{0};
    std::uint64_t sequence{0};      // submission order
    TimePoint created_at{};
    timer::TimerId ack_timer{timer::INVALID_TIMER_ID};
    bool queued{false};             // waiting in the transmit queue
    bool transmitted{false};        // handed to the radio at least once
    DeliveryCallback on_result{};
};

} // namespace meshlink::core::delivery
