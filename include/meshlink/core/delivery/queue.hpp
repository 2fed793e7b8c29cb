#pragma once

#include <algorithm>
#include <deque>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "meshlink/core/clock.hpp"
#include "meshlink/core/error.hpp"
#include "meshlink/core/telemetry.hpp"
#include "meshlink/core/delivery/message_status.hpp"
#include "meshlink/core/delivery/packet_id.hpp"
#include "meshlink/core/delivery/pending_packet.hpp"
#include "meshlink/core/link/concepts.hpp"
#include "meshlink/core/operation/queue.hpp"
#include "meshlink/core/policy/session_bundle.hpp"
#include "meshlink/core/protocol/frame.hpp"
#include "meshlink/core/telemetry/session.hpp"
#include "meshlink/core/timer/scheduler.hpp"
#include "meshlink/log/logger.hpp"


namespace meshlink::core::delivery {

/*
===============================================================================
 Packet Delivery Queue
===============================================================================

Owns every outbound mesh packet from submit() until a terminal status.

  - Ids come from PacketIdSequence, skipping ids still pending.
  - Packets are handed to the radio one at a time, in submission order, as a
    ReliableWrite on the operation queue. The slot is released by the write
    result, a QueueStatus report, or the queue timeout.
  - Tracked packets wait for a Routing acknowledgment under the ack timeout;
    an unacknowledged packet is re-submitted with the same id up to
    max_message_retries times, then Failed.
  - Untracked packets resolve once the radio accepts them.
  - Transmission only happens while the link is ready. On link loss, tracked
    packets are kept and replayed once, in submission order, when the link is
    ready again; untracked packets fail with LinkReset.

Status changes follow MessageStatus::can_transition(); anything else is
rejected and logged. Callbacks run after internal state is consistent.

===============================================================================
*/

template<link::TransportLinkConcept Link, protocol::FrameCodecConcept Codec,
         ClockConcept Clock, policy::SessionBundle Bundle>
class Queue {
    using Policy = typename Bundle::delivery;
    using OpQueue = operation::Queue<Link, Clock, typename Bundle::operation>;

public:
    Queue(OpQueue& ops, timer::Scheduler<Clock>& scheduler, Codec& codec, telemetry::Delivery& telemetry)
        : ops_(ops)
        , scheduler_(scheduler)
        , codec_(codec)
        , telemetry_(telemetry)
    {}

    ~Queue() {
        scheduler_.cancel(queue_timer_);
        for (auto& [id, p] : pending_) {
            scheduler_.cancel(p.ack_timer);
        }
    }

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    // Returns the assigned id, or INVALID_PACKET_ID if the payload is too large
    PacketId submit(Submission submission, DeliveryCallback on_result = {}) {
        if (submission.payload.size() > Policy::max_packet_size) {
            ML_WARN("[DELIVERY] Rejecting packet of " << submission.payload.size()
                    << " bytes (max " << Policy::max_packet_size << ")");
            ML_TL1(telemetry_.rejected_oversize_total.inc());
            if (on_result) {
                on_result(DeliveryResult{INVALID_PACKET_ID, submission.correlation_id,
                                         MessageStatus::Failed, Error::PacketTooLarge});
            }
            return INVALID_PACKET_ID;
        }

        const PacketId id = ids_.next_unused([this](PacketId candidate) {
            return pending_.find(candidate) != pending_.end();
        });

        PendingPacket p;
        p.id = id;
        p.correlation_id = submission.correlation_id;
        p.destination = submission.destination;
        p.payload = std::move(submission.payload);
        p.tracked = submission.track_for_ack;
        p.sequence = next_sequence_++;
        p.created_at = Clock::now();
        p.queued = true;
        p.on_result = std::move(on_result);
        pending_.emplace(id, std::move(p));
        transmit_queue_.push_back(id);

        ML_TL1(telemetry_.submitted_total.inc());
        ML_DEBUG("[DELIVERY] Queued packet " << id << (submission.track_for_ack ? " (tracked)" : "")
                 << (ready_ ? "" : " while link not ready"));

        pump_();
        flush_outbox_();
        return id;
    }

    // Link reached Ready: replay kept packets, then resume transmission
    void on_link_ready() {
        ready_ = true;

        std::vector<const PendingPacket*> ordered;
        ordered.reserve(pending_.size());
        for (const auto& [id, p] : pending_) {
            ordered.push_back(&p);
        }
        std::sort(ordered.begin(), ordered.end(), [](const PendingPacket* a, const PendingPacket* b) {
            return a->sequence < b->sequence;
        });

        transmit_queue_.clear();
        std::size_t replayed = 0;
        for (const PendingPacket* p : ordered) {
            if (p->transmitted) {
                ++replayed;
            }
            transmit_queue_.push_back(p->id);
        }
        for (auto& [id, p] : pending_) {
            p.queued = true;
        }
        if (replayed > 0) {
            ML_INFO("[DELIVERY] Replaying " << replayed << " tracked packets");
            ML_TL1(telemetry_.replayed_total.inc(replayed));
        }

        pump_();
        flush_outbox_();
    }

    // Link left Ready: untracked packets fail, tracked packets wait for replay
    void on_link_lost() {
        ready_ = false;
        release_slot_();
        transmit_queue_.clear();

        for (auto it = pending_.begin(); it != pending_.end();) {
            PendingPacket& p = it->second;
            scheduler_.cancel(p.ack_timer);
            p.ack_timer = timer::INVALID_TIMER_ID;
            p.queued = false;
            if (p.tracked) {
                ++it;
                continue;
            }
            fail_(p, Error::LinkReset);
            it = pending_.erase(it);
        }
        flush_outbox_();
    }

    // Fail every pending packet (session closed or gave up)
    void flush(Error reason) {
        ready_ = false;
        release_slot_();
        transmit_queue_.clear();

        if (!pending_.empty()) {
            ML_INFO("[DELIVERY] Flushing " << pending_.size() << " pending packets (" << to_string(reason) << ")");
        }
        for (auto& [id, p] : pending_) {
            scheduler_.cancel(p.ack_timer);
            fail_(p, reason);
        }
        pending_.clear();
        flush_outbox_();
    }

    void on_queue_status(const protocol::QueueStatus& status) {
        if (status.result == 0 && status.free == 0) {
            ML_WARN("[DELIVERY] Radio transmit queue is full");
            return;
        }
        if (status.packet_id == INVALID_PACKET_ID) {
            return;
        }
        auto it = pending_.find(status.packet_id);
        if (it == pending_.end()) {
            ML_TRACE("[DELIVERY] Queue status for unknown packet " << status.packet_id);
            return;
        }
        PendingPacket& p = it->second;
        const PacketId id = p.id;

        if (status.result == 0) {
            if (p.status == MessageStatus::Sending) {
                (void)advance_(p, MessageStatus::Sent, Error::None);
            }
            if (in_flight_id_ == id) {
                release_slot_();
            }
            if (!p.tracked) {
                pending_.erase(it);
            }
        }
        else {
            ML_WARN("[DELIVERY] Radio rejected packet " << id << " (result=" << status.result << ")");
            scheduler_.cancel(p.ack_timer);
            const MessageStatus target = (p.status == MessageStatus::Sending) ? MessageStatus::Failed
                                                                               : MessageStatus::Error;
            (void)advance_(p, target, Error::MessageDeliveryFailed);
            ML_TL1(telemetry_.failed_total.inc());
            if (in_flight_id_ == id) {
                release_slot_();
            }
            pending_.erase(it);
        }
        pump_();
        flush_outbox_();
    }

    void on_routing(const protocol::Routing& routing) {
        auto it = pending_.find(routing.request_id);
        if (it == pending_.end()) {
            ML_TRACE("[DELIVERY] Routing report for unknown packet " << routing.request_id);
            return;
        }
        PendingPacket& p = it->second;
        const PacketId id = p.id;

        MessageStatus target = MessageStatus::Error;
        if (routing.error_reason == 0) {
            target = (routing.from == p.destination) ? MessageStatus::Received : MessageStatus::Delivered;
        }

        // The ack proves the radio accepted the packet
        if (p.status == MessageStatus::Sending) {
            (void)advance_(p, MessageStatus::Sent, Error::None);
        }
        if (!advance_(p, target, target == MessageStatus::Error ? Error::MessageDeliveryFailed : Error::None)) {
            flush_outbox_();
            return;
        }
        if (target == MessageStatus::Error) {
            ML_WARN("[DELIVERY] Packet " << id << " routing error " << routing.error_reason);
            ML_TL1(telemetry_.failed_total.inc());
        }
        else {
            ML_TL1(telemetry_.acknowledged_total.inc());
        }
        scheduler_.cancel(p.ack_timer);
        if (in_flight_id_ == id) {
            release_slot_();
        }
        pending_.erase(it);
        pump_();
        flush_outbox_();
    }

    // Accessors
    [[nodiscard]] bool ready() const noexcept { return ready_; }
    [[nodiscard]] std::size_t pending_count() const noexcept { return pending_.size(); }
    [[nodiscard]] std::size_t queued_count() const noexcept { return transmit_queue_.size(); }
    [[nodiscard]] PacketId in_flight() const noexcept { return in_flight_id_; }

    [[nodiscard]]
    const PendingPacket* find(PacketId id) const noexcept {
        auto it = pending_.find(id);
        return (it == pending_.end()) ? nullptr : &it->second;
    }

    [[nodiscard]]
    std::optional<MessageStatus> status_of(PacketId id) const noexcept {
        const PendingPacket* p = find(id);
        if (p == nullptr) {
            return std::nullopt;
        }
        return p->status;
    }

private:
    OpQueue& ops_;
    timer::Scheduler<Clock>& scheduler_;
    Codec& codec_;
    telemetry::Delivery& telemetry_;

    PacketIdSequence ids_;
    std::uint64_t next_sequence_{0};
    std::unordered_map<PacketId, PendingPacket> pending_;
    std::deque<PacketId> transmit_queue_;
    PacketId in_flight_id_{INVALID_PACKET_ID};
    timer::TimerId queue_timer_{timer::INVALID_TIMER_ID};
    bool ready_{false};

    struct Notice {
        DeliveryCallback callback;
        DeliveryResult result;
    };
    std::vector<Notice> outbox_;

private:
    void pump_() {
        while (ready_ && in_flight_id_ == INVALID_PACKET_ID && !transmit_queue_.empty()) {
            const PacketId id = transmit_queue_.front();
            transmit_queue_.pop_front();
            auto it = pending_.find(id);
            if (it == pending_.end() || !it->second.queued) {
                continue;
            }
            transmit_(it->second);
        }
    }

    void transmit_(PendingPacket& p) {
        const PacketId id = p.id;
        p.queued = false;
        p.transmitted = true;
        in_flight_id_ = id;
        if (p.tracked) {
            arm_ack_timer_(p);
        }
        Bytes frame = codec_.encode_packet(id, p.destination, p.tracked, p.payload);
        queue_timer_ = scheduler_.schedule_after(Policy::queue_timeout, [this, id]() { on_queue_timeout_(id); });
        ML_TL1(telemetry_.transmitted_total.inc());
        ML_TRACE("[DELIVERY] Transmitting packet " << id << " (" << frame.size() << " bytes)");

        // The write may complete synchronously; `p` must not be used past this point
        ops_.enqueue(operation::ReliableWrite{
            link::Characteristic::ToRadio,
            std::move(frame),
            [this, id](const operation::Result& result) { on_write_result_(id, result); }
        });
    }

    void on_write_result_(PacketId id, const operation::Result& result) {
        if (in_flight_id_ == id) {
            release_slot_();
        }
        auto it = pending_.find(id);
        if (it != pending_.end()) {
            PendingPacket& p = it->second;
            if (result.ok()) {
                if (p.status == MessageStatus::Sending) {
                    (void)advance_(p, MessageStatus::Sent, Error::None);
                }
                if (!p.tracked) {
                    pending_.erase(it);
                }
            }
            else if (result.error == Error::LinkReset) {
                // Tracked packets are replayed once the link is ready again
                if (!p.tracked) {
                    fail_(p, Error::LinkReset);
                    pending_.erase(it);
                }
            }
            else {
                ML_WARN("[DELIVERY] Write of packet " << id << " failed: " << to_string(result.error));
                scheduler_.cancel(p.ack_timer);
                fail_(p, result.error);
                pending_.erase(it);
            }
        }
        pump_();
        flush_outbox_();
    }

    void on_queue_timeout_(PacketId id) {
        queue_timer_ = timer::INVALID_TIMER_ID;
        if (in_flight_id_ != id) {
            return;
        }
        in_flight_id_ = INVALID_PACKET_ID;
        ML_WARN("[DELIVERY] Radio did not accept packet " << id << " in time");

        auto it = pending_.find(id);
        if (it != pending_.end() && !it->second.tracked) {
            fail_(it->second, Error::OperationTimeout);
            pending_.erase(it);
        }
        pump_();
        flush_outbox_();
    }

    void arm_ack_timer_(PendingPacket& p) {
        scheduler_.cancel(p.ack_timer);
        const PacketId id = p.id;
        p.ack_timer = scheduler_.schedule_after(Policy::ack_timeout, [this, id]() { on_ack_timeout_(id); });
    }

    void on_ack_timeout_(PacketId id) {
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return;
        }
        PendingPacket& p = it->second;
        p.ack_timer = timer::INVALID_TIMER_ID;

        if (p.queued || in_flight_id_ == id) {
            ML_DEBUG("[DELIVERY] Packet " << id << " still queued, deferring retry");
            arm_ack_timer_(p);
            return;
        }
        if (p.retry_count < Policy::max_message_retries) {
            ++p.retry_count;
            ML_INFO("[DELIVERY] No ack for packet " << id << ", retrying (" << static_cast<int>(p.retry_count)
                    << "/" << static_cast<int>(Policy::max_message_retries) << ")");
            ML_TL1(telemetry_.retried_total.inc());
            p.queued = true;
            transmit_queue_.push_back(id);
            pump_();
        }
        else {
            ML_WARN("[DELIVERY] Packet " << id << " was never acknowledged");
            fail_(p, Error::MessageDeliveryFailed);
            pending_.erase(it);
        }
        flush_outbox_();
    }

    void release_slot_() noexcept {
        scheduler_.cancel(queue_timer_);
        queue_timer_ = timer::INVALID_TIMER_ID;
        in_flight_id_ = INVALID_PACKET_ID;
    }

    void fail_(PendingPacket& p, Error error) {
        if (advance_(p, MessageStatus::Failed, error)) {
            ML_TL1(telemetry_.failed_total.inc());
        }
    }

    [[nodiscard]]
    bool advance_(PendingPacket& p, MessageStatus to, Error error) {
        if (!can_transition(p.status, to)) {
            ML_WARN("[DELIVERY] Rejected status change " << to_string(p.status) << " -> " << to_string(to)
                    << " for packet " << p.id);
            ML_TL1(telemetry_.rejected_transitions_total.inc());
            return false;
        }
        ML_DEBUG("[DELIVERY] Packet " << p.id << ": " << to_string(p.status) << " -> " << to_string(to));
        p.status = to;
        if (p.on_result) {
            outbox_.push_back(Notice{p.on_result, DeliveryResult{p.id, p.correlation_id, to, error}});
        }
        return true;
    }

    void flush_outbox_() {
        if (outbox_.empty()) {
            return;
        }
        std::vector<Notice> notices = std::move(outbox_);
        outbox_.clear();
        for (auto& notice : notices) {
            notice.callback(notice.result);
        }
    }
};

} // namespace meshlink::core::delivery
