#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "meshlink/core/clock.hpp"
#include "meshlink/core/error.hpp"
#include "meshlink/core/telemetry.hpp"
#include "meshlink/core/config/link.hpp"
#include "meshlink/core/link/concepts.hpp"
#include "meshlink/core/link/endpoint.hpp"
#include "meshlink/core/link/event.hpp"
#include "meshlink/core/link/signal.hpp"
#include "meshlink/core/link/state.hpp"
#include "meshlink/core/lockfree/spsc_ring.hpp"
#include "meshlink/core/operation/queue.hpp"
#include "meshlink/core/policy/device_quirks.hpp"
#include "meshlink/core/policy/failure_codes.hpp"
#include "meshlink/core/policy/session_bundle.hpp"
#include "meshlink/core/protocol/frame.hpp"
#include "meshlink/core/telemetry/session.hpp"
#include "meshlink/core/timer/scheduler.hpp"
#include "meshlink/log/logger.hpp"


namespace meshlink::core::link {

/*
===============================================================================
 Connection Lifecycle
===============================================================================

Drives one radio link from connect() to Ready and keeps it there.

Setup stages (each gated on the previous one):

  [AwaitingAuthorization]      only for bonding devices not yet bonded
  Connecting                   link.connect(), wait for LinkUp
  LinkEstablished              optional service cache invalidation
  ParameterNegotiation         MTU request, retried once, never fatal
  ServiceResolution            ToRadio, FromRadio and FromNum must exist
  BacklogDrain                 read FromRadio until it returns empty
  HandshakeInProgress          send want-config(nonce), drain until the
                               matching ConfigComplete, then enable FromNum
                               notifications
  Ready

Failure handling (link loss, stage timeouts, failed or escalated operations):

  category -> recovery
    StaleCache            immediate reconnect, cache refreshed next link-up
    LostConnection        reconnect after reconnect policy backoff
    Unknown               same as LostConnection
    PersistentStackFault  adapter restart, then reconnect

Only one reconnect may be pending. Exceeding the reconnect budget, missing
characteristics and declined authorization end in Failed.

The public ConnectionState reads Connecting for every setup stage and while
waiting to reconnect; Connected only in Ready.

===============================================================================
*/

template<TransportLinkConcept Link, protocol::FrameCodecConcept Codec,
         ClockConcept Clock, policy::SessionBundle Bundle>
class Lifecycle {
    using OpQueue   = operation::Queue<Link, Clock, typename Bundle::operation>;
    using Reconnect = typename Bundle::reconnect;
    using Handshake = typename Bundle::handshake;

public:
    using StateObserver = std::function<void(const ConnectionState&)>;

    // Hooks invoked synchronously on stage edges, before signals are emitted
    struct Listener {
        std::function<void()> on_ready;                 // entered Ready
        std::function<void()> on_link_lost;             // left Ready
        std::function<void(Error)> on_closed;           // Disconnected or Failed
        std::function<void(const Bytes&)> on_inbound;   // frame read from FromRadio
    };

    Lifecycle(Link& link, OpQueue& ops, timer::Scheduler<Clock>& scheduler, Codec& codec,
              telemetry::Lifecycle& telemetry,
              policy::DeviceQuirkTable quirks = policy::DeviceQuirkTable::defaults(),
              policy::FailureCodeTable failure_codes = policy::FailureCodeTable::defaults())
        : link_(link)
        , ops_(ops)
        , scheduler_(scheduler)
        , codec_(codec)
        , telemetry_(telemetry)
        , quirks_(std::move(quirks))
        , failure_codes_(std::move(failure_codes))
    {}

    ~Lifecycle() {
        cancel_stage_timers_();
        scheduler_.cancel(reconnect_timer_);
    }

    Lifecycle(const Lifecycle&) = delete;
    Lifecycle& operator=(const Lifecycle&) = delete;

    void set_listener(Listener listener) {
        listener_ = std::move(listener);
    }

    // -------------------------------------------------------------------------
    // Commands
    // -------------------------------------------------------------------------

    [[nodiscard]]
    Error connect(const Target& target) {
        if (stage_ != Stage::Idle && stage_ != Stage::Disconnected && stage_ != Stage::Failed) {
            ML_WARN("[LINK] connect() ignored in stage " << to_string(stage_));
            return Error::InvalidState;
        }
        target_ = target;
        device_class_ = quirks_.classify(target_);
        reconnect_attempts_ = 0;
        refresh_cache_ = false;
        last_failure_ = policy::FailureCategory::None;
        last_error_ = Error::None;
        failure_reason_.clear();
        ML_INFO("[LINK] Connecting to '" << target_.name << "' [" << target_.address
                << "] (class " << device_class_.name << ")");
        begin_attempt_();
        return Error::None;
    }

    // Caller-initiated close. Idempotent.
    void disconnect() {
        if (stage_ == Stage::Idle || stage_ == Stage::Disconnected) {
            return;
        }
        ML_INFO("[LINK] Disconnect requested");
        teardown_();
        cancel_reconnect_();
        set_stage_(Stage::Disconnected);
        emit_(Signal::Disconnected);
        if (listener_.on_closed) {
            listener_.on_closed(Error::LinkReset);
        }
        publish_state_();
    }

    // Drop the current link (if any) and reconnect immediately with a fresh budget
    [[nodiscard]]
    Error force_reconnect() {
        if (target_.address.empty() && target_.name.empty()) {
            return Error::InvalidState;
        }
        ML_INFO("[LINK] Forced reconnect");
        teardown_();
        cancel_reconnect_();
        reconnect_attempts_ = 0;
        schedule_reconnect_(policy::Recovery::ImmediateReconnect);
        return Error::None;
    }

    // -------------------------------------------------------------------------
    // Inputs
    // -------------------------------------------------------------------------

    // Non-completion link events (completions go to the operation queue)
    void on_link_event(const Event& ev) {
        std::visit([this](const auto& e) { handle_(e); }, ev);
    }

    // Final failure of a queued operation
    void on_operation_escalated(Error error) {
        if (error == Error::LinkReset || error == Error::TransportUnavailable) {
            return;
        }
        if (!is_link_active(stage_)) {
            ML_DEBUG("[LINK] Escalation ignored in stage " << to_string(stage_));
            return;
        }
        ML_WARN("[LINK] Operation escalated (" << to_string(error) << "), restarting link");
        recover_(policy::FailureCategory::LostConnection);
    }

    void on_config_complete(std::uint32_t nonce) {
        if (stage_ != Stage::HandshakeInProgress) {
            ML_DEBUG("[LINK] Config complete outside handshake ignored");
            return;
        }
        if (nonce != config_nonce_) {
            ML_WARN("[LINK] Ignoring stale config complete (nonce " << nonce << ", expected " << config_nonce_ << ")");
            return;
        }
        if (config_complete_) {
            return;
        }
        config_complete_ = true;
        // The handshake timer stays armed until notifications are enabled
        ML_INFO("[LINK] Configuration received (" << handshake_frames_ << " frames), enabling notifications");
        const std::uint64_t epoch = epoch_;
        ops_.enqueue(operation::SetNotify{
            Characteristic::FromNum, true,
            [this, epoch](const operation::Result& r) { on_notify_enabled_(epoch, r); }
        });
    }

    // Counts frames received while the configuration download is in progress
    void note_handshake_frame() noexcept {
        ++handshake_frames_;
    }

    // -------------------------------------------------------------------------
    // Observation
    // -------------------------------------------------------------------------

    [[nodiscard]]
    bool poll_signal(Signal& out) noexcept {
        return signals_.pop(out);
    }

    std::size_t subscribe(StateObserver observer) {
        const std::size_t id = next_observer_id_++;
        observers_.emplace_back(id, std::move(observer));
        return id;
    }

    bool unsubscribe(std::size_t id) {
        auto it = std::find_if(observers_.begin(), observers_.end(),
                               [id](const auto& entry) { return entry.first == id; });
        if (it == observers_.end()) {
            return false;
        }
        observers_.erase(it);
        return true;
    }

    // Accessors
    [[nodiscard]] Stage stage() const noexcept { return stage_; }
    [[nodiscard]] const ConnectionState& state() const noexcept { return state_; }
    [[nodiscard]] bool is_ready() const noexcept { return stage_ == Stage::Ready; }
    [[nodiscard]] const Target& target() const noexcept { return target_; }
    [[nodiscard]] const policy::DeviceClass& device_class() const noexcept { return device_class_; }
    [[nodiscard]] std::uint32_t reconnect_attempts() const noexcept { return reconnect_attempts_; }
    [[nodiscard]] bool reconnect_pending() const noexcept { return reconnect_timer_ != timer::INVALID_TIMER_ID; }
    [[nodiscard]] std::uint32_t config_nonce() const noexcept { return config_nonce_; }
    [[nodiscard]] std::uint32_t handshake_frames() const noexcept { return handshake_frames_; }
    [[nodiscard]] std::uint16_t mtu() const noexcept { return mtu_; }
    [[nodiscard]] std::uint64_t epoch() const noexcept { return epoch_; }
    [[nodiscard]] policy::FailureCategory last_failure() const noexcept { return last_failure_; }
    [[nodiscard]] Error last_error() const noexcept { return last_error_; }
    [[nodiscard]] Stage failed_stage() const noexcept { return failed_stage_; }

private:
    Link& link_;
    OpQueue& ops_;
    timer::Scheduler<Clock>& scheduler_;
    Codec& codec_;
    telemetry::Lifecycle& telemetry_;

    policy::DeviceQuirkTable quirks_;
    policy::FailureCodeTable failure_codes_;

    Target target_{};
    policy::DeviceClass device_class_{};

    Stage stage_{Stage::Idle};
    ConnectionState state_{};

    // Incremented on every teardown; sinks of older epochs are ignored
    std::uint64_t epoch_{0};

    std::uint32_t reconnect_attempts_{0};
    timer::TimerId reconnect_timer_{timer::INVALID_TIMER_ID};
    timer::TimerId stage_timer_{timer::INVALID_TIMER_ID};
    timer::TimerId drain_timer_{timer::INVALID_TIMER_ID};

    bool link_open_{false};
    bool refresh_cache_{false};
    bool draining_{false};
    bool config_complete_{false};
    std::uint8_t negotiation_attempts_{0};
    std::uint16_t mtu_{0};
    std::uint32_t config_nonce_{0};
    std::uint32_t handshake_frames_{0};

    policy::FailureCategory last_failure_{policy::FailureCategory::None};
    Error last_error_{Error::None};
    Stage failed_stage_{Stage::Idle};
    std::string failure_reason_{};

    Listener listener_{};
    std::vector<std::pair<std::size_t, StateObserver>> observers_;
    std::size_t next_observer_id_{1};

    lockfree::SpscRing<Signal, config::link::SIGNAL_RING_CAPACITY> signals_;

private:
    // -------------------------------------------------------------------------
    // Event handlers
    // -------------------------------------------------------------------------

    void handle_(const std::monostate&) {}

    void handle_(const OpCompleted& ev) {
        ops_.on_completed(ev);
    }

    void handle_(const Authorization& ev) {
        if (stage_ != Stage::AwaitingAuthorization) {
            ML_DEBUG("[LINK] Unexpected authorization result ignored");
            return;
        }
        if (!ev.granted) {
            ML_ERROR("[LINK] Authorization declined by '" << target_.name << "'");
            fail_(Error::AuthorizationDeclined, Stage::AwaitingAuthorization, "auth declined");
            return;
        }
        ML_INFO("[LINK] Authorization granted");
        target_.bonded = true;
        start_connect_();
    }

    void handle_(const LinkUp&) {
        if (stage_ != Stage::Connecting) {
            ML_WARN("[LINK] LinkUp ignored in stage " << to_string(stage_));
            return;
        }
        cancel_stage_timers_();
        ML_TL1(telemetry_.link_up_total.inc());
        set_stage_(Stage::LinkEstablished);
        emit_(Signal::LinkUp);

        const bool invalidate = refresh_cache_ || device_class_.cache == policy::CachePolicy::Invalidate;
        refresh_cache_ = false;
        if (invalidate) {
            invalidate_cache_();
        }
        begin_negotiation_();
    }

    void handle_(const LinkDown& ev) {
        ML_TL1(telemetry_.link_down_total.inc());
        switch (stage_) {
        case Stage::Idle:
        case Stage::AwaitingAuthorization:
        case Stage::WaitingReconnect:
        case Stage::RestartingAdapter:
        case Stage::Disconnected:
        case Stage::Failed:
            ML_DEBUG("[LINK] LinkDown (code " << ev.reason_code << ") ignored in stage " << to_string(stage_));
            return;
        default:
            break;
        }
        const policy::FailureCategory category = failure_codes_.classify(ev.reason_code);
        ML_WARN("[LINK] Link down in stage " << to_string(stage_) << " (code " << ev.reason_code
                << ": " << to_string(category) << ")");
        recover_(category);
    }

    void handle_(const MtuNegotiated& ev) {
        if (stage_ != Stage::ParameterNegotiation) {
            return;
        }
        cancel_stage_timers_();
        on_mtu_result_(ev.success, ev.mtu);
    }

    void handle_(const ServicesDiscovered& ev) {
        if (stage_ != Stage::ServiceResolution) {
            return;
        }
        cancel_stage_timers_();
        if (!ev.success) {
            ML_WARN("[LINK] Service discovery failed");
            recover_(policy::FailureCategory::StaleCache);
            return;
        }
        for (Characteristic required : {Characteristic::ToRadio, Characteristic::FromRadio, Characteristic::FromNum}) {
            if (std::find(ev.characteristics.begin(), ev.characteristics.end(), required) == ev.characteristics.end()) {
                ML_ERROR("[LINK] Required characteristic " << to_string(required) << " not found");
                fail_(Error::HandshakeFailed, Stage::ServiceResolution,
                      "handshake failed: missing " + std::string{to_string(required)});
                return;
            }
        }
        begin_backlog_drain_();
    }

    void handle_(const Notification& ev) {
        if (ev.source == Characteristic::FromRadio) {
            deliver_inbound_(ev.data);
            return;
        }
        if (ev.source == Characteristic::FromNum && stage_ == Stage::Ready && !draining_) {
            ML_TRACE("[LINK] FromNum notification, draining");
            issue_drain_read_();
        }
    }

    void handle_(const AdapterRestarted& ev) {
        if (stage_ != Stage::RestartingAdapter) {
            return;
        }
        cancel_stage_timers_();
        on_adapter_restarted_(ev.success);
    }

    // -------------------------------------------------------------------------
    // Setup stages
    // -------------------------------------------------------------------------

    void begin_attempt_() {
        if (device_class_.requires_bonding && !target_.bonded) {
            set_stage_(Stage::AwaitingAuthorization);
            ML_INFO("[LINK] Requesting authorization from '" << target_.name << "'");
            const Error err = link_.request_authorization(target_);
            if (err != Error::None) {
                ML_ERROR("[LINK] Authorization request failed: " << to_string(err));
                fail_(Error::AuthorizationDeclined, Stage::AwaitingAuthorization, "auth unavailable");
            }
            return;
        }
        start_connect_();
    }

    void start_connect_() {
        set_stage_(Stage::Connecting);
        ML_TL1(telemetry_.connect_attempts_total.inc());
        arm_stage_timer_(Handshake::connect_timeout, Stage::Connecting);
        const Error err = link_.connect(target_);
        if (err != Error::None) {
            ML_WARN("[LINK] connect() rejected: " << to_string(err));
            recover_(policy::FailureCategory::LostConnection);
            return;
        }
        link_open_ = true;
    }

    void invalidate_cache_() {
        if constexpr (CacheInvalidationCapable<Link>) {
            const Error err = link_.invalidate_cache();
            if (err != Error::None) {
                ML_WARN("[LINK] Service cache invalidation failed: " << to_string(err));
                return;
            }
            ML_TL1(telemetry_.cache_invalidations_total.inc());
            ML_DEBUG("[LINK] Service cache invalidated");
        }
        else {
            ML_DEBUG("[LINK] Link cannot invalidate its service cache, skipping");
        }
    }

    void begin_negotiation_() {
        set_stage_(Stage::ParameterNegotiation);
        negotiation_attempts_ = 1;
        request_mtu_();
    }

    void request_mtu_() {
        const Error err = link_.request_mtu(Handshake::requested_mtu);
        if (err != Error::None) {
            on_mtu_result_(false, 0);
            return;
        }
        arm_stage_timer_(Handshake::negotiation_timeout, Stage::ParameterNegotiation);
    }

    void on_mtu_result_(bool success, std::uint16_t mtu) {
        if (success) {
            mtu_ = mtu;
            ML_DEBUG("[LINK] MTU negotiated: " << mtu);
            begin_discovery_();
            return;
        }
        if (negotiation_attempts_ < 2) {
            ++negotiation_attempts_;
            ML_WARN("[LINK] MTU negotiation failed, retrying");
            request_mtu_();
            return;
        }
        ML_WARN("[LINK] MTU negotiation failed, proceeding with default MTU");
        mtu_ = 0;
        begin_discovery_();
    }

    void begin_discovery_() {
        set_stage_(Stage::ServiceResolution);
        arm_stage_timer_(Handshake::discovery_timeout, Stage::ServiceResolution);
        const Error err = link_.discover_services();
        if (err != Error::None) {
            ML_WARN("[LINK] Service discovery rejected: " << to_string(err));
            recover_(policy::FailureCategory::LostConnection);
        }
    }

    void begin_backlog_drain_() {
        set_stage_(Stage::BacklogDrain);
        arm_stage_timer_(Handshake::handshake_timeout, Stage::BacklogDrain);
        issue_drain_read_();
    }

    void issue_drain_read_() {
        draining_ = true;
        const std::uint64_t epoch = epoch_;
        ops_.enqueue(operation::Read{
            Characteristic::FromRadio,
            [this, epoch](const operation::Result& r) { on_drain_read_(epoch, r); }
        });
    }

    void schedule_drain_read_() {
        draining_ = true;
        drain_timer_ = scheduler_.schedule_after(Handshake::drain_interval, [this]() {
            drain_timer_ = timer::INVALID_TIMER_ID;
            issue_drain_read_();
        });
    }

    void on_drain_read_(std::uint64_t epoch, const operation::Result& r) {
        if (epoch != epoch_) {
            return;
        }
        if (!r.ok()) {
            draining_ = false;
            on_link_op_failed_("FromRadio read", r.error);
            return;
        }

        if (!r.data.empty()) {
            ML_TL1(telemetry_.drained_frames_total.inc());
            deliver_inbound_(r.data);
            if (epoch != epoch_) {
                return;
            }
            if (stage_ == Stage::Ready) {
                issue_drain_read_();
            }
            else if (stage_ == Stage::HandshakeInProgress && config_complete_) {
                draining_ = false;
            }
            else {
                schedule_drain_read_();
            }
            return;
        }

        switch (stage_) {
        case Stage::BacklogDrain:
            draining_ = false;
            begin_handshake_();
            break;
        case Stage::HandshakeInProgress:
            if (config_complete_) {
                draining_ = false;
            }
            else {
                schedule_drain_read_();
            }
            break;
        default:
            draining_ = false;
            break;
        }
    }

    void begin_handshake_() {
        set_stage_(Stage::HandshakeInProgress);
        config_complete_ = false;
        handshake_frames_ = 0;
        do {
            ++config_nonce_;
        } while (config_nonce_ == 0);
        arm_stage_timer_(Handshake::handshake_timeout, Stage::HandshakeInProgress);
        ML_DEBUG("[LINK] Requesting configuration (nonce " << config_nonce_ << ")");

        const std::uint64_t epoch = epoch_;
        ops_.enqueue(operation::ReliableWrite{
            Characteristic::ToRadio,
            codec_.encode_want_config(config_nonce_),
            [this, epoch](const operation::Result& r) { on_config_requested_(epoch, r); }
        });
    }

    void on_config_requested_(std::uint64_t epoch, const operation::Result& r) {
        if (epoch != epoch_) {
            return;
        }
        if (!r.ok()) {
            on_link_op_failed_("Configuration request", r.error);
            return;
        }
        if (!draining_) {
            issue_drain_read_();
        }
    }

    void on_notify_enabled_(std::uint64_t epoch, const operation::Result& r) {
        if (epoch != epoch_) {
            return;
        }
        if (!r.ok()) {
            on_link_op_failed_("Enabling FromNum notifications", r.error);
            return;
        }
        become_ready_();
    }

    void become_ready_() {
        scheduler_.cancel(stage_timer_);
        stage_timer_ = timer::INVALID_TIMER_ID;
        set_stage_(Stage::Ready);
        reconnect_attempts_ = 0;
        last_failure_ = policy::FailureCategory::None;
        ML_TL1(telemetry_.ready_total.inc());
        ML_INFO("[LINK] Link ready (mtu " << mtu_ << ")");
        if (listener_.on_ready) {
            listener_.on_ready();
        }
        emit_(Signal::Ready);
        publish_state_();
    }

    // -------------------------------------------------------------------------
    // Failure handling
    // -------------------------------------------------------------------------

    void recover_(policy::FailureCategory category) {
        last_failure_ = category;
        teardown_();
        const policy::Recovery recovery = policy::recovery_for(category);
        ML_DEBUG("[LINK] Recovery for '" << to_string(category) << "': " << to_string(recovery));
        switch (recovery) {
        case policy::Recovery::ImmediateReconnect:
            refresh_cache_ = true;
            schedule_reconnect_(recovery);
            break;
        case policy::Recovery::AdapterRestart:
            if (reconnect_attempts_ >= Reconnect::max_attempts) {
                // No reconnect would follow the restart
                schedule_reconnect_(policy::Recovery::BackoffReconnect);
                break;
            }
            restart_adapter_();
            break;
        default:
            schedule_reconnect_(policy::Recovery::BackoffReconnect);
            break;
        }
    }

    // A failed queued operation ends the attempt, whether or not the queue escalates it
    void on_link_op_failed_(const char* what, Error error) {
        ML_WARN("[LINK] " << what << " failed: " << to_string(error));
        if (error == Error::LinkReset || !is_link_active(stage_)) {
            return;
        }
        if (stage_ == Stage::BacklogDrain || stage_ == Stage::HandshakeInProgress) {
            last_error_ = Error::HandshakeFailed;
            failed_stage_ = stage_;
        }
        recover_(policy::FailureCategory::LostConnection);
    }

    void schedule_reconnect_(policy::Recovery recovery) {
        if (reconnect_timer_ != timer::INVALID_TIMER_ID) {
            ML_DEBUG("[LINK] Reconnect already pending");
            return;
        }
        if (reconnect_attempts_ >= Reconnect::max_attempts) {
            ML_ERROR("[LINK] Giving up after " << reconnect_attempts_ << " reconnect attempts");
            fail_(Error::ReconnectExhausted, stage_, std::string{to_string(last_failure_)});
            return;
        }
        ++reconnect_attempts_;
        ML_TL1(telemetry_.reconnects_scheduled_total.inc());

        std::chrono::milliseconds delay{0};
        if (recovery == policy::Recovery::ImmediateReconnect) {
            emit_(Signal::RetryImmediate);
        }
        else {
            delay = Reconnect::delay(reconnect_attempts_);
            emit_(Signal::RetryScheduled);
        }
        ML_INFO("[LINK] Reconnect attempt " << reconnect_attempts_ << "/" << Reconnect::max_attempts
                << " in " << delay.count() << " ms");

        set_stage_(Stage::WaitingReconnect);
        publish_state_();
        reconnect_timer_ = scheduler_.schedule_after(delay, [this]() {
            reconnect_timer_ = timer::INVALID_TIMER_ID;
            begin_attempt_();
        });
    }

    void restart_adapter_() {
        if constexpr (AdapterRestartCapable<Link>) {
            set_stage_(Stage::RestartingAdapter);
            publish_state_();
            emit_(Signal::AdapterRestart);
            ML_TL1(telemetry_.adapter_restarts_total.inc());
            ML_WARN("[LINK] Restarting local adapter");
            const Error err = link_.restart_adapter();
            if (err != Error::None) {
                ML_ERROR("[LINK] Adapter restart rejected: " << to_string(err));
                schedule_reconnect_(policy::Recovery::BackoffReconnect);
                return;
            }
            arm_stage_timer_(Handshake::adapter_restart_timeout, Stage::RestartingAdapter);
        }
        else {
            ML_WARN("[LINK] Link cannot restart its adapter, reconnecting with backoff");
            schedule_reconnect_(policy::Recovery::BackoffReconnect);
        }
    }

    void on_adapter_restarted_(bool success) {
        if (!success) {
            ML_ERROR("[LINK] Adapter restart did not complete");
        }
        schedule_reconnect_(policy::Recovery::ImmediateReconnect);
    }

    void on_stage_timeout_(Stage expected) {
        stage_timer_ = timer::INVALID_TIMER_ID;
        if (stage_ != expected) {
            return;
        }
        ML_WARN("[LINK] Stage " << to_string(expected) << " timed out");
        switch (expected) {
        case Stage::ParameterNegotiation:
            on_mtu_result_(false, 0);
            break;
        case Stage::RestartingAdapter:
            on_adapter_restarted_(false);
            break;
        case Stage::BacklogDrain:
        case Stage::HandshakeInProgress:
            last_error_ = Error::HandshakeFailed;
            failed_stage_ = expected;
            recover_(policy::FailureCategory::LostConnection);
            break;
        default:
            recover_(policy::FailureCategory::LostConnection);
            break;
        }
    }

    void fail_(Error error, Stage stage, std::string reason) {
        teardown_();
        cancel_reconnect_();
        last_error_ = error;
        failed_stage_ = stage;
        failure_reason_ = std::move(reason);
        ML_ERROR("[LINK] Connection failed: " << failure_reason_ << " (" << to_string(error)
                 << " in " << to_string(stage) << ")");
        set_stage_(Stage::Failed);
        emit_(Signal::Failed);
        if (listener_.on_closed) {
            listener_.on_closed(error);
        }
        publish_state_();
    }

    // Releases the link and flushes queued operations
    void teardown_() {
        cancel_stage_timers_();
        ++epoch_;
        draining_ = false;
        config_complete_ = false;
        if (stage_ == Stage::Ready) {
            if (listener_.on_link_lost) {
                listener_.on_link_lost();
            }
            emit_(Signal::LinkLost);
        }
        ops_.reset(Error::LinkReset);
        if (link_open_) {
            link_open_ = false;
            link_.disconnect();
        }
    }

    // -------------------------------------------------------------------------
    // Helpers
    // -------------------------------------------------------------------------

    void deliver_inbound_(const Bytes& frame) {
        if (listener_.on_inbound) {
            listener_.on_inbound(frame);
        }
    }

    void arm_stage_timer_(std::chrono::milliseconds timeout, Stage stage) {
        scheduler_.cancel(stage_timer_);
        stage_timer_ = scheduler_.schedule_after(timeout, [this, stage]() { on_stage_timeout_(stage); });
    }

    void cancel_stage_timers_() noexcept {
        scheduler_.cancel(stage_timer_);
        scheduler_.cancel(drain_timer_);
        stage_timer_ = timer::INVALID_TIMER_ID;
        drain_timer_ = timer::INVALID_TIMER_ID;
    }

    void cancel_reconnect_() noexcept {
        scheduler_.cancel(reconnect_timer_);
        reconnect_timer_ = timer::INVALID_TIMER_ID;
    }

    void set_stage_(Stage next) {
        if (next == stage_) {
            return;
        }
        ML_DEBUG("[FSM] " << to_string(stage_) << " -> " << to_string(next));
        stage_ = next;
        if (project(next) == ConnectionState::Kind::Connecting) {
            publish_state_();
        }
    }

    void publish_state_() {
        ConnectionState next;
        switch (project(stage_)) {
        case ConnectionState::Kind::Connected:
            next = ConnectionState::connected(target_);
            break;
        case ConnectionState::Kind::Failed:
            next = ConnectionState::failed(failure_reason_);
            break;
        case ConnectionState::Kind::Connecting:
            next = ConnectionState::connecting();
            break;
        default:
            next = ConnectionState::disconnected();
            break;
        }
        if (next == state_) {
            return;
        }
        ML_INFO("[LINK] Connection state: " << to_string(state_.kind) << " -> " << to_string(next.kind));
        state_ = std::move(next);

        // Observers may subscribe or unsubscribe while being notified
        auto observers = observers_;
        for (auto& [id, observer] : observers) {
            if (observer) {
                observer(state_);
            }
        }
    }

    void emit_(Signal signal) noexcept {
        ML_TRACE("[LINK] Emitting signal: " << to_string(signal));
        if (!signals_.push(signal)) {
            ML_WARN("[LINK] Signal '" << to_string(signal) << "' dropped (signals not drained)");
        }
    }
};

} // namespace meshlink::core::link
