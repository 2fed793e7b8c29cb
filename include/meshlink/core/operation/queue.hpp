#pragma once

#include <deque>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "meshlink/core/clock.hpp"
#include "meshlink/core/error.hpp"
#include "meshlink/core/telemetry.hpp"
#include "meshlink/core/link/concepts.hpp"
#include "meshlink/core/operation/operation.hpp"
#include "meshlink/core/policy/operation.hpp"
#include "meshlink/core/telemetry/session.hpp"
#include "meshlink/core/timer/scheduler.hpp"
#include "meshlink/log/logger.hpp"


namespace meshlink::core::operation {

/*
===============================================================================
 Operation Queue
===============================================================================

Serializes GATT primitives onto the link: at most one operation is in flight.

Lifecycle of one operation:

  enqueue() -> [pending FIFO] -> start (token, timeout armed)
            -> OpCompleted{token} | timeout
            -> success                 : sink(result)
            -> retryable failure       : re-enter at the head of the queue
                                         (ReliableWrite: after a backoff, the
                                          in-flight slot stays held)
            -> final failure           : sink(result), escalation handler
            -> TransportUnavailable    : sink(result), no retry, no escalation

Completion is idempotent: a completion whose token does not match the
in-flight operation (late, duplicate, or already timed out) is ignored.

reset() fails the in-flight and every pending operation with the given error
and leaves the queue idle. Sinks run after the queue state has been updated,
so a sink may enqueue() or reset() re-entrantly.

===============================================================================
*/

template<link::TransportLinkConcept Link, ClockConcept Clock, policy::OperationPolicy Policy>
class Queue {
public:
    using EscalationHandler = std::function<void(Error)>;

    Queue(Link& link, timer::Scheduler<Clock>& scheduler, telemetry::Operations& telemetry)
        : link_(link)
        , scheduler_(scheduler)
        , telemetry_(telemetry)
    {}

    ~Queue() {
        scheduler_.cancel(timeout_timer_);
        scheduler_.cancel(backoff_timer_);
    }

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    void set_escalation_handler(EscalationHandler handler) {
        escalation_handler_ = std::move(handler);
    }

    void enqueue(Operation op) {
        ML_TL1(telemetry_.enqueued_total.inc());
        ML_TRACE("[OPQ] Enqueue " << to_string(kind_of(op)) << " (depth=" << pending_.size() << ")");
        pending_.push_back(std::move(op));
        process_();
    }

    // Feed a link completion. Mismatched tokens are ignored.
    void on_completed(const link::OpCompleted& ev) {
        if (!current_ || ev.token == INVALID_OP_TOKEN || ev.token != current_token_) {
            ML_DEBUG("[OPQ] Ignoring stale completion (token=" << ev.token << ")");
            ML_TL1(telemetry_.stale_completions_total.inc());
            return;
        }
        complete_current_(Result{ev.error, ev.status, ev.data});
    }

    // Fail everything with `reason` and return to idle
    void reset(Error reason = Error::LinkReset) {
        scheduler_.cancel(timeout_timer_);
        scheduler_.cancel(backoff_timer_);
        timeout_timer_ = timer::INVALID_TIMER_ID;
        backoff_timer_ = timer::INVALID_TIMER_ID;

        std::optional<Operation> current = std::move(current_);
        current_.reset();
        std::deque<Operation> pending = std::move(pending_);
        pending_.clear();
        in_flight_ = false;
        current_token_ = INVALID_OP_TOKEN;

        const std::size_t flushed = pending.size() + (current ? 1 : 0);
        if (flushed > 0) {
            ML_DEBUG("[OPQ] Flushing " << flushed << " operations (" << to_string(reason) << ")");
        }
        ML_TL1(telemetry_.flushed_total.inc(flushed));

        const Result result{reason, 0, {}};
        if (current) {
            deliver_(*current, result);
        }
        for (auto& op : pending) {
            deliver_(op, result);
        }
    }

    // Accessors
    [[nodiscard]] bool busy() const noexcept { return in_flight_; }
    [[nodiscard]] std::size_t depth() const noexcept { return pending_.size(); }
    [[nodiscard]] bool idle() const noexcept { return !in_flight_ && pending_.empty(); }
    [[nodiscard]] OpToken current_token() const noexcept { return current_token_; }
    [[nodiscard]] bool backing_off() const noexcept { return backoff_timer_ != timer::INVALID_TIMER_ID; }

private:
    Link& link_;
    timer::Scheduler<Clock>& scheduler_;
    telemetry::Operations& telemetry_;

    std::deque<Operation> pending_;
    std::optional<Operation> current_;
    bool in_flight_{false};
    OpToken current_token_{INVALID_OP_TOKEN};
    OpToken next_token_{1};

    timer::TimerId timeout_timer_{timer::INVALID_TIMER_ID};
    timer::TimerId backoff_timer_{timer::INVALID_TIMER_ID};

    EscalationHandler escalation_handler_;

private:
    void process_() {
        while (!in_flight_ && !pending_.empty()) {
            current_ = std::move(pending_.front());
            pending_.pop_front();
            in_flight_ = true;
            start_current_();
        }
    }

    // Requires current_ set and in_flight_ held
    void start_current_() {
        current_token_ = next_token_++;
        ML_TL1(telemetry_.started_total.inc());
        ML_TRACE("[OPQ] Start " << to_string(kind_of(*current_)) << " (token=" << current_token_ << ")");

        const Error err = issue_(*current_, current_token_);
        if (err != Error::None) {
            ML_WARN("[OPQ] " << to_string(kind_of(*current_)) << " rejected by link: " << to_string(err));
            complete_current_(Result{err, 0, {}});
            return;
        }
        const OpToken token = current_token_;
        timeout_timer_ = scheduler_.schedule_after(Policy::timeout, [this, token]() { on_timeout_(token); });
    }

    [[nodiscard]]
    Error issue_(const Operation& op, OpToken token) noexcept {
        return std::visit([&](const auto& o) -> Error {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, Write>) {
                return link_.write(o.target, o.payload, token);
            }
            else if constexpr (std::is_same_v<T, Read>) {
                return link_.read(o.target, token);
            }
            else if constexpr (std::is_same_v<T, SetNotify>) {
                return link_.set_notify(o.target, o.enable, token);
            }
            else {
                return link_.reliable_write(o.target, o.payload, token);
            }
        }, op);
    }

    void on_timeout_(OpToken token) {
        timeout_timer_ = timer::INVALID_TIMER_ID;
        if (!current_ || token != current_token_) {
            return;
        }
        ML_WARN("[OPQ] " << to_string(kind_of(*current_)) << " timed out (token=" << token << ")");
        ML_TL1(telemetry_.timed_out_total.inc());
        complete_current_(Result{Error::OperationTimeout, 0, {}});
    }

    void complete_current_(Result result) {
        scheduler_.cancel(timeout_timer_);
        timeout_timer_ = timer::INVALID_TIMER_ID;
        Operation op = std::move(*current_);
        current_.reset();
        current_token_ = INVALID_OP_TOKEN;

        if (result.ok()) {
            ML_TL1(telemetry_.succeeded_total.inc());
            in_flight_ = false;
            deliver_(op, result);
            process_();
            return;
        }

        if (result.error == Error::TransportUnavailable) {
            ML_TL1(telemetry_.failed_total.inc());
            in_flight_ = false;
            deliver_(op, result);
            process_();
            return;
        }

        if (retry_(op, result)) {
            return;
        }

        ML_TL1(telemetry_.failed_total.inc());
        in_flight_ = false;
        deliver_(op, result);
        escalate_(result.error);
        process_();
    }

    // Returns true if `op` was scheduled for another attempt
    bool retry_(Operation& op, const Result& result) {
        std::uint8_t* attempt = attempt_of(op);
        if (attempt == nullptr) {
            return false;
        }
        if (*attempt >= Policy::max_attempts) {
            ML_WARN("[OPQ] " << to_string(kind_of(op)) << " failed after " << static_cast<int>(*attempt)
                    << " attempts: " << to_string(result.error));
            return false;
        }
        ++*attempt;
        ML_TL1(telemetry_.retried_total.inc());
        ML_INFO("[OPQ] Retrying " << to_string(kind_of(op)) << " (attempt " << static_cast<int>(*attempt)
                << "/" << static_cast<int>(Policy::max_attempts) << ") after " << to_string(result.error));

        if (std::holds_alternative<ReliableWrite>(op)) {
            current_ = std::move(op);
            backoff_timer_ = scheduler_.schedule_after(Policy::reliable_write_backoff, [this]() { resume_after_backoff_(); });
            return true;
        }

        in_flight_ = false;
        pending_.push_front(std::move(op));
        process_();
        return true;
    }

    void resume_after_backoff_() {
        backoff_timer_ = timer::INVALID_TIMER_ID;
        if (!current_) {
            return;
        }
        start_current_();
    }

    void deliver_(const Operation& op, const Result& result) {
        const ResultSink& sink = sink_of(op);
        if (sink) {
            sink(result);
        }
    }

    void escalate_(Error error) {
        ML_TL1(telemetry_.escalations_total.inc());
        if (escalation_handler_) {
            escalation_handler_(error);
        }
    }
};

} // namespace meshlink::core::operation
