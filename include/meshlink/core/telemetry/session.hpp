#pragma once

#include "meshlink/core/metrics/counter.hpp"


namespace meshlink::core::telemetry {

// ============================================================================
// Operation queue telemetry
// ============================================================================
struct alignas(64) Operations {
    metrics::Counter64 enqueued_total;
    metrics::Counter64 started_total;
    metrics::Counter64 succeeded_total;
    metrics::Counter64 retried_total;
    metrics::Counter64 timed_out_total;
    metrics::Counter64 failed_total;
    metrics::Counter64 stale_completions_total;
    metrics::Counter64 escalations_total;
    metrics::Counter64 flushed_total;

    void reset() noexcept {
        enqueued_total.reset();
        started_total.reset();
        succeeded_total.reset();
        retried_total.reset();
        timed_out_total.reset();
        failed_total.reset();
        stale_completions_total.reset();
        escalations_total.reset();
        flushed_total.reset();
    }
};

// ============================================================================
// Connection lifecycle telemetry
// ============================================================================
struct alignas(64) Lifecycle {
    metrics::Counter64 connect_attempts_total;
    metrics::Counter64 link_up_total;
    metrics::Counter64 link_down_total;
    metrics::Counter64 reconnects_scheduled_total;
    metrics::Counter64 adapter_restarts_total;
    metrics::Counter64 cache_invalidations_total;
    metrics::Counter64 drained_frames_total;
    metrics::Counter64 ready_total;

    void reset() noexcept {
        connect_attempts_total.reset();
        link_up_total.reset();
        link_down_total.reset();
        reconnects_scheduled_total.reset();
        adapter_restarts_total.reset();
        cache_invalidations_total.reset();
        drained_frames_total.reset();
        ready_total.reset();
    }
};

// ============================================================================
// Packet delivery telemetry
// ============================================================================
struct alignas(64) Delivery {
    metrics::Counter64 submitted_total;
    metrics::Counter64 rejected_oversize_total;
    metrics::Counter64 transmitted_total;
    metrics::Counter64 replayed_total;
    metrics::Counter64 retried_total;
    metrics::Counter64 acknowledged_total;
    metrics::Counter64 failed_total;
    metrics::Counter64 rejected_transitions_total;

    void reset() noexcept {
        submitted_total.reset();
        rejected_oversize_total.reset();
        transmitted_total.reset();
        replayed_total.reset();
        retried_total.reset();
        acknowledged_total.reset();
        failed_total.reset();
        rejected_transitions_total.reset();
    }
};

// ============================================================================
// Notification dispatch telemetry
// ============================================================================
struct alignas(64) Dispatch {
    metrics::Counter64 dispatched_total;
    metrics::Counter64 unhandled_total;
    metrics::Counter64 handler_failures_total;
    metrics::Counter64 undecodable_total;

    void reset() noexcept {
        dispatched_total.reset();
        unhandled_total.reset();
        handler_failures_total.reset();
        undecodable_total.reset();
    }
};

// ============================================================================
// Session telemetry aggregate
// ============================================================================
struct Session {
    Operations operations;
    Lifecycle  lifecycle;
    Delivery   delivery;
    Dispatch   dispatch;

    void reset() noexcept {
        operations.reset();
        lifecycle.reset();
        delivery.reset();
        dispatch.reset();
    }
};

} // namespace meshlink::core::telemetry
