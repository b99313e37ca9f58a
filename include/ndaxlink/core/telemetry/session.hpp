#pragma once

#include "lcr/metrics/atomic/counter.hpp"

namespace ndaxlink::core::telemetry {

// ============================================================================
// Session telemetry
//
// Protocol-level anomalies and throughput, written by the dispatch thread
// (correlator / registry / session), readable from any thread.
// ============================================================================

struct alignas(64) Session final {
    // --- Inbound ---
    lcr::metrics::atomic::counter64 frames_received_total;
    lcr::metrics::atomic::counter64 decode_errors_total;       // frame dropped by the codec
    lcr::metrics::atomic::counter64 unmatched_replies_total;   // reply with no pending request (late or duplicate)
    lcr::metrics::atomic::counter64 unmatched_events_total;    // event with no live subscription
    lcr::metrics::atomic::counter64 invalid_events_total;      // event payload failed validation
    lcr::metrics::atomic::counter64 events_delivered_total;    // handed to a subscription handler

    // --- Requests ---
    lcr::metrics::atomic::counter64 requests_submitted_total;
    lcr::metrics::atomic::counter64 requests_sent_total;
    lcr::metrics::atomic::counter64 requests_timed_out_total;
    lcr::metrics::atomic::counter64 requests_failed_total;     // ConnectionLost / AuthFailed / ShuttingDown

    // --- Authentication ---
    lcr::metrics::atomic::counter64 auth_attempts_total;
    lcr::metrics::atomic::counter64 auth_success_total;
    lcr::metrics::atomic::counter64 auth_failure_total;

    // --- Subscriptions ---
    lcr::metrics::atomic::counter64 subscriptions_replayed_total;
};

} // namespace ndaxlink::core::telemetry
