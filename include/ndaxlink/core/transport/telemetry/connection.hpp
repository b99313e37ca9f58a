#pragma once

#include "lcr/metrics/atomic/counter.hpp"

namespace ndaxlink::core::transport::telemetry {

// ============================================================================
// Connection telemetry
//
// Mechanical facts about connection-level transitions and decisions.
// Written by the dispatch thread, readable from any thread.
// ============================================================================

struct alignas(64) Connection final {
    // --- Lifecycle ---
    lcr::metrics::atomic::counter64 open_calls_total;          // open() invoked by owner
    lcr::metrics::atomic::counter64 connect_success_total;     // reached State::Connected
    lcr::metrics::atomic::counter64 connect_failure_total;     // initial attempt failed
    lcr::metrics::atomic::counter64 close_calls_total;         // close() invoked by owner
    lcr::metrics::atomic::counter64 disconnect_events_total;   // transport closed while connected

    // --- Keep-alive ---
    lcr::metrics::atomic::counter64 pings_requested_total;
    lcr::metrics::atomic::counter64 pongs_observed_total;
    lcr::metrics::atomic::counter64 liveness_timeouts_total;

    // --- Retry ---
    lcr::metrics::atomic::counter64 retry_cycles_started_total;
    lcr::metrics::atomic::counter64 retry_attempts_total;
    lcr::metrics::atomic::counter64 retry_success_total;
    lcr::metrics::atomic::counter64 retry_failure_total;

    // --- Data plane ---
    lcr::metrics::atomic::counter64 rx_messages_total;
    lcr::metrics::atomic::counter64 tx_messages_total;
    lcr::metrics::atomic::counter64 send_rejected_total;       // send() while not connected
};

} // namespace ndaxlink::core::transport::telemetry
