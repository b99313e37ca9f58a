/*
===============================================================================
 transport::Connection - Keep-alive Unit Tests
===============================================================================

Covered Requirements:
---------------------
C1. PingDue is emitted once per interval while connected, never twice
    for the same outstanding ping
C2. on_pong() re-arms the interval
C3. A ping left unanswered past the grace window force-closes the
    transport and reconnects (LivenessTimeout)
C4. Keep-alive is inert when disabled or not connected

Time is simulated with force_last_pong() / force_ping_requested().
===============================================================================
*/

#include <iostream>
#include <chrono>

#include "common/harness/connection.hpp"

using transport::test::ConnectionHarness;
using namespace std::chrono_literals;

namespace {

transport::policy::KeepAlive fast_keepalive() {
    return transport::policy::KeepAlive{100ms, 50ms};
}

} // namespace


// -----------------------------------------------------------------------------
// C1 + C2: ping cadence
// -----------------------------------------------------------------------------
void test_ping_due_cadence() {
    std::cout << "[TEST] C1/C2: ping cadence\n";
    ConnectionHarness h(fast_keepalive());

    TEST_CHECK(h.connection->open("wss://api.ndax.io/WSGateway/") == Error::None);
    h.step();
    TEST_CHECK(h.ping_due_signals == 0);   // interval starts at connect

    h.connection->force_last_pong(std::chrono::steady_clock::now() - 200ms);
    h.step();
    TEST_CHECK(h.ping_due_signals == 1);

    // Same outstanding ping: no second request
    h.step();
    TEST_CHECK(h.ping_due_signals == 1);

    h.connection->on_pong();
    TEST_CHECK(h.telemetry.pongs_observed_total.load() == 1);
    h.step();
    TEST_CHECK(h.ping_due_signals == 1);

    // A stray pong is ignored
    h.connection->on_pong();
    TEST_CHECK(h.telemetry.pongs_observed_total.load() == 1);

    h.connection->force_last_pong(std::chrono::steady_clock::now() - 200ms);
    h.step();
    TEST_CHECK(h.ping_due_signals == 2);
    TEST_CHECK(h.telemetry.pings_requested_total.load() == 2);
    TEST_CHECK(h.connection->state() == State::Connected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C3: liveness timeout
// -----------------------------------------------------------------------------
void test_missing_pong_forces_reconnect() {
    std::cout << "[TEST] C3: missing pong forces reconnect\n";
    ConnectionHarness h(fast_keepalive());

    TEST_CHECK(h.connection->open("wss://api.ndax.io/WSGateway/") == Error::None);
    h.drain_signals();
    h.reset_counters();

    h.connection->force_ping_requested(std::chrono::steady_clock::now() - 100ms);
    h.step();
    TEST_CHECK(h.liveness_expired_signals == 1);
    TEST_CHECK(h.connection->state() == State::Disconnecting);
    TEST_CHECK(h.connection->disconnect_reason() == DisconnectReason::LivenessTimeout);

    h.step();
    TEST_CHECK(h.disconnect_signals == 1);
    TEST_CHECK(h.connect_signals == 1);
    TEST_CHECK(h.connection->epoch() == 2);
    TEST_CHECK(h.connection->state() == State::Connected);
    TEST_CHECK(h.telemetry.liveness_timeouts_total.load() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C4: inert when disabled
// -----------------------------------------------------------------------------
void test_disabled_keepalive() {
    std::cout << "[TEST] C4: keep-alive disabled\n";
    ConnectionHarness h;   // ping_interval = 0

    TEST_CHECK(h.connection->open("wss://api.ndax.io/WSGateway/") == Error::None);
    h.connection->force_last_pong(std::chrono::steady_clock::now() - 3600s);
    h.step();
    h.step();
    TEST_CHECK(h.ping_due_signals == 0);
    TEST_CHECK(h.liveness_expired_signals == 0);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_ping_due_cadence();
    test_missing_pong_forces_reconnect();
    test_disabled_keepalive();

    std::cout << "\n[KEEP-ALIVE TESTS PASSED]\n";
    return 0;
}
