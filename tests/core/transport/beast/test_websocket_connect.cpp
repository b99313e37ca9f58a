/*
===============================================================================
 beast::WebSocket connect() Tests
===============================================================================

Runs the real Boost.Beast backend against loopback sockets only.

Covered:
  - A peer that accepts TCP but never answers the upgrade fails with
    Error::Timeout once the connect deadline passes
  - A closed port fails fast with Error::ConnectionFailed
  - close() after a failed connect is a no-op and queues no event
===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "ndaxlink/core/transport/beast/websocket.hpp"
#include "lcr/log/logger.hpp"
#include "common/test_check.hpp"

using namespace ndaxlink::core::transport;
using tcp = boost::asio::ip::tcp;
using namespace std::chrono_literals;


// Listens on an ephemeral loopback port and never accepts: the kernel still
// completes the TCP handshake, the HTTP upgrade is never answered.
struct SilentListener {
    boost::asio::io_context ioc;
    tcp::acceptor acceptor{ioc, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)};

    std::string port() const {
        return std::to_string(acceptor.local_endpoint().port());
    }
};


void test_silent_peer_times_out() {
    std::cout << "[TEST] silent peer: connect() gives up at the deadline\n";

    SilentListener listener;
    beast::WebSocket ws(false, 300ms);

    const auto t0 = std::chrono::steady_clock::now();
    const Error err = ws.connect("127.0.0.1", listener.port(), "/WSGateway/");
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    TEST_CHECK(err == Error::Timeout);
    TEST_CHECK(elapsed >= 250ms);
    TEST_CHECK(elapsed < 3s);

    websocket::Event ev;
    TEST_CHECK(!ws.poll_event(ev));

    std::cout << "[TEST] OK\n";
}

void test_closed_port_fails_fast() {
    std::cout << "[TEST] closed port: connect() fails without waiting\n";

    std::string port;
    {
        SilentListener listener;
        port = listener.port();
    }

    beast::WebSocket ws(false, 5000ms);
    const auto t0 = std::chrono::steady_clock::now();
    const Error err = ws.connect("127.0.0.1", port, "/");
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    TEST_CHECK(err == Error::ConnectionFailed);
    TEST_CHECK(elapsed < 2s);

    std::cout << "[TEST] OK\n";
}

void test_close_after_failed_connect() {
    std::cout << "[TEST] close() after a failed connect\n";

    SilentListener listener;
    beast::WebSocket ws(false, 100ms);
    TEST_CHECK(ws.connect("127.0.0.1", listener.port(), "/") == Error::Timeout);

    ws.close();
    ws.close();

    std::string msg;
    websocket::Event ev;
    TEST_CHECK(!ws.poll_message(msg));
    TEST_CHECK(!ws.poll_event(ev));
    TEST_CHECK(!ws.send("{}"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_silent_peer_times_out();
    test_closed_port_fails_fast();
    test_close_after_failed_connect();

    std::cout << "\n[BEAST CONNECT TESTS PASSED]\n";
    return 0;
}
