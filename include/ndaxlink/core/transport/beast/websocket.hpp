#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <memory>
#include <cstddef>

#include "ndaxlink/core/transport/error.hpp"
#include "ndaxlink/core/transport/websocket/events.hpp"

/*
================================================================================
WebSocket transport (Boost.Beast over Asio, TLS by OpenSSL)
================================================================================

One instance = one socket lifetime. Connection creates a fresh instance for
every connect attempt and never reuses a closed one.

  - connect() resolves, connects, performs TLS (with SNI and peer
    verification) and the WebSocket upgrade on the caller's thread, all
    under one deadline, then starts a dedicated I/O thread
  - the I/O thread owns the Beast stream: it drains the outbound queue and
    reads complete text frames into a lock-free SPSC ring
  - control-plane events (Error, then Close) are delivered exactly once
    through a second SPSC ring
  - an inbound ring overflow is reported as Error::Backpressure and the
    socket is closed

No retries and no reconnection logic here: that policy belongs to
transport::Connection.

Boost.Beast types are kept out of this header.
================================================================================
*/

namespace ndaxlink::core::transport::beast {

// Inbound frames buffered between the I/O thread and the dispatch loop
inline constexpr std::size_t RX_RING_CAPACITY = 1024;

// Largest inbound message accepted (snapshots can be large)
inline constexpr std::size_t RX_MESSAGE_MAX = 16 * 1024 * 1024;

class WebSocket {
public:
    WebSocket(bool secure, std::chrono::milliseconds connect_timeout);
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    // Timeout once the connect deadline passes, whatever step was running
    [[nodiscard]]
    Error connect(const std::string& host, const std::string& port, const std::string& path) noexcept;

    // Queues a text frame for the I/O thread. False if the socket is not open.
    [[nodiscard]]
    bool send(std::string_view msg) noexcept;

    // Idempotent. Joins the I/O thread.
    void close() noexcept;

    [[nodiscard]]
    bool poll_message(std::string& out) noexcept;

    [[nodiscard]]
    bool poll_event(websocket::Event& out) noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ndaxlink::core::transport::beast
