#pragma once

#include <chrono>
#include <concepts>
#include <string>
#include <string_view>

#include "ndaxlink/core/transport/error.hpp"
#include "ndaxlink/core/transport/websocket/events.hpp"


namespace ndaxlink::core::transport {

// Budget for resolve, TCP connect, TLS and the upgrade together
inline constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{10000};

// What Connection<WS> needs from a socket. One WS object is one socket: it
// is built with the TLS flag and its connect deadline, connected once, closed once and thrown away.
// Whatever threads it runs internally, every member below is called from the
// dispatch thread and must not block; connect() blocks at most for the
// timeout it was built with.
//
// Models: beast::WebSocket, and test::MockWebSocket in the test tree.
template <class WS>
concept WebSocketConcept =
    std::constructible_from<WS, bool, std::chrono::milliseconds> &&
    requires(WS ws,
             const std::string& host,
             const std::string& port,
             const std::string& path,
             std::string_view frame,
             std::string& inbound,
             websocket::Event& event)
{
    { ws.connect(host, port, path) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;
    { ws.send(frame) } noexcept -> std::same_as<bool>;
    { ws.poll_message(inbound) } noexcept -> std::same_as<bool>;   // one text frame
    { ws.poll_event(event) } noexcept -> std::same_as<bool>;       // Close / Error
};

} // namespace ndaxlink::core::transport
