#pragma once

#include <cstdint>
#include <string_view>


namespace ndaxlink::core::transport {

// -----------------------------------------------------------------------------
// Transport errors
//
// What the socket layer reports, already mapped from Beast / Asio / OpenSSL
// error codes by the backend. The session never sees a boost::system code.
// -----------------------------------------------------------------------------
enum class Error : std::uint8_t {
    None = 0,

    // caller side
    InvalidUrl,         // not ws:// or wss://, empty host, bad port
    InvalidState,       // e.g. open() on a live connection
    Cancelled,

    // orderly endings
    LocalShutdown,
    RemoteClosed,       // close frame or EOF from the gateway

    // network
    Timeout,
    ConnectionFailed,   // resolve / TCP connect
    HandshakeFailed,    // TLS or HTTP upgrade
    TransportFailure,   // read / write failed mid-stream
    Backpressure,       // inbound ring overflowed

    ProtocolError,
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
        case Error::None:             return "None";
        case Error::InvalidUrl:       return "InvalidUrl";
        case Error::InvalidState:     return "InvalidState";
        case Error::Cancelled:        return "Cancelled";
        case Error::LocalShutdown:    return "LocalShutdown";
        case Error::RemoteClosed:     return "RemoteClosed";
        case Error::Timeout:          return "Timeout";
        case Error::ConnectionFailed: return "ConnectionFailed";
        case Error::HandshakeFailed:  return "HandshakeFailed";
        case Error::TransportFailure: return "TransportFailure";
        case Error::Backpressure:     return "Backpressure";
        case Error::ProtocolError:    return "ProtocolError";
        default:                      return "Unknown";
    }
}

// Network conditions that may clear on their own. Everything else is either
// a local decision or a mistake that a new socket would repeat.
[[nodiscard]]
inline constexpr bool is_retryable(Error err) noexcept {
    switch (err) {
        case Error::RemoteClosed:
        case Error::Timeout:
        case Error::ConnectionFailed:
        case Error::HandshakeFailed:
        case Error::TransportFailure:
        case Error::Backpressure:
            return true;
        default:
            return false;
    }
}

} // namespace ndaxlink::core::transport
