#pragma once

#include <cstdint>
#include <string_view>


namespace ndaxlink::core::transport::connection {

// -----------------------------------------------------------------------------
// What Connection::poll_signal() hands to the session. Each value is an edge:
// it is emitted once when the thing happens and never repeated.
//
//   Connected        new socket, epoch() moved forward; time to log in
//   Disconnected     the socket that was Connected is gone
//   RetryImmediate   reconnect cycle entered, next attempt on the next poll
//   RetryScheduled   an attempt failed, next one after the backoff delay
//   PingDue          send a Ping and report the reply with on_pong()
//   LivenessExpired  the last Ping was never answered; Disconnected follows
// -----------------------------------------------------------------------------
enum class Signal : std::uint8_t {
    None,
    Connected,
    Disconnected,
    RetryImmediate,
    RetryScheduled,
    PingDue,
    LivenessExpired,
};

[[nodiscard]]
inline constexpr std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:            return "None";
        case Signal::Connected:       return "Connected";
        case Signal::Disconnected:    return "Disconnected";
        case Signal::RetryImmediate:  return "RetryImmediate";
        case Signal::RetryScheduled:  return "RetryScheduled";
        case Signal::PingDue:         return "PingDue";
        case Signal::LivenessExpired: return "LivenessExpired";
        default:                      return "Unknown";
    }
}

} // namespace ndaxlink::core::transport::connection
