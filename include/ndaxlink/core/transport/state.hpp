#pragma once

#include <cstdint>
#include <string_view>


namespace ndaxlink::core::transport {

//  Disconnected --open()--> Connecting --ok--> Connected
//       ^                       |                  |
//       |                    failed          close / reset / dead peer
//       |                       v                  v
//       +---- close() --- WaitingReconnect <--- Disconnecting
//
enum class State : std::uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting,
    WaitingReconnect
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:     return "Disconnected";
        case State::Connecting:       return "Connecting";
        case State::Connected:        return "Connected";
        case State::Disconnecting:    return "Disconnecting";
        case State::WaitingReconnect: return "WaitingReconnect";
        default:                      return "Unknown";
    }
}

// Why the last transport lifetime ended. Only LocalClose stops the retry
// cycle; the others reconnect when the recorded error allows it.
enum class DisconnectReason : std::uint8_t {
    None,
    LocalClose,
    TransportError,
    LivenessTimeout,
    ProtocolReset
};

[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:            return "None";
        case DisconnectReason::LocalClose:      return "LocalClose";
        case DisconnectReason::TransportError:  return "TransportError";
        case DisconnectReason::LivenessTimeout: return "LivenessTimeout";
        case DisconnectReason::ProtocolReset:   return "ProtocolReset";
        default:                                return "Unknown";
    }
}

// Set by the connection itself; a late socket error must not overwrite it
[[nodiscard]]
inline constexpr bool is_deliberate(DisconnectReason r) noexcept {
    return r == DisconnectReason::LocalClose
        || r == DisconnectReason::LivenessTimeout
        || r == DisconnectReason::ProtocolReset;
}

} // namespace ndaxlink::core::transport
