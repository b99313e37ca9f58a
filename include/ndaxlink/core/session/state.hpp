#pragma once

#include <cstdint>
#include <string_view>


namespace ndaxlink::core::session {

enum class State : std::uint8_t {
    Disconnected,     // not started, or stopped by an auth failure
    Connecting,       // first transport connect in progress
    Authenticating,   // transport up, login running
    Authenticated,    // steady state
    Reconnecting,     // transport lost, retry cycle running
    Closed            // stop() called; terminal
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:   return "Disconnected";
        case State::Connecting:     return "Connecting";
        case State::Authenticating: return "Authenticating";
        case State::Authenticated:  return "Authenticated";
        case State::Reconnecting:   return "Reconnecting";
        case State::Closed:         return "Closed";
        default:                    return "Unknown";
    }
}

} // namespace ndaxlink::core::session
