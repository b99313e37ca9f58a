#pragma once

#include <cstdint>
#include <string>
#include <string_view>


namespace ndaxlink::core::auth {

// ===============================================
// AUTHENTICATION STATE
// ===============================================
enum class State : std::uint8_t {
    Disconnected,
    Connecting,
    AwaitingChallenge,       // AuthenticateUser sent
    AwaitingSecondFactor,    // Authenticate2FA sent
    Authenticated,
    AuthFailed
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:         return "Disconnected";
        case State::Connecting:           return "Connecting";
        case State::AwaitingChallenge:    return "AwaitingChallenge";
        case State::AwaitingSecondFactor: return "AwaitingSecondFactor";
        case State::Authenticated:        return "Authenticated";
        case State::AuthFailed:           return "AuthFailed";
        default:                          return "Unknown";
    }
}


// ===============================================
// FAILURE KIND
// ===============================================
enum class Failure : std::uint8_t {
    None = 0,
    CredentialsRejected,     // AuthenticateUser refused
    SecondFactorRejected,    // Authenticate2FA refused (often clock skew)
    Locked,                  // account locked by the gateway
    ProtocolError,           // reply could not be interpreted
    Cancelled                // stop() during login
};

[[nodiscard]]
inline constexpr std::string_view to_string(Failure f) noexcept {
    switch (f) {
        case Failure::None:                 return "None";
        case Failure::CredentialsRejected:  return "CredentialsRejected";
        case Failure::SecondFactorRejected: return "SecondFactorRejected";
        case Failure::Locked:               return "Locked";
        case Failure::ProtocolError:        return "ProtocolError";
        case Failure::Cancelled:            return "Cancelled";
        default:                            return "Unknown";
    }
}


// ===============================================
// OUTCOME (result of Session::start)
// ===============================================
struct Outcome {
    Failure failure{Failure::None};
    std::string reason;
    std::string session_token;
    std::uint64_t user_id{0};

    [[nodiscard]]
    bool ok() const noexcept {
        return failure == Failure::None;
    }
};

} // namespace ndaxlink::core::auth
