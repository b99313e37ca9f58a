#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <ostream>
#include <functional>


namespace ndaxlink::core::protocol::ndax {

// ===============================================
// REQUEST COMPLETION STATUS
// ===============================================
enum class Status : std::uint8_t {
    Ok = 0,
    Rejected,          // reply body carried "result":false
    ServerError,       // gateway answered with an m=5 Error frame
    Timeout,           // no reply before the deadline
    ConnectionLost,    // sent, then the transport dropped before the reply
    AuthFailed,        // session could not authenticate
    ShuttingDown       // stop() was called, or submitted after stop()
};

[[nodiscard]]
inline constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
        case Status::Ok:             return "Ok";
        case Status::Rejected:       return "Rejected";
        case Status::ServerError:    return "ServerError";
        case Status::Timeout:        return "Timeout";
        case Status::ConnectionLost: return "ConnectionLost";
        case Status::AuthFailed:     return "AuthFailed";
        case Status::ShuttingDown:   return "ShuttingDown";
        default:                     return "Unknown";
    }
}


// ===============================================
// RESPONSE
// ===============================================
// Outcome of one request. `payload` is the raw JSON of the reply ("o"),
// empty unless the gateway answered.
struct Response {
    Status status{Status::Ok};
    std::string endpoint;
    std::string payload;
    std::string reason;

    [[nodiscard]]
    bool ok() const noexcept {
        return status == Status::Ok;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Response& r) {
    os << "{" << r.endpoint << " -> " << to_string(r.status);
    if (!r.reason.empty()) {
        os << " (" << r.reason << ")";
    }
    return os << "}";
}

using Completion = std::function<void(Response&&)>;

} // namespace ndaxlink::core::protocol::ndax
