#pragma once

#include <chrono>
#include <functional>
#include <string_view>

#include "ndaxlink/core/auth/credentials.hpp"
#include "ndaxlink/core/transport/policy/backoff.hpp"
#include "ndaxlink/core/transport/policy/keepalive.hpp"
#include "ndaxlink/core/transport/websocket_concept.hpp"


namespace ndaxlink::core::config {

// Asynchronous anomalies (auth failure, undecodable frames, refused
// subscriptions). `code` is a short stable tag, `message` is human-readable.
using ErrorHandler = std::function<void(std::string_view code, std::string_view message)>;

inline constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{10000};
inline constexpr std::chrono::milliseconds DEFAULT_AUTH_TIMEOUT{10000};

struct Session {
    auth::Credentials credentials{};
    std::chrono::milliseconds request_timeout{DEFAULT_REQUEST_TIMEOUT};
    std::chrono::milliseconds auth_timeout{DEFAULT_AUTH_TIMEOUT};
    // Per connect attempt; bounds how long one poll() can block
    std::chrono::milliseconds connect_timeout{transport::DEFAULT_CONNECT_TIMEOUT};
    transport::policy::KeepAlive keepalive{};
    transport::policy::Backoff backoff{};
    ErrorHandler error_handler{};
};

} // namespace ndaxlink::core::config
