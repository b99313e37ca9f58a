#pragma once

#include <chrono>

namespace ndaxlink::core::transport::policy {

// A ping is requested every `ping_interval` while connected. The connection
// is declared dead if its pong has not been observed `pong_grace` after the
// ping was requested. A zero interval disables keep-alive.
struct KeepAlive {
    std::chrono::milliseconds ping_interval{15000};
    std::chrono::milliseconds pong_grace{5000};

    [[nodiscard]]
    bool enabled() const noexcept {
        return ping_interval.count() > 0;
    }
};

} // namespace ndaxlink::core::transport::policy
