#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

namespace ndaxlink::core::transport::policy {

// -----------------------------------------------------------------------------
// Reconnect backoff
// -----------------------------------------------------------------------------
//
// delay(n) = min(max, initial * multiplier^(n-1)), for attempt n >= 1,
// then scaled by a uniform factor in [1 - jitter, 1 + jitter] and clamped
// to max again. Retries are unlimited; only Connection::close() ends the cycle.
//
struct Backoff {
    std::chrono::milliseconds initial{1000};
    std::chrono::milliseconds max{30000};
    double multiplier{2.0};
    double jitter{0.0};          // 0.0 .. 1.0

    [[nodiscard]]
    std::chrono::milliseconds delay(int attempt) const noexcept {
        if (attempt < 1) {
            attempt = 1;
        }
        double ms = static_cast<double>(initial.count());
        const double cap = static_cast<double>(max.count());
        for (int i = 1; i < attempt && ms < cap; ++i) {
            ms *= multiplier;
        }
        ms = std::min(ms, cap);
        if (jitter > 0.0) {
            thread_local std::minstd_rand rng{std::random_device{}()};
            std::uniform_real_distribution<double> dist(1.0 - jitter, 1.0 + jitter);
            ms = std::min(ms * dist(rng), cap);
        }
        return std::chrono::milliseconds(static_cast<std::int64_t>(ms));
    }
};

} // namespace ndaxlink::core::transport::policy
