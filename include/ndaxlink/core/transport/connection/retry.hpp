#pragma once

#include <chrono>

#include "ndaxlink/core/transport/policy/backoff.hpp"


namespace ndaxlink::core::transport::connection {

// -----------------------------------------------------------------------------
// RetrySchedule
//
// When the next reconnect attempt may run. Attempts are numbered from 1 and
// the numbering restarts on every successful connect: attempt 1 runs at
// once, attempt n > 1 waits backoff.delay(n - 1).
// -----------------------------------------------------------------------------
class RetrySchedule {
public:
    using clock = std::chrono::steady_clock;

    explicit RetrySchedule(policy::Backoff backoff) noexcept
        : backoff_(backoff)
    {}

    void arm_now(clock::time_point now) noexcept {
        attempt_ = 1;
        due_ = now;
    }

    // Returns the delay chosen for the new attempt
    std::chrono::milliseconds arm_next(clock::time_point now) noexcept {
        ++attempt_;
        const auto delay = backoff_.delay(attempt_ - 1);
        due_ = now + delay;
        return delay;
    }

    void clear() noexcept {
        attempt_ = 0;
    }

    [[nodiscard]] bool due(clock::time_point now) const noexcept { return now >= due_; }
    [[nodiscard]] int attempt() const noexcept { return attempt_; }
    [[nodiscard]] clock::time_point due_at() const noexcept { return due_; }

#ifdef NL_UNIT_TEST
    void force_due(clock::time_point ts) noexcept { due_ = ts; }
#endif

private:
    policy::Backoff backoff_;
    int attempt_{0};
    clock::time_point due_{};
};

} // namespace ndaxlink::core::transport::connection
