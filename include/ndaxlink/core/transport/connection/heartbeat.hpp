#pragma once

#include <chrono>

#include "ndaxlink/core/transport/policy/keepalive.hpp"


namespace ndaxlink::core::transport::connection {

// -----------------------------------------------------------------------------
// Heartbeat
//
// Ping bookkeeping for one connected socket. The connection asks check(now)
// on every poll; at most one ping is outstanding at a time.
// -----------------------------------------------------------------------------
class Heartbeat {
public:
    using clock = std::chrono::steady_clock;

    enum class Verdict {
        Quiet,
        PingDue,     // a ping was just requested
        Overdue      // the outstanding ping outlived pong_grace
    };

    explicit Heartbeat(policy::KeepAlive policy) noexcept
        : policy_(policy)
    {}

    // New socket: the first ping is one full interval away
    void restart(clock::time_point now) noexcept {
        awaiting_ = false;
        last_pong_ = now;
    }

    void stop() noexcept {
        awaiting_ = false;
    }

    [[nodiscard]]
    Verdict check(clock::time_point now) noexcept {
        if (!policy_.enabled()) {
            return Verdict::Quiet;
        }
        if (awaiting_) {
            return now - ping_sent_ > policy_.pong_grace ? Verdict::Overdue : Verdict::Quiet;
        }
        if (now - last_pong_ < policy_.ping_interval) {
            return Verdict::Quiet;
        }
        awaiting_ = true;
        ping_sent_ = now;
        return Verdict::PingDue;
    }

    // False for a pong nobody asked for
    bool pong(clock::time_point now) noexcept {
        if (!awaiting_) {
            return false;
        }
        awaiting_ = false;
        last_pong_ = now;
        return true;
    }

    [[nodiscard]] bool awaiting() const noexcept { return awaiting_; }
    [[nodiscard]] const policy::KeepAlive& keepalive() const noexcept { return policy_; }

#ifdef NL_UNIT_TEST
    void force_ping_sent(clock::time_point ts) noexcept {
        awaiting_ = true;
        ping_sent_ = ts;
    }

    void force_last_pong(clock::time_point ts) noexcept {
        last_pong_ = ts;
    }
#endif

private:
    policy::KeepAlive policy_;
    bool awaiting_{false};
    clock::time_point ping_sent_{};
    clock::time_point last_pong_{};
};

} // namespace ndaxlink::core::transport::connection
