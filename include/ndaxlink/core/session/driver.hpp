#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "ndaxlink/core/auth/state.hpp"
#include "ndaxlink/core/session/state.hpp"
#include "lcr/log/logger.hpp"


namespace ndaxlink::core::session {

// -----------------------------------------------------------------------------
// Driver
//
// Owns the dispatch thread that polls one session every tick.
//
// start() and stop() may also be called from the dispatch thread itself, i.e.
// from a stream handler or the error handler. The session is then driven
// inline, the loop ends after the current poll, and the join is left to the
// next call from another thread or to the destructor. The Driver must not be
// destroyed from the dispatch thread.
// -----------------------------------------------------------------------------
template <class SessionT>
class Driver {
public:
    Driver(SessionT& session, std::chrono::milliseconds tick) noexcept
        : session_(session)
        , tick_(tick)
    {}

    ~Driver() {
        stop();
    }

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;

    [[nodiscard]]
    std::future<auth::Outcome> start(const std::string& url) {
        if (on_dispatch_thread_()) {
            return session_.start(url);
        }
        // start() touches the transport: the dispatch thread must be parked
        park_();
        auto future = session_.start(url);
        if (session_.state() != State::Closed) {
            launch_();
        }
        return future;
    }

    void stop() {
        if (on_dispatch_thread_()) {
            NL_DEBUG("[DRIVER] stop() from the dispatch thread, join deferred");
            running_.store(false, std::memory_order_release);
            session_.stop();
            return;
        }
        park_();
        session_.stop();
    }

    [[nodiscard]]
    bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

private:
    SessionT& session_;
    std::chrono::milliseconds tick_;

    std::atomic<bool> running_{false};
    std::atomic<std::thread::id> dispatch_id_{};
    std::thread dispatcher_;

    [[nodiscard]]
    bool on_dispatch_thread_() const noexcept {
        return dispatch_id_.load(std::memory_order_acquire) == std::this_thread::get_id();
    }

    void launch_() {
        running_.store(true, std::memory_order_release);
        dispatcher_ = std::thread([this] {
            dispatch_id_.store(std::this_thread::get_id(), std::memory_order_release);
            lcr::log::set_thread_name("dispatch");
            NL_DEBUG("[DRIVER] dispatch thread started");
            const bool cooperative = (tick_.count() > 0);
            while (running_.load(std::memory_order_acquire)) {
                session_.poll();
                if (cooperative) {
                    std::this_thread::sleep_for(tick_);
                }
            }
            NL_DEBUG("[DRIVER] dispatch thread stopped");
        });
    }

    void park_() {
        running_.store(false, std::memory_order_release);
        if (dispatcher_.joinable()) {
            dispatcher_.join();
            dispatch_id_.store(std::thread::id{}, std::memory_order_release);
        }
    }
};

} // namespace ndaxlink::core::session
