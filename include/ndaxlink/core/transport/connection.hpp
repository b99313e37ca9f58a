#pragma once

#include <cassert>
#include <cstddef>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "ndaxlink/core/transport/error.hpp"
#include "ndaxlink/core/transport/state.hpp"
#include "ndaxlink/core/transport/parse_url.hpp"
#include "ndaxlink/core/transport/websocket_concept.hpp"
#include "ndaxlink/core/transport/websocket/events.hpp"
#include "ndaxlink/core/transport/connection/signal.hpp"
#include "ndaxlink/core/transport/connection/heartbeat.hpp"
#include "ndaxlink/core/transport/connection/retry.hpp"
#include "ndaxlink/core/transport/policy/backoff.hpp"
#include "ndaxlink/core/transport/policy/keepalive.hpp"
#include "ndaxlink/core/transport/telemetry/connection.hpp"
#include "lcr/optional.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"


namespace ndaxlink::core::transport {

/*
===============================================================================
 Connection<WS>
===============================================================================

One logical link to the gateway. It outlives the sockets it drives: every
successful connect builds a fresh WS, bumps epoch() and emits
Signal::Connected. The session uses the epoch to tell frames and replies of
an old socket from those of the current one.

The connection moves text frames and nothing else. It does not know the
NDAX envelope; when the heartbeat says a ping is due it emits PingDue and
waits for the owner to call on_pong().

Losing the socket
-----------------
  remote close / socket error   Disconnected, then an immediate attempt
  reset(err)                    same, after closing the socket ourselves
  unanswered ping               LivenessExpired, then as reset(Timeout)
  close()                       Disconnected, no further attempts

Failed attempts are retried after RetrySchedule's delay for as long as the
error is retryable (see is_retryable()). There is no attempt limit.

All calls come from the dispatch thread. The socket's own I/O thread talks
to us only through the rings it exposes to poll_message() / poll_event().
===============================================================================
*/

inline constexpr std::size_t SIGNAL_RING_CAPACITY = 64;

template <transport::WebSocketConcept WS>
class Connection {
    using clock = std::chrono::steady_clock;

public:
    explicit Connection(telemetry::Connection& telemetry,
                        policy::Backoff backoff = {},
                        policy::KeepAlive keepalive = {},
                        std::chrono::milliseconds connect_timeout = DEFAULT_CONNECT_TIMEOUT) noexcept
        : telemetry_(telemetry)
        , connect_timeout_(connect_timeout)
        , heartbeat_(keepalive)
        , retry_(backoff)
    {}

    ~Connection() {
        close();
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Returns None once connected. A retryable failure has already entered
    // the reconnect cycle when it is returned; any other leaves us Disconnected.
    [[nodiscard]]
    Error open(std::string_view url) noexcept {
        telemetry_.open_calls_total.inc();
        if (state_ != State::Disconnected && state_ != State::WaitingReconnect) {
            NL_WARN("[CONN] open(" << url << ") ignored in state " << to_string(state_));
            return Error::InvalidState;
        }

        ParsedUrl endpoint;
        if (Error err = parse_url(url, endpoint); err != Error::None) {
            NL_ERROR("[CONN] Rejected url '" << url << "' (" << to_string(err) << ")");
            last_error_ = err;
            return err;
        }
        url_.assign(url.data(), url.size());
        endpoint_ = std::move(endpoint);
        reason_ = DisconnectReason::None;

        NL_DEBUG("[CONN] Opening " << url_);
        return attempt_(false);
    }

    // Ends the logical connection and any reconnect cycle. Idempotent.
    void close() noexcept {
        switch (state_) {
            case State::Disconnected:
            case State::Disconnecting:
                return;

            case State::Connected:
                telemetry_.close_calls_total.inc();
                NL_DEBUG("[CONN] Closing " << url_);
                shut_socket_(DisconnectReason::LocalClose, Error::LocalShutdown);
                return;

            case State::WaitingReconnect:
                telemetry_.close_calls_total.inc();
                reason_ = DisconnectReason::LocalClose;
                enter_(State::Disconnected);
                return;

            case State::Connecting:
                telemetry_.close_calls_total.inc();
                enter_(State::Disconnected);
                return;
        }
    }

    // Drops a healthy socket for a protocol-level reason and reconnects if
    // `why` is retryable. No-op unless Connected.
    void reset(Error why) noexcept {
        if (state_ != State::Connected) {
            return;
        }
        NL_WARN("[CONN] Resetting transport (" << to_string(why) << ")");
        shut_socket_(DisconnectReason::ProtocolReset, why);
    }

    [[nodiscard]]
    bool send(std::string_view text) noexcept {
        if (state_ != State::Connected) {
            NL_WARN("[CONN] send() refused in state " << to_string(state_));
            telemetry_.send_rejected_total.inc();
            return false;
        }
        if (!ws_->send(text)) {
            return false;
        }
        ++tx_messages_;
        telemetry_.tx_messages_total.inc();
        return true;
    }

    // Handles socket events, runs a due reconnect attempt, then the heartbeat
    void poll() noexcept {
        websocket::Event ev;
        while (ws_ && ws_->poll_event(ev)) {
            if (ev.type == websocket::EventType::Error) {
                on_socket_error_(ev.error);
            }
            else {
                on_socket_closed_();
            }
        }

        const auto now = clock::now();
        if (state_ == State::WaitingReconnect && retry_.due(now)) {
            telemetry_.retry_attempts_total.inc();
            NL_DEBUG("[CONN] Reconnect attempt " << retry_.attempt() << " to " << url_);
            (void)attempt_(true);
        }
        if (state_ == State::Connected) {
            tick_heartbeat_(now);
        }
    }

    [[nodiscard]]
    bool poll_message(std::string& out) noexcept {
        if (!ws_ || !ws_->poll_message(out)) {
            return false;
        }
        ++rx_messages_;
        telemetry_.rx_messages_total.inc();
        return true;
    }

    [[nodiscard]]
    bool poll_signal(connection::Signal& out) noexcept {
        return signals_.pop(out);
    }

    // The ping that PingDue asked for was answered
    void on_pong() noexcept {
        if (heartbeat_.pong(clock::now())) {
            telemetry_.pongs_observed_total.inc();
        }
    }

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool is_connected() const noexcept { return state_ == State::Connected; }

    // Connected, or on the way back to it
    [[nodiscard]] bool is_active() const noexcept { return state_ != State::Disconnected; }

    [[nodiscard]] std::uint64_t epoch() const noexcept { return epoch_; }
    [[nodiscard]] std::uint64_t rx_messages() const noexcept { return rx_messages_; }
    [[nodiscard]] std::uint64_t tx_messages() const noexcept { return tx_messages_; }
    [[nodiscard]] DisconnectReason disconnect_reason() const noexcept { return reason_; }
    [[nodiscard]] Error last_error() const noexcept { return last_error_; }
    [[nodiscard]] int retry_attempts() const noexcept { return retry_.attempt(); }
    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] std::chrono::milliseconds connect_timeout() const noexcept { return connect_timeout_; }

    // Nothing for poll() to do right now: no queued signal, no attempt due
    [[nodiscard]]
    bool is_idle() const noexcept {
        if (!signals_.empty()) {
            return false;
        }
        return !(state_ == State::WaitingReconnect && retry_.due(clock::now()));
    }

#ifdef NL_UNIT_TEST
    WS& ws() {
        assert(ws_ && "no transport");
        return *ws_;
    }

    [[nodiscard]] bool has_transport() const noexcept { return ws_ != nullptr; }

    void force_ping_requested(clock::time_point ts) noexcept { heartbeat_.force_ping_sent(ts); }
    void force_last_pong(clock::time_point ts) noexcept { heartbeat_.force_last_pong(ts); }
    void force_next_retry(clock::time_point ts) noexcept { retry_.force_due(ts); }
    [[nodiscard]] clock::time_point next_retry() const noexcept { return retry_.due_at(); }
#endif

private:
    telemetry::Connection& telemetry_;
    std::chrono::milliseconds connect_timeout_;

    std::string url_;
    lcr::optional<ParsedUrl> endpoint_;
    std::unique_ptr<WS> ws_;

    State state_{State::Disconnected};
    DisconnectReason reason_{DisconnectReason::None};
    Error last_error_{Error::None};
    std::uint64_t epoch_{0};

    connection::Heartbeat heartbeat_;
    connection::RetrySchedule retry_;

    std::uint64_t rx_messages_{0};
    std::uint64_t tx_messages_{0};

    lcr::lockfree::spsc_ring<connection::Signal, SIGNAL_RING_CAPACITY> signals_;

    void enter_(State next) noexcept {
        NL_TRACE("[CONN] " << to_string(state_) << " -> " << to_string(next));
        state_ = next;
    }

    void emit_(connection::Signal sig) noexcept {
        NL_TRACE("[CONN] signal " << to_string(sig));
        if (!signals_.push(sig)) [[unlikely]] {
            // The session drains every poll, so this means it stopped polling
            NL_FATAL("[CONN] Signal ring full, '" << to_string(sig) << "' lost");
        }
    }

    // One connect on a brand new socket. `reconnect` tells an attempt of the
    // retry cycle from the first one made by open().
    Error attempt_(bool reconnect) noexcept {
        enter_(State::Connecting);
        if (ws_) {
            ws_->close();
        }
        const ParsedUrl& ep = endpoint_.value();
        ws_ = std::make_unique<WS>(ep.secure, connect_timeout_);

        last_error_ = ws_->connect(ep.host, ep.port, ep.path);
        if (last_error_ == Error::None) {
            on_connected_(reconnect);
        }
        else if (reconnect) {
            on_retry_failed_();
        }
        else {
            on_open_failed_();
        }
        return last_error_;
    }

    void on_connected_(bool reconnect) noexcept {
        if (reconnect) {
            telemetry_.retry_success_total.inc();
        }
        else {
            telemetry_.connect_success_total.inc();
        }
        enter_(State::Connected);
        ++epoch_;
        reason_ = DisconnectReason::None;
        retry_.clear();
        heartbeat_.restart(clock::now());
        emit_(connection::Signal::Connected);
        NL_INFO("[CONN] Connected to " << url_ << " (epoch " << epoch_ << ")");
    }

    void on_open_failed_() noexcept {
        NL_ERROR("[CONN] Connect to " << url_ << " failed (" << to_string(last_error_) << ")");
        telemetry_.connect_failure_total.inc();
        if (is_retryable(last_error_)) {
            start_retry_cycle_();
            return;
        }
        reason_ = DisconnectReason::TransportError;
        enter_(State::Disconnected);
    }

    void on_retry_failed_() noexcept {
        NL_ERROR("[CONN] Reconnect to " << url_ << " failed (" << to_string(last_error_) << ")");
        telemetry_.retry_failure_total.inc();
        reason_ = DisconnectReason::TransportError;
        if (!is_retryable(last_error_)) {
            enter_(State::Disconnected);
            return;
        }
        enter_(State::WaitingReconnect);
        const auto delay = retry_.arm_next(clock::now());
        emit_(connection::Signal::RetryScheduled);
        NL_INFO("[CONN] Attempt " << retry_.attempt() << " in " << delay.count() << " ms");
    }

    void start_retry_cycle_() noexcept {
        telemetry_.retry_cycles_started_total.inc();
        enter_(State::WaitingReconnect);
        retry_.arm_now(clock::now());
        emit_(connection::Signal::RetryImmediate);
    }

    // Closes the live socket on our own initiative. The socket answers with
    // a Close event, which on_socket_closed_() turns into Disconnected.
    void shut_socket_(DisconnectReason reason, Error err) noexcept {
        reason_ = reason;
        last_error_ = err;
        heartbeat_.stop();
        enter_(State::Disconnecting);
        ws_->close();
    }

    void on_socket_error_(Error err) noexcept {
        if (is_deliberate(reason_)) {
            return;
        }
        NL_WARN("[CONN] Socket error: " << to_string(err));
        last_error_ = err;
        reason_ = DisconnectReason::TransportError;
    }

    void on_socket_closed_() noexcept {
        // Only a socket that made it to Connected has a lifetime to end
        if (state_ != State::Connected && state_ != State::Disconnecting) {
            return;
        }
        if (reason_ == DisconnectReason::None) {
            reason_ = DisconnectReason::TransportError;
        }
        if (last_error_ == Error::None) {
            last_error_ = Error::RemoteClosed;
        }
        telemetry_.disconnect_events_total.inc();
        emit_(connection::Signal::Disconnected);
        NL_INFO("[CONN] Disconnected from " << url_ << " (" << to_string(reason_)
                << ", " << to_string(last_error_) << ")");

        if (reason_ != DisconnectReason::LocalClose && is_retryable(last_error_)) {
            start_retry_cycle_();
        }
        else {
            enter_(State::Disconnected);
        }
    }

    void tick_heartbeat_(clock::time_point now) noexcept {
        switch (heartbeat_.check(now)) {
            case connection::Heartbeat::Verdict::PingDue:
                telemetry_.pings_requested_total.inc();
                emit_(connection::Signal::PingDue);
                break;

            case connection::Heartbeat::Verdict::Overdue:
                NL_WARN("[CONN] No pong within " << heartbeat_.keepalive().pong_grace.count() << " ms, dropping socket");
                telemetry_.liveness_timeouts_total.inc();
                emit_(connection::Signal::LivenessExpired);
                shut_socket_(DisconnectReason::LivenessTimeout, Error::Timeout);
                break;

            case connection::Heartbeat::Verdict::Quiet:
                break;
        }
    }
};

} // namespace ndaxlink::core::transport
