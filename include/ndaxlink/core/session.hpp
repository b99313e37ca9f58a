/*
===============================================================================
NDAX protocol Session
===============================================================================

Composes the transport, the login handshake, request correlation and stream
subscriptions into one poll-driven session against the NDAX gateway.

Architecture:
  - transport::Connection<WS>  → socket lifecycle
                                  • reconnection with backoff
                                  • keep-alive timer
                                  • raw text frames
  - protocol::ndax::Codec      → envelope encode / decode
  - protocol::ndax::Correlator → request/reply matching, timeouts, outbox
  - auth::Machine              → AuthenticateUser / Authenticate2FA
  - subscription::Registry     → stream intent, replay, event routing

Pipeline, re-run on every transport epoch:

  connect → AuthenticateUser [→ Authenticate2FA] → replay subscriptions
          → flush queued session requests → steady state

Threading:
  - poll(), start() and stop() belong to one dispatch thread. start() and
    stop() may be called from another thread only while nothing is polling
  - submit(), the query/order helpers, subscribe_*() and unsubscribe() are
    safe from any thread: they only touch the correlator and the registry,
    both internally locked
  - Completions and subscription handlers run on the dispatch thread, except
    that a submit() after stop() resolves inline with ShuttingDown

Failure model:
  - Transport loss: requests already sent resolve with ConnectionLost,
    queued ones wait for the next authenticated epoch
  - Login timeout: the transport is reset and the pipeline restarts
  - Login refused: no retry, pending requests resolve with AuthFailed,
    start() resolves with the failure; start() may be called again
  - stop(): terminal; every outstanding future resolves with ShuttingDown
===============================================================================
*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <exception>
#include <mutex>
#include <utility>
#include <variant>

#include "ndaxlink/core/config/session.hpp"
#include "ndaxlink/core/session/state.hpp"
#include "ndaxlink/core/telemetry/session.hpp"
#include "ndaxlink/core/transport/connection.hpp"
#include "ndaxlink/core/transport/telemetry/connection.hpp"
#include "ndaxlink/core/protocol/ndax/frame.hpp"
#include "ndaxlink/core/protocol/ndax/codec.hpp"
#include "ndaxlink/core/protocol/ndax/endpoints.hpp"
#include "ndaxlink/core/protocol/ndax/response.hpp"
#include "ndaxlink/core/protocol/ndax/correlator.hpp"
#include "ndaxlink/core/protocol/ndax/parser/result.hpp"
#include "ndaxlink/core/protocol/ndax/schema/level1.hpp"
#include "ndaxlink/core/protocol/ndax/schema/level2.hpp"
#include "ndaxlink/core/protocol/ndax/schema/trade.hpp"
#include "ndaxlink/core/protocol/ndax/schema/ticker.hpp"
#include "ndaxlink/core/protocol/ndax/schema/account.hpp"
#include "ndaxlink/core/protocol/ndax/schema/order.hpp"
#include "ndaxlink/core/protocol/ndax/schema/query.hpp"
#include "ndaxlink/core/auth/machine.hpp"
#include "ndaxlink/core/subscription/registry.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace ndaxlink::core {

template <transport::WebSocketConcept WS>
class Session {
public:
    using Response = protocol::ndax::Response;
    using Status = protocol::ndax::Status;
    using Lane = protocol::ndax::Lane;

    template <class T>
    using TypedHandler = std::function<void(const T&)>;

    explicit Session(config::Session cfg)
        : config_(std::move(cfg))
        , connection_(connection_telemetry_, config_.backoff, config_.keepalive, config_.connect_timeout)
        , correlator_(telemetry_)
        , registry_(telemetry_)
        , auth_(config_.credentials)
    {}

    ~Session() {
        stop();
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    // Connects and logs in. The future resolves once: authenticated, refused,
    // or cancelled by stop(). Transient connect failures are retried and do
    // not resolve it.
    [[nodiscard]]
    std::future<auth::Outcome> start(std::string_view url) {
        const auto st = state();
        if (st == session::State::Closed) {
            return ready_outcome_(auth::Failure::Cancelled, "session is closed");
        }
        if (st != session::State::Disconnected || start_promise_) {
            NL_WARN("[SESSION] start() called while " << session::to_string(st) << ". Ignoring.");
            return ready_outcome_(auth::Failure::ProtocolError, "session already started");
        }

        NL_INFO("[SESSION] Starting session for " << config_.credentials);
        auth_.reset();
        auth_.on_connecting();
        publish_auth_state_();
        set_state_(session::State::Connecting);

        start_promise_ = std::make_unique<std::promise<auth::Outcome>>();
        auto future = start_promise_->get_future();

        const transport::Error err = connection_.open(url);
        if (err != transport::Error::None) {
            if (connection_.state() == transport::State::WaitingReconnect) {
                NL_WARN("[SESSION] Initial connect failed (" << transport::to_string(err) << "), retrying");
                set_state_(session::State::Reconnecting);
            }
            else {
                set_state_(session::State::Disconnected);
                auth_.fail(auth::Failure::ProtocolError, std::string("connect failed: ") + std::string(transport::to_string(err)));
                publish_auth_state_();
                resolve_start_();
            }
        }
        // On success the Connected signal is handled by the next poll()
        return future;
    }

    // Terminal shutdown. Safe to call more than once.
    void stop() {
        if (state() == session::State::Closed) {
            return;
        }
        NL_INFO("[SESSION] Stopping session");

        // Best-effort LogOut, sent straight away since the transport is
        // about to go
        if (auth_.is_authenticated() && connection_.is_connected()) {
            correlator_.submit(protocol::ndax::endpoint::LogOut, "{}", config_.request_timeout, Completion_{}, Lane::Control);
            (void)correlator_.flush(false, [this](std::string_view frame) { return connection_.send(frame); });
        }

        set_state_(session::State::Closed);
        connection_.close();
        registry_.deactivate();

        correlator_.shutdown();
        correlator_.fail_all(Status::ShuttingDown, "session stopped");

        if (start_promise_) {
            auth_.fail(auth::Failure::Cancelled, "stopped before login completed");
            resolve_start_();
        }
        else {
            auth_.on_disconnected();
        }
        publish_auth_state_();
        set_token_({});
    }

    // One dispatch step: transport, signals, inbound frames, timeouts, outbox.
    void poll() {
        if (state() == session::State::Closed) {
            return;
        }

        connection_.poll();

        transport::connection::Signal sig;
        while (connection_.poll_signal(sig)) {
            handle_signal_(sig);
        }

        // A handler may call stop(): nothing is delivered after it
        while (state() != session::State::Closed && connection_.poll_message(rx_buffer_)) {
            handle_message_(rx_buffer_);
        }

        (void)correlator_.expire(protocol::ndax::Correlator::clock::now());

        if (connection_.is_connected()) {
            (void)correlator_.flush(auth_.is_authenticated(),
                                    [this](std::string_view frame) { return connection_.send(frame); });
        }
    }

    // =========================================================================
    // Requests (any thread)
    // =========================================================================

    // Generic one-shot call. The request waits for authentication.
    [[nodiscard]]
    std::future<Response> submit(std::string_view endpoint, std::string_view payload) {
        return correlator_.submit(endpoint, payload, config_.request_timeout);
    }

    [[nodiscard]]
    std::future<Response> submit(std::string_view endpoint, std::string_view payload, std::chrono::milliseconds timeout) {
        return correlator_.submit(endpoint, payload, timeout);
    }

    // --- Queries ---

    [[nodiscard]]
    std::future<Response> get_account_positions() {
        return submit(protocol::ndax::endpoint::GetAccountPositions, account_request_().to_json());
    }

    [[nodiscard]]
    std::future<Response> get_account_info() {
        return submit(protocol::ndax::endpoint::GetAccountInfo, account_request_().to_json());
    }

    [[nodiscard]]
    std::future<Response> get_level1(std::uint64_t instrument_id) {
        return submit(protocol::ndax::endpoint::GetLevel1,
                      protocol::ndax::schema::level1::Get{instrument_id}.to_json());
    }

    [[nodiscard]]
    std::future<Response> get_l2_snapshot(std::uint64_t instrument_id, std::uint64_t depth = 10) {
        return submit(protocol::ndax::endpoint::GetL2Snapshot,
                      protocol::ndax::schema::level2::GetSnapshot{instrument_id, depth}.to_json());
    }

    [[nodiscard]]
    std::future<Response> get_open_orders() {
        return submit(protocol::ndax::endpoint::GetOpenOrders, account_request_().to_json());
    }

    [[nodiscard]]
    std::future<Response> get_open_trade_reports() {
        return submit(protocol::ndax::endpoint::GetOpenTradeReports, account_request_().to_json());
    }

    [[nodiscard]]
    std::future<Response> get_products() {
        return submit(protocol::ndax::endpoint::GetProducts, protocol::ndax::schema::query::OmsScoped{}.to_json());
    }

    [[nodiscard]]
    std::future<Response> get_instruments() {
        return submit(protocol::ndax::endpoint::GetInstruments, protocol::ndax::schema::query::OmsScoped{}.to_json());
    }

    [[nodiscard]]
    std::future<Response> get_ticker_history(std::uint64_t instrument_id, std::uint64_t interval,
                                             std::string from_date, std::string to_date) {
        protocol::ndax::schema::ticker::History req{instrument_id, interval, std::move(from_date), std::move(to_date)};
        return submit(protocol::ndax::endpoint::GetTickerHistory, req.to_json());
    }

    // --- Orders ---

    // A zero account id is filled with the configured account
    [[nodiscard]]
    std::future<Response> send_order(protocol::ndax::schema::order::Send order) {
        if (const auto field = order.invalid_field(); !field.empty()) {
            NL_WARN("[SESSION] SendOrder refused locally: " << field << " is not a finite number");
            return ready_response_(Status::Rejected, protocol::ndax::endpoint::SendOrder,
                                   std::string(field) + " is not a finite number");
        }
        if (order.account_id == 0) {
            order.account_id = config_.credentials.account_id;
        }
        return submit(protocol::ndax::endpoint::SendOrder, order.to_json());
    }

    [[nodiscard]]
    std::future<Response> cancel_order(std::uint64_t order_id) {
        protocol::ndax::schema::order::Cancel req{config_.credentials.account_id, order_id};
        return submit(protocol::ndax::endpoint::CancelOrder, req.to_json());
    }

    [[nodiscard]]
    std::future<Response> cancel_all_orders() {
        protocol::ndax::schema::order::CancelAll req;
        req.account_id = config_.credentials.account_id;
        return submit(protocol::ndax::endpoint::CancelAllOrders, req.to_json());
    }

    [[nodiscard]]
    std::future<Response> logout() {
        return submit(protocol::ndax::endpoint::LogOut, "{}");
    }

    // =========================================================================
    // Streams (any thread)
    // =========================================================================

    subscription::SubscriptionId subscribe_level1(std::uint64_t instrument_id,
                                                  TypedHandler<protocol::ndax::schema::level1::Update> handler) {
        protocol::ndax::schema::level1::Subscribe req{instrument_id, {}};
        return subscribe_({subscription::Feed::Level1, instrument_id}, req.to_json(), std::move(handler));
    }

    subscription::SubscriptionId subscribe_level2(std::uint64_t instrument_id,
                                                  TypedHandler<protocol::ndax::schema::level2::Snapshot> handler,
                                                  std::uint64_t depth = 10) {
        protocol::ndax::schema::level2::Subscribe req{instrument_id, depth};
        return subscribe_({subscription::Feed::Level2, instrument_id}, req.to_json(), std::move(handler));
    }

    subscription::SubscriptionId subscribe_trades(std::uint64_t instrument_id,
                                                  TypedHandler<protocol::ndax::schema::trade::Batch> handler,
                                                  std::uint64_t include_last_count = 100) {
        protocol::ndax::schema::trade::Subscribe req{instrument_id, include_last_count};
        return subscribe_({subscription::Feed::Trades, instrument_id}, req.to_json(), std::move(handler));
    }

    subscription::SubscriptionId subscribe_ticker(std::uint64_t instrument_id,
                                                  TypedHandler<protocol::ndax::schema::ticker::Batch> handler,
                                                  std::uint64_t interval = 60,
                                                  std::uint64_t include_last_count = 100) {
        protocol::ndax::schema::ticker::Subscribe req{instrument_id, interval, include_last_count};
        return subscribe_({subscription::Feed::Ticker, instrument_id}, req.to_json(), std::move(handler));
    }

    subscription::SubscriptionId subscribe_account_events(TypedHandler<protocol::ndax::schema::account::Event> handler) {
        const std::uint64_t account = config_.credentials.account_id;
        return subscribe_({subscription::Feed::AccountEvents, account}, account_request_().to_json(), std::move(handler));
    }

    // Returns false for an unknown id
    bool unsubscribe(subscription::SubscriptionId id) {
        if (!registry_.key_of(id).has()) {
            return false;
        }
        auto wire = registry_.unsubscribe(id);
        if (wire.has()) {
            submit_stream_(wire.take(), false);
        }
        return true;
    }

    // =========================================================================
    // Accessors (any thread)
    // =========================================================================

    [[nodiscard]] session::State state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] auth::State auth_state() const noexcept { return auth_state_.load(std::memory_order_acquire); }
    [[nodiscard]] bool is_authenticated() const noexcept { return state() == session::State::Authenticated; }

    [[nodiscard]]
    std::string session_token() const {
        std::lock_guard lock(token_mutex_);
        return session_token_;
    }

    [[nodiscard]] std::uint64_t transport_epoch() const noexcept { return epoch_.load(std::memory_order_acquire); }
    [[nodiscard]] std::size_t pending_requests() const { return correlator_.pending(); }
    [[nodiscard]] std::size_t subscriptions() const { return registry_.size(); }

    [[nodiscard]] const telemetry::Session& telemetry() const noexcept { return telemetry_; }
    [[nodiscard]] const transport::telemetry::Connection& connection_telemetry() const noexcept { return connection_telemetry_; }
    [[nodiscard]] const config::Session& config() const noexcept { return config_; }

#ifdef NL_UNIT_TEST
public:
    transport::Connection<WS>& connection() { return connection_; }
    WS& ws() { return connection_.ws(); }
    protocol::ndax::Correlator& correlator() { return correlator_; }
    subscription::Registry& registry() { return registry_; }
    auth::Machine& auth() { return auth_; }
#endif // NL_UNIT_TEST

private:
    using Completion_ = protocol::ndax::Completion;

    config::Session config_;

    // Telemetry first: the components below hold references to it
    transport::telemetry::Connection connection_telemetry_;
    telemetry::Session telemetry_;

    transport::Connection<WS> connection_;
    protocol::ndax::Codec codec_;
    protocol::ndax::Correlator correlator_;
    subscription::Registry registry_;
    auth::Machine auth_;

    std::atomic<session::State> state_{session::State::Disconnected};
    std::atomic<auth::State> auth_state_{auth::State::Disconnected};
    std::atomic<std::uint64_t> epoch_{0};

    mutable std::mutex token_mutex_;
    std::string session_token_;

    std::unique_ptr<std::promise<auth::Outcome>> start_promise_;

    std::string rx_buffer_;
    protocol::ndax::Frame frame_;

private:
    // -------------------------------------------------------------------------
    // Transport signals
    // -------------------------------------------------------------------------

    void handle_signal_(transport::connection::Signal sig) {
        using transport::connection::Signal;
        NL_TRACE("[SESSION] signal " << transport::connection::to_string(sig));

        switch (sig) {
            case Signal::Connected:
                on_connected_();
                break;

            case Signal::Disconnected:
                on_disconnected_();
                break;

            case Signal::RetryImmediate:
            case Signal::RetryScheduled:
                if (state() != session::State::Disconnected) {
                    set_state_(session::State::Reconnecting);
                }
                break;

            case Signal::PingDue:
                send_ping_();
                break;

            case Signal::LivenessExpired:
                NL_WARN("[SESSION] Gateway stopped answering pings, reconnecting");
                break;

            default:
                break;
        }
    }

    void on_connected_() {
        const std::uint64_t epoch = connection_.epoch();
        epoch_.store(epoch, std::memory_order_release);
        set_state_(session::State::Authenticating);

        auth_.on_connecting();
        std::string payload = auth_.begin();
        publish_auth_state_();
        telemetry_.auth_attempts_total.inc();

        NL_INFO("[SESSION] Transport epoch " << epoch << " up, logging in");
        correlator_.submit(protocol::ndax::endpoint::AuthenticateUser, payload, config_.auth_timeout,
            [this, epoch](Response&& r) {
                if (!is_current_(epoch)) {
                    return;
                }
                apply_auth_(auth_.on_user_reply(r, std::chrono::system_clock::now()), epoch);
            },
            Lane::Control);
    }

    void on_disconnected_() {
        correlator_.retire_streams(registry_.deactivate());
        const std::size_t failed = correlator_.fail_in_flight(Status::ConnectionLost, "connection lost");
        auth_.on_disconnected();
        publish_auth_state_();
        set_token_({});

        // The immediate retry may already have reconnected within the same poll
        if (connection_.is_active()) {
            NL_WARN("[SESSION] Connection lost (" << failed << " request(s) failed), reconnecting");
            set_state_(session::State::Reconnecting);
            return;
        }

        set_state_(session::State::Disconnected);
        if (start_promise_) {
            // Gave up before the first login completed
            auth_.fail(auth::Failure::ProtocolError,
                       std::string("connection closed: ") + std::string(transport::to_string(connection_.last_error())));
            publish_auth_state_();
            resolve_start_();
        }
    }

    void send_ping_() {
        const std::uint64_t epoch = connection_.epoch();
        correlator_.submit(protocol::ndax::endpoint::Ping, "{}", config_.keepalive.pong_grace,
            [this, epoch](Response&& r) {
                if (r.ok() && is_current_(epoch)) {
                    connection_.on_pong();
                }
            },
            Lane::Control);
    }

    // -------------------------------------------------------------------------
    // Authentication
    // -------------------------------------------------------------------------

    void apply_auth_(auth::Machine::Action action, std::uint64_t epoch) {
        publish_auth_state_();

        switch (action) {
            case auth::Machine::Action::SendSecondFactor:
                NL_DEBUG("[SESSION] Second factor required");
                correlator_.submit(protocol::ndax::endpoint::Authenticate2FA, auth_.second_factor_payload(),
                    config_.auth_timeout,
                    [this, epoch](Response&& r) {
                        if (!is_current_(epoch)) {
                            return;
                        }
                        apply_auth_(auth_.on_second_factor_reply(r), epoch);
                    },
                    Lane::Control);
                break;

            case auth::Machine::Action::Authenticated:
                on_authenticated_();
                break;

            case auth::Machine::Action::Failed:
                on_auth_failed_();
                break;

            case auth::Machine::Action::ResetTransport:
                connection_.reset(transport::Error::Timeout);
                break;

            case auth::Machine::Action::None:
            default:
                break;
        }
    }

    void on_authenticated_() {
        telemetry_.auth_success_total.inc();
        set_token_(auth_.session_token());
        set_state_(session::State::Authenticated);

        auto wires = registry_.activate();
        telemetry_.subscriptions_replayed_total.add(wires.size());
        for (auto& w : wires) {
            submit_stream_(std::move(w), true);
        }

        resolve_start_();
    }

    void on_auth_failed_() {
        telemetry_.auth_failure_total.inc();
        const std::string reason = std::string(auth::to_string(auth_.failure())) + ": " + auth_.reason();
        report_error_("auth", reason);

        connection_.close();
        correlator_.retire_streams(registry_.deactivate());
        correlator_.fail_all(Status::AuthFailed, reason);
        set_state_(session::State::Disconnected);

        resolve_start_();
    }

    // -------------------------------------------------------------------------
    // Inbound frames
    // -------------------------------------------------------------------------

    void handle_message_(const std::string& raw) {
        telemetry_.frames_received_total.inc();

        const auto err = codec_.decode(raw, frame_);
        if (err != protocol::ndax::DecodeError::None) {
            telemetry_.decode_errors_total.inc();
            NL_WARN("[CODEC] Dropping undecodable frame (" << protocol::ndax::to_string(err) << ")");
            report_error_("decode", protocol::ndax::to_string(err));
            return;
        }

        if (frame_.is_response()) {
            (void)correlator_.resolve(frame_);
        }
        else if (frame_.type == protocol::ndax::MessageType::Event) {
            const auto r = registry_.route(frame_);
            if (protocol::ndax::parser::is_decode_error(r)) {
                report_error_("event", frame_.endpoint + ": " + std::string(protocol::ndax::parser::to_string(r)));
            }
        }
        else {
            NL_DEBUG("[SESSION] Ignoring unexpected " << frame_);
        }
    }

    // -------------------------------------------------------------------------
    // Subscriptions
    // -------------------------------------------------------------------------

    template <class T>
    subscription::SubscriptionId subscribe_(subscription::Key key, std::string request, TypedHandler<T> handler) {
        auto reg = registry_.subscribe(key, std::move(request),
            [handler = std::move(handler)](const subscription::Payload& p) {
                if (const T* v = std::get_if<T>(&p)) {
                    handler(*v);
                }
            });
        if (reg.wire.has()) {
            submit_stream_(reg.wire.take(), true);
        }
        return reg.id;
    }

    void submit_stream_(subscription::Wire wire, bool subscribing) {
        const subscription::Key key = wire.key;
        correlator_.submit(wire.endpoint, wire.payload, config_.request_timeout,
            [this, key, subscribing](Response&& r) {
                if (r.ok()) {
                    if (subscribing) {
                        (void)registry_.deliver_snapshot(key, r.payload);
                    }
                    return;
                }
                if (r.status == Status::ConnectionLost || r.status == Status::ShuttingDown
                    || r.status == Status::AuthFailed) {
                    NL_DEBUG("[SUBS] " << r.endpoint << " for " << key << " abandoned (" << protocol::ndax::to_string(r.status) << ")");
                    return;
                }
                NL_WARN("[SUBS] " << r.endpoint << " for " << key << " failed: " << r);
                report_error_("subscription", r.endpoint + " " + std::string(protocol::ndax::to_string(r.status)) + ": " + r.reason);
            },
            Lane::Stream, wire.generation);
    }

    // -------------------------------------------------------------------------
    // Helpers
    // -------------------------------------------------------------------------

    [[nodiscard]]
    protocol::ndax::schema::account::Request account_request_() const noexcept {
        return protocol::ndax::schema::account::Request{config_.credentials.account_id};
    }

    [[nodiscard]]
    bool is_current_(std::uint64_t epoch) const noexcept {
        return state() != session::State::Closed && epoch == connection_.epoch();
    }

    void set_state_(session::State next) noexcept {
        const auto prev = state_.exchange(next, std::memory_order_acq_rel);
        if (prev != next) {
            NL_DEBUG("[SESSION] " << session::to_string(prev) << " -> " << session::to_string(next));
        }
    }

    void publish_auth_state_() noexcept {
        auth_state_.store(auth_.state(), std::memory_order_release);
    }

    void set_token_(std::string token) {
        std::lock_guard lock(token_mutex_);
        session_token_ = std::move(token);
    }

    void resolve_start_() {
        if (!start_promise_) {
            return;
        }
        start_promise_->set_value(auth_.outcome());
        start_promise_.reset();
    }

    [[nodiscard]]
    static std::future<auth::Outcome> ready_outcome_(auth::Failure failure, std::string reason) {
        std::promise<auth::Outcome> p;
        auth::Outcome o;
        o.failure = failure;
        o.reason = std::move(reason);
        p.set_value(std::move(o));
        return p.get_future();
    }

    [[nodiscard]]
    static std::future<Response> ready_response_(Status status, std::string_view endpoint, std::string reason) {
        std::promise<Response> p;
        p.set_value(Response{status, std::string(endpoint), {}, std::move(reason)});
        return p.get_future();
    }

    void report_error_(std::string_view code, std::string_view message) {
        if (!config_.error_handler) {
            return;
        }
        try {
            config_.error_handler(code, message);
        }
        catch (const std::exception& e) {
            NL_ERROR("[SESSION] error handler threw: " << e.what());
        }
    }
};

} // namespace ndaxlink::core
