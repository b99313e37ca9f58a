#pragma once

#include <cstdint>
#include <string>
#include <chrono>
#include <functional>
#include <future>
#include <memory>

#include "ndaxlink/core/auth/credentials.hpp"
#include "ndaxlink/core/auth/state.hpp"
#include "ndaxlink/core/config/session.hpp"
#include "ndaxlink/core/session/state.hpp"
#include "ndaxlink/core/telemetry/session.hpp"
#include "ndaxlink/core/transport/policy/backoff.hpp"
#include "ndaxlink/core/transport/policy/keepalive.hpp"
#include "ndaxlink/core/transport/telemetry/connection.hpp"
#include "ndaxlink/core/protocol/ndax/response.hpp"
#include "ndaxlink/core/protocol/ndax/schema/level1.hpp"
#include "ndaxlink/core/protocol/ndax/schema/level2.hpp"
#include "ndaxlink/core/protocol/ndax/schema/trade.hpp"
#include "ndaxlink/core/protocol/ndax/schema/ticker.hpp"
#include "ndaxlink/core/protocol/ndax/schema/account.hpp"
#include "ndaxlink/core/protocol/ndax/schema/order.hpp"
#include "ndaxlink/core/subscription/feed.hpp"


namespace ndaxlink {

// -----------------------------------------------------------------------------
// Client configuration
// -----------------------------------------------------------------------------
struct ClientConfig {
    /// NDAX WebSocket gateway
    std::string endpoint = "wss://api.ndax.io/WSGateway/";

    core::auth::Credentials credentials{};

    std::chrono::milliseconds request_timeout{core::config::DEFAULT_REQUEST_TIMEOUT};
    std::chrono::milliseconds auth_timeout{core::config::DEFAULT_AUTH_TIMEOUT};

    /// Resolve, TCP connect, TLS and upgrade of one attempt
    std::chrono::milliseconds connect_timeout{core::transport::DEFAULT_CONNECT_TIMEOUT};

    /// Dispatch thread poll period
    std::chrono::milliseconds tick{5};

    core::transport::policy::KeepAlive keepalive{};
    core::transport::policy::Backoff backoff{};

    /// Invoked on the dispatch thread for asynchronous anomalies
    core::config::ErrorHandler error_handler{};
};


/*
===============================================================================
ndaxlink Client
===============================================================================

Threaded facade over the poll-driven core Session with the Boost.Beast
transport. It owns one dispatch thread that polls the session every tick;
callers only ever wait on their own futures.

  - start()  connects and logs in, resolving once login succeeds or fails
  - stop()   joins the dispatch thread, then closes the session. Every
             outstanding future resolves with ShuttingDown. Terminal.
  - Handlers run on the dispatch thread and must not block it. They may
    call stop(); the thread is then joined by the next stop()/start()
    from elsewhere or by the destructor
  - One connect attempt blocks the dispatch thread for at most
    connect_timeout

Several clients may coexist; there is no process-wide client state.
===============================================================================
*/
class Client {
public:
    using Response    = core::protocol::ndax::Response;
    using Outcome     = core::auth::Outcome;
    using SubscriptionId = core::subscription::SubscriptionId;

    using level1_handler  = std::function<void(const core::protocol::ndax::schema::level1::Update&)>;
    using level2_handler  = std::function<void(const core::protocol::ndax::schema::level2::Snapshot&)>;
    using trade_handler   = std::function<void(const core::protocol::ndax::schema::trade::Batch&)>;
    using ticker_handler  = std::function<void(const core::protocol::ndax::schema::ticker::Batch&)>;
    using account_handler = std::function<void(const core::protocol::ndax::schema::account::Event&)>;

    explicit Client(ClientConfig cfg);
    // Non-copyable
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    // Stops the session if still running
    ~Client();

    // lifecycle
    [[nodiscard]] std::future<Outcome> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept;

    // one-shot requests
    [[nodiscard]] std::future<Response> submit(const std::string& endpoint, const std::string& payload);
    [[nodiscard]] std::future<Response> get_account_positions();
    [[nodiscard]] std::future<Response> get_account_info();
    [[nodiscard]] std::future<Response> get_level1(std::uint64_t instrument_id);
    [[nodiscard]] std::future<Response> get_l2_snapshot(std::uint64_t instrument_id, std::uint64_t depth = 10);
    [[nodiscard]] std::future<Response> get_open_orders();
    [[nodiscard]] std::future<Response> get_open_trade_reports();
    [[nodiscard]] std::future<Response> get_products();
    [[nodiscard]] std::future<Response> get_instruments();
    [[nodiscard]] std::future<Response> get_ticker_history(std::uint64_t instrument_id, std::uint64_t interval,
                                                           std::string from_date, std::string to_date);

    // orders
    [[nodiscard]] std::future<Response> send_order(core::protocol::ndax::schema::order::Send order);
    [[nodiscard]] std::future<Response> cancel_order(std::uint64_t order_id);
    [[nodiscard]] std::future<Response> cancel_all_orders();
    [[nodiscard]] std::future<Response> logout();

    // streams
    SubscriptionId subscribe_level1(std::uint64_t instrument_id, level1_handler handler);
    SubscriptionId subscribe_level2(std::uint64_t instrument_id, level2_handler handler, std::uint64_t depth = 10);
    SubscriptionId subscribe_trades(std::uint64_t instrument_id, trade_handler handler, std::uint64_t include_last_count = 100);
    SubscriptionId subscribe_ticker(std::uint64_t instrument_id, ticker_handler handler,
                                    std::uint64_t interval = 60, std::uint64_t include_last_count = 100);
    SubscriptionId subscribe_account_events(account_handler handler);
    bool unsubscribe(SubscriptionId id);

    // observation
    [[nodiscard]] core::session::State state() const noexcept;
    [[nodiscard]] core::auth::State auth_state() const noexcept;
    [[nodiscard]] std::string session_token() const;
    [[nodiscard]] std::uint64_t transport_epoch() const noexcept;
    [[nodiscard]] std::size_t pending_requests() const;
    [[nodiscard]] const core::telemetry::Session& telemetry() const noexcept;
    [[nodiscard]] const core::transport::telemetry::Connection& connection_telemetry() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ndaxlink
