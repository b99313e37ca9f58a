#include <utility>

#include "ndaxlink/client.hpp"

// ---- Core includes (PRIVATE) ----
#include "ndaxlink/core/session.hpp"
#include "ndaxlink/core/session/driver.hpp"
#include "ndaxlink/core/transport/beast/websocket.hpp"


namespace ndaxlink {

using WS = core::transport::beast::WebSocket;

namespace {

core::config::Session to_session_config(const ClientConfig& cfg) {
    core::config::Session s;
    s.credentials = cfg.credentials;
    s.request_timeout = cfg.request_timeout;
    s.auth_timeout = cfg.auth_timeout;
    s.connect_timeout = cfg.connect_timeout;
    s.keepalive = cfg.keepalive;
    s.backoff = cfg.backoff;
    s.error_handler = cfg.error_handler;
    return s;
}

} // namespace

// -----------------------------
// Impl
// -----------------------------

struct Client::Impl {
    ClientConfig cfg;

    // Core session (owning); the driver below is destroyed first
    core::Session<WS> session;
    core::session::Driver<core::Session<WS>> driver;

    explicit Impl(ClientConfig c)
        : cfg(std::move(c))
        , session(to_session_config(cfg))
        , driver(session, cfg.tick)
    {}
};

// -----------------------------
// Client methods
// -----------------------------

Client::Client(ClientConfig cfg)
    : impl_(std::make_unique<Impl>(std::move(cfg))) {}

Client::~Client() = default;

std::future<Client::Outcome> Client::start() {
    return impl_->driver.start(impl_->cfg.endpoint);
}

void Client::stop() {
    impl_->driver.stop();
}

bool Client::is_running() const noexcept {
    return impl_->driver.is_running();
}

std::future<Client::Response> Client::submit(const std::string& endpoint, const std::string& payload) {
    return impl_->session.submit(endpoint, payload);
}

std::future<Client::Response> Client::get_account_positions() {
    return impl_->session.get_account_positions();
}

std::future<Client::Response> Client::get_account_info() {
    return impl_->session.get_account_info();
}

std::future<Client::Response> Client::get_level1(std::uint64_t instrument_id) {
    return impl_->session.get_level1(instrument_id);
}

std::future<Client::Response> Client::get_l2_snapshot(std::uint64_t instrument_id, std::uint64_t depth) {
    return impl_->session.get_l2_snapshot(instrument_id, depth);
}

std::future<Client::Response> Client::get_open_orders() {
    return impl_->session.get_open_orders();
}

std::future<Client::Response> Client::get_open_trade_reports() {
    return impl_->session.get_open_trade_reports();
}

std::future<Client::Response> Client::get_products() {
    return impl_->session.get_products();
}

std::future<Client::Response> Client::get_instruments() {
    return impl_->session.get_instruments();
}

std::future<Client::Response> Client::get_ticker_history(std::uint64_t instrument_id, std::uint64_t interval,
                                                         std::string from_date, std::string to_date) {
    return impl_->session.get_ticker_history(instrument_id, interval, std::move(from_date), std::move(to_date));
}

std::future<Client::Response> Client::send_order(core::protocol::ndax::schema::order::Send order) {
    return impl_->session.send_order(std::move(order));
}

std::future<Client::Response> Client::cancel_order(std::uint64_t order_id) {
    return impl_->session.cancel_order(order_id);
}

std::future<Client::Response> Client::cancel_all_orders() {
    return impl_->session.cancel_all_orders();
}

std::future<Client::Response> Client::logout() {
    return impl_->session.logout();
}

Client::SubscriptionId Client::subscribe_level1(std::uint64_t instrument_id, level1_handler handler) {
    return impl_->session.subscribe_level1(instrument_id, std::move(handler));
}

Client::SubscriptionId Client::subscribe_level2(std::uint64_t instrument_id, level2_handler handler, std::uint64_t depth) {
    return impl_->session.subscribe_level2(instrument_id, std::move(handler), depth);
}

Client::SubscriptionId Client::subscribe_trades(std::uint64_t instrument_id, trade_handler handler, std::uint64_t include_last_count) {
    return impl_->session.subscribe_trades(instrument_id, std::move(handler), include_last_count);
}

Client::SubscriptionId Client::subscribe_ticker(std::uint64_t instrument_id, ticker_handler handler,
                                                std::uint64_t interval, std::uint64_t include_last_count) {
    return impl_->session.subscribe_ticker(instrument_id, std::move(handler), interval, include_last_count);
}

Client::SubscriptionId Client::subscribe_account_events(account_handler handler) {
    return impl_->session.subscribe_account_events(std::move(handler));
}

bool Client::unsubscribe(SubscriptionId id) {
    return impl_->session.unsubscribe(id);
}

core::session::State Client::state() const noexcept {
    return impl_->session.state();
}

core::auth::State Client::auth_state() const noexcept {
    return impl_->session.auth_state();
}

std::string Client::session_token() const {
    return impl_->session.session_token();
}

std::uint64_t Client::transport_epoch() const noexcept {
    return impl_->session.transport_epoch();
}

std::size_t Client::pending_requests() const {
    return impl_->session.pending_requests();
}

const core::telemetry::Session& Client::telemetry() const noexcept {
    return impl_->session.telemetry();
}

const core::transport::telemetry::Connection& Client::connection_telemetry() const noexcept {
    return impl_->session.connection_telemetry();
}

} // namespace ndaxlink
