#include "ndaxlink/core/transport/beast/websocket.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <thread>
#include <exception>
#include <type_traits>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/ssl.h>

#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"

namespace asio = boost::asio;
namespace bbeast = boost::beast;
namespace bws = boost::beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;


namespace ndaxlink::core::transport::beast {

namespace {

// How long the I/O thread blocks waiting for a read or a wake-up
constexpr auto IO_SLICE = std::chrono::milliseconds(10);

// Upper bound for the closing handshake on local shutdown
constexpr auto CLOSE_GRACE = std::chrono::milliseconds(1000);

[[nodiscard]]
Error map_read_error(const bbeast::error_code& ec) noexcept {
    if (ec == bws::error::closed) {
        NL_INFO("[WS] Received WebSocket close frame.");
        return Error::RemoteClosed;
    }
    if (ec == asio::error::eof || ec == ssl::error::stream_truncated
        || ec == asio::error::connection_reset || ec == asio::error::connection_aborted) {
        NL_INFO("[WS] Connection closed by peer (" << ec.message() << ")");
        return Error::RemoteClosed;
    }
    if (ec == asio::error::operation_aborted) {
        NL_TRACE("[WS] Receive cancelled (local shutdown)");
        return Error::LocalShutdown;
    }
    if (ec == asio::error::timed_out || ec == bbeast::error::timeout) {
        NL_WARN("[WS] Receive timeout");
        return Error::Timeout;
    }
    NL_ERROR("[WS] Receive failed: " << ec.message());
    return Error::TransportFailure;
}

} // namespace


struct WebSocket::Impl {
    using clock       = std::chrono::steady_clock;
    using TlsStream   = bws::stream<ssl::stream<bbeast::tcp_stream>>;
    using PlainStream = bws::stream<bbeast::tcp_stream>;

    Impl(bool is_secure, std::chrono::milliseconds timeout)
        : secure(is_secure)
        , connect_timeout(timeout)
    {}

    bool secure;
    std::chrono::milliseconds connect_timeout;
    asio::io_context ioc;
    ssl::context ssl_ctx{ssl::context::tls_client};
    std::unique_ptr<TlsStream> tls;
    std::unique_ptr<PlainStream> plain;

    std::thread io_thread;
    std::atomic<bool> running{false};
    std::atomic<bool> open{false};
    std::atomic<bool> closed{false};

    std::mutex outbound_mtx;
    std::deque<std::string> outbound;

    lcr::lockfree::spsc_ring<std::string, RX_RING_CAPACITY> inbound;
    lcr::lockfree::spsc_ring<websocket::Event, 16> events;

    // --- I/O thread only -------------------------------------------------

    template <class Stream>
    void run(Stream& ws) noexcept {
        bbeast::flat_buffer buffer;
        bool read_pending = false;
        bool read_done = false;
        bbeast::error_code read_ec;
        Error failure = Error::None;

        while (running.load(std::memory_order_acquire)) {
            // --- drain outbound queue ---
            if (!flush_outbound(ws, failure)) {
                break;
            }
            // --- keep exactly one read outstanding ---
            if (!read_pending) {
                read_done = false;
                ws.async_read(buffer, [&](bbeast::error_code ec, std::size_t) {
                    read_ec = ec;
                    read_done = true;
                });
                read_pending = true;
            }
            if (ioc.stopped()) {
                ioc.restart();
            }
            // Returns after one completion (read or send wake-up) or the slice
            ioc.run_one_for(IO_SLICE);

            if (read_done) {
                read_pending = false;
                if (read_ec) {
                    failure = map_read_error(read_ec);
                    break;
                }
                std::string msg = bbeast::buffers_to_string(buffer.data());
                buffer.consume(buffer.size());
                if (!inbound.push(std::move(msg))) [[unlikely]] {
                    NL_ERROR("[WS] Inbound ring full (" << RX_RING_CAPACITY << " frames). Dropping connection.");
                    failure = Error::Backpressure;
                    break;
                }
            }
        }

        open.store(false, std::memory_order_release);
        shutdown(ws, read_pending);
        if (failure != Error::None && failure != Error::LocalShutdown) {
            (void)events.push(websocket::Event::make_error(failure));
        }
        signal_close();
    }

    template <class Stream>
    bool flush_outbound(Stream& ws, Error& failure) noexcept {
        std::deque<std::string> batch;
        {
            std::lock_guard<std::mutex> lk(outbound_mtx);
            batch.swap(outbound);
        }
        for (const auto& frame : batch) {
            bbeast::error_code ec;
            ws.write(asio::buffer(frame), ec);
            if (ec) {
                NL_ERROR("[WS] Write failed: " << ec.message());
                failure = Error::TransportFailure;
                return false;
            }
        }
        return true;
    }

    // Closing handshake if the socket is still usable, hard close otherwise
    template <class Stream>
    void shutdown(Stream& ws, bool read_pending) noexcept {
        bbeast::error_code ec;
        if (ws.is_open()) {
            bool close_done = false;
            ws.async_close(bws::close_code::normal, [&](bbeast::error_code) { close_done = true; });
            if (ioc.stopped()) {
                ioc.restart();
            }
            const auto deadline = clock::now() + CLOSE_GRACE;
            while ((!close_done || read_pending) && clock::now() < deadline) {
                if (ioc.run_one_for(IO_SLICE) == 0 && ioc.stopped()) {
                    break;
                }
                // The pending read completes with bws::error::closed once the handshake ends
                if (close_done) {
                    read_pending = false;
                }
            }
        }
        bbeast::get_lowest_layer(ws).socket().close(ec);
        ioc.stop();
    }

    void signal_close() noexcept {
        if (closed.exchange(true)) {
            return;
        }
        if (!events.push(websocket::Event::make_close())) {
            NL_FATAL("[WS] Control event ring full, close event lost");
        }
    }

    // --- connect helpers (caller thread) ---------------------------------

    // Runs completions until `done` or the deadline. Past the deadline
    // `cancel` aborts the operation and its handler is drained here, since it
    // captures the caller's frame.
    template <class Cancel>
    bool await(const bool& done, clock::time_point deadline, Cancel&& cancel) {
        ioc.restart();
        while (!done) {
            if (clock::now() >= deadline) {
                cancel();
                const auto drain_until = clock::now() + CLOSE_GRACE;
                while (!done && clock::now() < drain_until) {
                    if (ioc.stopped()) {
                        ioc.restart();
                    }
                    ioc.run_one_for(IO_SLICE);
                }
                return false;
            }
            if (ioc.stopped()) {
                ioc.restart();
            }
            ioc.run_one_until(deadline);
        }
        return true;
    }

    template <class Stream>
    Error open_stream(Stream& ws, const tcp::resolver::results_type& endpoints,
                      const std::string& host, const std::string& port, const std::string& path,
                      clock::time_point deadline) {
        auto& tcp_layer = bbeast::get_lowest_layer(ws);
        const auto drop_socket = [&tcp_layer] {
            bbeast::error_code ignored;
            tcp_layer.socket().close(ignored);
        };
        bbeast::error_code ec;
        bool done = false;

        // --- TCP ---
        tcp_layer.expires_at(deadline);
        tcp_layer.async_connect(endpoints, [&](const bbeast::error_code& e, const tcp::endpoint&) {
            ec = e;
            done = true;
        });
        if (!await(done, deadline, drop_socket) || ec == bbeast::error::timeout) {
            NL_ERROR("[WS] TCP connect to " << host << ":" << port << " timed out");
            return Error::Timeout;
        }
        if (ec) {
            NL_ERROR("[WS] TCP connect failed: " << ec.message());
            return Error::ConnectionFailed;
        }

        // --- TLS ---
        if constexpr (std::is_same_v<Stream, TlsStream>) {
            done = false;
            ws.next_layer().async_handshake(ssl::stream_base::client, [&](const bbeast::error_code& e) {
                ec = e;
                done = true;
            });
            if (!await(done, deadline, drop_socket) || ec == bbeast::error::timeout) {
                NL_ERROR("[WS] TLS handshake with " << host << " timed out");
                return Error::Timeout;
            }
            if (ec) {
                NL_ERROR("[WS] TLS handshake failed: " << ec.message());
                return Error::HandshakeFailed;
            }
        }

        // --- Upgrade: the websocket layer takes over the timer ---
        tcp_layer.expires_never();
        const auto now = clock::now();
        if (now >= deadline) {
            NL_ERROR("[WS] Connect deadline passed before the upgrade");
            return Error::Timeout;
        }
        auto timeouts = bws::stream_base::timeout::suggested(bbeast::role_type::client);
        timeouts.handshake_timeout = deadline - now;
        ws.set_option(timeouts);
        ws.set_option(bws::stream_base::decorator([](bws::request_type& req) {
            req.set(bbeast::http::field::user_agent, std::string("ndaxlink ") + BOOST_BEAST_VERSION_STRING);
        }));
        ws.read_message_max(RX_MESSAGE_MAX);
        ws.text(true);

        const bool default_port = (secure && port == "443") || (!secure && port == "80");
        const std::string authority = default_port ? host : host + ":" + port;
        done = false;
        ws.async_handshake(authority, path, [&](const bbeast::error_code& e) {
            ec = e;
            done = true;
        });
        if (!await(done, deadline, drop_socket) || ec == bbeast::error::timeout) {
            NL_ERROR("[WS] WebSocket handshake with " << authority << " timed out");
            return Error::Timeout;
        }
        if (ec) {
            NL_ERROR("[WS] WebSocket handshake failed: " << ec.message());
            return Error::HandshakeFailed;
        }

        // No idle timeout once open: Connection runs the keep-alive
        ws.set_option(bws::stream_base::timeout::suggested(bbeast::role_type::client));
        return Error::None;
    }
};


WebSocket::WebSocket(bool secure, std::chrono::milliseconds connect_timeout)
    : impl_(std::make_unique<Impl>(secure, connect_timeout))
{}

WebSocket::~WebSocket() {
    close();
}

Error WebSocket::connect(const std::string& host, const std::string& port, const std::string& path) noexcept {
    auto& s = *impl_;
    if (s.open.load(std::memory_order_acquire) || s.closed.load(std::memory_order_acquire)) {
        NL_WARN("[WS] connect() called on a used transport instance");
        return Error::InvalidState;
    }
    try {
        const auto deadline = Impl::clock::now() + s.connect_timeout;

        // --- DNS ---
        tcp::resolver resolver(s.ioc);
        tcp::resolver::results_type endpoints;
        bbeast::error_code ec;
        bool done = false;
        resolver.async_resolve(host, port, [&](const bbeast::error_code& e, tcp::resolver::results_type r) {
            ec = e;
            endpoints = std::move(r);
            done = true;
        });
        if (!s.await(done, deadline, [&resolver] { resolver.cancel(); })) {
            NL_ERROR("[WS] DNS resolution of " << host << " timed out");
            return Error::Timeout;
        }
        if (ec) {
            NL_ERROR("[WS] DNS resolution failed for " << host << ": " << ec.message());
            return Error::ConnectionFailed;
        }

        Error err = Error::None;
        if (s.secure) {
            s.ssl_ctx.set_default_verify_paths(ec);
            if (ec) {
                NL_WARN("[WS] Could not load system CA paths: " << ec.message());
            }
            s.ssl_ctx.set_verify_mode(ssl::verify_peer);
            s.tls = std::make_unique<Impl::TlsStream>(s.ioc, s.ssl_ctx);
            s.tls->next_layer().set_verify_callback(ssl::host_name_verification(host));
            // SNI
            if (!SSL_set_tlsext_host_name(s.tls->next_layer().native_handle(), host.c_str())) {
                NL_ERROR("[WS] Failed to set SNI host name");
                return Error::HandshakeFailed;
            }
            err = s.open_stream(*s.tls, endpoints, host, port, path, deadline);
        }
        else {
            s.plain = std::make_unique<Impl::PlainStream>(s.ioc);
            err = s.open_stream(*s.plain, endpoints, host, port, path, deadline);
        }
        if (err != Error::None) {
            return err;
        }

        s.open.store(true, std::memory_order_release);
        s.running.store(true, std::memory_order_release);
        s.io_thread = std::thread([&s] {
            lcr::log::set_thread_name("ws-io");
            if (s.tls) {
                s.run(*s.tls);
            } else {
                s.run(*s.plain);
            }
        });
        NL_DEBUG("[WS] Connected to " << host << ":" << port << path);
        return Error::None;
    }
    catch (const std::exception& e) {
        NL_ERROR("[WS] connect() failed: " << e.what());
        return Error::TransportFailure;
    }
}

bool WebSocket::send(std::string_view msg) noexcept {
    auto& s = *impl_;
    if (!s.open.load(std::memory_order_acquire)) {
        NL_ERROR("[WS] send() called on a closed WebSocket");
        return false;
    }
    try {
        {
            std::lock_guard<std::mutex> lk(s.outbound_mtx);
            s.outbound.emplace_back(msg);
        }
        // Wake the I/O thread out of run_one_for()
        asio::post(s.ioc, [] {});
        return true;
    }
    catch (const std::exception& e) {
        NL_ERROR("[WS] send() failed: " << e.what());
        return false;
    }
}

void WebSocket::close() noexcept {
    auto& s = *impl_;
    s.running.store(false, std::memory_order_release);
    if (s.io_thread.joinable()) {
        try {
            asio::post(s.ioc, [] {});
        } catch (const std::exception& e) {
            // Not fatal: run_one_for() returns within IO_SLICE anyway
            NL_DEBUG("[WS] Wake-up post failed: " << e.what());
        }
        s.io_thread.join();
        NL_TRACE("[WS] WebSocket closed.");
    }
}

bool WebSocket::poll_message(std::string& out) noexcept {
    return impl_->inbound.pop(out);
}

bool WebSocket::poll_event(websocket::Event& out) noexcept {
    return impl_->events.pop(out);
}

} // namespace ndaxlink::core::transport::beast
