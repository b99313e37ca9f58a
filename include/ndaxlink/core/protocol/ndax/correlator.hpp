#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ndaxlink/core/protocol/ndax/frame.hpp"
#include "ndaxlink/core/protocol/ndax/codec.hpp"
#include "ndaxlink/core/protocol/ndax/response.hpp"
#include "ndaxlink/core/telemetry/session.hpp"
#include "lcr/sequence.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

/*
===============================================================================
 Request Correlator
===============================================================================

Matches replies to the requests that caused them.

  caller thread(s)                    dispatch thread
  ----------------                    ---------------
  submit()  -> seq, pending, outbox   flush()   -> transport send
                                      resolve() -> completion(Response)
                                      expire()  -> completion(Timeout)

- Sequence numbers come from an atomic generator (start 2, step 2, the
  numbering the gateway expects from clients), so they are unique across
  concurrent submitters and never reused within the process
- Every request resolves exactly once: reply, error, timeout, connection
  loss, auth failure or shutdown
- Completions always run with the internal lock released
- Deadlines start at submit(), not at send

Lanes:
  Control  sent as soon as the transport is up (login, 2FA, ping)
  Session  held in the outbox until the session is authenticated
  Stream   like Session, but bound to one transport epoch: subscription
           traffic that the registry replays itself after a reconnect.
           Each carries its registry generation; once retire_streams(g) has
           run, submits from an older generation are turned away
===============================================================================
*/

namespace ndaxlink::core::protocol::ndax {

enum class Lane : std::uint8_t {
    Control,
    Session,
    Stream
};

[[nodiscard]]
inline constexpr std::string_view to_string(Lane l) noexcept {
    switch (l) {
        case Lane::Control: return "Control";
        case Lane::Session: return "Session";
        case Lane::Stream:  return "Stream";
        default:            return "Unknown";
    }
}


class Correlator {
public:
    using clock = std::chrono::steady_clock;

    explicit Correlator(telemetry::Session& telemetry) noexcept
        : telemetry_(telemetry)
        , sequence_(2, 2)
    {}

    Correlator(const Correlator&) = delete;
    Correlator& operator=(const Correlator&) = delete;

    // ---------------------------------------------------------------------
    // Submission (any thread)
    // ---------------------------------------------------------------------

    // Registers a request and queues its frame. Returns the sequence number,
    // or 0 when it was refused: shut down (ShuttingDown), or a Stream request
    // from a retired generation (ConnectionLost). The completion has then
    // already been invoked.
    std::uint64_t submit(std::string_view endpoint, std::string_view payload,
                         std::chrono::milliseconds timeout, Completion completion,
                         Lane lane = Lane::Session, std::uint64_t generation = 0) {
        std::unique_lock lock(mutex_);
        if (shutdown_) {
            lock.unlock();
            Response resp{Status::ShuttingDown, std::string(endpoint), {}, "session closed"};
            if (completion) {
                completion(std::move(resp));
            }
            return 0;
        }
        if (lane == Lane::Stream && generation < stream_floor_) {
            lock.unlock();
            telemetry_.requests_failed_total.inc();
            NL_DEBUG("[CORR] " << endpoint << " from generation " << generation << " is stale -> refused");
            Response resp{Status::ConnectionLost, std::string(endpoint), {}, "minted before the connection was lost"};
            if (completion) {
                completion(std::move(resp));
            }
            return 0;
        }

        const std::uint64_t seq = sequence_.next();
        const auto now = clock::now();

        Pending p;
        p.endpoint.assign(endpoint.data(), endpoint.size());
        p.lane = lane;
        p.deadline = now + timeout;
        p.sent = false;
        p.completion = std::move(completion);
        pending_.emplace(seq, std::move(p));

        outbox_.push_back(Outgoing{seq, lane, Codec::encode(MessageType::Request, seq, endpoint, payload)});
        telemetry_.requests_submitted_total.inc();

        NL_TRACE("[CORR] submit i=" << seq << " n=" << endpoint << " lane=" << to_string(lane));
        return seq;
    }

    // Future form for application callers.
    [[nodiscard]]
    std::future<Response> submit(std::string_view endpoint, std::string_view payload,
                                 std::chrono::milliseconds timeout) {
        auto promise = std::make_shared<std::promise<Response>>();
        auto future = promise->get_future();
        submit(endpoint, payload, timeout,
               [promise](Response&& r) { promise->set_value(std::move(r)); },
               Lane::Session);
        return future;
    }

    // ---------------------------------------------------------------------
    // Dispatch thread
    // ---------------------------------------------------------------------

    // Sends queued frames in submission order. Session/Stream frames stay queued
    // until `authenticated`. Stops at the first frame the transport refuses.
    // Returns the number of frames sent.
    template <typename SendFn>
    std::size_t flush(bool authenticated, SendFn&& send) {
        std::size_t sent = 0;
        std::lock_guard lock(mutex_);
        for (auto it = outbox_.begin(); it != outbox_.end(); ) {
            auto p = pending_.find(it->sequence);
            if (p == pending_.end()) {
                // Resolved before it went out (timeout, failure)
                it = outbox_.erase(it);
                continue;
            }
            if (it->lane != Lane::Control && !authenticated) {
                ++it;
                continue;
            }
            if (!send(std::string_view(it->frame))) {
                NL_DEBUG("[CORR] transport refused i=" << it->sequence << ", keeping queued");
                break;
            }
            p->second.sent = true;
            telemetry_.requests_sent_total.inc();
            ++sent;
            it = outbox_.erase(it);
        }
        return sent;
    }

    // Resolves the request answered by `frame`. Returns false for a reply
    // nobody is waiting for (late after timeout, duplicate).
    bool resolve(const Frame& frame) {
        Pending p;
        {
            std::lock_guard lock(mutex_);
            auto it = pending_.find(frame.sequence);
            if (it == pending_.end()) {
                on_unmatched_(frame);
                return false;
            }
            p = std::move(it->second);
            pending_.erase(it);
        }

        Response resp;
        resp.endpoint = std::move(p.endpoint);
        resp.payload = frame.payload;
        if (frame.type == MessageType::Error) {
            resp.status = Status::ServerError;
            resp.reason = extract_errormsg_(frame.payload);
            if (resp.reason.empty()) {
                resp.reason = "gateway error";
            }
        }
        else if (is_rejection_(frame.payload, resp.reason)) {
            resp.status = Status::Rejected;
        }
        else {
            resp.status = Status::Ok;
        }

        NL_TRACE("[CORR] resolve i=" << frame.sequence << " " << resp);
        complete_(p, std::move(resp));
        return true;
    }

    // Resolves every request whose deadline has passed with Timeout.
    std::size_t expire(clock::time_point now) {
        std::vector<Pending> expired;
        {
            std::lock_guard lock(mutex_);
            for (auto it = pending_.begin(); it != pending_.end(); ) {
                if (now >= it->second.deadline) {
                    NL_WARN("[CORR] request i=" << it->first << " n=" << it->second.endpoint << " timed out");
                    expired.push_back(std::move(it->second));
                    it = pending_.erase(it);
                }
                else {
                    ++it;
                }
            }
        }
        for (auto& p : expired) {
            telemetry_.requests_timed_out_total.inc();
            Response resp{Status::Timeout, p.endpoint, {}, "no reply before deadline"};
            complete_(p, std::move(resp));
        }
        return expired.size();
    }

    // Transport dropped. Requests already on the wire can no longer be
    // answered; queued control and stream frames belonged to the lost
    // transport epoch. Queued session requests survive and go out after
    // re-authentication.
    std::size_t fail_in_flight(Status status, std::string_view reason) {
        return fail_if_(status, reason, [](const Pending& p) noexcept {
            return p.sent || p.lane != Lane::Session;
        });
    }

    // Stream submits from generations below `generation` are refused from now
    // on. Call before fail_in_flight() so nothing slips in between.
    void retire_streams(std::uint64_t generation) noexcept {
        std::lock_guard lock(mutex_);
        if (generation > stream_floor_) {
            stream_floor_ = generation;
        }
    }

    // Resolves every pending request, sent or not.
    std::size_t fail_all(Status status, std::string_view reason) {
        return fail_if_(status, reason, [](const Pending&) noexcept { return true; });
    }

    // After shutdown() every submit() resolves immediately with ShuttingDown.
    void shutdown() noexcept {
        std::lock_guard lock(mutex_);
        shutdown_ = true;
    }

    // ---------------------------------------------------------------------
    // Accessors
    // ---------------------------------------------------------------------

    [[nodiscard]]
    std::size_t pending() const {
        std::lock_guard lock(mutex_);
        return pending_.size();
    }

    [[nodiscard]]
    std::size_t queued() const {
        std::lock_guard lock(mutex_);
        return outbox_.size();
    }

    [[nodiscard]]
    bool is_pending(std::uint64_t seq) const {
        std::lock_guard lock(mutex_);
        return pending_.count(seq) != 0;
    }

    [[nodiscard]]
    bool is_shutdown() const {
        std::lock_guard lock(mutex_);
        return shutdown_;
    }

    [[nodiscard]]
    std::uint64_t next_sequence() const noexcept {
        return sequence_.current();
    }

private:
    struct Pending {
        std::string endpoint;
        Lane lane{Lane::Session};
        clock::time_point deadline{};
        bool sent{false};
        Completion completion;
    };

    struct Outgoing {
        std::uint64_t sequence;
        Lane lane;
        std::string frame;
    };

    telemetry::Session& telemetry_;
    lcr::sequence sequence_;

    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, Pending> pending_;
    std::deque<Outgoing> outbox_;
    std::uint64_t stream_floor_{0};
    bool shutdown_{false};

    // Reply body inspection happens on the dispatch thread only
    simdjson::dom::parser parser_;

private:
    static void complete_(Pending& p, Response&& resp) {
        if (p.completion) {
            p.completion(std::move(resp));
        }
    }

    void on_unmatched_(const Frame& frame) {
        telemetry_.unmatched_replies_total.inc();
        NL_WARN("[CORR] unmatched " << to_string(frame.type) << " i=" << frame.sequence
                << " n=" << frame.endpoint << " (late or duplicate) -> dropped");
    }

    template <typename Pred>
    std::size_t fail_if_(Status status, std::string_view reason, Pred&& pred) {
        std::vector<Pending> failed;
        {
            std::lock_guard lock(mutex_);
            for (auto it = pending_.begin(); it != pending_.end(); ) {
                if (pred(it->second)) {
                    failed.push_back(std::move(it->second));
                    it = pending_.erase(it);
                }
                else {
                    ++it;
                }
            }
        }
        if (!failed.empty()) {
            NL_DEBUG("[CORR] failing " << failed.size() << " request(s) with " << to_string(status));
        }
        for (auto& p : failed) {
            telemetry_.requests_failed_total.inc();
            Response resp{status, p.endpoint, {}, std::string(reason)};
            complete_(p, std::move(resp));
        }
        return failed.size();
    }

    // {"result":false,"errormsg":"...","errorcode":...}
    bool is_rejection_(std::string_view payload, std::string& reason) {
        simdjson::dom::element root;
        if (parser_.parse(payload.data(), payload.size()).get(root)) {
            return false;
        }
        if (root.type() != simdjson::dom::element_type::OBJECT) {
            return false;
        }
        bool result = true;
        if (root["result"].get(result) || result) {
            return false;
        }
        std::string_view msg;
        if (!root["errormsg"].get(msg) && !msg.empty()) {
            reason.assign(msg.data(), msg.size());
        }
        else {
            reason = "rejected";
        }
        return true;
    }

    std::string extract_errormsg_(std::string_view payload) {
        simdjson::dom::element root;
        if (parser_.parse(payload.data(), payload.size()).get(root)) {
            return {};
        }
        std::string_view msg;
        if (root.type() != simdjson::dom::element_type::OBJECT || root["errormsg"].get(msg)) {
            return {};
        }
        return std::string(msg);
    }
};

} // namespace ndaxlink::core::protocol::ndax
