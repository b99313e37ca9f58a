/*
===============================================================================
 protocol::ndax::Correlator Unit Tests
===============================================================================

Covered:
  - Sequence numbering (2, 4, 6, ...) unique across concurrent submitters
  - Lanes: Control goes out before login, Session/Stream wait for it
  - Reply classification: Ok / Rejected / ServerError
  - Exactly-once resolution: timeout, late reply, connection loss, shutdown
  - Transport refusal keeps frames queued, in order
  - Stream submits from a retired generation are refused
===============================================================================
*/

#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <set>
#include <thread>
#include <mutex>
#include <functional>
#include <chrono>

#include "ndaxlink/core/protocol/ndax/correlator.hpp"
#include "ndaxlink/core/protocol/ndax/codec.hpp"
#include "ndaxlink/core/telemetry/session.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"

using namespace ndaxlink::core;
using namespace ndaxlink::core::protocol::ndax;
using namespace std::chrono_literals;

namespace {

// Records every frame handed to the transport
struct Wire {
    std::vector<Frame> frames;
    bool accept{true};
    Codec codec;

    bool operator()(std::string_view raw) {
        if (!accept) {
            return false;
        }
        Frame f;
        TEST_CHECK(codec.decode(raw, f) == DecodeError::None);
        frames.push_back(std::move(f));
        return true;
    }
};

// Captures the completion
struct Sink {
    int calls{0};
    Response last;

    Completion completion() {
        return [this](Response&& r) {
            ++calls;
            last = std::move(r);
        };
    }
};

Frame reply_to(const Frame& req, std::string_view payload) {
    Codec codec;
    Frame f;
    TEST_CHECK(codec.decode(json::ndax::reply(req.sequence, req.endpoint, payload), f) == DecodeError::None);
    return f;
}

} // namespace


void test_sequence_and_lanes() {
    std::cout << "[TEST] sequence numbers and lanes\n";
    telemetry::Session t;
    Correlator c(t);
    Wire wire;

    Sink a, b, d;
    TEST_CHECK(c.submit("GetProducts", R"({"OMSId":1})", 1000ms, a.completion()) == 2);
    TEST_CHECK(c.submit("AuthenticateUser", "{}", 1000ms, b.completion(), Lane::Control) == 4);
    TEST_CHECK(c.submit("SubscribeLevel1", "{}", 1000ms, d.completion(), Lane::Stream) == 6);
    TEST_CHECK(c.next_sequence() == 8);
    TEST_CHECK(c.pending() == 3);
    TEST_CHECK(c.queued() == 3);

    // Before login only the control frame leaves
    TEST_CHECK(c.flush(false, std::ref(wire)) == 1);
    TEST_CHECK(wire.frames.size() == 1);
    TEST_CHECK(wire.frames[0].endpoint == "AuthenticateUser");
    TEST_CHECK(wire.frames[0].sequence == 4);
    TEST_CHECK(wire.frames[0].type == MessageType::Request);

    // After login the rest, in submission order
    TEST_CHECK(c.flush(true, std::ref(wire)) == 2);
    TEST_CHECK(wire.frames.size() == 3);
    TEST_CHECK(wire.frames[1].sequence == 2);
    TEST_CHECK(wire.frames[1].payload == R"({"OMSId":1})");
    TEST_CHECK(wire.frames[2].sequence == 6);
    TEST_CHECK(c.queued() == 0);
    TEST_CHECK(c.pending() == 3);
    TEST_CHECK(t.requests_sent_total.load() == 3);

    std::cout << "[TEST] OK\n";
}

void test_reply_classification() {
    std::cout << "[TEST] reply classification\n";
    telemetry::Session t;
    Correlator c(t);
    Wire wire;

    Sink ok, rejected, error;
    c.submit("GetProducts", "{}", 1000ms, ok.completion());
    c.submit("CancelOrder", "{}", 1000ms, rejected.completion());
    c.submit("SendOrder", "{}", 1000ms, error.completion());
    (void)c.flush(true, std::ref(wire));

    TEST_CHECK(c.resolve(reply_to(wire.frames[0], R"([{"ProductId":1}])")));
    TEST_CHECK(ok.calls == 1);
    TEST_CHECK(ok.last.ok());
    TEST_CHECK(ok.last.endpoint == "GetProducts");
    TEST_CHECK(ok.last.payload == R"([{"ProductId":1}])");

    TEST_CHECK(c.resolve(reply_to(wire.frames[1], json::ndax::generic_rejected("Order not found"))));
    TEST_CHECK(rejected.calls == 1);
    TEST_CHECK(rejected.last.status == Status::Rejected);
    TEST_CHECK(rejected.last.reason == "Order not found");

    Codec codec;
    Frame err;
    TEST_CHECK(codec.decode(json::ndax::error(wire.frames[2].sequence, "SendOrder", "Not Authorized"), err) == DecodeError::None);
    TEST_CHECK(c.resolve(err));
    TEST_CHECK(error.calls == 1);
    TEST_CHECK(error.last.status == Status::ServerError);
    TEST_CHECK(error.last.reason == "Not Authorized");

    // A generic "result":true is a success
    Sink generic;
    c.submit("LogOut", "{}", 1000ms, generic.completion());
    (void)c.flush(true, std::ref(wire));
    TEST_CHECK(c.resolve(reply_to(wire.frames[3], json::ndax::generic_ok())));
    TEST_CHECK(generic.last.ok());

    // Duplicate reply: nobody waits for it anymore
    TEST_CHECK(!c.resolve(reply_to(wire.frames[0], "[]")));
    TEST_CHECK(ok.calls == 1);
    TEST_CHECK(t.unmatched_replies_total.load() == 1);
    TEST_CHECK(c.pending() == 0);

    std::cout << "[TEST] OK\n";
}

void test_timeout_then_late_reply() {
    std::cout << "[TEST] timeout then late reply\n";
    telemetry::Session t;
    Correlator c(t);
    Wire wire;

    Sink s;
    const auto seq = c.submit("GetAccountPositions", "{}", 20ms, s.completion());
    (void)c.flush(true, std::ref(wire));

    TEST_CHECK(c.expire(Correlator::clock::now()) == 0);
    TEST_CHECK(c.expire(Correlator::clock::now() + 50ms) == 1);
    TEST_CHECK(s.calls == 1);
    TEST_CHECK(s.last.status == Status::Timeout);
    TEST_CHECK(!c.is_pending(seq));
    TEST_CHECK(t.requests_timed_out_total.load() == 1);

    // The reply shows up afterwards: dropped, counted, no second completion
    TEST_CHECK(!c.resolve(reply_to(wire.frames[0], "[]")));
    TEST_CHECK(s.calls == 1);
    TEST_CHECK(t.unmatched_replies_total.load() == 1);

    std::cout << "[TEST] OK\n";
}

void test_expired_before_send_is_never_sent() {
    std::cout << "[TEST] request expired while queued is never sent\n";
    telemetry::Session t;
    Correlator c(t);
    Wire wire;

    Sink s;
    c.submit("GetOpenOrders", "{}", 10ms, s.completion());
    TEST_CHECK(c.expire(Correlator::clock::now() + 20ms) == 1);
    TEST_CHECK(c.flush(true, std::ref(wire)) == 0);
    TEST_CHECK(wire.frames.empty());
    TEST_CHECK(c.queued() == 0);

    std::cout << "[TEST] OK\n";
}

void test_fail_in_flight() {
    std::cout << "[TEST] connection loss\n";
    telemetry::Session t;
    Correlator c(t);
    Wire wire;

    Sink sent, queued_session, queued_stream, queued_control;
    c.submit("GetProducts", "{}", 1000ms, sent.completion());
    (void)c.flush(true, std::ref(wire));
    const auto survivor = c.submit("GetInstruments", "{}", 1000ms, queued_session.completion());
    c.submit("SubscribeTrades", "{}", 1000ms, queued_stream.completion(), Lane::Stream);
    c.submit("Ping", "{}", 1000ms, queued_control.completion(), Lane::Control);

    TEST_CHECK(c.fail_in_flight(Status::ConnectionLost, "connection lost") == 3);
    TEST_CHECK(sent.last.status == Status::ConnectionLost);
    TEST_CHECK(queued_stream.last.status == Status::ConnectionLost);
    TEST_CHECK(queued_control.last.status == Status::ConnectionLost);
    TEST_CHECK(queued_session.calls == 0);
    TEST_CHECK(c.is_pending(survivor));

    // Only the survivor goes out on the next epoch
    wire.frames.clear();
    TEST_CHECK(c.flush(true, std::ref(wire)) == 1);
    TEST_CHECK(wire.frames[0].sequence == survivor);

    std::cout << "[TEST] OK\n";
}

void test_retired_stream_generation() {
    std::cout << "[TEST] stream submits from a retired generation\n";
    telemetry::Session t;
    Correlator c(t);
    Wire wire;

    // Queued before the retirement: failed by fail_in_flight as usual
    Sink early;
    TEST_CHECK(c.submit("SubscribeLevel1", "{}", 1000ms, early.completion(), Lane::Stream, 0) != 0);

    c.retire_streams(1);
    TEST_CHECK(c.fail_in_flight(Status::ConnectionLost, "connection lost") == 1);
    TEST_CHECK(early.last.status == Status::ConnectionLost);

    // Arrives late: refused at once, never queued
    Sink late;
    TEST_CHECK(c.submit("SubscribeLevel1", "{}", 1000ms, late.completion(), Lane::Stream, 0) == 0);
    TEST_CHECK(late.calls == 1);
    TEST_CHECK(late.last.status == Status::ConnectionLost);
    TEST_CHECK(c.queued() == 0);
    TEST_CHECK(c.pending() == 0);

    // Current generation and other lanes are unaffected
    Sink current, session;
    TEST_CHECK(c.submit("SubscribeLevel1", "{}", 1000ms, current.completion(), Lane::Stream, 1) != 0);
    TEST_CHECK(c.submit("GetProducts", "{}", 1000ms, session.completion()) != 0);
    TEST_CHECK(c.flush(true, std::ref(wire)) == 2);

    // Never moves backwards
    c.retire_streams(0);
    Sink again;
    TEST_CHECK(c.submit("SubscribeTrades", "{}", 1000ms, again.completion(), Lane::Stream, 0) == 0);

    std::cout << "[TEST] OK\n";
}

void test_refused_send_keeps_order() {
    std::cout << "[TEST] refused send keeps frames queued\n";
    telemetry::Session t;
    Correlator c(t);
    Wire wire;

    c.submit("GetProducts", "{}", 1000ms, {});
    c.submit("GetInstruments", "{}", 1000ms, {});

    wire.accept = false;
    TEST_CHECK(c.flush(true, std::ref(wire)) == 0);
    TEST_CHECK(c.queued() == 2);

    wire.accept = true;
    TEST_CHECK(c.flush(true, std::ref(wire)) == 2);
    TEST_CHECK(wire.frames[0].endpoint == "GetProducts");
    TEST_CHECK(wire.frames[1].endpoint == "GetInstruments");

    std::cout << "[TEST] OK\n";
}

void test_shutdown() {
    std::cout << "[TEST] shutdown\n";
    telemetry::Session t;
    Correlator c(t);

    auto f1 = c.submit("GetProducts", "{}", 1000ms);
    auto f2 = c.submit("GetInstruments", "{}", 1000ms);
    c.shutdown();
    TEST_CHECK(c.fail_all(Status::ShuttingDown, "session stopped") == 2);
    TEST_CHECK(f1.get().status == Status::ShuttingDown);
    TEST_CHECK(f2.get().status == Status::ShuttingDown);

    // Late submit resolves inline
    Sink s;
    TEST_CHECK(c.submit("GetProducts", "{}", 1000ms, s.completion()) == 0);
    TEST_CHECK(s.calls == 1);
    TEST_CHECK(s.last.status == Status::ShuttingDown);
    TEST_CHECK(c.pending() == 0);
    TEST_CHECK(c.queued() == 2);   // dead frames are discarded by the next flush

    Wire wire;
    TEST_CHECK(c.flush(true, std::ref(wire)) == 0);
    TEST_CHECK(c.queued() == 0);

    std::cout << "[TEST] OK\n";
}

void test_concurrent_submitters() {
    std::cout << "[TEST] concurrent submitters get unique sequence numbers\n";
    telemetry::Session t;
    Correlator c(t);

    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 250;

    std::mutex m;
    std::vector<std::uint64_t> seqs;
    std::vector<std::thread> workers;
    for (int i = 0; i < THREADS; ++i) {
        workers.emplace_back([&] {
            std::vector<std::uint64_t> local;
            for (int k = 0; k < PER_THREAD; ++k) {
                local.push_back(c.submit("GetProducts", "{}", 1000ms, {}));
            }
            std::lock_guard lock(m);
            seqs.insert(seqs.end(), local.begin(), local.end());
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    const std::set<std::uint64_t> unique(seqs.begin(), seqs.end());
    TEST_CHECK(unique.size() == THREADS * PER_THREAD);
    for (auto s : unique) {
        TEST_CHECK(s >= 2 && s % 2 == 0);
    }
    TEST_CHECK(c.pending() == THREADS * PER_THREAD);
    TEST_CHECK(t.requests_submitted_total.load() == THREADS * PER_THREAD);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Warn);

    test_sequence_and_lanes();
    test_reply_classification();
    test_timeout_then_late_reply();
    test_expired_before_send_is_never_sent();
    test_fail_in_flight();
    test_retired_stream_generation();
    test_refused_send_keeps_order();
    test_shutdown();
    test_concurrent_submitters();

    std::cout << "\n[CORRELATOR TESTS PASSED]\n";
    return 0;
}
