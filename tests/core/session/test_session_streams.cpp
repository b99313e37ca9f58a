/*
===============================================================================
 core::Session - Stream Unit Tests
===============================================================================

Covered Requirements:
---------------------
S1. Subscribing before login produces exactly one Subscribe frame, sent
    after authentication
S2. After a reconnect and re-login every subscription is replayed exactly
    once; the subscribe reply carries the initial snapshot
S3. Events reach the handler in arrival order
S4. unsubscribe() sends the Unsubscribe call and stops delivery
S5. Undecodable frames are dropped and reported, the session carries on
S6. Keep-alive pings are answered through the request path
S7. Several live keys across feeds are each replayed exactly once after a
    reconnect; a key unsubscribed before the drop is not replayed
S8. A subscribe request minted before a disconnect and submitted after it
    is refused; only the replay reaches the gateway
===============================================================================
*/

#include <iostream>
#include <chrono>
#include <string>
#include <vector>

#include "common/harness/session.hpp"

using test::SessionHarness;
using test::harness::is_ready;
using namespace std::chrono_literals;


// -----------------------------------------------------------------------------
// S1: deferred until authenticated
// -----------------------------------------------------------------------------
void test_subscribe_before_login() {
    std::cout << "[TEST] S1: subscribe before login\n";
    SessionHarness h;

    const auto id = h.session.subscribe_level1(7, [](const schema::level1::Update&) {});
    TEST_CHECK(id != 0);
    TEST_CHECK(h.session.subscriptions() == 1);

    auto f = h.start();
    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel1) == 0);

    h.reply(h.last_sent(endpoint::AuthenticateUser).value(), json::ndax::auth_ok());
    TEST_CHECK(f.get().ok());

    auto req = h.last_sent(endpoint::SubscribeLevel1);
    TEST_CHECK(req.has());
    TEST_CHECK(req.value().type == MessageType::Request);
    TEST_CHECK(req.value().payload == R"({"OMSId":1,"InstrumentId":7})");

    h.drain();
    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel1) == 1);
    TEST_CHECK(h.session.telemetry().subscriptions_replayed_total.load() == 1);

    // Same key again: same id, nothing new on the wire
    const auto again = h.session.subscribe_level1(7, [](const schema::level1::Update&) {});
    h.drain();
    TEST_CHECK(again == id);
    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel1) == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S2: replay after reconnect
// -----------------------------------------------------------------------------
void test_replay_after_reconnect() {
    std::cout << "[TEST] S2: replay after reconnect\n";
    SessionHarness h;

    std::vector<double> bids;
    TEST_CHECK(h.login().ok());
    (void)h.session.subscribe_level1(7, [&](const schema::level1::Update& u) {
        bids.push_back(u.best_bid);
    });
    h.drain();
    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel1) == 1);

    // Snapshot in the subscribe reply
    h.reply(h.last_sent(endpoint::SubscribeLevel1).value(), json::ndax::level1(7, 9, 10));
    TEST_CHECK(bids.size() == 1);

    h.force_reconnect();
    TEST_CHECK(h.session.transport_epoch() == 2);
    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel1) == 1);     // not before the new login

    h.reply(h.last_sent(endpoint::AuthenticateUser).value(), json::ndax::auth_ok("tok-2"));
    TEST_CHECK(h.session.is_authenticated());
    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel1) == 2);

    h.drain();
    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel1) == 2);
    TEST_CHECK(h.session.subscriptions() == 1);

    h.reply(h.last_sent(endpoint::SubscribeLevel1).value(), json::ndax::level1(7, 20, 21));
    TEST_CHECK((bids == std::vector<double>{9, 20}));

    // A second reconnect replays once more, never twice
    h.force_reconnect();
    h.reply(h.last_sent(endpoint::AuthenticateUser).value(), json::ndax::auth_ok("tok-3"));
    h.drain();
    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel1) == 3);
    TEST_CHECK(h.session.telemetry().subscriptions_replayed_total.load() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S3: ordered delivery
// -----------------------------------------------------------------------------
void test_events_in_order() {
    std::cout << "[TEST] S3: events in arrival order\n";
    SessionHarness h;

    std::vector<double> bids;
    std::vector<std::uint64_t> trade_ids;
    (void)h.session.subscribe_level1(7, [&](const schema::level1::Update& u) {
        TEST_CHECK(u.instrument_id == 7);
        bids.push_back(u.best_bid);
    });
    (void)h.session.subscribe_trades(7, [&](const schema::trade::Batch& b) {
        for (const auto& t : b.trades) {
            trade_ids.push_back(t.trade_id);
        }
    });
    TEST_CHECK(h.login().ok());

    // Several frames land in one poll
    for (double bid : {10.0, 11.0, 12.0}) {
        h.session.ws().emit_message(json::ndax::event(endpoint::Level1UpdateEvent, json::ndax::level1(7, bid, bid + 1)));
    }
    h.session.ws().emit_message(json::ndax::event(endpoint::TradeDataUpdateEvent,
        "[[501,7,0.1,65000,1,2,1700000000000,0,0,0,0],[502,7,0.2,65001,3,4,1700000000001,1,0,0,0]]"));
    h.drain();

    TEST_CHECK((bids == std::vector<double>{10, 11, 12}));
    TEST_CHECK((trade_ids == std::vector<std::uint64_t>{501, 502}));

    // Another instrument: valid but unrouted
    h.push_event(endpoint::Level1UpdateEvent, json::ndax::level1(8, 1, 2));
    TEST_CHECK(bids.size() == 3);
    TEST_CHECK(h.session.telemetry().unmatched_events_total.load() == 1);
    TEST_CHECK(h.session.telemetry().events_delivered_total.load() == 4);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S4: unsubscribe
// -----------------------------------------------------------------------------
void test_unsubscribe() {
    std::cout << "[TEST] S4: unsubscribe\n";
    SessionHarness h;
    TEST_CHECK(h.login().ok());

    int updates = 0;
    const auto id = h.session.subscribe_level2(7, [&](const schema::level2::Snapshot&) { ++updates; }, 20);
    h.drain();
    auto sub = h.last_sent(endpoint::SubscribeLevel2);
    TEST_CHECK(sub.has());
    TEST_CHECK(sub.value().payload == R"({"OMSId":1,"InstrumentId":7,"Depth":20})");

    TEST_CHECK(h.session.unsubscribe(id));
    h.drain();
    auto unsub = h.last_sent(endpoint::UnsubscribeLevel2);
    TEST_CHECK(unsub.has());
    TEST_CHECK(unsub.value().payload == sub.value().payload);
    TEST_CHECK(h.session.subscriptions() == 0);

    // Unknown now
    TEST_CHECK(!h.session.unsubscribe(id));

    // Stale event racing the unsubscribe is dropped quietly
    h.push_event(endpoint::Level2UpdateEvent, "[[101,1,1700000000000,0,65000,1,65000,7,0.25,0]]");
    TEST_CHECK(updates == 0);
    TEST_CHECK(h.session.telemetry().unmatched_events_total.load() == 1);

    // Account events: subscribe goes out, unsubscribe is local only
    const auto account = h.session.subscribe_account_events([](const schema::account::Event&) {});
    h.drain();
    TEST_CHECK(h.count_sent(endpoint::SubscribeAccountEvents) == 1);
    TEST_CHECK(h.session.unsubscribe(account));
    h.drain();
    TEST_CHECK(h.session.subscriptions() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S5: decode errors
// -----------------------------------------------------------------------------
void test_decode_error_reported() {
    std::cout << "[TEST] S5: undecodable frame\n";

    std::vector<std::string> codes;
    auto cfg = test::harness::default_config();
    cfg.error_handler = [&](std::string_view code, std::string_view) {
        codes.emplace_back(code);
    };
    SessionHarness h(cfg);
    TEST_CHECK(h.login().ok());

    h.push_raw("this is not json");
    h.push_raw(R"({"m":3,"i":0,"n":"Level1UpdateEvent"})");

    TEST_CHECK(codes.size() == 2);
    TEST_CHECK(codes[0] == "decode");
    TEST_CHECK(codes[1] == "decode");
    TEST_CHECK(h.session.telemetry().decode_errors_total.load() == 2);
    TEST_CHECK(h.session.is_authenticated());

    // A well-formed envelope around an unusable event payload
    h.push_raw(R"({"m":3,"i":0,"n":"Level1UpdateEvent","o":"{\"InstrumentId\":"})");
    TEST_CHECK(codes.size() == 3);
    TEST_CHECK(codes[2] == "event");
    TEST_CHECK(h.session.telemetry().decode_errors_total.load() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S6: keep-alive
// -----------------------------------------------------------------------------
void test_ping_pong() {
    std::cout << "[TEST] S6: keep-alive ping\n";

    auto cfg = test::harness::default_config();
    cfg.keepalive.ping_interval = 60000ms;
    cfg.keepalive.pong_grace = 60000ms;
    SessionHarness h(cfg);
    TEST_CHECK(h.login().ok());
    TEST_CHECK(h.count_sent(endpoint::Ping) == 0);

    h.session.connection().force_last_pong(std::chrono::steady_clock::now() - 120s);
    h.drain();

    auto ping = h.last_sent(endpoint::Ping);
    TEST_CHECK(ping.has());
    TEST_CHECK(ping.value().payload == "{}");
    TEST_CHECK(h.count_sent(endpoint::Ping) == 1);     // one outstanding ping at a time

    h.reply(ping.value(), json::ndax::pong());
    TEST_CHECK(h.session.connection_telemetry().pongs_observed_total.load() == 1);
    TEST_CHECK(h.session.transport_epoch() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S7: multi-key replay
// -----------------------------------------------------------------------------

// Frames sent to `name` whose payload contains `needle`
static std::size_t count_sent_with(SessionHarness& h, std::string_view name, std::string_view needle) {
    std::size_t n = 0;
    for (const auto& f : h.sent()) {
        if (f.endpoint == name && f.payload.find(needle) != std::string::npos) {
            ++n;
        }
    }
    return n;
}

void test_replay_many_keys() {
    std::cout << "[TEST] S7: replay of several keys across feeds\n";
    SessionHarness h;
    TEST_CHECK(h.login().ok());

    int l1_seven = 0;
    int l1_eight = 0;
    (void)h.session.subscribe_level1(7, [&](const schema::level1::Update&) { ++l1_seven; });
    (void)h.session.subscribe_level1(8, [&](const schema::level1::Update&) { ++l1_eight; });
    (void)h.session.subscribe_trades(7, [](const schema::trade::Batch&) {});
    (void)h.session.subscribe_account_events([](const schema::account::Event&) {});
    const auto dropped = h.session.subscribe_level2(9, [](const schema::level2::Snapshot&) {});
    h.drain();

    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel1) == 2);
    TEST_CHECK(h.count_sent(endpoint::SubscribeTrades) == 1);
    TEST_CHECK(h.count_sent(endpoint::SubscribeAccountEvents) == 1);
    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel2) == 1);

    TEST_CHECK(h.session.unsubscribe(dropped));
    h.drain();
    TEST_CHECK(h.count_sent(endpoint::UnsubscribeLevel2) == 1);
    TEST_CHECK(h.session.subscriptions() == 4);

    // Only what the new transport carries from here on
    WebSocketUnderTest::clear_sent();
    h.force_reconnect();
    TEST_CHECK(h.session.transport_epoch() == 2);
    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel1) == 0);

    h.reply(h.last_sent(endpoint::AuthenticateUser).value(), json::ndax::auth_ok("tok-2"));
    h.drain();

    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel1) == 2);
    TEST_CHECK(count_sent_with(h, endpoint::SubscribeLevel1, R"("InstrumentId":7)") == 1);
    TEST_CHECK(count_sent_with(h, endpoint::SubscribeLevel1, R"("InstrumentId":8)") == 1);
    TEST_CHECK(h.count_sent(endpoint::SubscribeTrades) == 1);
    TEST_CHECK(h.count_sent(endpoint::SubscribeAccountEvents) == 1);
    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel2) == 0);
    TEST_CHECK(h.count_sent(endpoint::UnsubscribeLevel2) == 0);
    TEST_CHECK(h.session.telemetry().subscriptions_replayed_total.load() == 4);

    // Both level1 keys route again
    h.push_event(endpoint::Level1UpdateEvent, json::ndax::level1(7, 1, 2));
    h.push_event(endpoint::Level1UpdateEvent, json::ndax::level1(8, 3, 4));
    TEST_CHECK(l1_seven == 1);
    TEST_CHECK(l1_eight == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S8: subscribe request racing a disconnect
// -----------------------------------------------------------------------------
void test_stale_subscribe_refused() {
    std::cout << "[TEST] S8: subscribe minted before a disconnect\n";
    SessionHarness h;
    TEST_CHECK(h.login().ok());

    // A subscriber thread has its wire request in hand...
    auto reg = h.session.registry().subscribe({subscription::Feed::Level1, 7},
                                              R"({"OMSId":1,"InstrumentId":7})",
                                              [](const subscription::Payload&) {});
    TEST_CHECK(reg.wire.has());
    const auto wire = reg.wire.take();

    // ...when the dispatch thread handles the drop and reconnects
    h.force_reconnect();
    TEST_CHECK(h.session.registry().generation() > wire.generation);

    bool called = false;
    Status status = Status::Ok;
    const auto seq = h.session.correlator().submit(wire.endpoint, wire.payload, 1000ms,
        [&](Response&& r) {
            called = true;
            status = r.status;
        },
        Lane::Stream, wire.generation);
    TEST_CHECK(seq == 0);
    TEST_CHECK(called);
    TEST_CHECK(status == Status::ConnectionLost);

    h.reply(h.last_sent(endpoint::AuthenticateUser).value(), json::ndax::auth_ok("tok-2"));
    h.drain();
    TEST_CHECK(h.count_sent(endpoint::SubscribeLevel1) == 1);      // the replay only
    TEST_CHECK(h.session.subscriptions() == 1);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_subscribe_before_login();
    test_replay_after_reconnect();
    test_events_in_order();
    test_unsubscribe();
    test_decode_error_reported();
    test_ping_pong();
    test_replay_many_keys();
    test_stale_subscribe_refused();

    std::cout << "\n[SESSION STREAM TESTS PASSED]\n";
    return 0;
}
