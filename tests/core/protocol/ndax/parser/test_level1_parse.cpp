#include <iostream>
#include <string_view>

#include "ndaxlink/core/protocol/ndax/parser/level1.hpp"
#include "core/protocol/ndax/parser/parser.hpp"

using namespace ndaxlink::core::protocol::ndax;
using tests::protocol::ndax::parser::parse_root;


/*
================================================================================
Level1UpdateEvent Parser - Unit Tests
================================================================================
*/

void test_level1_full_update() {
    std::cout << "[TEST] Level1 update parser (full payload)..." << std::endl;

    constexpr std::string_view json = R"json(
    {
        "OMSId": 1,
        "InstrumentId": 7,
        "BestBid": 61234.5,
        "BestOffer": 61240.25,
        "LastTradedPx": 61238.0,
        "LastTradedQty": 0.0125,
        "LastTradeTime": 1700000000123,
        "SessionOpen": 60000,
        "SessionHigh": 62000,
        "SessionLow": 59500,
        "SessionClose": 61238,
        "Volume": 0.0125,
        "CurrentDayVolume": 12.5,
        "CurrentDayNumTrades": 345,
        "CurrentDayPxChange": -12.5,
        "Rolling24HrVolume": 20.75,
        "Rolling24HrNumTrades": 512,
        "Rolling24HrPxChange": 1.25,
        "TimeStamp": "1700000000456"
    }
    )json";

    simdjson::dom::parser p;
    const auto root = parse_root(p, json);

    schema::level1::Update u;
    TEST_CHECK(parser::level1::update::parse(root, u) == parser::Result::Parsed);

    TEST_CHECK(u.oms_id == 1);
    TEST_CHECK(u.instrument_id == 7);
    TEST_CHECK(u.best_bid == 61234.5);
    TEST_CHECK(u.best_offer == 61240.25);
    TEST_CHECK(u.last_traded_px == 61238.0);
    TEST_CHECK(u.last_trade_time == 1700000000123ULL);
    TEST_CHECK(u.session_low == 59500.0);
    TEST_CHECK(u.current_day_num_trades == 345);
    TEST_CHECK(u.current_day_px_change == -12.5);
    TEST_CHECK(u.rolling_24hr_num_trades == 512);
    // Serialized as a string by the gateway
    TEST_CHECK(u.timestamp == 1700000000456ULL);

    std::cout << "[TEST] OK\n";
}

void test_level1_minimal_update() {
    std::cout << "[TEST] Level1 update parser (optional fields absent or null)..." << std::endl;

    constexpr std::string_view json = R"json(
        {"InstrumentId": 3, "BestBid": 0, "BestOffer": 1.5, "LastTradedPx": null}
    )json";

    simdjson::dom::parser p;
    const auto root = parse_root(p, json);

    schema::level1::Update u;
    TEST_CHECK(parser::level1::update::parse(root, u) == parser::Result::Parsed);
    TEST_CHECK(u.instrument_id == 3);
    TEST_CHECK(u.best_bid == 0.0);
    TEST_CHECK(u.best_offer == 1.5);
    TEST_CHECK(u.last_traded_px == 0.0);
    TEST_CHECK(u.timestamp == 0);

    std::cout << "[TEST] OK\n";
}

void test_level1_rejects_invalid() {
    std::cout << "[TEST] Level1 update parser (invalid payloads)..." << std::endl;

    simdjson::dom::parser p;
    schema::level1::Update u;

    // Not an object
    TEST_CHECK(parser::level1::update::parse(parse_root(p, "[1,2,3]"), u) != parser::Result::Parsed);

    // Missing InstrumentId
    TEST_CHECK(parser::level1::update::parse(parse_root(p, R"({"BestBid":1,"BestOffer":2})"), u) == parser::Result::InvalidSchema);

    // Missing BestOffer
    TEST_CHECK(parser::level1::update::parse(parse_root(p, R"({"InstrumentId":1,"BestBid":1})"), u) == parser::Result::InvalidSchema);

    // Wrong type
    TEST_CHECK(parser::level1::update::parse(parse_root(p, R"({"InstrumentId":"1","BestBid":1,"BestOffer":2})"), u) == parser::Result::InvalidSchema);
    TEST_CHECK(parser::level1::update::parse(parse_root(p, R"({"InstrumentId":1,"BestBid":1,"BestOffer":2,"Volume":"x"})"), u) == parser::Result::InvalidSchema);

    // Digit string expected
    TEST_CHECK(parser::level1::update::parse(parse_root(p, R"({"InstrumentId":1,"BestBid":1,"BestOffer":2,"TimeStamp":"12a"})"), u) == parser::Result::InvalidValue);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_level1_full_update();
    test_level1_minimal_update();
    test_level1_rejects_invalid();

    std::cout << "\n[LEVEL1 PARSER TESTS PASSED]\n";
    return 0;
}
