#include <iostream>
#include <string_view>

#include "ndaxlink/core/protocol/ndax/parser/level2.hpp"
#include "ndaxlink/core/protocol/ndax/parser/trade.hpp"
#include "ndaxlink/core/protocol/ndax/parser/ticker.hpp"
#include "core/protocol/ndax/parser/parser.hpp"

using namespace ndaxlink::core::protocol::ndax;
using tests::protocol::ndax::parser::parse_root;


/*
================================================================================
Row-array Market Data Parsers - Unit Tests
================================================================================

Level2UpdateEvent, TradeDataUpdateEvent and TickerDataUpdateEvent (and the
matching subscribe replies) carry positional rows, one instrument per message.
================================================================================
*/

// -----------------------------------------------------------------------------
// Level 2
// -----------------------------------------------------------------------------

void test_level2_snapshot() {
    std::cout << "[TEST] Level2 parser (snapshot rows)..." << std::endl;

    constexpr std::string_view json = R"json(
    [
        [101, 1, 1700000000000, 0, 61238.0, 2, 61230.5, 7, 0.75, 0],
        [102, 1, 1700000000001, 1, 61238.0, 1, 61245.0, 7, 1.5, 1],
        [103, 1, 1700000000002, 2, 61238.0, 0, 61250.0, 7, 0, 1]
    ]
    )json";

    simdjson::dom::parser p;
    schema::level2::Snapshot s;
    TEST_CHECK(parser::level2::snapshot::parse(parse_root(p, json), s) == parser::Result::Parsed);

    TEST_CHECK(s.instrument_id == 7);
    TEST_CHECK(s.entries.size() == 3);
    TEST_CHECK(s.entries[0].md_update_id == 101);
    TEST_CHECK(s.entries[0].action == BookAction::New);
    TEST_CHECK(s.entries[0].side == Side::Buy);
    TEST_CHECK(s.entries[0].price == 61230.5);
    TEST_CHECK(s.entries[0].quantity == 0.75);
    TEST_CHECK(s.entries[1].action == BookAction::Update);
    TEST_CHECK(s.entries[1].side == Side::Sell);
    TEST_CHECK(s.entries[2].action == BookAction::Delete);
    TEST_CHECK(s.entries[2].action_date_time == 1700000000002LL);

    std::cout << "[TEST] OK\n";
}

void test_level2_rejects_invalid() {
    std::cout << "[TEST] Level2 parser (invalid payloads)..." << std::endl;

    simdjson::dom::parser p;
    schema::level2::Snapshot s;

    // Empty array: parsed, nothing in it
    TEST_CHECK(parser::level2::snapshot::parse(parse_root(p, "[]"), s) == parser::Result::Parsed);
    TEST_CHECK(s.entries.empty());

    // Not an array
    TEST_CHECK(parser::level2::snapshot::parse(parse_root(p, R"({"a":1})"), s) != parser::Result::Parsed);

    // Short row
    TEST_CHECK(parser::level2::snapshot::parse(parse_root(p, "[[1,1,1,0,1.0,1,1.0,7,1.0]]"), s) == parser::Result::InvalidSchema);

    // Wrong type in a row
    TEST_CHECK(parser::level2::snapshot::parse(parse_root(p, R"([[1,1,1,0,1.0,1,"1.0",7,1.0,0]])"), s) == parser::Result::InvalidSchema);

    // Mixed instruments
    TEST_CHECK(parser::level2::snapshot::parse(parse_root(p,
        "[[1,1,1,0,1.0,1,1.0,7,1.0,0],[2,1,1,0,1.0,1,1.0,8,1.0,0]]"), s) == parser::Result::InvalidValue);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Trades
// -----------------------------------------------------------------------------

void test_trade_batch() {
    std::cout << "[TEST] Trade parser (batch rows)..." << std::endl;

    constexpr std::string_view json = R"json(
    [
        [9001, 7, 0.01, 61238.0, 555, 556, 1700000000000, 1, 0, false, 0],
        [9002, 7, 0.02, 61239.5, 557, 558, 1700000000100, 2, 1, 1],
        [9003, 7, 0.03, 61237.0, 559, 560, 1700000000200, 0, 1]
    ]
    )json";

    simdjson::dom::parser p;
    schema::trade::Batch b;
    TEST_CHECK(parser::trade::batch::parse(parse_root(p, json), b) == parser::Result::Parsed);

    TEST_CHECK(b.instrument_id == 7);
    TEST_CHECK(b.trades.size() == 3);
    TEST_CHECK(b.trades[0].trade_id == 9001);
    TEST_CHECK(b.trades[0].price == 61238.0);
    TEST_CHECK(b.trades[0].taker_side == Side::Buy);
    TEST_CHECK(b.trades[0].block_trade == false);
    TEST_CHECK(b.trades[1].direction == 2);
    TEST_CHECK(b.trades[1].taker_side == Side::Sell);
    TEST_CHECK(b.trades[1].block_trade == true);     // 0/1 flag
    TEST_CHECK(b.trades[2].block_trade == false);    // absent
    TEST_CHECK(b.trades[2].trade_time == 1700000000200LL);

    std::cout << "[TEST] OK\n";
}

void test_trade_rejects_invalid() {
    std::cout << "[TEST] Trade parser (invalid payloads)..." << std::endl;

    simdjson::dom::parser p;
    schema::trade::Batch b;

    TEST_CHECK(parser::trade::batch::parse(parse_root(p, "[]"), b) == parser::Result::Parsed);
    TEST_CHECK(b.trades.empty());
    TEST_CHECK(parser::trade::batch::parse(parse_root(p, "[[1,7,0.1,1.0,1,2,3,0]]"), b) == parser::Result::InvalidSchema);
    TEST_CHECK(parser::trade::batch::parse(parse_root(p, "[[1,7,0.1,1.0,1,2,3,0,0,7]]"), b) == parser::Result::InvalidSchema);
    TEST_CHECK(parser::trade::batch::parse(parse_root(p,
        "[[1,7,0.1,1.0,1,2,3,0,0],[2,9,0.1,1.0,1,2,3,0,0]]"), b) == parser::Result::InvalidValue);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Ticker
// -----------------------------------------------------------------------------

void test_ticker_batch() {
    std::cout << "[TEST] Ticker parser (bars)..." << std::endl;

    constexpr std::string_view json = R"json(
    [
        [1700000060000, 61300.0, 61200.0, 61250.0, 61280.0, 1.5, 61279.0, 61281.0, 7],
        [1700000120000, 61350.0, 61270.0, 61280.0, 61340.0, 2.25, 61339.0, 61341.0, 7, 60]
    ]
    )json";

    simdjson::dom::parser p;
    schema::ticker::Batch b;
    TEST_CHECK(parser::ticker::batch::parse(parse_root(p, json), b) == parser::Result::Parsed);

    TEST_CHECK(b.instrument_id == 7);
    TEST_CHECK(b.bars.size() == 2);
    TEST_CHECK(b.bars[0].end_date_time == 1700000060000LL);
    TEST_CHECK(b.bars[0].high == 61300.0);
    TEST_CHECK(b.bars[0].low == 61200.0);
    TEST_CHECK(b.bars[1].volume == 2.25);
    TEST_CHECK(b.bars[1].inside_ask == 61341.0);

    TEST_CHECK(parser::ticker::batch::parse(parse_root(p, "[[1,2,3,4,5,6,7,8]]"), b) == parser::Result::InvalidSchema);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_level2_snapshot();
    test_level2_rejects_invalid();
    test_trade_batch();
    test_trade_rejects_invalid();
    test_ticker_batch();

    std::cout << "\n[MARKET DATA PARSER TESTS PASSED]\n";
    return 0;
}
