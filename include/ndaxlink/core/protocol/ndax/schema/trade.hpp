#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <ostream>

#include "ndaxlink/core/protocol/ndax/enums.hpp"
#include "lcr/json.hpp"


namespace ndaxlink::core::protocol::ndax::schema::trade {

// SubscribeTrades / UnsubscribeTrades
// {"OMSId":1,"InstrumentId":7,"IncludeLastCount":100}
struct Subscribe {
    std::uint64_t instrument_id{0};
    std::uint64_t include_last_count{100};

    std::string to_json() const {
        std::string j;
        j.reserve(72);
        j += "{\"OMSId\":";
        lcr::json::append(j, OMS_ID);
        j += ",\"InstrumentId\":";
        lcr::json::append(j, instrument_id);
        j += ",\"IncludeLastCount\":";
        lcr::json::append(j, include_last_count);
        j += "}";
        return j;
    }
};

using Unsubscribe = Subscribe;


// ===============================================
// TRADE (one row of TradeDataUpdateEvent)
// ===============================================
// [TradeId, InstrumentId, Quantity, Price, Order1, Order2, TradeTime,
//  Direction, TakerSide, BlockTrade, ...]
struct Trade {
    std::uint64_t trade_id{0};
    std::uint64_t instrument_id{0};
    double quantity{0};
    double price{0};
    std::uint64_t order1{0};
    std::uint64_t order2{0};
    std::int64_t trade_time{0};     // ms since epoch
    std::int64_t direction{0};      // 0 no change, 1 uptick, 2 downtick
    Side taker_side{Side::Unknown};
    bool block_trade{false};
};

inline constexpr std::size_t TRADE_MIN_FIELDS = 9;
inline constexpr std::size_t TRADE_INSTRUMENT_INDEX = 1;

struct Batch {
    std::uint64_t instrument_id{0};
    std::vector<Trade> trades;
};

inline std::ostream& operator<<(std::ostream& os, const Batch& b) {
    return os << "[TRADES " << b.instrument_id << "] " << b.trades.size() << " trade(s)";
}

} // namespace ndaxlink::core::protocol::ndax::schema::trade
