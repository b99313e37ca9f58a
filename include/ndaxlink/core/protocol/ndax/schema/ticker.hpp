#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <ostream>

#include "ndaxlink/core/protocol/ndax/enums.hpp"
#include "lcr/json.hpp"


namespace ndaxlink::core::protocol::ndax::schema::ticker {

// SubscribeTicker / UnsubscribeTicker
// {"OMSId":1,"InstrumentId":7,"Interval":60,"IncludeLastCount":100}
struct Subscribe {
    std::uint64_t instrument_id{0};
    std::uint64_t interval{60};             // seconds per bar
    std::uint64_t include_last_count{100};

    std::string to_json() const {
        std::string j;
        j.reserve(88);
        j += "{\"OMSId\":";
        lcr::json::append(j, OMS_ID);
        j += ",\"InstrumentId\":";
        lcr::json::append(j, instrument_id);
        j += ",\"Interval\":";
        lcr::json::append(j, interval);
        j += ",\"IncludeLastCount\":";
        lcr::json::append(j, include_last_count);
        j += "}";
        return j;
    }
};

using Unsubscribe = Subscribe;

// GetTickerHistory
// {"OMSId":1,"InstrumentId":7,"Interval":60,"FromDate":"2024-01-01T00:00:00","ToDate":"..."}
struct History {
    std::uint64_t instrument_id{0};
    std::uint64_t interval{60};
    std::string from_date;      // ISO 8601, gateway-local
    std::string to_date;

    std::string to_json() const {
        std::string j;
        j.reserve(128 + from_date.size() + to_date.size());
        j += "{\"OMSId\":";
        lcr::json::append(j, OMS_ID);
        j += ",\"InstrumentId\":";
        lcr::json::append(j, instrument_id);
        j += ",\"Interval\":";
        lcr::json::append(j, interval);
        j += ",\"FromDate\":";
        lcr::json::append_string(j, from_date);
        j += ",\"ToDate\":";
        lcr::json::append_string(j, to_date);
        j += "}";
        return j;
    }
};


// ===============================================
// BAR (one row of TickerDataUpdateEvent)
// ===============================================
// [EndDateTime, High, Low, Open, Close, Volume, InsideBidPrice,
//  InsideAskPrice, InstrumentId, ...]
struct Bar {
    std::int64_t end_date_time{0};  // ms since epoch
    double high{0};
    double low{0};
    double open{0};
    double close{0};
    double volume{0};
    double inside_bid{0};
    double inside_ask{0};
    std::uint64_t instrument_id{0};
};

inline constexpr std::size_t BAR_MIN_FIELDS = 9;
inline constexpr std::size_t BAR_INSTRUMENT_INDEX = 8;

struct Batch {
    std::uint64_t instrument_id{0};
    std::vector<Bar> bars;
};

inline std::ostream& operator<<(std::ostream& os, const Batch& b) {
    return os << "[TICKER " << b.instrument_id << "] " << b.bars.size() << " bar(s)";
}

} // namespace ndaxlink::core::protocol::ndax::schema::ticker
