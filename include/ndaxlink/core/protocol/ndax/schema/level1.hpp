#pragma once

#include <cstdint>
#include <string>
#include <ostream>

#include "ndaxlink/core/protocol/ndax/enums.hpp"
#include "lcr/json.hpp"


namespace ndaxlink::core::protocol::ndax::schema::level1 {

// SubscribeLevel1 / UnsubscribeLevel1 / GetLevel1
// {"OMSId":1,"InstrumentId":7,"Symbol":""}
struct Subscribe {
    std::uint64_t instrument_id{0};
    std::string symbol;

    std::string to_json() const {
        std::string j;
        j.reserve(64 + symbol.size());
        j += "{\"OMSId\":";
        lcr::json::append(j, OMS_ID);
        j += ",\"InstrumentId\":";
        lcr::json::append(j, instrument_id);
        j += ",\"Symbol\":";
        lcr::json::append_string(j, symbol);
        j += "}";
        return j;
    }
};

using Unsubscribe = Subscribe;

// GetLevel1 {"OMSId":1,"InstrumentId":7}
struct Get {
    std::uint64_t instrument_id{0};

    std::string to_json() const {
        std::string j;
        j.reserve(40);
        j += "{\"OMSId\":";
        lcr::json::append(j, OMS_ID);
        j += ",\"InstrumentId\":";
        lcr::json::append(j, instrument_id);
        j += "}";
        return j;
    }
};


// ===============================================
// LEVEL 1 UPDATE (Level1UpdateEvent, SubscribeLevel1 / GetLevel1 reply)
// ===============================================
struct Update {
    std::uint64_t oms_id{0};
    std::uint64_t instrument_id{0};
    double best_bid{0};
    double best_offer{0};
    double last_traded_px{0};
    double last_traded_qty{0};
    std::uint64_t last_trade_time{0};       // ms since epoch
    double session_open{0};
    double session_high{0};
    double session_low{0};
    double session_close{0};
    double volume{0};
    double current_day_volume{0};
    std::uint64_t current_day_num_trades{0};
    double current_day_px_change{0};
    double rolling_24hr_volume{0};
    std::uint64_t rolling_24hr_num_trades{0};
    double rolling_24hr_px_change{0};
    std::uint64_t timestamp{0};             // ms since epoch
};

inline std::ostream& operator<<(std::ostream& os, const Update& u) {
    return os << "[L1 " << u.instrument_id << "] bid=" << u.best_bid << " ask=" << u.best_offer
              << " last=" << u.last_traded_px << " qty=" << u.last_traded_qty << " ts=" << u.timestamp;
}

} // namespace ndaxlink::core::protocol::ndax::schema::level1
