#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <ostream>

#include "ndaxlink/core/protocol/ndax/enums.hpp"
#include "lcr/json.hpp"


namespace ndaxlink::core::protocol::ndax::schema::level2 {

// SubscribeLevel2 / UnsubscribeLevel2 / GetL2Snapshot
// {"OMSId":1,"InstrumentId":7,"Depth":10}
struct Subscribe {
    std::uint64_t instrument_id{0};
    std::uint64_t depth{10};

    std::string to_json() const {
        std::string j;
        j.reserve(56);
        j += "{\"OMSId\":";
        lcr::json::append(j, OMS_ID);
        j += ",\"InstrumentId\":";
        lcr::json::append(j, instrument_id);
        j += ",\"Depth\":";
        lcr::json::append(j, depth);
        j += "}";
        return j;
    }
};

using Unsubscribe = Subscribe;
using GetSnapshot = Subscribe;


// ===============================================
// LEVEL 2 ENTRY (one row of Level2UpdateEvent)
// ===============================================
// [MDUpdateId, Accounts, ActionDateTime, ActionType, LastTradePrice,
//  Orders, Price, ProductPairCode, Quantity, Side]
struct Entry {
    std::uint64_t md_update_id{0};
    std::uint64_t accounts{0};
    std::int64_t action_date_time{0};       // ms since epoch
    BookAction action{BookAction::Unknown};
    double last_trade_price{0};
    std::uint64_t orders{0};
    double price{0};
    std::uint64_t instrument_id{0};
    double quantity{0};
    Side side{Side::Unknown};
};

inline constexpr std::size_t ENTRY_FIELDS = 10;
inline constexpr std::size_t ENTRY_INSTRUMENT_INDEX = 7;

// Rows of one update (or of the subscribe snapshot), all for one instrument
struct Snapshot {
    std::uint64_t instrument_id{0};
    std::vector<Entry> entries;
};

inline std::ostream& operator<<(std::ostream& os, const Snapshot& s) {
    return os << "[L2 " << s.instrument_id << "] " << s.entries.size() << " level(s)";
}

} // namespace ndaxlink::core::protocol::ndax::schema::level2
