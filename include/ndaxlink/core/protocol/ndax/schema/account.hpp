#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <ostream>

#include "ndaxlink/core/protocol/ndax/enums.hpp"
#include "lcr/json.hpp"


namespace ndaxlink::core::protocol::ndax::schema::account {

// Account-scoped requests share one body:
// SubscribeAccountEvents, GetAccountPositions, GetAccountInfo,
// GetOpenOrders, GetOpenTradeReports
// {"OMSId":1,"AccountId":123}
struct Request {
    std::uint64_t account_id{0};

    std::string to_json() const {
        std::string j;
        j.reserve(40);
        j += "{\"OMSId\":";
        lcr::json::append(j, OMS_ID);
        j += ",\"AccountId\":";
        lcr::json::append(j, account_id);
        j += "}";
        return j;
    }
};

using Subscribe = Request;


// ===============================================
// ACCOUNT EVENT (OrderStateEvent, AccountPositionEvent, ...)
// ===============================================
// The event bodies differ per endpoint; they are delivered as validated
// JSON text together with the event name and owning account.
struct Event {
    std::string name;
    std::uint64_t account_id{0};
    std::string payload;
};

inline std::ostream& operator<<(std::ostream& os, const Event& e) {
    return os << "[ACCOUNT " << e.account_id << "] " << e.name << " (" << e.payload.size() << " bytes)";
}


// ===============================================
// POSITION (one element of the GetAccountPositions reply)
// ===============================================
struct Position {
    std::uint64_t account_id{0};
    std::uint64_t product_id{0};
    std::string product_symbol;
    double amount{0};
    double hold{0};
    double pending_deposits{0};
    double pending_withdraws{0};
    double total_day_deposits{0};
    double total_day_withdraws{0};
};

inline std::ostream& operator<<(std::ostream& os, const Position& p) {
    return os << p.product_symbol << " amount=" << p.amount << " hold=" << p.hold;
}

} // namespace ndaxlink::core::protocol::ndax::schema::account
