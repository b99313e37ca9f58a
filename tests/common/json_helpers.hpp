#pragma once

#include <string>
#include <string_view>
#include <cstdint>

#include "ndaxlink/core/protocol/ndax/codec.hpp"
#include "ndaxlink/core/protocol/ndax/frame.hpp"

// ----------------------------------------------------------------------------
// Gateway-side frames, as the NDAX server would send them
// ----------------------------------------------------------------------------

namespace json::ndax {

using ndaxlink::core::protocol::ndax::Codec;
using ndaxlink::core::protocol::ndax::MessageType;

static inline std::string reply(std::uint64_t seq, std::string_view endpoint, std::string_view payload) {
    return Codec::encode(MessageType::Reply, seq, endpoint, payload);
}

static inline std::string error(std::uint64_t seq, std::string_view endpoint, std::string_view errormsg) {
    std::string o = R"({"result":false,"errormsg":")" + std::string(errormsg) + R"(","errorcode":100})";
    return Codec::encode(MessageType::Error, seq, endpoint, o);
}

static inline std::string event(std::string_view endpoint, std::string_view payload) {
    return Codec::encode(MessageType::Event, 0, endpoint, payload);
}

// -----------------------------------------------------------------------------
// Authentication
// -----------------------------------------------------------------------------

static inline std::string auth_ok(std::string_view token = "tok-1", std::uint64_t user_id = 42) {
    return R"({"Authenticated":true,"SessionToken":")" + std::string(token) +
           R"(","User":{"UserId":)" + std::to_string(user_id) + R"(,"UserName":"alice"},"Locked":false,"Requires2FA":false})";
}

static inline std::string auth_requires_2fa() {
    return R"({"Authenticated":true,"Requires2FA":true,"AuthType":"Google","AddtlInfo":""})";
}

static inline std::string auth_refused(std::string_view errormsg = "Invalid username or password") {
    return R"({"Authenticated":false,"Locked":false,"errormsg":")" + std::string(errormsg) + R"("})";
}

static inline std::string auth_locked() {
    return R"({"Authenticated":false,"Locked":true,"errormsg":"User is locked"})";
}

static inline std::string second_factor_ok(std::string_view token = "tok-2fa", std::uint64_t user_id = 42) {
    return R"({"Authenticated":true,"UserId":)" + std::to_string(user_id) +
           R"(,"SessionToken":")" + std::string(token) + R"("})";
}

// -----------------------------------------------------------------------------
// Generic replies
// -----------------------------------------------------------------------------

static inline std::string generic_ok() {
    return R"({"result":true,"errormsg":null,"errorcode":0,"detail":null})";
}

static inline std::string generic_rejected(std::string_view errormsg) {
    return R"({"result":false,"errormsg":")" + std::string(errormsg) + R"(","errorcode":101,"detail":null})";
}

static inline std::string pong() {
    return R"({"msg":"PONG"})";
}

// -----------------------------------------------------------------------------
// Market data
// -----------------------------------------------------------------------------

static inline std::string level1(std::uint64_t instrument_id, double bid, double offer, std::uint64_t ts = 1700000000000ULL) {
    return R"({"OMSId":1,"InstrumentId":)" + std::to_string(instrument_id) +
           R"(,"BestBid":)" + std::to_string(bid) +
           R"(,"BestOffer":)" + std::to_string(offer) +
           R"(,"LastTradedPx":)" + std::to_string(bid) +
           R"(,"LastTradedQty":0.01,"LastTradeTime":1700000000000,"SessionOpen":1,"SessionHigh":2,"SessionLow":0.5,)"
           R"("SessionClose":1.5,"Volume":0.01,"CurrentDayVolume":12.5,"CurrentDayNumTrades":17,"CurrentDayPxChange":-3.2,)"
           R"("Rolling24HrVolume":20.1,"Rolling24HrNumTrades":33,"Rolling24HrPxChange":1.1,"TimeStamp":")" + std::to_string(ts) + R"("})";
}

} // namespace json::ndax
