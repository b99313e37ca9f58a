#pragma once

#include <string_view>

// Endpoint names (the "n" field) of the NDAX / AlphaPoint WebSocket gateway.

namespace ndaxlink::core::protocol::ndax::endpoint {

// --- Authentication ---
inline constexpr std::string_view AuthenticateUser      = "AuthenticateUser";
inline constexpr std::string_view Authenticate2FA       = "Authenticate2FA";
inline constexpr std::string_view LogOut                = "LogOut";

// --- Keep-alive ---
inline constexpr std::string_view Ping                  = "Ping";

// --- Queries ---
inline constexpr std::string_view GetAccountPositions   = "GetAccountPositions";
inline constexpr std::string_view GetAccountInfo        = "GetAccountInfo";
inline constexpr std::string_view GetLevel1             = "GetLevel1";
inline constexpr std::string_view GetL2Snapshot         = "GetL2Snapshot";
inline constexpr std::string_view GetOpenOrders         = "GetOpenOrders";
inline constexpr std::string_view GetOpenTradeReports   = "GetOpenTradeReports";
inline constexpr std::string_view GetProducts           = "GetProducts";
inline constexpr std::string_view GetInstruments        = "GetInstruments";
inline constexpr std::string_view GetTickerHistory      = "GetTickerHistory";

// --- Orders ---
inline constexpr std::string_view SendOrder             = "SendOrder";
inline constexpr std::string_view CancelOrder           = "CancelOrder";
inline constexpr std::string_view CancelAllOrders       = "CancelAllOrders";

// --- Subscriptions ---
inline constexpr std::string_view SubscribeLevel1       = "SubscribeLevel1";
inline constexpr std::string_view UnsubscribeLevel1     = "UnsubscribeLevel1";
inline constexpr std::string_view SubscribeLevel2       = "SubscribeLevel2";
inline constexpr std::string_view UnsubscribeLevel2     = "UnsubscribeLevel2";
inline constexpr std::string_view SubscribeTrades       = "SubscribeTrades";
inline constexpr std::string_view UnsubscribeTrades     = "UnsubscribeTrades";
inline constexpr std::string_view SubscribeTicker       = "SubscribeTicker";
inline constexpr std::string_view UnsubscribeTicker     = "UnsubscribeTicker";
inline constexpr std::string_view SubscribeAccountEvents = "SubscribeAccountEvents";

// --- Server pushes ---
inline constexpr std::string_view Level1UpdateEvent     = "Level1UpdateEvent";
inline constexpr std::string_view Level2UpdateEvent     = "Level2UpdateEvent";
inline constexpr std::string_view TradeDataUpdateEvent  = "TradeDataUpdateEvent";
inline constexpr std::string_view TickerDataUpdateEvent = "TickerDataUpdateEvent";

// Account-scoped pushes enabled by SubscribeAccountEvents
inline constexpr std::string_view ACCOUNT_EVENTS[] = {
    "AccountPositionEvent",
    "OrderStateEvent",
    "OrderTradeEvent",
    "NewOrderRejectEvent",
    "CancelOrderRejectEvent",
    "CancelAllOrdersRejectEvent",
    "TransactionEvent",
    "AccountInfoUpdateEvent",
};

[[nodiscard]]
inline constexpr bool is_account_event(std::string_view name) noexcept {
    for (auto e : ACCOUNT_EVENTS) {
        if (e == name) {
            return true;
        }
    }
    return false;
}

} // namespace ndaxlink::core::protocol::ndax::endpoint
