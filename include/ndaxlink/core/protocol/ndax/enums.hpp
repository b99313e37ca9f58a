#pragma once

#include <cstdint>
#include <string_view>

// Numeric enumerations of the NDAX (AlphaPoint) API. Values are the wire values.

namespace ndaxlink::core::protocol::ndax {

// ===============================================
// SIDE
// ===============================================
enum class Side : std::uint8_t {
    Buy     = 0,
    Sell    = 1,
    Short   = 2,
    Unknown = 3
};

[[nodiscard]]
inline constexpr std::string_view to_string(Side s) noexcept {
    switch (s) {
        case Side::Buy:   return "buy";
        case Side::Sell:  return "sell";
        case Side::Short: return "short";
        default:          return "unknown";
    }
}

[[nodiscard]]
inline constexpr Side to_side_enum(std::uint64_t v) noexcept {
    return v <= 2 ? static_cast<Side>(v) : Side::Unknown;
}


// ===============================================
// ORDER TYPE
// ===============================================
enum class OrderType : std::uint8_t {
    Unknown            = 0,
    Market             = 1,
    Limit              = 2,
    StopMarket         = 3,
    StopLimit          = 4,
    TrailingStopMarket = 5,
    TrailingStopLimit  = 6,
    BlockTrade         = 7
};

[[nodiscard]]
inline constexpr std::string_view to_string(OrderType t) noexcept {
    switch (t) {
        case OrderType::Market:             return "market";
        case OrderType::Limit:              return "limit";
        case OrderType::StopMarket:         return "stop-market";
        case OrderType::StopLimit:          return "stop-limit";
        case OrderType::TrailingStopMarket: return "trailing-stop-market";
        case OrderType::TrailingStopLimit:  return "trailing-stop-limit";
        case OrderType::BlockTrade:         return "block-trade";
        default:                            return "unknown";
    }
}


// ===============================================
// TIME IN FORCE
// ===============================================
enum class TimeInForce : std::uint8_t {
    Unknown = 0,
    GTC     = 1,   // good till cancelled
    OPG     = 2,   // market on open
    IOC     = 3,   // immediate or cancel
    FOK     = 4,   // fill or kill
    GTX     = 5,   // good till extended session
    GTD     = 6    // good till date
};

[[nodiscard]]
inline constexpr std::string_view to_string(TimeInForce t) noexcept {
    switch (t) {
        case TimeInForce::GTC: return "GTC";
        case TimeInForce::OPG: return "OPG";
        case TimeInForce::IOC: return "IOC";
        case TimeInForce::FOK: return "FOK";
        case TimeInForce::GTX: return "GTX";
        case TimeInForce::GTD: return "GTD";
        default:               return "unknown";
    }
}


// ===============================================
// LEVEL 2 ACTION
// ===============================================
enum class BookAction : std::uint8_t {
    New     = 0,
    Update  = 1,
    Delete  = 2,
    Unknown = 3
};

[[nodiscard]]
inline constexpr std::string_view to_string(BookAction a) noexcept {
    switch (a) {
        case BookAction::New:    return "new";
        case BookAction::Update: return "update";
        case BookAction::Delete: return "delete";
        default:                 return "unknown";
    }
}

[[nodiscard]]
inline constexpr BookAction to_book_action_enum(std::uint64_t v) noexcept {
    return v <= 2 ? static_cast<BookAction>(v) : BookAction::Unknown;
}

// Every request on NDAX targets this order management system
inline constexpr std::uint64_t OMS_ID = 1;

} // namespace ndaxlink::core::protocol::ndax
