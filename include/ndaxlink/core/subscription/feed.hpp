#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>
#include <functional>
#include <ostream>

#include "ndaxlink/core/protocol/ndax/endpoints.hpp"


namespace ndaxlink::core::subscription {

// ===============================================
// FEED
// ===============================================
enum class Feed : std::uint8_t {
    Level1,
    Level2,
    Trades,
    Ticker,
    AccountEvents
};

[[nodiscard]]
inline constexpr std::string_view to_string(Feed f) noexcept {
    switch (f) {
        case Feed::Level1:        return "level1";
        case Feed::Level2:        return "level2";
        case Feed::Trades:        return "trades";
        case Feed::Ticker:        return "ticker";
        case Feed::AccountEvents: return "account";
        default:                  return "unknown";
    }
}

[[nodiscard]]
inline constexpr std::string_view subscribe_endpoint(Feed f) noexcept {
    namespace ep = protocol::ndax::endpoint;
    switch (f) {
        case Feed::Level1:        return ep::SubscribeLevel1;
        case Feed::Level2:        return ep::SubscribeLevel2;
        case Feed::Trades:        return ep::SubscribeTrades;
        case Feed::Ticker:        return ep::SubscribeTicker;
        case Feed::AccountEvents: return ep::SubscribeAccountEvents;
        default:                  return {};
    }
}

// Empty for feeds the gateway cannot unsubscribe (account events)
[[nodiscard]]
inline constexpr std::string_view unsubscribe_endpoint(Feed f) noexcept {
    namespace ep = protocol::ndax::endpoint;
    switch (f) {
        case Feed::Level1: return ep::UnsubscribeLevel1;
        case Feed::Level2: return ep::UnsubscribeLevel2;
        case Feed::Trades: return ep::UnsubscribeTrades;
        case Feed::Ticker: return ep::UnsubscribeTicker;
        default:           return {};
    }
}


// ===============================================
// KEY (feed + instrument or account id)
// ===============================================
struct Key {
    Feed feed{Feed::Level1};
    std::uint64_t id{0};

    bool operator==(const Key&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const Key& k) {
    return os << to_string(k.feed) << "/" << k.id;
}

struct KeyHash {
    std::size_t operator()(const Key& k) const noexcept {
        return std::hash<std::uint64_t>{}((k.id << 3) ^ static_cast<std::uint64_t>(k.feed));
    }
};

using SubscriptionId = std::uint64_t;

} // namespace ndaxlink::core::subscription
