#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>

#include "ndaxlink/core/protocol/ndax/enums.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace ndaxlink::core::protocol::ndax::schema::order {

// SendOrder
// {"OMSId":1,"AccountId":123,"InstrumentId":7,"TimeInForce":1,"Side":0,
//  "OrderType":2,"UseDisplayQuantity":false,"Quantity":0.5,"LimitPrice":65000}
struct Send {
    std::uint64_t account_id{0};
    std::uint64_t instrument_id{0};
    Side side{Side::Buy};
    OrderType order_type{OrderType::Limit};
    TimeInForce time_in_force{TimeInForce::GTC};
    double quantity{0};
    lcr::optional<double> limit_price{};
    lcr::optional<double> stop_price{};
    lcr::optional<std::uint64_t> client_order_id{};
    bool use_display_quantity{false};

    // Name of the first number JSON cannot carry (NaN, infinity), empty if none
    [[nodiscard]]
    std::string_view invalid_field() const noexcept {
        if (!std::isfinite(quantity)) {
            return "Quantity";
        }
        if (limit_price.has() && !std::isfinite(limit_price.value())) {
            return "LimitPrice";
        }
        if (stop_price.has() && !std::isfinite(stop_price.value())) {
            return "StopPrice";
        }
        return {};
    }

    // Empty string when invalid_field() names something
    std::string to_json() const {
        if (!invalid_field().empty()) {
            return {};
        }
        std::string j;
        j.reserve(256);
        j += "{\"OMSId\":";
        lcr::json::append(j, OMS_ID);
        j += ",\"AccountId\":";
        lcr::json::append(j, account_id);
        j += ",\"InstrumentId\":";
        lcr::json::append(j, instrument_id);
        j += ",\"TimeInForce\":";
        lcr::json::append(j, static_cast<std::uint64_t>(time_in_force));
        j += ",\"Side\":";
        lcr::json::append(j, static_cast<std::uint64_t>(side));
        j += ",\"OrderType\":";
        lcr::json::append(j, static_cast<std::uint64_t>(order_type));
        j += ",\"UseDisplayQuantity\":";
        lcr::json::append_bool(j, use_display_quantity);
        j += ",\"Quantity\":";
        lcr::json::append_decimal(j, quantity);
        // The gateway expects LimitPrice even for market orders
        j += ",\"LimitPrice\":";
        lcr::json::append_decimal(j, limit_price.value_or(0.0));
        if (stop_price.has()) {
            j += ",\"StopPrice\":";
            lcr::json::append_decimal(j, stop_price.value());
        }
        if (client_order_id.has()) {
            j += ",\"ClientOrderId\":";
            lcr::json::append(j, client_order_id.value());
        }
        j += "}";
        return j;
    }
};

// CancelOrder {"OMSId":1,"AccountId":123,"OrderId":456}
struct Cancel {
    std::uint64_t account_id{0};
    std::uint64_t order_id{0};

    std::string to_json() const {
        std::string j;
        j.reserve(64);
        j += "{\"OMSId\":";
        lcr::json::append(j, OMS_ID);
        j += ",\"AccountId\":";
        lcr::json::append(j, account_id);
        j += ",\"OrderId\":";
        lcr::json::append(j, order_id);
        j += "}";
        return j;
    }
};

// CancelAllOrders {"OMSId":1,"AccountId":123[,"InstrumentId":7]}
struct CancelAll {
    std::uint64_t account_id{0};
    lcr::optional<std::uint64_t> instrument_id{};

    std::string to_json() const {
        std::string j;
        j.reserve(64);
        j += "{\"OMSId\":";
        lcr::json::append(j, OMS_ID);
        j += ",\"AccountId\":";
        lcr::json::append(j, account_id);
        if (instrument_id.has()) {
            j += ",\"InstrumentId\":";
            lcr::json::append(j, instrument_id.value());
        }
        j += "}";
        return j;
    }
};

} // namespace ndaxlink::core::protocol::ndax::schema::order
