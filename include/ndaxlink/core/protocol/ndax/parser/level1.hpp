#pragma once

#include "ndaxlink/core/protocol/ndax/schema/level1.hpp"
#include "ndaxlink/core/protocol/ndax/parser/result.hpp"
#include "ndaxlink/core/protocol/ndax/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace ndaxlink::core::protocol::ndax::parser::level1 {

// Level1UpdateEvent, and the SubscribeLevel1 / GetLevel1 replies (same object)
struct update {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::level1::Update& out) noexcept {
        out = schema::level1::Update{};

        // Root
        auto r = helper::require_object(root);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Root not an object in level1 update -> ignore message.");
            return r;
        }

        // InstrumentId (required)
        r = helper::parse_uint64_required(root, "InstrumentId", out.instrument_id);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Field 'InstrumentId' missing or invalid in level1 update -> ignore message.");
            return r;
        }

        // BestBid / BestOffer (required)
        r = helper::parse_double_required(root, "BestBid", out.best_bid);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Field 'BestBid' missing or invalid in level1 update -> ignore message.");
            return r;
        }
        r = helper::parse_double_required(root, "BestOffer", out.best_offer);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Field 'BestOffer' missing or invalid in level1 update -> ignore message.");
            return r;
        }

        // Everything else is optional and defaults to zero
        struct DecimalField { const char* key; double* dst; };
        const DecimalField decimals[] = {
            {"LastTradedPx",          &out.last_traded_px},
            {"LastTradedQty",         &out.last_traded_qty},
            {"SessionOpen",           &out.session_open},
            {"SessionHigh",           &out.session_high},
            {"SessionLow",            &out.session_low},
            {"SessionClose",          &out.session_close},
            {"Volume",                &out.volume},
            {"CurrentDayVolume",      &out.current_day_volume},
            {"CurrentDayPxChange",    &out.current_day_px_change},
            {"Rolling24HrVolume",     &out.rolling_24hr_volume},
            {"Rolling24HrPxChange",   &out.rolling_24hr_px_change},
        };
        for (const auto& f : decimals) {
            lcr::optional<double> v;
            r = helper::parse_double_optional(root, f.key, v);
            if (r != Result::Ok) {
                NL_DEBUG("[PARSER] Field '" << f.key << "' invalid in level1 update -> ignore message.");
                return r;
            }
            *f.dst = v.value_or(0.0);
        }

        struct IntegerField { const char* key; std::uint64_t* dst; };
        const IntegerField integers[] = {
            {"OMSId",                 &out.oms_id},
            {"LastTradeTime",         &out.last_trade_time},
            {"CurrentDayNumTrades",   &out.current_day_num_trades},
            {"Rolling24HrNumTrades",  &out.rolling_24hr_num_trades},
            {"TimeStamp",             &out.timestamp},
        };
        for (const auto& f : integers) {
            lcr::optional<std::uint64_t> v;
            r = helper::parse_uint64_lenient_optional(root, f.key, v);
            if (r != Result::Ok) {
                NL_DEBUG("[PARSER] Field '" << f.key << "' invalid in level1 update -> ignore message.");
                return r;
            }
            *f.dst = v.value_or(0);
        }

        return Result::Parsed;
    }
};

} // namespace ndaxlink::core::protocol::ndax::parser::level1
