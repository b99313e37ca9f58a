#pragma once

#include "ndaxlink/core/protocol/ndax/schema/trade.hpp"
#include "ndaxlink/core/protocol/ndax/parser/result.hpp"
#include "ndaxlink/core/protocol/ndax/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace ndaxlink::core::protocol::ndax::parser::trade {

// TradeDataUpdateEvent and the SubscribeTrades reply
struct batch {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::trade::Batch& out) noexcept {
        out = schema::trade::Batch{};

        simdjson::dom::array rows;
        auto r = helper::require_array(root, rows);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Root not an array in trade message -> ignore message.");
            return r;
        }

        out.trades.reserve(rows.size());
        for (const simdjson::dom::element& elem : rows) {
            simdjson::dom::array row;
            if (elem.get(row) || row.size() < schema::trade::TRADE_MIN_FIELDS) {
                NL_DEBUG("[PARSER] Malformed row in trade message -> ignore message.");
                return Result::InvalidSchema;
            }

            schema::trade::Trade t{};
            std::uint64_t taker = 0;
            if (helper::parse_uint64_at(row, 0, t.trade_id) != Result::Ok
                || helper::parse_uint64_at(row, schema::trade::TRADE_INSTRUMENT_INDEX, t.instrument_id) != Result::Ok
                || helper::parse_double_at(row, 2, t.quantity) != Result::Ok
                || helper::parse_double_at(row, 3, t.price) != Result::Ok
                || helper::parse_uint64_at(row, 4, t.order1) != Result::Ok
                || helper::parse_uint64_at(row, 5, t.order2) != Result::Ok
                || helper::parse_int64_at(row, 6, t.trade_time) != Result::Ok
                || helper::parse_int64_at(row, 7, t.direction) != Result::Ok
                || helper::parse_uint64_at(row, 8, taker) != Result::Ok) {
                NL_DEBUG("[PARSER] Invalid field in trade row -> ignore message.");
                return Result::InvalidSchema;
            }
            t.taker_side = to_side_enum(taker);

            // BlockTrade (optional trailing field)
            if (row.size() > 9 && helper::parse_flag_at(row, 9, t.block_trade) != Result::Ok) {
                NL_DEBUG("[PARSER] Invalid 'BlockTrade' in trade row -> ignore message.");
                return Result::InvalidSchema;
            }

            if (out.trades.empty()) {
                out.instrument_id = t.instrument_id;
            }
            else if (t.instrument_id != out.instrument_id) {
                NL_DEBUG("[PARSER] Mixed instruments in trade message -> ignore message.");
                return Result::InvalidValue;
            }
            out.trades.push_back(t);
        }

        return Result::Parsed;
    }
};

} // namespace ndaxlink::core::protocol::ndax::parser::trade
