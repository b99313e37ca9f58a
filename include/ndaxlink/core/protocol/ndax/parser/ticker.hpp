#pragma once

#include "ndaxlink/core/protocol/ndax/schema/ticker.hpp"
#include "ndaxlink/core/protocol/ndax/parser/result.hpp"
#include "ndaxlink/core/protocol/ndax/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace ndaxlink::core::protocol::ndax::parser::ticker {

// TickerDataUpdateEvent, SubscribeTicker and GetTickerHistory replies
struct batch {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::ticker::Batch& out) noexcept {
        out = schema::ticker::Batch{};

        simdjson::dom::array rows;
        auto r = helper::require_array(root, rows);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Root not an array in ticker message -> ignore message.");
            return r;
        }

        out.bars.reserve(rows.size());
        for (const simdjson::dom::element& elem : rows) {
            simdjson::dom::array row;
            if (elem.get(row) || row.size() < schema::ticker::BAR_MIN_FIELDS) {
                NL_DEBUG("[PARSER] Malformed row in ticker message -> ignore message.");
                return Result::InvalidSchema;
            }

            schema::ticker::Bar b{};
            if (helper::parse_int64_at(row, 0, b.end_date_time) != Result::Ok
                || helper::parse_double_at(row, 1, b.high) != Result::Ok
                || helper::parse_double_at(row, 2, b.low) != Result::Ok
                || helper::parse_double_at(row, 3, b.open) != Result::Ok
                || helper::parse_double_at(row, 4, b.close) != Result::Ok
                || helper::parse_double_at(row, 5, b.volume) != Result::Ok
                || helper::parse_double_at(row, 6, b.inside_bid) != Result::Ok
                || helper::parse_double_at(row, 7, b.inside_ask) != Result::Ok
                || helper::parse_uint64_at(row, schema::ticker::BAR_INSTRUMENT_INDEX, b.instrument_id) != Result::Ok) {
                NL_DEBUG("[PARSER] Invalid field in ticker row -> ignore message.");
                return Result::InvalidSchema;
            }

            if (out.bars.empty()) {
                out.instrument_id = b.instrument_id;
            }
            else if (b.instrument_id != out.instrument_id) {
                NL_DEBUG("[PARSER] Mixed instruments in ticker message -> ignore message.");
                return Result::InvalidValue;
            }
            out.bars.push_back(b);
        }

        return Result::Parsed;
    }
};

} // namespace ndaxlink::core::protocol::ndax::parser::ticker
