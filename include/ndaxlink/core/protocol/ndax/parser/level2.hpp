#pragma once

#include "ndaxlink/core/protocol/ndax/schema/level2.hpp"
#include "ndaxlink/core/protocol/ndax/parser/result.hpp"
#include "ndaxlink/core/protocol/ndax/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace ndaxlink::core::protocol::ndax::parser::level2 {

// Level2UpdateEvent and the SubscribeLevel2 / GetL2Snapshot replies:
// an array of 10-element rows, all for one instrument
struct snapshot {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::level2::Snapshot& out) noexcept {
        out = schema::level2::Snapshot{};

        simdjson::dom::array rows;
        auto r = helper::require_array(root, rows);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Root not an array in level2 message -> ignore message.");
            return r;
        }

        out.entries.reserve(rows.size());
        for (const simdjson::dom::element& elem : rows) {
            simdjson::dom::array row;
            if (elem.get(row) || row.size() < schema::level2::ENTRY_FIELDS) {
                NL_DEBUG("[PARSER] Malformed row in level2 message -> ignore message.");
                return Result::InvalidSchema;
            }

            schema::level2::Entry e{};
            std::uint64_t action = 0;
            std::uint64_t side = 0;
            if (helper::parse_uint64_at(row, 0, e.md_update_id) != Result::Ok
                || helper::parse_uint64_at(row, 1, e.accounts) != Result::Ok
                || helper::parse_int64_at(row, 2, e.action_date_time) != Result::Ok
                || helper::parse_uint64_at(row, 3, action) != Result::Ok
                || helper::parse_double_at(row, 4, e.last_trade_price) != Result::Ok
                || helper::parse_uint64_at(row, 5, e.orders) != Result::Ok
                || helper::parse_double_at(row, 6, e.price) != Result::Ok
                || helper::parse_uint64_at(row, schema::level2::ENTRY_INSTRUMENT_INDEX, e.instrument_id) != Result::Ok
                || helper::parse_double_at(row, 8, e.quantity) != Result::Ok
                || helper::parse_uint64_at(row, 9, side) != Result::Ok) {
                NL_DEBUG("[PARSER] Invalid field in level2 row -> ignore message.");
                return Result::InvalidSchema;
            }
            e.action = to_book_action_enum(action);
            e.side = to_side_enum(side);

            if (out.entries.empty()) {
                out.instrument_id = e.instrument_id;
            }
            else if (e.instrument_id != out.instrument_id) {
                NL_DEBUG("[PARSER] Mixed instruments in level2 message -> ignore message.");
                return Result::InvalidValue;
            }
            out.entries.push_back(e);
        }

        return Result::Parsed;
    }
};

} // namespace ndaxlink::core::protocol::ndax::parser::level2
