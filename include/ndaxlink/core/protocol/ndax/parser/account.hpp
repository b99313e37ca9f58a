#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ndaxlink/core/protocol/ndax/schema/account.hpp"
#include "ndaxlink/core/protocol/ndax/parser/result.hpp"
#include "ndaxlink/core/protocol/ndax/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace ndaxlink::core::protocol::ndax::parser::account {

// Account-scoped events. Only the owning account is extracted; the body is
// kept as JSON text. The id is "AccountId" on most events and "Account"
// on a few (OrderStateEvent, OrderTradeEvent).
struct event {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, std::string_view name, schema::account::Event& out) {
        out = schema::account::Event{};

        auto r = helper::require_object(root);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Root not an object in " << name << " -> ignore message.");
            return r;
        }

        lcr::optional<std::uint64_t> id;
        r = helper::parse_uint64_optional(root, "AccountId", id);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Field 'AccountId' invalid in " << name << " -> ignore message.");
            return r;
        }
        if (!id.has()) {
            r = helper::parse_uint64_optional(root, "Account", id);
            if (r != Result::Ok || !id.has()) {
                NL_DEBUG("[PARSER] No account id in " << name << " -> ignore message.");
                return Result::InvalidSchema;
            }
        }

        out.name.assign(name.data(), name.size());
        out.account_id = id.value();
        out.payload = simdjson::minify(root);
        return Result::Parsed;
    }
};

// GetAccountPositions reply: array of position objects
struct positions {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, std::vector<schema::account::Position>& out) {
        out.clear();

        simdjson::dom::array items;
        auto r = helper::require_array(root, items);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Root not an array in positions reply -> ignore message.");
            return r;
        }

        out.reserve(items.size());
        for (const simdjson::dom::element& item : items) {
            schema::account::Position p{};

            if (helper::parse_uint64_required(item, "AccountId", p.account_id) != Result::Ok
                || helper::parse_uint64_required(item, "ProductId", p.product_id) != Result::Ok
                || helper::parse_string_required(item, "ProductSymbol", p.product_symbol) != Result::Ok
                || helper::parse_double_required(item, "Amount", p.amount) != Result::Ok
                || helper::parse_double_required(item, "Hold", p.hold) != Result::Ok) {
                NL_DEBUG("[PARSER] Missing field in position -> ignore message.");
                return Result::InvalidSchema;
            }

            struct DecimalField { const char* key; double* dst; };
            const DecimalField decimals[] = {
                {"PendingDeposits",   &p.pending_deposits},
                {"PendingWithdraws",  &p.pending_withdraws},
                {"TotalDayDeposits",  &p.total_day_deposits},
                {"TotalDayWithdraws", &p.total_day_withdraws},
            };
            for (const auto& f : decimals) {
                lcr::optional<double> v;
                if (helper::parse_double_optional(item, f.key, v) != Result::Ok) {
                    NL_DEBUG("[PARSER] Field '" << f.key << "' invalid in position -> ignore message.");
                    return Result::InvalidSchema;
                }
                *f.dst = v.value_or(0.0);
            }

            out.push_back(std::move(p));
        }

        return Result::Parsed;
    }
};

} // namespace ndaxlink::core::protocol::ndax::parser::account
