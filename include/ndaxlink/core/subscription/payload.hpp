#pragma once

#include <variant>

#include "ndaxlink/core/protocol/ndax/schema/level1.hpp"
#include "ndaxlink/core/protocol/ndax/schema/level2.hpp"
#include "ndaxlink/core/protocol/ndax/schema/trade.hpp"
#include "ndaxlink/core/protocol/ndax/schema/ticker.hpp"
#include "ndaxlink/core/protocol/ndax/schema/account.hpp"


namespace ndaxlink::core::subscription {

// Validated event payload handed to subscription handlers
using Payload = std::variant<
    protocol::ndax::schema::level1::Update,
    protocol::ndax::schema::level2::Snapshot,
    protocol::ndax::schema::trade::Batch,
    protocol::ndax::schema::ticker::Batch,
    protocol::ndax::schema::account::Event
>;

} // namespace ndaxlink::core::subscription
