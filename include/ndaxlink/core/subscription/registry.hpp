/*
===============================================================================
Subscription Registry (stream intent + event routing)
===============================================================================

Keeps every active stream subscription, keyed by (feed, instrument/account),
so that it can be sent once the session is authenticated and replayed after
every reconnect, and routes pushed events to the registered handler.

-------------------------------------------------------------------------------
Core invariants
-------------------------------------------------------------------------------
• At most one entry per key. Subscribing an existing key replaces the handler
  and keeps the id; no second wire request is produced
• Wire requests are produced only while live (authenticated):
    - subscribe() while live        -> one request
    - subscribe() while not live    -> none, activate() produces it later
    - activate()                    -> exactly one request per entry
• Every wire request carries the registry generation it was minted in;
  deactivate() starts a new generation, so a request built just before a
  disconnect can be told apart from its replay
• Events for unknown keys are dropped and counted (stale feeds during an
  unsubscribe race are expected, never fatal)
• Invalid payloads are dropped and counted
• Handlers run on the dispatch thread with the registry lock released;
  per-key ordering is the frame arrival order

-------------------------------------------------------------------------------
Lifecycle
-------------------------------------------------------------------------------
• subscribe(key, request, handler)    add / replace intent
• unsubscribe(id)                     drop intent, maybe an Unsubscribe request
• activate()                          session authenticated -> replay
• deactivate()                        transport lost, new generation
• route(frame)                        Event frame from the gateway
• deliver_snapshot(key, payload)      reply to a subscribe request

-------------------------------------------------------------------------------
Threading
-------------------------------------------------------------------------------
subscribe / unsubscribe may be called from any thread. route and
deliver_snapshot are dispatch-thread only (they own the JSON parser).
===============================================================================
*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ndaxlink/core/subscription/feed.hpp"
#include "ndaxlink/core/subscription/payload.hpp"
#include "ndaxlink/core/protocol/ndax/frame.hpp"
#include "ndaxlink/core/protocol/ndax/endpoints.hpp"
#include "ndaxlink/core/protocol/ndax/parser/result.hpp"
#include "ndaxlink/core/protocol/ndax/parser/level1.hpp"
#include "ndaxlink/core/protocol/ndax/parser/level2.hpp"
#include "ndaxlink/core/protocol/ndax/parser/trade.hpp"
#include "ndaxlink/core/protocol/ndax/parser/ticker.hpp"
#include "ndaxlink/core/protocol/ndax/parser/account.hpp"
#include "ndaxlink/core/telemetry/session.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace ndaxlink::core::subscription {

using Handler = std::function<void(const Payload&)>;

// A request the session must submit on the gateway
struct Wire {
    Key key{};
    std::string_view endpoint;
    std::string payload;
    std::uint64_t generation{0};
};

struct Registration {
    SubscriptionId id{0};
    lcr::optional<Wire> wire{};
};


class Registry {
public:
    using Result = protocol::ndax::parser::Result;

    explicit Registry(telemetry::Session& telemetry) noexcept
        : telemetry_(telemetry)
    {}

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // ------------------------------------------------------------
    // Intent
    // ------------------------------------------------------------

    // `request` is the JSON body shared by the Subscribe and Unsubscribe calls
    [[nodiscard]]
    Registration subscribe(Key key, std::string request, Handler handler) {
        std::lock_guard lock(mutex_);

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            NL_DEBUG("[SUBS] " << key << " already registered (id " << it->second.id << "), handler replaced");
            it->second.handler = std::move(handler);
            it->second.request = std::move(request);
            return Registration{it->second.id, {}};
        }

        const SubscriptionId id = next_id_++;
        Entry e;
        e.id = id;
        e.request = std::move(request);
        e.handler = std::move(handler);
        e.active = live_;

        Registration reg{id, {}};
        if (live_) {
            reg.wire = Wire{key, subscribe_endpoint(key.feed), e.request, generation_};
        }
        ids_.emplace(id, key);
        entries_.emplace(key, std::move(e));

        NL_DEBUG("[SUBS] " << key << " registered (id " << id << (live_ ? ", sending)" : ", deferred)"));
        return reg;
    }

    // Returns the Unsubscribe request when the gateway has to be told
    [[nodiscard]]
    lcr::optional<Wire> unsubscribe(SubscriptionId id) {
        std::lock_guard lock(mutex_);

        auto idit = ids_.find(id);
        if (idit == ids_.end()) {
            NL_DEBUG("[SUBS] unsubscribe: unknown id " << id);
            return {};
        }
        const Key key = idit->second;
        ids_.erase(idit);

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return {};
        }
        const bool was_active = it->second.active;
        std::string request = std::move(it->second.request);
        entries_.erase(it);

        NL_DEBUG("[SUBS] " << key << " unregistered (id " << id << ")");

        const auto endpoint = unsubscribe_endpoint(key.feed);
        if (!live_ || !was_active || endpoint.empty()) {
            return {};
        }
        return Wire{key, endpoint, std::move(request), generation_};
    }

    // ------------------------------------------------------------
    // Session lifecycle
    // ------------------------------------------------------------

    // Session authenticated: every entry goes out exactly once
    [[nodiscard]]
    std::vector<Wire> activate() {
        std::lock_guard lock(mutex_);
        live_ = true;

        std::vector<Wire> wires;
        wires.reserve(entries_.size());
        for (auto& [key, e] : entries_) {
            e.active = true;
            wires.push_back(Wire{key, subscribe_endpoint(key.feed), e.request, generation_});
        }
        if (!wires.empty()) {
            NL_INFO("[SUBS] replaying " << wires.size() << " subscription(s)");
        }
        return wires;
    }

    // Returns the new generation. Wires minted before it are stale.
    std::uint64_t deactivate() {
        std::lock_guard lock(mutex_);
        live_ = false;
        for (auto& [key, e] : entries_) {
            e.active = false;
        }
        return ++generation_;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        live_ = false;
        ++generation_;
        entries_.clear();
        ids_.clear();
    }

    // ------------------------------------------------------------
    // Data plane (dispatch thread)
    // ------------------------------------------------------------

    Result route(const protocol::ndax::Frame& frame) {
        namespace ep = protocol::ndax::endpoint;

        const std::string_view name = frame.endpoint;
        if (name == ep::Level1UpdateEvent)     return parse_and_deliver_(Feed::Level1, name, frame.payload, nullptr);
        if (name == ep::Level2UpdateEvent)     return parse_and_deliver_(Feed::Level2, name, frame.payload, nullptr);
        if (name == ep::TradeDataUpdateEvent)  return parse_and_deliver_(Feed::Trades, name, frame.payload, nullptr);
        if (name == ep::TickerDataUpdateEvent) return parse_and_deliver_(Feed::Ticker, name, frame.payload, nullptr);
        if (ep::is_account_event(name))        return parse_and_deliver_(Feed::AccountEvents, name, frame.payload, nullptr);

        telemetry_.unmatched_events_total.inc();
        NL_WARN("[SUBS] unhandled event " << name << " -> dropped");
        return Result::Ignored;
    }

    // Initial snapshot carried by the reply to a subscribe request
    Result deliver_snapshot(const Key& key, std::string_view payload) {
        if (key.feed == Feed::AccountEvents) {
            return Result::Ignored;     // {"Subscribed":true}
        }
        return parse_and_deliver_(key.feed, subscribe_endpoint(key.feed), payload, &key);
    }

    // ------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------

    [[nodiscard]]
    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]]
    bool contains(const Key& key) const {
        std::lock_guard lock(mutex_);
        return entries_.count(key) != 0;
    }

    [[nodiscard]]
    lcr::optional<Key> key_of(SubscriptionId id) const {
        std::lock_guard lock(mutex_);
        auto it = ids_.find(id);
        if (it == ids_.end()) {
            return {};
        }
        return it->second;
    }

    [[nodiscard]]
    bool is_live() const {
        std::lock_guard lock(mutex_);
        return live_;
    }

    [[nodiscard]]
    std::uint64_t generation() const {
        std::lock_guard lock(mutex_);
        return generation_;
    }

private:
    struct Entry {
        SubscriptionId id{0};
        std::string request;
        Handler handler;
        bool active{false};
    };

    telemetry::Session& telemetry_;

    mutable std::mutex mutex_;
    std::unordered_map<Key, Entry, KeyHash> entries_;
    std::unordered_map<SubscriptionId, Key> ids_;
    SubscriptionId next_id_{1};
    std::uint64_t generation_{0};
    bool live_{false};

    simdjson::dom::parser parser_;

private:
    // `expected` is set for snapshots: the key is known from the request, and
    // an empty snapshot is not worth a handler call.
    Result parse_and_deliver_(Feed feed, std::string_view name, std::string_view json, const Key* expected) {
        namespace parser = protocol::ndax::parser;

        simdjson::dom::element root;
        if (parser_.parse(json.data(), json.size()).get(root)) {
            telemetry_.invalid_events_total.inc();
            NL_WARN("[SUBS] " << name << ": payload is not valid JSON -> dropped");
            return Result::InvalidJson;
        }

        Payload payload;
        Result r = Result::Ignored;
        std::uint64_t id = 0;
        bool empty = false;

        switch (feed) {
            case Feed::Level1: {
                protocol::ndax::schema::level1::Update u;
                r = parser::level1::update::parse(root, u);
                id = u.instrument_id;
                payload = std::move(u);
                break;
            }
            case Feed::Level2: {
                protocol::ndax::schema::level2::Snapshot s;
                r = parser::level2::snapshot::parse(root, s);
                id = s.instrument_id;
                empty = s.entries.empty();
                payload = std::move(s);
                break;
            }
            case Feed::Trades: {
                protocol::ndax::schema::trade::Batch b;
                r = parser::trade::batch::parse(root, b);
                id = b.instrument_id;
                empty = b.trades.empty();
                payload = std::move(b);
                break;
            }
            case Feed::Ticker: {
                protocol::ndax::schema::ticker::Batch b;
                r = parser::ticker::batch::parse(root, b);
                id = b.instrument_id;
                empty = b.bars.empty();
                payload = std::move(b);
                break;
            }
            case Feed::AccountEvents: {
                protocol::ndax::schema::account::Event e;
                r = parser::account::event::parse(root, name, e);
                id = e.account_id;
                payload = std::move(e);
                break;
            }
        }

        if (r != Result::Parsed) {
            telemetry_.invalid_events_total.inc();
            NL_WARN("[SUBS] " << name << ": invalid payload (" << parser::to_string(r) << ") -> dropped");
            return r;
        }

        if (empty) {
            // Nothing in it, and no instrument id to route by
            return Result::Ignored;
        }

        const Key key{feed, id};
        if (expected && !(*expected == key)) {
            telemetry_.invalid_events_total.inc();
            NL_WARN("[SUBS] snapshot for " << key << " received on " << *expected << " -> dropped");
            return Result::InvalidValue;
        }

        Handler handler;
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                handler = it->second.handler;
            }
        }
        if (!handler) {
            telemetry_.unmatched_events_total.inc();
            NL_DEBUG("[SUBS] " << name << " for " << key << " has no subscription -> dropped");
            return Result::Unmatched;
        }

        handler(payload);
        telemetry_.events_delivered_total.inc();
        return Result::Delivered;
    }
};

} // namespace ndaxlink::core::subscription
