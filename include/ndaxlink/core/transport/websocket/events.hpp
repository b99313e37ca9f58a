#pragma once

#include <cstdint>
#include <type_traits>

#include "ndaxlink/core/transport/error.hpp"


namespace ndaxlink::core::transport::websocket {

// -----------------------------------------------------------------------------
// Socket control events
//
// Pushed by the backend's I/O thread, popped by Connection::poll(). A failing
// socket reports Error first and Close last; Close comes exactly once per
// socket, whoever started the shutdown.
// -----------------------------------------------------------------------------
enum class EventType : std::uint8_t {
    Close,
    Error,
};

struct Event {
    EventType type{EventType::Close};
    transport::Error error{transport::Error::None};   // EventType::Error only

    static constexpr Event make_close() noexcept {
        return Event{};
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        return Event{EventType::Error, e};
    }
};

static_assert(std::is_trivially_copyable_v<Event>);

} // namespace ndaxlink::core::transport::websocket
