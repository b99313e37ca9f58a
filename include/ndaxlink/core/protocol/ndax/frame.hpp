#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <ostream>


namespace ndaxlink::core::protocol::ndax {

// ===============================================
// ENVELOPE MESSAGE TYPE (the "m" field)
// ===============================================
enum class MessageType : std::uint8_t {
    Request     = 0,
    Reply       = 1,
    Subscribe   = 2,
    Event       = 3,
    Unsubscribe = 4,
    Error       = 5
};

inline constexpr std::uint64_t MESSAGE_TYPE_MAX = 5;

[[nodiscard]]
inline constexpr std::string_view to_string(MessageType t) noexcept {
    switch (t) {
        case MessageType::Request:     return "Request";
        case MessageType::Reply:       return "Reply";
        case MessageType::Subscribe:   return "Subscribe";
        case MessageType::Event:       return "Event";
        case MessageType::Unsubscribe: return "Unsubscribe";
        case MessageType::Error:       return "Error";
        default:                       return "Unknown";
    }
}


// ===============================================
// FRAME
// ===============================================
// One wire message. `payload` is the JSON text carried by the "o" field,
// not yet validated against any schema.
struct Frame {
    MessageType type{MessageType::Request};
    std::uint64_t sequence{0};
    std::string endpoint;
    std::string payload;

    // Replies and errors answer a request; everything else is unsolicited
    [[nodiscard]]
    bool is_response() const noexcept {
        return type == MessageType::Reply || type == MessageType::Error;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Frame& f) {
    return os << "{m=" << to_string(f.type) << ", i=" << f.sequence << ", n=" << f.endpoint
              << ", o=" << f.payload.size() << " bytes}";
}

} // namespace ndaxlink::core::protocol::ndax
