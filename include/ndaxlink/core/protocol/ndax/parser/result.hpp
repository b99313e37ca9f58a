#pragma once

#include <cstdint>
#include <string_view>


namespace ndaxlink::core::protocol::ndax::parser {

// Outcome of decoding one payload, and then of routing it.
//
// Field helpers answer Ok or one of the Invalid* values; whole-message
// parsers answer Parsed, Ignored or Invalid*. The registry adds Delivered
// and Unmatched once a handler was (or was not) found for the stream.
enum class Result : std::uint8_t {
    Ok,
    Parsed,
    Ignored,         // valid, but nothing to deliver (e.g. an empty snapshot)
    InvalidJson,     // simdjson could not parse the text
    InvalidSchema,   // missing key or wrong JSON type
    InvalidValue,    // right type, unusable value (negative price, unknown side)

    Delivered,
    Unmatched
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:            return "Ok";
        case Result::Parsed:        return "Parsed";
        case Result::Ignored:       return "Ignored";
        case Result::InvalidJson:   return "InvalidJson";
        case Result::InvalidSchema: return "InvalidSchema";
        case Result::InvalidValue:  return "InvalidValue";
        case Result::Delivered:     return "Delivered";
        case Result::Unmatched:     return "Unmatched";
        default:                    return "Unknown";
    }
}

// Decode failures are what the session reports through the error handler
[[nodiscard]]
inline constexpr bool is_decode_error(Result r) noexcept {
    return r == Result::InvalidJson || r == Result::InvalidSchema || r == Result::InvalidValue;
}

} // namespace ndaxlink::core::protocol::ndax::parser
