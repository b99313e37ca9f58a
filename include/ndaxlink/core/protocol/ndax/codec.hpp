#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "ndaxlink/core/protocol/ndax/frame.hpp"
#include "lcr/json.hpp"

#include "simdjson.h"

/*
===============================================================================
 NDAX Frame Codec
===============================================================================

Every gateway message is one JSON text frame:

    {"m":<type>,"i":<sequence>,"n":"<endpoint>","o":"<payload as JSON text>"}

The payload travels as a JSON string holding serialized JSON. Some gateway
builds inline it as an object or array instead. Both are accepted on decode
and normalized to JSON text. encode() always emits the string form.

Decode failures are per-frame: the caller drops the frame, counts it and
keeps the connection.
===============================================================================
*/

namespace ndaxlink::core::protocol::ndax {

enum class DecodeError : std::uint8_t {
    None = 0,
    InvalidJson,          // not JSON, or root is not an object
    MissingField,         // one of m / i / n / o absent
    InvalidSequence,      // "i" is not an unsigned integer
    UnknownMessageType,   // "m" is not an integer in 0..5
    InvalidEndpoint,      // "n" is not a string
    InvalidPayload        // "o" is neither a string nor an object/array
};

[[nodiscard]]
inline constexpr std::string_view to_string(DecodeError e) noexcept {
    switch (e) {
        case DecodeError::None:               return "None";
        case DecodeError::InvalidJson:        return "InvalidJson";
        case DecodeError::MissingField:       return "MissingField";
        case DecodeError::InvalidSequence:    return "InvalidSequence";
        case DecodeError::UnknownMessageType: return "UnknownMessageType";
        case DecodeError::InvalidEndpoint:    return "InvalidEndpoint";
        case DecodeError::InvalidPayload:     return "InvalidPayload";
        default:                              return "Unknown";
    }
}


class Codec {
public:
    Codec() = default;

    Codec(const Codec&) = delete;
    Codec& operator=(const Codec&) = delete;

    // `payload` must be JSON text; it is embedded as an escaped string.
    [[nodiscard]]
    static std::string encode(MessageType type, std::uint64_t sequence, std::string_view endpoint, std::string_view payload) {
        std::string out;
        out.reserve(32 + endpoint.size() + payload.size() + payload.size() / 4);
        out.append("{\"m\":");
        lcr::json::append(out, static_cast<std::uint64_t>(type));
        out.append(",\"i\":");
        lcr::json::append(out, sequence);
        out.append(",\"n\":");
        lcr::json::append_string(out, endpoint);
        out.append(",\"o\":");
        lcr::json::append_string(out, payload.empty() ? std::string_view("{}") : payload);
        out.push_back('}');
        return out;
    }

    // On success `out` holds the frame. On failure `out` is unspecified.
    // Not thread-safe (one parser per codec).
    [[nodiscard]]
    DecodeError decode(std::string_view text, Frame& out) {
        simdjson::dom::element root;
        if (parser_.parse(text.data(), text.size()).get(root)) {
            return DecodeError::InvalidJson;
        }
        if (root.type() != simdjson::dom::element_type::OBJECT) {
            return DecodeError::InvalidJson;
        }

        // --- m ---
        auto m = root["m"];
        if (m.error() == simdjson::NO_SUCH_FIELD) {
            return DecodeError::MissingField;
        }
        std::uint64_t type = 0;
        if (m.get(type) || type > MESSAGE_TYPE_MAX) {
            return DecodeError::UnknownMessageType;
        }

        // --- i ---
        auto i = root["i"];
        if (i.error() == simdjson::NO_SUCH_FIELD) {
            return DecodeError::MissingField;
        }
        std::uint64_t sequence = 0;
        if (i.get(sequence)) {
            return DecodeError::InvalidSequence;
        }

        // --- n ---
        auto n = root["n"];
        if (n.error() == simdjson::NO_SUCH_FIELD) {
            return DecodeError::MissingField;
        }
        std::string_view endpoint;
        if (n.get(endpoint)) {
            return DecodeError::InvalidEndpoint;
        }

        // --- o ---
        auto o = root["o"];
        if (o.error() == simdjson::NO_SUCH_FIELD) {
            return DecodeError::MissingField;
        }
        simdjson::dom::element body;
        if (o.get(body)) {
            return DecodeError::InvalidPayload;
        }
        switch (body.type()) {
            case simdjson::dom::element_type::STRING: {
                std::string_view sv;
                if (body.get(sv)) {
                    return DecodeError::InvalidPayload;
                }
                out.payload.assign(sv.data(), sv.size());
                break;
            }
            case simdjson::dom::element_type::OBJECT:
            case simdjson::dom::element_type::ARRAY:
                out.payload = simdjson::minify(body);
                break;
            default:
                return DecodeError::InvalidPayload;
        }

        out.type = static_cast<MessageType>(type);
        out.sequence = sequence;
        out.endpoint.assign(endpoint.data(), endpoint.size());
        return DecodeError::None;
    }

private:
    simdjson::dom::parser parser_;
};

} // namespace ndaxlink::core::protocol::ndax
