#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "ndaxlink/core/protocol/ndax/parser/result.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
NDAX JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Schema-agnostic helpers that extract primitive values from simdjson DOM
elements. They back every payload parser (auth replies, level1/level2,
trades, ticker bars, account events).

Two shapes exist on the NDAX gateway:
  - objects   {"InstrumentId":7,"BestBid":10.5,...}
  - row arrays [[1001, 7, 0.25, 65000.1, ...], ...] (level2, trades, ticker)

Rules:
  - Helpers never log, never throw, never interpret values
  - On failure `out` is left untouched
  - NDAX serializes numbers loosely (integers where decimals are expected),
    so decimal getters accept any JSON number

================================================================================
*/


namespace ndaxlink::core::protocol::ndax::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return root.type() == simdjson::dom::element_type::OBJECT ? Result::Ok : Result::InvalidSchema;
}

[[nodiscard]]
inline Result require_array(const simdjson::dom::element& root, simdjson::dom::array& out) noexcept {
    return root.get(out) ? Result::InvalidSchema : Result::Ok;
}

// ============================================================================
// OBJECT FIELDS - REQUIRED
// ============================================================================

[[nodiscard]]
inline Result parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    std::uint64_t v;
    if (obj[key].get(v)) {
        return Result::InvalidSchema;
    }
    out = v;
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_double_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    double v;
    if (obj[key].get(v)) {
        return Result::InvalidSchema;
    }
    out = v;
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_bool_required(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    bool v;
    if (obj[key].get(v)) {
        return Result::InvalidSchema;
    }
    out = v;
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    std::string_view sv;
    if (obj[key].get(sv)) {
        return Result::InvalidSchema;
    }
    out.assign(sv.data(), sv.size());
    return Result::Ok;
}

// ============================================================================
// OBJECT FIELDS - OPTIONAL
// ============================================================================
// Absent or null -> Ok with `out` reset. Present with the wrong type -> InvalidSchema.

template <typename T>
[[nodiscard]]
inline Result parse_optional_(const simdjson::dom::element& obj, const char* key, lcr::optional<T>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.value_unsafe().is_null()) {
        return Result::Ok;
    }
    T v;
    if (field.get(v)) {
        return Result::InvalidSchema;
    }
    out = v;
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_uint64_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::uint64_t>& out) noexcept {
    return parse_optional_(obj, key, out);
}

[[nodiscard]]
inline Result parse_double_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<double>& out) noexcept {
    return parse_optional_(obj, key, out);
}

[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<bool>& out) noexcept {
    return parse_optional_(obj, key, out);
}

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::string>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.value_unsafe().is_null()) {
        return Result::Ok;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    out = std::string(sv);
    return Result::Ok;
}

// Integer that some gateway builds serialize as a decimal string
// ("TimeStamp":"1700000000123"). Absent or null -> Ok with `out` reset.
[[nodiscard]]
inline Result parse_uint64_lenient_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::uint64_t>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.value_unsafe().is_null()) {
        return Result::Ok;
    }
    std::uint64_t v;
    if (!field.get(v)) {
        out = v;
        return Result::Ok;
    }
    std::string_view sv;
    if (field.get(sv) || sv.empty()) {
        return Result::InvalidSchema;
    }
    v = 0;
    for (char c : sv) {
        if (c < '0' || c > '9') {
            return Result::InvalidValue;
        }
        v = v * 10 + static_cast<std::uint64_t>(c - '0');
    }
    out = v;
    return Result::Ok;
}

// ============================================================================
// ROW ARRAYS (positional fields)
// ============================================================================

[[nodiscard]]
inline Result parse_uint64_at(const simdjson::dom::array& row, std::size_t index, std::uint64_t& out) noexcept {
    std::uint64_t v;
    if (row.at(index).get(v)) {
        return Result::InvalidSchema;
    }
    out = v;
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_int64_at(const simdjson::dom::array& row, std::size_t index, std::int64_t& out) noexcept {
    std::int64_t v;
    if (row.at(index).get(v)) {
        return Result::InvalidSchema;
    }
    out = v;
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_double_at(const simdjson::dom::array& row, std::size_t index, double& out) noexcept {
    double v;
    if (row.at(index).get(v)) {
        return Result::InvalidSchema;
    }
    out = v;
    return Result::Ok;
}

// Flags appear both as JSON booleans and as 0/1
[[nodiscard]]
inline Result parse_flag_at(const simdjson::dom::array& row, std::size_t index, bool& out) noexcept {
    auto field = row.at(index);
    bool b;
    if (!field.get(b)) {
        out = b;
        return Result::Ok;
    }
    std::uint64_t v;
    if (field.get(v) || v > 1) {
        return Result::InvalidSchema;
    }
    out = (v == 1);
    return Result::Ok;
}

} // namespace ndaxlink::core::protocol::ndax::parser::helper
