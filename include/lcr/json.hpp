#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <charconv>
#include <cmath>
#include <system_error>


namespace lcr {
namespace json {


// Appends `s` escaped for use inside a JSON string literal (no surrounding quotes).
inline void escape_into(std::string& out, std::string_view s) {
    static constexpr char HEX[] = "0123456789abcdef";
    for (char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += HEX[(c >> 4) & 0x0F];
                    out += HEX[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

inline std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    escape_into(out, s);
    return out;
}

// Appends a quoted, escaped JSON string
inline void append_string(std::string& out, std::string_view s) {
    out += '\"';
    escape_into(out, s);
    out += '\"';
}

// Fast integer -> string formatter
inline void append(std::string& out, std::uint64_t value)
{
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = '0' + (value % 10);
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

// Decimal formatter for prices and quantities (shortest round-trip form).
// JSON has no NaN or infinity: those append nothing and return false.
inline bool append_decimal(std::string& out, double value)
{
    if (!std::isfinite(value)) {
        return false;
    }
    char buf[32];
    const auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        return false;
    }
    out.append(buf, end);
    return true;
}

inline void append_bool(std::string& out, bool value)
{
    out += value ? "true" : "false";
}

} // namespace json
} // namespace lcr
