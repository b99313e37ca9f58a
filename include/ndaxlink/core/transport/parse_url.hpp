#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include "ndaxlink/core/transport/error.hpp"


namespace ndaxlink::core::transport {

struct ParsedUrl {
    bool secure{true};      // wss
    std::string host;
    std::string port;       // kept as text, it goes straight to the resolver
    std::string path;
};

// Splits a gateway URL into what the socket needs to connect and upgrade.
//
//   wss://api.ndax.io/WSGateway/   secure  api.ndax.io  443   /WSGateway/
//   ws://localhost:8080            plain   localhost    8080  /
//
// Only ws and wss are accepted. No userinfo, no IPv6 literals; a query
// string is left in the path.
[[nodiscard]]
inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
    out = ParsedUrl{};

    std::string_view rest;
    if (url.starts_with("wss://")) {
        rest = url.substr(6);
    }
    else if (url.starts_with("ws://")) {
        out.secure = false;
        rest = url.substr(5);
    }
    else {
        return Error::InvalidUrl;
    }

    const auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    out.path = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));

    std::string_view port = out.secure ? "443" : "80";
    if (const auto colon = authority.find(':'); colon != std::string_view::npos) {
        port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
    }

    if (authority.empty() || authority.find_first_of(" @?#") != std::string_view::npos) {
        return Error::InvalidUrl;
    }

    std::uint32_t number = 0;
    const auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), number);
    if (port.empty() || ec != std::errc{} || end != port.data() + port.size()
        || number == 0 || number > 65535) {
        return Error::InvalidUrl;
    }

    out.host = std::string(authority);
    out.port = std::string(port);
    return Error::None;
}

} // namespace ndaxlink::core::transport
