#pragma once

#include <cstdint>
#include <string>

#include "lcr/json.hpp"


namespace ndaxlink::core::protocol::ndax::schema::auth {

// ===============================================
// REQUESTS
// ===============================================

// AuthenticateUser {"UserName":...,"Password":...}
struct AuthenticateUser {
    std::string username;
    std::string password;

    std::string to_json() const {
        std::string j;
        j.reserve(48 + username.size() + password.size());
        j += "{\"UserName\":";
        lcr::json::append_string(j, username);
        j += ",\"Password\":";
        lcr::json::append_string(j, password);
        j += "}";
        return j;
    }
};

// Authenticate2FA {"Code":"123456"}
struct Authenticate2FA {
    std::string code;

    std::string to_json() const {
        std::string j;
        j.reserve(24);
        j += "{\"Code\":";
        lcr::json::append_string(j, code);
        j += "}";
        return j;
    }
};


// ===============================================
// REPLY (AuthenticateUser / Authenticate2FA)
// ===============================================
// Accepted, first factor only:  {"Authenticated":true,"Requires2FA":true,"AuthType":"Google",...}
// Accepted, complete:           {"Authenticated":true,"SessionToken":"...","User":{"UserId":42,...}}
// Second factor accepted:       {"Authenticated":true,"UserId":42,"SessionToken":"..."}
// Refused:                      {"Authenticated":false,"errormsg":"Invalid username or password"}
struct Reply {
    bool authenticated{false};
    bool requires_2fa{false};
    bool locked{false};
    std::string session_token;
    std::uint64_t user_id{0};
    std::string errormsg;
};

} // namespace ndaxlink::core::protocol::ndax::schema::auth
