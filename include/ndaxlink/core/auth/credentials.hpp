#pragma once

#include <cstdint>
#include <string>
#include <ostream>


namespace ndaxlink::core::auth {

// Login material. Never logged: operator<< masks the secrets.
struct Credentials {
    std::uint64_t account_id{0};
    std::string username;
    std::string password;
    std::string second_factor_secret;   // base32 TOTP secret, empty if 2FA is off

    [[nodiscard]]
    bool has_second_factor() const noexcept {
        return !second_factor_secret.empty();
    }
};

inline std::ostream& operator<<(std::ostream& os, const Credentials& c) {
    return os << "{account=" << c.account_id << ", user=" << c.username
              << ", password=***, 2fa=" << (c.has_second_factor() ? "***" : "none") << "}";
}

} // namespace ndaxlink::core::auth
