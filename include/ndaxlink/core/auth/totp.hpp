#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <chrono>

#include <openssl/evp.h>
#include <openssl/hmac.h>

/*
===============================================================================
 Time-based one-time passwords (RFC 6238 over RFC 4226)
===============================================================================

  counter = floor(unix_time / step)
  hmac    = HMAC-SHA1(secret, counter as 8 big-endian bytes)
  offset  = hmac[19] & 0x0f
  code    = (hmac[offset..offset+3] & 0x7fffffff) mod 10^digits

The secret is the base32 text shown by authenticator apps. Codes are only
valid inside one step, so the local clock must be within ~30 s of the
gateway's.
===============================================================================
*/

namespace ndaxlink::core::auth::totp {

inline constexpr std::uint64_t STEP_SECONDS = 30;
inline constexpr int DIGITS = 6;

// RFC 4648 base32, case-insensitive. Spaces, dashes and '=' padding are
// skipped. Returns false on any other character.
[[nodiscard]]
inline bool base32_decode(std::string_view text, std::vector<unsigned char>& out) {
    out.clear();
    out.reserve(text.size() * 5 / 8 + 1);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        int v;
        if (c >= 'A' && c <= 'Z')      v = c - 'A';
        else if (c >= 'a' && c <= 'z') v = c - 'a';
        else if (c >= '2' && c <= '7') v = c - '2' + 26;
        else if (c == '=' || c == ' ' || c == '-') continue;
        else return false;

        buffer = (buffer << 5) | static_cast<std::uint32_t>(v);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<unsigned char>((buffer >> bits) & 0xFF));
        }
    }
    return true;
}

// HOTP value for an explicit counter. Returns false when the key is empty
// or the HMAC cannot be computed.
[[nodiscard]]
inline bool hotp(const std::vector<unsigned char>& key, std::uint64_t counter, int digits, std::uint32_t& out) {
    if (key.empty() || digits < 1 || digits > 9) {
        return false;
    }

    unsigned char msg[8];
    for (int i = 7; i >= 0; --i) {
        msg[i] = static_cast<unsigned char>(counter & 0xFF);
        counter >>= 8;
    }

    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()), msg, sizeof(msg), mac, &mac_len) == nullptr
        || mac_len < 20) {
        return false;
    }

    const unsigned offset = mac[mac_len - 1] & 0x0F;
    const std::uint32_t binary =
          (static_cast<std::uint32_t>(mac[offset]     & 0x7F) << 24)
        | (static_cast<std::uint32_t>(mac[offset + 1] & 0xFF) << 16)
        | (static_cast<std::uint32_t>(mac[offset + 2] & 0xFF) << 8)
        |  static_cast<std::uint32_t>(mac[offset + 3] & 0xFF);

    std::uint32_t modulo = 1;
    for (int i = 0; i < digits; ++i) {
        modulo *= 10;
    }
    out = binary % modulo;
    return true;
}

// Zero-padded code for `now`. Empty string when the secret is not valid base32.
[[nodiscard]]
inline std::string code(std::string_view secret_base32,
                        std::chrono::system_clock::time_point now,
                        int digits = DIGITS) {
    std::vector<unsigned char> key;
    if (!base32_decode(secret_base32, key)) {
        return {};
    }

    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    if (seconds < 0) {
        return {};
    }

    std::uint32_t value = 0;
    if (!hotp(key, static_cast<std::uint64_t>(seconds) / STEP_SECONDS, digits, value)) {
        return {};
    }

    std::string s = std::to_string(value);
    if (s.size() < static_cast<std::size_t>(digits)) {
        s.insert(0, static_cast<std::size_t>(digits) - s.size(), '0');
    }
    return s;
}

} // namespace ndaxlink::core::auth::totp
