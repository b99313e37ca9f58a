#pragma once

#include <string_view>

#include "ndaxlink/core/protocol/ndax/schema/auth.hpp"
#include "ndaxlink/core/protocol/ndax/parser/result.hpp"
#include "ndaxlink/core/protocol/ndax/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace ndaxlink::core::protocol::ndax::parser::auth {

struct reply {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::auth::Reply& out) noexcept {
        out = schema::auth::Reply{};

        // Root
        auto r = helper::require_object(root);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Root not an object in auth reply -> ignore message.");
            return r;
        }

        // Authenticated (required)
        r = helper::parse_bool_required(root, "Authenticated", out.authenticated);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Field 'Authenticated' missing or invalid in auth reply -> ignore message.");
            return r;
        }

        // Requires2FA (optional)
        lcr::optional<bool> requires_2fa;
        r = helper::parse_bool_optional(root, "Requires2FA", requires_2fa);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Field 'Requires2FA' invalid in auth reply -> ignore message.");
            return r;
        }
        out.requires_2fa = requires_2fa.value_or(false);

        // Locked (optional)
        lcr::optional<bool> locked;
        r = helper::parse_bool_optional(root, "Locked", locked);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Field 'Locked' invalid in auth reply -> ignore message.");
            return r;
        }
        out.locked = locked.value_or(false);

        // SessionToken (optional)
        lcr::optional<std::string> token;
        r = helper::parse_string_optional(root, "SessionToken", token);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Field 'SessionToken' invalid in auth reply -> ignore message.");
            return r;
        }
        if (token.has()) {
            out.session_token = token.take();
        }

        // UserId at the root (2FA reply) or inside "User" (single-step login)
        lcr::optional<std::uint64_t> user_id;
        r = helper::parse_uint64_optional(root, "UserId", user_id);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Field 'UserId' invalid in auth reply -> ignore message.");
            return r;
        }
        if (!user_id.has()) {
            simdjson::dom::element user;
            if (!root["User"].get(user) && user.type() == simdjson::dom::element_type::OBJECT) {
                r = helper::parse_uint64_optional(user, "UserId", user_id);
                if (r != Result::Ok) {
                    NL_DEBUG("[PARSER] Field 'User.UserId' invalid in auth reply -> ignore message.");
                    return r;
                }
            }
        }
        out.user_id = user_id.value_or(0);

        // errormsg (optional)
        lcr::optional<std::string> errormsg;
        r = helper::parse_string_optional(root, "errormsg", errormsg);
        if (r != Result::Ok) {
            NL_DEBUG("[PARSER] Field 'errormsg' invalid in auth reply -> ignore message.");
            return r;
        }
        if (errormsg.has()) {
            out.errormsg = errormsg.take();
        }

        return Result::Parsed;
    }
};

} // namespace ndaxlink::core::protocol::ndax::parser::auth
