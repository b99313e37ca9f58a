#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <chrono>
#include <utility>

#include "ndaxlink/core/auth/state.hpp"
#include "ndaxlink/core/auth/credentials.hpp"
#include "ndaxlink/core/auth/totp.hpp"
#include "ndaxlink/core/protocol/ndax/response.hpp"
#include "ndaxlink/core/protocol/ndax/schema/auth.hpp"
#include "ndaxlink/core/protocol/ndax/parser/auth.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

/*
===============================================================================
 Authentication state machine
===============================================================================

Pure protocol logic: no I/O, no timers. The Session feeds it transport facts
and request replies, it answers with the next action.

  Disconnected --on_connecting--> Connecting --begin--> AwaitingChallenge
  AwaitingChallenge    --accepted, 2FA required--> AwaitingSecondFactor
  AwaitingChallenge    --accepted-->                Authenticated
  AwaitingSecondFactor --accepted-->                Authenticated
  any awaiting state   --refused-->                 AuthFailed
  any state            --on_disconnected-->         Disconnected (AuthFailed is sticky)

A reply that times out is a transport fault (Action::ResetTransport): the
owner drops the connection and the sequence restarts from the top after
the reconnect. AuthFailed is terminal until reset().
===============================================================================
*/

namespace ndaxlink::core::auth {

class Machine {
public:
    enum class Action : std::uint8_t {
        None,               // nothing to do (stale or irrelevant reply)
        SendSecondFactor,   // submit Authenticate2FA with second_factor_payload()
        Authenticated,      // flush subscriptions, resolve start()
        Failed,             // tear down without retry, see failure()/reason()
        ResetTransport      // reply timed out, reconnect and start over
    };

    explicit Machine(Credentials credentials)
        : credentials_(std::move(credentials))
    {}

    Machine(const Machine&) = delete;
    Machine& operator=(const Machine&) = delete;

    // ---------------------------------------------------------------------
    // Transport facts
    // ---------------------------------------------------------------------

    void on_connecting() noexcept {
        if (state_ == State::Disconnected) {
            transition_(State::Connecting);
        }
    }

    // Transport is up: returns the AuthenticateUser payload.
    [[nodiscard]]
    std::string begin() {
        session_token_.clear();
        user_id_ = 0;
        ++attempts_;
        transition_(State::AwaitingChallenge);
        return protocol::ndax::schema::auth::AuthenticateUser{credentials_.username, credentials_.password}.to_json();
    }

    void on_disconnected() noexcept {
        if (state_ == State::AuthFailed) {
            return;
        }
        session_token_.clear();
        transition_(State::Disconnected);
    }

    // ---------------------------------------------------------------------
    // Replies
    // ---------------------------------------------------------------------

    [[nodiscard]]
    Action on_user_reply(const protocol::ndax::Response& resp, std::chrono::system_clock::time_point now) {
        if (state_ != State::AwaitingChallenge) {
            NL_DEBUG("[AUTH] AuthenticateUser reply ignored in state " << to_string(state_));
            return Action::None;
        }

        Action a = Action::None;
        if (!check_status_(resp, Failure::CredentialsRejected, a)) {
            return a;
        }

        protocol::ndax::schema::auth::Reply reply;
        if (!parse_reply_(resp.payload, reply)) {
            return fail(Failure::ProtocolError, "unreadable AuthenticateUser reply");
        }

        if (!reply.authenticated) {
            if (reply.locked) {
                return fail(Failure::Locked, reply.errormsg.empty() ? std::string("account locked") : reply.errormsg);
            }
            return fail(Failure::CredentialsRejected,
                        reply.errormsg.empty() ? std::string("invalid credentials") : reply.errormsg);
        }

        if (reply.requires_2fa) {
            if (!credentials_.has_second_factor()) {
                return fail(Failure::SecondFactorRejected, "second factor required but no secret configured");
            }
            std::string code = totp::code(credentials_.second_factor_secret, now);
            if (code.empty()) {
                return fail(Failure::SecondFactorRejected, "second factor secret is not valid base32");
            }
            second_factor_payload_ = protocol::ndax::schema::auth::Authenticate2FA{std::move(code)}.to_json();
            transition_(State::AwaitingSecondFactor);
            return Action::SendSecondFactor;
        }

        accept_(reply);
        return Action::Authenticated;
    }

    [[nodiscard]]
    Action on_second_factor_reply(const protocol::ndax::Response& resp) {
        if (state_ != State::AwaitingSecondFactor) {
            NL_DEBUG("[AUTH] Authenticate2FA reply ignored in state " << to_string(state_));
            return Action::None;
        }

        Action a = Action::None;
        if (!check_status_(resp, Failure::SecondFactorRejected, a)) {
            return a;
        }

        protocol::ndax::schema::auth::Reply reply;
        if (!parse_reply_(resp.payload, reply)) {
            return fail(Failure::ProtocolError, "unreadable Authenticate2FA reply");
        }

        if (!reply.authenticated) {
            std::string reason = reply.errormsg.empty() ? std::string("second factor refused") : reply.errormsg;
            reason += " (codes are valid for one 30 s step, check the local clock)";
            return fail(Failure::SecondFactorRejected, std::move(reason));
        }

        accept_(reply);
        return Action::Authenticated;
    }

    // Enters AuthFailed. Also used by the owner for Cancelled.
    Action fail(Failure failure, std::string reason) {
        failure_ = failure;
        reason_ = std::move(reason);
        session_token_.clear();
        transition_(State::AuthFailed);
        NL_WARN("[AUTH] authentication failed: " << to_string(failure_) << " (" << reason_ << ")");
        return Action::Failed;
    }

    // Back to Disconnected with no failure recorded (next start()).
    void reset() noexcept {
        failure_ = Failure::None;
        reason_.clear();
        session_token_.clear();
        user_id_ = 0;
        state_ = State::Disconnected;
    }

    // ---------------------------------------------------------------------
    // Accessors
    // ---------------------------------------------------------------------

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool is_authenticated() const noexcept { return state_ == State::Authenticated; }
    [[nodiscard]] bool is_awaiting() const noexcept {
        return state_ == State::AwaitingChallenge || state_ == State::AwaitingSecondFactor;
    }
    [[nodiscard]] Failure failure() const noexcept { return failure_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }
    [[nodiscard]] const std::string& session_token() const noexcept { return session_token_; }
    [[nodiscard]] std::uint64_t user_id() const noexcept { return user_id_; }
    [[nodiscard]] std::uint64_t attempts() const noexcept { return attempts_; }
    [[nodiscard]] const std::string& second_factor_payload() const noexcept { return second_factor_payload_; }
    [[nodiscard]] const Credentials& credentials() const noexcept { return credentials_; }

    [[nodiscard]]
    Outcome outcome() const {
        Outcome o;
        o.failure = failure_;
        o.reason = reason_;
        if (state_ == State::Authenticated) {
            o.session_token = session_token_;
            o.user_id = user_id_;
        }
        return o;
    }

private:
    Credentials credentials_;
    State state_{State::Disconnected};
    Failure failure_{Failure::None};
    std::string reason_;
    std::string session_token_;
    std::uint64_t user_id_{0};
    std::uint64_t attempts_{0};
    std::string second_factor_payload_;

    simdjson::dom::parser parser_;

private:
    void transition_(State next) noexcept {
        if (state_ != next) {
            NL_DEBUG("[AUTH] " << to_string(state_) << " -> " << to_string(next));
            state_ = next;
        }
    }

    // Returns true when the reply carries a body worth parsing. Otherwise
    // `action` holds what the owner must do.
    bool check_status_(const protocol::ndax::Response& resp, Failure refused, Action& action) {
        using protocol::ndax::Status;
        switch (resp.status) {
            case Status::Ok:
                return true;
            case Status::Rejected:
            case Status::ServerError:
                action = fail(refused, resp.reason.empty() ? std::string("refused by gateway") : resp.reason);
                return false;
            case Status::Timeout:
                NL_WARN("[AUTH] no reply to " << resp.endpoint << " -> resetting transport");
                transition_(State::Connecting);
                action = Action::ResetTransport;
                return false;
            case Status::ConnectionLost:
            case Status::AuthFailed:
            case Status::ShuttingDown:
            default:
                // Transport or owner already drives the state
                action = Action::None;
                return false;
        }
    }

    bool parse_reply_(std::string_view payload, protocol::ndax::schema::auth::Reply& out) {
        simdjson::dom::element root;
        if (parser_.parse(payload.data(), payload.size()).get(root)) {
            return false;
        }
        return protocol::ndax::parser::auth::reply::parse(root, out) == protocol::ndax::parser::Result::Parsed;
    }

    void accept_(protocol::ndax::schema::auth::Reply& reply) {
        session_token_ = std::move(reply.session_token);
        user_id_ = reply.user_id;
        failure_ = Failure::None;
        reason_.clear();
        transition_(State::Authenticated);
        NL_INFO("[AUTH] authenticated (user id " << user_id_ << ")");
    }
};

} // namespace ndaxlink::core::auth
