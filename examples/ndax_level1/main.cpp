#include <atomic>
#include <csignal>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <CLI/CLI.hpp>

#include "ndaxlink/client.hpp"
#include "ndaxlink/core/protocol/ndax/parser/account.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

using namespace ndaxlink;
using namespace ndaxlink::core::protocol::ndax;
using namespace lcr::log;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    CLI::App app{"ndaxlink - NDAX Level 1 Example\n"
        "Logs in to the NDAX gateway, prints the account positions and streams\n"
        "top-of-book updates for one instrument.\n"};

    std::string url                 = "wss://api.ndax.io/WSGateway/";
    std::uint64_t instrument_id     = 1;
    std::uint64_t account_id        = 0;
    std::string username;
    std::string password;
    std::string second_factor;
    std::string log_level           = "info";

    auto ws_url_validator = CLI::Validator(
        [](std::string &value) -> std::string {
            if (value.rfind("ws://", 0) == 0 || value.rfind("wss://", 0) == 0) {
                return {}; // OK
            }
            return "URL must start with ws:// or wss://";
        },
        "WebSocket URL validator"
    );

    app.add_option("--url", url, "NDAX WebSocket gateway URL")->check(ws_url_validator)->default_val(url);
    app.add_option("-i,--instrument", instrument_id, "Instrument id (1 = BTC/CAD)")->default_val(instrument_id);
    app.add_option("-a,--account", account_id, "Account id")->envname("NDAX_ACCOUNT_ID")->required();
    app.add_option("-u,--user", username, "User name")->envname("NDAX_USERNAME")->required();
    app.add_option("-p,--password", password, "Password")->envname("NDAX_PASSWORD")->required();
    app.add_option("--2fa-secret", second_factor, "Base32 TOTP secret, if 2FA is enabled")->envname("NDAX_2FA_SECRET");
    app.add_option("-l, --log-level", log_level, "Log level: trace | debug | info | warn | error | off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal", "off"}))
        ->default_val(log_level);
    app.footer(
        "Credentials are read from the environment when not given on the command line.\n"
        "This example runs indefinitely until interrupted.\n"
        "Press Ctrl+C to unsubscribe and exit cleanly."
    );

    CLI11_PARSE(app, argc, argv);

    // -------------------------------------------------------------
    // Logging
    // -------------------------------------------------------------
    Logger::instance().set_level(parse_level(log_level));

    // -------------------------------------------------------------
    // Signal handling
    // -------------------------------------------------------------
    std::signal(SIGINT, on_signal);

    std::cout << "=== ndaxlink Level 1 Example ===\n"
              << "Instrument : " << instrument_id << "\n"
              << "Account    : " << account_id << "\n"
              << "URL        : " << url << "\n"
              << "Press Ctrl+C to exit\n\n";

    // -------------------------------------------------------------
    // Client setup
    // -------------------------------------------------------------
    ClientConfig cfg;
    cfg.endpoint = url;
    cfg.credentials.account_id = account_id;
    cfg.credentials.username = username;
    cfg.credentials.password = password;
    cfg.credentials.second_factor_secret = second_factor;
    cfg.error_handler = [](std::string_view code, std::string_view message) {
        NL_WARN(" -> [" << code << "] " << message);
    };

    Client client(std::move(cfg));

    // Subscribed before login: sent once the session is authenticated
    const auto sub = client.subscribe_level1(instrument_id, [](const schema::level1::Update& u) {
        std::cout << " -> " << u << std::endl;
    });

    const auto outcome = client.start().get();
    if (!outcome.ok()) {
        std::cerr << "Login failed: " << core::auth::to_string(outcome.failure) << " (" << outcome.reason << ")\n";
        client.stop();
        return -1;
    }
    std::cout << "Authenticated as user " << outcome.user_id << "\n";

    // -------------------------------------------------------------
    // Account positions
    // -------------------------------------------------------------
    const auto reply = client.get_account_positions().get();
    if (reply.ok()) {
        simdjson::dom::parser json;
        simdjson::dom::element root;
        std::vector<schema::account::Position> positions;
        if (!json.parse(reply.payload).get(root)
            && parser::account::positions::parse(root, positions) == parser::Result::Parsed) {
            std::cout << "Positions:\n";
            for (const auto& p : positions) {
                std::cout << "  " << p << "\n";
            }
        }
        else {
            std::cerr << "Unreadable positions reply\n";
        }
    }
    else {
        std::cerr << "GetAccountPositions failed: " << reply << "\n";
    }

    // Main loop: updates arrive on the client's dispatch thread
    while (running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // Ctrl+C received
    client.unsubscribe(sub);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    client.stop();

    const auto& t = client.telemetry();
    std::cout << "Frames received : " << t.frames_received_total.load() << "\n"
              << "Events delivered: " << t.events_delivered_total.load() << "\n"
              << "Decode errors   : " << t.decode_errors_total.load() << "\n";
    std::cout << "=== Done ===\n";
    return 0;
}
