#include <atomic>
#include <csignal>
#include <chrono>
#include <iostream>
#include <thread>

#include "livestand.hpp"

#if defined(_WIN32)
#include "livestand/transport/winhttp/websocket.hpp"
#else
#include "livestand/transport/beast/websocket.hpp"
#endif

#include "common/cli/params.hpp"

namespace cli = livestand::examples::cli;
using namespace livestand;

#if defined(_WIN32)
using WebSocket = transport::winhttp::WebSocket;
#else
using WebSocket = transport::beast::WebSocket;
#endif

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
    // Signal handling
    // -------------------------------------------------------------
    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    const auto params = cli::configure_client(argc, argv, "Livestand - Live Standing Client\n"
        "Connects to a tournament broadcast server and prints the reconciled\n"
        "leaderboard diff for every paced snapshot.\n"
    );
    params.dump("=== Client Parameters ===", std::cout);

    // -------------------------------------------------------------
    // Pipeline setup
    // -------------------------------------------------------------
    Pipeline<WebSocket> pipeline(params.to_config());

    pipeline.on_status_change([](transport::Status status) {
        LS_INFO(" -> status: " << transport::to_string(status));
    });

    std::size_t diffs = 0;
    pipeline.on_diff([&](const reconcile::Diff& diff) {
        ++diffs;
        std::cout << diff;
        for (const auto& e : diff.eliminations) {
            std::cout << " -> " << e.name << " eliminated (#" << e.placement_rank << " of " << e.teams_in_match << ")\n";
        }
        if (diff.match_ended) {
            std::cout << " -> Match ended\n";
        }
    });

    // Connect
    auto err = pipeline.connect(params.endpoint(), params.token);
    if (err == transport::Error::InvalidUrl || err == transport::Error::InvalidState) {
        LS_ERROR("Cannot start client: " << transport::to_string(err));
        return -1;
    }

    // -------------------------------------------------------------------------
    // Main polling loop (runs until Ctrl+C)
    // -------------------------------------------------------------------------
    while (running.load()) {
        pipeline.poll();   // REQUIRED to receive, reconnect and deliver
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    pipeline.close();

#ifdef LIVESTAND_ENABLE_TELEMETRY_L1
    pipeline.connection().telemetry().debug_dump(std::cout);
    pipeline.dispatcher().telemetry().debug_dump(std::cout);
#endif

    std::cout << "=== Done (" << diffs << " diffs) ===\n";
    return 0;
}
