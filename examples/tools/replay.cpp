#include <atomic>
#include <csignal>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "livestand.hpp"

#include "common/cli/params.hpp"

namespace cli = livestand::examples::cli;
using namespace livestand;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

namespace {

[[nodiscard]]
bool load_lines(const std::string& path, std::vector<std::string>& out) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LS_ERROR("Cannot open replay file '" << path << "'");
        return false;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        out.push_back(std::move(line));
    }
    return true;
}

} // namespace

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    using clock = std::chrono::steady_clock;

    // -------------------------------------------------------------
    // Signal handling
    // -------------------------------------------------------------
    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    const auto params = cli::configure_replay(argc, argv, "Livestand - Snapshot Replay\n"
        "Feeds recorded snapshot payloads through the dispatch, match tracking\n"
        "and reconciliation stages, without a server.\n"
    );
    params.dump("=== Replay Parameters ===", std::cout);

    std::vector<std::string> lines;
    if (!load_lines(params.file, lines)) {
        return -1;
    }
    LS_INFO("Loaded " << lines.size() << " line(s) of replay data");

    // -------------------------------------------------------------
    // Stages
    // -------------------------------------------------------------
    const Config cfg = params.to_config();
    dispatch::DispatchQueue       dispatcher(cfg);
    match::MatchStateTracker      tracker;
    reconcile::SnapshotReconciler reconciler(cfg);
    reconcile::PanelRegistry      panels;

    std::size_t diffs = 0;
    dispatcher.on_update([&](const schema::MatchSnapshot& snapshot, bool reconnecting) {
        const auto diff = process_snapshot(snapshot, reconnecting, tracker, reconciler, panels);
        ++diffs;
        std::cout << diff;
    });

    // -------------------------------------------------------------------------
    // Feed the next line once the previous one left the queue, poll every
    // pacing check
    // -------------------------------------------------------------------------
    dispatcher.start();
    std::size_t next_line = 0;

    while (running.load()) {
        const auto now = clock::now();
        if (next_line < lines.size() && dispatcher.size() == 0) {
            dispatcher.enqueue(dispatch::QueuedMessage{false, lines[next_line]});
            ++next_line;
            LS_DEBUG("Fed line " << next_line << "/" << lines.size());
        }
        (void)dispatcher.poll(now);
        if (next_line == lines.size() && dispatcher.size() == 0) {
            LS_INFO("Replay completed.");
            break;
        }
        std::this_thread::sleep_for(cfg.pacing_check);
    }

    dispatcher.stop();
    tracker.clear();

#ifdef LIVESTAND_ENABLE_TELEMETRY_L1
    dispatcher.telemetry().debug_dump(std::cout);
#endif

    std::cout << "=== Done (" << diffs << " diffs) ===\n";
    return 0;
}
