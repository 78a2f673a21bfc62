#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <utility>

#include "livestand/config.hpp"
#include "livestand/connection/manager.hpp"
#include "livestand/dispatch/queue.hpp"
#include "livestand/match/state_tracker.hpp"
#include "livestand/reconcile/diff.hpp"
#include "livestand/reconcile/panel_registry.hpp"
#include "livestand/reconcile/reconciler.hpp"
#include "livestand/schema/snapshot.hpp"
#include "livestand/transport/concepts.hpp"
#include "livestand/transport/error.hpp"
#include "livestand/transport/state.hpp"
#include "lcr/log/logger.hpp"


namespace livestand {

// One delivered snapshot through match tracking and reconciliation. Rebuilds
// when the producer asked for it or the match id changed; the tracker is
// updated after the diff is computed.
[[nodiscard]]
inline reconcile::Diff process_snapshot(const schema::MatchSnapshot& snapshot, bool reconnecting,
                                        match::MatchStateTracker& tracker,
                                        const reconcile::SnapshotReconciler& reconciler,
                                        reconcile::PanelRegistry& panels) {
    const bool rebuild = snapshot.refresh || tracker.should_refresh(snapshot.match_id);
    auto diff = reconciler.reconcile(snapshot, rebuild, panels);
    diff.reconnecting = reconnecting;
    tracker.update_state(snapshot.match_id, snapshot.tournament_id);
    LS_DEBUG("[PIPELINE] Snapshot reconciled (rebuild=" << (rebuild ? "true" : "false")
             << ", upserts=" << diff.upserts.size()
             << ", rank_changes=" << diff.rank_changes.size()
             << ", eliminations=" << diff.eliminations.size() << ").");
    return diff;
}

/*
===============================================================================
 livestand::Pipeline
===============================================================================

Wires the live-standing pipeline:

  transport → ConnectionManager → DispatchQueue → MatchStateTracker
            → SnapshotReconciler → diff sink

- Every component is an explicitly constructed member; nothing is global
- poll() drives the connection (inbox, reconnect deadline) and the pacing
  tick from the caller's thread. Deliveries are single-flight
- A delivery rebuilds when the producer asked for it or the match id changed
- close() stops the dispatcher, clears the tracker and panels, and closes
  the connection. Idempotent

===============================================================================
*/

template <transport::WebSocketConcept WS>
class Pipeline {
public:
    using clock             = std::chrono::steady_clock;
    using diff_handler_t    = std::function<void(const reconcile::Diff&)>;
    using status_handler_t  = std::function<void(transport::Status)>;

public:
    explicit Pipeline(const Config& cfg = Config{})
        : cfg_(cfg)
        , connection_(cfg.reconnect_delay, cfg.connect_timeout)
        , dispatcher_(cfg)
        , reconciler_(cfg)
    {
        connection_.on_message([this](std::string_view payload, bool reconnecting) {
            dispatcher_.enqueue(dispatch::QueuedMessage{reconnecting, std::string(payload)});
        });
        connection_.on_connect([](bool succeed, bool reconnect, std::string_view detail) {
            if (succeed) {
                LS_INFO("[PIPELINE] Connection ready" << (reconnect ? " (reconnect): " : ": ") << detail);
            }
            else {
                LS_WARN("[PIPELINE] Connection attempt failed: " << detail);
            }
        });
        connection_.on_disconnect([](bool closed_by_user) {
            LS_INFO("[PIPELINE] Disconnected" << (closed_by_user ? " by user." : "."));
        });
        dispatcher_.on_update([this](const schema::MatchSnapshot& snapshot, bool reconnecting) {
            on_snapshot_(snapshot, reconnecting);
        });
    }

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    ~Pipeline() {
        dispatcher_.stop();
    }

    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline transport::Error connect(const std::string& url, std::string credential) noexcept {
        return connect(url, std::move(credential), clock::now());
    }

    [[nodiscard]]
    inline transport::Error connect(const std::string& url, std::string credential, clock::time_point now) noexcept {
        auto err = connection_.connect(url, std::move(credential), now);
        if (err == transport::Error::InvalidUrl || err == transport::Error::InvalidState) {
            return err;
        }
        // Other failures are retried by the connection manager
        dispatcher_.start(now);
        return err;
    }

    inline void close() noexcept {
        dispatcher_.stop();
        tracker_.clear();
        panels_.clear();
        connection_.close();
    }

    // ---------------------------------------------------------------------
    // Event loop
    // ---------------------------------------------------------------------

    inline void poll() noexcept {
        poll(clock::now());
    }

    inline void poll(clock::time_point now) noexcept {
        connection_.poll(now);
        (void)dispatcher_.poll(now);
    }

    // ---------------------------------------------------------------------
    // Callbacks
    // ---------------------------------------------------------------------

    void on_diff(diff_handler_t cb) noexcept {
        hooks_.on_diff_cb_ = std::move(cb);
    }

    void on_status_change(status_handler_t cb) noexcept {
        connection_.on_status_change(std::move(cb));
    }

    // ---------------------------------------------------------------------
    // Accessors
    // ---------------------------------------------------------------------

    [[nodiscard]] inline transport::Status status() const noexcept { return connection_.status(); }
    [[nodiscard]] inline const reconcile::PanelRegistry& panels() const noexcept { return panels_; }
    [[nodiscard]] inline const match::MatchStateTracker& tracker() const noexcept { return tracker_; }
    [[nodiscard]] inline connection::ConnectionManager<WS>& connection() noexcept { return connection_; }
    [[nodiscard]] inline dispatch::DispatchQueue& dispatcher() noexcept { return dispatcher_; }

private:
    Config cfg_;

    connection::ConnectionManager<WS> connection_;
    dispatch::DispatchQueue           dispatcher_;
    match::MatchStateTracker          tracker_;
    reconcile::SnapshotReconciler     reconciler_;
    reconcile::PanelRegistry          panels_;

    struct Hooks {
        diff_handler_t on_diff_cb_{};
    };

    Hooks hooks_;

private:
    inline void on_snapshot_(const schema::MatchSnapshot& snapshot, bool reconnecting) {
        const auto diff = process_snapshot(snapshot, reconnecting, tracker_, reconciler_, panels_);
        if (hooks_.on_diff_cb_) {
            hooks_.on_diff_cb_(diff);
        }
    }
};

} // namespace livestand
