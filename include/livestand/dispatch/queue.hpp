#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

#include "livestand/config.hpp"
#include "livestand/dispatch/telemetry.hpp"
#include "livestand/schema/snapshot.hpp"
#include "livestand/protocol/parser/result.hpp"
#include "livestand/protocol/parser/snapshot.hpp"


namespace livestand {
namespace dispatch {

// One inbound payload. Immutable once queued; consumed at most once.
struct QueuedMessage {
    bool        reconnecting = false;
    std::string payload;
};

/*
===============================================================================
 livestand::dispatch::DispatchQueue
===============================================================================

Time-paced delivery stage between the connection and the reconciler.

- enqueue() may be called from any thread; the buffer is mutex-protected
- poll() is the periodic tick. It checks at most once per pacing_check and
  delivers at most one message per pacing_interval
- When the window opens the buffer is deduplicated per DedupPolicy:
    KeepNewest  : deliver the newest message, drop everything older
    NewestOfTwo : pop the two oldest, deliver the second
  A reconnect tag on a dropped message carries over to the delivered one
- The payload is decoded at delivery time. Decode failures and exceptions
  thrown by the update handler are logged and the queue keeps running
- Only one delivery is in flight at a time; a poll() issued from inside the
  update handler is ignored
- stop() halts delivery and drops the buffer (no flush)

===============================================================================
*/

class DispatchQueue {
public:
    using clock            = std::chrono::steady_clock;
    using update_handler_t = std::function<void(const schema::MatchSnapshot&, bool reconnecting)>;

public:
    explicit DispatchQueue(const Config& cfg = Config{});

    DispatchQueue(const DispatchQueue&) = delete;
    DispatchQueue& operator=(const DispatchQueue&) = delete;

    // Lifecycle
    void start();
    void start(clock::time_point now);
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    // Buffer
    void enqueue(QueuedMessage msg);
    void clear();
    [[nodiscard]] std::size_t size() const;

    // Tick. Returns Delivered when a snapshot reached the handler, the
    // decoder's error code when the picked payload was rejected, and
    // Ignored when nothing was due.
    protocol::parser::Result poll();
    protocol::parser::Result poll(clock::time_point now);

    void on_update(update_handler_t cb) noexcept {
        on_update_cb_ = std::move(cb);
    }

    [[nodiscard]]
    inline const telemetry::Dispatch& telemetry() const noexcept {
        return telemetry_;
    }

    [[nodiscard]]
    inline clock::time_point last_delivery() const noexcept {
        return last_delivery_;
    }

private:
    // Removes the message to deliver from the buffer (caller holds the lock)
    [[nodiscard]] bool take_locked_(QueuedMessage& out);

private:
    Config cfg_;

    mutable std::mutex        mutex_;
    std::deque<QueuedMessage> queue_;

    bool running_    = false;
    bool delivering_ = false;

    clock::time_point last_delivery_{};
    clock::time_point last_check_{};

    protocol::parser::SnapshotDecoder decoder_;
    schema::MatchSnapshot             snapshot_;

    update_handler_t on_update_cb_;

    telemetry::Dispatch telemetry_;
};

} // namespace dispatch
} // namespace livestand
