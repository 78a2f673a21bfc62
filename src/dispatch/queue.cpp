#include "livestand/dispatch/queue.hpp"
#include "livestand/telemetry.hpp"
#include "lcr/log/logger.hpp"

#include <exception>
#include <utility>


namespace livestand {
namespace dispatch {

using protocol::parser::Result;

DispatchQueue::DispatchQueue(const Config& cfg)
    : cfg_(cfg)
{}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void DispatchQueue::start() {
    start(clock::now());
}

void DispatchQueue::start(clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        LS_WARN("[DISPATCH] Dispatcher already started.");
        return;
    }
    running_       = true;
    last_delivery_ = now;
    last_check_    = now;
    LS_INFO("[DISPATCH] Dispatcher started (interval=" << cfg_.pacing_interval.count()
            << " ms, check=" << cfg_.pacing_check.count()
            << " ms, dedup=" << to_string(cfg_.dedup) << ").");
}

void DispatchQueue::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ && queue_.empty()) {
        return;
    }
    running_ = false;
    if (!queue_.empty()) {
        LS_INFO("[DISPATCH] Dropping " << queue_.size() << " buffered message(s).");
        LS_TL1(telemetry_.discarded_total.inc(queue_.size()));
        queue_.clear();
    }
    LS_INFO("[DISPATCH] Dispatcher stopped.");
}

bool DispatchQueue::is_running() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

// ---------------------------------------------------------------------------
// Buffer
// ---------------------------------------------------------------------------

void DispatchQueue::enqueue(QueuedMessage msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(msg));
    LS_TL1(telemetry_.enqueued_total.inc());
    LS_DEBUG("[DISPATCH] Message enqueued (queue size: " << queue_.size() << ").");
}

void DispatchQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    LS_TL1(telemetry_.discarded_total.inc(queue_.size()));
    queue_.clear();
}

std::size_t DispatchQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool DispatchQueue::take_locked_(QueuedMessage& out) {
    if (queue_.empty()) {
        return false;
    }
    bool reconnecting = false;
    std::size_t dropped = 0;
    switch (cfg_.dedup) {
        case DedupPolicy::KeepNewest: {
            for (const auto& m : queue_) {
                reconnecting = reconnecting || m.reconnecting;
            }
            dropped = queue_.size() - 1;
            out = std::move(queue_.back());
            queue_.clear();
            break;
        }
        case DedupPolicy::NewestOfTwo: {
            out = std::move(queue_.front());
            queue_.pop_front();
            reconnecting = out.reconnecting;
            if (!queue_.empty()) {
                out = std::move(queue_.front());
                queue_.pop_front();
                reconnecting = reconnecting || out.reconnecting;
                dropped = 1;
            }
            break;
        }
    }
    out.reconnecting = reconnecting;
    if (dropped != 0) {
        LS_DEBUG("[DISPATCH] Dropped " << dropped << " older message(s).");
        LS_TL1(telemetry_.deduplicated_total.inc(dropped));
    }
    return true;
}

// ---------------------------------------------------------------------------
// Tick
// ---------------------------------------------------------------------------

Result DispatchQueue::poll() {
    return poll(clock::now());
}

Result DispatchQueue::poll(clock::time_point now) {
    QueuedMessage msg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || delivering_) {
            return Result::Ignored;
        }
        if (now - last_check_ < cfg_.pacing_check) {
            return Result::Ignored;
        }
        last_check_ = now;
        if (now - last_delivery_ < cfg_.pacing_interval) {
            return Result::Ignored;
        }
        if (!take_locked_(msg)) {
            return Result::Ignored;
        }
        // The window closes even if the payload turns out to be undecodable
        last_delivery_ = now;
        delivering_    = true;
    }

    Result result = decoder_.decode(msg.payload, snapshot_);
    if (result != Result::Parsed) {
        LS_ERROR("[DISPATCH] Failed to decode payload (" << to_string(result) << ", " << msg.payload.size() << " bytes) -> message dropped.");
        LS_TL1(telemetry_.decode_failures_total.inc());
    }
    else {
        LS_DEBUG("[DISPATCH] Delivering snapshot (match=" << schema::to_hex(snapshot_.match_id)
                 << ", reconnecting=" << (msg.reconnecting ? "true" : "false") << ").");
        result = Result::Delivered;
        if (on_update_cb_) {
            try {
                on_update_cb_(snapshot_, msg.reconnecting);
            }
            catch (const std::exception& e) {
                LS_ERROR("[DISPATCH] Update handler failed: " << e.what());
                LS_TL1(telemetry_.handler_failures_total.inc());
            }
            catch (...) {
                LS_ERROR("[DISPATCH] Update handler failed with a non-standard exception.");
                LS_TL1(telemetry_.handler_failures_total.inc());
            }
        }
        LS_TL1(telemetry_.delivered_total.inc());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    delivering_ = false;
    return result;
}

} // namespace dispatch
} // namespace livestand
