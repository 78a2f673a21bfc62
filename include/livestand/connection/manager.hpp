#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <memory>
#include <mutex>
#include <deque>
#include <chrono>
#include <cstdint>
#include <utility>

#include "livestand/config.hpp"
#include "livestand/telemetry.hpp"
#include "livestand/transport/concepts.hpp"
#include "livestand/transport/parse_url.hpp"
#include "livestand/transport/state.hpp"
#include "livestand/transport/telemetry/connection.hpp"
#include "livestand/protocol/auth.hpp"
#include "livestand/protocol/envelope.hpp"
#include "livestand/protocol/parser/envelope.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace livestand {
namespace connection {

/*
===============================================================================
 livestand::connection::ConnectionManager
===============================================================================

Owns one broadcast connection on top of a transport conforming to
transport::WebSocketConcept.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Open the transport and send the authentication payload once per open
- Report "Connected" only after the server acknowledges authentication
  (envelope code 201), not when the socket opens
- Forward code 200 payloads, tagging the first one after a reconnect
- Reconnect after a fixed delay on any loss not initiated by close()
- Treat unexpected codes and malformed envelopes as connection errors

-------------------------------------------------------------------------------
 Threading Model
-------------------------------------------------------------------------------
- Transports invoke callbacks from their IO thread. Those callbacks only
  push events into a mutex-protected inbox.
- poll() drains the inbox on the caller's thread and runs every callback
  and state transition there.
- Each transport instance gets an epoch. Events from an older epoch, or
  arriving after close(), are discarded.

-------------------------------------------------------------------------------
 State Machine
-------------------------------------------------------------------------------
  Disconnected --connect()--> Opening --201--> Authenticated
  Opening | Authenticated --loss--> WaitingReconnect --delay--> Opening
  any --close()--> Disconnected (terminal until the next connect())

===============================================================================
*/

template <transport::WebSocketConcept WS>
class ConnectionManager {
public:
    using clock = std::chrono::steady_clock;

    using message_handler_t    = std::function<void(std::string_view payload, bool reconnecting)>;
    using connect_handler_t    = std::function<void(bool succeed, bool reconnect, std::string_view detail)>;
    using disconnect_handler_t = std::function<void(bool closed_by_user)>;
    using status_handler_t     = std::function<void(transport::Status)>;

public:
    explicit ConnectionManager(std::chrono::milliseconds reconnect_delay = config::RECONNECT_DELAY,
                               std::chrono::milliseconds connect_timeout = config::CONNECT_TIMEOUT)
        : reconnect_delay_(reconnect_delay)
        , connect_timeout_(connect_timeout)
    {}

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    ~ConnectionManager() {
        ++epoch_;
        if (ws_) {
            ws_->close();
        }
    }

    // ---------------------------------------------------------------------
    // Connection lifecycle
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline transport::Error connect(const std::string& url, std::string credential) noexcept {
        return connect(url, std::move(credential), clock::now());
    }

    [[nodiscard]]
    inline transport::Error connect(const std::string& url, std::string credential, clock::time_point now) noexcept {
        if (state_ != ConnState::Disconnected) {
            LS_WARN("[CONN] connect() ignored: connection already active (" << to_string(status_) << ").");
            return transport::Error::InvalidState;
        }
        transport::ParsedUrl parsed;
        auto err = transport::parse_url(url, parsed);
        if (err != transport::Error::None) {
            LS_ERROR("[CONN] Invalid URL '" << url << "': " << to_string(err));
            return err;
        }
        url_            = url;
        target_         = std::move(parsed);
        credential_     = std::move(credential);
        closed_by_user_ = false;
        reconnecting_   = false;
        authenticated_  = false;
        LS_INFO("[CONN] Connecting to: " << url_);
        set_status_(transport::Status::Connecting);
        return open_(now, false);
    }

    // Marks the connection user-closed. No reconnect is scheduled afterwards
    // and any event still in flight is discarded. Idempotent.
    inline void close() noexcept {
        closed_by_user_ = true;
        if (state_ == ConnState::Disconnected) {
            return;
        }
        LS_INFO("[CONN] Closing connection (user request).");
        ++epoch_;
        if (ws_) {
            ws_->close();
        }
        {
            std::lock_guard<std::mutex> lock(inbox_mutex_);
            inbox_.clear();
        }
        state_         = ConnState::Disconnected;
        authenticated_ = false;
        reconnecting_  = false;
        LS_TL1(telemetry_.disconnects_total.inc());
        if (hooks_.on_disconnect_cb_) {
            hooks_.on_disconnect_cb_(true);
        }
        set_status_(transport::Status::Disconnected);
    }

    // ---------------------------------------------------------------------
    // Event loop
    // ---------------------------------------------------------------------

    inline void poll() noexcept {
        poll(clock::now());
    }

    inline void poll(clock::time_point now) noexcept {
        drain_inbox_(now);
        // === Reconnection logic ===
        if (state_ == ConnState::WaitingReconnect && !closed_by_user_ && now >= next_retry_) {
            LS_INFO("[CONN] Attempting reconnection to: " << url_);
            (void)open_(now, true);
        }
    }

    // ---------------------------------------------------------------------
    // Callbacks
    // ---------------------------------------------------------------------

    void on_message(message_handler_t cb) noexcept {
        hooks_.on_message_cb_ = std::move(cb);
    }

    void on_connect(connect_handler_t cb) noexcept {
        hooks_.on_connect_cb_ = std::move(cb);
    }

    void on_disconnect(disconnect_handler_t cb) noexcept {
        hooks_.on_disconnect_cb_ = std::move(cb);
    }

    void on_status_change(status_handler_t cb) noexcept {
        hooks_.on_status_cb_ = std::move(cb);
    }

    // ---------------------------------------------------------------------
    // Accessors
    // ---------------------------------------------------------------------

    [[nodiscard]] inline transport::Status status() const noexcept { return status_; }
    [[nodiscard]] inline bool is_connected() const noexcept { return authenticated_; }
    [[nodiscard]] inline bool is_reconnecting() const noexcept { return reconnecting_; }
    [[nodiscard]] inline bool closed_by_user() const noexcept { return closed_by_user_; }
    [[nodiscard]] inline bool reconnect_pending() const noexcept { return state_ == ConnState::WaitingReconnect; }
    [[nodiscard]] inline clock::time_point next_retry() const noexcept { return next_retry_; }
    [[nodiscard]] inline const std::string& url() const noexcept { return url_; }

    [[nodiscard]]
    inline const transport::telemetry::Connection& telemetry() const noexcept {
        return telemetry_;
    }

#ifdef LS_UNIT_TEST
public:
    inline void force_next_retry(clock::time_point ts) noexcept {
        next_retry_ = ts;
    }

    [[nodiscard]] inline std::uint64_t epoch() const noexcept {
        return epoch_;
    }

    WS& ws() {
        return *ws_;
    }

    [[nodiscard]] inline bool has_ws() const noexcept {
        return ws_ != nullptr;
    }
#endif // LS_UNIT_TEST

private:
    // ---------------------------------------------------------------------
    // Inbox (filled from the transport thread, drained by poll())
    // ---------------------------------------------------------------------
    enum class EventKind : std::uint8_t {
        Message,
        Error,
        Closed
    };

    struct Event {
        EventKind        kind;
        std::uint64_t    epoch;
        std::string      text;
        transport::Error error = transport::Error::None;
    };

    enum class ConnState : std::uint8_t {
        Disconnected,
        Opening,            // transport open, waiting for the auth ack
        Authenticated,
        WaitingReconnect
    };

    struct Hooks {
        message_handler_t    on_message_cb_{};
        connect_handler_t    on_connect_cb_{};
        disconnect_handler_t on_disconnect_cb_{};
        status_handler_t     on_status_cb_{};
    };

private:
    std::chrono::milliseconds reconnect_delay_;
    std::chrono::milliseconds connect_timeout_;

    std::string          url_;
    transport::ParsedUrl target_;
    std::string          credential_;

    std::unique_ptr<WS> ws_;
    std::uint64_t       epoch_ = 0;

    std::mutex        inbox_mutex_;
    std::deque<Event> inbox_;

    ConnState         state_ = ConnState::Disconnected;
    transport::Status status_ = transport::Status::Disconnected;
    clock::time_point next_retry_{};

    bool closed_by_user_ = false;
    bool authenticated_  = false;
    // True from a reconnect attempt until the next payload is forwarded
    bool reconnecting_   = false;

    simdjson::dom::parser envelope_parser_;

    Hooks hooks_;

    transport::telemetry::Connection telemetry_;

private:
    inline void push_event_(Event&& ev) {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        inbox_.push_back(std::move(ev));
    }

    inline void set_status_(transport::Status s) {
        if (status_ == s) {
            return;
        }
        status_ = s;
        LS_DEBUG("[CONN] Status -> " << to_string(s));
        if (hooks_.on_status_cb_) {
            hooks_.on_status_cb_(s);
        }
    }

    // Creates a fresh transport, opens it and sends the auth payload
    [[nodiscard]]
    inline transport::Error open_(clock::time_point now, bool reconnect) {
        if (ws_) {
            ws_->close();
        }
        const std::uint64_t epoch = ++epoch_;
        ws_ = std::make_unique<WS>();
        if constexpr (requires(WS& ws, std::chrono::milliseconds timeout) { ws.set_connect_timeout(timeout); }) {
            ws_->set_connect_timeout(connect_timeout_);
        }
        ws_->set_message_callback([this, epoch](std::string_view msg) {
            push_event_(Event{EventKind::Message, epoch, std::string(msg)});
        });
        ws_->set_error_callback([this, epoch](transport::Error err) {
            push_event_(Event{EventKind::Error, epoch, {}, err});
        });
        ws_->set_close_callback([this, epoch]() {
            push_event_(Event{EventKind::Closed, epoch, {}});
        });

        state_        = ConnState::Opening;
        reconnecting_ = reconnect;
        set_status_(transport::Status::Connecting);
        LS_TL1(telemetry_.connect_attempts_total.inc());

        auto err = ws_->connect(target_.host, target_.port, target_.path, target_.secure);
        if (err != transport::Error::None) {
            LS_ERROR("[CONN] Connection to '" << url_ << "' failed: " << to_string(err));
            LS_TL1(telemetry_.connect_failures_total.inc());
            ++epoch_;
            if (hooks_.on_connect_cb_) {
                hooks_.on_connect_cb_(false, reconnect, to_string(err));
            }
            handle_disconnect_(now);
            return err;
        }

        LS_INFO("[CONN] Transport open, sending authentication.");
        protocol::AuthRequest auth{credential_};
        if (!ws_->send(auth.to_json())) {
            LS_ERROR("[CONN] Failed to send authentication payload.");
            drop_transport_(now);
            return transport::Error::TransportFailure;
        }
        return transport::Error::None;
    }

    // Closes the current transport and invalidates its pending events
    inline void drop_transport_(clock::time_point now) {
        ++epoch_;
        if (ws_) {
            ws_->close();
        }
        handle_disconnect_(now);
    }

    inline void handle_disconnect_(clock::time_point now) {
        const bool was_authenticated = authenticated_;
        authenticated_ = false;
        LS_TL1(telemetry_.disconnects_total.inc());
        LS_WARN("[CONN] Connection lost" << (was_authenticated ? " (was authenticated)." : "."));
        if (hooks_.on_disconnect_cb_) {
            hooks_.on_disconnect_cb_(false);
        }
        // A callback may have closed the manager
        if (closed_by_user_) {
            return;
        }
        state_      = ConnState::WaitingReconnect;
        next_retry_ = now + reconnect_delay_;
        LS_TL1(telemetry_.reconnects_scheduled_total.inc());
        LS_INFO("[CONN] Reconnecting in " << reconnect_delay_.count() << " ms.");
        set_status_(transport::Status::Connecting);
    }

    inline void drain_inbox_(clock::time_point now) {
        for (;;) {
            std::deque<Event> batch;
            {
                std::lock_guard<std::mutex> lock(inbox_mutex_);
                batch.swap(inbox_);
            }
            if (batch.empty()) {
                return;
            }
            for (auto& ev : batch) {
                if (closed_by_user_ || ev.epoch != epoch_) {
                    LS_TL1(telemetry_.stale_events_total.inc());
                    continue;
                }
                switch (ev.kind) {
                    case EventKind::Message:
                        LS_TL1(telemetry_.messages_received_total.inc());
                        handle_frame_(ev.text, now);
                        break;
                    case EventKind::Error:
                        LS_ERROR("[CONN] Transport error: " << to_string(ev.error));
                        break;
                    case EventKind::Closed:
                        LS_DEBUG("[CONN] Transport closed.");
                        ++epoch_;
                        handle_disconnect_(now);
                        break;
                }
            }
        }
    }

    inline void handle_frame_(std::string_view text, clock::time_point now) {
        protocol::Envelope env;
        auto r = protocol::parser::envelope::parse(envelope_parser_, text, env);
        if (r != protocol::parser::Result::Parsed) {
            LS_ERROR("[CONN] Malformed envelope (" << to_string(r) << ").");
            protocol_error_(now);
            return;
        }

        if (env.is_authenticated()) {
            LS_INFO("[CONN] Authenticated" << (reconnecting_ ? " (reconnect)." : "."));
            LS_TL1(telemetry_.auth_acks_total.inc());
            state_         = ConnState::Authenticated;
            authenticated_ = true;
            set_status_(transport::Status::Connected);
            if (hooks_.on_connect_cb_) {
                hooks_.on_connect_cb_(true, reconnecting_, "Authenticated");
            }
            return;
        }

        if (env.is_payload()) {
            if (env.data.empty()) {
                LS_WARN("[CONN] Envelope code " << env.code << " without data -> ignore message.");
                LS_TL1(telemetry_.empty_payloads_total.inc());
                return;
            }
            // A payload that arrives before the auth ack leaves the tag pending
            const bool tag = authenticated_ && reconnecting_;
            if (authenticated_) {
                reconnecting_ = false;
            }
            LS_TL1(telemetry_.messages_forwarded_total.inc());
            if (hooks_.on_message_cb_) {
                hooks_.on_message_cb_(env.data, tag);
            }
            return;
        }

        LS_ERROR("[CONN] Server error (code=" << env.code << "): " << (env.message.empty() ? "<no message>" : env.message));
        protocol_error_(now);
    }

    inline void protocol_error_(clock::time_point now) {
        LS_TL1(telemetry_.protocol_errors_total.inc());
        set_status_(transport::Status::Disconnected);
        drop_transport_(now);
    }
};

} // namespace connection
} // namespace livestand
