#pragma once

#include <string>
#include <string_view>
#include <concepts>
#include <functional>

#include "livestand/transport/error.hpp"

namespace livestand::transport {

// Transport callbacks. Implementations may invoke them from their own IO
// thread; consumers must hand the data over to their polling thread.
using MessageCallback = std::function<void(std::string_view msg)>;
using CloseCallback   = std::function<void()>;
using ErrorCallback   = std::function<void(Error err)>;

// -----------------------------------------------------------------------------
// WebSocketConcept
// -----------------------------------------------------------------------------
//
// Defines the minimal contract required by the ConnectionManager.
//
// The WebSocket implementation:
//
//   • Is a single-connection primitive (no retries, no reconnection)
//   • Owns its IO thread once connect() succeeds
//   • Signals close exactly once per successful connect()
//   • Reports failures as transport::Error before signalling close
//
// -----------------------------------------------------------------------------

template<class WS>
concept WebSocketConcept =
    std::default_initializable<WS> &&
    requires(
        WS ws,
        const std::string& host,
        const std::string& port,
        const std::string& path,
        bool secure,
        const std::string& msg,
        MessageCallback on_message,
        CloseCallback on_close,
        ErrorCallback on_error
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(host, port, path, secure) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Signaling
    // ---------------------------------------------------------------------

    { ws.set_message_callback(on_message) } -> std::same_as<void>;
    { ws.set_close_callback(on_close) } -> std::same_as<void>;
    { ws.set_error_callback(on_error) } -> std::same_as<void>;
};

} // namespace livestand::transport
