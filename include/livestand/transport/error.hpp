#pragma once

#include <string_view>

namespace livestand {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents *semantic transport failures*, abstracted away from
platform- or library-specific error codes (WinHTTP, Boost.Beast).

The ConnectionManager uses it to decide between retrying and giving up:
everything except the control errors is recovered by the fixed-delay
reconnect unless the user closed the connection.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current connection state
    Cancelled,        // Operation aborted because the user closed the connection

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection was closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the connection gracefully (CLOSE frame)

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Transport-level timeout
    ConnectionFailed, // Connection attempt failed (DNS, refused, routing)
    HandshakeFailed,  // TLS or WebSocket upgrade failed

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame, unexpected in-band status code, non-JSON envelope

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure  // Unclassified transport failure
};


/// Helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::Cancelled:         return "Cancelled";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace livestand
