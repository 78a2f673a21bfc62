#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/counter.hpp"

namespace livestand::transport::telemetry {

// ============================================================================
// Connection Telemetry
//
// Observes connection-level decisions of the ConnectionManager.
// Mechanical facts only. Updated from the polling thread.
// ============================================================================

struct Connection final {
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    // Transport open attempts (initial and reconnect)
    lcr::metrics::counter32 connect_attempts_total;

    // Transport open failures
    lcr::metrics::counter32 connect_failures_total;

    // Server acknowledged authentication (code 201)
    lcr::metrics::counter32 auth_acks_total;

    // Transport closed (any cause)
    lcr::metrics::counter32 disconnects_total;

    // Reconnects scheduled after a non-user loss
    lcr::metrics::counter32 reconnects_scheduled_total;

    // Unexpected in-band codes or malformed envelopes
    lcr::metrics::counter32 protocol_errors_total;

    // ---------------------------------------------------------------------
    // Message handoff (transport → message callback)
    // ---------------------------------------------------------------------

    lcr::metrics::counter64 messages_received_total;
    lcr::metrics::counter64 messages_forwarded_total;

    // Code 200 envelopes without payload
    lcr::metrics::counter64 empty_payloads_total;

    // Events discarded because they belonged to a closed transport
    lcr::metrics::counter64 stale_events_total;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(Connection& other) const noexcept {
        connect_attempts_total.copy_to(other.connect_attempts_total);
        connect_failures_total.copy_to(other.connect_failures_total);
        auth_acks_total.copy_to(other.auth_acks_total);
        disconnects_total.copy_to(other.disconnects_total);
        reconnects_scheduled_total.copy_to(other.reconnects_scheduled_total);
        protocol_errors_total.copy_to(other.protocol_errors_total);
        messages_received_total.copy_to(other.messages_received_total);
        messages_forwarded_total.copy_to(other.messages_forwarded_total);
        empty_payloads_total.copy_to(other.empty_payloads_total);
        stale_events_total.copy_to(other.stale_events_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Connection Telemetry ===\n";
        os << "Lifecycle\n";
        os << "  Connect attempts      : " << connect_attempts_total.load() << '\n';
        os << "  Connect failures      : " << connect_failures_total.load() << '\n';
        os << "  Auth acks             : " << auth_acks_total.load() << '\n';
        os << "  Disconnects           : " << disconnects_total.load() << '\n';
        os << "  Reconnects scheduled  : " << reconnects_scheduled_total.load() << '\n';
        os << "  Protocol errors       : " << protocol_errors_total.load() << '\n';
        os << "\nMessage handoff\n";
        os << "  Received              : " << messages_received_total.load() << '\n';
        os << "  Forwarded             : " << messages_forwarded_total.load() << '\n';
        os << "  Empty payloads        : " << empty_payloads_total.load() << '\n';
        os << "  Stale events          : " << stale_events_total.load() << '\n';
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Connection>, "telemetry::Connection must be standard layout");
static_assert(std::is_trivially_destructible_v<Connection>, "telemetry::Connection must be trivially destructible");

} // namespace livestand::transport::telemetry
