#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/counter.hpp"

namespace livestand::dispatch::telemetry {

// ============================================================================
// Dispatch Telemetry
//
// Observes pacing and delivery decisions of the DispatchQueue.
// ============================================================================

struct Dispatch final {
    // Payloads accepted by enqueue()
    lcr::metrics::counter64 enqueued_total;

    // Payloads handed to the update handler
    lcr::metrics::counter64 delivered_total;

    // Older payloads dropped in favour of a newer one
    lcr::metrics::counter64 deduplicated_total;

    // Payloads dropped by stop() / clear()
    lcr::metrics::counter64 discarded_total;

    // Payloads rejected by the snapshot decoder
    lcr::metrics::counter64 decode_failures_total;

    // Update handler threw
    lcr::metrics::counter64 handler_failures_total;

    inline void copy_to(Dispatch& other) const noexcept {
        enqueued_total.copy_to(other.enqueued_total);
        delivered_total.copy_to(other.delivered_total);
        deduplicated_total.copy_to(other.deduplicated_total);
        discarded_total.copy_to(other.discarded_total);
        decode_failures_total.copy_to(other.decode_failures_total);
        handler_failures_total.copy_to(other.handler_failures_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Dispatch Telemetry ===\n";
        os << "  Enqueued              : " << enqueued_total.load() << '\n';
        os << "  Delivered             : " << delivered_total.load() << '\n';
        os << "  Deduplicated          : " << deduplicated_total.load() << '\n';
        os << "  Discarded             : " << discarded_total.load() << '\n';
        os << "  Decode failures       : " << decode_failures_total.load() << '\n';
        os << "  Handler failures      : " << handler_failures_total.load() << '\n';
    }
};

static_assert(std::is_standard_layout_v<Dispatch>, "telemetry::Dispatch must be standard layout");
static_assert(std::is_trivially_destructible_v<Dispatch>, "telemetry::Dispatch must be trivially destructible");

} // namespace livestand::dispatch::telemetry
