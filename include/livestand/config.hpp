/*
================================================================================
Livestand Configuration
================================================================================

Fixed pipeline constants and the overridable runtime configuration.

All defaults live here. Components receive the slice of Config they need at
construction and never read global state.
================================================================================
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>


namespace livestand {
namespace config {

// -----------------------------------------------------------------------------
// Delivery pacing
// -----------------------------------------------------------------------------
inline constexpr static std::chrono::milliseconds PACING_INTERVAL{1500};   // at most one delivery per interval
inline constexpr static std::chrono::milliseconds PACING_CHECK{100};       // granularity of the pacing tick

// -----------------------------------------------------------------------------
// Connection
// -----------------------------------------------------------------------------
inline constexpr static std::chrono::milliseconds RECONNECT_DELAY{3000};
inline constexpr static std::chrono::milliseconds CONNECT_TIMEOUT{5000};   // resolve through WebSocket upgrade
inline constexpr static std::string_view BROADCAST_PATH = "/api/v1/broadcast";

// In-band envelope codes
inline constexpr static std::int64_t CODE_PAYLOAD       = 200;
inline constexpr static std::int64_t CODE_AUTHENTICATED = 201;

// -----------------------------------------------------------------------------
// Leaderboard
// -----------------------------------------------------------------------------
inline constexpr static std::size_t MAX_DISPLAYED_TEAMS = 16;
inline constexpr static std::uint32_t MIN_SQUAD_SIZE    = 4;

// A just-eliminated team with this placement leaves a single survivor
inline constexpr static std::int64_t RUNNER_UP_PLACEMENT = 2;

} // namespace config


// -----------------------------------------------------------------------------
// Dedup policy applied when the pacing window opens
// -----------------------------------------------------------------------------
enum class DedupPolicy : std::uint8_t {
    KeepNewest,     // deliver the newest buffered message, drop everything older
    NewestOfTwo     // pop the two oldest, deliver the second (legacy behavior)
};

[[nodiscard]]
inline constexpr std::string_view to_string(DedupPolicy p) noexcept {
    switch (p) {
        case DedupPolicy::KeepNewest:  return "keep-newest";
        case DedupPolicy::NewestOfTwo: return "newest-of-two";
        default:                       return "unknown";
    }
}


// -----------------------------------------------------------------------------
// Runtime configuration (all values overridable)
// -----------------------------------------------------------------------------
struct Config {
    std::chrono::milliseconds pacing_interval = config::PACING_INTERVAL;
    std::chrono::milliseconds pacing_check    = config::PACING_CHECK;
    std::chrono::milliseconds reconnect_delay = config::RECONNECT_DELAY;
    std::chrono::milliseconds connect_timeout = config::CONNECT_TIMEOUT;
    std::size_t   max_displayed_teams         = config::MAX_DISPLAYED_TEAMS;
    std::uint32_t min_squad_size              = config::MIN_SQUAD_SIZE;
    DedupPolicy   dedup                       = DedupPolicy::KeepNewest;
};

} // namespace livestand
