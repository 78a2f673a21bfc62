#pragma once

#include <cstdint>
#include <string_view>


namespace livestand::transport {

// ===============================================================
// CONNECTION STATUS
// ===============================================================
// Observable connection status reported through on_status_change().
// Connected means "authenticated", not merely "socket open".
enum class Status : uint8_t {
    Disconnected,
    Connecting,
    Connected
};

[[nodiscard]]
inline constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
        case Status::Disconnected: return "Disconnected";
        case Status::Connecting:   return "Connecting";
        case Status::Connected:    return "Connected";
        default:                   return "Unknown";
    }
}

} // namespace livestand::transport
