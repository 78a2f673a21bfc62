#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "livestand/schema/snapshot.hpp"
#include "livestand/reconcile/diff.hpp"


namespace livestand::reconcile {

enum class PlayerState : std::uint8_t {
    Alive,
    Groggy,
    Dead
};

[[nodiscard]]
inline constexpr std::string_view to_string(PlayerState s) noexcept {
    switch (s) {
        case PlayerState::Alive:  return "alive";
        case PlayerState::Groggy: return "groggy";
        case PlayerState::Dead:   return "dead";
        default:                  return "unknown";
    }
}

// Death type first, then telemetry, alive when neither is present
[[nodiscard]]
PlayerState player_state(const schema::PlayerRecord& player) noexcept;

// Elimination test: death type other than "alive", or telemetry not alive.
// No data means not down.
[[nodiscard]]
bool is_down(const schema::PlayerRecord& player) noexcept;

// Players of one team: by team id, or by team name for players without one
[[nodiscard]]
std::vector<const schema::PlayerRecord*> players_of(const schema::TeamRecord& team,
                                                    const std::vector<schema::PlayerRecord>& players);

[[nodiscard]]
SquadStatus squad_status(const std::vector<const schema::PlayerRecord*>& players, std::uint32_t min_squad_size) noexcept;

} // namespace livestand::reconcile
