#include "livestand/reconcile/squad.hpp"

#include <algorithm>


namespace livestand::reconcile {

PlayerState player_state(const schema::PlayerRecord& player) noexcept {
    if (player.death_type.has()) {
        if (player.death_type == "alive") {
            return PlayerState::Alive;
        }
        if (player.death_type == "groggy") {
            return PlayerState::Groggy;
        }
        return PlayerState::Dead;
    }
    if (player.telemetry.has()) {
        const auto& t = player.telemetry.value();
        if (t.is_alive) {
            return t.is_groggy ? PlayerState::Groggy : PlayerState::Alive;
        }
        return PlayerState::Dead;
    }
    return PlayerState::Alive;
}

bool is_down(const schema::PlayerRecord& player) noexcept {
    if (player.death_type.has()) {
        return player.death_type.value() != "alive";
    }
    if (player.telemetry.has()) {
        return !player.telemetry.value().is_alive;
    }
    return false;
}

std::vector<const schema::PlayerRecord*> players_of(const schema::TeamRecord& team,
                                                    const std::vector<schema::PlayerRecord>& players) {
    std::vector<const schema::PlayerRecord*> out;
    for (const auto& p : players) {
        // Join key is per player: team id when both sides carry one, team name otherwise
        const bool joined = (p.team_id != 0 && team.id != 0) ? p.team_id == team.id
                                                             : p.team_name == team.name;
        if (joined) {
            out.push_back(&p);
        }
    }
    return out;
}

SquadStatus squad_status(const std::vector<const schema::PlayerRecord*>& players, std::uint32_t min_squad_size) noexcept {
    SquadStatus s;
    if (players.empty()) {
        s.alive = min_squad_size;
        s.total = min_squad_size;
        return s;
    }
    for (const auto* p : players) {
        switch (player_state(*p)) {
            case PlayerState::Alive:  ++s.alive;  break;
            case PlayerState::Groggy: ++s.groggy; break;
            case PlayerState::Dead:   ++s.dead;   break;
        }
    }
    s.total = std::max(static_cast<std::uint32_t>(players.size()), min_squad_size);
    return s;
}

} // namespace livestand::reconcile
