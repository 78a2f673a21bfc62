#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <ostream>
#include <sstream>

#include "lcr/optional.hpp"


namespace livestand::schema {

// Match identifiers are opaque bytes compared by exact equality
using MatchId = std::vector<std::uint8_t>;

// Renders a match id as dash-separated hex bytes (e.g. "fd-af-21")
[[nodiscard]]
inline std::string to_hex(const MatchId& id) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(id.size() * 3);
    for (std::size_t i = 0; i < id.size(); ++i) {
        if (i != 0) {
            out += '-';
        }
        out += HEX[(id[i] >> 4) & 0x0F];
        out += HEX[id[i] & 0x0F];
    }
    return out;
}

// ===============================================
// TEAM RECORD
// ===============================================
struct TeamRecord {
    std::string   name;                 // unique key
    std::string   full_name;            // display name (falls back to name)
    std::int64_t  id = 0;
    std::int64_t  rank = 0;             // 1-based, lower is better
    std::int64_t  placement_rank = 0;   // finishing order once eliminated
    std::int64_t  total_kills = 0;
    double        total_score = 0.0;
    bool          eliminated = false;
};

// Secondary player status source (omitted booleans decode as false)
struct PlayerTelemetry {
    bool is_alive  = false;
    bool is_groggy = false;
};

// ===============================================
// PLAYER RECORD
// ===============================================
struct PlayerRecord {
    using Telemetry = PlayerTelemetry;

    std::string   name;
    std::string   team_name;
    std::int64_t  team_id = 0;          // 0 means "absent", join falls back to team_name

    // Primary status source ("alive", "groggy", anything else is dead).
    // An empty death type is stored as absent.
    lcr::optional<std::string> death_type;

    // Secondary status source
    lcr::optional<Telemetry> telemetry;
};

// ===============================================
// MATCH SNAPSHOT
// ===============================================
struct MatchSnapshot {
    MatchId     match_id;
    std::string tournament_id;

    std::vector<TeamRecord>   teams;          // current-match subset
    std::vector<TeamRecord>   total_teams;    // cumulative roster
    std::vector<PlayerRecord> players;        // current-match players
    std::vector<PlayerRecord> total_players;  // cumulative players

    bool refresh = false;                     // producer requested a rebuild

    // ------------------------------------------------------------
    // Debug / diagnostic dump
    // ------------------------------------------------------------
    inline void dump(std::ostream& os) const {
        os << "[SNAPSHOT] {\n";
        os << "  match_id: " << to_hex(match_id) << "\n";
        os << "  tournament_id: " << tournament_id << "\n";
        os << "  refresh: " << (refresh ? "true" : "false") << "\n";
        os << "  teams: " << teams.size() << "\n";
        os << "  total_teams: " << total_teams.size() << "\n";
        os << "  players: " << players.size() << "\n";
        os << "  total_players: " << total_players.size() << "\n";
        for (const auto& t : total_teams) {
            os << "    - #" << t.rank << " " << t.name
               << " (id=" << t.id << ", score=" << t.total_score << ")\n";
        }
        for (const auto& p : players) {
            os << "    * " << p.name << " [" << p.team_name << "] death_type=";
            lcr::print(os, p.death_type);
            if (p.telemetry.has()) {
                os << " alive=" << (p.telemetry.value().is_alive ? "true" : "false")
                   << " groggy=" << (p.telemetry.value().is_groggy ? "true" : "false");
            }
            os << "\n";
        }
        os << "}\n";
    }

    [[nodiscard]]
    inline std::string str() const {
        std::ostringstream oss;
        dump(oss);
        return oss.str();
    }
};

inline std::ostream& operator<<(std::ostream& os, const MatchSnapshot& s) {
    s.dump(os);
    return os;
}

} // namespace livestand::schema
