#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <ostream>
#include <sstream>


namespace livestand::reconcile {

// ===============================================
// SQUAD STATUS
// ===============================================
struct SquadStatus {
    std::uint32_t alive  = 0;
    std::uint32_t groggy = 0;
    std::uint32_t dead   = 0;
    std::uint32_t total  = 0;       // display slots (at least min_squad_size)

    bool operator==(const SquadStatus&) const = default;
};

// ===============================================
// RANK DIRECTION
// ===============================================
enum class RankDirection : std::uint8_t {
    Up,         // rank number decreased
    Down        // rank number increased
};

[[nodiscard]]
inline constexpr std::string_view to_string(RankDirection d) noexcept {
    switch (d) {
        case RankDirection::Up:   return "up";
        case RankDirection::Down: return "down";
        default:                  return "unknown";
    }
}

// ===============================================
// RENDERER INSTRUCTIONS
// ===============================================

// Per-team panel update
struct Upsert {
    std::int64_t  team_id = 0;
    std::string   name;
    std::string   full_name;
    std::uint32_t display_index = 0;    // 1-based, counts in-match teams only
    std::int64_t  rank = 0;
    std::string   rank_text;            // "-" while the team has no score
    double        total_score = 0.0;
    std::int64_t  kills = 0;            // current match kills
    std::int64_t  kills_gained = 0;     // since the previous pass
    SquadStatus   squad;
    bool          in_match = false;
    bool          eliminated = false;
    bool          created = false;      // panel created in this pass
};

struct RankChange {
    std::int64_t  team_id = 0;
    std::string   name;
    RankDirection direction = RankDirection::Up;
    std::int64_t  previous_rank = 0;
    std::int64_t  current_rank = 0;
};

struct Elimination {
    std::int64_t  team_id = 0;
    std::string   name;
    std::int64_t  placement_rank = 0;
    std::int64_t  kills = 0;
    std::size_t   teams_in_match = 0;
};

struct SnapSlot {
    std::int64_t  team_id = 0;
    std::string   name;
    std::uint32_t position = 0;         // 1-based slot in the displayed roster
};

// ===============================================
// DIFF (one reconciliation pass)
// ===============================================
struct Diff {
    bool rebuild = false;               // renderer must drop all panels first
    bool reconnecting = false;          // delivery was tagged as post-reconnect

    std::vector<Upsert>      upserts;
    std::vector<RankChange>  rank_changes;
    std::vector<Elimination> eliminations;  // placement_rank descending

    bool match_ended = false;           // runner-up eliminated in this pass

    bool                  snap_to_position = false;
    std::vector<SnapSlot> snap_slots;

    std::size_t teams_in_match = 0;

    [[nodiscard]]
    inline bool empty() const noexcept {
        return !rebuild && upserts.empty() && rank_changes.empty() &&
               eliminations.empty() && !match_ended && !snap_to_position;
    }

    // ------------------------------------------------------------
    // Debug / diagnostic dump
    // ------------------------------------------------------------
    inline void dump(std::ostream& os) const {
        os << "[DIFF] {\n";
        os << "  rebuild: " << (rebuild ? "true" : "false")
           << ", reconnecting: " << (reconnecting ? "true" : "false")
           << ", teams_in_match: " << teams_in_match << "\n";
        for (const auto& u : upserts) {
            os << "  upsert #" << u.display_index << " " << u.name
               << " rank=" << u.rank_text
               << " kills=" << u.kills << " (+" << u.kills_gained << ")"
               << " squad=" << u.squad.alive << "/" << u.squad.groggy << "/" << u.squad.dead
               << (u.in_match ? "" : " [out]")
               << (u.eliminated ? " [eliminated]" : "")
               << (u.created ? " [new]" : "") << "\n";
        }
        for (const auto& r : rank_changes) {
            os << "  rank " << to_string(r.direction) << " " << r.name
               << " " << r.previous_rank << " -> " << r.current_rank << "\n";
        }
        for (const auto& e : eliminations) {
            os << "  eliminated " << e.name << " placement=" << e.placement_rank
               << " kills=" << e.kills << "\n";
        }
        if (match_ended) {
            os << "  match ended\n";
        }
        if (snap_to_position) {
            os << "  snap:";
            for (const auto& s : snap_slots) {
                os << " " << s.position << "=" << s.name;
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

inline std::ostream& operator<<(std::ostream& os, const Diff& d) {
    d.dump(os);
    return os;
}

} // namespace livestand::reconcile
