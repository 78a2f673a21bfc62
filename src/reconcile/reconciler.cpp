#include "livestand/reconcile/reconciler.hpp"
#include "livestand/reconcile/squad.hpp"
#include "lcr/log/logger.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>


namespace livestand::reconcile {

namespace {

// Roster order: rank ascending, then name ascending
[[nodiscard]]
std::vector<const schema::TeamRecord*> displayed_roster(const std::vector<schema::TeamRecord>& total_teams, std::size_t cap) {
    std::vector<const schema::TeamRecord*> roster;
    roster.reserve(total_teams.size());
    for (const auto& t : total_teams) {
        roster.push_back(&t);
    }
    std::stable_sort(roster.begin(), roster.end(), [](const schema::TeamRecord* a, const schema::TeamRecord* b) {
        if (a->rank != b->rank) {
            return a->rank < b->rank;
        }
        return a->name < b->name;
    });
    if (roster.size() > cap) {
        roster.resize(cap);
    }
    return roster;
}

[[nodiscard]]
std::string rank_text(const schema::TeamRecord& team) {
    return team.total_score == 0.0 ? std::string("-") : std::to_string(team.rank);
}

} // namespace

Diff SnapshotReconciler::reconcile(const schema::MatchSnapshot& snapshot, bool rebuild, PanelRegistry& panels) const {
    Diff diff;
    diff.rebuild = rebuild;
    if (rebuild) {
        LS_DEBUG("[RECONCILE] Rebuild requested, clearing " << panels.size() << " panel(s).");
        panels.clear();
    }

    // Current match teams by name (last record wins)
    std::unordered_map<std::string_view, const schema::TeamRecord*> match_teams;
    match_teams.reserve(snapshot.teams.size());
    for (const auto& t : snapshot.teams) {
        match_teams[t.name] = &t;
    }
    diff.teams_in_match = match_teams.size();

    const auto roster = displayed_roster(snapshot.total_teams, max_displayed_teams_);

    std::vector<const schema::TeamRecord*> eliminated;
    std::uint32_t display_index = 1;

    for (const schema::TeamRecord* team : roster) {
        auto it = match_teams.find(team->name);
        if (it == match_teams.end()) {
            continue;   // not playing in the current match
        }
        const schema::TeamRecord& match_team = *it->second;

        // ---- Panel lookup / creation ----
        bool created = false;
        auto h = panels.find(team->name);
        if (h == PanelRegistry::npos) {
            h = panels.create(team->id, team->name, team->rank, display_index);
            created = true;
            LS_TRACE("[RECONCILE] Panel created for '" << team->name << "' at index " << display_index << ".");
        }
        Panel& panel = panels.at(h);

        // ---- Squad ----
        const auto players = players_of(*team, snapshot.players);
        const bool all_down = !players.empty() &&
            std::all_of(players.begin(), players.end(), [](const schema::PlayerRecord* p) { return is_down(*p); });
        panel.in_match = !players.empty();
        panel.team_id  = team->id;

        // ---- Rank change ----
        if (panel.positioned && panel.previous_rank > 0 && panel.previous_rank != team->rank) {
            RankChange rc;
            rc.team_id       = team->id;
            rc.name          = team->name;
            rc.direction     = (panel.previous_rank > team->rank) ? RankDirection::Up : RankDirection::Down;
            rc.previous_rank = panel.previous_rank;
            rc.current_rank  = team->rank;
            LS_DEBUG("[RECONCILE] Rank " << to_string(rc.direction) << " '" << team->name << "': "
                     << rc.previous_rank << " -> " << rc.current_rank);
            diff.rank_changes.push_back(std::move(rc));
        }
        panel.previous_rank = team->rank;
        panel.positioned    = true;
        panel.display_index = display_index;

        // ---- Elimination transition ----
        bool just_eliminated = false;
        if (panel.in_match && !panel.eliminated && all_down) {
            panel.eliminated = true;
            just_eliminated  = true;
            LS_INFO("[RECONCILE] Team '" << team->name << "' just got eliminated.");
        }
        else if (!all_down) {
            panel.eliminated = false;
        }

        // ---- Upsert ----
        Upsert u;
        u.team_id       = team->id;
        u.name          = team->name;
        u.full_name     = team->full_name.empty() ? team->name : team->full_name;
        u.display_index = display_index;
        u.rank          = team->rank;
        u.rank_text     = rank_text(*team);
        u.total_score   = team->total_score;
        u.kills         = match_team.total_kills;
        u.kills_gained  = (!created && match_team.total_kills > panel.kills) ? match_team.total_kills - panel.kills : 0;
        u.squad         = squad_status(players, min_squad_size_);
        u.in_match      = panel.in_match;
        u.eliminated    = panel.eliminated;
        u.created       = created;
        panel.kills     = match_team.total_kills;
        diff.upserts.push_back(std::move(u));

        if (just_eliminated && !diff.match_ended) {
            if (match_team.placement_rank == config::RUNNER_UP_PLACEMENT) {
                diff.match_ended = true;
                LS_INFO("[RECONCILE] Match ended: runner-up '" << team->name << "' eliminated.");
            }
            eliminated.push_back(&match_team);
        }

        ++display_index;
    }

    // ---- Elimination batch ----
    if (diff.match_ended) {
        if (!eliminated.empty()) {
            LS_DEBUG("[RECONCILE] Match ended, skipping " << eliminated.size() << " elimination(s).");
        }
    }
    else if (!eliminated.empty()) {
        std::stable_sort(eliminated.begin(), eliminated.end(), [](const schema::TeamRecord* a, const schema::TeamRecord* b) {
            return a->placement_rank > b->placement_rank;
        });
        diff.eliminations.reserve(eliminated.size());
        for (const auto* t : eliminated) {
            Elimination e;
            e.team_id        = t->id;
            e.name           = t->name;
            e.placement_rank = t->placement_rank;
            e.kills          = t->total_kills;
            e.teams_in_match = diff.teams_in_match;
            diff.eliminations.push_back(std::move(e));
        }
    }

    // ---- Snap to position ----
    const bool full = !roster.empty() && panels.size() == roster.size();
    if (rebuild || (full && !panels.was_full())) {
        diff.snap_to_position = true;
        for (std::size_t i = 0; i < roster.size(); ++i) {
            auto h = panels.find(roster[i]->name);
            if (h == PanelRegistry::npos) {
                continue;
            }
            diff.snap_slots.push_back(SnapSlot{roster[i]->id, roster[i]->name, static_cast<std::uint32_t>(i + 1)});
        }
        LS_DEBUG("[RECONCILE] Snap " << diff.snap_slots.size() << " panel(s) to position.");
    }
    if (full) {
        panels.mark_full();
    }

    return diff;
}

} // namespace livestand::reconcile
