#pragma once

#include <cstddef>
#include <cstdint>

#include "livestand/config.hpp"
#include "livestand/schema/snapshot.hpp"
#include "livestand/reconcile/diff.hpp"
#include "livestand/reconcile/panel_registry.hpp"


namespace livestand::reconcile {

/*
===============================================================================
 livestand::reconcile::SnapshotReconciler
===============================================================================

Turns one decoded snapshot into the renderer instructions of one pass.

Input:
  • snapshot.total_teams : cumulative roster, sorted here by (rank, name)
                           and capped at max_displayed_teams
  • snapshot.teams       : current-match subset, joined by team name
  • snapshot.players     : current-match players, joined by team id, then
                           by team name
  • rebuild              : full refresh (new match or producer request)
  • panels               : panel memory from previous passes (caller-owned)

Per displayed team that plays in the current match, in roster order:
  1. create the panel if missing
  2. emit an upsert with squad counts and scores
  3. "just eliminated" fires once: in match, not yet marked, all players down.
     A team whose players are no longer all down is unmarked (revival)
  4. a just-eliminated runner-up (placement_rank 2) ends the match and
     suppresses the elimination batch of this pass
  5. rank change compares the recorded rank with the current one; not on
     the pass that creates the panel

After the loop:
  • eliminations are sorted by placement_rank descending
  • snap-to-position on rebuild, or when the panel set first reaches the
    displayed roster size

The reconciler holds no state between calls.

===============================================================================
*/

class SnapshotReconciler {
public:
    explicit SnapshotReconciler(const Config& cfg = Config{}) noexcept
        : max_displayed_teams_(cfg.max_displayed_teams)
        , min_squad_size_(cfg.min_squad_size)
    {}

    [[nodiscard]]
    Diff reconcile(const schema::MatchSnapshot& snapshot, bool rebuild, PanelRegistry& panels) const;

private:
    std::size_t   max_displayed_teams_;
    std::uint32_t min_squad_size_;
};

} // namespace livestand::reconcile
