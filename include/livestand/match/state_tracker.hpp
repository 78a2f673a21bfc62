#pragma once

#include <mutex>
#include <string>

#include "livestand/schema/snapshot.hpp"


namespace livestand {
namespace match {

// ===============================================
// MATCH STATE
// ===============================================
struct MatchState {
    bool            observed = false;   // false until the first update_state()
    schema::MatchId match_id;
    std::string     tournament_id;
};

/*
===============================================================================
 livestand::match::MatchStateTracker
===============================================================================

Decides whether a delivered snapshot belongs to the tracked match or starts
a new one.

- should_refresh() is false until a match id has been recorded, then true
  iff the new id differs byte-for-byte from the recorded one. The
  reconnecting tag plays no part in the decision.
- update_state() must run after every processed snapshot. It stores its own
  copy of the id.
- clear() returns to the "never observed" state.

All operations are mutex-protected.

===============================================================================
*/

class MatchStateTracker {
public:
    MatchStateTracker() = default;

    MatchStateTracker(const MatchStateTracker&) = delete;
    MatchStateTracker& operator=(const MatchStateTracker&) = delete;

    [[nodiscard]]
    bool should_refresh(const schema::MatchId& new_match_id) const;

    void update_state(const schema::MatchId& match_id, const std::string& tournament_id);

    void clear();

    [[nodiscard]]
    MatchState state() const;

private:
    mutable std::mutex mutex_;
    MatchState state_;
};

} // namespace match
} // namespace livestand
