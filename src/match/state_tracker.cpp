#include "livestand/match/state_tracker.hpp"
#include "lcr/log/logger.hpp"


namespace livestand {
namespace match {

bool MatchStateTracker::should_refresh(const schema::MatchId& new_match_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.observed) {
        LS_DEBUG("[MATCH] First snapshot observed, no refresh.");
        return false;
    }
    if (state_.match_id == new_match_id) {
        return false;
    }
    LS_INFO("[MATCH] Match changed: " << schema::to_hex(state_.match_id)
            << " -> " << schema::to_hex(new_match_id) << " (refresh).");
    return true;
}

void MatchStateTracker::update_state(const schema::MatchId& match_id, const std::string& tournament_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.observed      = true;
    state_.match_id      = match_id;
    state_.tournament_id = tournament_id;
    LS_TRACE("[MATCH] State updated (match=" << schema::to_hex(match_id)
             << ", tournament=" << tournament_id << ").");
}

void MatchStateTracker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = MatchState{};
    LS_DEBUG("[MATCH] State cleared.");
}

MatchState MatchStateTracker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace match
} // namespace livestand
