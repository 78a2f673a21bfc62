#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>


namespace livestand::reconcile {

// Reconciler-side memory of one rendered team panel
struct Panel {
    std::int64_t  team_id = 0;
    std::string   name;
    std::int64_t  previous_rank = 0;    // rank recorded by the last pass
    std::int64_t  kills = 0;            // match kills recorded by the last pass
    std::uint32_t display_index = 0;
    bool          positioned = false;   // a pass has already placed the panel
    bool          in_match = false;
    bool          eliminated = false;
};

/*
===============================================================================
 livestand::reconcile::PanelRegistry
===============================================================================

Arena of panels keyed by team name. Owned by the caller of the reconciler
(the Pipeline) so the reconciler itself stays stateless.

Handles are indices into the arena; they stay valid until clear().

===============================================================================
*/

class PanelRegistry {
public:
    using handle_t = std::size_t;
    static constexpr handle_t npos = static_cast<handle_t>(-1);

    [[nodiscard]]
    inline handle_t find(const std::string& name) const {
        auto it = index_.find(name);
        return it == index_.end() ? npos : it->second;
    }

    // Creates a panel with previous_rank seeded from the current rank
    inline handle_t create(std::int64_t team_id, const std::string& name, std::int64_t rank, std::uint32_t display_index) {
        handle_t h = panels_.size();
        Panel p;
        p.team_id       = team_id;
        p.name          = name;
        p.previous_rank = rank;
        p.display_index = display_index;
        panels_.push_back(std::move(p));
        index_.emplace(name, h);
        return h;
    }

    [[nodiscard]] inline Panel& at(handle_t h) { return panels_.at(h); }
    [[nodiscard]] inline const Panel& at(handle_t h) const { return panels_.at(h); }

    [[nodiscard]] inline std::size_t size() const noexcept { return panels_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return panels_.empty(); }

    [[nodiscard]] inline const std::vector<Panel>& panels() const noexcept { return panels_; }

    // Set once the panel count has reached the displayed roster size
    [[nodiscard]] inline bool was_full() const noexcept { return was_full_; }
    inline void mark_full() noexcept { was_full_ = true; }

    inline void clear() noexcept {
        panels_.clear();
        index_.clear();
        was_full_ = false;
    }

private:
    std::vector<Panel>                        panels_;
    std::unordered_map<std::string, handle_t> index_;
    bool was_full_ = false;
};

} // namespace livestand::reconcile
