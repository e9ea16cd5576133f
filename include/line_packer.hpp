#pragma once

#include "model.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fillsched {

// CleanWindow state of the line while planning. Cheap to copy so search
// strategies can branch on it without emitting activities.
struct PackState {
    Hours current_time{0.0};
    Hours last_clean_end{0.0};
    std::optional<std::string> last_type; // none right after a clean
};

// What placing a lot on a given state would cost.
struct PlacementPreview {
    bool forced_clean{false};
    Hours changeover{0.0};    // after any forced clean
    Hours needed{0.0};        // changeover + fill
    Hours budget_after{0.0};  // window budget left once the fill ends
};

// State right after the opening clean at `start_time`.
PackState openLine(const FillConfig& cfg, Hours start_time);

PlacementPreview previewPlacement(const PackState& state, const Lot& lot, const FillConfig& cfg);

// Apply a placement to a copy of the state (forced clean included).
PackState advance(const PackState& state, const Lot& lot, const FillConfig& cfg);

// Throws OversizeLotError for the first lot whose fill can never fit a window.
void checkOversize(const std::vector<Lot>& lots, const FillConfig& cfg);

// Common packing skeleton shared by every strategy. Emits a Clean at the
// start time, then Changeover/Fill pairs, inserting a Clean whenever the
// next placement would overrun the window.
class LinePacker {
public:
    LinePacker(const FillConfig& cfg, Hours start_time);

    // Place `lot` next. Returns true when a forced clean was inserted first.
    bool place(const Lot& lot);

    // Voluntary clean; resets the window and the changeover chain.
    void clean(const std::string& note = "Block reset");

    const PackState& state() const { return state_; }
    const Schedule& schedule() const { return schedule_; }
    Schedule finish() { return std::move(schedule_); }

private:
    const FillConfig& cfg_;
    PackState state_;
    Schedule schedule_;

    void appendClean(const std::string& note);
};

// Pack lots exactly in the given order (no optimisation).
Schedule planInOrder(const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg);

// Lots named in `sequence` first, in that order; the rest keep their original order.
// Unknown ids in `sequence` are returned through `unknown` when given.
std::vector<Lot> orderLotsBySequence(const std::vector<Lot>& lots, const std::vector<std::string>& sequence,
                                     std::vector<std::string>* unknown = nullptr);

} // namespace fillsched
