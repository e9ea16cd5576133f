#pragma once

#include "line_packer.hpp"
#include "strategy.hpp"
#include <vector>

namespace fillsched {

// Score of placing `lot` next on `state`. Higher is better:
//   -w_slack * max(0, budget left) - lambda1 * changeover - lambda2 * [avoidable forced clean]
// A forced clean is avoidable when some other lot of `pool` not yet in
// `used` would still fit the current window.
double scorePlacement(const PackState& state, const Lot& lot, const std::vector<Lot>& pool,
                      const std::vector<bool>& used, const FillConfig& cfg);

// Bounded beam search over `pool` from `state`. Expands up to
// cfg.smart_lookahead levels keeping cfg.beam_width partial sequences
// (cumulative score, ties by id sequence) and returns the index in `pool`
// of the first lot of the best one. `pool` must not be empty.
size_t beamPickNext(const PackState& state, const std::vector<Lot>& pool, const FillConfig& cfg);

class SmartPack : public Strategy {
public:
    std::string getName() const override { return "smart-pack"; }
protected:
    Schedule doPlan(const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg,
                    ProgressSink* progress) const override;
};

// CFS clusters fix the group order; the beam orders lots inside each group.
class HybridPack : public Strategy {
public:
    std::string getName() const override { return "hybrid-pack"; }
protected:
    Schedule doPlan(const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg,
                    ProgressSink* progress) const override;
};

} // namespace fillsched
