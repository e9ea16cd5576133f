#include "smart_pack.hpp"
#include "heuristics.hpp"
#include <algorithm>
#include <limits>
#include <numeric>
#include <spdlog/spdlog.h>

namespace fillsched {

namespace {

// The two cheapest placements among the unused lots of a pool, seen from
// one state. Enough to tell whether any lot other than a given one fits.
struct WindowFit {
    size_t best{static_cast<size_t>(-1)};
    Hours best_needed{std::numeric_limits<Hours>::infinity()};
    Hours second_needed{std::numeric_limits<Hours>::infinity()};
    Hours budget{0.0};

    bool otherLotFits(size_t j) const {
        return !requiresForcedClean(budget, j == best ? second_needed : best_needed);
    }
};

WindowFit summarizeFit(const PackState& state, const std::vector<Lot>& pool, const std::vector<bool>& used,
                       const FillConfig& cfg) {
    WindowFit fit;
    fit.budget = windowBudget(cfg, state.last_clean_end, state.current_time);
    for (size_t j = 0; j < pool.size(); ++j) {
        if (used[j]) continue;
        Hours needed = changeoverDuration(cfg, state.last_type, pool[j].getType()) + pool[j].getFillHours();
        if (needed < fit.best_needed) {
            fit.second_needed = fit.best_needed;
            fit.best_needed = needed;
            fit.best = j;
        } else if (needed < fit.second_needed) {
            fit.second_needed = needed;
        }
    }
    return fit;
}

double placementScore(const PlacementPreview& p, bool avoidableClean, const FillConfig& cfg) {
    return -cfg.smart_slack_weight * std::max(0.0, p.budget_after)
           - cfg.smart_changeover_weight * p.changeover
           - (avoidableClean ? cfg.smart_forced_clean_penalty : 0.0);
}

struct BeamEntry {
    PackState state;
    std::vector<bool> used;
    std::vector<size_t> picks;
    double score{0.0};
};

// One expansion of a beam entry, materialized only if it survives the cut.
struct Candidate {
    size_t parent;
    size_t lot;
    double score;
};

} // namespace

double scorePlacement(const PackState& state, const Lot& lot, const std::vector<Lot>& pool,
                      const std::vector<bool>& used, const FillConfig& cfg) {
    PlacementPreview p = previewPlacement(state, lot, cfg);
    bool avoidable = false;
    if (p.forced_clean) {
        size_t self = pool.size();
        for (size_t j = 0; j < pool.size(); ++j) {
            if (!used[j] && pool[j] == lot) self = j;
        }
        avoidable = summarizeFit(state, pool, used, cfg).otherLotFits(self);
    }
    return placementScore(p, avoidable, cfg);
}

size_t beamPickNext(const PackState& state, const std::vector<Lot>& pool, const FillConfig& cfg) {
    const size_t width = static_cast<size_t>(cfg.beam_width);
    const size_t depth = std::min(pool.size(), static_cast<size_t>(cfg.smart_lookahead));

    // rank[j]: position of pool[j] in id order, for the tie-break
    std::vector<size_t> byId(pool.size());
    std::iota(byId.begin(), byId.end(), 0);
    std::sort(byId.begin(), byId.end(), [&](size_t a, size_t b) { return pool[a].getId() < pool[b].getId(); });
    std::vector<size_t> rank(pool.size());
    for (size_t r = 0; r < byId.size(); ++r) rank[byId[r]] = r;

    std::vector<BeamEntry> beam;
    beam.push_back(BeamEntry{state, std::vector<bool>(pool.size(), false), {}, 0.0});

    for (size_t level = 0; level < depth; ++level) {
        std::vector<Candidate> next;
        for (size_t b = 0; b < beam.size(); ++b) {
            const BeamEntry& cur = beam[b];
            const WindowFit fit = summarizeFit(cur.state, pool, cur.used, cfg);
            for (size_t j = 0; j < pool.size(); ++j) {
                if (cur.used[j]) continue;
                PlacementPreview p = previewPlacement(cur.state, pool[j], cfg);
                next.push_back({b, j, cur.score + placementScore(p, p.forced_clean && fit.otherLotFits(j), cfg)});
            }
        }
        // Keep best `width` by cumulative score; equal scores fall back to the id sequence
        auto better = [&](const Candidate& a, const Candidate& b) {
            if (a.score != b.score) return a.score > b.score;
            if (a.parent != b.parent) {
                const auto& pa = beam[a.parent].picks;
                const auto& pb = beam[b.parent].picks;
                return std::lexicographical_compare(pa.begin(), pa.end(), pb.begin(), pb.end(),
                                                    [&](size_t x, size_t y) { return rank[x] < rank[y]; });
            }
            return rank[a.lot] < rank[b.lot];
        };
        const size_t keep = std::min(width, next.size());
        std::partial_sort(next.begin(), next.begin() + static_cast<std::ptrdiff_t>(keep), next.end(), better);

        std::vector<BeamEntry> kept;
        kept.reserve(keep);
        for (size_t k = 0; k < keep; ++k) {
            const Candidate& c = next[k];
            const BeamEntry& parent = beam[c.parent];
            BeamEntry e{advance(parent.state, pool[c.lot], cfg), parent.used, parent.picks, c.score};
            e.used[c.lot] = true;
            e.picks.push_back(c.lot);
            kept.push_back(std::move(e));
        }
        beam.swap(kept);
    }
    return beam.front().picks.front();
}

// Drain `pool` onto the packer one beam decision at a time.
static void packWithBeam(LinePacker& packer, std::vector<Lot> pool, const FillConfig& cfg, const std::string& name,
                         ProgressSink* progress, int& placed, int total) {
    std::sort(pool.begin(), pool.end(), [](const Lot& a, const Lot& b) { return a.getId() < b.getId(); });
    while (!pool.empty()) {
        size_t pick = beamPickNext(packer.state(), pool, cfg);
        const Lot lot = pool[pick];
        pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(pick));
        bool forced = packer.place(lot);
        ++placed;
        spdlog::trace("{}: placed {} ({} of {}){}", name, lot.getId(), placed, total, forced ? " after forced clean" : "");
        notify(progress, name, placed, total, "placed " + lot.getId());
    }
}

Schedule SmartPack::doPlan(const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg,
                           ProgressSink* progress) const {
    LinePacker packer(cfg, start_time);
    int placed = 0;
    packWithBeam(packer, lots, cfg, getName(), progress, placed, static_cast<int>(lots.size()));
    return packer.finish();
}

Schedule HybridPack::doPlan(const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg,
                            ProgressSink* progress) const {
    LinePacker packer(cfg, start_time);
    int placed = 0;
    for (auto& cluster : cfsClusters(lots, cfg)) {
        packWithBeam(packer, std::move(cluster), cfg, getName(), progress, placed, static_cast<int>(lots.size()));
    }
    return packer.finish();
}

} // namespace fillsched
