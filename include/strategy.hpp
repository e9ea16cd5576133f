#pragma once

#include "config.hpp"
#include "model.hpp"
#include "progress.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fillsched {

class SolverBackend;

struct PlanResult {
    std::string strategy;
    Schedule schedule;
    KpiSummary kpis;
};

// A sequencing strategy. plan() is the only entry point: it checks the
// config, rejects oversize lots, lets the subclass sequence, then runs
// Postflight over the result before handing it back.
class Strategy {
public:
    virtual ~Strategy() = default;

    virtual std::string getName() const = 0;

    PlanResult plan(const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg,
                    ProgressSink* progress = nullptr) const;

protected:
    // Never called with an empty lot set or an oversize lot.
    virtual Schedule doPlan(const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg,
                            ProgressSink* progress) const = 0;
};

// Strategies that only pick an order and leave packing to LinePacker.
class OrderingStrategy : public Strategy {
protected:
    virtual std::vector<Lot> order(const std::vector<Lot>& lots, const FillConfig& cfg) const = 0;

    Schedule doPlan(const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg,
                    ProgressSink* progress) const override;
};

// Canonical name for `name` (aliases like "spt" or "smart_pack" accepted,
// case-insensitive). Throws UnknownStrategyError.
std::string canonicalStrategyName(const std::string& name);

std::vector<std::string> strategyNames();

// `backend` is only used by milp-opt; without one it fails with SolverUnavailableError.
std::unique_ptr<Strategy> makeStrategy(const std::string& name, std::shared_ptr<SolverBackend> backend = nullptr);

} // namespace fillsched
