#pragma once

#include "strategy.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fillsched {

enum class SortMetric { Makespan, Utilization, Changeovers };

// "makespan", "utilization" or "changeovers" (case-insensitive). Throws ConfigError.
SortMetric parseSortMetric(const std::string& name);
const char* toString(SortMetric metric);

struct StrategyFailure {
    std::string strategy;
    std::string error_kind;
    std::string message;
};

struct ComparisonReport {
    std::vector<PlanResult> ranked;
    std::vector<StrategyFailure> failures; // in request order
};

// Run every named strategy on the same lots and rank the successes.
// A failing run is recorded and never stops the others.
ComparisonReport compareStrategies(const std::vector<Lot>& lots, const std::vector<std::string>& names,
                                   Hours start_time, const FillConfig& cfg,
                                   SortMetric sort_by = SortMetric::Makespan,
                                   std::shared_ptr<SolverBackend> backend = nullptr, bool parallel = true);

} // namespace fillsched
