#include "comparator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <future>
#include <optional>
#include <spdlog/spdlog.h>

namespace fillsched {

SortMetric parseSortMetric(const std::string& name) {
    std::string key;
    for (char c : name) key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (key == "makespan") return SortMetric::Makespan;
    if (key == "utilization") return SortMetric::Utilization;
    if (key == "changeovers") return SortMetric::Changeovers;
    throw ConfigError("unknown sort metric '" + name + "' (makespan, utilization, changeovers)");
}

const char* toString(SortMetric metric) {
    switch (metric) {
        case SortMetric::Makespan: return "makespan";
        case SortMetric::Utilization: return "utilization";
        case SortMetric::Changeovers: return "changeovers";
    }
    return "makespan";
}

namespace {

struct Outcome {
    std::optional<PlanResult> result;
    std::optional<StrategyFailure> failure;
};

Outcome runOne(const std::string& name, const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg,
               const std::shared_ptr<SolverBackend>& backend) {
    Outcome out;
    try {
        out.result = makeStrategy(name, backend)->plan(lots, start_time, cfg);
    } catch (const std::exception& e) {
        out.failure = StrategyFailure{name, errorKind(e), e.what()};
    }
    return out;
}

} // namespace

ComparisonReport compareStrategies(const std::vector<Lot>& lots, const std::vector<std::string>& names,
                                   Hours start_time, const FillConfig& cfg, SortMetric sort_by,
                                   std::shared_ptr<SolverBackend> backend, bool parallel) {
    const auto policy = parallel ? std::launch::async : std::launch::deferred;
    std::vector<std::future<Outcome>> runs;
    runs.reserve(names.size());
    for (const auto& name : names) {
        runs.push_back(std::async(policy, runOne, name, std::cref(lots), start_time, std::cref(cfg), std::cref(backend)));
    }

    ComparisonReport report;
    for (auto& run : runs) {
        Outcome out = run.get();
        if (out.result) {
            report.ranked.push_back(std::move(*out.result));
        } else {
            spdlog::warn("{} failed: [{}] {}", out.failure->strategy, out.failure->error_kind, out.failure->message);
            report.failures.push_back(std::move(*out.failure));
        }
    }

    std::sort(report.ranked.begin(), report.ranked.end(), [sort_by](const PlanResult& a, const PlanResult& b) {
        switch (sort_by) {
            case SortMetric::Makespan:
                if (a.kpis.makespan != b.kpis.makespan) return a.kpis.makespan < b.kpis.makespan;
                break;
            case SortMetric::Utilization:
                if (a.kpis.utilization != b.kpis.utilization) return a.kpis.utilization > b.kpis.utilization;
                break;
            case SortMetric::Changeovers:
                if (a.kpis.changeover_count != b.kpis.changeover_count) {
                    return a.kpis.changeover_count < b.kpis.changeover_count;
                }
                break;
        }
        return a.strategy < b.strategy;
    });
    return report;
}

} // namespace fillsched
