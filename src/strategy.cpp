#include "strategy.hpp"
#include "errors.hpp"
#include "heuristics.hpp"
#include "line_packer.hpp"
#include "milp_opt.hpp"
#include "smart_pack.hpp"
#include "validator.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <spdlog/spdlog.h>

namespace fillsched {

PlanResult Strategy::plan(const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg,
                          ProgressSink* progress) const {
    cfg.validateOrThrow();
    PlanResult result;
    result.strategy = getName();
    const int total = static_cast<int>(lots.size());
    if (lots.empty()) {
        notify(progress, result.strategy, 0, 0, "no lots");
        return result;
    }
    checkOversize(lots, cfg);

    spdlog::debug("{}: planning {} lots", result.strategy, total);
    result.schedule = doPlan(lots, start_time, cfg, progress);
    postflight(result.schedule, cfg, lots);
    result.kpis = computeKpis(result.schedule);
    spdlog::debug("{}: makespan {:.2f} h, {} cleans, {} changeovers", result.strategy, result.kpis.makespan,
                  result.kpis.clean_blocks, result.kpis.changeover_count);
    notify(progress, result.strategy, total, total, "done");
    return result;
}

Schedule OrderingStrategy::doPlan(const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg,
                                  ProgressSink*) const {
    LinePacker packer(cfg, start_time);
    for (const auto& lot : order(lots, cfg)) packer.place(lot);
    return packer.finish();
}

static const std::map<std::string, std::string>& aliases() {
    static const std::map<std::string, std::string> table = {
        {"spt", "spt-pack"},       {"spt-pack", "spt-pack"},
        {"lpt", "lpt-pack"},       {"lpt-pack", "lpt-pack"},
        {"cfs", "cfs-pack"},       {"cfs-pack", "cfs-pack"},
        {"smart", "smart-pack"},   {"smart-pack", "smart-pack"},
        {"hybrid", "hybrid-pack"}, {"hybrid-pack", "hybrid-pack"},
        {"milp", "milp-opt"},      {"milp-opt", "milp-opt"},
    };
    return table;
}

std::string canonicalStrategyName(const std::string& name) {
    std::string key;
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        key.push_back(c == '_' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    auto it = aliases().find(key);
    if (it == aliases().end()) {
        std::string known;
        for (const auto& n : strategyNames()) known += (known.empty() ? "" : ", ") + n;
        throw UnknownStrategyError("Unknown strategy '" + name + "'. Available: " + known);
    }
    return it->second;
}

std::vector<std::string> strategyNames() {
    return {"spt-pack", "lpt-pack", "cfs-pack", "smart-pack", "hybrid-pack", "milp-opt"};
}

std::unique_ptr<Strategy> makeStrategy(const std::string& name, std::shared_ptr<SolverBackend> backend) {
    const std::string canonical = canonicalStrategyName(name);
    if (canonical == "spt-pack") return std::make_unique<SptPack>();
    if (canonical == "lpt-pack") return std::make_unique<LptPack>();
    if (canonical == "cfs-pack") return std::make_unique<CfsPack>();
    if (canonical == "smart-pack") return std::make_unique<SmartPack>();
    if (canonical == "hybrid-pack") return std::make_unique<HybridPack>();
    return std::make_unique<MilpOpt>(std::move(backend));
}

} // namespace fillsched
