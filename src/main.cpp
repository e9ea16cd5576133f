#include "comparator.hpp"
#include "errors.hpp"
#include "lot_io.hpp"
#include "milp_model.hpp"
#include "strategy.hpp"
#include "validator.hpp"
#ifdef FILLSCHED_WITH_GUROBI
#include "gurobi_backend.hpp"
#endif
#include <spdlog/spdlog.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace fillsched;

static void usage() {
    std::cout << "Usage: fillsched <lots.csv> [--strategy NAME | --compare a,b,...|all] [--sort-by makespan|utilization|changeovers]\n"
                 "                 [--start \"YYYY-MM-DD HH:MM\"] [--out schedule.csv]\n"
                 "                 [--rate V] [--clean H] [--window H] [--chg-same H] [--chg-diff H] [--beam-width N]\n"
                 "                 [--time-limit S] [--strict] [--clean-in-window] [--set key=value] [--verbose] [--trace]\n";
}

static std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string item;
    while (std::getline(iss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

static std::shared_ptr<SolverBackend> makeBackend() {
#ifdef FILLSCHED_WITH_GUROBI
    return std::make_shared<GurobiBackend>();
#else
    return nullptr;
#endif
}

static void printKpis(const KpiSummary& kpis) {
    for (const auto& kv : kpiMap(kpis)) {
        std::cout << "  " << std::left << std::setw(22) << kv.first << std::right << std::fixed
                  << std::setprecision(kv.first == "Utilization" ? 3 : 2) << kv.second << "\n";
    }
}

static void printSchedule(const PlanResult& r) {
    std::cout << "Schedule (" << r.strategy << "):\n";
    for (const auto& a : r.schedule.activities()) {
        std::cout << "  " << formatTimestamp(a.start) << " -> " << formatTimestamp(a.end) << "  " << std::left
                  << std::setw(11) << toString(a.kind) << std::right;
        if (a.lot) std::cout << a.lot->getId() << " (" << a.lot->getType() << ")  ";
        std::cout << a.note << "\n";
    }
    std::cout << "Fill order: ";
    auto order = r.schedule.fillOrder();
    for (size_t i = 0; i < order.size(); ++i) {
        if (i) std::cout << " -> ";
        std::cout << order[i];
    }
    std::cout << "\n";
    printKpis(r.kpis);
}

static bool writeOut(const std::string& path, const Schedule& schedule) {
    std::ofstream out(path);
    if (!out) {
        std::cerr << "Failed to open output: " << path << "\n";
        return false;
    }
    writeScheduleCsv(out, schedule);
    std::cout << "Wrote " << path << "\n";
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 0;
    }
    std::ifstream fin(argv[1]);
    if (!fin) {
        std::cerr << "Failed to open input: " << argv[1] << "\n";
        return 1;
    }

    FillConfig cfg;
    std::string strategyName = "smart-pack";
    std::vector<std::string> compare;
    std::string sortBy = "makespan";
    std::string outPath;
    Hours start = 0.0;
    std::string error;

    // Named flags are shorthands for --set
    auto set = [&](const std::string& key, const std::string& value) {
        if (!applyOverride(cfg, key, value, error)) {
            std::cerr << "Bad option: " << error << "\n";
            return false;
        }
        return true;
    };
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        bool ok = true;
        if (a == "--verbose") spdlog::set_level(spdlog::level::debug);
        else if (a == "--trace") spdlog::set_level(spdlog::level::trace);
        else if (a == "--strict") cfg.strict_duplicate_ids = true;
        else if (a == "--clean-in-window") cfg.clean_counts_toward_window = true;
        else if (a == "--strategy" && i + 1 < argc) strategyName = argv[++i];
        else if (a == "--compare" && i + 1 < argc) compare = splitList(argv[++i]);
        else if (a == "--sort-by" && i + 1 < argc) sortBy = argv[++i];
        else if (a == "--out" && i + 1 < argc) outPath = argv[++i];
        else if (a == "--rate" && i + 1 < argc) ok = set("fill_rate_vials_per_hour", argv[++i]);
        else if (a == "--clean" && i + 1 < argc) ok = set("clean_hours", argv[++i]);
        else if (a == "--window" && i + 1 < argc) ok = set("window_hours", argv[++i]);
        else if (a == "--chg-same" && i + 1 < argc) ok = set("changeover_same_hours", argv[++i]);
        else if (a == "--chg-diff" && i + 1 < argc) ok = set("changeover_diff_hours", argv[++i]);
        else if (a == "--beam-width" && i + 1 < argc) ok = set("beam_width", argv[++i]);
        else if (a == "--time-limit" && i + 1 < argc) ok = set("milp_time_limit_seconds", argv[++i]);
        else if (a == "--set" && i + 1 < argc) {
            ok = applyAssignment(cfg, argv[++i], error);
            if (!ok) std::cerr << "Bad option: " << error << "\n";
        } else if (a == "--start" && i + 1 < argc) {
            ok = parseTimestamp(argv[++i], start);
            if (!ok) std::cerr << "Bad --start, expected \"YYYY-MM-DD HH:MM\": " << argv[i] << "\n";
        } else {
            std::cerr << "Unknown option: " << a << "\n";
            usage();
            return 4;
        }
        if (!ok) return 4;
    }
    if (compare.size() == 1 && compare[0] == "all") compare = strategyNames();

    std::vector<RawLotRecord> records;
    if (!parseLotCsv(fin, records, error)) {
        std::cerr << "Parse error: " << error << "\n";
        return 2;
    }
    PreflightReport report = preflight(records, cfg);
    for (const auto& w : report.warnings) spdlog::warn("{}", w.message);
    if (!report.ok()) {
        std::cerr << "Input validation failed (" << report.errors.size() << " error(s)):\n";
        for (const auto& e : report.errors) std::cerr << "  - " << e.message << "\n";
        return 2;
    }
    std::cout << "Lots: " << report.lots.size() << ", start " << formatTimestamp(start) << "\n";

    try {
        if (!compare.empty()) {
            SortMetric metric = parseSortMetric(sortBy);
            ComparisonReport cmp = compareStrategies(report.lots, compare, start, cfg, metric, makeBackend());
            std::cout << "Ranking by " << toString(metric) << ":\n";
            for (size_t i = 0; i < cmp.ranked.size(); ++i) {
                const auto& r = cmp.ranked[i];
                std::cout << "  " << i + 1 << ". " << std::left << std::setw(12) << r.strategy << std::right
                          << std::fixed << std::setprecision(2) << " makespan " << r.kpis.makespan << " h"
                          << std::setprecision(3) << "  utilization " << r.kpis.utilization
                          << "  changeovers " << r.kpis.changeover_count << "\n";
            }
            for (const auto& f : cmp.failures) {
                std::cout << "  x  " << f.strategy << ": " << f.error_kind << ": " << f.message << "\n";
            }
            if (cmp.ranked.empty()) {
                std::cerr << "No strategy produced a schedule.\n";
                return 3;
            }
            std::cout << "\n";
            printSchedule(cmp.ranked.front());
            if (!outPath.empty() && !writeOut(outPath, cmp.ranked.front().schedule)) return 1;
        } else {
            PlanResult result = makeStrategy(strategyName, makeBackend())->plan(report.lots, start, cfg);
            printSchedule(result);
            if (!outPath.empty() && !writeOut(outPath, result.schedule)) return 1;
        }
    } catch (const ConfigError& e) {
        std::cerr << errorKind(e) << ": " << e.what() << "\n";
        return 4;
    } catch (const std::exception& e) {
        std::cerr << errorKind(e) << ": " << e.what() << "\n";
        return 3;
    }
    return 0;
}
