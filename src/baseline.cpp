#include "errors.hpp"
#include "line_packer.hpp"
#include "lot_io.hpp"
#include "validator.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <iomanip>
#include <iostream>

using namespace fillsched;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << "Usage: fillsched_baseline <lots.csv> [--seq sequence.txt] [--start \"YYYY-MM-DD HH:MM\"] [--set key=value]\n";
        return 0;
    }
    std::ifstream fin(argv[1]);
    if (!fin) {
        std::cerr << "Failed to open input: " << argv[1] << "\n";
        return 1;
    }

    FillConfig cfg;
    Hours start = 0.0;
    std::string seqPath;
    std::string error;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--seq" && i + 1 < argc) seqPath = argv[++i];
        else if (a == "--verbose") spdlog::set_level(spdlog::level::debug);
        else if (a == "--start" && i + 1 < argc) {
            if (!parseTimestamp(argv[++i], start)) {
                std::cerr << "Bad --start: " << argv[i] << "\n";
                return 4;
            }
        } else if (a == "--set" && i + 1 < argc) {
            if (!applyAssignment(cfg, argv[++i], error)) {
                std::cerr << "Bad option: " << error << "\n";
                return 4;
            }
        } else {
            std::cerr << "Unknown option: " << a << "\n";
            return 4;
        }
    }

    std::vector<RawLotRecord> records;
    if (!parseLotCsv(fin, records, error)) {
        std::cerr << "Parse error: " << error << "\n";
        return 2;
    }
    PreflightReport report = preflight(records, cfg);
    for (const auto& w : report.warnings) spdlog::warn("{}", w.message);
    if (!report.ok()) {
        for (const auto& e : report.errors) std::cerr << "  - " << e.message << "\n";
        return 2;
    }

    std::vector<Lot> lots = report.lots;
    if (!seqPath.empty()) {
        std::ifstream seq(seqPath);
        if (!seq) {
            std::cerr << "Failed to open sequence: " << seqPath << "\n";
            return 1;
        }
        std::vector<std::string> ids;
        if (!parseSequence(seq, ids, error)) {
            std::cerr << "Sequence parse error: " << error << "\n";
            return 2;
        }
        std::vector<std::string> unknown;
        lots = orderLotsBySequence(lots, ids, &unknown);
        for (const auto& id : unknown) spdlog::warn("sequence names unknown lot {}", id);
    }

    try {
        Schedule schedule = planInOrder(lots, start, cfg);
        postflight(schedule, cfg, lots);
        KpiSummary kpis = computeKpis(schedule);
        std::cout << "Baseline schedule (" << (seqPath.empty() ? "given order" : "sequence file") << "):\n";
        auto order = schedule.fillOrder();
        for (size_t i = 0; i < order.size(); ++i) {
            if (i) std::cout << " -> ";
            std::cout << order[i];
        }
        std::cout << "\n";
        for (const auto& kv : kpiMap(kpis)) {
            std::cout << "  " << std::left << std::setw(22) << kv.first << std::right << std::fixed
                      << std::setprecision(2) << kv.second << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << errorKind(e) << ": " << e.what() << "\n";
        return 3;
    }
    return 0;
}
