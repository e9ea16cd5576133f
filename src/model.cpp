#include "model.hpp"
#include "errors.hpp"
#include <sstream>

namespace fillsched {

const char* toString(ActivityKind kind) {
    switch (kind) {
        case ActivityKind::Clean: return "CLEAN";
        case ActivityKind::Changeover: return "CHANGEOVER";
        case ActivityKind::Fill: return "FILL";
    }
    return "UNKNOWN";
}

void Schedule::append(Activity a) {
    const size_t idx = activities_.size();
    if (a.end <= a.start) {
        std::ostringstream oss;
        oss << "activity " << idx << " (" << toString(a.kind) << ") has end <= start";
        throw ScheduleInvariantError(oss.str(), idx);
    }
    if (!activities_.empty()) {
        const Activity& prev = activities_.back();
        if (a.start + kTimeEpsilon < prev.end) {
            std::ostringstream oss;
            oss << "activity " << idx << " (" << toString(a.kind) << ") starts at " << a.start
                << " before activity " << idx - 1 << " (" << toString(prev.kind) << ") ends at " << prev.end;
            throw ScheduleInvariantError(oss.str(), idx);
        }
        if (a.line_id != prev.line_id) {
            throw ScheduleInvariantError("activity " + std::to_string(idx) + " is on line '" + a.line_id +
                                         "', schedule is for line '" + prev.line_id + "'", idx);
        }
    }
    activities_.push_back(std::move(a));
}

std::vector<std::string> Schedule::fillOrder() const {
    std::vector<std::string> ids;
    for (const auto& a : activities_) {
        if (a.kind == ActivityKind::Fill && a.lot) ids.push_back(a.lot->getId());
    }
    return ids;
}

KpiSummary computeKpis(const Schedule& schedule) {
    KpiSummary k;
    if (schedule.empty()) return k;
    k.makespan = schedule.activities().back().end - schedule.activities().front().start;
    for (const auto& a : schedule.activities()) {
        switch (a.kind) {
            case ActivityKind::Clean:
                k.total_clean_hours += a.duration();
                ++k.clean_blocks;
                break;
            case ActivityKind::Changeover:
                k.total_changeover_hours += a.duration();
                ++k.changeover_count;
                break;
            case ActivityKind::Fill:
                k.total_fill_hours += a.duration();
                ++k.lots_scheduled;
                break;
        }
    }
    k.utilization = k.makespan > 0.0 ? k.total_fill_hours / k.makespan : 0.0;
    return k;
}

std::vector<std::pair<std::string, double>> kpiMap(const KpiSummary& kpis) {
    return {
        {"Makespan (h)", kpis.makespan},
        {"Total Clean (h)", kpis.total_clean_hours},
        {"Total Changeover (h)", kpis.total_changeover_hours},
        {"Total Fill (h)", kpis.total_fill_hours},
        {"Utilization", kpis.utilization},
        {"Lots Scheduled", static_cast<double>(kpis.lots_scheduled)},
        {"Clean Blocks", static_cast<double>(kpis.clean_blocks)},
        {"Changeovers", static_cast<double>(kpis.changeover_count)},
    };
}

} // namespace fillsched
