#pragma once

#include "rules.hpp"
#include <utility>
#include <optional>
#include <string>
#include <vector>

namespace fillsched {

// A production batch. Immutable once built by Preflight.
class Lot {
private:
    std::string id_;
    std::string type_;
    long long vial_count_;
    Hours fill_hours_;
public:
    Lot() : vial_count_(0), fill_hours_(0.0) {}
    Lot(std::string id, std::string type, long long vial_count, const FillConfig& cfg)
        : id_(std::move(id)), type_(std::move(type)), vial_count_(vial_count),
          fill_hours_(fillDuration(cfg, vial_count)) {}
    const std::string& getId() const { return id_; }
    const std::string& getType() const { return type_; }
    long long getVialCount() const { return vial_count_; }
    Hours getFillHours() const { return fill_hours_; }
    bool operator==(const Lot& other) const {
        return id_ == other.id_ && type_ == other.type_ && vial_count_ == other.vial_count_ &&
               fill_hours_ == other.fill_hours_;
    }
    bool operator!=(const Lot& other) const { return !(*this == other); }
};

enum class ActivityKind { Clean, Changeover, Fill };

const char* toString(ActivityKind kind);

// One block on the line.
struct Activity {
    ActivityKind kind{ActivityKind::Clean};
    std::optional<Lot> lot; // Fill only
    Hours start{0.0};
    Hours end{0.0};
    std::string line_id;
    std::string note;

    Hours duration() const { return end - start; }
    bool operator==(const Activity& other) const {
        return kind == other.kind && lot == other.lot && start == other.start && end == other.end &&
               line_id == other.line_id && note == other.note;
    }
};

// Ordered, non-overlapping activities of one line.
class Schedule {
private:
    std::vector<Activity> activities_;
public:
    Schedule() = default;

    // Throws ScheduleInvariantError when `a` has end <= start, starts before
    // the previous activity ends, or names another line.
    void append(Activity a);

    const std::vector<Activity>& activities() const { return activities_; }
    bool empty() const { return activities_.empty(); }
    size_t size() const { return activities_.size(); }
    const Activity& operator[](size_t i) const { return activities_[i]; }

    // Lot ids in fill order.
    std::vector<std::string> fillOrder() const;

    bool operator==(const Schedule& other) const { return activities_ == other.activities_; }
};

struct KpiSummary {
    Hours makespan{0.0};
    Hours total_clean_hours{0.0};
    Hours total_changeover_hours{0.0};
    Hours total_fill_hours{0.0};
    double utilization{0.0};
    int lots_scheduled{0};
    int clean_blocks{0};
    int changeover_count{0};
};

KpiSummary computeKpis(const Schedule& schedule);

// Labelled view of the summary, in report order.
std::vector<std::pair<std::string, double>> kpiMap(const KpiSummary& kpis);

} // namespace fillsched
