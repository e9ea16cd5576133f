#include "rules.hpp"

namespace fillsched {

Hours cleanDuration(const FillConfig& cfg) {
    return cfg.clean_hours;
}

Hours changeoverDuration(const FillConfig& cfg, const std::optional<std::string>& prev_type,
                         const std::string& next_type) {
    if (!prev_type) return 0.0;
    return *prev_type == next_type ? cfg.changeover_same_hours : cfg.changeover_diff_hours;
}

Hours fillDuration(const FillConfig& cfg, long long vial_count) {
    return static_cast<double>(vial_count) / cfg.fill_rate_vials_per_hour;
}

Hours windowCapacity(const FillConfig& cfg) {
    if (cfg.clean_counts_toward_window) return cfg.window_hours - cfg.clean_hours;
    return cfg.window_hours;
}

Hours windowBudget(const FillConfig& cfg, Hours last_clean_end, Hours now) {
    return windowCapacity(cfg) - (now - last_clean_end);
}

bool requiresForcedClean(Hours remaining_hours, Hours needed_hours) {
    return needed_hours > remaining_hours + kTimeEpsilon;
}

bool isOversize(const FillConfig& cfg, Hours fill_hours) {
    return fill_hours > windowCapacity(cfg) + kTimeEpsilon;
}

} // namespace fillsched
