#pragma once

#include <string>
#include <vector>

namespace fillsched {

// Every knob the core reads. Passed by const reference into each call; the
// core keeps no configuration of its own.
struct FillConfig {
    // Process constants
    double fill_rate_vials_per_hour{19920.0};
    double clean_hours{24.0};
    double window_hours{120.0};
    double changeover_same_hours{4.0};
    double changeover_diff_hours{8.0};
    // When true the clean itself eats into the window (clock starts at clean start).
    bool clean_counts_toward_window{false};

    // Validation
    bool strict_duplicate_ids{false};

    // Smart-pack / hybrid-pack beam search
    int beam_width{3};
    int smart_lookahead{3};
    double smart_slack_weight{1.0};
    double smart_changeover_weight{3.0};
    double smart_forced_clean_penalty{1000.0};

    // CFS clustering: "by_vials" | "by_count", and "by_id" | "spt" | "lpt" within a cluster
    std::string cfs_cluster_order{"by_vials"};
    std::string cfs_within{"by_id"};

    // MILP
    int milp_max_lots{30};
    double milp_time_limit_seconds{60.0};
    bool milp_accept_incumbent{false};

    std::string line_id{"LINE-1"};

    // Throws ConfigError on the first value out of range.
    void validateOrThrow() const;

    // Human-readable problems with the configuration; empty when valid.
    std::vector<std::string> problems() const;
};

// Set `key` (a field name above) from text. Returns false and fills `error`
// on an unknown key or a malformed value. Does not validate ranges.
bool applyOverride(FillConfig& cfg, const std::string& key, const std::string& value, std::string& error);

// Parse "key=value" and apply it.
bool applyAssignment(FillConfig& cfg, const std::string& assignment, std::string& error);

} // namespace fillsched
