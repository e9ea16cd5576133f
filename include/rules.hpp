#pragma once

#include "config.hpp"
#include <optional>
#include <string>

namespace fillsched {

using Hours = double;

// Tolerance for every time comparison.
constexpr Hours kTimeEpsilon = 1e-6;

// Rule engine. Stateless; everything it knows comes from the config.

Hours cleanDuration(const FillConfig& cfg);

// 0 when there is no previous type (first fill after a clean).
Hours changeoverDuration(const FillConfig& cfg, const std::optional<std::string>& prev_type,
                         const std::string& next_type);

Hours fillDuration(const FillConfig& cfg, long long vial_count);

// Fill+changeover hours available after a clean completes.
Hours windowCapacity(const FillConfig& cfg);

// Capacity left at `now` for a window opened by a clean ending at `last_clean_end`.
Hours windowBudget(const FillConfig& cfg, Hours last_clean_end, Hours now);

bool requiresForcedClean(Hours remaining_hours, Hours needed_hours);

// A fill that can never fit into any window.
bool isOversize(const FillConfig& cfg, Hours fill_hours);

} // namespace fillsched
