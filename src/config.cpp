#include "config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <map>

namespace fillsched {

std::vector<std::string> FillConfig::problems() const {
    std::vector<std::string> out;
    auto positive = [&](double v, const char* name) {
        if (!std::isfinite(v) || v <= 0.0) out.push_back(std::string(name) + " must be > 0");
    };
    auto nonNegative = [&](double v, const char* name) {
        if (!std::isfinite(v) || v < 0.0) out.push_back(std::string(name) + " must be >= 0");
    };
    positive(fill_rate_vials_per_hour, "fill_rate_vials_per_hour");
    positive(clean_hours, "clean_hours");
    positive(window_hours, "window_hours");
    nonNegative(changeover_same_hours, "changeover_same_hours");
    nonNegative(changeover_diff_hours, "changeover_diff_hours");
    if (clean_counts_toward_window && std::isfinite(window_hours) && std::isfinite(clean_hours) &&
        window_hours - clean_hours <= 0.0) {
        out.push_back("window_hours must exceed clean_hours when clean_counts_toward_window is set");
    }
    if (beam_width < 1) out.push_back("beam_width must be >= 1");
    if (smart_lookahead < 1) out.push_back("smart_lookahead must be >= 1");
    nonNegative(smart_slack_weight, "smart_slack_weight");
    nonNegative(smart_changeover_weight, "smart_changeover_weight");
    nonNegative(smart_forced_clean_penalty, "smart_forced_clean_penalty");
    if (cfs_cluster_order != "by_vials" && cfs_cluster_order != "by_count") {
        out.push_back("cfs_cluster_order must be 'by_vials' or 'by_count', got '" + cfs_cluster_order + "'");
    }
    if (cfs_within != "by_id" && cfs_within != "spt" && cfs_within != "lpt") {
        out.push_back("cfs_within must be 'by_id', 'spt' or 'lpt', got '" + cfs_within + "'");
    }
    if (milp_max_lots < 1) out.push_back("milp_max_lots must be >= 1");
    positive(milp_time_limit_seconds, "milp_time_limit_seconds");
    if (line_id.empty()) out.push_back("line_id must not be empty");
    return out;
}

void FillConfig::validateOrThrow() const {
    auto errs = problems();
    if (!errs.empty()) throw ConfigError("FillConfig: " + errs.front());
}

static bool parseDouble(const std::string& s, double& out) {
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parseBool(std::string s, bool& out) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
    if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
    return false;
}

bool applyOverride(FillConfig& cfg, const std::string& key, const std::string& value, std::string& error) {
    using Setter = std::function<bool(const std::string&)>;
    auto d = [](double& f) -> Setter { return [&f](const std::string& v) { return parseDouble(v, f); }; };
    auto i = [](int& f) -> Setter { return [&f](const std::string& v) { return parseInt(v, f); }; };
    auto b = [](bool& f) -> Setter { return [&f](const std::string& v) { return parseBool(v, f); }; };
    auto s = [](std::string& f) -> Setter { return [&f](const std::string& v) { f = v; return true; }; };

    const std::map<std::string, Setter> setters = {
        {"fill_rate_vials_per_hour", d(cfg.fill_rate_vials_per_hour)},
        {"clean_hours", d(cfg.clean_hours)},
        {"window_hours", d(cfg.window_hours)},
        {"changeover_same_hours", d(cfg.changeover_same_hours)},
        {"changeover_diff_hours", d(cfg.changeover_diff_hours)},
        {"clean_counts_toward_window", b(cfg.clean_counts_toward_window)},
        {"strict_duplicate_ids", b(cfg.strict_duplicate_ids)},
        {"beam_width", i(cfg.beam_width)},
        {"smart_lookahead", i(cfg.smart_lookahead)},
        {"smart_slack_weight", d(cfg.smart_slack_weight)},
        {"smart_changeover_weight", d(cfg.smart_changeover_weight)},
        {"smart_forced_clean_penalty", d(cfg.smart_forced_clean_penalty)},
        {"cfs_cluster_order", s(cfg.cfs_cluster_order)},
        {"cfs_within", s(cfg.cfs_within)},
        {"milp_max_lots", i(cfg.milp_max_lots)},
        {"milp_time_limit_seconds", d(cfg.milp_time_limit_seconds)},
        {"milp_accept_incumbent", b(cfg.milp_accept_incumbent)},
        {"line_id", s(cfg.line_id)},
    };

    auto it = setters.find(key);
    if (it == setters.end()) {
        error = "unknown configuration key '" + key + "'";
        return false;
    }
    if (!it->second(value)) {
        error = "invalid value '" + value + "' for " + key;
        return false;
    }
    return true;
}

bool applyAssignment(FillConfig& cfg, const std::string& assignment, std::string& error) {
    auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        error = "expected key=value, got '" + assignment + "'";
        return false;
    }
    return applyOverride(cfg, assignment.substr(0, eq), assignment.substr(eq + 1), error);
}

} // namespace fillsched
