#include "validator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace fillsched {

const char* toString(IssueKind kind) {
    switch (kind) {
        case IssueKind::Config: return "Config";
        case IssueKind::NoLots: return "NoLots";
        case IssueKind::MissingId: return "MissingId";
        case IssueKind::MissingType: return "MissingType";
        case IssueKind::MissingVials: return "MissingVials";
        case IssueKind::BadVials: return "BadVials";
        case IssueKind::NonPositiveVials: return "NonPositiveVials";
        case IssueKind::DuplicateId: return "DuplicateId";
        case IssueKind::OversizeLot: return "OversizeLot";
    }
    return "Unknown";
}

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Whole numbers, also when written as a decimal or with an exponent ("1000.0", "1e6").
static bool parseWholeNumber(const std::string& text, long long& out) {
    if (text.find_first_not_of("0123456789+-.eE") != std::string::npos) return false;
    size_t pos = 0;
    try {
        long long v = std::stoll(text, &pos);
        if (pos == text.size()) {
            out = v;
            return true;
        }
    } catch (const std::out_of_range&) {
        return false;
    } catch (const std::invalid_argument&) {
        // ".5e1" has no leading digits; stod below decides
    }
    double d = 0.0;
    try {
        d = std::stod(text, &pos);
    } catch (const std::exception&) {
        return false;
    }
    if (pos != text.size() || !std::isfinite(d) || d != std::floor(d) || std::fabs(d) > 9.0e18) return false;
    out = static_cast<long long>(d);
    return true;
}

static std::string label(const std::string& id, size_t row) {
    return id.empty() ? "Row " + std::to_string(row + 1) : "Lot " + id;
}

PreflightReport preflight(const std::vector<RawLotRecord>& records, const FillConfig& cfg) {
    PreflightReport rep;

    // Without a sane config, fill durations mean nothing; report and stop short of the oversize check.
    auto cfgProblems = cfg.problems();
    for (const auto& p : cfgProblems) rep.errors.push_back({IssueKind::Config, 0, "", "Config: " + p});
    const bool cfgOk = cfgProblems.empty();

    if (records.empty()) {
        rep.errors.push_back({IssueKind::NoLots, 0, "", "No lots found in input."});
        return rep;
    }

    const double capacity = windowCapacity(cfg);
    const long long maxVials = cfgOk ? static_cast<long long>(std::floor(capacity * cfg.fill_rate_vials_per_hour)) : 0;

    std::unordered_map<std::string, size_t> firstRow;
    for (size_t row = 0; row < records.size(); ++row) {
        const std::string id = trim(records[row].id);
        const std::string type = trim(records[row].type);
        const std::string vialsText = trim(records[row].vial_count);
        const size_t errorsBefore = rep.errors.size();

        if (id.empty()) {
            rep.errors.push_back({IssueKind::MissingId, row, id, "Row " + std::to_string(row + 1) + ": Lot ID is blank."});
        }
        if (type.empty()) {
            rep.errors.push_back({IssueKind::MissingType, row, id, label(id, row) + " has empty Type."});
        }

        std::optional<long long> vials;
        if (vialsText.empty()) {
            rep.errors.push_back({IssueKind::MissingVials, row, id, label(id, row) + ": Vials value is missing."});
        } else {
            long long v = 0;
            if (parseWholeNumber(vialsText, v)) {
                vials = v;
            } else {
                rep.errors.push_back({IssueKind::BadVials, row, id,
                                      label(id, row) + ": Vials must be an integer (got '" + vialsText + "')."});
            }
            if (vials && *vials <= 0) {
                rep.errors.push_back({IssueKind::NonPositiveVials, row, id,
                                      label(id, row) + ": Vials must be a positive integer (got " +
                                          std::to_string(*vials) + ")."});
            }
        }

        bool duplicate = false;
        if (!id.empty()) {
            auto ins = firstRow.emplace(id, row);
            if (!ins.second) {
                duplicate = true;
                std::string msg = "Duplicate Lot ID detected: " + id + " (rows " + std::to_string(ins.first->second + 1) +
                                  " and " + std::to_string(row + 1) + ")";
                if (cfg.strict_duplicate_ids) {
                    rep.errors.push_back({IssueKind::DuplicateId, row, id, msg + "."});
                } else {
                    rep.warnings.push_back({IssueKind::DuplicateId, row, id, msg + "; later record ignored."});
                }
            }
        }

        if (cfgOk && vials && *vials > 0) {
            Hours fill = fillDuration(cfg, *vials);
            if (isOversize(cfg, fill)) {
                std::ostringstream oss;
                oss << label(id, row) << ": " << *vials << " vials (~" << std::fixed << std::setprecision(2) << fill
                    << " h) exceeds the " << std::defaultfloat << capacity
                    << " h clean window. Max vials per lot at current rate: " << maxVials << ".";
                rep.errors.push_back({IssueKind::OversizeLot, row, id, oss.str()});
            }
        }

        if (cfgOk && !duplicate && rep.errors.size() == errorsBefore) {
            rep.lots.emplace_back(id, type, *vials, cfg);
        }
    }
    return rep;
}

void requireValid(const PreflightReport& report) {
    if (report.ok()) return;
    bool onlyDuplicates = true;
    for (const auto& e : report.errors) {
        if (e.kind != IssueKind::DuplicateId) { onlyDuplicates = false; break; }
    }
    std::string msg = "INPUT VALIDATION failed with " + std::to_string(report.errors.size()) +
                      " error(s); first: " + report.errors.front().message;
    if (onlyDuplicates) throw DuplicateLotError(msg);
    throw ValidationError(msg);
}

static std::string describe(const Schedule& s, size_t i) {
    std::ostringstream oss;
    oss << "#" << i << " " << toString(s[i].kind);
    if (s[i].lot) oss << " " << s[i].lot->getId();
    oss << " [" << s[i].start << ", " << s[i].end << "]";
    return oss.str();
}

static std::string describePair(const Schedule& s, size_t a, size_t b) {
    return describe(s, a) + " / " + describe(s, b);
}

void postflight(const Schedule& schedule, const FillConfig& cfg) {
    if (schedule.empty()) return;

    const Hours capacity = windowCapacity(cfg);
    Hours anchor = schedule[0].start; // window clock; reset by each clean
    std::optional<std::string> lastType;
    std::optional<size_t> pendingChg;
    std::optional<size_t> lastFill;
    std::unordered_map<std::string, size_t> filled;

    for (size_t i = 0; i < schedule.size(); ++i) {
        const Activity& a = schedule[i];
        if (a.end <= a.start) {
            throw ScheduleInvariantError("non-positive duration: " + describe(schedule, i), i);
        }
        if (i > 0) {
            const Activity& prev = schedule[i - 1];
            if (a.start + kTimeEpsilon < prev.end) {
                throw ScheduleInvariantError("overlapping activities: " + describePair(schedule, i - 1, i), i);
            }
            if (a.line_id != prev.line_id) {
                throw ScheduleInvariantError("activities on different lines: " + describePair(schedule, i - 1, i), i);
            }
        }

        switch (a.kind) {
            case ActivityKind::Clean: {
                if (std::fabs(a.duration() - cleanDuration(cfg)) > kTimeEpsilon) {
                    throw ScheduleInvariantError("clean length differs from clean_hours: " + describe(schedule, i), i);
                }
                if (pendingChg) {
                    throw ScheduleInvariantError("changeover not followed by a fill: " +
                                                     describePair(schedule, *pendingChg, i), i);
                }
                anchor = a.end;
                lastType.reset();
                break;
            }
            case ActivityKind::Changeover: {
                if (pendingChg) {
                    throw ScheduleInvariantError("two changeovers without a fill: " +
                                                     describePair(schedule, *pendingChg, i), i);
                }
                if (a.end - anchor > capacity + kTimeEpsilon) {
                    throw WindowOverrunError("window overrun at " + describe(schedule, i), i);
                }
                pendingChg = i;
                break;
            }
            case ActivityKind::Fill: {
                if (!a.lot) throw ScheduleInvariantError("fill without a lot: " + describe(schedule, i), i);
                const Lot& lot = *a.lot;
                auto seen = filled.emplace(lot.getId(), i);
                if (!seen.second) {
                    throw LotSplitError("Lot split detected: " + describePair(schedule, seen.first->second, i), i);
                }
                if (std::fabs(a.duration() - lot.getFillHours()) > kTimeEpsilon) {
                    throw LotSplitError("fill of lot " + lot.getId() + " does not cover its full duration: " +
                                            describe(schedule, i), i);
                }
                if (a.end - anchor > capacity + kTimeEpsilon) {
                    std::ostringstream oss;
                    oss << "window overrun: " << (a.end - anchor) << " h > " << capacity << " h at "
                        << describe(schedule, i);
                    throw WindowOverrunError(oss.str(), i);
                }
                const Hours expected = changeoverDuration(cfg, lastType, lot.getType());
                if (expected > kTimeEpsilon) {
                    size_t ref = pendingChg ? *pendingChg : (lastFill ? *lastFill : i);
                    if (!pendingChg || std::fabs(schedule[*pendingChg].duration() - expected) > kTimeEpsilon) {
                        std::ostringstream oss;
                        oss << "changeover before lot " << lot.getId() << " must be " << expected
                            << " h: " << describePair(schedule, ref, i);
                        throw ScheduleInvariantError(oss.str(), i);
                    }
                } else if (pendingChg) {
                    throw ScheduleInvariantError("changeover where the rule table gives 0 h: " +
                                                     describePair(schedule, *pendingChg, i), i);
                }
                lastType = lot.getType();
                pendingChg.reset();
                lastFill = i;
                break;
            }
        }
    }
    if (pendingChg) {
        throw ScheduleInvariantError("schedule ends with a changeover: " + describe(schedule, *pendingChg),
                                     *pendingChg);
    }
}

void postflight(const Schedule& schedule, const FillConfig& cfg, const std::vector<Lot>& expected) {
    postflight(schedule, cfg);

    std::unordered_map<std::string, const Lot*> want;
    for (const auto& lot : expected) want.emplace(lot.getId(), &lot);
    const size_t last = schedule.empty() ? 0 : schedule.size() - 1;

    size_t fills = 0;
    for (size_t i = 0; i < schedule.size(); ++i) {
        const Activity& a = schedule[i];
        if (a.kind != ActivityKind::Fill) continue;
        ++fills;
        auto it = want.find(a.lot->getId());
        if (it == want.end() || *it->second != *a.lot) {
            throw ScheduleInvariantError("fill of a lot outside the planned set: " + describe(schedule, i), i);
        }
    }
    if (fills != want.size()) {
        auto order = schedule.fillOrder();
        for (const auto& lot : expected) {
            if (std::find(order.begin(), order.end(), lot.getId()) == order.end()) {
                throw ScheduleInvariantError("lot " + lot.getId() + " was never filled", last);
            }
        }
    }
}

} // namespace fillsched
