#pragma once

#include "config.hpp"
#include "model.hpp"
#include <string>
#include <vector>

namespace fillsched {

// One row as delivered by a lot source. Fields are raw text; nothing has
// been checked yet.
struct RawLotRecord {
    std::string id;
    std::string type;
    std::string vial_count;
};

enum class IssueKind {
    Config,
    NoLots,
    MissingId,
    MissingType,
    MissingVials,
    BadVials,
    NonPositiveVials,
    DuplicateId,
    OversizeLot
};

const char* toString(IssueKind kind);

struct Issue {
    IssueKind kind;
    size_t row;          // 0-based record index; 0 for config-level issues
    std::string lot_id;  // as given, may be blank
    std::string message;
    bool operator==(const Issue& o) const {
        return kind == o.kind && row == o.row && lot_id == o.lot_id && message == o.message;
    }
};

struct PreflightReport {
    std::vector<Lot> lots; // records that passed, in input order
    std::vector<Issue> errors;
    std::vector<Issue> warnings;
    bool ok() const { return errors.empty(); }
};

// Check every record and collect every problem; never stops at the first one.
PreflightReport preflight(const std::vector<RawLotRecord>& records, const FillConfig& cfg);

// Throws ValidationError (DuplicateLotError when duplicates are the only
// errors) if the report has errors.
void requireValid(const PreflightReport& report);

// Re-walk a produced schedule and throw on the first broken invariant:
// WindowOverrunError, LotSplitError or ScheduleInvariantError.
void postflight(const Schedule& schedule, const FillConfig& cfg);

// Same, and also require every lot in `expected` to be filled exactly once
// and nothing else to be filled.
void postflight(const Schedule& schedule, const FillConfig& cfg, const std::vector<Lot>& expected);

} // namespace fillsched
