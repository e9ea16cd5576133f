#pragma once

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace fillsched {

// Base of every error the scheduler raises.
class FillSchedError : public std::runtime_error {
public:
    explicit FillSchedError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Configuration value out of range or unknown key.
class ConfigError : public FillSchedError {
public:
    explicit ConfigError(std::string msg) : FillSchedError(std::move(msg)) {}
};

// Input records failed Preflight.
class ValidationError : public FillSchedError {
public:
    explicit ValidationError(std::string msg) : FillSchedError(std::move(msg)) {}
};

class DuplicateLotError : public ValidationError {
public:
    explicit DuplicateLotError(std::string msg) : ValidationError(std::move(msg)) {}
};

class UnknownStrategyError : public FillSchedError {
public:
    explicit UnknownStrategyError(std::string msg) : FillSchedError(std::move(msg)) {}
};

// No valid schedule exists for the lot set.
class InfeasibleScheduleError : public FillSchedError {
public:
    explicit InfeasibleScheduleError(std::string msg) : FillSchedError(std::move(msg)) {}
};

// A single lot's fill alone exceeds the window capacity.
class OversizeLotError : public InfeasibleScheduleError {
public:
    OversizeLotError(std::string msg, std::string lot_id)
        : InfeasibleScheduleError(std::move(msg)), lot_id_(std::move(lot_id)) {}
    const std::string& lotId() const { return lot_id_; }
private:
    std::string lot_id_;
};

// Postflight failures. These point at a defect in the strategy that produced
// the schedule, never at the input data.
class PostflightError : public FillSchedError {
public:
    PostflightError(std::string msg, std::size_t activity_index)
        : FillSchedError(std::move(msg)), activity_index_(activity_index) {}
    std::size_t activityIndex() const { return activity_index_; }
private:
    std::size_t activity_index_;
};

class WindowOverrunError : public PostflightError {
public:
    using PostflightError::PostflightError;
};

class LotSplitError : public PostflightError {
public:
    using PostflightError::PostflightError;
};

class ScheduleInvariantError : public PostflightError {
public:
    using PostflightError::PostflightError;
};

// MILP backend failures; callers may fall back to a heuristic.
class SolverError : public FillSchedError {
public:
    explicit SolverError(std::string msg) : FillSchedError(std::move(msg)) {}
};

class SolverUnavailableError : public SolverError {
public:
    explicit SolverUnavailableError(std::string msg) : SolverError(std::move(msg)) {}
};

class SolverTimeoutError : public SolverError {
public:
    explicit SolverTimeoutError(std::string msg) : SolverError(std::move(msg)) {}
};

class SolverSizeLimitError : public SolverError {
public:
    explicit SolverSizeLimitError(std::string msg) : SolverError(std::move(msg)) {}
};

// Stable name of the most derived taxonomy type, e.g. "SolverSizeLimitError".
// Anything outside the taxonomy reports "InternalError".
std::string errorKind(const std::exception& e);

} // namespace fillsched
