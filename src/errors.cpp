#include "errors.hpp"

namespace fillsched {

std::string errorKind(const std::exception& e) {
    // Most derived first.
    if (dynamic_cast<const OversizeLotError*>(&e)) return "OversizeLotError";
    if (dynamic_cast<const InfeasibleScheduleError*>(&e)) return "InfeasibleScheduleError";
    if (dynamic_cast<const DuplicateLotError*>(&e)) return "DuplicateLotError";
    if (dynamic_cast<const ValidationError*>(&e)) return "ValidationError";
    if (dynamic_cast<const WindowOverrunError*>(&e)) return "WindowOverrunError";
    if (dynamic_cast<const LotSplitError*>(&e)) return "LotSplitError";
    if (dynamic_cast<const ScheduleInvariantError*>(&e)) return "ScheduleInvariantError";
    if (dynamic_cast<const SolverUnavailableError*>(&e)) return "SolverUnavailableError";
    if (dynamic_cast<const SolverTimeoutError*>(&e)) return "SolverTimeoutError";
    if (dynamic_cast<const SolverSizeLimitError*>(&e)) return "SolverSizeLimitError";
    if (dynamic_cast<const SolverError*>(&e)) return "SolverError";
    if (dynamic_cast<const UnknownStrategyError*>(&e)) return "UnknownStrategyError";
    if (dynamic_cast<const ConfigError*>(&e)) return "ConfigError";
    if (dynamic_cast<const FillSchedError*>(&e)) return "FillSchedError";
    return "InternalError";
}

} // namespace fillsched
