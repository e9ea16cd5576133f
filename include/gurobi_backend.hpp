#pragma once

#include "milp_model.hpp"

namespace fillsched {

// Solves a MilpModel with Gurobi. A fresh environment is created per solve,
// so one instance can serve concurrent strategies.
class GurobiBackend : public SolverBackend {
public:
    explicit GurobiBackend(bool log_to_console = false) : log_to_console_(log_to_console) {}

    std::string getName() const override { return "gurobi"; }
    SolveResult solve(const MilpModel& model, std::chrono::duration<double> time_limit) override;

private:
    bool log_to_console_;
};

} // namespace fillsched
