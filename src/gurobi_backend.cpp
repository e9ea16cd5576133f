#include "gurobi_backend.hpp"
#include "errors.hpp"
#include "gurobi_c++.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace fillsched {

static char toGrbType(VarType type) {
    switch (type) {
        case VarType::kBinary: return GRB_BINARY;
        case VarType::kInteger: return GRB_INTEGER;
        case VarType::kContinuous: return GRB_CONTINUOUS;
    }
    return GRB_CONTINUOUS;
}

static char toGrbSense(Sense sense) {
    switch (sense) {
        case Sense::kLessEqual: return GRB_LESS_EQUAL;
        case Sense::kGreaterEqual: return GRB_GREATER_EQUAL;
        case Sense::kEqual: return GRB_EQUAL;
    }
    return GRB_EQUAL;
}

SolveResult GurobiBackend::solve(const MilpModel& milp, std::chrono::duration<double> time_limit) {
    std::unique_ptr<GRBEnv> env;
    try {
        env = std::make_unique<GRBEnv>(true);
        env->set(GRB_IntParam_OutputFlag, log_to_console_ ? 1 : 0);
        env->start();
    } catch (const GRBException& e) {
        throw SolverUnavailableError("Gurobi environment could not start: " + e.getMessage());
    }

    SolveResult result;
    try {
        GRBModel model(*env);
        model.set(GRB_DoubleParam_TimeLimit, time_limit.count());

        std::vector<GRBVar> vars;
        vars.reserve(milp.variables().size());
        for (const auto& v : milp.variables()) {
            vars.push_back(model.addVar(v.lower, v.upper, 0.0, toGrbType(v.type), v.name));
        }

        for (const auto& c : milp.constraints()) {
            GRBLinExpr lhs = 0;
            for (const auto& t : c.terms) lhs += t.coef * vars[static_cast<size_t>(t.var)];
            model.addConstr(lhs, toGrbSense(c.sense), c.rhs, c.name);
        }

        GRBLinExpr objective = milp.objectiveConstant();
        for (const auto& t : milp.objectiveTerms()) objective += t.coef * vars[static_cast<size_t>(t.var)];
        model.setObjective(objective, GRB_MINIMIZE);

        if (milp.hasStart()) {
            for (size_t i = 0; i < vars.size(); ++i) vars[i].set(GRB_DoubleAttr_Start, milp.start()[i]);
        }

        model.optimize();

        const int status = model.get(GRB_IntAttr_Status);
        const bool hasSolution = model.get(GRB_IntAttr_SolCount) > 0;
        if (status == GRB_OPTIMAL) {
            result.status = SolveStatus::kOptimal;
        } else if (status == GRB_TIME_LIMIT) {
            result.status = SolveStatus::kTimeLimit;
        } else if (status == GRB_INFEASIBLE || status == GRB_INF_OR_UNBD) {
            result.status = SolveStatus::kInfeasible;
        } else {
            result.status = SolveStatus::kError;
            result.message = "Gurobi finished with status " + std::to_string(status);
        }

        if (hasSolution) {
            result.has_solution = true;
            result.objective = model.get(GRB_DoubleAttr_ObjVal);
            result.values.reserve(vars.size());
            for (auto& v : vars) result.values.push_back(v.get(GRB_DoubleAttr_X));
        }
        spdlog::debug("gurobi: status {} ({}), objective {:.3f}", status, toString(result.status), result.objective);
    } catch (const GRBException& e) {
        result = SolveResult{};
        result.status = SolveStatus::kError;
        result.message = "Gurobi error " + std::to_string(e.getErrorCode()) + ": " + e.getMessage();
    }
    return result;
}

} // namespace fillsched
