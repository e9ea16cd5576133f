#include "milp_model.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace fillsched {

int MilpModel::addVariable(const std::string& name, double lower, double upper, VarType type) {
    if (type == VarType::kBinary) {
        lower = std::max(lower, 0.0);
        upper = std::min(upper, 1.0);
    }
    if (lower > upper) throw SolverError("variable " + name + " has empty bounds");
    variables_.push_back({name, lower, upper, type});
    return static_cast<int>(variables_.size()) - 1;
}

void MilpModel::checkTerms(const std::vector<LinearTerm>& terms) const {
    for (const auto& t : terms) {
        if (t.var < 0 || t.var >= static_cast<int>(variables_.size())) {
            throw SolverError("linear term refers to unknown variable " + std::to_string(t.var));
        }
    }
}

void MilpModel::addConstraint(LinearConstraint constraint) {
    checkTerms(constraint.terms);
    constraints_.push_back(std::move(constraint));
}

void MilpModel::setObjective(std::vector<LinearTerm> terms, double constant) {
    checkTerms(terms);
    objective_ = std::move(terms);
    objective_constant_ = constant;
}

void MilpModel::setStart(std::vector<double> values) {
    if (!values.empty() && values.size() != variables_.size()) {
        throw SolverError("warm start has " + std::to_string(values.size()) + " values for " +
                          std::to_string(variables_.size()) + " variables");
    }
    start_ = std::move(values);
}

static double evaluate(const std::vector<LinearTerm>& terms, const std::vector<double>& values) {
    double sum = 0.0;
    for (const auto& t : terms) sum += t.coef * values[static_cast<size_t>(t.var)];
    return sum;
}

double MilpModel::evaluateObjective(const std::vector<double>& values) const {
    return objective_constant_ + evaluate(objective_, values);
}

bool MilpModel::isFeasible(const std::vector<double>& values, double tol) const {
    if (values.size() != variables_.size()) return false;
    for (size_t v = 0; v < variables_.size(); ++v) {
        const Variable& var = variables_[v];
        if (values[v] < var.lower - tol || values[v] > var.upper + tol) return false;
        if (var.type != VarType::kContinuous && std::fabs(values[v] - std::round(values[v])) > tol) return false;
    }
    for (const auto& c : constraints_) {
        double lhs = evaluate(c.terms, values);
        switch (c.sense) {
            case Sense::kLessEqual:
                if (lhs > c.rhs + tol) return false;
                break;
            case Sense::kGreaterEqual:
                if (lhs < c.rhs - tol) return false;
                break;
            case Sense::kEqual:
                if (std::fabs(lhs - c.rhs) > tol) return false;
                break;
        }
    }
    return true;
}

const char* toString(SolveStatus status) {
    switch (status) {
        case SolveStatus::kOptimal: return "optimal";
        case SolveStatus::kTimeLimit: return "time limit";
        case SolveStatus::kInfeasible: return "infeasible";
        case SolveStatus::kError: return "error";
    }
    return "unknown";
}

} // namespace fillsched
