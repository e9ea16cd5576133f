#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace fillsched {

enum class VarType { kContinuous, kBinary, kInteger };

struct Variable {
    std::string name;
    double lower{0.0};
    double upper{0.0};
    VarType type{VarType::kContinuous};
};

struct LinearTerm {
    int var;
    double coef;
};

enum class Sense { kLessEqual, kGreaterEqual, kEqual };

struct LinearConstraint {
    std::string name;
    std::vector<LinearTerm> terms;
    Sense sense{Sense::kLessEqual};
    double rhs{0.0};
};

// Solver-neutral minimisation model. Backends translate it into their own API.
class MilpModel {
public:
    // Returns the variable index.
    int addVariable(const std::string& name, double lower, double upper, VarType type);
    void addConstraint(LinearConstraint constraint);
    void setObjective(std::vector<LinearTerm> terms, double constant = 0.0);
    // Warm start; one value per variable.
    void setStart(std::vector<double> values);

    const std::vector<Variable>& variables() const { return variables_; }
    const std::vector<LinearConstraint>& constraints() const { return constraints_; }
    const std::vector<LinearTerm>& objectiveTerms() const { return objective_; }
    double objectiveConstant() const { return objective_constant_; }
    const std::vector<double>& start() const { return start_; }
    bool hasStart() const { return !start_.empty(); }

    double evaluateObjective(const std::vector<double>& values) const;

    // Bounds, integrality and every constraint within `tol`.
    bool isFeasible(const std::vector<double>& values, double tol = 1e-6) const;

private:
    std::vector<Variable> variables_;
    std::vector<LinearConstraint> constraints_;
    std::vector<LinearTerm> objective_;
    double objective_constant_{0.0};
    std::vector<double> start_;

    void checkTerms(const std::vector<LinearTerm>& terms) const;
};

enum class SolveStatus { kOptimal, kTimeLimit, kInfeasible, kError };

const char* toString(SolveStatus status);

struct SolveResult {
    SolveStatus status{SolveStatus::kError};
    std::vector<double> values; // one per variable when has_solution
    double objective{0.0};
    bool has_solution{false};
    std::string message;
};

// Formulate/solve/parse seam for MILP-Opt. Implementations throw
// SolverUnavailableError when the engine cannot be started.
class SolverBackend {
public:
    virtual ~SolverBackend() = default;
    virtual std::string getName() const = 0;
    virtual SolveResult solve(const MilpModel& model, std::chrono::duration<double> time_limit) = 0;
};

} // namespace fillsched
