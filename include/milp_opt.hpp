#pragma once

#include "milp_model.hpp"
#include "strategy.hpp"
#include <memory>
#include <vector>

namespace fillsched {

// Position-based model of one filling line.
//
// x[i,k]  lot i sits at position k
// c[k]    a clean runs right before position k (k >= 1)
// s[k]    same-type changeover before position k
// d[k]    different-type changeover before position k
// L[k]    window load (fill + changeover hours since the last clean) after position k, <= capacity
//
// The objective equals the makespan of the packed sequence: the opening
// clean plus every fill are constants, the rest is clean/changeover time.
class FillLineFormulation {
public:
    struct Decoded {
        std::vector<size_t> order;  // indices into lots()
        std::vector<bool> cleans;   // cleans[k]: clean before position k; cleans[0] is always false
    };

    FillLineFormulation(std::vector<Lot> lots, const FillConfig& cfg);

    const MilpModel& model() const { return model_; }
    MilpModel& model() { return model_; }

    // Lots in model order (sorted by id).
    const std::vector<Lot>& lots() const { return lots_; }

    // Assignment for a concrete sequence with the given cleans.
    std::vector<double> encode(const std::vector<size_t>& order, const std::vector<bool>& cleans) const;

    // Assignment for a sequence packed greedily (clean only when the window is full).
    std::vector<double> encode(const std::vector<size_t>& order) const;

    // Throws SolverError when the values are not a permutation.
    Decoded decode(const std::vector<double>& values) const;

    int x(size_t lot, size_t pos) const { return x_[lot * lots_.size() + pos]; }
    int c(size_t pos) const { return c_[pos]; }
    int s(size_t pos) const { return s_[pos]; }
    int d(size_t pos) const { return d_[pos]; }
    int load(size_t pos) const { return load_[pos]; }

private:
    std::vector<Lot> lots_;
    FillConfig cfg_;
    MilpModel model_;
    std::vector<int> x_;
    std::vector<int> c_, s_, d_; // index 0 unused (-1)
    std::vector<int> load_;

    void build();
};

// Exact strategy. Delegates the search to a SolverBackend and replays the
// decoded sequence through LinePacker.
class MilpOpt : public Strategy {
public:
    explicit MilpOpt(std::shared_ptr<SolverBackend> backend) : backend_(std::move(backend)) {}

    std::string getName() const override { return "milp-opt"; }

protected:
    Schedule doPlan(const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg,
                    ProgressSink* progress) const override;

private:
    std::shared_ptr<SolverBackend> backend_;
};

} // namespace fillsched
