#include "milp_opt.hpp"
#include "errors.hpp"
#include "heuristics.hpp"
#include "line_packer.hpp"
#include <algorithm>
#include <map>
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace fillsched {

FillLineFormulation::FillLineFormulation(std::vector<Lot> lots, const FillConfig& cfg)
    : lots_(std::move(lots)), cfg_(cfg) {
    std::sort(lots_.begin(), lots_.end(), [](const Lot& a, const Lot& b) { return a.getId() < b.getId(); });
    build();
}

void FillLineFormulation::build() {
    const size_t n = lots_.size();
    const double W = windowCapacity(cfg_);
    const double CS = cfg_.changeover_same_hours;
    const double CD = cfg_.changeover_diff_hours;
    const double CL = cleanDuration(cfg_);

    x_.assign(n * n, -1);
    c_.assign(n, -1);
    s_.assign(n, -1);
    d_.assign(n, -1);
    load_.assign(n, -1);

    for (size_t i = 0; i < n; ++i) {
        for (size_t k = 0; k < n; ++k) {
            x_[i * n + k] = model_.addVariable("x_" + lots_[i].getId() + "_" + std::to_string(k), 0.0, 1.0,
                                               VarType::kBinary);
        }
    }
    for (size_t k = 1; k < n; ++k) {
        const std::string sfx = "_" + std::to_string(k);
        c_[k] = model_.addVariable("clean" + sfx, 0.0, 1.0, VarType::kBinary);
        s_[k] = model_.addVariable("same" + sfx, 0.0, 1.0, VarType::kBinary);
        d_[k] = model_.addVariable("diff" + sfx, 0.0, 1.0, VarType::kBinary);
    }
    for (size_t k = 0; k < n; ++k) {
        load_[k] = model_.addVariable("load_" + std::to_string(k), 0.0, W, VarType::kContinuous);
    }

    // Each lot at exactly one position, each position holds exactly one lot
    for (size_t i = 0; i < n; ++i) {
        LinearConstraint row{"assign_lot_" + lots_[i].getId(), {}, Sense::kEqual, 1.0};
        for (size_t k = 0; k < n; ++k) row.terms.push_back({x(i, k), 1.0});
        model_.addConstraint(std::move(row));
    }
    for (size_t k = 0; k < n; ++k) {
        LinearConstraint col{"assign_pos_" + std::to_string(k), {}, Sense::kEqual, 1.0};
        for (size_t i = 0; i < n; ++i) col.terms.push_back({x(i, k), 1.0});
        model_.addConstraint(std::move(col));
    }

    std::map<std::string, std::vector<size_t>> byType;
    for (size_t i = 0; i < n; ++i) byType[lots_[i].getType()].push_back(i);

    auto fillTerms = [&](size_t k, double sign) {
        std::vector<LinearTerm> terms;
        for (size_t i = 0; i < n; ++i) terms.push_back({x(i, k), sign * lots_[i].getFillHours()});
        return terms;
    };

    for (size_t k = 1; k < n; ++k) {
        const std::string sfx = "_" + std::to_string(k);
        model_.addConstraint({"mode" + sfx, {{c_[k], 1.0}, {s_[k], 1.0}, {d_[k], 1.0}}, Sense::kEqual, 1.0});

        for (const auto& kv : byType) {
            // s >= Y[t,k-1] + Y[t,k] - 1 - c
            LinearConstraint same{"same_" + kv.first + sfx, {{s_[k], 1.0}, {c_[k], 1.0}}, Sense::kGreaterEqual, -1.0};
            // d >= Y[t,k-1] - Y[t,k] - c
            LinearConstraint diff{"diff_" + kv.first + sfx, {{d_[k], 1.0}, {c_[k], 1.0}}, Sense::kGreaterEqual, 0.0};
            for (size_t i : kv.second) {
                same.terms.push_back({x(i, k - 1), -1.0});
                same.terms.push_back({x(i, k), -1.0});
                diff.terms.push_back({x(i, k - 1), -1.0});
                diff.terms.push_back({x(i, k), 1.0});
            }
            model_.addConstraint(std::move(same));
            model_.addConstraint(std::move(diff));
        }
    }

    // Window load
    if (n > 0) {
        LinearConstraint first{"load_0", fillTerms(0, -1.0), Sense::kGreaterEqual, 0.0};
        first.terms.push_back({load_[0], 1.0});
        model_.addConstraint(std::move(first));
    }
    for (size_t k = 1; k < n; ++k) {
        const std::string sfx = "_" + std::to_string(k);
        LinearConstraint carry{"load" + sfx, fillTerms(k, -1.0), Sense::kGreaterEqual, 0.0};
        carry.terms.push_back({load_[k], 1.0});
        carry.terms.push_back({load_[k - 1], -1.0});
        carry.terms.push_back({s_[k], -CS});
        carry.terms.push_back({d_[k], -CD});
        carry.terms.push_back({c_[k], W});
        model_.addConstraint(std::move(carry));

        LinearConstraint fit{"fit" + sfx, fillTerms(k, -1.0), Sense::kGreaterEqual, 0.0};
        fit.terms.push_back({load_[k], 1.0});
        model_.addConstraint(std::move(fit));
    }

    double constant = CL;
    for (const auto& lot : lots_) constant += lot.getFillHours();
    std::vector<LinearTerm> objective;
    for (size_t k = 1; k < n; ++k) {
        objective.push_back({c_[k], CL});
        objective.push_back({s_[k], CS});
        objective.push_back({d_[k], CD});
    }
    model_.setObjective(std::move(objective), constant);
}

std::vector<double> FillLineFormulation::encode(const std::vector<size_t>& order, const std::vector<bool>& cleans) const {
    const size_t n = lots_.size();
    if (order.size() != n || cleans.size() != n) {
        throw SolverError("encode: sequence length does not match the model");
    }
    std::vector<double> v(model_.variables().size(), 0.0);
    double load = 0.0;
    for (size_t k = 0; k < n; ++k) {
        const Lot& lot = lots_[order[k]];
        v[static_cast<size_t>(x(order[k], k))] = 1.0;
        if (k == 0) {
            load = lot.getFillHours();
        } else if (cleans[k]) {
            v[static_cast<size_t>(c_[k])] = 1.0;
            load = lot.getFillHours();
        } else {
            const bool same = lots_[order[k - 1]].getType() == lot.getType();
            v[static_cast<size_t>(same ? s_[k] : d_[k])] = 1.0;
            load += lot.getFillHours() + (same ? cfg_.changeover_same_hours : cfg_.changeover_diff_hours);
        }
        v[static_cast<size_t>(load_[k])] = load;
    }
    return v;
}

std::vector<double> FillLineFormulation::encode(const std::vector<size_t>& order) const {
    std::vector<bool> cleans(order.size(), false);
    PackState state = openLine(cfg_, 0.0);
    for (size_t k = 0; k < order.size(); ++k) {
        const Lot& lot = lots_.at(order[k]);
        if (k > 0 && previewPlacement(state, lot, cfg_).forced_clean) cleans[k] = true;
        state = advance(state, lot, cfg_);
    }
    return encode(order, cleans);
}

FillLineFormulation::Decoded FillLineFormulation::decode(const std::vector<double>& values) const {
    const size_t n = lots_.size();
    if (values.size() != model_.variables().size()) {
        throw SolverError("solver returned " + std::to_string(values.size()) + " values for " +
                          std::to_string(model_.variables().size()) + " variables");
    }
    Decoded out;
    out.order.assign(n, n);
    out.cleans.assign(n, false);
    std::vector<bool> seen(n, false);
    for (size_t k = 0; k < n; ++k) {
        for (size_t i = 0; i < n; ++i) {
            if (values[static_cast<size_t>(x(i, k))] <= 0.5) continue;
            if (out.order[k] != n || seen[i]) {
                throw SolverError("solver assignment is not a permutation at position " + std::to_string(k));
            }
            out.order[k] = i;
            seen[i] = true;
        }
        if (out.order[k] == n) throw SolverError("solver left position " + std::to_string(k) + " empty");
        if (k > 0) out.cleans[k] = values[static_cast<size_t>(c_[k])] > 0.5;
    }
    return out;
}

Schedule MilpOpt::doPlan(const std::vector<Lot>& lots, Hours start_time, const FillConfig& cfg,
                         ProgressSink* progress) const {
    const int n = static_cast<int>(lots.size());
    if (n > cfg.milp_max_lots) {
        throw SolverSizeLimitError("milp-opt: " + std::to_string(n) + " lots exceed milp_max_lots=" +
                                   std::to_string(cfg.milp_max_lots) + "; use a heuristic strategy");
    }
    if (!backend_) throw SolverUnavailableError("milp-opt: no solver backend configured");

    FillLineFormulation f(lots, cfg);

    // Warm start from the SPT-Pack sequence
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < f.lots().size(); ++i) index.emplace(f.lots()[i].getId(), i);
    std::vector<size_t> warm;
    for (const auto& lot : sptOrder(lots)) warm.push_back(index.at(lot.getId()));
    f.model().setStart(f.encode(warm));

    spdlog::debug("milp-opt: {} variables, {} constraints, solving with {} ({} s limit)",
                  f.model().variables().size(), f.model().constraints().size(), backend_->getName(),
                  cfg.milp_time_limit_seconds);
    notify(progress, getName(), 0, n, "solving");
    SolveResult res = backend_->solve(f.model(), std::chrono::duration<double>(cfg.milp_time_limit_seconds));

    switch (res.status) {
        case SolveStatus::kOptimal:
            break;
        case SolveStatus::kTimeLimit:
            if (!(cfg.milp_accept_incumbent && res.has_solution)) {
                throw SolverTimeoutError("milp-opt: no optimal solution within " +
                                         std::to_string(cfg.milp_time_limit_seconds) + " s");
            }
            spdlog::warn("milp-opt: time limit reached, using incumbent (objective {:.2f} h)", res.objective);
            break;
        case SolveStatus::kInfeasible:
            throw InfeasibleScheduleError("milp-opt: solver reports the lot set infeasible" +
                                          (res.message.empty() ? std::string() : ": " + res.message));
        case SolveStatus::kError:
            throw SolverError("milp-opt: " + (res.message.empty() ? std::string("solver error") : res.message));
    }
    if (!res.has_solution) throw SolverError("milp-opt: solver reported success without a solution");

    FillLineFormulation::Decoded seq = f.decode(res.values);
    LinePacker packer(cfg, start_time);
    for (size_t k = 0; k < seq.order.size(); ++k) {
        if (seq.cleans[k]) packer.clean("Planned clean");
        packer.place(f.lots()[seq.order[k]]);
    }
    spdlog::debug("milp-opt: objective {:.2f} h", res.objective);
    return packer.finish();
}

} // namespace fillsched
