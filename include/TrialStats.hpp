#pragma once
#include "BasisPursuit.hpp"
#include <vector>

// Both solvers on one instance, with wall times.
struct TrialOutcome {
    PursuitSolution subgradient;
    PursuitSolution slsqp;
    double subgradient_ms;
    double slsqp_ms;
};

// Throws whatever either solver throws.
TrialOutcome run_trial(const Problem& P,
                       const SubgradientOptions& opt,
                       const ProgressCallback& progress = nullptr);

// Per-solver samples over the trials of one (m, n) cell.
class SolverStats {
public:
    void add(double ms, const PursuitSolution& sol);

    int count() const noexcept { return static_cast<int>(ms_.size()); }
    int converged() const noexcept { return converged_; }

    double mean_ms() const;
    double stddev_ms() const;   // sample standard deviation, 0 below two samples
    double mean_l1() const;
    double mean_gap() const;

private:
    std::vector<double> ms_, l1_, gap_;
    int converged_ = 0;
};

// Adds the trial to both columns, so they always count the same trials.
void record_trial(const TrialOutcome& t, SolverStats& subgradient, SolverStats& slsqp);
