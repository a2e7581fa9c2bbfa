#include "TrialStats.hpp"
#include <chrono>
#include <cmath>
#include <numeric>

namespace {
double mean_of(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double elapsed_ms(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
}
}

TrialOutcome run_trial(const Problem& P,
                       const SubgradientOptions& opt,
                       const ProgressCallback& progress)
{
    TrialOutcome t;
    auto t0 = std::chrono::steady_clock::now();
    t.subgradient = solve_basis_pursuit(P, SolverKind::Subgradient, opt, progress);
    t.subgradient_ms = elapsed_ms(t0);

    t0 = std::chrono::steady_clock::now();
    t.slsqp = solve_basis_pursuit(P, SolverKind::SLSQP);
    t.slsqp_ms = elapsed_ms(t0);
    return t;
}

void SolverStats::add(double ms, const PursuitSolution& sol) {
    ms_.push_back(ms);
    l1_.push_back(sol.l1_norm);
    gap_.push_back(sol.certificate.gap);
    if (sol.status == SubgradientStatus::Converged) ++converged_;
}

double SolverStats::mean_ms() const { return mean_of(ms_); }
double SolverStats::mean_l1() const { return mean_of(l1_); }
double SolverStats::mean_gap() const { return mean_of(gap_); }

double SolverStats::stddev_ms() const {
    if (ms_.size() < 2) return 0.0;
    const double mu = mean_ms();
    double ss = 0.0;
    for (double x : ms_) ss += (x - mu) * (x - mu);
    return std::sqrt(ss / static_cast<double>(ms_.size() - 1));
}

void record_trial(const TrialOutcome& t, SolverStats& subgradient, SolverStats& slsqp) {
    subgradient.add(t.subgradient_ms, t.subgradient);
    slsqp.add(t.slsqp_ms, t.slsqp);
}
