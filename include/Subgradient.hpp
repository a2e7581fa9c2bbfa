#pragma once
#include "Problem.hpp"
#include "GramFactorization.hpp"
#include <functional>
#include <vector>

struct SubgradientOptions {
    int max_iterations = 1000000;
    double tol = 1e-6;        // stop when ||x_k - x_{k+1}||_inf < tol
    int report_every = 0;     // progress stride, 0 = silent
};

enum class SubgradientStatus { Running, Converged, IterationLimitReached };

struct SubgradientResult {
    Eigen::VectorXd x;            // best iterate seen
    double fval;                  // ||x||_1 at the best iterate
    int iters;                    // completed iterations
    SubgradientStatus status;     // Converged or IterationLimitReached
    std::vector<double> history;  // ||x_{k+1}||_1 per iteration, size == iters
};

// Called with (k, ||x_{k+1}||_1). Observational only.
using ProgressCallback = std::function<void(int, double)>;

// sign(x) componentwise, with sign(0) = 0.
Eigen::VectorXd l1_subgradient(const Eigen::VectorXd& x);

// alpha_k = 1 / (1 + k)
inline double diminishing_step(int k) { return 1.0 / (1.0 + static_cast<double>(k)); }

// Projected subgradient method for min ||x||_1 s.t. A x = b.
// The stall test is a heuristic: it says the iterates stopped moving, not that
// x is optimal (see duality_gap in Certificate.hpp for a bound).
SubgradientResult minimize_subgradient(const Problem& P,
                                       const Eigen::VectorXd& x0,
                                       const SubgradientOptions& opt,
                                       const ProgressCallback& progress = nullptr);

// Same, reusing a factorization of A A^T owned by the caller.
SubgradientResult minimize_subgradient(const Problem& P,
                                       const GramFactorization& gram,
                                       const Eigen::VectorXd& x0,
                                       const SubgradientOptions& opt,
                                       const ProgressCallback& progress = nullptr);
