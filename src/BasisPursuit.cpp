#include "BasisPursuit.hpp"
#include "AffineProjection.hpp"
#include "GramFactorization.hpp"
#include <utility>

namespace {
// Budget and round-off stops did not meet NLopt's own tolerances.
SubgradientStatus from_nlopt(nlopt::result r) {
    switch (r) {
        case nlopt::SUCCESS:
        case nlopt::STOPVAL_REACHED:
        case nlopt::FTOL_REACHED:
        case nlopt::XTOL_REACHED:
            return SubgradientStatus::Converged;
        default:
            return SubgradientStatus::IterationLimitReached;
    }
}
}

PursuitSolution solve_basis_pursuit(const Problem& P,
                                    SolverKind solver,
                                    const SubgradientOptions& opt,
                                    const ProgressCallback& progress)
{
    validate_problem(P);
    const Eigen::VectorXd x0 = Eigen::VectorXd::Zero(P.n());
    const GramFactorization gram(P.A);

    PursuitSolution sol;
    switch (solver) {
        case SolverKind::Subgradient: {
            auto res = minimize_subgradient(P, gram, x0, opt, progress);
            sol.x = std::move(res.x);
            sol.iters = res.iters;
            sol.history = std::move(res.history);
            sol.status = res.status;
            break;
        }
        case SolverKind::SLSQP: {
            NloptOptions o; o.max_evals = 20000;
            auto res = minimize_slsqp(P, x0, o);
            sol.x = std::move(res.x);
            sol.iters = 0;
            sol.status = from_nlopt(res.status);
            sol.nlopt_status = res.status;
            break;
        }
    }

    sol.l1_norm = sol.x.lpNorm<1>();
    sol.residual = Affine::residual_norm(P.A, P.b, sol.x);
    sol.certificate = duality_gap(P, gram, sol.x);
    return sol;
}
