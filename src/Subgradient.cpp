#include "Subgradient.hpp"
#include "AffineProjection.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace {
void validate_options(const SubgradientOptions& opt) {
    if (opt.max_iterations < 1)
        throw InvalidInput("Subgradient: max_iterations must be at least 1.");
    if (!(opt.tol >= 0.0))
        throw InvalidInput("Subgradient: tol must be nonnegative.");
    if (opt.report_every < 0)
        throw InvalidInput("Subgradient: report_every must be nonnegative.");
}
}

Eigen::VectorXd l1_subgradient(const Eigen::VectorXd& x) {
    Eigen::VectorXd g(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        g[i] = (x[i] > 0.0) ? 1.0 : ((x[i] < 0.0) ? -1.0 : 0.0);
    }
    return g;
}

SubgradientResult minimize_subgradient(const Problem& P,
                                       const Eigen::VectorXd& x0,
                                       const SubgradientOptions& opt,
                                       const ProgressCallback& progress)
{
    validate_start(P, x0);
    validate_options(opt);
    const GramFactorization gram(P.A);
    return minimize_subgradient(P, gram, x0, opt, progress);
}

SubgradientResult minimize_subgradient(const Problem& P,
                                       const GramFactorization& gram,
                                       const Eigen::VectorXd& x0,
                                       const SubgradientOptions& opt,
                                       const ProgressCallback& progress)
{
    using Vec = Eigen::VectorXd;
    validate_start(P, x0);
    validate_options(opt);
    if (gram.size() != P.m())
        throw InvalidInput("Subgradient: factorization does not match A.");

    SubgradientResult res;
    res.fval = std::numeric_limits<double>::infinity();
    res.iters = 0;
    res.status = SubgradientStatus::Running;
    res.history.reserve(static_cast<size_t>(std::min(opt.max_iterations, 1 << 20)));

    Vec x = x0;
    for (int k = 0; k < opt.max_iterations; ++k) {
        const Vec y = x - diminishing_step(k) * l1_subgradient(x);
        Vec x_next = Affine::project(y, P.A, P.b, gram);

        const double f = x_next.lpNorm<1>();
        if (!std::isfinite(f)) {
            throw NumericalError("Subgradient: non-finite objective at iteration "
                                 + std::to_string(k) + ".");
        }
        res.history.push_back(f);
        res.iters = k + 1;

        // strict: ties keep the earlier iterate
        if (f < res.fval) {
            res.fval = f;
            res.x = x_next;
        }

        if (progress && opt.report_every > 0 && k % opt.report_every == 0) {
            progress(k, f);
        }

        const double step = (x - x_next).lpNorm<Eigen::Infinity>();
        x.swap(x_next);
        if (step < opt.tol) {
            res.status = SubgradientStatus::Converged;
            return res;
        }
    }
    res.status = SubgradientStatus::IterationLimitReached;
    return res;
}
