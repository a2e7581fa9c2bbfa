#include "SLSQP.hpp"
#include <vector>

namespace {
// f(u, v) = sum u + sum v
double objective(unsigned n, const double* z, double* grad, void*) {
    double s = 0.0;
    for (unsigned i = 0; i < n; ++i) s += z[i];
    if (grad) for (unsigned i = 0; i < n; ++i) grad[i] = 1.0;
    return s;
}

// result = A (u - v) - b, grad is m x 2n row-major
void equality(unsigned m, double* result, unsigned n2, const double* z, double* grad, void* data) {
    const Problem* P = static_cast<const Problem*>(data);
    const unsigned n = n2 / 2;
    Eigen::Map<const Eigen::VectorXd> u(z, n);
    Eigen::Map<const Eigen::VectorXd> v(z + n, n);
    Eigen::Map<Eigen::VectorXd> r(result, m);
    r = P->A * (u - v) - P->b;
    if (grad) {
        using RowMat = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
        Eigen::Map<RowMat> J(grad, m, n2);
        J.leftCols(n) = P->A;
        J.rightCols(n) = -P->A;
    }
}
}

NloptResult minimize_slsqp(const Problem& P, const Eigen::VectorXd& x0, const NloptOptions& opt) {
    validate_start(P, x0);
    const int n = P.n();
    const int m = P.m();
    nlopt::opt opti(nlopt::LD_SLSQP, 2 * n);

    // Bounds u_i, v_i >= 0
    opti.set_lower_bounds(std::vector<double>(2 * n, 0.0));

    opti.add_equality_mconstraint(equality, const_cast<Problem*>(&P),
                                  std::vector<double>(m, opt.eq_tol));

    opti.set_min_objective(objective, nullptr);
    opti.set_maxeval(opt.max_evals);
    opti.set_xtol_rel(opt.rel_tol);
    opti.set_xtol_abs(opt.abs_tol);

    std::vector<double> z(2 * n);
    for (int i = 0; i < n; ++i) {
        z[i]     = x0[i] > 0.0 ?  x0[i] : 0.0;
        z[n + i] = x0[i] < 0.0 ? -x0[i] : 0.0;
    }

    double minf = 0.0;
    nlopt::result status;
    try {
        status = opti.optimize(z, minf);
    } catch (const nlopt::roundoff_limited&) {
        // z and minf hold the last point SLSQP accepted
        status = nlopt::ROUNDOFF_LIMITED;
    }

    Eigen::VectorXd x(n);
    for (int i = 0; i < n; ++i) x[i] = z[i] - z[n + i];
    return {x, x.lpNorm<1>(), status};
}
