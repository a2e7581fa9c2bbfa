#include "Certificate.hpp"
#include "Subgradient.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <utility>

DualCertificate duality_gap(const Problem& P, const GramFactorization& gram, const Eigen::VectorXd& x) {
    if (x.size() != P.n() || gram.size() != P.m())
        throw InvalidInput("duality_gap: dimension mismatch.");

    const Eigen::VectorXd s = l1_subgradient(x);
    Eigen::VectorXd nu = gram.solve(P.A * s);

    // rescale so that ||A^T nu||_inf <= 1
    const double scale = std::max(1.0, (P.A.transpose() * nu).lpNorm<Eigen::Infinity>());
    nu /= scale;

    DualCertificate c;
    c.primal = x.lpNorm<1>();
    c.dual = P.b.dot(nu);
    c.gap = c.primal - c.dual;
    c.nu = std::move(nu);
    return c;
}
