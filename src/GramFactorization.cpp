#include "GramFactorization.hpp"
#include "Errors.hpp"
#include <string>

GramFactorization::GramFactorization(const Eigen::Ref<const Mat>& A) {
    if (A.rows() == 0)
        throw InvalidInput("GramFactorization: A has no rows.");

    Mat G(A.rows(), A.rows());
    G.setZero();
    G.selfadjointView<Eigen::Lower>().rankUpdate(A);   // G = A A^T, lower half
    const double gmax = G.diagonal().maxCoeff();

    llt_.compute(G);
    if (llt_.info() != Eigen::Success || !(gmax > 0.0)) {
        throw NumericalError("GramFactorization: LLT failed, A A^T is not SPD (A rank deficient?).");
    }

    // LLT only rejects non-positive pivots; a tiny one still means rank(A) < m
    const Vec L_diag = llt_.matrixLLT().diagonal();
    pivot_ratio_ = L_diag.array().square().minCoeff() / gmax;
    if (!(pivot_ratio_ >= kMinPivotRatio)) {
        throw NumericalError("GramFactorization: A A^T is numerically singular (pivot ratio "
                             + std::to_string(pivot_ratio_) + ").");
    }
}

GramFactorization::Vec GramFactorization::solve(const Eigen::Ref<const Vec>& r) const {
    if (r.size() != size())
        throw InvalidInput("GramFactorization::solve: rhs has wrong size.");
    return llt_.solve(r);
}

GramFactorization factorize(const Eigen::MatrixXd& A) {
    return GramFactorization(A);
}
