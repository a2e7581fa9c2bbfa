#pragma once
#include <Eigen/Dense>

// Cholesky factor of the Gram matrix G = A A^T (m x m, SPD when A has full row rank).
// Built once per run and only read afterwards, so a single instance can be shared
// by several runs on the same A.
class GramFactorization {
public:
    using Vec = Eigen::VectorXd;
    using Mat = Eigen::MatrixXd;

    // Throws NumericalError if A A^T is not numerically SPD.
    explicit GramFactorization(const Eigen::Ref<const Mat>& A);

    // z such that (A A^T) z = r, by forward/backward substitution: O(m^2).
    Vec solve(const Eigen::Ref<const Vec>& r) const;

    int size() const noexcept { return static_cast<int>(llt_.rows()); }

    // Smallest squared pivot relative to the largest Gram diagonal entry.
    double pivot_ratio() const noexcept { return pivot_ratio_; }

    // Below this pivot ratio the Gram matrix is treated as singular.
    static constexpr double kMinPivotRatio = 1e-12;

private:
    Eigen::LLT<Mat> llt_;
    double pivot_ratio_{0.0};
};

GramFactorization factorize(const Eigen::MatrixXd& A);
