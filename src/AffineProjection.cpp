#include "AffineProjection.hpp"
#include "Errors.hpp"

Eigen::VectorXd Affine::project(const Eigen::VectorXd& y,
                                const Eigen::MatrixXd& A,
                                const Eigen::VectorXd& b,
                                const GramFactorization& gram)
{
    if (y.size() != A.cols() || b.size() != A.rows() || gram.size() != A.rows())
        throw InvalidInput("Affine::project: dimension mismatch between y, A, b and factorization.");

    const Eigen::VectorXd r = A * y - b;  // infeasibility
    const Eigen::VectorXd z = gram.solve(r);
    Eigen::VectorXd x = y;
    x.noalias() -= A.transpose() * z;
    return x;
}

double Affine::residual_norm(const Eigen::MatrixXd& A, const Eigen::VectorXd& b, const Eigen::VectorXd& x) {
    return (A * x - b).norm();
}
