#pragma once
#include "GramFactorization.hpp"
#include <Eigen/Dense>

namespace Affine {

// Euclidean projection of y onto {x : A x = b}:
//   x = y - A^T (A A^T)^{-1} (A y - b)
// gram must be the factorization of A A^T for this A.
Eigen::VectorXd project(const Eigen::VectorXd& y,
                        const Eigen::MatrixXd& A,
                        const Eigen::VectorXd& b,
                        const GramFactorization& gram);

// ||A x - b||_2
double residual_norm(const Eigen::MatrixXd& A, const Eigen::VectorXd& b, const Eigen::VectorXd& x);

}
