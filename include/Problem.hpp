#pragma once
#include <Eigen/Dense>

// min ||x||_1  s.t.  A x = b,  A is m x n with m < n and full row rank.
struct Problem {
    Eigen::MatrixXd A;
    Eigen::VectorXd b;

    int m() const noexcept { return static_cast<int>(A.rows()); }
    int n() const noexcept { return static_cast<int>(A.cols()); }
};

// Throws InvalidInput unless 1 <= m < n, b has m entries and everything is finite.
// Rank is not checked here; the Gram factorization catches rank deficiency.
void validate_problem(const Eigen::MatrixXd& A, const Eigen::VectorXd& b);

inline void validate_problem(const Problem& P) { validate_problem(P.A, P.b); }

// Also checks that x0 has n entries and is finite.
void validate_start(const Problem& P, const Eigen::VectorXd& x0);
