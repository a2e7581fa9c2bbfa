#pragma once
#include "Problem.hpp"
#include "GramFactorization.hpp"

// Lower bound on min ||x||_1 from the dual  max b^T nu  s.t. ||A^T nu||_inf <= 1.
struct DualCertificate {
    Eigen::VectorXd nu;   // dual feasible point
    double primal;        // ||x||_1
    double dual;          // b^T nu <= optimal value
    double gap;           // primal - dual
};

// nu is the least-squares fit of A^T nu ~ sign(x), scaled into the dual ball.
// gap is only an upper bound on suboptimality when x is feasible.
DualCertificate duality_gap(const Problem& P, const GramFactorization& gram, const Eigen::VectorXd& x);
