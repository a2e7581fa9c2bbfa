#pragma once
#include "Problem.hpp"
#include <nlopt.hpp>

struct NloptOptions {
    int max_evals = 5000;
    double rel_tol = 1e-10;
    double abs_tol = 1e-12;
    double eq_tol = 1e-10;     // tolerance on each row of A(u - v) = b
};

struct NloptResult {
    Eigen::VectorXd x;
    double fval;
    nlopt::result status;
};

// Reference solver: x = u - v with u, v >= 0, min 1^T (u + v) s.t. A (u - v) = b,
// handed to NLopt's SLSQP.
NloptResult minimize_slsqp(const Problem& P, const Eigen::VectorXd& x0, const NloptOptions& opt);
