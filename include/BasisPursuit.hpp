#pragma once
#include "Problem.hpp"
#include "Subgradient.hpp"
#include "SLSQP.hpp"
#include "Certificate.hpp"
#include <optional>
#include <vector>

struct PursuitSolution {
    Eigen::VectorXd x;
    double l1_norm;
    double residual;              // ||A x - b||_2
    int iters;                    // subgradient iterations, 0 for SLSQP
    std::vector<double> history;  // subgradient objective history, empty for SLSQP
    DualCertificate certificate;
    SubgradientStatus status;     // how the solver stopped, SLSQP mapped onto the same two outcomes
    std::optional<nlopt::result> nlopt_status;  // raw NLopt code, SLSQP only
};

enum class SolverKind { Subgradient, SLSQP };

// Solve from x0 = 0 with one factorization of A A^T shared by the solver and the certificate.
PursuitSolution solve_basis_pursuit(const Problem& P,
                                    SolverKind solver,
                                    const SubgradientOptions& opt = {},
                                    const ProgressCallback& progress = nullptr);
