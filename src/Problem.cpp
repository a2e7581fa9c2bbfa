#include "Problem.hpp"
#include "Errors.hpp"
#include <string>

void validate_problem(const Eigen::MatrixXd& A, const Eigen::VectorXd& b) {
    const auto m = A.rows();
    const auto n = A.cols();
    if (m < 1 || n < 1)
        throw InvalidInput("Problem: A must be nonempty.");
    if (m >= n)
        throw InvalidInput("Problem: system must be underdetermined (m < n), got m="
                           + std::to_string(m) + ", n=" + std::to_string(n) + ".");
    if (b.size() != m)
        throw InvalidInput("Problem: b has " + std::to_string(b.size())
                           + " entries, A has " + std::to_string(m) + " rows.");
    if (!A.allFinite() || !b.allFinite())
        throw InvalidInput("Problem: A and b must be finite.");
}

void validate_start(const Problem& P, const Eigen::VectorXd& x0) {
    validate_problem(P);
    if (x0.size() != P.n())
        throw InvalidInput("Problem: x0 has " + std::to_string(x0.size())
                           + " entries, A has " + std::to_string(P.n()) + " columns.");
    if (!x0.allFinite())
        throw InvalidInput("Problem: x0 must be finite.");
}
