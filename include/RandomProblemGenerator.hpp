#pragma once
#include "Problem.hpp"
#include <cstdint>
#include <random>

struct GeneratedProblem {
    Problem problem;
    Eigen::VectorXd planted;   // b = A * planted, a known feasible point
};

class RandomProblemGenerator {
public:
    enum class MatrixMode  { Gaussian, Uniform };
    enum class PlantedMode { Ones, Sparse };

    struct Options {
        int m = 5;                     // rows (constraints)
        int n = 20;                    // columns (unknowns), n > m
        MatrixMode matrix_mode = MatrixMode::Gaussian;
        double scale = 1.0;            // Gaussian: N(0, scale^2); Uniform: [-scale, scale]

        PlantedMode planted_mode = PlantedMode::Ones;
        int sparsity = 3;              // nonzeros of the planted vector for Sparse

        uint64_t seed = 42ULL;
    };

    explicit RandomProblemGenerator(Options opts);

    // Throws NumericalError if the drawn A is numerically rank deficient.
    GeneratedProblem generate();

private:
    using Vec = Eigen::VectorXd;
    using Mat = Eigen::MatrixXd;

    Options opts_;
    std::mt19937_64 rng_;

    Mat sample_matrix();
    Vec sample_planted();
};
