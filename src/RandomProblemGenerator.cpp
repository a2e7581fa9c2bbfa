#include "RandomProblemGenerator.hpp"
#include "GramFactorization.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <numeric>
#include <utility>
#include <vector>

RandomProblemGenerator::RandomProblemGenerator(Options opts)
    : opts_(std::move(opts)), rng_(opts_.seed)
{
    if (opts_.m <= 0 || opts_.n <= 0) {
        throw InvalidInput("RandomProblemGenerator: m and n must be positive.");
    }
    if (opts_.m >= opts_.n) {
        throw InvalidInput("RandomProblemGenerator: require m < n.");
    }
    if (!(opts_.scale > 0.0)) {
        throw InvalidInput("RandomProblemGenerator: scale must be positive.");
    }
    if (opts_.planted_mode == PlantedMode::Sparse &&
        (opts_.sparsity < 1 || opts_.sparsity > opts_.n)) {
        throw InvalidInput("RandomProblemGenerator: sparsity must be in [1, n].");
    }
}

GeneratedProblem RandomProblemGenerator::generate() {
    GeneratedProblem out;
    out.problem.A = sample_matrix();
    out.planted = sample_planted();
    out.problem.b = out.problem.A * out.planted;

    // full row rank holds almost surely; throws NumericalError if not
    factorize(out.problem.A);
    return out;
}

RandomProblemGenerator::Mat RandomProblemGenerator::sample_matrix() {
    if (opts_.matrix_mode == MatrixMode::Gaussian) {
        std::normal_distribution<double> N(0.0, opts_.scale);
        return Mat::NullaryExpr(opts_.m, opts_.n, [&]() { return N(rng_); });
    }
    std::uniform_real_distribution<double> U(-opts_.scale, opts_.scale);
    return Mat::NullaryExpr(opts_.m, opts_.n, [&]() { return U(rng_); });
}

RandomProblemGenerator::Vec RandomProblemGenerator::sample_planted() {
    if (opts_.planted_mode == PlantedMode::Ones) {
        return Vec::Ones(opts_.n);
    }
    // k-sparse: random support, N(0,1) values
    std::vector<int> idx(opts_.n);
    std::iota(idx.begin(), idx.end(), 0);
    std::shuffle(idx.begin(), idx.end(), rng_);

    std::normal_distribution<double> N(0.0, 1.0);
    Vec x = Vec::Zero(opts_.n);
    for (int j = 0; j < opts_.sparsity; ++j) x[idx[j]] = N(rng_);
    return x;
}
