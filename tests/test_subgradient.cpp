#include <gtest/gtest.h>
#include "Subgradient.hpp"
#include "AffineProjection.hpp"
#include "RandomProblemGenerator.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

static Problem single_constraint() {
    Problem P;
    P.A.resize(1, 2);
    P.A << 1.0, 1.0;
    P.b.resize(1);
    P.b << 1.0;
    return P;
}

static GeneratedProblem ones_instance(uint64_t seed) {
    RandomProblemGenerator::Options opt;
    opt.m = 5;
    opt.n = 20;
    opt.planted_mode = RandomProblemGenerator::PlantedMode::Ones;
    opt.seed = seed;
    return RandomProblemGenerator(opt).generate();
}

TEST(subgradient, sign_is_zero_at_zero) {
    const Eigen::VectorXd x = Eigen::Vector4d(-2.5, 0.0, 1e-300, -0.0);
    const Eigen::VectorXd g = l1_subgradient(x);
    EXPECT_EQ(g[0], -1.0);
    EXPECT_EQ(g[1], 0.0);
    EXPECT_EQ(g[2], 1.0);
    EXPECT_EQ(g[3], 0.0);
}

TEST(subgradient, step_sizes_decrease_and_diverge) {
    EXPECT_DOUBLE_EQ(diminishing_step(0), 1.0);
    EXPECT_DOUBLE_EQ(diminishing_step(1), 0.5);

    const int K = 1000000;
    double sum = 0.0;
    double prev = diminishing_step(0) + 1.0;
    for (int k = 0; k < K; ++k) {
        const double a = diminishing_step(k);
        ASSERT_LT(a, prev);
        ASSERT_GT(a, 0.0);
        sum += a;
        prev = a;
    }
    // harmonic partial sums grow like log(K)
    EXPECT_GT(sum, std::log(K + 1.0) - 1e-9);
    EXPECT_LT(diminishing_step(K), 1e-5);
}

TEST(subgradient, single_constraint_converges_to_one) {
    const Problem P = single_constraint();
    const auto res = minimize_subgradient(P, Eigen::VectorXd::Zero(2), SubgradientOptions{});

    EXPECT_EQ(res.status, SubgradientStatus::Converged);
    EXPECT_NEAR(res.fval, 1.0, 1e-9);
    EXPECT_EQ(res.iters, 2);
    ASSERT_EQ(res.history.size(), 2u);
    EXPECT_DOUBLE_EQ(res.history[0], 1.0);
    EXPECT_NEAR(res.x[0] + res.x[1], 1.0, 1e-12);
    EXPECT_GE(res.x.minCoeff(), 0.0);
}

TEST(subgradient, single_constraint_from_negative_start) {
    const Problem P = single_constraint();
    const auto res = minimize_subgradient(P, Eigen::Vector2d(-3.0, 2.0), SubgradientOptions{});
    EXPECT_EQ(res.status, SubgradientStatus::Converged);
    EXPECT_NEAR(res.fval, 1.0, 1e-3);
    EXPECT_NEAR(Affine::residual_norm(P.A, P.b, res.x), 0.0, 1e-12);
}

TEST(subgradient, optimal_start_stops_immediately) {
    const Problem P = single_constraint();
    const auto res = minimize_subgradient(P, Eigen::Vector2d(0.5, 0.5), SubgradientOptions{});
    EXPECT_EQ(res.status, SubgradientStatus::Converged);
    EXPECT_LE(res.iters, 2);
    EXPECT_NEAR(res.fval, 1.0, 1e-12);
    EXPECT_NEAR(res.x[0], 0.5, 1e-12);
    EXPECT_NEAR(res.x[1], 0.5, 1e-12);
}

TEST(subgradient, random_instance_with_ones_planted) {
    const GeneratedProblem inst = ones_instance(2024);
    const Problem& P = inst.problem;

    SubgradientOptions opt;
    opt.max_iterations = 20000;
    const auto res = minimize_subgradient(P, Eigen::VectorXd::Zero(P.n()), opt);

    EXPECT_TRUE(res.status == SubgradientStatus::Converged ||
                res.status == SubgradientStatus::IterationLimitReached);
    EXPECT_TRUE(std::isfinite(res.fval));
    EXPECT_LE(res.fval, inst.planted.lpNorm<1>() + 1e-9);
    EXPECT_LT(Affine::residual_norm(P.A, P.b, res.x), 1e-8);
    EXPECT_EQ(res.history.size(), static_cast<size_t>(res.iters));
    EXPECT_LE(res.iters, opt.max_iterations);
}

TEST(subgradient, best_tracker_matches_history) {
    const GeneratedProblem inst = ones_instance(99);
    const Problem& P = inst.problem;

    SubgradientOptions opt;
    opt.max_iterations = 500;
    opt.tol = 0.0;
    const auto res = minimize_subgradient(P, Eigen::VectorXd::Zero(P.n()), opt);

    ASSERT_EQ(res.history.size(), 500u);
    EXPECT_EQ(res.fval, *std::min_element(res.history.begin(), res.history.end()));
    EXPECT_DOUBLE_EQ(res.x.lpNorm<1>(), res.fval);
}

TEST(subgradient, best_value_never_increases_with_budget) {
    const GeneratedProblem inst = ones_instance(17);
    const Problem& P = inst.problem;
    const GramFactorization gram(P.A);

    double prev = std::numeric_limits<double>::infinity();
    for (int budget : {1, 5, 25, 125, 625}) {
        SubgradientOptions opt;
        opt.max_iterations = budget;
        opt.tol = 0.0;
        const auto res = minimize_subgradient(P, gram, Eigen::VectorXd::Zero(P.n()), opt);
        EXPECT_LE(res.fval, prev);
        prev = res.fval;
    }
}

TEST(subgradient, every_projected_iterate_is_feasible) {
    const GeneratedProblem inst = ones_instance(5);
    const Problem& P = inst.problem;
    const GramFactorization gram(P.A);

    Eigen::VectorXd x = Eigen::VectorXd::Constant(P.n(), 3.0);
    for (int k = 0; k < 200; ++k) {
        const Eigen::VectorXd y = x - diminishing_step(k) * l1_subgradient(x);
        x = Affine::project(y, P.A, P.b, gram);
        ASSERT_LT(Affine::residual_norm(P.A, P.b, x), 1e-9) << "iteration " << k;
    }
}

TEST(subgradient, iteration_limit_is_not_an_error) {
    const GeneratedProblem inst = ones_instance(31);
    const Problem& P = inst.problem;

    SubgradientOptions opt;
    opt.max_iterations = 50;
    opt.tol = 0.0;
    SubgradientResult res;
    ASSERT_NO_THROW(res = minimize_subgradient(P, Eigen::VectorXd::Zero(P.n()), opt));

    EXPECT_EQ(res.status, SubgradientStatus::IterationLimitReached);
    EXPECT_EQ(res.iters, 50);
    EXPECT_EQ(res.history.size(), 50u);
    EXPECT_LT(Affine::residual_norm(P.A, P.b, res.x), 1e-9);
}

TEST(subgradient, progress_callback_is_observational) {
    const GeneratedProblem inst = ones_instance(8);
    const Problem& P = inst.problem;

    SubgradientOptions opt;
    opt.max_iterations = 50;
    opt.tol = 0.0;
    opt.report_every = 10;

    std::vector<int> seen;
    std::vector<double> values;
    const auto with = minimize_subgradient(P, Eigen::VectorXd::Zero(P.n()), opt,
        [&](int k, double f) { seen.push_back(k); values.push_back(f); });

    opt.report_every = 0;
    const auto without = minimize_subgradient(P, Eigen::VectorXd::Zero(P.n()), opt);

    EXPECT_EQ(seen, (std::vector<int>{0, 10, 20, 30, 40}));
    for (size_t i = 0; i < seen.size(); ++i) EXPECT_EQ(values[i], with.history[seen[i]]);
    EXPECT_EQ(with.history, without.history);
    EXPECT_TRUE(with.x.isApprox(without.x));
}

TEST(subgradient, shared_factorization_across_starts) {
    const GeneratedProblem inst = ones_instance(12);
    const Problem& P = inst.problem;
    const GramFactorization gram(P.A);

    SubgradientOptions opt;
    opt.max_iterations = 300;
    for (double start : {0.0, 1.0, -2.0}) {
        const Eigen::VectorXd x0 = Eigen::VectorXd::Constant(P.n(), start);
        const auto shared = minimize_subgradient(P, gram, x0, opt);
        const auto own = minimize_subgradient(P, x0, opt);
        EXPECT_EQ(shared.iters, own.iters);
        EXPECT_EQ(shared.history, own.history);
    }
}

TEST(subgradient, invalid_input) {
    const Problem P = single_constraint();
    const SubgradientOptions opt{};
    EXPECT_THROW(minimize_subgradient(P, Eigen::VectorXd::Zero(3), opt), InvalidInput);

    Problem square;
    square.A = Eigen::MatrixXd::Identity(2, 2);
    square.b = Eigen::VectorXd::Ones(2);
    EXPECT_THROW(minimize_subgradient(square, Eigen::VectorXd::Zero(2), opt), InvalidInput);

    Problem bad_b = single_constraint();
    bad_b.b = Eigen::VectorXd::Ones(2);
    EXPECT_THROW(minimize_subgradient(bad_b, Eigen::VectorXd::Zero(2), opt), InvalidInput);

    Problem nan_A = single_constraint();
    nan_A.A(0, 1) = std::nan("");
    EXPECT_THROW(minimize_subgradient(nan_A, Eigen::VectorXd::Zero(2), opt), InvalidInput);

    SubgradientOptions no_iters;
    no_iters.max_iterations = 0;
    EXPECT_THROW(minimize_subgradient(P, Eigen::VectorXd::Zero(2), no_iters), InvalidInput);

    SubgradientOptions negative_tol;
    negative_tol.tol = -1.0;
    EXPECT_THROW(minimize_subgradient(P, Eigen::VectorXd::Zero(2), negative_tol), InvalidInput);

    SubgradientOptions negative_stride;
    negative_stride.report_every = -1;
    EXPECT_THROW(minimize_subgradient(P, Eigen::VectorXd::Zero(2), negative_stride), InvalidInput);

    const GramFactorization other(ones_instance(1).problem.A);
    EXPECT_THROW(minimize_subgradient(P, other, Eigen::VectorXd::Zero(2), opt), InvalidInput);
}

TEST(subgradient, non_finite_objective_aborts) {
    // finite start, but the first projection overflows to inf
    const Problem P = single_constraint();
    const Eigen::VectorXd x0 = Eigen::Vector2d(1e308, 1e308);
    EXPECT_THROW(minimize_subgradient(P, x0, SubgradientOptions{}), NumericalError);
}

TEST(subgradient, rank_deficient_constraints) {
    Problem P;
    P.A.resize(2, 3);
    P.A << 1.0, 2.0, 0.0,
           2.0, 4.0, 0.0;
    P.b = Eigen::Vector2d(1.0, 2.0);
    EXPECT_THROW(minimize_subgradient(P, Eigen::VectorXd::Zero(3), SubgradientOptions{}), NumericalError);
}
