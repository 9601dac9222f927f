/**
 * @file test_mean_variance_optimizer.cpp
 * @brief Unit tests for MeanVarianceOptimizer
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <limits>

#include "folio/optimizer/mean_variance_optimizer.hpp"

using namespace folio;
using namespace folio::optimizer;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixture
// ============================================================================

class OptimizerTestFixture
{
protected:
    Eigen::VectorXd returns_2asset_;
    Eigen::MatrixXd cov_2asset_;

    Eigen::VectorXd returns_5asset_;
    Eigen::MatrixXd cov_5asset_;

    OptimizerTestFixture()
    {
        returns_2asset_ = Eigen::VectorXd(2);
        returns_2asset_ << 0.10, 0.08;

        cov_2asset_ = Eigen::MatrixXd(2, 2);
        cov_2asset_ << 0.04, 0.01,
                       0.01, 0.02;

        returns_5asset_ = Eigen::VectorXd(5);
        returns_5asset_ << 0.10, 0.08, 0.12, 0.06, 0.11;

        Eigen::VectorXd vols(5);
        vols << 0.20, 0.15, 0.25, 0.10, 0.22;
        cov_5asset_ = Eigen::MatrixXd(5, 5);
        for (int i = 0; i < 5; ++i)
        {
            for (int j = 0; j < 5; ++j)
            {
                double rho = (i == j) ? 1.0 : 0.3;
                cov_5asset_(i, j) = rho * vols(i) * vols(j);
            }
        }
    }

    static Eigen::VectorXd equal(Eigen::Index n)
    {
        return Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n));
    }
};

TEST_CASE_METHOD(OptimizerTestFixture, "MeanVarianceOptimizer construction",
                 "[MeanVarianceOptimizer][Basic]")
{
    SECTION("Default construction")
    {
        MeanVarianceOptimizer opt;
        REQUIRE(opt.get_name() == "MeanVarianceOptimizer");
        REQUIRE(opt.get_objective() == ObjectiveType::MIN_VARIANCE);
        REQUIRE_THAT(opt.get_risk_free_rate(), WithinAbs(0.0, 1e-15));
    }

    SECTION("Parameters are reported")
    {
        MeanVarianceOptimizer opt(ObjectiveType::MAX_SHARPE, 0.02);
        auto params = opt.get_parameters();
        REQUIRE(params["objective"].get<std::string>() == "MAX_SHARPE");
        REQUIRE_THAT(params["risk_free_rate"].get<double>(), WithinAbs(0.02, 1e-15));
        REQUIRE_FALSE(params.contains("target_return"));
    }

    SECTION("Non-finite inputs throw")
    {
        REQUIRE_THROWS_AS(MeanVarianceOptimizer(ObjectiveType::MAX_SHARPE, std::numeric_limits<double>::infinity()),
                          std::invalid_argument);
        MeanVarianceOptimizer opt(ObjectiveType::TARGET_RETURN);
        REQUIRE_THROWS_AS(opt.set_target_return(std::nan("")), std::invalid_argument);
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "OptimizationConstraints validation",
                 "[MeanVarianceOptimizer][Constraints]")
{
    SECTION("Valid constraints")
    {
        OptimizationConstraints c;
        c.max_weight = 0.5;
        REQUIRE_NOTHROW(c.validate());
        REQUIRE(c.is_feasible(2));
        REQUIRE_FALSE(c.is_feasible(1));
    }

    SECTION("Invalid bounds")
    {
        OptimizationConstraints c;
        c.min_weight = 0.6;
        c.max_weight = 0.4;
        REQUIRE_THROWS_AS(c.validate(), std::invalid_argument);

        c.min_weight = -0.1;
        c.max_weight = 1.0;
        REQUIRE_THROWS_AS(c.validate(), std::invalid_argument);
    }

    SECTION("Infeasible bounds are rejected before solving")
    {
        OptimizationConstraints c;
        c.max_weight = 0.3;
        MeanVarianceOptimizer opt;
        REQUIRE_THROWS_AS(opt.optimize(returns_2asset_, cov_2asset_, c), std::invalid_argument);
    }

    SECTION("From JSON")
    {
        auto c = OptimizationConstraints::from_json(nlohmann::json{{"max_weight", 0.4}});
        REQUIRE_THAT(c.max_weight, WithinAbs(0.4, 1e-15));
        REQUIRE_THAT(c.min_weight, WithinAbs(0.0, 1e-15));
        REQUIRE(c.sum_to_one);
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Input validation", "[MeanVarianceOptimizer][Validation]")
{
    MeanVarianceOptimizer opt;
    OptimizationConstraints c;

    SECTION("Dimension mismatch")
    {
        REQUIRE_THROWS_AS(opt.optimize(returns_5asset_, cov_2asset_, c), std::invalid_argument);
    }

    SECTION("Asymmetric covariance")
    {
        Eigen::MatrixXd bad = cov_2asset_;
        bad(0, 1) = 0.02;
        REQUIRE_THROWS_AS(opt.optimize(returns_2asset_, bad, c), std::invalid_argument);
    }

    SECTION("Indefinite covariance")
    {
        Eigen::MatrixXd bad(2, 2);
        bad << 0.01, 0.05,
               0.05, 0.01;
        REQUIRE_THROWS_AS(opt.optimize(returns_2asset_, bad, c), std::invalid_argument);
    }

    SECTION("Non-finite expected returns")
    {
        Eigen::VectorXd bad = returns_2asset_;
        bad(0) = std::nan("");
        REQUIRE_THROWS_AS(opt.optimize(bad, cov_2asset_, c), std::invalid_argument);
    }

    SECTION("Initial weights of the wrong size")
    {
        REQUIRE_THROWS_AS(opt.optimize(returns_2asset_, cov_2asset_, c, equal(3)), std::invalid_argument);
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Minimum variance", "[MeanVarianceOptimizer][MinVariance]")
{
    MeanVarianceOptimizer opt(ObjectiveType::MIN_VARIANCE);
    OptimizationConstraints c;

    SECTION("Two-asset closed form")
    {
        // w1 = (s2^2 - s12) / (s1^2 + s2^2 - 2 s12) = 0.01 / 0.04
        OptimizationResult result = opt.optimize(returns_2asset_, cov_2asset_, c);

        REQUIRE(result.success);
        REQUIRE(result.is_valid());
        REQUIRE_THAT(result.weights(0), WithinAbs(0.25, 1e-5));
        REQUIRE_THAT(result.weights(1), WithinAbs(0.75, 1e-5));
        REQUIRE_THAT(result.weights.sum(), WithinAbs(1.0, 1e-6));
        REQUIRE_THAT(result.volatility, WithinAbs(std::sqrt(0.0175), 1e-6));
        REQUIRE_THAT(result.expected_return, WithinAbs(0.085, 1e-6));
    }

    SECTION("Beats equal weight and respects bounds")
    {
        c.max_weight = 0.4;
        OptimizationResult result = opt.optimize(returns_5asset_, cov_5asset_, c);
        OptimizationResult ew = OptimizerInterface::calculate_statistics(equal(5), returns_5asset_, cov_5asset_);

        REQUIRE(result.success);
        REQUIRE(OptimizerInterface::check_constraints(result.weights, c));
        REQUIRE(result.weights.maxCoeff() <= 0.4 + 1e-6);
        REQUIRE(result.volatility <= ew.volatility + 1e-12);
    }

    SECTION("Daily-scale covariance")
    {
        Eigen::MatrixXd daily = cov_5asset_ / 252.0;
        OptimizationResult daily_result = opt.optimize(returns_5asset_ / 252.0, daily, c);
        OptimizationResult annual_result = opt.optimize(returns_5asset_, cov_5asset_, c);

        REQUIRE(daily_result.success);
        for (Eigen::Index i = 0; i < 5; ++i)
        {
            REQUIRE_THAT(daily_result.weights(i), WithinAbs(annual_result.weights(i), 1e-4));
        }
    }

    SECTION("Zero covariance keeps the starting point")
    {
        OptimizationResult result = opt.optimize(returns_2asset_, Eigen::MatrixXd::Zero(2, 2), c);
        REQUIRE(result.success);
        REQUIRE_THAT(result.weights(0), WithinAbs(0.5, 1e-15));
        REQUIRE(result.volatility == 0.0);
        REQUIRE_FALSE(result.sharpe_ratio.has_value());
    }

    SECTION("Perfect hedge reaches zero volatility")
    {
        // Second asset is -0.5 times the first
        Eigen::MatrixXd hedge(2, 2);
        hedge << 0.04, -0.02,
                 -0.02, 0.01;
        OptimizationResult result = opt.optimize(returns_2asset_, hedge, c);

        REQUIRE(result.success);
        REQUIRE_THAT(result.weights(0), WithinAbs(1.0 / 3.0, 1e-4));
        REQUIRE(result.volatility < 1e-3);
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Maximum Sharpe", "[MeanVarianceOptimizer][MaxSharpe]")
{
    OptimizationConstraints c;

    SECTION("Uncorrelated closed form")
    {
        Eigen::MatrixXd cov = Eigen::MatrixXd::Zero(2, 2);
        cov(0, 0) = 0.04;
        cov(1, 1) = 0.02;

        MeanVarianceOptimizer opt(ObjectiveType::MAX_SHARPE, 0.0);
        OptimizationResult result = opt.optimize(returns_2asset_, cov, c);

        REQUIRE(result.success);
        REQUIRE_THAT(result.weights(0), WithinAbs(2.5 / 6.5, 1e-4));
    }

    SECTION("Sharpe at least equal weight")
    {
        MeanVarianceOptimizer opt(ObjectiveType::MAX_SHARPE, 0.02);
        OptimizationResult result = opt.optimize(returns_5asset_, cov_5asset_, c);
        OptimizationResult ew = OptimizerInterface::calculate_statistics(equal(5), returns_5asset_, cov_5asset_, 0.02);

        REQUIRE(result.is_valid());
        REQUIRE(OptimizerInterface::check_constraints(result.weights, c));
        REQUIRE(result.sharpe_ratio.has_value());
        REQUIRE(*result.sharpe_ratio >= *ew.sharpe_ratio - 1e-12);
    }

    SECTION("Sharpe at least that of the minimum variance portfolio")
    {
        MeanVarianceOptimizer sharpe(ObjectiveType::MAX_SHARPE, 0.02);
        MeanVarianceOptimizer minvar(ObjectiveType::MIN_VARIANCE, 0.02);
        OptimizationResult best = sharpe.optimize(returns_5asset_, cov_5asset_, c);
        OptimizationResult low = minvar.optimize(returns_5asset_, cov_5asset_, c);

        REQUIRE(*best.sharpe_ratio >= *low.sharpe_ratio - 1e-6);
    }

    SECTION("Zero covariance falls back to the start")
    {
        MeanVarianceOptimizer opt(ObjectiveType::MAX_SHARPE, 0.0);
        OptimizationResult result = opt.optimize(returns_2asset_, Eigen::MatrixXd::Zero(2, 2), c);

        REQUIRE_FALSE(result.success);
        REQUIRE_THAT(result.weights(0), WithinAbs(0.5, 1e-15));
        REQUIRE_FALSE(result.message.empty());
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Target return", "[MeanVarianceOptimizer][TargetReturn]")
{
    OptimizationConstraints c;

    SECTION("Target must be set")
    {
        MeanVarianceOptimizer opt(ObjectiveType::TARGET_RETURN);
        REQUIRE_THROWS_AS(opt.optimize(returns_5asset_, cov_5asset_, c), std::invalid_argument);
    }

    SECTION("Target is met")
    {
        MeanVarianceOptimizer opt(ObjectiveType::TARGET_RETURN);
        opt.set_target_return(0.10);
        OptimizationResult result = opt.optimize(returns_5asset_, cov_5asset_, c);

        REQUIRE(result.success);
        REQUIRE_THAT(result.expected_return, WithinAbs(0.10, 1e-6));
        REQUIRE(OptimizerInterface::check_constraints(result.weights, c));
        REQUIRE(opt.get_parameters().contains("target_return"));
    }

    SECTION("Unreachable target falls back")
    {
        MeanVarianceOptimizer opt(ObjectiveType::TARGET_RETURN);
        opt.set_target_return(0.50);
        OptimizationResult result = opt.optimize(returns_5asset_, cov_5asset_, c);

        REQUIRE_FALSE(result.success);
        REQUIRE(result.message.find("returning starting point") != std::string::npos);
    }
}

TEST_CASE("Objective names", "[MeanVarianceOptimizer]")
{
    REQUIRE(to_string(ObjectiveType::MIN_VARIANCE) == "MIN_VARIANCE");
    REQUIRE(to_string(ObjectiveType::TARGET_RETURN) == "TARGET_RETURN");
}
