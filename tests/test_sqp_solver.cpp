/**
 * @file test_sqp_solver.cpp
 * @brief Tests for the SQP solver on smooth portfolio objectives
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>

#include "folio/optimizer/objective_function.hpp"
#include "folio/optimizer/optimizer_interface.hpp"
#include "folio/optimizer/osqp_solver.hpp"
#include "folio/optimizer/sqp_solver.hpp"

using namespace folio;
using namespace folio::optimizer;
using Catch::Matchers::WithinAbs;

namespace
{
    /// Squared distance to a fixed point
    class DistanceObjective : public ObjectiveFunction
    {
    public:
        explicit DistanceObjective(const Eigen::VectorXd &target) : target_(target) {}

        double value(const Eigen::VectorXd &weights) const override
        {
            return (weights - target_).squaredNorm();
        }

        Eigen::VectorXd gradient(const Eigen::VectorXd &weights) const override
        {
            return 2.0 * (weights - target_);
        }

        std::string get_name() const override { return "Distance"; }

    private:
        Eigen::VectorXd target_;
    };

    Eigen::MatrixXd three_asset_covariance()
    {
        Eigen::MatrixXd cov(3, 3);
        cov << 0.040, 0.006, 0.010,
               0.006, 0.025, 0.004,
               0.010, 0.004, 0.090;
        return cov;
    }
}

TEST_CASE("SQP projects onto the simplex", "[SQP]")
{
    // Closest simplex point to (0.8, 0.6, -0.2) is (0.6, 0.4, 0)
    Eigen::VectorXd target(3);
    target << 0.8, 0.6, -0.2;
    DistanceObjective objective(target);

    OptimizationConstraints constraints;
    LinearConstraints linear = constraints.to_linear_constraints(3);

    SqpSolver solver;
    SolverResult result = solver.solve(objective, linear, Eigen::VectorXd::Constant(3, 1.0 / 3.0));

    REQUIRE(result.success);
    REQUIRE_THAT(result.solution(0), WithinAbs(0.6, 1e-6));
    REQUIRE_THAT(result.solution(1), WithinAbs(0.4, 1e-6));
    REQUIRE_THAT(result.solution(2), WithinAbs(0.0, 1e-6));
    REQUIRE(linear.max_violation(result.solution) < 1e-8);
}

TEST_CASE("SQP minimum volatility agrees with the QP", "[SQP][OSQP]")
{
    Eigen::MatrixXd cov = three_asset_covariance();
    OptimizationConstraints constraints;
    LinearConstraints linear = constraints.to_linear_constraints(3);

    PortfolioVolatilityObjective objective(cov);
    SqpSolver solver;
    SolverResult sqp = solver.solve(objective, linear, Eigen::VectorXd::Constant(3, 1.0 / 3.0));

    QuadraticProblem problem;
    problem.P = cov;
    problem.q = Eigen::VectorXd::Zero(3);
    problem.constraints = linear;
    SolverResult qp = OsqpSolver().solve(problem);

    REQUIRE(sqp.success);
    REQUIRE(qp.success);
    for (Eigen::Index i = 0; i < 3; ++i)
    {
        REQUIRE_THAT(sqp.solution(i), WithinAbs(qp.solution(i), 1e-4));
    }
    REQUIRE_THAT(objective.value(sqp.solution), WithinAbs(objective.value(qp.solution), 1e-7));
}

TEST_CASE("SQP maximum Sharpe for uncorrelated assets", "[SQP][Sharpe]")
{
    // Tangency weights are proportional to Sigma^-1 mu = (2.5, 4)
    Eigen::VectorXd mu(2);
    mu << 0.10, 0.08;
    Eigen::MatrixXd cov = Eigen::MatrixXd::Zero(2, 2);
    cov(0, 0) = 0.04;
    cov(1, 1) = 0.02;

    NegativeSharpeObjective objective(mu, cov, 0.0);
    OptimizationConstraints constraints;
    SqpSolver solver;
    SolverResult result = solver.solve(objective, constraints.to_linear_constraints(2),
                                       Eigen::VectorXd::Constant(2, 0.5));

    REQUIRE(result.success);
    REQUIRE_THAT(result.solution(0), WithinAbs(2.5 / 6.5, 1e-4));
    REQUIRE_THAT(result.solution(1), WithinAbs(4.0 / 6.5, 1e-4));
    REQUIRE(objective.value(result.solution) <= objective.value(Eigen::VectorXd::Constant(2, 0.5)));
}

TEST_CASE("SQP inadmissible start", "[SQP]")
{
    Eigen::VectorXd mu = Eigen::VectorXd::Constant(2, 0.001);
    Eigen::MatrixXd cov = Eigen::MatrixXd::Zero(2, 2);

    NegativeSharpeObjective objective(mu, cov, 0.0);
    OptimizationConstraints constraints;
    SqpSolver solver;
    SolverResult result = solver.solve(objective, constraints.to_linear_constraints(2),
                                       Eigen::VectorXd::Constant(2, 0.5));

    REQUIRE_FALSE(result.success);
    REQUIRE(result.iterations == 0);
    REQUIRE(result.solution.size() == 2);
}

TEST_CASE("SQP options and inputs", "[SQP]")
{
    SqpOptions options;
    options.max_iterations = 0;
    REQUIRE_THROWS_AS(SqpSolver(options), std::invalid_argument);

    DistanceObjective objective(Eigen::VectorXd::Zero(2));
    OptimizationConstraints constraints;
    SqpSolver solver;
    REQUIRE_THROWS_AS(solver.solve(objective, constraints.to_linear_constraints(2), Eigen::VectorXd()),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(solver.solve(objective, constraints.to_linear_constraints(3), Eigen::VectorXd::Zero(2)),
                      std::invalid_argument);
}

TEST_CASE("Objective gradients match finite differences", "[SQP][Objective]")
{
    Eigen::VectorXd mu(3);
    mu << 0.0008, 0.0005, 0.0011;
    Eigen::MatrixXd cov = three_asset_covariance() / 252.0;
    Eigen::VectorXd w(3);
    w << 0.5, 0.3, 0.2;

    NegativeSharpeObjective sharpe(mu, cov, 0.0001);
    PortfolioVolatilityObjective vol(cov);

    const double h = 1e-7;
    Eigen::VectorXd g_sharpe = sharpe.gradient(w);
    Eigen::VectorXd g_vol = vol.gradient(w);
    for (Eigen::Index i = 0; i < 3; ++i)
    {
        Eigen::VectorXd up = w;
        Eigen::VectorXd down = w;
        up(i) += h;
        down(i) -= h;
        REQUIRE_THAT(g_sharpe(i), WithinAbs((sharpe.value(up) - sharpe.value(down)) / (2 * h), 1e-5));
        REQUIRE_THAT(g_vol(i), WithinAbs((vol.value(up) - vol.value(down)) / (2 * h), 1e-6));
    }

    SECTION("Zero volatility is penalized")
    {
        NegativeSharpeObjective flat(mu, Eigen::MatrixXd::Zero(3, 3), 0.0);
        REQUIRE_FALSE(flat.is_admissible(flat.value(w)));
        REQUIRE(flat.gradient(w).isZero());
    }
}
