/**
 * @file mean_variance_optimizer.cpp
 * @brief Implementation of mean-variance portfolio optimizer
 */

#include "folio/optimizer/mean_variance_optimizer.hpp"
#include "folio/optimizer/objective_function.hpp"
#include "folio/optimizer/osqp_solver.hpp"

#include <cmath>
#include <stdexcept>

namespace folio
{
    namespace optimizer
    {

        namespace
        {
            constexpr double CONSTRAINT_TOLERANCE = 1e-6;

            /**
             * Solve min w' Sigma w over the given constraints. Sigma is divided
             * by its mean diagonal so OSQP's absolute tolerances are meaningful
             * for daily-scale covariances.
             */
            SolverResult solve_variance_qp(const Eigen::MatrixXd &covariance,
                                           const LinearConstraints &constraints,
                                           const Eigen::VectorXd &start,
                                           const SolverOptions &options)
            {
                double scale = covariance.diagonal().mean();
                if (!(scale > 0.0))
                {
                    scale = 1.0;
                }

                QuadraticProblem problem;
                problem.P = covariance / scale;
                problem.q = Eigen::VectorXd::Zero(covariance.rows());
                problem.constraints = constraints;
                problem.initial_guess = start;

                OsqpSolver solver(options);
                return solver.solve(problem);
            }

            double portfolio_variance(const Eigen::VectorXd &weights, const Eigen::MatrixXd &covariance)
            {
                return weights.dot(covariance * weights);
            }
        } // anonymous namespace

        std::string to_string(ObjectiveType objective)
        {
            switch (objective)
            {
            case ObjectiveType::MIN_VARIANCE:
                return "MIN_VARIANCE";
            case ObjectiveType::MAX_SHARPE:
                return "MAX_SHARPE";
            case ObjectiveType::TARGET_RETURN:
                return "TARGET_RETURN";
            }
            return "UNKNOWN";
        }

        MeanVarianceOptimizer::MeanVarianceOptimizer(
            ObjectiveType objective,
            double risk_free_rate)
            : objective_(objective),
              risk_free_rate_(risk_free_rate),
              target_return_(0.0),
              target_return_set_(false)
        {
            if (!std::isfinite(risk_free_rate))
            {
                throw std::invalid_argument("Risk-free rate must be finite");
            }
        }

        std::string MeanVarianceOptimizer::get_name() const
        {
            return "MeanVarianceOptimizer";
        }

        nlohmann::json MeanVarianceOptimizer::get_parameters() const
        {
            nlohmann::json params;
            params["optimizer_type"] = "MeanVariance";
            params["objective"] = to_string(objective_);
            params["risk_free_rate"] = risk_free_rate_;
            if (target_return_set_)
            {
                params["target_return"] = target_return_;
            }
            params["max_iterations"] = solver_options_.max_iterations;
            params["tolerance"] = solver_options_.tolerance;
            params["sqp_max_iterations"] = sqp_options_.max_iterations;
            return params;
        }

        void MeanVarianceOptimizer::set_target_return(double target_return)
        {
            if (!std::isfinite(target_return))
            {
                throw std::invalid_argument("Target return must be finite");
            }
            target_return_ = target_return;
            target_return_set_ = true;
        }

        OptimizationResult MeanVarianceOptimizer::optimize(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints,
            const Eigen::VectorXd &initial_weights) const
        {
            validate_inputs(expected_returns, covariance);
            constraints.validate();

            const Eigen::Index n = expected_returns.size();
            if (!constraints.is_feasible(n))
            {
                throw std::invalid_argument(
                    "Weight bounds [" + std::to_string(constraints.min_weight) + ", " +
                    std::to_string(constraints.max_weight) + "] cannot sum to one over " +
                    std::to_string(n) + " assets");
            }

            Eigen::VectorXd start;
            if (initial_weights.size() == 0)
            {
                start = Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n));
            }
            else
            {
                if (initial_weights.size() != n)
                {
                    throw std::invalid_argument(
                        "initial_weights size (" + std::to_string(initial_weights.size()) +
                        ") does not match number of assets (" + std::to_string(n) + ")");
                }
                if (!check_constraints(initial_weights, constraints))
                {
                    throw std::invalid_argument("initial_weights violate the constraints");
                }
                start = initial_weights;
            }

            switch (objective_)
            {
            case ObjectiveType::MIN_VARIANCE:
                return optimize_min_variance(expected_returns, covariance, constraints, start);

            case ObjectiveType::MAX_SHARPE:
                return optimize_max_sharpe(expected_returns, covariance, constraints, start);

            case ObjectiveType::TARGET_RETURN:
                return optimize_target_return(expected_returns, covariance, constraints, start);
            }

            throw std::runtime_error("Unknown objective type");
        }

        OptimizationResult MeanVarianceOptimizer::optimize_min_variance(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints,
            const Eigen::VectorXd &start) const
        {
            const Eigen::Index n = covariance.rows();

            // PSD with a zero diagonal means Sigma == 0: every feasible point is optimal
            if (covariance.diagonal().maxCoeff() <= 0.0)
            {
                OptimizationResult result = calculate_statistics(start, expected_returns, covariance,
                                                                 risk_free_rate_);
                result.success = true;
                result.message = "Zero covariance: starting point is optimal";
                return result;
            }

            LinearConstraints linear = constraints.to_linear_constraints(n);
            SolverResult solver_result = solve_variance_qp(covariance, linear, start, solver_options_);

            if (!solver_result.success)
            {
                return fallback_result(start, expected_returns, covariance,
                                       "Minimum variance solve failed: " + solver_result.message,
                                       solver_result.iterations);
            }

            Eigen::VectorXd weights = linear.clip_to_bounds(solver_result.solution);
            if (!check_constraints(weights, constraints, CONSTRAINT_TOLERANCE))
            {
                return fallback_result(start, expected_returns, covariance,
                                       "Minimum variance solution violates constraints",
                                       solver_result.iterations);
            }

            std::string message = solver_result.message;
            if (portfolio_variance(weights, covariance) > portfolio_variance(start, covariance))
            {
                weights = start;
                message += " (starting point retained)";
            }

            OptimizationResult result = calculate_statistics(weights, expected_returns, covariance,
                                                             risk_free_rate_);
            result.success = true;
            result.message = message;
            result.iterations = solver_result.iterations;
            return result;
        }

        OptimizationResult MeanVarianceOptimizer::optimize_max_sharpe(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints,
            const Eigen::VectorXd &start) const
        {
            const Eigen::Index n = expected_returns.size();

            NegativeSharpeObjective objective(expected_returns, covariance, risk_free_rate_);
            LinearConstraints linear = constraints.to_linear_constraints(n);

            SqpSolver solver(sqp_options_);
            SolverResult solver_result = solver.solve(objective, linear, start);

            Eigen::VectorXd weights = (solver_result.solution.size() == n) ? solver_result.solution : start;
            if (!check_constraints(weights, constraints, CONSTRAINT_TOLERANCE))
            {
                return fallback_result(start, expected_returns, covariance,
                                       "Maximum Sharpe iterate violates constraints",
                                       solver_result.iterations);
            }

            const double start_value = objective.value(start);
            if (objective.is_admissible(start_value) && objective.value(weights) > start_value)
            {
                weights = start;
            }

            OptimizationResult result = calculate_statistics(weights, expected_returns, covariance,
                                                             risk_free_rate_);
            result.success = solver_result.success;
            result.iterations = solver_result.iterations;
            result.objective_value = objective.value(weights);
            if (solver_result.success)
            {
                result.message = solver_result.message;
            }
            else
            {
                result.message = "Maximum Sharpe did not converge (" + solver_result.message +
                                 "); returning last feasible iterate";
            }
            return result;
        }

        OptimizationResult MeanVarianceOptimizer::optimize_target_return(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints,
            const Eigen::VectorXd &start) const
        {
            if (!target_return_set_)
            {
                throw std::invalid_argument("Target return must be set for TARGET_RETURN objective");
            }

            const Eigen::Index n = expected_returns.size();
            LinearConstraints linear = constraints.to_linear_constraints(n);

            // Return row scaled to unit magnitude, appended below the budget row
            double scale = expected_returns.cwiseAbs().maxCoeff();
            if (!(scale > 0.0))
            {
                scale = 1.0;
            }
            const Eigen::Index n_eq = linear.A_eq.rows();
            Eigen::MatrixXd A_eq(n_eq + 1, n);
            Eigen::VectorXd b_eq(n_eq + 1);
            if (n_eq > 0)
            {
                A_eq.topRows(n_eq) = linear.A_eq;
                b_eq.head(n_eq) = linear.b_eq;
            }
            A_eq.row(n_eq) = expected_returns.transpose() / scale;
            b_eq(n_eq) = target_return_ / scale;
            linear.A_eq = A_eq;
            linear.b_eq = b_eq;

            SolverResult solver_result = solve_variance_qp(covariance, linear, start, solver_options_);
            if (!solver_result.success)
            {
                return fallback_result(start, expected_returns, covariance,
                                       "Target return solve failed: " + solver_result.message,
                                       solver_result.iterations);
            }

            Eigen::VectorXd weights = linear.clip_to_bounds(solver_result.solution);
            if (!check_constraints(weights, constraints, CONSTRAINT_TOLERANCE) ||
                std::abs(weights.dot(expected_returns) - target_return_) > CONSTRAINT_TOLERANCE)
            {
                return fallback_result(start, expected_returns, covariance,
                                       "Target return solution violates constraints",
                                       solver_result.iterations);
            }

            OptimizationResult result = calculate_statistics(weights, expected_returns, covariance,
                                                             risk_free_rate_);
            result.success = true;
            result.message = solver_result.message;
            result.iterations = solver_result.iterations;
            return result;
        }

        OptimizationResult MeanVarianceOptimizer::fallback_result(
            const Eigen::VectorXd &start,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const std::string &reason,
            int iterations) const
        {
            OptimizationResult result = calculate_statistics(start, expected_returns, covariance,
                                                             risk_free_rate_);
            result.success = false;
            result.message = reason + "; returning starting point";
            result.iterations = iterations;
            return result;
        }

    } // namespace optimizer
} // namespace folio
