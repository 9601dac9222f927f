/**
 * @file optimizer_interface.cpp
 * @brief Implementation of optimizer interface and common structures
 */

#include "folio/optimizer/optimizer_interface.hpp"
#include "folio/analytics/portfolio_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace folio
{
    namespace optimizer
    {

        // ============================================================================
        // OptimizationConstraints Implementation
        // ============================================================================

        void OptimizationConstraints::validate() const
        {
            if (!std::isfinite(min_weight) || !std::isfinite(max_weight))
            {
                throw std::invalid_argument("Weight bounds must be finite");
            }

            if (min_weight < 0.0)
            {
                throw std::invalid_argument(
                    "min_weight must be non-negative, got: " + std::to_string(min_weight));
            }

            if (max_weight <= 0.0)
            {
                throw std::invalid_argument(
                    "max_weight must be positive, got: " + std::to_string(max_weight));
            }

            if (min_weight > max_weight)
            {
                throw std::invalid_argument(
                    "min_weight (" + std::to_string(min_weight) +
                    ") cannot exceed max_weight (" + std::to_string(max_weight) + ")");
            }

            if (sum_to_one && min_weight > 1.0)
            {
                throw std::invalid_argument(
                    "Infeasible constraints: min_weight > 1.0 with sum_to_one constraint");
            }
        }

        bool OptimizationConstraints::is_feasible(Eigen::Index num_assets) const
        {
            if (num_assets <= 0)
            {
                return false;
            }
            if (!sum_to_one)
            {
                return true;
            }
            const double n = static_cast<double>(num_assets);
            return n * min_weight <= 1.0 + 1e-12 && n * max_weight >= 1.0 - 1e-12;
        }

        LinearConstraints OptimizationConstraints::to_linear_constraints(Eigen::Index num_assets) const
        {
            LinearConstraints linear;
            if (sum_to_one)
            {
                linear.A_eq = Eigen::MatrixXd::Ones(1, num_assets);
                linear.b_eq = Eigen::VectorXd::Ones(1);
            }
            linear.lower_bounds = Eigen::VectorXd::Constant(num_assets, min_weight);
            linear.upper_bounds = Eigen::VectorXd::Constant(num_assets, max_weight);
            return linear;
        }

        OptimizationConstraints OptimizationConstraints::from_json(const nlohmann::json &j)
        {
            OptimizationConstraints constraints;

            constraints.min_weight = j.value("min_weight", 0.0);
            constraints.max_weight = j.value("max_weight", 1.0);
            constraints.sum_to_one = j.value("sum_to_one", true);

            constraints.validate();
            return constraints;
        }

        // ============================================================================
        // OptimizationResult Implementation
        // ============================================================================

        OptimizationResult::OptimizationResult()
            : expected_return(0.0),
              volatility(0.0),
              success(false),
              iterations(0),
              objective_value(0.0)
        {
        }

        bool OptimizationResult::is_valid() const
        {
            if (weights.size() == 0)
                return false;
            if (!weights.allFinite())
                return false;
            if (!(volatility >= 0.0))
                return false;

            return true;
        }

        // ============================================================================
        // OptimizerInterface Static Helpers
        // ============================================================================

        void OptimizerInterface::validate_inputs(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance)
        {
            if (expected_returns.size() == 0)
            {
                throw std::invalid_argument("Expected returns vector is empty");
            }

            if (expected_returns.size() != covariance.rows() ||
                expected_returns.size() != covariance.cols())
            {
                throw std::invalid_argument(
                    "Dimension mismatch: expected returns size (" +
                    std::to_string(expected_returns.size()) +
                    ") does not match covariance dimensions (" +
                    std::to_string(covariance.rows()) + "x" +
                    std::to_string(covariance.cols()) + ")");
            }

            if (!expected_returns.allFinite())
            {
                throw std::invalid_argument("Expected returns contain NaN or Inf values");
            }

            if (!covariance.allFinite())
            {
                throw std::invalid_argument("Covariance matrix contains NaN or Inf values");
            }

            const double scale = std::max(1.0, covariance.cwiseAbs().maxCoeff());
            double asymmetry = (covariance - covariance.transpose()).cwiseAbs().maxCoeff();
            if (asymmetry > 1e-10 * scale)
            {
                throw std::invalid_argument(
                    "Covariance matrix is not symmetric (max asymmetry: " +
                    std::to_string(asymmetry) + ")");
            }

            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance, Eigen::EigenvaluesOnly);
            double min_eigenvalue = solver.eigenvalues().minCoeff();
            if (min_eigenvalue < -1e-10 * scale)
            {
                throw std::invalid_argument(
                    "Covariance matrix is not positive semi-definite (min eigenvalue: " +
                    std::to_string(min_eigenvalue) + ")");
            }
        }

        bool OptimizerInterface::check_constraints(
            const Eigen::VectorXd &weights,
            const OptimizationConstraints &constraints,
            double tolerance)
        {
            if (!weights.allFinite())
            {
                return false;
            }

            for (Eigen::Index i = 0; i < weights.size(); ++i)
            {
                if (weights(i) < constraints.min_weight - tolerance ||
                    weights(i) > constraints.max_weight + tolerance)
                {
                    return false;
                }
            }

            if (constraints.sum_to_one && std::abs(weights.sum() - 1.0) > tolerance)
            {
                return false;
            }

            return true;
        }

        OptimizationResult OptimizerInterface::calculate_statistics(
            const Eigen::VectorXd &weights,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            double risk_free_rate)
        {
            OptimizationResult result;
            result.weights = weights;
            result.expected_return = weights.dot(expected_returns);
            result.volatility = analytics::portfolio_volatility(weights, covariance);
            result.sharpe_ratio = analytics::sharpe_ratio(result.expected_return, result.volatility,
                                                          risk_free_rate);
            result.objective_value = result.volatility * result.volatility;
            return result;
        }

    } // namespace optimizer
} // namespace folio
