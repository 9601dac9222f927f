/**
 * @file efficient_frontier.cpp
 * @brief Implementation of efficient frontier computation
 */

#include "folio/optimizer/efficient_frontier.hpp"

#include <stdexcept>
#include <string>

namespace folio
{
    namespace optimizer
    {

        // ============================================================================
        // EfficientFrontier Implementation
        // ============================================================================

        EfficientFrontier::EfficientFrontier()
            : num_points_(DEFAULT_NUM_POINTS)
        {
        }

        void EfficientFrontier::set_num_points(int num_points)
        {
            if (num_points < 2)
            {
                throw std::invalid_argument(
                    "Number of points must be at least 2, got: " + std::to_string(num_points));
            }
            num_points_ = num_points;
        }

        std::vector<double> EfficientFrontier::target_returns(const Eigen::VectorXd &expected_returns,
                                                              int num_points)
        {
            if (expected_returns.size() == 0)
            {
                throw std::invalid_argument("Expected returns vector is empty");
            }
            if (num_points < 2)
            {
                throw std::invalid_argument(
                    "Number of points must be at least 2, got: " + std::to_string(num_points));
            }

            const double min_ret = expected_returns.minCoeff();
            const double max_ret = expected_returns.maxCoeff();
            const double step = (max_ret - min_ret) / static_cast<double>(num_points - 1);

            std::vector<double> targets;
            targets.reserve(static_cast<size_t>(num_points));
            for (int i = 0; i < num_points - 1; ++i)
            {
                targets.push_back(min_ret + i * step);
            }
            targets.push_back(max_ret);
            return targets;
        }

        EfficientFrontierResult EfficientFrontier::compute(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints,
            double risk_free_rate) const
        {
            OptimizerInterface::validate_inputs(expected_returns, covariance);
            constraints.validate();

            EfficientFrontierResult result;
            std::vector<double> targets = target_returns(expected_returns, num_points_);
            result.num_targets = static_cast<int>(targets.size());

            MeanVarianceOptimizer optimizer(ObjectiveType::TARGET_RETURN, risk_free_rate);
            optimizer.set_solver_options(solver_options_);

            for (double target : targets)
            {
                optimizer.set_target_return(target);
                OptimizationResult solved = optimizer.optimize(expected_returns, covariance, constraints);

                // Fallback results are flagged unsuccessful and never enter the frontier
                if (!solved.success || !solved.is_valid())
                {
                    continue;
                }

                FrontierPoint point;
                point.target_return = target;
                point.volatility = solved.volatility;
                point.sharpe_ratio = solved.sharpe_ratio;
                point.weights = solved.weights;
                result.points.push_back(point);
            }

            result.success = !result.points.empty();
            result.message = std::to_string(result.points.size()) + " of " +
                             std::to_string(result.num_targets) + " frontier points converged";
            return result;
        }

    } // namespace optimizer
} // namespace folio
