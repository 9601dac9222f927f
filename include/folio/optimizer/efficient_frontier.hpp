/**
 * @file efficient_frontier.hpp
 * @brief Efficient frontier computation for portfolio optimization
 *
 * Traces the Markowitz frontier by solving, for each target return
 * r_target evenly spaced from min(mu) to max(mu) inclusive:
 *
 *     Minimize:   w^T * Sigma * w
 *     Subject to: mu^T * w = r_target
 *                 sum(w) = 1
 *                 w_min <= w <= w_max
 *
 * Targets whose solve does not converge, or whose solution violates the
 * constraints beyond tolerance, are dropped. The surviving points keep
 * the order of increasing target return.
 */

#ifndef FOLIO_OPTIMIZER_EFFICIENT_FRONTIER_HPP
#define FOLIO_OPTIMIZER_EFFICIENT_FRONTIER_HPP

#include "folio/optimizer/mean_variance_optimizer.hpp"
#include "folio/optimizer/optimizer_interface.hpp"

#include <optional>
#include <string>
#include <vector>

namespace folio
{
    namespace optimizer
    {

        /**
         * @struct FrontierPoint
         * @brief Single converged point on the efficient frontier
         */
        struct FrontierPoint
        {
            double target_return = 0.0;         ///< Return the solve was constrained to
            double volatility = 0.0;            ///< Resulting portfolio volatility
            std::optional<double> sharpe_ratio; ///< Absent when volatility is zero
            Eigen::VectorXd weights;            ///< Portfolio weights
        };

        /**
         * @struct EfficientFrontierResult
         * @brief Complete efficient frontier data
         */
        struct EfficientFrontierResult
        {
            std::vector<FrontierPoint> points; ///< Converged points by increasing target
            int num_targets = 0;               ///< Number of targets attempted
            bool success = false;              ///< At least one point converged
            std::string message;               ///< Status message
        };

        /**
         * @class EfficientFrontier
         * @brief Computes the efficient frontier by target-return sweeps
         *
         * Usage Example:
         * @code
         * EfficientFrontier frontier;
         * frontier.set_num_points(20);
         *
         * auto result = frontier.compute(mu, covariance, OptimizationConstraints(), 0.04 / 252);
         * for (const auto& point : result.points) {
         *     std::cout << point.target_return << " " << point.volatility << "\n";
         * }
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class EfficientFrontier
        {
        public:
            static constexpr int DEFAULT_NUM_POINTS = 20;

            EfficientFrontier();

            /**
             * @brief Compute efficient frontier
             * @param expected_returns Expected returns for each asset (per period)
             * @param covariance Covariance matrix (per period)
             * @param constraints Portfolio constraints
             * @param risk_free_rate Risk-free rate per period, for Sharpe
             * @return Frontier result; never throws on solver failure
             * @throws std::invalid_argument if inputs are invalid
             */
            EfficientFrontierResult compute(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints,
                double risk_free_rate = 0.0) const;

            /**
             * @brief num_points targets evenly spaced over [min(mu), max(mu)]
             */
            static std::vector<double> target_returns(const Eigen::VectorXd &expected_returns,
                                                      int num_points);

            /**
             * @brief Set number of points on frontier
             * @throws std::invalid_argument if num_points < 2
             */
            void set_num_points(int num_points);

            void set_solver_options(const SolverOptions &options) { solver_options_ = options; }

            int get_num_points() const { return num_points_; }

            const SolverOptions &get_solver_options() const { return solver_options_; }

        private:
            int num_points_;
            SolverOptions solver_options_;
        };

    } // namespace optimizer
} // namespace folio

#endif // FOLIO_OPTIMIZER_EFFICIENT_FRONTIER_HPP
