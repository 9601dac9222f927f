/**
 * @file mean_variance_optimizer.hpp
 * @brief Mean-variance portfolio optimizer (Markowitz)
 *
 * Supports three objectives under the constraints sum(w) = 1 and
 * w_min <= w_i <= w_max:
 * - Minimum variance:  minimize w^T Sigma w                  (QP, OSQP)
 * - Maximum Sharpe:    minimize -(mu^T w - rf) / sqrt(w^T Sigma w)  (SQP)
 * - Target return:     minimize w^T Sigma w s.t. mu^T w = target     (QP, OSQP)
 *
 * Every solve starts from the supplied initial weights, or equal weights
 * when none are given, and is bounded by an iteration cap.
 *
 * A solve that does not converge never throws: the result carries the last
 * feasible iterate (the starting point when the solver produced nothing
 * better), success = false and a message describing the failure.
 */

#ifndef FOLIO_OPTIMIZER_MEAN_VARIANCE_OPTIMIZER_HPP
#define FOLIO_OPTIMIZER_MEAN_VARIANCE_OPTIMIZER_HPP

#include "folio/optimizer/optimizer_interface.hpp"
#include "folio/optimizer/quadratic_problem.hpp"
#include "folio/optimizer/sqp_solver.hpp"

namespace folio
{
    namespace optimizer
    {

        /**
         * @enum ObjectiveType
         * @brief Type of optimization objective
         */
        enum class ObjectiveType
        {
            MIN_VARIANCE, ///< Minimize variance only
            MAX_SHARPE,   ///< Maximize Sharpe ratio
            TARGET_RETURN ///< Target return with min variance
        };

        /**
         * @brief Objective name as used in configuration and logs
         */
        std::string to_string(ObjectiveType objective);

        /**
         * @class MeanVarianceOptimizer
         * @brief Markowitz mean-variance portfolio optimizer
         *
         * Usage Example:
         * @code
         * MeanVarianceOptimizer optimizer(ObjectiveType::MAX_SHARPE, 0.04 / 252);
         *
         * OptimizationConstraints constraints;
         * auto result = optimizer.optimize(mu, covariance, constraints);
         * if (!result.success) {
         *     std::cerr << "Warning: " << result.message << "\n";
         * }
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class MeanVarianceOptimizer : public OptimizerInterface
        {
        public:
            /**
             * @brief Construct mean-variance optimizer
             * @param objective Optimization objective type
             * @param risk_free_rate Risk-free rate per period, used for Sharpe
             * @throws std::invalid_argument if risk_free_rate is not finite
             */
            explicit MeanVarianceOptimizer(
                ObjectiveType objective = ObjectiveType::MIN_VARIANCE,
                double risk_free_rate = 0.0);

            ~MeanVarianceOptimizer() override = default;

            OptimizationResult optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints,
                const Eigen::VectorXd &initial_weights = Eigen::VectorXd()) const override;

            std::string get_name() const override;

            nlohmann::json get_parameters() const override;

            /**
             * @brief Set target return for TARGET_RETURN
             */
            void set_target_return(double target_return);

            /**
             * @brief Options for the OSQP solves (min variance, target return)
             */
            void set_solver_options(const SolverOptions &options) { solver_options_ = options; }

            /**
             * @brief Options for the SQP solve (max Sharpe)
             */
            void set_sqp_options(const SqpOptions &options) { sqp_options_ = options; }

            double get_target_return() const { return target_return_; }

            ObjectiveType get_objective() const { return objective_; }

            double get_risk_free_rate() const { return risk_free_rate_; }

            const SolverOptions &get_solver_options() const { return solver_options_; }

            const SqpOptions &get_sqp_options() const { return sqp_options_; }

        private:
            ObjectiveType objective_;
            double risk_free_rate_;
            double target_return_;
            bool target_return_set_;
            SolverOptions solver_options_;
            SqpOptions sqp_options_;

            OptimizationResult optimize_min_variance(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints,
                const Eigen::VectorXd &start) const;

            OptimizationResult optimize_max_sharpe(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints,
                const Eigen::VectorXd &start) const;

            OptimizationResult optimize_target_return(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints,
                const Eigen::VectorXd &start) const;

            /**
             * @brief Result at the starting point, flagged as not converged
             */
            OptimizationResult fallback_result(
                const Eigen::VectorXd &start,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const std::string &reason,
                int iterations) const;
        };

    } // namespace optimizer
} // namespace folio

#endif // FOLIO_OPTIMIZER_MEAN_VARIANCE_OPTIMIZER_HPP
