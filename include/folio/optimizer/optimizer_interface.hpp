/**
 * @file optimizer_interface.hpp
 * @brief Optimizer base class with its constraint and result types
 *
 * Expected returns, covariance and result statistics are daily. The report
 * layer annualizes them.
 */

#ifndef FOLIO_OPTIMIZER_OPTIMIZER_INTERFACE_HPP
#define FOLIO_OPTIMIZER_OPTIMIZER_INTERFACE_HPP

#include "folio/optimizer/quadratic_problem.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace folio
{
    namespace optimizer
    {

        /**
         * @struct OptimizationConstraints
         * @brief Box and budget constraints on portfolio weights
         */
        struct OptimizationConstraints
        {
            double min_weight = 0.0; ///< Minimum asset weight
            double max_weight = 1.0; ///< Maximum asset weight
            bool sum_to_one = true;  ///< Weights sum to 1

            /// @throws std::invalid_argument on non-finite, negative or crossed bounds
            void validate() const;

            /**
             * @brief Check that the budget can be met by N assets within the box
             */
            bool is_feasible(Eigen::Index num_assets) const;

            /**
             * @brief Express as equality and box constraints for N assets
             */
            LinearConstraints to_linear_constraints(Eigen::Index num_assets) const;

            /// Reads min_weight, max_weight and sum_to_one; absent keys keep defaults
            static OptimizationConstraints from_json(const nlohmann::json &j);
        };

        /**
         * @struct OptimizationResult
         * @brief Weights returned by an optimizer and their daily statistics
         *
         * When the solver fails the weights are the starting point, success is
         * false and the statistics describe that starting point.
         */
        struct OptimizationResult
        {
            Eigen::VectorXd weights;            ///< Portfolio weights
            double expected_return;             ///< Portfolio expected return (per period)
            double volatility;                  ///< Portfolio volatility (per period)
            std::optional<double> sharpe_ratio; ///< Absent when volatility is zero
            bool success;                       ///< Solver converged
            std::string message;                ///< Status message
            int iterations;                     ///< Number of solver iterations
            double objective_value;             ///< Final objective value

            OptimizationResult();

            /// Non-empty, finite weights with a non-negative volatility
            bool is_valid() const;
        };

        /**
         * @class OptimizerInterface
         * @brief Common entry point of the mean-variance objectives
         *
         * @code
         * auto optimizer = std::make_unique<MeanVarianceOptimizer>(ObjectiveType::MIN_VARIANCE);
         * auto result = optimizer->optimize(mu, covariance, constraints);
         * if (!result.success) std::cerr << result.message << "\n";
         * @endcode
         */
        class OptimizerInterface
        {
        public:
            virtual ~OptimizerInterface() = default;

            /**
             * @param expected_returns Daily mean return per asset
             * @param covariance Daily covariance, N x N
             * @param initial_weights Starting point; empty selects 1/N
             * @throws std::invalid_argument on malformed inputs or infeasible bounds
             */
            virtual OptimizationResult optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints,
                const Eigen::VectorXd &initial_weights = Eigen::VectorXd()) const = 0;

            virtual std::string get_name() const = 0;

            /// Objective, risk-free rate and target return as JSON
            virtual nlohmann::json get_parameters() const = 0;

            /**
             * @throws std::invalid_argument on a size mismatch, NaN or Inf, or a
             *         covariance that is asymmetric or has a negative eigenvalue
             */
            static void validate_inputs(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance);

            /// Bounds and budget hold to within tolerance
            static bool check_constraints(
                const Eigen::VectorXd &weights,
                const OptimizationConstraints &constraints,
                double tolerance = 1e-6);

            /// Daily return, volatility and Sharpe ratio of the given weights
            static OptimizationResult calculate_statistics(
                const Eigen::VectorXd &weights,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                double risk_free_rate = 0.0);
        };

    } // namespace optimizer
} // namespace folio

#endif // FOLIO_OPTIMIZER_OPTIMIZER_INTERFACE_HPP
