/**
 * @file objective_function.hpp
 * @brief Smooth portfolio objectives for the nonlinear solver
 *
 * Each objective supplies its value and analytic gradient with respect to
 * the weight vector. Objectives hold copies of their inputs and are
 * immutable after construction.
 */

#ifndef FOLIO_OPTIMIZER_OBJECTIVE_FUNCTION_HPP
#define FOLIO_OPTIMIZER_OBJECTIVE_FUNCTION_HPP

#include <Eigen/Dense>
#include <limits>
#include <string>

namespace folio
{
    namespace optimizer
    {

        /**
         * @class ObjectiveFunction
         * @brief Abstract differentiable objective f(w)
         */
        class ObjectiveFunction
        {
        public:
            virtual ~ObjectiveFunction() = default;

            /**
             * @brief Objective value at w
             */
            virtual double value(const Eigen::VectorXd &weights) const = 0;

            /**
             * @brief Gradient of the objective at w
             */
            virtual Eigen::VectorXd gradient(const Eigen::VectorXd &weights) const = 0;

            virtual std::string get_name() const = 0;

            /**
             * @brief True if f(w) is a usable value (finite and not a penalty)
             */
            virtual bool is_admissible(double value) const;
        };

        /**
         * @class PortfolioVolatilityObjective
         * @brief f(w) = sqrt(w' Sigma w)
         */
        class PortfolioVolatilityObjective : public ObjectiveFunction
        {
        public:
            explicit PortfolioVolatilityObjective(const Eigen::MatrixXd &covariance);

            double value(const Eigen::VectorXd &weights) const override;

            /**
             * @brief Sigma w / sqrt(w' Sigma w); zero where volatility is zero
             */
            Eigen::VectorXd gradient(const Eigen::VectorXd &weights) const override;

            std::string get_name() const override { return "PortfolioVolatility"; }

        private:
            Eigen::MatrixXd covariance_;
        };

        /**
         * @class NegativeSharpeObjective
         * @brief f(w) = -(mu.w - rf) / sqrt(w' Sigma w)
         *
         * A candidate with exactly zero volatility evaluates to
         * PENALTY, the largest representable double, so the solver treats it
         * as the worst admissible point instead of dividing by zero.
         */
        class NegativeSharpeObjective : public ObjectiveFunction
        {
        public:
            static constexpr double PENALTY = std::numeric_limits<double>::max();

            /**
             * @param expected_returns Per-period mean returns (N)
             * @param covariance Per-period covariance (N x N)
             * @param risk_free_rate Risk-free rate in the same period units
             */
            NegativeSharpeObjective(const Eigen::VectorXd &expected_returns,
                                    const Eigen::MatrixXd &covariance,
                                    double risk_free_rate);

            double value(const Eigen::VectorXd &weights) const override;

            /**
             * @brief -(mu / s - (mu.w - rf) Sigma w / s^3) with s = volatility
             */
            Eigen::VectorXd gradient(const Eigen::VectorXd &weights) const override;

            std::string get_name() const override { return "NegativeSharpe"; }

            bool is_admissible(double value) const override;

        private:
            Eigen::VectorXd expected_returns_;
            Eigen::MatrixXd covariance_;
            double risk_free_rate_;
        };

    } // namespace optimizer
} // namespace folio

#endif // FOLIO_OPTIMIZER_OBJECTIVE_FUNCTION_HPP
