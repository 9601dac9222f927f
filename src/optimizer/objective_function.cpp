/**
 * @file objective_function.cpp
 * @brief Implementation of portfolio objectives
 */

#include "folio/optimizer/objective_function.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace folio
{
    namespace optimizer
    {

        namespace
        {
            double volatility_of(const Eigen::VectorXd &weights, const Eigen::MatrixXd &covariance)
            {
                return std::sqrt(std::max(0.0, weights.dot(covariance * weights)));
            }
        } // anonymous namespace

        bool ObjectiveFunction::is_admissible(double value) const
        {
            return std::isfinite(value);
        }

        // ============================================================================
        // PortfolioVolatilityObjective
        // ============================================================================

        PortfolioVolatilityObjective::PortfolioVolatilityObjective(const Eigen::MatrixXd &covariance)
            : covariance_(covariance)
        {
            if (covariance_.rows() != covariance_.cols())
            {
                throw std::invalid_argument("Covariance matrix must be square");
            }
        }

        double PortfolioVolatilityObjective::value(const Eigen::VectorXd &weights) const
        {
            return volatility_of(weights, covariance_);
        }

        Eigen::VectorXd PortfolioVolatilityObjective::gradient(const Eigen::VectorXd &weights) const
        {
            double vol = volatility_of(weights, covariance_);
            if (vol == 0.0)
            {
                return Eigen::VectorXd::Zero(weights.size());
            }
            return covariance_ * weights / vol;
        }

        // ============================================================================
        // NegativeSharpeObjective
        // ============================================================================

        NegativeSharpeObjective::NegativeSharpeObjective(const Eigen::VectorXd &expected_returns,
                                                         const Eigen::MatrixXd &covariance,
                                                         double risk_free_rate)
            : expected_returns_(expected_returns), covariance_(covariance), risk_free_rate_(risk_free_rate)
        {
            if (covariance_.rows() != expected_returns_.size() || covariance_.cols() != expected_returns_.size())
            {
                throw std::invalid_argument(
                    "Dimension mismatch: expected returns size (" + std::to_string(expected_returns_.size()) +
                    ") does not match covariance dimensions");
            }
        }

        double NegativeSharpeObjective::value(const Eigen::VectorXd &weights) const
        {
            double vol = volatility_of(weights, covariance_);
            if (vol == 0.0)
            {
                return PENALTY;
            }
            return -(weights.dot(expected_returns_) - risk_free_rate_) / vol;
        }

        Eigen::VectorXd NegativeSharpeObjective::gradient(const Eigen::VectorXd &weights) const
        {
            double vol = volatility_of(weights, covariance_);
            if (vol == 0.0)
            {
                return Eigen::VectorXd::Zero(weights.size());
            }
            double excess = weights.dot(expected_returns_) - risk_free_rate_;
            Eigen::VectorXd sigma_w = covariance_ * weights;
            return -(expected_returns_ / vol - excess * sigma_w / (vol * vol * vol));
        }

        bool NegativeSharpeObjective::is_admissible(double value) const
        {
            return std::isfinite(value) && value < PENALTY;
        }

    } // namespace optimizer
} // namespace folio
