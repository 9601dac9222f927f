/**
 * @file risk_model.cpp
 * @brief Implementation of RiskModel base class utilities
 */

#include "folio/risk/risk_model.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace folio
{
    namespace risk
    {
        Eigen::MatrixXd RiskModel::estimate_correlation(const Eigen::MatrixXd &returns)
            const
        {
            Eigen::MatrixXd covariance = estimate_covariance(returns);
            return covariance_to_correlation(covariance);
        }

        void RiskModel::validate_returns(const Eigen::MatrixXd &returns)
        {
            if (returns.rows() == 0 || returns.cols() == 0)
            {
                throw std::invalid_argument("Returns matrix cannot be empty.");
            }

            if (!returns.allFinite())
            {
                throw std::invalid_argument("Returns matrix contains NaN or Inf values.");
            }
        }

        Eigen::MatrixXd RiskModel::covariance_to_correlation(const Eigen::MatrixXd &covariance)
        {
            const Eigen::Index n = covariance.rows();

            if (n == 0 || covariance.cols() != n)
            {
                throw std::invalid_argument("Covariance matrix must be square and non-empty");
            }

            const double nan = std::numeric_limits<double>::quiet_NaN();
            Eigen::VectorXd std_devs = covariance.diagonal().array().sqrt();

            // corr(i,j) = cov(i,j) / (std(i) * std(j)), undefined for flat series
            Eigen::MatrixXd correlation(n, n);

            for (Eigen::Index i = 0; i < n; ++i)
            {
                for (Eigen::Index j = 0; j < n; ++j)
                {
                    if (!(std_devs(i) > 0.0) || !(std_devs(j) > 0.0))
                    {
                        correlation(i, j) = nan;
                    }
                    else if (i == j)
                    {
                        correlation(i, j) = 1.0;
                    }
                    else
                    {
                        // Clamp to [-1, 1] to absorb rounding
                        double value = covariance(i, j) / (std_devs(i) * std_devs(j));
                        correlation(i, j) = std::max(-1.0, std::min(1.0, value));
                    }
                }
            }

            return correlation;
        }

        Eigen::MatrixXd RiskModel::ensure_symmetric(const Eigen::MatrixXd &matrix)
        {
            return 0.5 * (matrix + matrix.transpose());
        }
    } // namespace risk
} // namespace folio
