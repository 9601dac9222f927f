/**
 * @file sample_covariance.cpp
 * @brief Implementation of sample covariance estimator
 */

#include "folio/risk/sample_covariance.hpp"

#include <limits>

namespace folio
{
    namespace risk
    {

        SampleCovariance::SampleCovariance(bool bias_correction) : bias_correction_(bias_correction)
        {
        }

        Eigen::MatrixXd SampleCovariance::estimate_covariance(const Eigen::MatrixXd &returns) const
        {
            validate_returns(returns);

            const Eigen::Index n_obs = returns.rows();
            const Eigen::Index n_assets = returns.cols();

            double normalization = bias_correction_
                                       ? static_cast<double>(n_obs - 1)
                                       : static_cast<double>(n_obs);

            // One observation under Bessel's correction: undefined, not an error
            if (normalization <= 0.0)
            {
                return Eigen::MatrixXd::Constant(n_assets, n_assets,
                                                 std::numeric_limits<double>::quiet_NaN());
            }

            Eigen::RowVectorXd means = returns.colwise().mean();
            Eigen::MatrixXd centered = returns.rowwise() - means;

            // A flat column has exactly zero variance, whatever the mean rounds to
            for (Eigen::Index j = 0; j < n_assets; ++j)
            {
                if ((returns.col(j).array() == returns(0, j)).all())
                {
                    centered.col(j).setZero();
                }
            }

            Eigen::MatrixXd covariance = (centered.transpose() * centered) / normalization;

            return ensure_symmetric(covariance);
        }

        std::string SampleCovariance::get_name() const
        {
            return "SampleCovariance";
        }

    } // namespace risk
} // namespace folio
