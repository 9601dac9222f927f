/**
 * @file asset_statistics.hpp
 * @brief Per-asset return statistics and series helpers.
 *
 * All dispersion statistics use the sample (n-1) convention so that the
 * per-asset volatilities equal the square roots of the covariance
 * diagonal. Undefined statistics (fewer than two observations) are NaN.
 */

#ifndef FOLIO_ANALYTICS_ASSET_STATISTICS_HPP
#define FOLIO_ANALYTICS_ASSET_STATISTICS_HPP

#include "folio/risk/risk_model.hpp"

#include <Eigen/Dense>
#include <vector>

namespace folio
{
    namespace analytics
    {

        /**
         * @struct AssetStatistics
         * @brief Daily mean, volatility, covariance and correlation per asset.
         */
        struct AssetStatistics
        {
            Eigen::VectorXd means;        ///< Daily mean return per asset
            Eigen::VectorXd volatilities; ///< Daily sample standard deviation per asset
            Eigen::MatrixXd covariance;   ///< Daily sample covariance (N x N)
            Eigen::MatrixXd correlation;  ///< Correlation (N x N), NaN for flat assets

            /**
             * @brief Compute all statistics from a return matrix.
             * @param returns Daily returns (dates x assets).
             * @param model Covariance estimator.
             * @throws std::invalid_argument if returns is empty or non-finite.
             */
            static AssetStatistics compute(const Eigen::MatrixXd &returns,
                                           const risk::RiskModel &model);

            /**
             * @brief True when means and covariance contain no NaN/Inf.
             */
            bool is_finite() const;
        };

        // ---------------------------------------------------------------
        // Series helpers
        // ---------------------------------------------------------------

        /**
         * @brief Arithmetic mean; NaN for an empty series.
         */
        double series_mean(const std::vector<double> &values);

        /**
         * @brief Sample standard deviation (n-1).
         * @return NaN for fewer than two values, exactly 0 for a flat series.
         */
        double sample_std(const std::vector<double> &values);

        /**
         * @brief Sample covariance (n-1) of two equally long series.
         * @return NaN for fewer than two values or mismatched lengths,
         *         exactly 0 when either series is flat.
         */
        double sample_covariance(const std::vector<double> &x, const std::vector<double> &y);

        /**
         * @brief Convert an Eigen vector to std::vector.
         */
        std::vector<double> to_std_vector(const Eigen::VectorXd &values);

    } // namespace analytics
} // namespace folio

#endif // FOLIO_ANALYTICS_ASSET_STATISTICS_HPP
