/**
 * @file sample_covariance.hpp
 * @brief Sample covariance of daily asset returns
 *
 *     Sigma = (X - 1 * mean(X))^T (X - 1 * mean(X)) / (T - 1)
 *
 * With T = 1 the (T - 1) normalization is undefined and every entry of the
 * result is NaN.
 */

#ifndef FOLIO_RISK_SAMPLE_COVARIANCE_HPP
#define FOLIO_RISK_SAMPLE_COVARIANCE_HPP

#include "folio/risk/risk_model.hpp"

namespace folio
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Equal-weighted covariance estimator used for every statistic
         *        in the analytics report
         *
         * A column whose returns are all identical gets exactly zero
         * variance and covariance, independent of rounding in the mean.
         */
        class SampleCovariance : public RiskModel
        {
        public:
            /**
             * @param bias_correction Divide by T - 1 (default) instead of T
             */
            explicit SampleCovariance(bool bias_correction = true);

            ~SampleCovariance() override = default;

            Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const override;

            std::string get_name() const override;

            bool uses_bias_correction() const { return bias_correction_; }

        private:
            bool bias_correction_;
        };

    } // namespace risk
} // namespace folio

#endif // FOLIO_RISK_SAMPLE_COVARIANCE_HPP
