/**
 * @file asset_statistics.cpp
 * @brief Implementation of per-asset statistics and series helpers.
 */

#include "folio/analytics/asset_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace folio
{
    namespace analytics
    {

        namespace
        {
            bool is_flat(const std::vector<double> &values)
            {
                return std::all_of(values.begin(), values.end(),
                                   [&values](double v)
                                   { return v == values.front(); });
            }
        } // anonymous namespace

        AssetStatistics AssetStatistics::compute(const Eigen::MatrixXd &returns,
                                                 const risk::RiskModel &model)
        {
            AssetStatistics stats;
            stats.covariance = model.estimate_covariance(returns);
            stats.correlation = risk::RiskModel::covariance_to_correlation(stats.covariance);
            stats.means = returns.colwise().mean().transpose();

            // NaN variances stay NaN through sqrt
            stats.volatilities = stats.covariance.diagonal().array().max(0.0).sqrt();
            for (Eigen::Index i = 0; i < stats.covariance.rows(); ++i)
            {
                if (std::isnan(stats.covariance(i, i)))
                {
                    stats.volatilities(i) = std::numeric_limits<double>::quiet_NaN();
                }
            }

            return stats;
        }

        bool AssetStatistics::is_finite() const
        {
            return means.allFinite() && covariance.allFinite();
        }

        double series_mean(const std::vector<double> &values)
        {
            if (values.empty())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            double sum = 0.0;
            for (double v : values)
            {
                sum += v;
            }
            return sum / static_cast<double>(values.size());
        }

        double sample_std(const std::vector<double> &values)
        {
            if (values.size() < 2)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            if (is_flat(values))
            {
                return 0.0;
            }

            double mean = series_mean(values);
            double sum_sq = 0.0;
            for (double v : values)
            {
                double diff = v - mean;
                sum_sq += diff * diff;
            }
            return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
        }

        double sample_covariance(const std::vector<double> &x, const std::vector<double> &y)
        {
            if (x.size() != y.size() || x.size() < 2)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            if (is_flat(x) || is_flat(y))
            {
                return 0.0;
            }

            double mean_x = series_mean(x);
            double mean_y = series_mean(y);
            double sum = 0.0;
            for (size_t i = 0; i < x.size(); ++i)
            {
                sum += (x[i] - mean_x) * (y[i] - mean_y);
            }
            return sum / static_cast<double>(x.size() - 1);
        }

        std::vector<double> to_std_vector(const Eigen::VectorXd &values)
        {
            return std::vector<double>(values.data(), values.data() + values.size());
        }

    } // namespace analytics
} // namespace folio
