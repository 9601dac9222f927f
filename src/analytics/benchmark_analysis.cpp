/**
 * @file benchmark_analysis.cpp
 * @brief Implementation of the BenchmarkAnalysis class.
 */

#include "folio/analytics/benchmark_analysis.hpp"
#include "folio/analytics/asset_statistics.hpp"

#include <cmath>

namespace folio
{
    namespace analytics
    {

        BenchmarkAnalysis::BenchmarkAnalysis(const std::vector<double> &portfolio_returns,
                                             const std::vector<double> &benchmark_returns)
            : portfolio_returns_(portfolio_returns), benchmark_returns_(benchmark_returns)
        {
        }

        std::optional<double> BenchmarkAnalysis::beta() const
        {
            if (num_observations() < 2)
            {
                return std::nullopt;
            }

            double variance = sample_covariance(benchmark_returns_, benchmark_returns_);
            if (variance == 0.0 || !std::isfinite(variance))
            {
                return std::nullopt;
            }

            return sample_covariance(portfolio_returns_, benchmark_returns_) / variance;
        }

        int BenchmarkAnalysis::num_observations() const
        {
            if (portfolio_returns_.size() != benchmark_returns_.size())
            {
                return 0;
            }
            return static_cast<int>(portfolio_returns_.size());
        }

    } // namespace analytics
} // namespace folio
