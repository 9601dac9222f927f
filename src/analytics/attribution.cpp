/**
 * @file attribution.cpp
 * @brief Implementation of per-asset attribution.
 */

#include "folio/analytics/attribution.hpp"
#include "folio/analytics/portfolio_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace folio
{
    namespace analytics
    {

        Attribution::Attribution(const Eigen::VectorXd &weights,
                                 const AssetStatistics &stats,
                                 double risk_free_rate,
                                 int trading_days_per_year)
            : weights_(weights), stats_(stats), risk_free_rate_(risk_free_rate), trading_days_per_year_(trading_days_per_year)
        {
            if (weights_.size() != stats_.means.size() || stats_.covariance.rows() != weights_.size())
            {
                throw std::invalid_argument(
                    "Attribution weights size (" + std::to_string(weights_.size()) +
                    ") does not match number of assets (" + std::to_string(stats_.means.size()) + ")");
            }
            if (trading_days_per_year_ <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " +
                    std::to_string(trading_days_per_year_));
            }
        }

        Eigen::VectorXd Attribution::return_contributions() const
        {
            return stats_.means.cwiseProduct(weights_) * static_cast<double>(trading_days_per_year_);
        }

        Eigen::VectorXd Attribution::variance_contributions() const
        {
            const Eigen::Index n = weights_.size();
            double vol = portfolio_volatility(weights_, stats_.covariance);
            if (vol == 0.0)
            {
                return Eigen::VectorXd::Zero(n);
            }

            double variance = vol * vol;
            Eigen::VectorXd marginal = stats_.covariance * weights_;
            return (marginal / variance).cwiseProduct(weights_) * static_cast<double>(trading_days_per_year_);
        }

        std::vector<std::optional<double>> Attribution::asset_sharpes() const
        {
            const double days = static_cast<double>(trading_days_per_year_);
            std::vector<std::optional<double>> sharpes;
            sharpes.reserve(weights_.size());

            for (Eigen::Index i = 0; i < stats_.means.size(); ++i)
            {
                sharpes.push_back(sharpe_ratio(stats_.means(i) * days,
                                               stats_.volatilities(i) * std::sqrt(days),
                                               risk_free_rate_));
            }
            return sharpes;
        }

        std::vector<CorrelationPair> Attribution::top_correlations(
            const std::vector<std::string> &tickers,
            const Eigen::MatrixXd &correlation,
            int count)
        {
            const Eigen::Index n = static_cast<Eigen::Index>(tickers.size());
            if (correlation.rows() != n || correlation.cols() != n)
            {
                throw std::invalid_argument(
                    "Correlation matrix size does not match number of tickers (" + std::to_string(n) + ")");
            }

            std::vector<CorrelationPair> pairs;
            for (Eigen::Index i = 0; i < n; ++i)
            {
                for (Eigen::Index j = i + 1; j < n; ++j)
                {
                    if (std::isfinite(correlation(i, j)))
                    {
                        pairs.push_back({tickers[i], tickers[j], correlation(i, j)});
                    }
                }
            }

            std::stable_sort(pairs.begin(), pairs.end(),
                             [](const CorrelationPair &a, const CorrelationPair &b)
                             { return std::abs(a.correlation) > std::abs(b.correlation); });

            if (count >= 0 && pairs.size() > static_cast<size_t>(count))
            {
                pairs.resize(static_cast<size_t>(count));
            }
            return pairs;
        }

    } // namespace analytics
} // namespace folio
