/**
 * @file portfolio_statistics.cpp
 * @brief Implementation of portfolio aggregation.
 */

#include "folio/analytics/portfolio_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace folio
{
    namespace analytics
    {

        PortfolioStatistics PortfolioStatistics::compute(const Eigen::VectorXd &weights,
                                                         const Eigen::VectorXd &means,
                                                         const Eigen::MatrixXd &covariance,
                                                         double risk_free_rate,
                                                         int trading_days_per_year)
        {
            if (weights.size() != means.size() || covariance.rows() != means.size() ||
                covariance.cols() != means.size())
            {
                throw std::invalid_argument(
                    "Dimension mismatch: weights " + std::to_string(weights.size()) +
                    ", means " + std::to_string(means.size()) +
                    ", covariance " + std::to_string(covariance.rows()) + "x" +
                    std::to_string(covariance.cols()));
            }
            if (trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " +
                    std::to_string(trading_days_per_year));
            }

            const double days = static_cast<double>(trading_days_per_year);

            PortfolioStatistics stats;
            stats.daily_return = weights.dot(means);
            stats.daily_volatility = portfolio_volatility(weights, covariance);
            stats.daily_sharpe = sharpe_ratio(stats.daily_return, stats.daily_volatility,
                                              risk_free_rate / days);

            stats.annual_return = stats.daily_return * days;
            stats.annual_volatility = stats.daily_volatility * std::sqrt(days);
            stats.annual_sharpe = sharpe_ratio(stats.annual_return, stats.annual_volatility,
                                               risk_free_rate);
            return stats;
        }

        double portfolio_volatility(const Eigen::VectorXd &weights,
                                    const Eigen::MatrixXd &covariance)
        {
            double variance = weights.dot(covariance * weights);
            if (std::isnan(variance))
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return std::sqrt(std::max(0.0, variance));
        }

        std::optional<double> sharpe_ratio(double ret, double vol, double risk_free)
        {
            if (vol == 0.0)
            {
                return std::nullopt;
            }
            return (ret - risk_free) / vol;
        }

        std::optional<double> diversification_ratio(const Eigen::VectorXd &weights,
                                                    const Eigen::VectorXd &asset_volatilities,
                                                    double portfolio_vol)
        {
            if (portfolio_vol == 0.0)
            {
                return std::nullopt;
            }
            return weights.dot(asset_volatilities) / portfolio_vol;
        }

        std::vector<double> portfolio_return_series(const Eigen::MatrixXd &returns,
                                                    const Eigen::VectorXd &weights)
        {
            if (returns.cols() != weights.size())
            {
                throw std::invalid_argument(
                    "Return matrix has " + std::to_string(returns.cols()) +
                    " columns but " + std::to_string(weights.size()) + " weights were given");
            }
            Eigen::VectorXd series = returns * weights;
            return std::vector<double>(series.data(), series.data() + series.size());
        }

    } // namespace analytics
} // namespace folio
