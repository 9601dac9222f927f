/**
 * @file portfolio_statistics.hpp
 * @brief Aggregation of asset statistics into portfolio return, risk and Sharpe.
 *
 * Daily figures come from w.mu and sqrt(w' Sigma w). Annual figures scale
 * return by the trading-day count and volatility by its square root; the
 * annual Sharpe ratio is recomputed from the annual figures and the annual
 * risk-free rate rather than scaled from the daily ratio.
 */

#ifndef FOLIO_ANALYTICS_PORTFOLIO_STATISTICS_HPP
#define FOLIO_ANALYTICS_PORTFOLIO_STATISTICS_HPP

#include <Eigen/Dense>
#include <optional>
#include <vector>

namespace folio
{
    namespace analytics
    {

        /**
         * @struct PortfolioStatistics
         * @brief Daily and annualized portfolio return, volatility and Sharpe ratio.
         *
         * A Sharpe ratio is absent when the matching volatility is exactly zero.
         * Undefined inputs (NaN covariance) propagate as NaN.
         */
        struct PortfolioStatistics
        {
            double daily_return = 0.0;
            double daily_volatility = 0.0;
            std::optional<double> daily_sharpe;
            double annual_return = 0.0;
            double annual_volatility = 0.0;
            std::optional<double> annual_sharpe;

            /**
             * @brief Aggregate portfolio statistics.
             * @param weights Portfolio weights (N).
             * @param means Daily mean returns (N).
             * @param covariance Daily covariance (N x N).
             * @param risk_free_rate Annualized risk-free rate.
             * @param trading_days_per_year Annualization factor (default 252).
             * @throws std::invalid_argument on dimension mismatch.
             */
            static PortfolioStatistics compute(const Eigen::VectorXd &weights,
                                               const Eigen::VectorXd &means,
                                               const Eigen::MatrixXd &covariance,
                                               double risk_free_rate,
                                               int trading_days_per_year = 252);
        };

        /**
         * @brief sqrt(w' Sigma w), clamped at zero for rounding noise; NaN stays NaN.
         */
        double portfolio_volatility(const Eigen::VectorXd &weights,
                                    const Eigen::MatrixXd &covariance);

        /**
         * @brief (ret - rf) / vol, absent when vol is exactly zero.
         */
        std::optional<double> sharpe_ratio(double ret, double vol, double risk_free);

        /**
         * @brief (w . asset_vols) / portfolio_vol, absent when portfolio_vol is zero.
         */
        std::optional<double> diversification_ratio(const Eigen::VectorXd &weights,
                                                    const Eigen::VectorXd &asset_volatilities,
                                                    double portfolio_vol);

        /**
         * @brief Daily portfolio return series R * w.
         */
        std::vector<double> portfolio_return_series(const Eigen::MatrixXd &returns,
                                                    const Eigen::VectorXd &weights);

    } // namespace analytics
} // namespace folio

#endif // FOLIO_ANALYTICS_PORTFOLIO_STATISTICS_HPP
