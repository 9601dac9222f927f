/**
 * @file attribution.hpp
 * @brief Per-asset return and risk attribution.
 *
 * Attribution model (daily inputs, annualized outputs with T trading days):
 *   Return contribution   = mu_i * w_i * T
 *   Variance contribution = (Sigma w)_i / (w' Sigma w) * w_i * T
 *   Asset Sharpe          = (mu_i * T - rf) / (sigma_i * sqrt(T))
 *
 * The variance decomposition is the Euler allocation of portfolio
 * variance; the unscaled shares sum to one.
 */

#ifndef FOLIO_ANALYTICS_ATTRIBUTION_HPP
#define FOLIO_ANALYTICS_ATTRIBUTION_HPP

#include "folio/analytics/asset_statistics.hpp"

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace folio
{
    namespace analytics
    {

        /**
         * @struct CorrelationPair
         * @brief Correlation between two named assets.
         */
        struct CorrelationPair
        {
            std::string asset1;
            std::string asset2;
            double correlation;
        };

        /**
         * @class Attribution
         * @brief Decomposes portfolio return and variance by asset.
         *
         * Usage:
         * @code
         *   Attribution attribution(weights, stats, 0.04);
         *   Eigen::VectorXd ret = attribution.return_contributions();
         *   Eigen::VectorXd var = attribution.variance_contributions();
         * @endcode
         */
        class Attribution
        {
        public:
            /**
             * @brief Construct from weights and per-asset statistics.
             * @param weights Portfolio weights (N).
             * @param stats Daily asset statistics.
             * @param risk_free_rate Annualized risk-free rate.
             * @param trading_days_per_year Annualization factor.
             * @throws std::invalid_argument on dimension mismatch.
             */
            Attribution(const Eigen::VectorXd &weights,
                        const AssetStatistics &stats,
                        double risk_free_rate = 0.04,
                        int trading_days_per_year = 252);

            /**
             * @brief Annualized return contribution per asset.
             */
            Eigen::VectorXd return_contributions() const;

            /**
             * @brief Annualized variance contribution per asset.
             * @return All zeros when portfolio volatility is zero.
             */
            Eigen::VectorXd variance_contributions() const;

            /**
             * @brief Annualized Sharpe ratio of each asset held alone.
             * @return Absent entries for assets with zero volatility.
             */
            std::vector<std::optional<double>> asset_sharpes() const;

            /**
             * @brief Most correlated asset pairs by absolute correlation.
             * @param tickers Asset names in column order.
             * @param correlation Correlation matrix (N x N).
             * @param count Number of pairs to keep.
             * @return Pairs (i < j) ranked by |correlation| descending; ties keep
             *         enumeration order. Pairs with undefined correlation are skipped.
             * @throws std::invalid_argument if sizes disagree.
             */
            static std::vector<CorrelationPair> top_correlations(
                const std::vector<std::string> &tickers,
                const Eigen::MatrixXd &correlation,
                int count = 5);

        private:
            Eigen::VectorXd weights_;
            AssetStatistics stats_;
            double risk_free_rate_;
            int trading_days_per_year_;
        };

    } // namespace analytics
} // namespace folio

#endif // FOLIO_ANALYTICS_ATTRIBUTION_HPP
