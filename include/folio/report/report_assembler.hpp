/**
 * @file report_assembler.hpp
 * @brief Orchestrates statistics, risk metrics, attribution and optimization
 *
 * Pipeline of AnalyticsEngine::analyze:
 * 1. Validate weights (or default to equal weights)
 * 2. Asset statistics (means, volatilities, covariance, correlation)
 * 3. Portfolio aggregation, risk metrics and attribution
 * 4. Minimum-variance, maximum-Sharpe and efficient-frontier optimizations
 * 5. Annualization and removal of non-finite values
 *
 * Numerical degeneracy never aborts the run: the affected field is absent
 * and every other field is still computed.
 */

#ifndef FOLIO_REPORT_REPORT_ASSEMBLER_HPP
#define FOLIO_REPORT_REPORT_ASSEMBLER_HPP

#include "folio/analytics/asset_statistics.hpp"
#include "folio/data/return_matrix.hpp"
#include "folio/optimizer/optimizer_interface.hpp"
#include "folio/report/analytics_config.hpp"
#include "folio/report/analytics_report.hpp"

#include <Eigen/Dense>
#include <optional>

namespace folio
{
    namespace report
    {

        /**
         * @class AnalyticsEngine
         * @brief Builds an AnalyticsReport from a return matrix and weights
         *
         * Usage Example:
         * @code
         * AnalyticsConfig config;
         * config.risk_free_rate = 0.03;
         * AnalyticsEngine engine(config);
         * AnalyticsReport report = engine.analyze(returns, weights);
         * std::cout << to_json(report).dump(2) << "\n";
         * @endcode
         *
         * Thread Safety: analyze() holds no state between calls and may run
         * concurrently on one engine.
         */
        class AnalyticsEngine
        {
        public:
            /**
             * @throws std::invalid_argument if the configuration is invalid
             */
            explicit AnalyticsEngine(const AnalyticsConfig &config = AnalyticsConfig());

            /**
             * @brief Compute the full report
             * @param returns Daily return matrix
             * @param weights Portfolio weights in column order; equal weights when absent
             * @return Report with every present value finite
             * @throws ValidationError if weights are malformed
             */
            AnalyticsReport analyze(const ReturnMatrix &returns,
                                    const std::optional<Eigen::VectorXd> &weights = std::nullopt) const;

            const AnalyticsConfig &config() const { return config_; }

        private:
            AnalyticsConfig config_;

            void fill_portfolio_metrics(const ReturnMatrix &returns,
                                        const Eigen::VectorXd &weights,
                                        const analytics::AssetStatistics &stats,
                                        AnalyticsReport &report) const;

            void fill_attribution(const ReturnMatrix &returns,
                                  const Eigen::VectorXd &weights,
                                  const analytics::AssetStatistics &stats,
                                  AnalyticsReport &report) const;

            void fill_optimizations(const ReturnMatrix &returns,
                                    const analytics::AssetStatistics &stats,
                                    AnalyticsReport &report) const;

            /**
             * @brief Annualize a daily optimization result into the report form
             */
            PortfolioSummary summarize(const std::vector<std::string> &tickers,
                                       const optimizer::OptimizationResult &result) const;
        };

        /**
         * @brief Analyze with the default configuration and a given risk-free rate
         * @param risk_free_rate_annual Annualized risk-free rate
         * @throws ValidationError if weights are malformed or the rate is not finite
         */
        AnalyticsReport analyze(const ReturnMatrix &returns,
                                const std::optional<Eigen::VectorXd> &weights = std::nullopt,
                                double risk_free_rate_annual = DEFAULT_RISK_FREE_RATE);

    } // namespace report
} // namespace folio

#endif // FOLIO_REPORT_REPORT_ASSEMBLER_HPP
