/**
 * @file performance_metrics.hpp
 * @brief Drawdown, Sortino and calendar-window metrics for a portfolio return series.
 *
 * Works on a daily simple-return series with its ISO dates. The risk-free
 * rate is annualized and converted internally to a daily rate by dividing
 * by the trading-day count (default 252).
 */

#ifndef FOLIO_ANALYTICS_PERFORMANCE_METRICS_HPP
#define FOLIO_ANALYTICS_PERFORMANCE_METRICS_HPP

#include <optional>
#include <string>
#include <vector>

namespace folio
{
    namespace analytics
    {

        /**
         * @struct WindowedMetric
         * @brief Annualized statistics for one calendar quarter.
         */
        struct WindowedMetric
        {
            std::string quarter;              ///< Label, e.g. "2024Q1"
            double annual_return = 0.0;       ///< Mean daily return * trading days
            double annual_volatility = 0.0;   ///< Daily sample std * sqrt(trading days)
            std::optional<double> sharpe;     ///< Absent when volatility is zero
            int days = 0;                     ///< Observations in the quarter
        };

        /**
         * @class PerformanceMetrics
         * @brief Path-dependent and downside metrics of a portfolio return series.
         *
         * Usage:
         * @code
         *   PerformanceMetrics metrics(returns, dates, 0.04);
         *   double max_dd = metrics.max_drawdown();
         *   auto sortino = metrics.sortino_ratio();
         *   auto quarters = metrics.quarterly_metrics(20);
         * @endcode
         *
         * Thread safety: Instances are effectively immutable after construction.
         * All public methods are const and safe to call concurrently once the
         * drawdown cache has been filled.
         */
        class PerformanceMetrics
        {
        public:
            /**
             * @brief Construct from a return series and its dates.
             * @param return_series Daily simple returns.
             * @param dates YYYY-MM-DD dates, one per return.
             * @param risk_free_rate Annualized risk-free rate (default 0.04).
             * @param trading_days_per_year Annualization factor (default 252).
             * @throws std::invalid_argument If the series is empty or sizes differ.
             */
            PerformanceMetrics(const std::vector<double> &return_series,
                               const std::vector<std::string> &dates,
                               double risk_free_rate = 0.04,
                               int trading_days_per_year = 252);

            ~PerformanceMetrics() = default;

            // ---------------------------------------------------------------
            // Wealth and drawdown
            // ---------------------------------------------------------------

            /**
             * @brief Cumulative wealth C_t = prod_{i<=t} (1 + r_i).
             */
            const std::vector<double> &wealth_curve() const;

            /**
             * @brief Wealth curve scaled to a starting value (default 100).
             */
            std::vector<double> value_series(double base_value = 100.0) const;

            /**
             * @brief Drawdown D_t = (C_t - M_t) / M_t with M_t the running maximum.
             * @note Values are non-positive; 0.0 at a new peak.
             */
            const std::vector<double> &drawdown_series() const;

            /**
             * @brief Most negative drawdown, min(D_t). Always <= 0.
             */
            double max_drawdown() const;

            // ---------------------------------------------------------------
            // Downside risk
            // ---------------------------------------------------------------

            /**
             * @brief Sample std of the negative daily excess returns only.
             * @return NaN with fewer than two negative excess returns, 0 when
             *         they are all equal.
             */
            double downside_deviation() const;

            /**
             * @brief Daily Sortino ratio: mean excess return / downside deviation.
             * @return Absent when no excess return is negative or the downside
             *         deviation is zero.
             */
            std::optional<double> sortino_ratio() const;

            /**
             * @brief Daily Sortino ratio scaled by sqrt(trading days).
             */
            std::optional<double> annualized_sortino_ratio() const;

            // ---------------------------------------------------------------
            // Calendar windows
            // ---------------------------------------------------------------

            /**
             * @brief Annualized metrics per calendar quarter.
             * @param min_observations Quarters with fewer days are dropped.
             * @return Chronologically ordered quarter metrics.
             * @throws std::invalid_argument If min_observations < 1.
             */
            std::vector<WindowedMetric> quarterly_metrics(int min_observations = 20) const;

            // ---------------------------------------------------------------
            // Accessors
            // ---------------------------------------------------------------

            const std::vector<double> &return_series() const { return return_series_; }
            const std::vector<std::string> &dates() const { return dates_; }
            double risk_free_rate() const { return risk_free_rate_; }
            int trading_days_per_year() const { return trading_days_per_year_; }

        private:
            /**
             * @brief Fill wealth and drawdown caches on first use.
             */
            void compute_drawdown_cache() const;

            /**
             * @brief Negative values of r_t - rf_daily.
             */
            std::vector<double> negative_excess_returns() const;

            double daily_risk_free_rate() const;

            std::vector<double> return_series_;
            std::vector<std::string> dates_;
            double risk_free_rate_;
            int trading_days_per_year_;

            mutable bool drawdown_computed_;
            mutable std::vector<double> wealth_cache_;
            mutable std::vector<double> drawdown_cache_;
        };

    } // namespace analytics
} // namespace folio

#endif // FOLIO_ANALYTICS_PERFORMANCE_METRICS_HPP
