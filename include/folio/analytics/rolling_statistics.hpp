/**
 * @file rolling_statistics.hpp
 * @brief Rolling window computations for portfolio time series.
 *
 * Output vectors have size (n - window + 1) where n is the input series
 * length, and are aligned to the end of each window (result[0] corresponds
 * to the window ending at index window - 1). A series shorter than the
 * window produces an empty result; partial windows are never evaluated.
 */

#ifndef FOLIO_ANALYTICS_ROLLING_STATISTICS_HPP
#define FOLIO_ANALYTICS_ROLLING_STATISTICS_HPP

#include <functional>
#include <optional>
#include <vector>

namespace folio
{
    namespace analytics
    {

        /**
         * @struct RollingConfig
         * @brief Configuration for rolling window calculations.
         */
        struct RollingConfig
        {
            int window_days;           ///< Rolling window size in trading days
            int trading_days_per_year; ///< Trading days per year for annualization
            double risk_free_rate;     ///< Annualized risk-free rate

            explicit RollingConfig(int window = 90)
                : window_days(window), trading_days_per_year(252), risk_free_rate(0.04) {}
        };

        /**
         * @class RollingStatistics
         * @brief Trailing-window metrics over a daily return series.
         *
         * Usage:
         * @code
         *   RollingConfig config(90);
         *   config.risk_free_rate = 0.04;
         *   RollingStatistics rolling(return_series, config);
         *   auto sharpe = rolling.sharpe_ratio();
         * @endcode
         *
         * Thread safety: Instances are immutable after construction.
         */
        class RollingStatistics
        {
        public:
            /**
             * @brief Construct from a return series and configuration.
             * @throws std::invalid_argument If window_days < 2 or
             *         trading_days_per_year < 1.
             */
            RollingStatistics(const std::vector<double> &return_series,
                              const RollingConfig &config);

            /**
             * @brief Rolling annualized Sharpe ratio.
             *
             * (mean * T - rf) / (std * sqrt(T)) over each window, with the
             * sample (n-1) standard deviation. Absent for a flat window.
             */
            std::vector<std::optional<double>> sharpe_ratio() const;

            /**
             * @brief Index in the input series of the last day of window i.
             */
            int window_end_index(int i) const { return i + config_.window_days - 1; }

            /**
             * @brief Number of complete windows.
             */
            int num_windows() const;

            const RollingConfig &config() const { return config_; }

        private:
            std::vector<double> return_series_;
            RollingConfig config_;

            /**
             * @brief Apply func to every complete window.
             */
            std::vector<std::optional<double>> rolling_apply_internal(
                const std::function<std::optional<double>(const std::vector<double> &)> &func) const;
        };

    } // namespace analytics
} // namespace folio

#endif // FOLIO_ANALYTICS_ROLLING_STATISTICS_HPP
