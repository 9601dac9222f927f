/**
 * @file rolling_statistics.cpp
 * @brief Implementation of the RollingStatistics class.
 *
 * Uses direct per-window computation; windows are short enough that
 * incremental updates are not worth the loss of exactness for flat
 * windows.
 */

#include "folio/analytics/rolling_statistics.hpp"
#include "folio/analytics/asset_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace folio
{
    namespace analytics
    {

        RollingStatistics::RollingStatistics(const std::vector<double> &return_series,
                                             const RollingConfig &config)
            : return_series_(return_series), config_(config)
        {
            if (config_.window_days < 2)
            {
                throw std::invalid_argument(
                    "Expected window_days >= 2 for rolling statistics, got: " + std::to_string(config_.window_days));
            }
            if (config_.trading_days_per_year < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " +
                    std::to_string(config_.trading_days_per_year));
            }
        }

        int RollingStatistics::num_windows() const
        {
            return std::max(0, static_cast<int>(return_series_.size()) - config_.window_days + 1);
        }

        std::vector<std::optional<double>> RollingStatistics::sharpe_ratio() const
        {
            const double tdy = static_cast<double>(config_.trading_days_per_year);
            const double rf = config_.risk_free_rate;

            return rolling_apply_internal(
                [tdy, rf](const std::vector<double> &window) -> std::optional<double>
                {
                    double daily_vol = sample_std(window);
                    if (daily_vol == 0.0)
                    {
                        return std::nullopt;
                    }

                    double ann_ret = series_mean(window) * tdy;
                    double ann_vol = daily_vol * std::sqrt(tdy);
                    return (ann_ret - rf) / ann_vol;
                });
        }

        std::vector<std::optional<double>> RollingStatistics::rolling_apply_internal(
            const std::function<std::optional<double>(const std::vector<double> &)> &func) const
        {
            const int out_size = num_windows();
            const int w = config_.window_days;

            std::vector<std::optional<double>> result;
            result.reserve(out_size);

            for (int i = 0; i < out_size; ++i)
            {
                std::vector<double> window(return_series_.begin() + i,
                                           return_series_.begin() + i + w);
                result.push_back(func(window));
            }

            return result;
        }

    } // namespace analytics
} // namespace folio
