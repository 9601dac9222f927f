/**
 * @file performance_metrics.cpp
 * @brief Implementation of the PerformanceMetrics class.
 *
 * Annualized values use simple scaling (multiply by trading_days_per_year
 * or its square root).
 */

#include "folio/analytics/performance_metrics.hpp"
#include "folio/analytics/asset_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace folio
{
    namespace analytics
    {

        // ===================================================================
        // Constructors
        // ===================================================================

        PerformanceMetrics::PerformanceMetrics(const std::vector<double> &return_series,
                                               const std::vector<std::string> &dates,
                                               double risk_free_rate,
                                               int trading_days_per_year)
            : return_series_(return_series), dates_(dates), risk_free_rate_(risk_free_rate), trading_days_per_year_(trading_days_per_year), drawdown_computed_(false)
        {
            if (return_series_.empty())
            {
                throw std::invalid_argument("Return series cannot be empty");
            }
            if (return_series_.size() != dates_.size())
            {
                throw std::invalid_argument(
                    "Return series length (" + std::to_string(return_series_.size()) +
                    ") must match dates length (" + std::to_string(dates_.size()) + ")");
            }
            if (trading_days_per_year_ <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year_));
            }
        }

        // ===================================================================
        // Wealth and drawdown
        // ===================================================================

        const std::vector<double> &PerformanceMetrics::wealth_curve() const
        {
            compute_drawdown_cache();
            return wealth_cache_;
        }

        std::vector<double> PerformanceMetrics::value_series(double base_value) const
        {
            std::vector<double> values = wealth_curve();
            for (double &v : values)
            {
                v *= base_value;
            }
            return values;
        }

        const std::vector<double> &PerformanceMetrics::drawdown_series() const
        {
            compute_drawdown_cache();
            return drawdown_cache_;
        }

        double PerformanceMetrics::max_drawdown() const
        {
            compute_drawdown_cache();
            return *std::min_element(drawdown_cache_.begin(), drawdown_cache_.end());
        }

        void PerformanceMetrics::compute_drawdown_cache() const
        {
            if (drawdown_computed_)
            {
                return;
            }

            const size_t n = return_series_.size();
            wealth_cache_.resize(n);
            drawdown_cache_.resize(n);

            double wealth = 1.0;
            double peak = 0.0;
            for (size_t t = 0; t < n; ++t)
            {
                wealth *= (1.0 + return_series_[t]);
                peak = (t == 0) ? wealth : std::max(peak, wealth);

                wealth_cache_[t] = wealth;
                drawdown_cache_[t] = (wealth - peak) / peak;
            }

            drawdown_computed_ = true;
        }

        // ===================================================================
        // Downside risk
        // ===================================================================

        std::vector<double> PerformanceMetrics::negative_excess_returns() const
        {
            const double rf_daily = daily_risk_free_rate();
            std::vector<double> downside;
            for (double r : return_series_)
            {
                double excess = r - rf_daily;
                if (excess < 0.0)
                {
                    downside.push_back(excess);
                }
            }
            return downside;
        }

        double PerformanceMetrics::downside_deviation() const
        {
            return sample_std(negative_excess_returns());
        }

        std::optional<double> PerformanceMetrics::sortino_ratio() const
        {
            std::vector<double> downside = negative_excess_returns();
            if (downside.empty())
            {
                return std::nullopt;
            }

            double deviation = sample_std(downside);
            if (deviation == 0.0)
            {
                return std::nullopt;
            }

            double mean_excess = series_mean(return_series_) - daily_risk_free_rate();
            return mean_excess / deviation;
        }

        std::optional<double> PerformanceMetrics::annualized_sortino_ratio() const
        {
            std::optional<double> daily = sortino_ratio();
            if (!daily)
            {
                return std::nullopt;
            }
            return *daily * std::sqrt(static_cast<double>(trading_days_per_year_));
        }

        // ===================================================================
        // Calendar windows
        // ===================================================================

        std::vector<WindowedMetric> PerformanceMetrics::quarterly_metrics(int min_observations) const
        {
            if (min_observations < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'min_observations', got: " + std::to_string(min_observations));
            }

            const double days = static_cast<double>(trading_days_per_year_);
            std::vector<WindowedMetric> result;

            // Dates are strictly increasing, so each quarter is one contiguous run
            size_t i = 0;
            const size_t n = dates_.size();
            while (i < n)
            {
                if (dates_[i].size() < 10)
                {
                    throw std::invalid_argument(
                        "Date string too short for YYYY-MM-DD format: '" + dates_[i] + "'");
                }
                int year = std::stoi(dates_[i].substr(0, 4));
                int quarter = (std::stoi(dates_[i].substr(5, 2)) - 1) / 3 + 1;

                std::vector<double> window;
                size_t j = i;
                while (j < n && std::stoi(dates_[j].substr(0, 4)) == year &&
                       (std::stoi(dates_[j].substr(5, 2)) - 1) / 3 + 1 == quarter)
                {
                    window.push_back(return_series_[j]);
                    ++j;
                }

                if (static_cast<int>(window.size()) >= min_observations)
                {
                    WindowedMetric metric;
                    metric.quarter = std::to_string(year) + "Q" + std::to_string(quarter);
                    metric.annual_return = series_mean(window) * days;
                    metric.annual_volatility = sample_std(window) * std::sqrt(days);
                    if (metric.annual_volatility != 0.0)
                    {
                        metric.sharpe = (metric.annual_return - risk_free_rate_) / metric.annual_volatility;
                    }
                    metric.days = static_cast<int>(window.size());
                    result.push_back(metric);
                }

                i = j;
            }

            return result;
        }

        double PerformanceMetrics::daily_risk_free_rate() const
        {
            return risk_free_rate_ / static_cast<double>(trading_days_per_year_);
        }

    } // namespace analytics
} // namespace folio
