/**
 * @file analytics_report.hpp
 * @brief Value types of the analytics report and their JSON form
 *
 * Every numeric field is a Metric: an absent value means "no value"
 * (undefined ratio, degenerate input or a non-finite intermediate result).
 * The assembler guarantees that every present Metric is finite.
 *
 * Asset-keyed fields use AssetMap, which iterates in the order entries were
 * inserted; the assembler inserts in the column order of the return matrix.
 */

#ifndef FOLIO_REPORT_ANALYTICS_REPORT_HPP
#define FOLIO_REPORT_ANALYTICS_REPORT_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace folio
{
    namespace report
    {

        /// A numeric report value, absent when undefined
        using Metric = std::optional<double>;

        /**
         * @brief Finite values pass through; NaN and +/-inf become absent
         */
        Metric clean(double value);

        Metric clean(const std::optional<double> &value);

        /**
         * @class AssetMap
         * @brief Mapping from asset name to value with insertion order
         */
        template <typename T>
        class AssetMap
        {
        public:
            using value_type = std::pair<std::string, T>;
            using const_iterator = typename std::vector<value_type>::const_iterator;

            /**
             * @brief Insert or overwrite the value for an asset
             */
            void set(const std::string &asset, T value)
            {
                for (auto &entry : entries_)
                {
                    if (entry.first == asset)
                    {
                        entry.second = std::move(value);
                        return;
                    }
                }
                entries_.emplace_back(asset, std::move(value));
            }

            /**
             * @brief Value for an asset
             * @throws std::out_of_range if the asset is unknown
             */
            const T &at(const std::string &asset) const
            {
                for (const auto &entry : entries_)
                {
                    if (entry.first == asset)
                    {
                        return entry.second;
                    }
                }
                throw std::out_of_range("Unknown asset: " + asset);
            }

            bool contains(const std::string &asset) const
            {
                for (const auto &entry : entries_)
                {
                    if (entry.first == asset)
                    {
                        return true;
                    }
                }
                return false;
            }

            std::vector<std::string> keys() const
            {
                std::vector<std::string> names;
                names.reserve(entries_.size());
                for (const auto &entry : entries_)
                {
                    names.push_back(entry.first);
                }
                return names;
            }

            size_t size() const { return entries_.size(); }
            bool empty() const { return entries_.empty(); }
            const_iterator begin() const { return entries_.begin(); }
            const_iterator end() const { return entries_.end(); }

            bool operator==(const AssetMap &other) const { return entries_ == other.entries_; }
            bool operator!=(const AssetMap &other) const { return !(*this == other); }

        private:
            std::vector<value_type> entries_;
        };

        using AssetValueMap = AssetMap<Metric>;
        using AssetSeriesMap = AssetMap<std::vector<Metric>>;
        using CorrelationMatrix = AssetMap<AssetValueMap>;

        struct CorrelationEntry
        {
            std::string asset1;
            std::string asset2;
            Metric correlation;

            bool operator==(const CorrelationEntry &other) const
            {
                return asset1 == other.asset1 && asset2 == other.asset2 &&
                       correlation == other.correlation;
            }
        };

        /**
         * @struct WindowedMetricEntry
         * @brief Annualized figures of one calendar quarter
         */
        struct WindowedMetricEntry
        {
            std::string quarter;
            Metric annual_return;
            Metric annual_volatility;
            Metric sharpe;
            int days = 0;

            bool operator==(const WindowedMetricEntry &other) const
            {
                return quarter == other.quarter && annual_return == other.annual_return &&
                       annual_volatility == other.annual_volatility && sharpe == other.sharpe &&
                       days == other.days;
            }
        };

        struct RollingSharpePoint
        {
            std::string date; ///< Last date of the window
            Metric sharpe;

            bool operator==(const RollingSharpePoint &other) const
            {
                return date == other.date && sharpe == other.sharpe;
            }
        };

        /**
         * @struct TimeSeriesReport
         * @brief Charting series aligned with the date axis
         */
        struct TimeSeriesReport
        {
            std::vector<std::string> dates;
            std::vector<Metric> portfolio_value; ///< Cumulative value from the base value
            std::vector<RollingSharpePoint> rolling_sharpe;
            std::vector<Metric> drawdown; ///< Fractional drawdown, <= 0
            AssetSeriesMap asset_values;  ///< Per-asset cumulative value

            bool operator==(const TimeSeriesReport &other) const
            {
                return dates == other.dates && portfolio_value == other.portfolio_value &&
                       rolling_sharpe == other.rolling_sharpe && drawdown == other.drawdown &&
                       asset_values == other.asset_values;
            }
        };

        /**
         * @struct PortfolioSummary
         * @brief Annualized headline optimization result
         */
        struct PortfolioSummary
        {
            AssetValueMap weights;
            Metric annual_return;
            Metric annual_volatility;
            Metric annual_sharpe;
            bool converged = false;
            std::string message;

            bool operator==(const PortfolioSummary &other) const
            {
                return weights == other.weights && annual_return == other.annual_return &&
                       annual_volatility == other.annual_volatility &&
                       annual_sharpe == other.annual_sharpe && converged == other.converged &&
                       message == other.message;
            }
        };

        struct FrontierEntry
        {
            Metric annual_return; ///< Annualized target return
            Metric annual_volatility;
            Metric annual_sharpe;
            AssetValueMap weights;

            bool operator==(const FrontierEntry &other) const
            {
                return annual_return == other.annual_return &&
                       annual_volatility == other.annual_volatility &&
                       annual_sharpe == other.annual_sharpe && weights == other.weights;
            }
        };

        /**
         * @struct AnalyticsReport
         * @brief Full output of one analytics run
         */
        struct AnalyticsReport
        {
            AssetValueMap asset_means; ///< Daily
            AssetValueMap asset_vols;  ///< Daily

            Metric portfolio_return_daily;
            Metric portfolio_vol_daily;
            Metric portfolio_sharpe_daily;
            Metric portfolio_return_annual;
            Metric portfolio_vol_annual;
            Metric portfolio_sharpe_annual;

            Metric max_drawdown;
            Metric sortino_ratio_daily;
            Metric sortino_ratio_annual;
            Metric beta;
            CorrelationMatrix correlation_matrix;
            std::vector<CorrelationEntry> top_correlations;
            Metric diversification_ratio;

            AssetValueMap asset_weights;
            AssetValueMap asset_return_contributions;
            AssetValueMap asset_variance_contributions;
            AssetValueMap asset_sharpes;

            std::vector<WindowedMetricEntry> windowed_metrics;
            TimeSeriesReport time_series;

            PortfolioSummary min_variance;
            PortfolioSummary max_sharpe;
            std::vector<FrontierEntry> efficient_frontier;

            bool operator==(const AnalyticsReport &other) const;
            bool operator!=(const AnalyticsReport &other) const { return !(*this == other); }
        };

        /**
         * @brief Serialize with asset order preserved; absent values are null
         */
        nlohmann::ordered_json to_json(const AnalyticsReport &report);

    } // namespace report
} // namespace folio

#endif // FOLIO_REPORT_ANALYTICS_REPORT_HPP
