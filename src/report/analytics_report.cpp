/**
 * @file analytics_report.cpp
 * @brief Report cleaning helpers and JSON serialization
 */

#include "folio/report/analytics_report.hpp"

#include <cmath>

namespace folio
{
    namespace report
    {

        using ojson = nlohmann::ordered_json;

        namespace
        {
            ojson metric_json(const Metric &value)
            {
                if (value)
                {
                    return ojson(*value);
                }
                return ojson(nullptr);
            }

            ojson series_json(const std::vector<Metric> &values)
            {
                ojson array = ojson::array();
                for (const auto &value : values)
                {
                    array.push_back(metric_json(value));
                }
                return array;
            }

            ojson asset_map_json(const AssetValueMap &values)
            {
                ojson object = ojson::object();
                for (const auto &entry : values)
                {
                    object[entry.first] = metric_json(entry.second);
                }
                return object;
            }

            ojson summary_json(const PortfolioSummary &summary)
            {
                ojson j;
                j["weights"] = asset_map_json(summary.weights);
                j["return"] = metric_json(summary.annual_return);
                j["volatility"] = metric_json(summary.annual_volatility);
                j["sharpe"] = metric_json(summary.annual_sharpe);
                j["converged"] = summary.converged;
                j["message"] = summary.message;
                return j;
            }
        } // anonymous namespace

        Metric clean(double value)
        {
            if (std::isfinite(value))
            {
                return value;
            }
            return std::nullopt;
        }

        Metric clean(const std::optional<double> &value)
        {
            if (value)
            {
                return clean(*value);
            }
            return std::nullopt;
        }

        bool AnalyticsReport::operator==(const AnalyticsReport &other) const
        {
            return asset_means == other.asset_means &&
                   asset_vols == other.asset_vols &&
                   portfolio_return_daily == other.portfolio_return_daily &&
                   portfolio_vol_daily == other.portfolio_vol_daily &&
                   portfolio_sharpe_daily == other.portfolio_sharpe_daily &&
                   portfolio_return_annual == other.portfolio_return_annual &&
                   portfolio_vol_annual == other.portfolio_vol_annual &&
                   portfolio_sharpe_annual == other.portfolio_sharpe_annual &&
                   max_drawdown == other.max_drawdown &&
                   sortino_ratio_daily == other.sortino_ratio_daily &&
                   sortino_ratio_annual == other.sortino_ratio_annual &&
                   beta == other.beta &&
                   correlation_matrix == other.correlation_matrix &&
                   top_correlations == other.top_correlations &&
                   diversification_ratio == other.diversification_ratio &&
                   asset_weights == other.asset_weights &&
                   asset_return_contributions == other.asset_return_contributions &&
                   asset_variance_contributions == other.asset_variance_contributions &&
                   asset_sharpes == other.asset_sharpes &&
                   windowed_metrics == other.windowed_metrics &&
                   time_series == other.time_series &&
                   min_variance == other.min_variance &&
                   max_sharpe == other.max_sharpe &&
                   efficient_frontier == other.efficient_frontier;
        }

        ojson to_json(const AnalyticsReport &report)
        {
            ojson j;

            j["asset_means"] = asset_map_json(report.asset_means);
            j["asset_vols"] = asset_map_json(report.asset_vols);

            j["portfolio_return_daily"] = metric_json(report.portfolio_return_daily);
            j["portfolio_vol_daily"] = metric_json(report.portfolio_vol_daily);
            j["portfolio_sharpe_daily"] = metric_json(report.portfolio_sharpe_daily);
            j["portfolio_return_annual"] = metric_json(report.portfolio_return_annual);
            j["portfolio_vol_annual"] = metric_json(report.portfolio_vol_annual);
            j["portfolio_sharpe_annual"] = metric_json(report.portfolio_sharpe_annual);

            j["max_drawdown"] = metric_json(report.max_drawdown);
            j["sortino_ratio_daily"] = metric_json(report.sortino_ratio_daily);
            j["sortino_ratio_annual"] = metric_json(report.sortino_ratio_annual);
            j["beta"] = metric_json(report.beta);

            ojson correlation = ojson::object();
            for (const auto &row : report.correlation_matrix)
            {
                correlation[row.first] = asset_map_json(row.second);
            }
            j["correlation_matrix"] = correlation;

            ojson top = ojson::array();
            for (const auto &pair : report.top_correlations)
            {
                ojson entry;
                entry["asset1"] = pair.asset1;
                entry["asset2"] = pair.asset2;
                entry["correlation"] = metric_json(pair.correlation);
                top.push_back(entry);
            }
            j["top_correlations"] = top;
            j["diversification_ratio"] = metric_json(report.diversification_ratio);

            j["asset_weights"] = asset_map_json(report.asset_weights);
            j["asset_return_contributions"] = asset_map_json(report.asset_return_contributions);
            j["asset_variance_contributions"] = asset_map_json(report.asset_variance_contributions);
            j["asset_sharpes"] = asset_map_json(report.asset_sharpes);

            ojson windowed = ojson::array();
            for (const auto &quarter : report.windowed_metrics)
            {
                ojson entry;
                entry["quarter"] = quarter.quarter;
                entry["return"] = metric_json(quarter.annual_return);
                entry["volatility"] = metric_json(quarter.annual_volatility);
                entry["sharpe"] = metric_json(quarter.sharpe);
                entry["days"] = quarter.days;
                windowed.push_back(entry);
            }
            j["windowed_metrics"] = windowed;

            const TimeSeriesReport &ts = report.time_series;
            ojson time_series;
            time_series["dates"] = ts.dates;
            time_series["portfolio_value"] = series_json(ts.portfolio_value);
            ojson rolling = ojson::array();
            for (const auto &point : ts.rolling_sharpe)
            {
                rolling.push_back(ojson{{"date", point.date}, {"sharpe", metric_json(point.sharpe)}});
            }
            time_series["rolling_sharpe"] = rolling;
            time_series["drawdown"] = series_json(ts.drawdown);
            ojson asset_values = ojson::object();
            for (const auto &entry : ts.asset_values)
            {
                asset_values[entry.first] = series_json(entry.second);
            }
            time_series["asset_values"] = asset_values;
            j["time_series"] = time_series;

            j["optimal_portfolios"] = ojson{{"min_variance", summary_json(report.min_variance)},
                                            {"max_sharpe", summary_json(report.max_sharpe)}};

            ojson frontier = ojson::array();
            for (const auto &point : report.efficient_frontier)
            {
                ojson entry;
                entry["return"] = metric_json(point.annual_return);
                entry["volatility"] = metric_json(point.annual_volatility);
                entry["sharpe"] = metric_json(point.annual_sharpe);
                entry["weights"] = asset_map_json(point.weights);
                frontier.push_back(entry);
            }
            j["efficient_frontier"] = frontier;

            return j;
        }

    } // namespace report
} // namespace folio
