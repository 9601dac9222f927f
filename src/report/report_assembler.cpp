/**
 * @file report_assembler.cpp
 * @brief Implementation of AnalyticsEngine
 */

#include "folio/report/report_assembler.hpp"
#include "folio/analytics/attribution.hpp"
#include "folio/analytics/benchmark_analysis.hpp"
#include "folio/analytics/performance_metrics.hpp"
#include "folio/analytics/portfolio_statistics.hpp"
#include "folio/analytics/rolling_statistics.hpp"
#include "folio/data/weight_vector.hpp"
#include "folio/optimizer/efficient_frontier.hpp"
#include "folio/optimizer/mean_variance_optimizer.hpp"
#include "folio/risk/sample_covariance.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace folio
{
    namespace report
    {

        namespace
        {
            AssetValueMap make_asset_map(const std::vector<std::string> &tickers,
                                         const Eigen::VectorXd &values)
            {
                AssetValueMap map;
                for (size_t i = 0; i < tickers.size(); ++i)
                {
                    map.set(tickers[i], clean(values(static_cast<Eigen::Index>(i))));
                }
                return map;
            }

            AssetValueMap make_asset_map(const std::vector<std::string> &tickers,
                                         const std::vector<std::optional<double>> &values)
            {
                AssetValueMap map;
                for (size_t i = 0; i < tickers.size(); ++i)
                {
                    map.set(tickers[i], clean(values[i]));
                }
                return map;
            }

            std::vector<Metric> clean_series(const std::vector<double> &values)
            {
                std::vector<Metric> cleaned;
                cleaned.reserve(values.size());
                for (double value : values)
                {
                    cleaned.push_back(clean(value));
                }
                return cleaned;
            }

            PortfolioSummary skipped_summary(const std::vector<std::string> &tickers,
                                             const std::string &message)
            {
                PortfolioSummary summary;
                for (const auto &ticker : tickers)
                {
                    summary.weights.set(ticker, std::nullopt);
                }
                summary.converged = false;
                summary.message = message;
                return summary;
            }
        } // anonymous namespace

        AnalyticsEngine::AnalyticsEngine(const AnalyticsConfig &config) : config_(config)
        {
            config_.validate();
        }

        AnalyticsReport AnalyticsEngine::analyze(const ReturnMatrix &returns,
                                                 const std::optional<Eigen::VectorXd> &weights) const
        {
            const Eigen::Index n = static_cast<Eigen::Index>(returns.num_assets());

            // Validation happens before any computation
            Eigen::VectorXd w;
            if (weights)
            {
                validate_weights(*weights, n, config_.weight_tolerance);
                w = *weights;
            }
            else
            {
                w = equal_weights(n);
            }

            if (config_.verbose)
            {
                std::cout << "Analyzing " << returns.num_assets() << " assets over "
                          << returns.num_dates() << " days" << std::endl;
            }

            risk::SampleCovariance model;
            analytics::AssetStatistics stats = analytics::AssetStatistics::compute(returns.get_returns(), model);

            AnalyticsReport report;
            const auto &tickers = returns.get_tickers();

            report.asset_means = make_asset_map(tickers, stats.means);
            report.asset_vols = make_asset_map(tickers, stats.volatilities);
            report.asset_weights = make_asset_map(tickers, w);

            for (size_t i = 0; i < tickers.size(); ++i)
            {
                report.correlation_matrix.set(tickers[i],
                                              make_asset_map(tickers, Eigen::VectorXd(stats.correlation.row(static_cast<Eigen::Index>(i)).transpose())));
            }

            std::vector<analytics::CorrelationPair> pairs =
                analytics::Attribution::top_correlations(tickers, stats.correlation, config_.top_correlations);
            for (const auto &pair : pairs)
            {
                report.top_correlations.push_back(CorrelationEntry{pair.asset1, pair.asset2, clean(pair.correlation)});
            }

            fill_portfolio_metrics(returns, w, stats, report);
            fill_attribution(returns, w, stats, report);
            fill_optimizations(returns, stats, report);

            return report;
        }

        void AnalyticsEngine::fill_portfolio_metrics(const ReturnMatrix &returns,
                                                     const Eigen::VectorXd &weights,
                                                     const analytics::AssetStatistics &stats,
                                                     AnalyticsReport &report) const
        {
            const double rf = config_.risk_free_rate;
            const int days = config_.trading_days_per_year;
            const auto &dates = returns.get_dates();

            analytics::PortfolioStatistics portfolio = analytics::PortfolioStatistics::compute(
                weights, stats.means, stats.covariance, rf, days);

            report.portfolio_return_daily = clean(portfolio.daily_return);
            report.portfolio_vol_daily = clean(portfolio.daily_volatility);
            report.portfolio_sharpe_daily = clean(portfolio.daily_sharpe);
            report.portfolio_return_annual = clean(portfolio.annual_return);
            report.portfolio_vol_annual = clean(portfolio.annual_volatility);
            report.portfolio_sharpe_annual = clean(portfolio.annual_sharpe);

            report.diversification_ratio = clean(analytics::diversification_ratio(
                weights, stats.volatilities, portfolio.daily_volatility));

            std::vector<double> series = analytics::portfolio_return_series(returns.get_returns(), weights);
            analytics::PerformanceMetrics performance(series, dates, rf, days);

            report.max_drawdown = clean(performance.max_drawdown());
            report.sortino_ratio_daily = clean(performance.sortino_ratio());
            report.sortino_ratio_annual = clean(performance.annualized_sortino_ratio());

            if (returns.has_ticker(config_.benchmark_ticker))
            {
                Eigen::VectorXd benchmark = returns.get_asset_returns(config_.benchmark_ticker);
                analytics::BenchmarkAnalysis benchmark_analysis(series, analytics::to_std_vector(benchmark));
                report.beta = clean(benchmark_analysis.beta());
            }

            // Rolling Sharpe, tagged with the last date of each window
            analytics::RollingConfig rolling_config(config_.rolling_window);
            rolling_config.trading_days_per_year = days;
            rolling_config.risk_free_rate = rf;
            analytics::RollingStatistics rolling(series, rolling_config);
            std::vector<std::optional<double>> rolling_sharpe = rolling.sharpe_ratio();
            for (size_t i = 0; i < rolling_sharpe.size(); ++i)
            {
                const int end = rolling.window_end_index(static_cast<int>(i));
                report.time_series.rolling_sharpe.push_back(
                    RollingSharpePoint{dates[static_cast<size_t>(end)], clean(rolling_sharpe[i])});
            }

            for (const auto &quarter : performance.quarterly_metrics(config_.min_quarter_observations))
            {
                WindowedMetricEntry entry;
                entry.quarter = quarter.quarter;
                entry.annual_return = clean(quarter.annual_return);
                entry.annual_volatility = clean(quarter.annual_volatility);
                entry.sharpe = clean(quarter.sharpe);
                entry.days = quarter.days;
                report.windowed_metrics.push_back(entry);
            }

            report.time_series.dates = dates;
            report.time_series.portfolio_value = clean_series(performance.value_series(config_.base_value));
            report.time_series.drawdown = clean_series(performance.drawdown_series());

            const auto &tickers = returns.get_tickers();
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                Eigen::VectorXd column = returns.get_returns().col(static_cast<Eigen::Index>(i));
                analytics::PerformanceMetrics asset(analytics::to_std_vector(column), dates, rf, days);
                report.time_series.asset_values.set(tickers[i], clean_series(asset.value_series(config_.base_value)));
            }
        }

        void AnalyticsEngine::fill_attribution(const ReturnMatrix &returns,
                                               const Eigen::VectorXd &weights,
                                               const analytics::AssetStatistics &stats,
                                               AnalyticsReport &report) const
        {
            const auto &tickers = returns.get_tickers();
            analytics::Attribution attribution(weights, stats, config_.risk_free_rate,
                                               config_.trading_days_per_year);

            report.asset_return_contributions = make_asset_map(tickers, attribution.return_contributions());
            report.asset_variance_contributions = make_asset_map(tickers, attribution.variance_contributions());
            report.asset_sharpes = make_asset_map(tickers, attribution.asset_sharpes());
        }

        void AnalyticsEngine::fill_optimizations(const ReturnMatrix &returns,
                                                 const analytics::AssetStatistics &stats,
                                                 AnalyticsReport &report) const
        {
            const auto &tickers = returns.get_tickers();

            if (!stats.is_finite())
            {
                const std::string message = "Optimization skipped: asset statistics are undefined";
                report.min_variance = skipped_summary(tickers, message);
                report.max_sharpe = skipped_summary(tickers, message);
                std::cerr << "Warning: " << message << std::endl;
                return;
            }

            const double rf_daily = config_.risk_free_rate / config_.trading_days_per_year;

            auto run_headline = [&](const std::string &name,
                                    const optimizer::MeanVarianceOptimizer &solver) -> PortfolioSummary
            {
                try
                {
                    optimizer::OptimizationResult result =
                        solver.optimize(stats.means, stats.covariance, config_.constraints);
                    if (!result.success)
                    {
                        std::cerr << "Warning: " << name << " optimization did not converge: "
                                  << result.message << std::endl;
                    }
                    else if (config_.verbose)
                    {
                        std::cout << name << " optimization converged in " << result.iterations
                                  << " iterations" << std::endl;
                    }
                    return summarize(tickers, result);
                }
                catch (const std::invalid_argument &e)
                {
                    std::cerr << "Warning: " << name << " optimization rejected its inputs: "
                              << e.what() << std::endl;
                    return skipped_summary(tickers, name + " optimization failed: " + e.what());
                }
            };

            optimizer::MeanVarianceOptimizer min_variance(optimizer::ObjectiveType::MIN_VARIANCE, rf_daily);
            min_variance.set_solver_options(config_.solver_options);
            report.min_variance = run_headline("Minimum variance", min_variance);

            optimizer::MeanVarianceOptimizer max_sharpe(optimizer::ObjectiveType::MAX_SHARPE, rf_daily);
            max_sharpe.set_solver_options(config_.solver_options);
            max_sharpe.set_sqp_options(config_.sqp_options);
            report.max_sharpe = run_headline("Maximum Sharpe", max_sharpe);

            optimizer::EfficientFrontier frontier;
            frontier.set_num_points(config_.frontier_points);
            frontier.set_solver_options(config_.solver_options);

            try
            {
                optimizer::EfficientFrontierResult traced =
                    frontier.compute(stats.means, stats.covariance, config_.constraints, rf_daily);

                if (config_.verbose)
                {
                    std::cout << "Efficient frontier: " << traced.message << std::endl;
                }

                const double days = static_cast<double>(config_.trading_days_per_year);
                for (const auto &point : traced.points)
                {
                    FrontierEntry entry;
                    const double annual_return = point.target_return * days;
                    const double annual_volatility = point.volatility * std::sqrt(days);
                    entry.annual_return = clean(annual_return);
                    entry.annual_volatility = clean(annual_volatility);
                    entry.annual_sharpe = clean(analytics::sharpe_ratio(annual_return, annual_volatility,
                                                                        config_.risk_free_rate));
                    entry.weights = make_asset_map(tickers, point.weights);
                    report.efficient_frontier.push_back(entry);
                }
            }
            catch (const std::invalid_argument &e)
            {
                std::cerr << "Warning: efficient frontier skipped: " << e.what() << std::endl;
            }
        }

        PortfolioSummary AnalyticsEngine::summarize(const std::vector<std::string> &tickers,
                                                    const optimizer::OptimizationResult &result) const
        {
            const double days = static_cast<double>(config_.trading_days_per_year);
            const double annual_return = result.expected_return * days;
            const double annual_volatility = result.volatility * std::sqrt(days);

            PortfolioSummary summary;
            summary.weights = make_asset_map(tickers, result.weights);
            summary.annual_return = clean(annual_return);
            summary.annual_volatility = clean(annual_volatility);
            summary.annual_sharpe = clean(analytics::sharpe_ratio(annual_return, annual_volatility,
                                                                  config_.risk_free_rate));
            summary.converged = result.success;
            summary.message = result.message;
            return summary;
        }

        AnalyticsReport analyze(const ReturnMatrix &returns,
                                const std::optional<Eigen::VectorXd> &weights,
                                double risk_free_rate_annual)
        {
            if (!std::isfinite(risk_free_rate_annual))
            {
                throw ValidationError("risk_free_rate", "must be a finite number");
            }

            AnalyticsConfig config;
            config.risk_free_rate = risk_free_rate_annual;
            return AnalyticsEngine(config).analyze(returns, weights);
        }

    } // namespace report
} // namespace folio
