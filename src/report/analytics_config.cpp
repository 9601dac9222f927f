/**
 * @file analytics_config.cpp
 * @brief Implementation of AnalyticsConfig
 */

#include "folio/report/analytics_config.hpp"

#include <cmath>
#include <stdexcept>

namespace folio
{
    namespace report
    {

        namespace
        {
            void require_positive(int value, const std::string &name)
            {
                if (value <= 0)
                {
                    throw std::invalid_argument(
                        "Expected positive value for parameter '" + name + "', got: " +
                        std::to_string(value));
                }
            }
        } // anonymous namespace

        void AnalyticsConfig::validate() const
        {
            if (!std::isfinite(risk_free_rate))
            {
                throw std::invalid_argument("risk_free_rate must be finite");
            }

            require_positive(trading_days_per_year, "trading_days_per_year");
            require_positive(rolling_window, "rolling_window");
            require_positive(min_quarter_observations, "min_quarter_observations");
            require_positive(top_correlations, "top_correlations");
            require_positive(solver_options.max_iterations, "optimizer.max_iterations");
            require_positive(sqp_options.max_iterations, "optimizer.sqp_max_iterations");

            if (rolling_window < 2)
            {
                throw std::invalid_argument(
                    "rolling_window must be at least 2, got: " + std::to_string(rolling_window));
            }

            if (frontier_points < 2)
            {
                throw std::invalid_argument(
                    "frontier_points must be at least 2, got: " + std::to_string(frontier_points));
            }

            if (!(weight_tolerance >= 0.0) || !std::isfinite(weight_tolerance))
            {
                throw std::invalid_argument(
                    "weight_tolerance must be a non-negative number, got: " +
                    std::to_string(weight_tolerance));
            }

            if (!(base_value > 0.0) || !std::isfinite(base_value))
            {
                throw std::invalid_argument(
                    "base_value must be positive, got: " + std::to_string(base_value));
            }

            if (!(solver_options.tolerance > 0.0))
            {
                throw std::invalid_argument(
                    "optimizer.tolerance must be positive, got: " +
                    std::to_string(solver_options.tolerance));
            }

            constraints.validate();
        }

        AnalyticsConfig AnalyticsConfig::from_json(const nlohmann::json &j)
        {
            AnalyticsConfig config;

            if (j.contains("analytics"))
            {
                const auto &a = j.at("analytics");
                config.risk_free_rate = a.value("risk_free_rate", config.risk_free_rate);
                config.trading_days_per_year = a.value("trading_days_per_year", config.trading_days_per_year);
                config.rolling_window = a.value("rolling_window", config.rolling_window);
                config.min_quarter_observations = a.value("min_quarter_observations", config.min_quarter_observations);
                config.frontier_points = a.value("frontier_points", config.frontier_points);
                config.top_correlations = a.value("top_correlations", config.top_correlations);
                config.benchmark_ticker = a.value("benchmark_ticker", config.benchmark_ticker);
                config.weight_tolerance = a.value("weight_tolerance", config.weight_tolerance);
                config.base_value = a.value("base_value", config.base_value);
                config.verbose = a.value("verbose", config.verbose);
            }

            if (j.contains("optimizer"))
            {
                const auto &o = j.at("optimizer");
                config.solver_options.max_iterations = o.value("max_iterations", config.solver_options.max_iterations);
                config.solver_options.tolerance = o.value("tolerance", config.solver_options.tolerance);
                config.sqp_options.max_iterations = o.value("sqp_max_iterations", config.sqp_options.max_iterations);
                config.constraints = optimizer::OptimizationConstraints::from_json(o);
            }

            config.validate();
            return config;
        }

        nlohmann::json AnalyticsConfig::to_json() const
        {
            nlohmann::json j;
            j["analytics"] = {
                {"risk_free_rate", risk_free_rate},
                {"trading_days_per_year", trading_days_per_year},
                {"rolling_window", rolling_window},
                {"min_quarter_observations", min_quarter_observations},
                {"frontier_points", frontier_points},
                {"top_correlations", top_correlations},
                {"benchmark_ticker", benchmark_ticker},
                {"weight_tolerance", weight_tolerance},
                {"base_value", base_value},
                {"verbose", verbose}};
            j["optimizer"] = {
                {"max_iterations", solver_options.max_iterations},
                {"tolerance", solver_options.tolerance},
                {"sqp_max_iterations", sqp_options.max_iterations},
                {"min_weight", constraints.min_weight},
                {"max_weight", constraints.max_weight},
                {"sum_to_one", constraints.sum_to_one}};
            return j;
        }

    } // namespace report
} // namespace folio
