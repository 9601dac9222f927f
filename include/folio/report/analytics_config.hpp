/**
 * @file analytics_config.hpp
 * @brief Named numeric conventions and tunables of the analytics engine
 *
 * Every convention the report depends on (annualization factor, window
 * lengths, thresholds, frontier size) is a named constant here and a field
 * of AnalyticsConfig, so callers and tests can override them in one place.
 *
 * JSON layout read by AnalyticsConfig::from_json:
 * @code
 * {
 *   "analytics": { "risk_free_rate": 0.04, "trading_days_per_year": 252, ... },
 *   "optimizer": { "max_iterations": 10000, "tolerance": 1e-8,
 *                  "min_weight": 0.0, "max_weight": 1.0 }
 * }
 * @endcode
 */

#ifndef FOLIO_REPORT_ANALYTICS_CONFIG_HPP
#define FOLIO_REPORT_ANALYTICS_CONFIG_HPP

#include "folio/optimizer/optimizer_interface.hpp"
#include "folio/optimizer/quadratic_problem.hpp"
#include "folio/optimizer/sqp_solver.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace folio
{
    namespace report
    {

        constexpr int TRADING_DAYS_PER_YEAR = 252;
        constexpr double DEFAULT_RISK_FREE_RATE = 0.04;
        constexpr int ROLLING_WINDOW_DAYS = 90;
        constexpr int MIN_QUARTER_OBSERVATIONS = 20;
        constexpr int FRONTIER_POINTS = 20;
        constexpr int TOP_CORRELATIONS = 5;
        constexpr double PORTFOLIO_BASE_VALUE = 100.0;
        constexpr const char *DEFAULT_BENCHMARK_TICKER = "SPY";

        /**
         * @struct AnalyticsConfig
         * @brief Configuration of one analytics run
         */
        struct AnalyticsConfig
        {
            double risk_free_rate = DEFAULT_RISK_FREE_RATE;          ///< Annualized
            int trading_days_per_year = TRADING_DAYS_PER_YEAR;       ///< Annualization factor
            int rolling_window = ROLLING_WINDOW_DAYS;                ///< Rolling Sharpe window
            int min_quarter_observations = MIN_QUARTER_OBSERVATIONS; ///< Smallest reported quarter
            int frontier_points = FRONTIER_POINTS;                   ///< Frontier targets
            int top_correlations = TOP_CORRELATIONS;                 ///< Ranked pairs kept
            std::string benchmark_ticker = DEFAULT_BENCHMARK_TICKER; ///< Column used for beta
            double weight_tolerance = 0.01;                          ///< |sum(w) - 1| allowance
            double base_value = PORTFOLIO_BASE_VALUE;                ///< Start of value series
            bool verbose = false;                                    ///< Progress on stdout

            optimizer::OptimizationConstraints constraints; ///< Box and budget
            optimizer::SolverOptions solver_options;        ///< OSQP solves
            optimizer::SqpOptions sqp_options;              ///< Maximum Sharpe solve

            /**
             * @brief Validate all fields
             * @throws std::invalid_argument on a non-positive count or bad value
             */
            void validate() const;

            /**
             * @brief Read the "analytics" and "optimizer" objects of a config
             *
             * Missing keys keep their defaults. The result is validated.
             * @throws std::invalid_argument if a value is out of range
             * @throws nlohmann::json::exception if a value has the wrong type
             */
            static AnalyticsConfig from_json(const nlohmann::json &j);

            /**
             * @brief Serialize back to the layout read by from_json
             */
            nlohmann::json to_json() const;
        };

    } // namespace report
} // namespace folio

#endif // FOLIO_REPORT_ANALYTICS_CONFIG_HPP
