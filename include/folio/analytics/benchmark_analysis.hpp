/**
 * @file benchmark_analysis.hpp
 * @brief Market sensitivity of a portfolio against a benchmark series.
 *
 * beta = cov(R_p, R_b) / var(R_b), both with the sample (n-1) convention.
 */

#ifndef FOLIO_ANALYTICS_BENCHMARK_ANALYSIS_HPP
#define FOLIO_ANALYTICS_BENCHMARK_ANALYSIS_HPP

#include <optional>
#include <vector>

namespace folio
{
    namespace analytics
    {

        /**
         * @class BenchmarkAnalysis
         * @brief Relative metrics of a portfolio versus a benchmark return series.
         *
         * Degenerate inputs never throw: mismatched lengths, fewer than two
         * observations or a flat benchmark make beta absent.
         *
         * Usage:
         * @code
         *   BenchmarkAnalysis bench(portfolio_returns, spy_returns);
         *   if (auto b = bench.beta()) { ... }
         * @endcode
         */
        class BenchmarkAnalysis
        {
        public:
            BenchmarkAnalysis(const std::vector<double> &portfolio_returns,
                              const std::vector<double> &benchmark_returns);

            /**
             * @brief Portfolio beta against the benchmark, if defined.
             */
            std::optional<double> beta() const;

            /**
             * @brief Number of paired observations, or 0 when lengths differ.
             */
            int num_observations() const;

        private:
            std::vector<double> portfolio_returns_;
            std::vector<double> benchmark_returns_;
        };

    } // namespace analytics
} // namespace folio

#endif // FOLIO_ANALYTICS_BENCHMARK_ANALYSIS_HPP
