/**
 * @file test_rolling_benchmark.cpp
 * @brief Tests for rolling Sharpe and benchmark beta
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>

#include "folio/analytics/asset_statistics.hpp"
#include "folio/analytics/benchmark_analysis.hpp"
#include "folio/analytics/rolling_statistics.hpp"
#include "folio/data/data_loader.hpp"

using namespace folio;
using namespace folio::analytics;
using Catch::Matchers::WithinAbs;

TEST_CASE("Rolling Sharpe ratio", "[RollingStatistics]")
{
    ReturnMatrix returns = DataLoader::generate_synthetic_returns({"A"}, 120, "2022-01-03", 0.01, 0.0004, 0.0, 21);
    std::vector<double> series = to_std_vector(returns.get_returns().col(0));

    SECTION("One value per complete window")
    {
        RollingStatistics rolling(series, RollingConfig(90));
        auto sharpe = rolling.sharpe_ratio();

        REQUIRE(rolling.num_windows() == 31);
        REQUIRE(sharpe.size() == 31);
        REQUIRE(rolling.window_end_index(0) == 89);
        REQUIRE(rolling.window_end_index(30) == 119);
    }

    SECTION("Window value matches direct computation")
    {
        RollingConfig config(30);
        config.risk_free_rate = 0.02;
        RollingStatistics rolling(series, config);
        auto sharpe = rolling.sharpe_ratio();

        std::vector<double> window(series.begin() + 5, series.begin() + 35);
        double expected = (series_mean(window) * 252.0 - 0.02) / (sample_std(window) * std::sqrt(252.0));

        REQUIRE(sharpe[5].has_value());
        REQUIRE_THAT(*sharpe[5], WithinAbs(expected, 1e-10));
    }

    SECTION("Series shorter than the window gives nothing")
    {
        std::vector<double> short_series(series.begin(), series.begin() + 50);
        RollingStatistics rolling(short_series, RollingConfig(90));
        REQUIRE(rolling.num_windows() == 0);
        REQUIRE(rolling.sharpe_ratio().empty());
    }

    SECTION("Flat window has no value")
    {
        std::vector<double> flat(10, 0.002);
        flat.push_back(0.01);
        RollingStatistics rolling(flat, RollingConfig(5));
        auto sharpe = rolling.sharpe_ratio();
        REQUIRE(sharpe.size() == 7);
        REQUIRE_FALSE(sharpe[0].has_value());
        REQUIRE(sharpe[6].has_value());
    }

    SECTION("Window below two is rejected")
    {
        REQUIRE_THROWS_AS(RollingStatistics(series, RollingConfig(1)), std::invalid_argument);
    }
}

TEST_CASE("Benchmark beta", "[BenchmarkAnalysis]")
{
    std::vector<double> benchmark = {0.01, -0.02, 0.015, 0.005, -0.01, 0.02};

    SECTION("Scaled benchmark has beta equal to the scale")
    {
        std::vector<double> portfolio;
        for (double b : benchmark)
        {
            portfolio.push_back(1.5 * b + 0.0002);
        }
        BenchmarkAnalysis analysis(portfolio, benchmark);
        REQUIRE(analysis.num_observations() == 6);
        REQUIRE(analysis.beta().has_value());
        REQUIRE_THAT(*analysis.beta(), WithinAbs(1.5, 1e-12));
    }

    SECTION("Beta of the benchmark against itself is one")
    {
        BenchmarkAnalysis analysis(benchmark, benchmark);
        REQUIRE_THAT(*analysis.beta(), WithinAbs(1.0, 1e-12));
    }

    SECTION("Constant benchmark has no beta")
    {
        std::vector<double> constant(benchmark.size(), 0.0004);
        BenchmarkAnalysis analysis(benchmark, constant);
        REQUIRE_FALSE(analysis.beta().has_value());
    }

    SECTION("Too few or mismatched observations")
    {
        REQUIRE_FALSE(BenchmarkAnalysis({0.01}, {0.02}).beta().has_value());
        REQUIRE_FALSE(BenchmarkAnalysis({0.01, 0.02}, {0.02}).beta().has_value());
    }
}
