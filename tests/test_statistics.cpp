/**
 * @file test_statistics.cpp
 * @brief Tests for covariance estimation, asset and portfolio statistics
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <random>

#include "folio/analytics/asset_statistics.hpp"
#include "folio/analytics/portfolio_statistics.hpp"
#include "folio/data/data_loader.hpp"
#include "folio/risk/sample_covariance.hpp"

using namespace folio;
using namespace folio::analytics;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Test Fixture
// ============================================================================

class StatisticsFixture
{
protected:
    Eigen::MatrixXd returns_;

    StatisticsFixture()
    {
        returns_ = Eigen::MatrixXd(5, 3);
        returns_ << 0.010, 0.020, -0.005,
                    -0.020, 0.010, 0.000,
                    0.015, -0.010, 0.010,
                    0.005, 0.000, 0.005,
                    -0.010, 0.015, -0.010;
    }
};

TEST_CASE_METHOD(StatisticsFixture, "Sample covariance", "[SampleCovariance]")
{
    risk::SampleCovariance model;

    SECTION("Matches hand computation")
    {
        Eigen::MatrixXd cov = model.estimate_covariance(returns_);

        std::vector<double> a = to_std_vector(returns_.col(0));
        std::vector<double> b = to_std_vector(returns_.col(1));

        REQUIRE(cov.rows() == 3);
        REQUIRE_THAT(cov(0, 0), WithinAbs(std::pow(sample_std(a), 2), 1e-15));
        REQUIRE_THAT(cov(0, 1), WithinAbs(sample_covariance(a, b), 1e-15));
        REQUIRE_THAT(cov(1, 0), WithinAbs(cov(0, 1), 1e-18));
    }

    SECTION("Single observation is undefined, not an error")
    {
        Eigen::MatrixXd one = returns_.topRows(1);
        Eigen::MatrixXd cov = model.estimate_covariance(one);
        REQUIRE(std::isnan(cov(0, 0)));
        REQUIRE(std::isnan(cov(1, 2)));
    }

    SECTION("Flat column has exactly zero variance")
    {
        Eigen::MatrixXd flat = returns_;
        flat.col(2).setConstant(0.1 + 0.2);
        Eigen::MatrixXd cov = model.estimate_covariance(flat);
        REQUIRE(cov(2, 2) == 0.0);
        REQUIRE(cov(0, 2) == 0.0);
    }

    SECTION("Correlation of a flat column is NaN")
    {
        Eigen::MatrixXd flat = returns_;
        flat.col(1).setConstant(0.001);
        Eigen::MatrixXd corr = model.estimate_correlation(flat);
        REQUIRE_THAT(corr(0, 0), WithinAbs(1.0, 1e-15));
        REQUIRE(std::isnan(corr(0, 1)));
        REQUIRE(std::isnan(corr(1, 1)));
    }

    SECTION("Population normalization divides by n")
    {
        risk::SampleCovariance population(false);
        REQUIRE_FALSE(population.uses_bias_correction());
        REQUIRE(population.get_name() == "SampleCovariance");

        Eigen::MatrixXd unbiased = model.estimate_covariance(returns_);
        Eigen::MatrixXd biased = population.estimate_covariance(returns_);
        REQUIRE_THAT(biased(0, 1), WithinAbs(unbiased(0, 1) * 4.0 / 5.0, 1e-15));

        Eigen::MatrixXd one = returns_.topRows(1);
        REQUIRE(population.estimate_covariance(one)(0, 0) == 0.0);
    }

    SECTION("Rejects non-finite input")
    {
        Eigen::MatrixXd bad = returns_;
        bad(2, 1) = std::nan("");
        REQUIRE_THROWS_AS(model.estimate_covariance(bad), std::invalid_argument);
    }
}

TEST_CASE("Series helpers", "[AssetStatistics]")
{
    REQUIRE(std::isnan(series_mean({})));
    REQUIRE(std::isnan(sample_std({0.01})));
    REQUIRE(sample_std({0.003, 0.003, 0.003}) == 0.0);
    REQUIRE_THAT(sample_std({1.0, 2.0, 3.0, 4.0}), WithinAbs(std::sqrt(5.0 / 3.0), 1e-15));
    REQUIRE(std::isnan(sample_covariance({1.0, 2.0}, {1.0})));
    REQUIRE_THAT(sample_covariance({1.0, 2.0, 3.0}, {2.0, 4.0, 6.0}), WithinAbs(2.0, 1e-15));
}

TEST_CASE_METHOD(StatisticsFixture, "Asset statistics", "[AssetStatistics]")
{
    risk::SampleCovariance model;

    SECTION("Means and volatilities")
    {
        AssetStatistics stats = AssetStatistics::compute(returns_, model);
        REQUIRE_THAT(stats.means(0), WithinAbs(0.0, 1e-15));
        REQUIRE_THAT(stats.means(1), WithinAbs(0.007, 1e-15));
        REQUIRE_THAT(stats.volatilities(1), WithinAbs(sample_std(to_std_vector(returns_.col(1))), 1e-15));
        REQUIRE(stats.is_finite());
    }

    SECTION("Single row leaves dispersion undefined")
    {
        AssetStatistics stats = AssetStatistics::compute(returns_.topRows(1), model);
        REQUIRE_THAT(stats.means(1), WithinAbs(0.02, 1e-15));
        REQUIRE(std::isnan(stats.volatilities(0)));
        REQUIRE_FALSE(stats.is_finite());
    }
}

TEST_CASE_METHOD(StatisticsFixture, "Portfolio statistics", "[PortfolioStatistics]")
{
    risk::SampleCovariance model;
    AssetStatistics stats = AssetStatistics::compute(returns_, model);

    Eigen::VectorXd w(3);
    w << 0.5, 0.3, 0.2;

    SECTION("Daily and annual figures")
    {
        PortfolioStatistics p = PortfolioStatistics::compute(w, stats.means, stats.covariance, 0.04);

        REQUIRE_THAT(p.daily_return, WithinAbs(w.dot(stats.means), 1e-15));
        REQUIRE_THAT(p.daily_volatility, WithinAbs(std::sqrt(w.dot(stats.covariance * w)), 1e-15));
        REQUIRE_THAT(p.annual_return, WithinAbs(p.daily_return * 252.0, 1e-15));
        REQUIRE_THAT(p.annual_volatility, WithinAbs(p.daily_volatility * std::sqrt(252.0), 1e-15));
        REQUIRE(p.annual_sharpe.has_value());
        REQUIRE_THAT(*p.annual_sharpe, WithinAbs((p.annual_return - 0.04) / p.annual_volatility, 1e-12));
        REQUIRE(p.daily_sharpe.has_value());
        REQUIRE_THAT(*p.daily_sharpe, WithinAbs((p.daily_return - 0.04 / 252.0) / p.daily_volatility, 1e-12));
    }

    SECTION("Return series is the weighted sum of columns")
    {
        std::vector<double> series = portfolio_return_series(returns_, w);
        REQUIRE(series.size() == 5);
        REQUIRE_THAT(series[0], WithinAbs(0.5 * 0.010 + 0.3 * 0.020 + 0.2 * -0.005, 1e-15));
        REQUIRE_THROWS_AS(portfolio_return_series(returns_, Eigen::VectorXd::Ones(2)), std::invalid_argument);
    }

    SECTION("Zero volatility has no Sharpe")
    {
        REQUIRE_FALSE(sharpe_ratio(0.05, 0.0, 0.04).has_value());
        REQUIRE_FALSE(diversification_ratio(w, stats.volatilities, 0.0).has_value());
    }

    SECTION("Dimension mismatch")
    {
        REQUIRE_THROWS_AS(PortfolioStatistics::compute(Eigen::VectorXd::Ones(2), stats.means, stats.covariance, 0.04),
                          std::invalid_argument);
    }
}

TEST_CASE("Volatility and diversification bounds", "[PortfolioStatistics][Property]")
{
    ReturnMatrix returns = DataLoader::generate_synthetic_returns({"A", "B", "C", "D"}, 300, "2021-01-04",
                                                                  0.012, 0.0003, 0.4, 11);
    risk::SampleCovariance model;
    AssetStatistics stats = AssetStatistics::compute(returns.get_returns(), model);

    std::mt19937 gen(3);
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    for (int trial = 0; trial < 50; ++trial)
    {
        Eigen::VectorXd w(4);
        for (int i = 0; i < 4; ++i)
        {
            w(i) = dist(gen);
        }
        w /= w.sum();

        double vol = portfolio_volatility(w, stats.covariance);
        REQUIRE(vol >= 0.0);
        REQUIRE(vol <= w.dot(stats.volatilities) + 1e-15);

        auto ratio = diversification_ratio(w, stats.volatilities, vol);
        REQUIRE(ratio.has_value());
        REQUIRE(*ratio >= 1.0);
    }

    SECTION("Perfectly correlated assets give a ratio of one")
    {
        Eigen::MatrixXd data(4, 2);
        data << 0.01, 0.02,
                -0.02, -0.04,
                0.03, 0.06,
                0.00, 0.00;
        AssetStatistics linked = AssetStatistics::compute(data, model);
        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        double vol = portfolio_volatility(w, linked.covariance);
        auto ratio = diversification_ratio(w, linked.volatilities, vol);
        REQUIRE(ratio.has_value());
        REQUIRE_THAT(*ratio, WithinRel(1.0, 1e-12));
    }
}
