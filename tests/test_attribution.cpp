/**
 * @file test_attribution.cpp
 * @brief Tests for return and risk attribution and correlation ranking
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <limits>

#include "folio/analytics/attribution.hpp"
#include "folio/analytics/portfolio_statistics.hpp"
#include "folio/data/data_loader.hpp"
#include "folio/risk/sample_covariance.hpp"

using namespace folio;
using namespace folio::analytics;
using Catch::Matchers::WithinAbs;

class AttributionFixture
{
protected:
    AssetStatistics stats_;
    Eigen::VectorXd weights_;

    AttributionFixture()
    {
        ReturnMatrix returns = DataLoader::generate_synthetic_returns({"A", "B", "C"}, 250, "2023-01-02",
                                                                      0.01, 0.0004, 0.3, 17);
        stats_ = AssetStatistics::compute(returns.get_returns(), risk::SampleCovariance());
        weights_ = Eigen::VectorXd(3);
        weights_ << 0.5, 0.3, 0.2;
    }
};

TEST_CASE_METHOD(AttributionFixture, "Return contributions", "[Attribution]")
{
    Attribution attribution(weights_, stats_, 0.04);
    Eigen::VectorXd contributions = attribution.return_contributions();

    REQUIRE(contributions.size() == 3);
    REQUIRE_THAT(contributions(1), WithinAbs(0.3 * stats_.means(1) * 252.0, 1e-15));
    REQUIRE_THAT(contributions.sum(), WithinAbs(weights_.dot(stats_.means) * 252.0, 1e-12));
}

TEST_CASE_METHOD(AttributionFixture, "Variance contributions", "[Attribution]")
{
    Attribution attribution(weights_, stats_, 0.04);
    Eigen::VectorXd contributions = attribution.variance_contributions();

    // Fractions of variance scaled by the annualization factor
    REQUIRE_THAT(contributions.sum(), WithinAbs(252.0, 1e-9));

    double variance = weights_.dot(stats_.covariance * weights_);
    double expected = weights_(0) * (stats_.covariance * weights_)(0) / variance * 252.0;
    REQUIRE_THAT(contributions(0), WithinAbs(expected, 1e-10));

    SECTION("Zero-volatility portfolio")
    {
        AssetStatistics flat = stats_;
        flat.covariance.setZero();
        Attribution zero(weights_, flat, 0.04);
        REQUIRE(zero.variance_contributions().isZero());
    }
}

TEST_CASE_METHOD(AttributionFixture, "Asset Sharpe ratios", "[Attribution]")
{
    Attribution attribution(weights_, stats_, 0.04);
    auto sharpes = attribution.asset_sharpes();

    REQUIRE(sharpes.size() == 3);
    REQUIRE(sharpes[2].has_value());
    double expected = (stats_.means(2) * 252.0 - 0.04) / (stats_.volatilities(2) * std::sqrt(252.0));
    REQUIRE_THAT(*sharpes[2], WithinAbs(expected, 1e-12));

    SECTION("Flat asset has no Sharpe")
    {
        AssetStatistics flat = stats_;
        flat.volatilities(1) = 0.0;
        Attribution with_flat(weights_, flat, 0.04);
        REQUIRE_FALSE(with_flat.asset_sharpes()[1].has_value());
    }
}

TEST_CASE_METHOD(AttributionFixture, "Attribution input checks", "[Attribution]")
{
    REQUIRE_THROWS_AS(Attribution(Eigen::VectorXd::Ones(2), stats_), std::invalid_argument);
    REQUIRE_THROWS_AS(Attribution(weights_, stats_, 0.04, 0), std::invalid_argument);
}

TEST_CASE("Top correlations", "[Attribution][Correlation]")
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<std::string> tickers = {"A", "B", "C", "D"};
    Eigen::MatrixXd corr(4, 4);
    corr << 1.0, 0.2, -0.9, nan,
            0.2, 1.0, 0.5, nan,
            -0.9, 0.5, 1.0, nan,
            nan, nan, nan, nan;

    SECTION("Ranked by absolute value, upper triangle only")
    {
        auto pairs = Attribution::top_correlations(tickers, corr, 5);
        REQUIRE(pairs.size() == 3);
        REQUIRE(pairs[0].asset1 == "A");
        REQUIRE(pairs[0].asset2 == "C");
        REQUIRE_THAT(pairs[0].correlation, WithinAbs(-0.9, 1e-15));
        REQUIRE(pairs[1].asset1 == "B");
        REQUIRE(pairs[1].asset2 == "C");
        REQUIRE(pairs[2].asset2 == "B");
    }

    SECTION("Count limits the list")
    {
        auto pairs = Attribution::top_correlations(tickers, corr, 1);
        REQUIRE(pairs.size() == 1);
        REQUIRE(pairs[0].asset2 == "C");
    }

    SECTION("Size mismatch")
    {
        REQUIRE_THROWS_AS(Attribution::top_correlations({"A", "B"}, corr, 5), std::invalid_argument);
    }
}
