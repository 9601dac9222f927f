/**
 * @file test_return_matrix.cpp
 * @brief Unit tests for ReturnMatrix and weight validation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <limits>

#include "folio/data/return_matrix.hpp"
#include "folio/data/weight_vector.hpp"

using namespace folio;
using Catch::Matchers::WithinAbs;

namespace
{
    ReturnMatrix make_matrix()
    {
        Eigen::MatrixXd data(3, 2);
        data << 0.01, -0.02,
                0.00, 0.01,
                -0.01, 0.03;
        return ReturnMatrix(data, {"2024-01-02", "2024-01-03", "2024-01-04"}, {"AAA", "BBB"});
    }
}

TEST_CASE("ReturnMatrix construction", "[ReturnMatrix]")
{
    SECTION("Valid matrix exposes dimensions and names")
    {
        ReturnMatrix returns = make_matrix();
        REQUIRE(returns.num_dates() == 3);
        REQUIRE(returns.num_assets() == 2);
        REQUIRE(returns.get_tickers()[1] == "BBB");
        REQUIRE(returns.find_ticker_index("BBB") == 1);
        REQUIRE(returns.find_ticker_index("CCC") == -1);
        REQUIRE(returns.has_ticker("AAA"));
    }

    SECTION("Asset column lookup")
    {
        ReturnMatrix returns = make_matrix();
        Eigen::VectorXd b = returns.get_asset_returns("BBB");
        REQUIRE(b.size() == 3);
        REQUIRE_THAT(b(2), WithinAbs(0.03, 1e-15));
        REQUIRE_THROWS_AS(returns.get_asset_returns("CCC"), std::invalid_argument);
    }

    SECTION("Single row is accepted")
    {
        Eigen::MatrixXd data(1, 2);
        data << 0.01, 0.02;
        REQUIRE_NOTHROW(ReturnMatrix(data, {"2024-01-02"}, {"AAA", "BBB"}));
    }
}

TEST_CASE("ReturnMatrix rejects invalid input", "[ReturnMatrix][Validation]")
{
    Eigen::MatrixXd data = Eigen::MatrixXd::Zero(2, 2);

    SECTION("Empty matrix")
    {
        REQUIRE_THROWS_AS(ReturnMatrix(Eigen::MatrixXd(0, 0), {}, {}), ValidationError);
    }

    SECTION("Dates out of order")
    {
        REQUIRE_THROWS_AS(ReturnMatrix(data, {"2024-01-03", "2024-01-02"}, {"A", "B"}), ValidationError);
    }

    SECTION("Duplicate dates")
    {
        REQUIRE_THROWS_AS(ReturnMatrix(data, {"2024-01-02", "2024-01-02"}, {"A", "B"}), ValidationError);
    }

    SECTION("Malformed date")
    {
        REQUIRE_THROWS_AS(ReturnMatrix(data, {"2024-1-2", "2024-01-03"}, {"A", "B"}), ValidationError);
        REQUIRE_THROWS_AS(ReturnMatrix(data, {"2024-13-01", "2024-12-03"}, {"A", "B"}), ValidationError);
    }

    SECTION("Duplicate or empty asset names")
    {
        REQUIRE_THROWS_AS(ReturnMatrix(data, {"2024-01-02", "2024-01-03"}, {"A", "A"}), ValidationError);
        REQUIRE_THROWS_AS(ReturnMatrix(data, {"2024-01-02", "2024-01-03"}, {"A", ""}), ValidationError);
    }

    SECTION("Shape mismatch")
    {
        REQUIRE_THROWS_AS(ReturnMatrix(data, {"2024-01-02"}, {"A", "B"}), ValidationError);
        REQUIRE_THROWS_AS(ReturnMatrix(data, {"2024-01-02", "2024-01-03"}, {"A"}), ValidationError);
    }

    SECTION("Non-finite cell")
    {
        data(1, 0) = std::numeric_limits<double>::quiet_NaN();
        try
        {
            ReturnMatrix invalid(data, {"2024-01-02", "2024-01-03"}, {"A", "B"});
            FAIL("Expected ValidationError");
        }
        catch (const ValidationError &e)
        {
            REQUIRE(e.field() == "returns");
        }
    }
}

TEST_CASE("Weight validation", "[Weights]")
{
    SECTION("Valid weights within tolerance")
    {
        Eigen::VectorXd w(3);
        w << 0.3, 0.3, 0.395;
        REQUIRE_NOTHROW(validate_weights(w, 3));
    }

    SECTION("Sum of 1.1 is rejected, not renormalized")
    {
        Eigen::VectorXd w(2);
        w << 0.5, 0.6;
        try
        {
            validate_weights(w, 2);
            FAIL("Expected ValidationError");
        }
        catch (const ValidationError &e)
        {
            REQUIRE(e.field() == "weights");
        }
        REQUIRE_THAT(w(1), WithinAbs(0.6, 1e-15));
    }

    SECTION("Negative weight")
    {
        Eigen::VectorXd w(2);
        w << 1.2, -0.2;
        REQUIRE_THROWS_AS(validate_weights(w, 2), ValidationError);
    }

    SECTION("Wrong length")
    {
        Eigen::VectorXd w = Eigen::VectorXd::Constant(3, 1.0 / 3.0);
        REQUIRE_THROWS_AS(validate_weights(w, 2), ValidationError);
    }

    SECTION("ValidationError is an invalid_argument")
    {
        Eigen::VectorXd w(2);
        w << 0.5, 0.6;
        REQUIRE_THROWS_AS(validate_weights(w, 2), std::invalid_argument);
    }

    SECTION("Equal weights")
    {
        Eigen::VectorXd w = equal_weights(4);
        REQUIRE(w.size() == 4);
        REQUIRE_THAT(w.sum(), WithinAbs(1.0, 1e-15));
        REQUIRE_THAT(w(0), WithinAbs(0.25, 1e-15));
        REQUIRE_THROWS_AS(equal_weights(0), std::invalid_argument);
    }
}
