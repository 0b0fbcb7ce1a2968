/**
 * @file test_portfolio_metrics.cpp
 * @brief Tests for the normal distribution helpers and PortfolioMetrics
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "analytics/portfolio_metrics.hpp"
#include "core/advisor_error.hpp"

#include <cmath>
#include <stdexcept>

using namespace advisor;
using namespace advisor::analytics;
using Catch::Matchers::WithinAbs;

TEST_CASE("Inverse normal CDF", "[PortfolioMetrics][Normal]")
{
    SECTION("Central region")
    {
        REQUIRE_THAT(inverse_normal_cdf(0.5), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(inverse_normal_cdf(0.95), WithinAbs(1.6448536269514715, 1e-8));
        REQUIRE_THAT(inverse_normal_cdf(0.975), WithinAbs(1.9599639845400536, 1e-8));
    }

    SECTION("Symmetric about one half")
    {
        REQUIRE_THAT(inverse_normal_cdf(0.05), WithinAbs(-inverse_normal_cdf(0.95), 1e-8));
        REQUIRE_THAT(inverse_normal_cdf(0.01), WithinAbs(-inverse_normal_cdf(0.99), 1e-8));
    }

    SECTION("Deep tails stay finite")
    {
        REQUIRE_THAT(inverse_normal_cdf(1e-10), WithinAbs(-6.361340902404056, 1e-6));
        REQUIRE(std::isfinite(inverse_normal_cdf(1.0 - 1e-12)));
    }

    SECTION("Outside the open interval")
    {
        REQUIRE_THROWS_AS(inverse_normal_cdf(0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(inverse_normal_cdf(1.0), std::invalid_argument);
    }
}

TEST_CASE("Normal PDF", "[PortfolioMetrics][Normal]")
{
    REQUIRE_THAT(normal_pdf(0.0), WithinAbs(0.3989422804014327, 1e-15));
    REQUIRE_THAT(normal_pdf(1.6448536269514715), WithinAbs(0.10313564037537153, 1e-12));
    REQUIRE_THAT(normal_pdf(-1.3), WithinAbs(normal_pdf(1.3), 1e-15));
}

TEST_CASE("Single asset portfolio metrics", "[PortfolioMetrics]")
{
    Eigen::VectorXd w(1);
    w << 1.0;
    Eigen::VectorXd mu(1);
    mu << 0.10;
    Eigen::MatrixXd sigma(1, 1);
    sigma << 0.04;

    PortfolioMetrics metrics(0.043, 0.95);

    REQUIRE_THAT(metrics.expected_return(w, mu), WithinAbs(0.10, 1e-15));
    REQUIRE_THAT(metrics.volatility(w, sigma), WithinAbs(0.20, 1e-15));
    REQUIRE_THAT(metrics.sharpe_ratio(w, mu, sigma), WithinAbs(0.285, 1e-12));
    REQUIRE_THAT(metrics.conditional_var(w, mu, sigma), WithinAbs(0.31254256150148607, 1e-8));
}

TEST_CASE("Zero variance has no Sharpe ratio", "[PortfolioMetrics][Errors]")
{
    Eigen::VectorXd w = Eigen::VectorXd::Constant(2, 0.5);
    Eigen::VectorXd mu = Eigen::VectorXd::Constant(2, 0.05);
    Eigen::MatrixXd sigma = Eigen::MatrixXd::Zero(2, 2);

    PortfolioMetrics metrics;
    try
    {
        metrics.sharpe_ratio(w, mu, sigma);
        FAIL("Expected an AdvisorError");
    }
    catch (const AdvisorError &e)
    {
        REQUIRE(e.code() == ErrorCode::DEGENERATE_BASELINE);
    }

    // CVaR of a riskless portfolio is just the negated mean
    REQUIRE_THAT(metrics.conditional_var(w, mu, sigma), WithinAbs(-0.05, 1e-15));
}

TEST_CASE("Confidence level is validated", "[PortfolioMetrics][Errors]")
{
    REQUIRE_THROWS_AS(PortfolioMetrics(0.043, 0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(PortfolioMetrics(0.043, 1.0), std::invalid_argument);
}
