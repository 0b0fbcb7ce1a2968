/**
 * @file test_return_statistics.cpp
 * @brief Tests for date alignment, return construction and annualization
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <limits>

#include "core/advisor_error.hpp"
#include "data/data_loader.hpp"
#include "risk/return_statistics.hpp"

using namespace advisor;
using namespace advisor::risk;
using Catch::Matchers::WithinAbs;

namespace
{
    // Weekly closes 100 * growth^t on the calendar generated from `start`
    PriceSeries geometric_series(const std::string &ticker, size_t weeks, double growth,
                                 const std::string &start = "2022-01-07")
    {
        PriceSeries calendar = DataLoader::generate_synthetic_series(ticker, weeks, start);
        PriceSeries series(ticker);
        int t = 0;
        for (const auto &date : calendar.dates())
        {
            series.add_bar(date, 100.0 * std::pow(growth, t++));
        }
        return series;
    }

    template <typename F>
    AdvisorError capture_error(F &&f)
    {
        try
        {
            f();
        }
        catch (const AdvisorError &e)
        {
            return e;
        }
        FAIL("Expected an AdvisorError");
        return AdvisorError(ErrorCode::SCORER_UNAVAILABLE, "unreachable");
    }
}

TEST_CASE("Expected returns are compounded weekly means", "[ReturnStatistics][Mu]")
{
    ReturnStatistics engine;
    auto stats = engine.compute({geometric_series("AAA", 40, 1.01)});

    REQUIRE(stats.size() == 1);
    REQUIRE(stats.aligned_dates.size() == 40);
    REQUIRE(stats.returns.rows() == 39);
    REQUIRE_THAT(stats.expected_returns(0), WithinAbs(std::pow(1.01, 52) - 1.0, 1e-10));
    REQUIRE_THAT(stats.covariance(0, 0), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(stats.latest_prices.at("AAA"), WithinAbs(100.0 * std::pow(1.01, 39), 1e-9));
}

TEST_CASE("Dates are aligned on the intersection", "[ReturnStatistics][Alignment]")
{
    // BBB starts five weeks after AAA
    ReturnStatistics engine;
    auto stats = engine.compute({geometric_series("AAA", 40, 1.01),
                                 geometric_series("BBB", 40, 1.005, "2022-02-11")});

    REQUIRE(stats.aligned_dates.size() == 35);
    REQUIRE(stats.aligned_dates.front() == "2022-02-11");
    REQUIRE(stats.tickers == std::vector<std::string>{"AAA", "BBB"});
    REQUIRE(stats.valid_counts.at("AAA") == 34);
    REQUIRE(stats.index_of("BBB") == 1);
    REQUIRE(stats.index_of("ZZZ") == -1);
}

TEST_CASE("Undefined returns count as zero in the mean", "[ReturnStatistics][Missing]")
{
    PriceSeries series = geometric_series("AAA", 40, 1.01);
    const std::string gap = series.dates()[10];
    series.add_bar(gap, std::numeric_limits<double>::quiet_NaN());

    ReturnStatistics engine;
    auto stats = engine.compute({series});

    // Returns into and out of the gap are undefined
    REQUIRE(stats.valid_counts.at("AAA") == 37);
    REQUIRE(stats.returns(9, 0) == 0.0);
    REQUIRE(stats.returns(10, 0) == 0.0);
    REQUIRE(stats.returns.allFinite());

    double weekly_mean = 0.01 * 37.0 / 39.0;
    REQUIRE_THAT(stats.expected_returns(0), WithinAbs(std::pow(1.0 + weekly_mean, 52) - 1.0, 1e-10));
}

TEST_CASE("Covariance is the annualized sample covariance", "[ReturnStatistics][Sigma]")
{
    ReturnStatistics engine;
    auto stats = engine.compute({DataLoader::generate_synthetic_series("AAA", 60, "2022-01-07", 0.03, 0.002, 1),
                                 DataLoader::generate_synthetic_series("BBB", 60, "2022-01-07", 0.02, 0.001, 2)});

    Eigen::MatrixXd centered = stats.returns.rowwise() - stats.returns.colwise().mean();
    Eigen::MatrixXd expected = centered.transpose() * centered / (stats.returns.rows() - 1) * 52.0;

    REQUIRE((stats.covariance - expected).cwiseAbs().maxCoeff() < 1e-12);
    REQUIRE_THAT(stats.covariance(0, 1), WithinAbs(stats.covariance(1, 0), 1e-15));
}

TEST_CASE("Instruments are dropped with a reason", "[ReturnStatistics][Dropped]")
{
    ReturnStatistics engine;

    SECTION("Empty series")
    {
        auto stats = engine.compute({geometric_series("AAA", 40, 1.01), PriceSeries("EMPTY")});
        REQUIRE(stats.size() == 1);
        REQUIRE(stats.dropped.at("EMPTY") == "no data");
    }

    SECTION("Invalid latest close")
    {
        PriceSeries bad = geometric_series("BAD", 40, 1.01);
        bad.add_bar(bad.dates().back(), 0.0);

        auto stats = engine.compute({geometric_series("AAA", 40, 1.01), bad});
        REQUIRE(stats.tickers == std::vector<std::string>{"AAA"});
        REQUIRE(stats.dropped.at("BAD") == "invalid latest close");
        REQUIRE(stats.latest_prices.count("BAD") == 0);
    }

    SECTION("Too few valid returns")
    {
        PriceSeries sparse = geometric_series("SPARSE", 40, 1.01);
        auto dates = sparse.dates();
        for (size_t i = 1; i < 30; i += 2)
        {
            sparse.add_bar(dates[i], std::numeric_limits<double>::quiet_NaN());
        }

        auto stats = engine.compute({geometric_series("AAA", 40, 1.01), sparse});
        REQUIRE(stats.tickers == std::vector<std::string>{"AAA"});
        REQUIRE(stats.dropped.count("SPARSE") == 1);
    }
}

TEST_CASE("Statistics failures", "[ReturnStatistics][Errors]")
{
    ReturnStatistics engine;

    SECTION("No series at all")
    {
        auto error = capture_error([&]
                                   { engine.compute({}); });
        REQUIRE(error.code() == ErrorCode::NO_USABLE_INSTRUMENTS);
    }

    SECTION("Fewer than three aligned dates")
    {
        auto error = capture_error([&]
                                   { engine.compute({geometric_series("AAA", 2, 1.01)}); });
        REQUIRE(error.code() == ErrorCode::INSUFFICIENT_HISTORY);
        REQUIRE(error.context().at("aligned_dates") == 2);
        REQUIRE(error.context().at("required") == 3);
    }

    SECTION("Nothing meets the observation minimum")
    {
        auto error = capture_error([&]
                                   { engine.compute({geometric_series("AAA", 20, 1.01)}); });
        REQUIRE(error.code() == ErrorCode::NO_USABLE_INSTRUMENTS);
        REQUIRE(error.context().at("dropped").contains("AAA"));
    }
}

TEST_CASE("Statistics options are validated", "[ReturnStatistics][Options]")
{
    StatisticsOptions options;
    options.min_aligned_dates = 2;
    REQUIRE_THROWS_AS(ReturnStatistics(options), std::invalid_argument);

    options = StatisticsOptions();
    options.min_observations = 5;
    ReturnStatistics relaxed(options);
    auto stats = relaxed.compute({geometric_series("AAA", 10, 1.02)});
    REQUIRE(stats.size() == 1);
}
