/**
 * @file test_feature_assembler.cpp
 * @brief Tests for FeatureSchema and FeatureAssembler
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/advisor_error.hpp"
#include "features/feature_assembler.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

using namespace advisor;
using namespace advisor::features;
using Catch::Matchers::WithinAbs;

namespace
{
    ErrorCode code_of_mismatch(const FeatureSchema &expected, const FeatureSchema &actual)
    {
        try
        {
            expected.check_compatible(actual);
        }
        catch (const AdvisorError &e)
        {
            return e.code();
        }
        FAIL("Expected an AdvisorError");
        return ErrorCode::SCORER_UNAVAILABLE;
    }
}

TEST_CASE("Default schema column contract", "[FeatureSchema]")
{
    FeatureSchema schema = FeatureSchema::default_schema();

    REQUIRE(schema.version == 1);
    REQUIRE(schema.columns == std::vector<std::string>{"deltaSharpe", "deltaCvar", "mom6", "mom12",
                                                       "beta", "divYield", "logCap", "targetReturn"});
}

TEST_CASE("Schema parsing", "[FeatureSchema]")
{
    SECTION("Plain array")
    {
        auto schema = FeatureSchema::from_json(FeatureSchema::default_schema().columns);
        REQUIRE(schema == FeatureSchema::default_schema());
    }

    SECTION("Versioned object")
    {
        nlohmann::json j = {{"version", 2}, {"columns", {"deltaSharpe", "beta"}}};
        auto schema = FeatureSchema::from_json(j);
        REQUIRE(schema.version == 2);
        REQUIRE(schema.size() == 2);
    }

    SECTION("Malformed")
    {
        REQUIRE_THROWS_AS(FeatureSchema::from_json(nlohmann::json{{"names", 1}}), std::invalid_argument);
        REQUIRE_THROWS_AS(FeatureSchema::from_json(nlohmann::json::array()), std::invalid_argument);
    }
}

TEST_CASE("Schema compatibility checks", "[FeatureSchema][Errors]")
{
    const FeatureSchema expected = FeatureSchema::default_schema();

    SECTION("Identical schema passes")
    {
        REQUIRE_NOTHROW(expected.check_compatible(FeatureSchema::default_schema()));
        REQUIRE_NOTHROW(expected.check_dimension(8));
    }

    SECTION("Reordered columns")
    {
        FeatureSchema swapped = expected;
        std::swap(swapped.columns[0], swapped.columns[1]);
        REQUIRE(code_of_mismatch(expected, swapped) == ErrorCode::FEATURE_DIMENSION_MISMATCH);
    }

    SECTION("Missing column")
    {
        FeatureSchema shorter = expected;
        shorter.columns.pop_back();
        REQUIRE(code_of_mismatch(expected, shorter) == ErrorCode::FEATURE_DIMENSION_MISMATCH);
    }

    SECTION("Different version")
    {
        FeatureSchema newer = expected;
        newer.version = 2;
        REQUIRE(code_of_mismatch(expected, newer) == ErrorCode::FEATURE_DIMENSION_MISMATCH);
    }

    SECTION("Matrix width")
    {
        REQUIRE_THROWS_AS(expected.check_dimension(7), AdvisorError);
    }
}

TEST_CASE("Feature matrix assembly", "[FeatureAssembler]")
{
    FeatureAssembler assembler;

    analytics::MarginalMap marginals;
    marginals["AAA"] = {0.02, 0.01};
    marginals["BBB"] = {-0.01, std::numeric_limits<double>::quiet_NaN()};

    FundamentalMap fundamentals;
    FundamentalRow row;
    row.beta = 1.1;
    row.div_yield = 0.03;
    row.log_cap = 26.0;
    row.mom6 = 0.05;
    row.mom12 = 0.12;
    fundamentals["AAA"] = row;

    std::vector<std::string> candidates{"AAA", "BBB", "CCC"};
    Eigen::MatrixXd x = assembler.build(candidates, marginals, fundamentals, 0.09);

    REQUIRE(x.rows() == 3);
    REQUIRE(x.cols() == 8);
    REQUIRE(x.allFinite());

    SECTION("Row follows schema order")
    {
        Eigen::VectorXd expected(8);
        expected << 0.02, 0.01, 0.05, 0.12, 1.1, 0.03, 26.0, 0.09;
        REQUIRE((x.row(0).transpose() - expected).cwiseAbs().maxCoeff() < 1e-15);
    }

    SECTION("Missing values become zero")
    {
        REQUIRE(x(1, 0) == -0.01);
        REQUIRE(x(1, 1) == 0.0);
        REQUIRE(x.row(1).segment(2, 5).isZero());
        REQUIRE(x.row(2).head(7).isZero());
    }

    SECTION("Target return is broadcast")
    {
        REQUIRE((x.col(7).array() == 0.09).all());
    }
}

TEST_CASE("Empty candidate list", "[FeatureAssembler]")
{
    FeatureAssembler assembler;
    Eigen::MatrixXd x = assembler.build({}, {}, {}, 0.09);
    REQUIRE(x.rows() == 0);
    REQUIRE(x.cols() == 8);
}

TEST_CASE("Unknown column is rejected", "[FeatureAssembler][Errors]")
{
    FeatureSchema schema = FeatureSchema::default_schema();
    schema.columns.push_back("sentiment");
    REQUIRE_THROWS_AS(FeatureAssembler(schema), std::invalid_argument);
}
