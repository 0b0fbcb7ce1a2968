/**
 * @file test_recommendation_engine.cpp
 * @brief End-to-end tests of the recommendation pipeline on synthetic data
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/advisor_error.hpp"
#include "data/data_loader.hpp"
#include "risk/return_statistics.hpp"
#include "scoring/linear_scorer.hpp"
#include "service/recommendation_engine.hpp"

#include <cmath>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>

using namespace advisor;
using namespace advisor::service;
using Catch::Matchers::WithinAbs;

namespace
{
    template <typename F>
    ErrorCode error_code_of(F &&f)
    {
        try
        {
            f();
        }
        catch (const AdvisorError &e)
        {
            return e.code();
        }
        FAIL("Expected an AdvisorError");
        return ErrorCode::SCORER_UNAVAILABLE;
    }

    enum class StubMode
    {
        THROWS,
        WRONG_LENGTH,
        NON_FINITE
    };

    class StubScorer : public scoring::Scorer
    {
    public:
        explicit StubScorer(StubMode mode) : mode_(mode) {}

        Eigen::VectorXd score(const Eigen::MatrixXd &features,
                              const std::vector<std::string> &) const override
        {
            switch (mode_)
            {
            case StubMode::THROWS:
                throw std::runtime_error("model session failed");
            case StubMode::WRONG_LENGTH:
                return Eigen::VectorXd::Zero(features.rows() + 1);
            case StubMode::NON_FINITE:
                break;
            }
            return Eigen::VectorXd::Constant(features.rows(), std::numeric_limits<double>::quiet_NaN());
        }

        std::vector<std::string> feature_columns() const override
        {
            return features::FeatureSchema::default_schema().columns;
        }

        int schema_version() const override { return 1; }

        std::string get_name() const override { return "StubScorer"; }

    private:
        StubMode mode_;
    };
}

// ============================================================================
// Test Fixture
// ============================================================================

class EngineTestFixture
{
protected:
    AdvisorConfig config_;
    std::shared_ptr<data::InMemoryDataProvider> provider_;
    std::shared_ptr<scoring::LinearScorer> scorer_;
    double mid_target_;
    double max_return_;

    EngineTestFixture()
        : config_(AdvisorConfig::defaults()),
          provider_(std::make_shared<data::InMemoryDataProvider>())
    {
        config_.data.universe = {"AMZN", "GOOG", "JPM", "MA", "XOM", "CVX"};

        const double vols[] = {0.045, 0.040, 0.032, 0.030, 0.035, 0.034};
        const double drifts[] = {0.004, 0.003, 0.002, 0.0025, 0.001, 0.0015};
        for (size_t i = 0; i < config_.data.universe.size(); ++i)
        {
            const std::string &ticker = config_.data.universe[i];
            provider_->add_series(DataLoader::generate_synthetic_series(
                ticker, 80, "2022-01-07", vols[i], drifts[i], 100 + static_cast<unsigned int>(i), 0.5));
            provider_->add_overview(ticker, {{"Beta", "1.0"}, {"MarketCapitalization", "100000000000"}});
        }

        scorer_ = std::make_shared<scoring::LinearScorer>(
            features::FeatureSchema::default_schema().columns,
            (Eigen::VectorXd(8) << 6.0, 4.0, 0.5, 0.3, -0.2, 2.0, 0.02, 0.0).finished(),
            -0.6, scoring::LinkFunction::LOGISTIC, 1);

        risk::ReturnStatistics statistics;
        auto stats = statistics.compute({provider_->fetch_weekly_series("AMZN"),
                                         provider_->fetch_weekly_series("GOOG"),
                                         provider_->fetch_weekly_series("JPM"),
                                         provider_->fetch_weekly_series("MA"),
                                         provider_->fetch_weekly_series("XOM"),
                                         provider_->fetch_weekly_series("CVX")});
        max_return_ = stats.expected_returns.maxCoeff();
        mid_target_ = 0.5 * (stats.expected_returns.minCoeff() + max_return_);
    }

    RecommendationRequest request(double target, double budget = 0.0,
                                  const std::vector<std::string> &held = {}) const
    {
        RecommendationRequest r;
        r.target_return = target;
        r.budget = budget;
        for (const auto &ticker : held)
        {
            Holding h;
            h.ticker = ticker;
            h.shares = 10;
            r.holdings.push_back(h);
        }
        return r;
    }
};

// ============================================================================
// Request parsing
// ============================================================================

TEST_CASE("Request parsing", "[RecommendationEngine][Request]")
{
    SECTION("Tickers are trimmed and upper-cased")
    {
        nlohmann::json j = {
            {"holdings", {{{"ticker", " xom "}, {"shares", 40}, {"pricePaid", 98.5}},
                          {{"ticker", ""}, {"shares", 1}}}},
            {"targetReturn", 0.09},
            {"budget", 10000}};

        auto r = RecommendationRequest::from_json(j);
        REQUIRE(r.holdings.size() == 1);
        REQUIRE(r.holdings[0].ticker == "XOM");
        REQUIRE(r.holdings[0].shares == 40.0);
        REQUIRE_THAT(r.target_return, WithinAbs(0.09, 1e-15));
        REQUIRE(r.budget == 10000.0);
        REQUIRE(r.held_tickers() == std::set<std::string>{"XOM"});
    }

    SECTION("Budget defaults to zero")
    {
        auto r = RecommendationRequest::from_json({{"targetReturn", "0.1"}});
        REQUIRE(r.budget == 0.0);
        REQUIRE_THAT(r.target_return, WithinAbs(0.1, 1e-15));
    }

    SECTION("Invalid targets")
    {
        REQUIRE(error_code_of([]
                              { RecommendationRequest::from_json({{"holdings", nlohmann::json::array()}}); }) ==
                ErrorCode::INVALID_TARGET);
        REQUIRE(error_code_of([]
                              { RecommendationRequest::from_json({{"targetReturn", "abc"}}); }) ==
                ErrorCode::INVALID_TARGET);
        REQUIRE(error_code_of([]
                              { RecommendationRequest::from_json({{"targetReturn", nullptr}}); }) ==
                ErrorCode::INVALID_TARGET);
    }
}

// ============================================================================
// Pipeline
// ============================================================================

TEST_CASE_METHOD(EngineTestFixture, "Full pipeline", "[RecommendationEngine][Pipeline]")
{
    RecommendationEngine engine(config_, provider_, scorer_);
    auto response = engine.recommend(request(mid_target_, 10000.0, {"XOM", "JPM"}));

    REQUIRE(response.universe.size() == 6);
    REQUIRE(response.feature_order == features::FeatureSchema::default_schema().columns);
    REQUIRE(response.recommendations.size() == 4);
    REQUIRE_THAT(response.baseline_weights.sum(), WithinAbs(1.0, 1e-6));

    SECTION("Held instruments are never recommended")
    {
        for (const auto &rec : response.recommendations)
        {
            REQUIRE(rec.ticker != "XOM");
            REQUIRE(rec.ticker != "JPM");
        }
    }

    SECTION("Scores are in descending order")
    {
        for (size_t i = 1; i < response.recommendations.size(); ++i)
        {
            REQUIRE(response.recommendations[i - 1].score >= response.recommendations[i].score);
        }
    }

    SECTION("Shares use the latest price and an even budget split")
    {
        for (const auto &rec : response.recommendations)
        {
            REQUIRE(rec.price > 0.0);
            REQUIRE(rec.shares == static_cast<long>(std::floor(2500.0 / rec.price)));
        }
    }

    SECTION("Identical requests give identical output")
    {
        auto again = engine.recommend(request(mid_target_, 10000.0, {"XOM", "JPM"}));
        REQUIRE(again.to_json() == response.to_json());
    }

    SECTION("Summaries go to the given stream, not the JSON body")
    {
        std::ostringstream summary;
        response.print_summary(summary);
        response.baseline.print_summary(response.universe, summary);

        const std::string text = summary.str();
        REQUIRE(text.find("Recommendations (4)") != std::string::npos);
        REQUIRE(text.find(response.recommendations.front().ticker) != std::string::npos);

        // The body stays parseable on its own
        auto reparsed = nlohmann::json::parse(response.to_json().dump(2));
        REQUIRE(reparsed == response.to_json());
    }

    SECTION("JSON body")
    {
        auto j = response.to_json();
        REQUIRE(j["recommendations"].size() == 4);
        REQUIRE(j["featureOrder"].size() == 8);
        REQUIRE(j["recommendations"][0].contains("reason"));
    }
}

TEST_CASE_METHOD(EngineTestFixture, "Everything already held", "[RecommendationEngine][Pipeline]")
{
    RecommendationEngine engine(config_, provider_, scorer_);
    auto response = engine.recommend(request(mid_target_, 0.0, config_.data.universe));

    REQUIRE(response.recommendations.empty());
    REQUIRE(response.feature_order.size() == 8);
}

TEST_CASE_METHOD(EngineTestFixture, "Unavailable instruments are skipped", "[RecommendationEngine][Pipeline]")
{
    config_.data.universe.push_back("MISSING");
    RecommendationEngine engine(config_, provider_, scorer_);
    auto response = engine.recommend(request(mid_target_));

    REQUIRE(response.universe.size() == 6);
    REQUIRE(response.dropped.count("MISSING") == 1);
    REQUIRE(response.recommendations.size() == 5);
}

TEST_CASE_METHOD(EngineTestFixture, "Configured tickers are normalized before lookup", "[RecommendationEngine][Pipeline]")
{
    config_.data.universe = {" amzn", "goog ", "Jpm", "ma", "xom", "CVX"};
    RecommendationEngine engine(config_, provider_, scorer_);
    auto response = engine.recommend(request(mid_target_, 0.0, {"xom"}));

    REQUIRE(response.dropped.empty());
    REQUIRE(response.universe.size() == 6);
    REQUIRE(response.universe.front() == "AMZN");
    REQUIRE(response.recommendations.size() == 5);
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE_METHOD(EngineTestFixture, "Pipeline failures", "[RecommendationEngine][Errors]")
{
    SECTION("Target above every expected return")
    {
        RecommendationEngine engine(config_, provider_, scorer_);
        REQUIRE(error_code_of([&]
                              { engine.recommend(request(max_return_ + 0.5)); }) ==
                ErrorCode::INFEASIBLE_TARGET);
    }

    SECTION("Non-finite target")
    {
        RecommendationEngine engine(config_, provider_, scorer_);
        REQUIRE(error_code_of([&]
                              { engine.recommend(request(std::numeric_limits<double>::infinity())); }) ==
                ErrorCode::INVALID_TARGET);
    }

    SECTION("Not enough history")
    {
        auto short_provider = std::make_shared<data::InMemoryDataProvider>();
        for (const auto &ticker : config_.data.universe)
        {
            short_provider->add_series(DataLoader::generate_synthetic_series(ticker, 2));
        }
        RecommendationEngine engine(config_, short_provider, scorer_);
        REQUIRE(error_code_of([&]
                              { engine.recommend(request(0.05)); }) ==
                ErrorCode::INSUFFICIENT_HISTORY);
    }

    SECTION("Scorer throws")
    {
        RecommendationEngine engine(config_, provider_, std::make_shared<StubScorer>(StubMode::THROWS));
        REQUIRE(error_code_of([&]
                              { engine.recommend(request(mid_target_)); }) ==
                ErrorCode::SCORER_UNAVAILABLE);
    }

    SECTION("Scorer returns the wrong number of scores")
    {
        RecommendationEngine engine(config_, provider_, std::make_shared<StubScorer>(StubMode::WRONG_LENGTH));
        REQUIRE(error_code_of([&]
                              { engine.recommend(request(mid_target_)); }) ==
                ErrorCode::SCORER_UNAVAILABLE);
    }

    SECTION("Scorer returns NaN")
    {
        RecommendationEngine engine(config_, provider_, std::make_shared<StubScorer>(StubMode::NON_FINITE));
        REQUIRE(error_code_of([&]
                              { engine.recommend(request(mid_target_)); }) ==
                ErrorCode::SCORER_UNAVAILABLE);
    }
}

TEST_CASE_METHOD(EngineTestFixture, "Schema mismatches are caught at startup", "[RecommendationEngine][Errors]")
{
    SECTION("Model trained on a different column order")
    {
        auto columns = features::FeatureSchema::default_schema().columns;
        std::swap(columns[2], columns[3]);
        auto reordered = std::make_shared<scoring::LinearScorer>(columns, Eigen::VectorXd::Ones(8));

        REQUIRE(error_code_of([&]
                              { RecommendationEngine engine(config_, provider_, reordered); }) ==
                ErrorCode::FEATURE_DIMENSION_MISMATCH);
    }

    SECTION("Schema file with a missing column")
    {
        auto schema = features::FeatureSchema::default_schema();
        schema.columns.pop_back();

        REQUIRE(error_code_of([&]
                              { RecommendationEngine engine(config_, provider_, scorer_, schema); }) ==
                ErrorCode::FEATURE_DIMENSION_MISMATCH);
    }

    SECTION("Null collaborators")
    {
        REQUIRE_THROWS_AS(RecommendationEngine(config_, nullptr, scorer_), std::invalid_argument);
        REQUIRE_THROWS_AS(RecommendationEngine(config_, provider_, nullptr), std::invalid_argument);
    }
}
