/**
 * @file test_data_provider.cpp
 * @brief Tests for the data providers, series cache and fundamentals adapter
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "data/data_loader.hpp"
#include "data/data_provider.hpp"
#include "data/fundamentals.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>

using namespace advisor;
using namespace advisor::data;
using Catch::Matchers::WithinAbs;

namespace
{
    std::string make_cache_dir(const std::string &name)
    {
        auto dir = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        return dir.string();
    }

    void write_json(const std::string &dir, const std::string &file, const nlohmann::json &j)
    {
        std::ofstream out((std::filesystem::path(dir) / file).string());
        out << j.dump();
    }
}

TEST_CASE("FileDataProvider reads the weekly cache", "[DataProvider][File]")
{
    const std::string dir = make_cache_dir("advisor_cache_test");
    PriceSeries generated = DataLoader::generate_synthetic_series("XOM", 40, "2022-01-07", 0.03, 0.002, 3, 0.9);
    DataLoader::save_weekly_cache(generated, dir);
    write_json(dir, "overview_XOM.json", {{"Beta", "0.85"}, {"MarketCapitalization", "460000000000"}, {"Sector", "ENERGY"}});

    auto cache = std::make_shared<SeriesCache>();
    FileDataProvider provider(dir, cache);

    SECTION("Series round trip")
    {
        PriceSeries series = provider.fetch_weekly_series("XOM");
        REQUIRE(series.ticker() == "XOM");
        REQUIRE(series.size() == 40);
        REQUIRE_THAT(series.last_close(), WithinAbs(generated.last_close(), 1e-4));
        REQUIRE_THAT(series.trailing_dividend_yield(), WithinAbs(generated.trailing_dividend_yield(), 1e-5));
    }

    SECTION("Parsed series are memoized")
    {
        provider.fetch_weekly_series("XOM");
        REQUIRE(cache->size() == 1);

        // A second provider sharing the cache never touches the file
        std::filesystem::remove(std::filesystem::path(dir) / "weekly_XOM.json");
        FileDataProvider second(dir, cache);
        REQUIRE(second.fetch_weekly_series("XOM").size() == 40);
    }

    SECTION("Overview")
    {
        auto overview = provider.fetch_overview("XOM");
        REQUIRE(overview.has_value());
        REQUIRE((*overview)["Sector"] == "ENERGY");
        REQUIRE_FALSE(provider.fetch_overview("CVX").has_value());
    }

    SECTION("Missing ticker")
    {
        REQUIRE_THROWS_AS(provider.fetch_weekly_series("CVX"), std::runtime_error);
    }
}

TEST_CASE("FileDataProvider requires an existing directory", "[DataProvider][File]")
{
    REQUIRE_THROWS_AS(FileDataProvider("/nonexistent/advisor-cache"), std::invalid_argument);
}

TEST_CASE("Weekly series parsing", "[DataProvider][Parse]")
{
    nlohmann::json raw = {
        {"Meta Data", {{"2. Symbol", "CVX"}}},
        {"Weekly Adjusted Time Series", {
            {"2024-01-05", {{"4. close", "150.10"}, {"7. dividend amount", "1.6300"}}},
            {"2024-01-12", {{"4. close", "None"}, {"7. dividend amount", "0.0000"}}},
            {"not-a-date", {{"4. close", "1.0"}}}
        }}};

    PriceSeries series = FileDataProvider::parse_weekly_series("CVX", raw);

    REQUIRE(series.size() == 2);
    REQUIRE_THAT(series.close_at("2024-01-05"), WithinAbs(150.10, 1e-12));
    REQUIRE(std::isnan(series.close_at("2024-01-12")));
    REQUIRE_THAT(series.bars().at("2024-01-05").dividend, WithinAbs(1.63, 1e-12));

    REQUIRE_THROWS_AS(FileDataProvider::parse_weekly_series("CVX", nlohmann::json::array()), std::runtime_error);
}

TEST_CASE("InMemoryDataProvider", "[DataProvider][Memory]")
{
    InMemoryDataProvider provider;
    provider.add_series(DataLoader::generate_synthetic_series("JPM", 10));
    provider.add_overview("JPM", {{"Beta", 1.1}});

    REQUIRE(provider.fetch_weekly_series("JPM").size() == 10);
    REQUIRE(provider.fetch_overview("JPM").has_value());
    REQUIRE_FALSE(provider.fetch_overview("MA").has_value());
    REQUIRE_THROWS_AS(provider.fetch_weekly_series("MA"), std::runtime_error);
}

TEST_CASE("Fundamentals normalization", "[Fundamentals]")
{
    PriceSeries series = DataLoader::generate_synthetic_series("MA", 60, "2022-01-07", 0.02, 0.002, 11, 0.66);

    SECTION("String-encoded provider fields")
    {
        nlohmann::json overview = {{"Beta", "1.08"}, {"MarketCapitalization", "430000000000"}, {"Sector", "FINANCIAL SERVICES"}};
        FundamentalRow row = FundamentalsAdapter::normalize(overview, series);

        REQUIRE_THAT(row.beta, WithinAbs(1.08, 1e-12));
        REQUIRE_THAT(row.log_cap, WithinAbs(std::log(4.3e11), 1e-9));
        REQUIRE(row.sector == "FINANCIAL SERVICES");
        REQUIRE_THAT(row.mom6, WithinAbs(series.momentum(26), 1e-15));
        REQUIRE_THAT(row.mom12, WithinAbs(series.momentum(52), 1e-15));
        REQUIRE(row.div_yield > 0.0);
    }

    SECTION("Missing and invalid fields become zero")
    {
        nlohmann::json overview = {{"Beta", "None"}, {"MarketCapitalization", "-"}};
        FundamentalRow row = FundamentalsAdapter::normalize(overview, series);

        REQUIRE(row.beta == 0.0);
        REQUIRE(row.log_cap == 0.0);
        REQUIRE(row.sector.empty());

        FundamentalRow bare = FundamentalsAdapter::normalize(nlohmann::json::object(), PriceSeries("NONE"));
        REQUIRE(bare.div_yield == 0.0);
        REQUIRE(bare.mom6 == 0.0);
    }

    SECTION("numeric_field")
    {
        nlohmann::json j = {{"a", 2.5}, {"b", "3.5"}, {"c", "3.5x"}, {"d", nullptr}};
        REQUIRE(FundamentalsAdapter::numeric_field(j, "a") == 2.5);
        REQUIRE(FundamentalsAdapter::numeric_field(j, "b") == 3.5);
        REQUIRE(FundamentalsAdapter::numeric_field(j, "c", -1.0) == -1.0);
        REQUIRE(FundamentalsAdapter::numeric_field(j, "d", -1.0) == -1.0);
        REQUIRE(FundamentalsAdapter::numeric_field(j, "missing") == 0.0);
    }
}
