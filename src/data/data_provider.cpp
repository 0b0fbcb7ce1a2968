/**
 * @file data_provider.cpp
 * @brief Implementation of data collaborator classes
 */

#include "data/data_provider.hpp"
#include "data/fundamentals.hpp"
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace advisor
{
    namespace data
    {

        namespace
        {
            const char *WEEKLY_SERIES_KEY = "Weekly Adjusted Time Series";
            const char *CLOSE_KEY = "4. close";
            const char *DIVIDEND_KEY = "7. dividend amount";

            nlohmann::json read_json_file(const std::string &path)
            {
                std::ifstream file(path);
                if (!file.is_open())
                {
                    throw std::runtime_error("Could not open JSON file: " + path);
                }

                nlohmann::json j;
                try
                {
                    file >> j;
                }
                catch (const nlohmann::json::exception &e)
                {
                    throw std::runtime_error("JSON parsing error in " + path + ": " + e.what());
                }
                return j;
            }
        } // anonymous namespace

        // ============================================================================
        // SeriesCache Implementation
        // ============================================================================

        std::optional<PriceSeries> SeriesCache::get(const std::string &ticker) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(ticker);
            if (it == entries_.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        void SeriesCache::put(const std::string &ticker, const PriceSeries &series)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_[ticker] = series;
        }

        size_t SeriesCache::size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return entries_.size();
        }

        void SeriesCache::clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.clear();
        }

        // ============================================================================
        // FileDataProvider Implementation
        // ============================================================================

        FileDataProvider::FileDataProvider(const std::string &cache_dir,
                                           std::shared_ptr<SeriesCache> cache)
            : cache_dir_(cache_dir), cache_(std::move(cache))
        {
            if (!std::filesystem::is_directory(cache_dir_))
            {
                throw std::invalid_argument("Data cache directory does not exist: " + cache_dir_);
            }
        }

        std::string FileDataProvider::path_for(const std::string &prefix,
                                               const std::string &ticker) const
        {
            return (std::filesystem::path(cache_dir_) / (prefix + "_" + ticker + ".json")).string();
        }

        PriceSeries FileDataProvider::fetch_weekly_series(const std::string &ticker) const
        {
            if (cache_)
            {
                auto cached = cache_->get(ticker);
                if (cached)
                {
                    return *cached;
                }
            }

            PriceSeries series = parse_weekly_series(ticker, read_json_file(path_for("weekly", ticker)));

            if (cache_)
            {
                cache_->put(ticker, series);
            }
            return series;
        }

        std::optional<nlohmann::json> FileDataProvider::fetch_overview(const std::string &ticker) const
        {
            const std::string path = path_for("overview", ticker);
            if (!std::filesystem::exists(path))
            {
                return std::nullopt;
            }
            return read_json_file(path);
        }

        PriceSeries FileDataProvider::parse_weekly_series(const std::string &ticker,
                                                          const nlohmann::json &j)
        {
            const nlohmann::json &body = j.contains(WEEKLY_SERIES_KEY) ? j.at(WEEKLY_SERIES_KEY) : j;
            if (!body.is_object())
            {
                throw std::runtime_error("Weekly series for " + ticker + " is not a date-keyed object");
            }

            const double nan = std::numeric_limits<double>::quiet_NaN();
            PriceSeries series(ticker);

            for (auto it = body.begin(); it != body.end(); ++it)
            {
                if (!PriceSeries::is_valid_date(it.key()) || !it.value().is_object())
                {
                    continue;
                }

                double close = FundamentalsAdapter::numeric_field(it.value(), CLOSE_KEY, nan);
                double dividend = FundamentalsAdapter::numeric_field(it.value(), DIVIDEND_KEY, 0.0);
                series.add_bar(it.key(), close, dividend);
            }

            return series;
        }

        // ============================================================================
        // InMemoryDataProvider Implementation
        // ============================================================================

        InMemoryDataProvider::InMemoryDataProvider(const std::map<std::string, PriceSeries> &series)
            : series_(series)
        {
        }

        void InMemoryDataProvider::add_series(const PriceSeries &series)
        {
            series_[series.ticker()] = series;
        }

        void InMemoryDataProvider::add_overview(const std::string &ticker, const nlohmann::json &overview)
        {
            overviews_[ticker] = overview;
        }

        PriceSeries InMemoryDataProvider::fetch_weekly_series(const std::string &ticker) const
        {
            auto it = series_.find(ticker);
            if (it == series_.end())
            {
                throw std::runtime_error("No weekly series loaded for " + ticker);
            }
            return it->second;
        }

        std::optional<nlohmann::json> InMemoryDataProvider::fetch_overview(const std::string &ticker) const
        {
            auto it = overviews_.find(ticker);
            if (it == overviews_.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

    } // namespace data
} // namespace advisor
