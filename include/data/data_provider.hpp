/**
 * @file data_provider.hpp
 * @brief Market-data collaborator interface and implementations
 *
 * The recommendation pipeline only depends on DataProvider. Implementations
 * decide where series come from; the pipeline treats whatever is returned
 * as current.
 *
 * Thread Safety: FileDataProvider and InMemoryDataProvider are safe for
 * concurrent fetches. The SeriesCache guards its map with a mutex.
 */

#ifndef ADVISOR_DATA_DATA_PROVIDER_HPP
#define ADVISOR_DATA_DATA_PROVIDER_HPP

#include "data/price_series.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace advisor
{
    namespace data
    {

        /**
         * @class DataProvider
         * @brief Source of weekly series and fundamentals overviews
         */
        class DataProvider
        {
        public:
            virtual ~DataProvider() = default;

            /**
             * @brief Weekly close/dividend series for a ticker
             * @throws std::runtime_error if the series cannot be retrieved
             */
            virtual PriceSeries fetch_weekly_series(const std::string &ticker) const = 0;

            /**
             * @brief Provider overview object for a ticker
             * @return Overview, or std::nullopt if the provider has none
             */
            virtual std::optional<nlohmann::json> fetch_overview(const std::string &ticker) const = 0;
        };

        /**
         * @class SeriesCache
         * @brief In-process memo of parsed series, keyed by ticker
         *
         * Owned by the caller and injected into providers so its lifetime is
         * explicit. Entries never expire.
         */
        class SeriesCache
        {
        public:
            std::optional<PriceSeries> get(const std::string &ticker) const;

            void put(const std::string &ticker, const PriceSeries &series);

            size_t size() const;

            void clear();

        private:
            mutable std::mutex mutex_;
            std::map<std::string, PriceSeries> entries_;
        };

        /**
         * @class FileDataProvider
         * @brief Reads the provider's on-disk JSON cache
         *
         * Layout of `cache_dir`:
         * - weekly_<TICKER>.json: {"YYYY-MM-DD": {"4. close": "...", "7. dividend amount": "..."}, ...}
         *   (a raw response wrapped in "Weekly Adjusted Time Series" is also accepted)
         * - overview_<TICKER>.json: {"Beta": "...", "MarketCapitalization": "...", "Sector": "..."}
         */
        class FileDataProvider : public DataProvider
        {
        public:
            /**
             * @param cache_dir Directory holding the JSON files
             * @param cache Optional parsed-series memo shared across providers
             */
            explicit FileDataProvider(const std::string &cache_dir,
                                      std::shared_ptr<SeriesCache> cache = nullptr);

            PriceSeries fetch_weekly_series(const std::string &ticker) const override;

            std::optional<nlohmann::json> fetch_overview(const std::string &ticker) const override;

            /**
             * @brief Parse a weekly series object
             * @throws std::runtime_error if the JSON is not a date-keyed object
             */
            static PriceSeries parse_weekly_series(const std::string &ticker,
                                                   const nlohmann::json &j);

            const std::string &cache_dir() const { return cache_dir_; }

        private:
            std::string cache_dir_;
            std::shared_ptr<SeriesCache> cache_;

            std::string path_for(const std::string &prefix, const std::string &ticker) const;
        };

        /**
         * @class InMemoryDataProvider
         * @brief Serves series and overviews held in memory
         */
        class InMemoryDataProvider : public DataProvider
        {
        public:
            InMemoryDataProvider() = default;

            explicit InMemoryDataProvider(const std::map<std::string, PriceSeries> &series);

            void add_series(const PriceSeries &series);

            void add_overview(const std::string &ticker, const nlohmann::json &overview);

            PriceSeries fetch_weekly_series(const std::string &ticker) const override;

            std::optional<nlohmann::json> fetch_overview(const std::string &ticker) const override;

        private:
            std::map<std::string, PriceSeries> series_;
            std::map<std::string, nlohmann::json> overviews_;
        };

    } // namespace data
} // namespace advisor

#endif // ADVISOR_DATA_DATA_PROVIDER_HPP
