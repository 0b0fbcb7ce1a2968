/*
 * @file price_series.hpp
 * @brief Weekly price and dividend series for a single instrument.
 *
 * Stores closes and dividend amounts keyed by ISO date (YYYY-MM-DD) so that
 * series from different instruments can be aligned on a shared calendar.
 */

#ifndef ADVISOR_DATA_PRICE_SERIES_HPP
#define ADVISOR_DATA_PRICE_SERIES_HPP

#include <map>
#include <string>
#include <vector>

namespace advisor
{
    /**
     * @struct WeeklyBar
     * @brief One weekly observation.
     *
     * @note A missing or unparseable close is stored as NaN.
     */
    struct WeeklyBar
    {
        double close = 0.0;    ///< Weekly close
        double dividend = 0.0; ///< Dividend paid during the week
    };

    /**
     * @class PriceSeries
     * @brief Date-ordered weekly series for one ticker.
     *
     * Usage Example:
     * @code
     * PriceSeries series("XOM");
     * series.add_bar("2024-01-05", 101.2);
     * series.add_bar("2024-01-12", 103.0, 0.95);
     * double px = series.close_at("2024-01-12");
     * @endcode
     */
    class PriceSeries
    {
    public:
        PriceSeries() = default;

        explicit PriceSeries(const std::string &ticker);

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        const std::string &ticker() const { return ticker_; }

        bool empty() const { return bars_.empty(); }

        size_t size() const { return bars_.size(); }

        bool has_date(const std::string &date) const;

        /**
         * @brief Close on a date.
         * @return Close, or NaN if the date is absent.
         */
        double close_at(const std::string &date) const;

        /**
         * @brief All dates in ascending order.
         */
        std::vector<std::string> dates() const;

        const std::map<std::string, WeeklyBar> &bars() const { return bars_; }

        /**
         * @brief Close of the most recent bar.
         * @return Close, or NaN if the series is empty.
         */
        double last_close() const;

        /** ===========================================
         *  Data Modification Methods
         *  ===========================================
         */

        /**
         * @brief Insert or replace the bar for a date.
         * @throws std::invalid_argument if the date is not YYYY-MM-DD
         */
        void add_bar(const std::string &date, double close, double dividend = 0.0);

        /** ===========================================
         *  Signal Methods
         *  ===========================================
         */

        /**
         * @brief Price change over a number of weeks: last / last[-weeks] - 1.
         * @return 0 if history is too short or either close is invalid.
         */
        double momentum(size_t weeks) const;

        /**
         * @brief Trailing dividend yield: sum of the last `weeks` dividends / last close.
         * @return Non-negative yield, 0 if the last close is invalid.
         */
        double trailing_dividend_yield(size_t weeks = 52) const;

        /**
         * @brief Check YYYY-MM-DD layout.
         */
        static bool is_valid_date(const std::string &date);

    private:
        std::string ticker_;                    ///< Instrument identifier
        std::map<std::string, WeeklyBar> bars_; ///< Date to bar (ISO dates sort chronologically)
    };

    /**
     * @brief Trim surrounding whitespace and upper-case a ticker symbol.
     *
     * Applied wherever a ticker enters the system (CSV rows, configuration,
     * requests) so lookups agree.
     */
    std::string normalize_ticker(const std::string &ticker);

}
#endif // ADVISOR_DATA_PRICE_SERIES_HPP
