/**
 * @file fundamentals.hpp
 * @brief Per-instrument fundamental and momentum signals
 *
 * FundamentalsAdapter is the single place that knows the provider's field
 * names. Everything downstream consumes a FundamentalRow whose numeric
 * fields are always finite.
 */

#pragma once

#include "data/price_series.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace advisor
{

    /**
     * @struct FundamentalRow
     * @brief Normalized fundamentals for one instrument
     *
     * Missing provider values are stored as 0.
     */
    struct FundamentalRow
    {
        double beta = 0.0;      ///< Market beta
        double div_yield = 0.0; ///< Trailing 12-month dividend yield
        double log_cap = 0.0;   ///< Natural log of market capitalization
        double mom6 = 0.0;      ///< 26-week price change
        double mom12 = 0.0;     ///< 52-week price change
        std::string sector;     ///< Sector name, empty if unknown
    };

    using FundamentalMap = std::map<std::string, FundamentalRow>;

    /**
     * @class FundamentalsAdapter
     * @brief Normalizes a provider overview plus weekly series into a FundamentalRow
     *
     * Overview fields read: "Beta", "MarketCapitalization", "Sector". Values
     * may be numbers or numeric strings; anything else ("None", "-", absent)
     * becomes 0. Dividend yield and momentum are derived from the series so
     * that ETFs and non-payers without overview data still get a value.
     */
    class FundamentalsAdapter
    {
    public:
        static constexpr size_t SHORT_MOMENTUM_WEEKS = 26;
        static constexpr size_t LONG_MOMENTUM_WEEKS = 52;
        static constexpr size_t DIVIDEND_WINDOW_WEEKS = 52;

        /**
         * @brief Build a row from an overview object (may be empty) and a series
         */
        static FundamentalRow normalize(const nlohmann::json &overview,
                                        const PriceSeries &series);

        /**
         * @brief Read a numeric field that may be encoded as a string
         * @return Finite value, or `fallback` if absent or unparseable
         */
        static double numeric_field(const nlohmann::json &overview,
                                    const std::string &key,
                                    double fallback = 0.0);
    };

} // namespace advisor
