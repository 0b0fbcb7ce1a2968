/**
 * @file fundamentals.cpp
 * @brief Implementation of FundamentalsAdapter
 */

#include "data/fundamentals.hpp"
#include <cmath>
#include <stdexcept>

namespace advisor
{

    double FundamentalsAdapter::numeric_field(const nlohmann::json &overview,
                                              const std::string &key,
                                              double fallback)
    {
        if (!overview.is_object() || !overview.contains(key))
        {
            return fallback;
        }

        const auto &field = overview.at(key);
        double value = fallback;

        if (field.is_number())
        {
            value = field.get<double>();
        }
        else if (field.is_string())
        {
            const std::string text = field.get<std::string>();
            try
            {
                size_t consumed = 0;
                value = std::stod(text, &consumed);
                if (consumed != text.size())
                {
                    return fallback;
                }
            }
            catch (const std::invalid_argument &)
            {
                return fallback;
            }
            catch (const std::out_of_range &)
            {
                return fallback;
            }
        }

        return std::isfinite(value) ? value : fallback;
    }

    FundamentalRow FundamentalsAdapter::normalize(const nlohmann::json &overview,
                                                  const PriceSeries &series)
    {
        FundamentalRow row;

        row.beta = numeric_field(overview, "Beta");

        double market_cap = numeric_field(overview, "MarketCapitalization");
        row.log_cap = market_cap > 0.0 ? std::log(market_cap) : 0.0;

        row.div_yield = series.trailing_dividend_yield(DIVIDEND_WINDOW_WEEKS);
        row.mom6 = series.momentum(SHORT_MOMENTUM_WEEKS);
        row.mom12 = series.momentum(LONG_MOMENTUM_WEEKS);

        if (overview.is_object() && overview.contains("Sector") && overview["Sector"].is_string())
        {
            row.sector = overview["Sector"].get<std::string>();
        }

        return row;
    }

} // namespace advisor
