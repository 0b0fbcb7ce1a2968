/**
 * @file price_series.cpp
 * @brief Implementation of PriceSeries class
 */

#include "data/price_series.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace advisor
{

    std::string normalize_ticker(const std::string &ticker)
    {
        size_t first = ticker.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";
        size_t last = ticker.find_last_not_of(" \t\r\n");

        std::string result = ticker.substr(first, last - first + 1);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    PriceSeries::PriceSeries(const std::string &ticker) : ticker_(ticker)
    {
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    bool PriceSeries::has_date(const std::string &date) const
    {
        return bars_.count(date) > 0;
    }

    double PriceSeries::close_at(const std::string &date) const
    {
        auto it = bars_.find(date);
        if (it == bars_.end())
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return it->second.close;
    }

    std::vector<std::string> PriceSeries::dates() const
    {
        std::vector<std::string> result;
        result.reserve(bars_.size());
        for (const auto &entry : bars_)
        {
            result.push_back(entry.first);
        }
        return result;
    }

    double PriceSeries::last_close() const
    {
        if (bars_.empty())
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return bars_.rbegin()->second.close;
    }

    // ==========================
    // Data Modification Methods
    // ==========================

    void PriceSeries::add_bar(const std::string &date, double close, double dividend)
    {
        if (!is_valid_date(date))
        {
            throw std::invalid_argument("Invalid date for " + ticker_ + ": '" + date + "'");
        }

        WeeklyBar bar;
        bar.close = close;
        bar.dividend = std::isfinite(dividend) ? dividend : 0.0;
        bars_[date] = bar;
    }

    // ===========================
    // Signal Methods
    // ===========================

    double PriceSeries::momentum(size_t weeks) const
    {
        if (bars_.size() < weeks + 1)
        {
            return 0.0;
        }

        auto last_it = std::prev(bars_.end());
        auto prev_it = std::prev(bars_.end(), static_cast<long>(weeks) + 1);

        double last = last_it->second.close;
        double prev = prev_it->second.close;

        if (!std::isfinite(last) || !std::isfinite(prev) || prev <= 0.0)
        {
            return 0.0;
        }
        return last / prev - 1.0;
    }

    double PriceSeries::trailing_dividend_yield(size_t weeks) const
    {
        double last = last_close();
        if (!std::isfinite(last) || last <= 0.0)
        {
            return 0.0;
        }

        double dividends = 0.0;
        size_t counted = 0;
        for (auto it = bars_.rbegin(); it != bars_.rend() && counted < weeks; ++it, ++counted)
        {
            dividends += it->second.dividend;
        }

        return std::max(0.0, dividends / last);
    }

    bool PriceSeries::is_valid_date(const std::string &date)
    {
        if (date.length() != 10)
            return false;
        if (date[4] != '-' || date[7] != '-')
            return false;

        for (size_t i = 0; i < date.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }

        return true;
    }

} // namespace advisor
