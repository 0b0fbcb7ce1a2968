/**
 * @file return_statistics.cpp
 * @brief Implementation of the statistics engine
 */

#include "risk/return_statistics.hpp"
#include "risk/sample_covariance.hpp"
#include "core/advisor_error.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <stdexcept>

namespace advisor
{
    namespace risk
    {

        void StatisticsOptions::validate() const
        {
            if (min_observations < 2)
            {
                throw std::invalid_argument(
                    "min_observations must be at least 2, got: " + std::to_string(min_observations));
            }
            if (min_aligned_dates < 3)
            {
                throw std::invalid_argument(
                    "min_aligned_dates must be at least 3, got: " + std::to_string(min_aligned_dates));
            }
            if (periods_per_year <= 0)
            {
                throw std::invalid_argument(
                    "periods_per_year must be positive, got: " + std::to_string(periods_per_year));
            }
        }

        int UniverseStatistics::index_of(const std::string &ticker) const
        {
            auto it = std::find(tickers.begin(), tickers.end(), ticker);
            if (it == tickers.end())
            {
                return -1;
            }
            return static_cast<int>(std::distance(tickers.begin(), it));
        }

        ReturnStatistics::ReturnStatistics(const StatisticsOptions &options)
            : options_(options)
        {
            options_.validate();
        }

        double ReturnStatistics::annualize_return(double periodic_mean, int periods_per_year)
        {
            return std::pow(1.0 + periodic_mean, periods_per_year) - 1.0;
        }

        std::vector<std::string> ReturnStatistics::align_dates(const std::vector<PriceSeries> &series)
        {
            std::set<std::string> aligned;
            bool first = true;

            for (const auto &s : series)
            {
                if (s.empty())
                {
                    continue;
                }

                if (first)
                {
                    for (const auto &bar : s.bars())
                    {
                        aligned.insert(bar.first);
                    }
                    first = false;
                    continue;
                }

                std::set<std::string> next;
                for (const auto &date : aligned)
                {
                    if (s.has_date(date))
                    {
                        next.insert(date);
                    }
                }
                aligned.swap(next);
            }

            // std::set keeps ISO dates in ascending order
            return std::vector<std::string>(aligned.begin(), aligned.end());
        }

        UniverseStatistics ReturnStatistics::compute(const std::vector<PriceSeries> &series) const
        {
            UniverseStatistics stats;

            // Instruments with any data, first occurrence of each ticker wins
            std::vector<const PriceSeries *> with_data;
            std::set<std::string> seen;
            for (const auto &s : series)
            {
                if (s.empty())
                {
                    stats.dropped[s.ticker()] = "no data";
                    continue;
                }
                if (!seen.insert(s.ticker()).second)
                {
                    continue;
                }
                with_data.push_back(&s);
            }

            if (with_data.empty())
            {
                throw AdvisorError(ErrorCode::NO_USABLE_INSTRUMENTS,
                                   "No time series available to compute statistics",
                                   {{"requested", series.size()}});
            }

            std::vector<PriceSeries> usable;
            usable.reserve(with_data.size());
            for (const auto *s : with_data)
            {
                usable.push_back(*s);
            }

            stats.aligned_dates = align_dates(usable);
            const int n_dates = static_cast<int>(stats.aligned_dates.size());

            if (n_dates < options_.min_aligned_dates)
            {
                nlohmann::json instruments = nlohmann::json::array();
                for (const auto &s : usable)
                {
                    instruments.push_back(s.ticker());
                }
                throw AdvisorError(ErrorCode::INSUFFICIENT_HISTORY,
                                   "Not enough overlapping history to compute returns",
                                   {{"aligned_dates", n_dates},
                                    {"required", options_.min_aligned_dates},
                                    {"instruments", instruments}});
            }

            const int n_periods = n_dates - 1;
            const std::string &last_date = stats.aligned_dates.back();

            std::vector<Eigen::VectorXd> kept_returns;

            for (const auto &s : usable)
            {
                double last_close = s.close_at(last_date);
                if (!std::isfinite(last_close) || last_close <= 0.0)
                {
                    stats.dropped[s.ticker()] = "invalid latest close";
                    continue;
                }

                Eigen::VectorXd r = Eigen::VectorXd::Zero(n_periods);
                int valid = 0;

                for (int t = 0; t < n_periods; ++t)
                {
                    double p0 = s.close_at(stats.aligned_dates[t]);
                    double p1 = s.close_at(stats.aligned_dates[t + 1]);

                    if (std::isfinite(p0) && std::isfinite(p1) && p0 > 0.0 && p1 > 0.0)
                    {
                        r(t) = (p1 - p0) / p0;
                        ++valid;
                    }
                }

                if (valid < options_.min_observations)
                {
                    stats.dropped[s.ticker()] =
                        "insufficient history (" + std::to_string(valid) + " valid returns)";
                    continue;
                }

                stats.tickers.push_back(s.ticker());
                stats.latest_prices[s.ticker()] = last_close;
                stats.valid_counts[s.ticker()] = valid;
                kept_returns.push_back(r);
            }

            if (stats.tickers.empty())
            {
                throw AdvisorError(ErrorCode::NO_USABLE_INSTRUMENTS,
                                   "No tickers with sufficient overlapping history",
                                   {{"required_observations", options_.min_observations},
                                    {"aligned_dates", n_dates},
                                    {"dropped", stats.dropped}});
            }

            const int n_assets = static_cast<int>(stats.tickers.size());
            stats.returns = Eigen::MatrixXd(n_periods, n_assets);
            for (int j = 0; j < n_assets; ++j)
            {
                stats.returns.col(j) = kept_returns[j];
            }

            // mu: compounded mean, substituted zeros included in the mean
            Eigen::VectorXd weekly_means = stats.returns.colwise().mean().transpose();
            stats.expected_returns = Eigen::VectorXd(n_assets);
            for (int j = 0; j < n_assets; ++j)
            {
                stats.expected_returns(j) = annualize_return(weekly_means(j), options_.periods_per_year);
            }

            // Sigma: linear annualization of the sample covariance
            SampleCovariance estimator(true, static_cast<double>(options_.periods_per_year));
            stats.covariance = estimator.estimate_covariance(stats.returns);

            return stats;
        }

    } // namespace risk
} // namespace advisor
