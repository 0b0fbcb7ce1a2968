/**
 * @file return_statistics.hpp
 * @brief Aligned weekly returns, expected returns and covariance for a universe
 *
 * Turns raw per-instrument weekly series into the inputs of the optimizer:
 *
 * 1. Align all series with data on the intersection of their dates
 * 2. Compute simple returns per consecutive aligned pair; undefined returns
 *    (missing or non-positive price) are stored as 0 but not counted as valid
 * 3. Drop instruments with fewer than min_observations valid returns
 * 4. mu    = (1 + mean weekly return)^52 - 1   (compounded)
 *    Sigma = sample weekly covariance * 52     (linear)
 *
 * Thread Safety: Safe for concurrent read-only operations
 */

#ifndef ADVISOR_RISK_RETURN_STATISTICS_HPP
#define ADVISOR_RISK_RETURN_STATISTICS_HPP

#include "data/price_series.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace advisor
{
    namespace risk
    {

        /**
         * @struct StatisticsOptions
         * @brief Sufficiency thresholds and annualization factor
         */
        struct StatisticsOptions
        {
            int min_observations = 30;  ///< Valid returns required per instrument
            int min_aligned_dates = 3;  ///< Aligned calendar dates required overall
            int periods_per_year = 52;  ///< Weekly data

            /**
             * @throws std::invalid_argument if a threshold is out of range
             */
            void validate() const;
        };

        /**
         * @struct UniverseStatistics
         * @brief Everything derived from one pass over the universe
         *
         * All vectors and matrices are index-aligned with `tickers`.
         */
        struct UniverseStatistics
        {
            std::vector<std::string> tickers;             ///< Surviving instruments, input order
            std::vector<std::string> aligned_dates;       ///< Shared calendar, ascending
            Eigen::MatrixXd returns;                      ///< Weekly returns (periods x assets), undefined -> 0
            Eigen::VectorXd expected_returns;             ///< Annualized mu
            Eigen::MatrixXd covariance;                   ///< Annualized Sigma
            std::map<std::string, double> latest_prices;  ///< Last aligned close per kept ticker
            std::map<std::string, int> valid_counts;      ///< Valid returns per kept ticker
            std::map<std::string, std::string> dropped;   ///< Excluded ticker -> reason

            size_t size() const { return tickers.size(); }

            /**
             * @return Index of ticker in the universe, or -1
             */
            int index_of(const std::string &ticker) const;
        };

        /**
         * @class ReturnStatistics
         * @brief Statistics engine over weekly price series
         *
         * Usage Example:
         * @code
         * ReturnStatistics engine;
         * UniverseStatistics stats = engine.compute(series);
         * auto weights = optimizer.optimize(stats.expected_returns, stats.covariance, 0.10);
         * @endcode
         */
        class ReturnStatistics
        {
        public:
            explicit ReturnStatistics(const StatisticsOptions &options = StatisticsOptions());

            /**
             * @brief Compute universe statistics
             * @param series One series per instrument, in universe order
             * @throws AdvisorError(NO_USABLE_INSTRUMENTS) if no instrument has data
             *         or filtering removes every instrument
             * @throws AdvisorError(INSUFFICIENT_HISTORY) if fewer than
             *         min_aligned_dates dates are shared by all instruments
             */
            UniverseStatistics compute(const std::vector<PriceSeries> &series) const;

            /**
             * @brief Intersection of dates across non-empty series, ascending
             */
            static std::vector<std::string> align_dates(const std::vector<PriceSeries> &series);

            /**
             * @brief Compound a periodic mean return: (1 + m)^periods - 1
             */
            static double annualize_return(double periodic_mean, int periods_per_year);

            const StatisticsOptions &get_options() const { return options_; }

        private:
            StatisticsOptions options_;
        };

    } // namespace risk
} // namespace advisor

#endif // ADVISOR_RISK_RETURN_STATISTICS_HPP
