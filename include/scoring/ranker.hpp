/**
 * @file ranker.hpp
 * @brief Orders scored candidates and sizes suggested purchases
 */

#pragma once

#include <Eigen/Dense>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace advisor
{
    namespace scoring
    {

        /**
         * @struct Recommendation
         * @brief One ranked suggestion
         */
        struct Recommendation
        {
            std::string ticker;
            double score = 0.0;
            double price = 0.0; ///< Latest close, 0 if unknown
            long shares = 0;    ///< Whole shares affordable from the per-pick budget
            std::string reason;

            nlohmann::json to_json() const;
        };

        /**
         * @class Ranker
         * @brief Stable descending sort by score, truncated to top K
         *
         * Ties keep candidate order and NaN scores sort last. With a positive
         * budget each of the K = min(top_k, candidates) picks
         * gets budget / K and shares = floor(bucket / price).
         *
         * Usage Example:
         * @code
         * Ranker ranker(5);
         * auto picks = ranker.rank(candidates, scores, prices, 10000.0);
         * @endcode
         */
        class Ranker
        {
        public:
            static const char *const DEFAULT_REASON;

            /**
             * @throws std::invalid_argument if top_k < 1
             */
            explicit Ranker(int top_k = 5);

            /**
             * @throws AdvisorError SCORER_UNAVAILABLE if candidates and scores differ in length
             */
            std::vector<Recommendation> rank(const std::vector<std::string> &candidates,
                                             const Eigen::VectorXd &scores,
                                             const std::map<std::string, double> &prices,
                                             double budget) const;

            int top_k() const { return top_k_; }

            /**
             * @brief floor(bucket / price), 0 for a non-positive bucket or unknown price
             */
            static long shares_for(double bucket, double price);

        private:
            int top_k_;
        };

    } // namespace scoring
} // namespace advisor
