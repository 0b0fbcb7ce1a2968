/**
 * @file ranker.cpp
 * @brief Implementation of Ranker
 */

#include "scoring/ranker.hpp"
#include "core/advisor_error.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace advisor
{
    namespace scoring
    {

        const char *const Ranker::DEFAULT_REASON = "High P(improve Sharpe) for your target";

        nlohmann::json Recommendation::to_json() const
        {
            return {{"ticker", ticker},
                    {"score", score},
                    {"price", price},
                    {"shares", shares},
                    {"reason", reason}};
        }

        Ranker::Ranker(int top_k) : top_k_(top_k)
        {
            if (top_k_ < 1)
            {
                throw std::invalid_argument("top_k must be at least 1, got: " + std::to_string(top_k_));
            }
        }

        std::vector<Recommendation> Ranker::rank(const std::vector<std::string> &candidates,
                                                 const Eigen::VectorXd &scores,
                                                 const std::map<std::string, double> &prices,
                                                 double budget) const
        {
            if (static_cast<Eigen::Index>(candidates.size()) != scores.size())
            {
                throw AdvisorError(ErrorCode::SCORER_UNAVAILABLE,
                                   "Scorer returned a different number of scores than candidates",
                                   {{"candidates", candidates.size()}, {"scores", scores.size()}});
            }

            std::vector<size_t> order(candidates.size());
            std::iota(order.begin(), order.end(), 0);

            std::stable_sort(order.begin(), order.end(),
                             [&scores](size_t a, size_t b)
                             {
                                 double sa = scores(static_cast<Eigen::Index>(a));
                                 double sb = scores(static_cast<Eigen::Index>(b));
                                 if (std::isnan(sb))
                                     return !std::isnan(sa);
                                 if (std::isnan(sa))
                                     return false;
                                 return sa > sb;
                             });

            const size_t k = std::min(order.size(), static_cast<size_t>(top_k_));
            const double bucket = (budget > 0.0 && k > 0) ? budget / static_cast<double>(k) : 0.0;

            std::vector<Recommendation> result;
            result.reserve(k);

            for (size_t r = 0; r < k; ++r)
            {
                size_t idx = order[r];

                Recommendation rec;
                rec.ticker = candidates[idx];
                rec.score = scores(static_cast<Eigen::Index>(idx));
                rec.reason = DEFAULT_REASON;

                auto it = prices.find(rec.ticker);
                rec.price = (it != prices.end() && std::isfinite(it->second)) ? it->second : 0.0;
                rec.shares = shares_for(bucket, rec.price);

                result.push_back(rec);
            }

            return result;
        }

        long Ranker::shares_for(double bucket, double price)
        {
            if (!(bucket > 0.0) || !(price > 0.0) || !std::isfinite(price))
            {
                return 0;
            }
            return static_cast<long>(std::floor(bucket / price));
        }

    } // namespace scoring
} // namespace advisor
