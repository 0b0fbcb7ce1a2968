/**
 * @file marginal_utility.hpp
 * @brief Marginal effect of adding a small position in each candidate.
 *
 * For every instrument not already held, the baseline weights are tilted
 * by epsilon towards the instrument and the change in Sharpe ratio and
 * CVaR is recorded. Both deltas are oriented so that higher is better:
 *
 *   delta_sharpe = sharpe(perturbed) - sharpe(baseline)
 *   delta_cvar   = cvar(baseline) - cvar(perturbed)
 *
 * Results are tied to one baseline vector and are never cached.
 */

#ifndef ADVISOR_ANALYTICS_MARGINAL_UTILITY_HPP
#define ADVISOR_ANALYTICS_MARGINAL_UTILITY_HPP

#include "analytics/portfolio_metrics.hpp"

#include <Eigen/Dense>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace advisor
{
    namespace analytics
    {

        struct MarginalMetrics
        {
            double delta_sharpe = 0.0;
            double delta_cvar = 0.0;
        };

        using MarginalMap = std::map<std::string, MarginalMetrics>;

        /**
         * @enum DonorPolicy
         * @brief Where the epsilon moved into a candidate comes from.
         */
        enum class DonorPolicy
        {
            LARGEST_HOLDING, ///< First index of the largest baseline weight gives up epsilon
            PRO_RATA         ///< Every other instrument gives up epsilon in proportion to its weight
        };

        /**
         * @brief Parse "largest_holding" or "pro_rata".
         * @throws std::invalid_argument for any other name
         */
        DonorPolicy donor_policy_from_string(const std::string &name);

        std::string to_string(DonorPolicy policy);

        /**
         * @class MarginalUtilityEngine
         * @brief Perturbation analysis around a baseline portfolio.
         *
         * Usage Example:
         * @code
         * MarginalUtilityEngine engine(0.01, PortfolioMetrics(0.043, 0.95));
         * MarginalMap deltas = engine.compute(w, mu, sigma, tickers, {"XOM"});
         * @endcode
         */
        class MarginalUtilityEngine
        {
        public:
            /**
             * @throws std::invalid_argument if epsilon is not in (0, 1)
             */
            MarginalUtilityEngine(double epsilon,
                                  const PortfolioMetrics &metrics,
                                  DonorPolicy policy = DonorPolicy::LARGEST_HOLDING);

            /**
             * @brief Deltas for every ticker in `tickers` that is not in `held`.
             *
             * Held tickers outside `tickers` are ignored.
             *
             * @throws std::invalid_argument on dimension mismatch
             * @throws AdvisorError DEGENERATE_BASELINE if the baseline or a
             *         perturbed portfolio has zero variance
             */
            MarginalMap compute(const Eigen::VectorXd &weights,
                                const Eigen::VectorXd &expected_returns,
                                const Eigen::MatrixXd &covariance,
                                const std::vector<std::string> &tickers,
                                const std::set<std::string> &held) const;

            /**
             * @brief Baseline weights tilted by epsilon towards `index`.
             */
            Eigen::VectorXd perturb(const Eigen::VectorXd &weights, Eigen::Index index) const;

            double epsilon() const { return epsilon_; }
            DonorPolicy policy() const { return policy_; }
            const PortfolioMetrics &metrics() const { return metrics_; }

        private:
            double epsilon_;
            PortfolioMetrics metrics_;
            DonorPolicy policy_;
        };

    } // namespace analytics
} // namespace advisor

#endif // ADVISOR_ANALYTICS_MARGINAL_UTILITY_HPP
