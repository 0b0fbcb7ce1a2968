/**
 * @file marginal_utility.cpp
 * @brief Implementation of MarginalUtilityEngine.
 */

#include "analytics/marginal_utility.hpp"

#include <algorithm>
#include <stdexcept>

namespace advisor
{
    namespace analytics
    {

        DonorPolicy donor_policy_from_string(const std::string &name)
        {
            if (name == "largest_holding")
                return DonorPolicy::LARGEST_HOLDING;
            if (name == "pro_rata")
                return DonorPolicy::PRO_RATA;
            throw std::invalid_argument("Unknown donor_policy: " + name);
        }

        std::string to_string(DonorPolicy policy)
        {
            switch (policy)
            {
            case DonorPolicy::LARGEST_HOLDING:
                return "largest_holding";
            case DonorPolicy::PRO_RATA:
                return "pro_rata";
            }
            return "unknown";
        }

        MarginalUtilityEngine::MarginalUtilityEngine(double epsilon,
                                                     const PortfolioMetrics &metrics,
                                                     DonorPolicy policy)
            : epsilon_(epsilon), metrics_(metrics), policy_(policy)
        {
            if (!(epsilon > 0.0 && epsilon < 1.0))
            {
                throw std::invalid_argument(
                    "epsilon must be in (0, 1), got: " + std::to_string(epsilon));
            }
        }

        MarginalMap MarginalUtilityEngine::compute(const Eigen::VectorXd &weights,
                                                   const Eigen::VectorXd &expected_returns,
                                                   const Eigen::MatrixXd &covariance,
                                                   const std::vector<std::string> &tickers,
                                                   const std::set<std::string> &held) const
        {
            const Eigen::Index n = weights.size();

            if (expected_returns.size() != n ||
                covariance.rows() != n || covariance.cols() != n ||
                static_cast<Eigen::Index>(tickers.size()) != n)
            {
                throw std::invalid_argument(
                    "Marginal utility inputs disagree on dimension: weights " + std::to_string(n) +
                    ", returns " + std::to_string(expected_returns.size()) +
                    ", covariance " + std::to_string(covariance.rows()) + "x" +
                    std::to_string(covariance.cols()) +
                    ", tickers " + std::to_string(tickers.size()));
            }

            MarginalMap result;
            if (n == 0)
            {
                return result;
            }

            const double base_sharpe = metrics_.sharpe_ratio(weights, expected_returns, covariance);
            const double base_cvar = metrics_.conditional_var(weights, expected_returns, covariance);

            for (Eigen::Index i = 0; i < n; ++i)
            {
                const std::string &ticker = tickers[static_cast<size_t>(i)];
                if (held.count(ticker) > 0)
                    continue;

                Eigen::VectorXd perturbed = perturb(weights, i);

                MarginalMetrics m;
                m.delta_sharpe =
                    metrics_.sharpe_ratio(perturbed, expected_returns, covariance) - base_sharpe;
                m.delta_cvar =
                    base_cvar - metrics_.conditional_var(perturbed, expected_returns, covariance);
                result[ticker] = m;
            }

            return result;
        }

        Eigen::VectorXd MarginalUtilityEngine::perturb(const Eigen::VectorXd &weights,
                                                       Eigen::Index index) const
        {
            if (index < 0 || index >= weights.size())
            {
                throw std::out_of_range("Perturbation index out of range: " + std::to_string(index));
            }

            Eigen::VectorXd perturbed = weights;

            if (policy_ == DonorPolicy::LARGEST_HOLDING)
            {
                Eigen::Index donor = 0;
                weights.maxCoeff(&donor); // first index on ties
                perturbed(donor) = std::max(0.0, perturbed(donor) - epsilon_);
                perturbed(index) += epsilon_;
                return perturbed;
            }

            double others = weights.sum() - weights(index);
            if (others <= 0.0)
            {
                return perturbed;
            }

            double moved = std::min(epsilon_, others);
            for (Eigen::Index j = 0; j < weights.size(); ++j)
            {
                if (j != index)
                {
                    perturbed(j) -= moved * weights(j) / others;
                }
            }
            perturbed(index) += moved;
            return perturbed;
        }

    } // namespace analytics
} // namespace advisor
