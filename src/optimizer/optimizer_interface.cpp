/**
 * @file optimizer_interface.cpp
 * @brief Implementation of optimizer interface and common structures
 */

#include "optimizer/optimizer_interface.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace advisor
{
    namespace optimizer
    {

        // ============================================================================
        // OptimizationResult Implementation
        // ============================================================================

        OptimizationResult::OptimizationResult()
            : expected_return(0.0),
              volatility(0.0),
              sharpe_ratio(0.0),
              success(false),
              solver_status(SolverStatus::UNSOLVED),
              iterations(0),
              objective_value(0.0)
        {
        }

        bool OptimizationResult::is_valid() const
        {
            return success && weights.size() > 0 && weights.allFinite() &&
                   std::isfinite(expected_return) && std::isfinite(volatility);
        }

        void OptimizationResult::print_summary(const std::vector<std::string> &tickers,
                                               std::ostream &out) const
        {
            out << std::string(60, '-') << "\n";

            if (!success)
            {
                out << "Optimization failed: " << message << "\n";
                return;
            }

            out << "Status: " << message << " (" << iterations << " iterations)\n";
            out << "  Expected Return:  " << std::fixed << std::setprecision(2)
                << expected_return * 100 << "%\n";
            out << "  Volatility:       " << volatility * 100 << "%\n";
            out << "  Sharpe Ratio:     " << std::setprecision(3) << sharpe_ratio << "\n";

            std::vector<std::pair<double, std::string>> sorted_weights;
            for (Eigen::Index i = 0; i < weights.size() && i < static_cast<Eigen::Index>(tickers.size()); ++i)
            {
                if (std::abs(weights(i)) > 1e-4)
                {
                    sorted_weights.push_back({weights(i), tickers[i]});
                }
            }
            std::sort(sorted_weights.begin(), sorted_weights.end(),
                      [](const auto &a, const auto &b)
                      { return a.first > b.first; });

            for (const auto &pair : sorted_weights)
            {
                out << "  " << std::setw(8) << std::left << pair.second
                    << ": " << std::right << std::fixed << std::setprecision(2)
                    << pair.first * 100 << "%\n";
            }

            out << std::string(60, '-') << "\n";
        }

        // ============================================================================
        // OptimizerInterface Implementation
        // ============================================================================

        void OptimizerInterface::validate_inputs(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance)
        {
            const Eigen::Index n = expected_returns.size();

            if (n == 0)
            {
                throw std::invalid_argument("Expected returns vector cannot be empty");
            }

            if (covariance.rows() != n || covariance.cols() != n)
            {
                throw std::invalid_argument(
                    "Covariance matrix must be " + std::to_string(n) + "x" + std::to_string(n) +
                    ", got " + std::to_string(covariance.rows()) + "x" + std::to_string(covariance.cols()));
            }

            if (!expected_returns.allFinite())
            {
                throw std::invalid_argument("Expected returns contain NaN or Inf values");
            }
        }

        Eigen::VectorXd OptimizerInterface::clean_weights(const Eigen::VectorXd &weights,
                                                          double tolerance)
        {
            Eigen::VectorXd cleaned = weights;

            for (Eigen::Index i = 0; i < cleaned.size(); ++i)
            {
                if (cleaned(i) < -tolerance)
                {
                    throw std::invalid_argument(
                        "Weight " + std::to_string(i) + " is negative beyond tolerance: " +
                        std::to_string(cleaned(i)));
                }
                cleaned(i) = std::max(0.0, cleaned(i));
            }

            double total = cleaned.sum();
            if (total <= 0.0)
            {
                throw std::invalid_argument("Weights sum to zero after clamping");
            }

            return cleaned / total;
        }

        OptimizationResult OptimizerInterface::calculate_statistics(
            const Eigen::VectorXd &weights,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            double risk_free_rate)
        {
            OptimizationResult result;
            result.weights = weights;
            result.expected_return = expected_returns.dot(weights);

            double variance = weights.dot(covariance * weights);
            result.volatility = std::sqrt(std::max(0.0, variance));
            result.sharpe_ratio = (result.volatility > 0.0)
                                      ? (result.expected_return - risk_free_rate) / result.volatility
                                      : 0.0;
            return result;
        }

    } // namespace optimizer
} // namespace advisor
