/**
 * @file optimizer_interface.hpp
 * @brief Abstract interface for baseline portfolio optimizers
 *
 * An optimizer turns (mu, Sigma, target return) into a long-only weight
 * vector. It is the only component allowed to produce a WeightVector.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include "optimizer/quadratic_solver.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace advisor
{
    namespace optimizer
    {

        /**
         * @struct OptimizationResult
         * @brief Container for optimization results
         */
        struct OptimizationResult
        {
            Eigen::VectorXd weights;    ///< Optimal portfolio weights
            double expected_return;     ///< Portfolio expected return (mu . w)
            double volatility;          ///< Portfolio volatility sqrt(w' Sigma w)
            double sharpe_ratio;        ///< Sharpe ratio at the optimizer's risk-free rate
            bool success;               ///< Optimization succeeded
            SolverStatus solver_status; ///< Underlying solver outcome
            std::string message;        ///< Status message
            int iterations;             ///< Number of iterations
            double objective_value;     ///< Final objective value

            OptimizationResult();

            /**
             * @brief Check if result is valid
             */
            bool is_valid() const;

            /**
             * @brief Print summary statistics and non-zero weights
             */
            void print_summary(const std::vector<std::string> &tickers,
                               std::ostream &out = std::cout) const;
        };

        /**
         * @class OptimizerInterface
         * @brief Abstract base class for target-return optimizers
         *
         * Usage Example:
         * @code
         * std::unique_ptr<OptimizerInterface> optimizer = std::make_unique<MeanVarianceOptimizer>();
         * auto result = optimizer->optimize(mu, covariance, 0.09);
         * result.print_summary(tickers);
         * @endcode
         */
        class OptimizerInterface
        {
        public:
            virtual ~OptimizerInterface() = default;

            /**
             * @brief Optimize portfolio weights for a target return
             * @param expected_returns Expected returns for each asset (N x 1)
             * @param covariance Covariance matrix (N x N)
             * @param target_return Required portfolio expected return
             * @return OptimizationResult structure
             * @throws std::invalid_argument if inputs are malformed
             * @throws AdvisorError for invalid or infeasible targets and
             *         ill-conditioned covariance
             */
            virtual OptimizationResult optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                double target_return) const = 0;

            virtual std::string get_name() const = 0;

            virtual nlohmann::json get_parameters() const = 0;

            /**
             * @brief Validate input dimensions and finiteness
             * @throws std::invalid_argument if validation fails
             */
            static void validate_inputs(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance);

            /**
             * @brief Clamp numerical noise below zero and rescale to sum to one
             * @param weights Solver output that already passed feasibility checks
             * @param tolerance Components in (-tolerance, 0) are treated as zero
             * @throws std::invalid_argument if a component is below -tolerance
             *         or the clamped weights sum to zero
             */
            static Eigen::VectorXd clean_weights(const Eigen::VectorXd &weights,
                                                 double tolerance = 1e-6);

        protected:
            /**
             * @brief Calculate portfolio statistics
             */
            static OptimizationResult calculate_statistics(
                const Eigen::VectorXd &weights,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                double risk_free_rate = 0.0);
        };

    } // namespace optimizer
} // namespace advisor
