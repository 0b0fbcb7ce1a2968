/**
 * @file mean_variance_optimizer.hpp
 * @brief Long-only minimum-variance optimizer at a target return (Markowitz)
 *
 * Mathematical Formulation:
 *
 * Minimize:     w^T * Sigma * w
 * Subject to:   sum(w_i) = 1
 *               mu^T * w = target
 *               0 <= w_i <= 1
 *
 * where:
 * - w: portfolio weights
 * - Sigma: annualized covariance matrix
 * - mu: annualized expected returns
 *
 * The problem is handed to a QuadraticSolver (OSQP by default) as
 * P = 2 * Sigma, q = 0. Infeasible targets and non-PSD covariance are
 * reported as distinct AdvisorError codes; a solver iterate is never
 * returned unless it satisfies every constraint within tolerance.
 */

#pragma once

#include "optimizer/optimizer_interface.hpp"
#include "optimizer/quadratic_solver.hpp"
#include <memory>

namespace advisor
{
    namespace optimizer
    {

        /**
         * @struct MeanVarianceOptions
         * @brief Numerical settings for the baseline optimizer
         */
        struct MeanVarianceOptions
        {
            double risk_free_rate = 0.043;        ///< Used for the reported Sharpe ratio
            double tolerance = 1e-7;              ///< Solver eps_abs / eps_rel
            int max_iterations = 20000;           ///< Solver iteration cap
            double feasibility_tolerance = 1e-5;  ///< Max allowed constraint residual
            double target_tolerance = 1e-9;       ///< Slack on the [min mu, max mu] range check
            double psd_tolerance = 1e-10;         ///< Relative eigenvalue tolerance

            /**
             * @throws std::invalid_argument if a tolerance or cap is non-positive
             */
            void validate() const;
        };

        /**
         * @class MeanVarianceOptimizer
         * @brief Target-return Markowitz optimizer
         *
         * Usage Example:
         * @code
         * MeanVarianceOptions options;
         * options.risk_free_rate = 0.043;
         * MeanVarianceOptimizer optimizer(options);
         *
         * auto result = optimizer.optimize(mu, covariance, 0.09);
         * std::cout << "Volatility: " << result.volatility << "\n";
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class MeanVarianceOptimizer : public OptimizerInterface
        {
        public:
            /**
             * @brief Construct optimizer
             * @param options Numerical settings
             * @param solver QP backend; an OSQPSolver is created when null
             */
            explicit MeanVarianceOptimizer(
                const MeanVarianceOptions &options = MeanVarianceOptions(),
                std::shared_ptr<QuadraticSolver> solver = nullptr);

            ~MeanVarianceOptimizer() override = default;

            /**
             * @brief Minimum-variance long-only weights achieving target_return
             *
             * @throws std::invalid_argument on dimension mismatch or non-finite mu
             * @throws AdvisorError INVALID_TARGET if target_return is not finite
             * @throws AdvisorError INFEASIBLE_TARGET if the target lies outside
             *         [min mu, max mu] or the solver proves infeasibility
             * @throws AdvisorError ILL_CONDITIONED_COVARIANCE if Sigma is not
             *         symmetric PSD or the solver cannot converge
             */
            OptimizationResult optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                double target_return) const override;

            std::string get_name() const override { return "MeanVarianceOptimizer"; }

            nlohmann::json get_parameters() const override;

            const MeanVarianceOptions &get_options() const { return options_; }

            /**
             * @brief Build the QP for a target return
             */
            static QuadraticProblem build_problem(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                double target_return);

        private:
            MeanVarianceOptions options_;
            std::shared_ptr<QuadraticSolver> solver_;

            void check_covariance(const Eigen::MatrixXd &covariance) const;

            void check_target_range(const Eigen::VectorXd &expected_returns,
                                    double target_return) const;

            /**
             * @brief Reject solver output that violates a constraint
             *
             * Runs after the target range check, so a residual means the solver
             * did not converge accurately.
             * @throws AdvisorError ILL_CONDITIONED_COVARIANCE naming the violated
             *         constraint, its residual and the solver status
             */
            void verify_solution(const SolverResult &solved,
                                 const Eigen::VectorXd &expected_returns,
                                 double target_return) const;
        };

    } // namespace optimizer
} // namespace advisor
