/**
 * @file mean_variance_optimizer.cpp
 * @brief Implementation of the target-return mean-variance optimizer
 */

#include "optimizer/mean_variance_optimizer.hpp"
#include "core/advisor_error.hpp"
#include "optimizer/osqp_solver.hpp"
#include "risk/risk_model.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace advisor
{
    namespace optimizer
    {

        void MeanVarianceOptions::validate() const
        {
            if (tolerance <= 0.0 || feasibility_tolerance <= 0.0 ||
                target_tolerance < 0.0 || psd_tolerance < 0.0)
            {
                throw std::invalid_argument("Optimizer tolerances must be positive");
            }

            if (max_iterations <= 0)
            {
                throw std::invalid_argument(
                    "max_iterations must be positive, got: " + std::to_string(max_iterations));
            }

            if (!std::isfinite(risk_free_rate))
            {
                throw std::invalid_argument("risk_free_rate must be finite");
            }
        }

        // ============================================================================
        // Constructor
        // ============================================================================

        MeanVarianceOptimizer::MeanVarianceOptimizer(const MeanVarianceOptions &options,
                                                     std::shared_ptr<QuadraticSolver> solver)
            : options_(options), solver_(std::move(solver))
        {
            options_.validate();

            if (!solver_)
            {
                SolverOptions solver_options;
                solver_options.tolerance = options_.tolerance;
                solver_options.max_iterations = options_.max_iterations;
                solver_options.polish = true;
                solver_ = std::make_shared<OSQPSolver>(solver_options);
            }
        }

        // ============================================================================
        // Main Optimization Method
        // ============================================================================

        OptimizationResult MeanVarianceOptimizer::optimize(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            double target_return) const
        {
            validate_inputs(expected_returns, covariance);

            if (!std::isfinite(target_return))
            {
                throw AdvisorError(ErrorCode::INVALID_TARGET,
                                   "Target return must be a finite number");
            }

            check_covariance(covariance);
            check_target_range(expected_returns, target_return);

            QuadraticProblem problem = build_problem(expected_returns, covariance, target_return);
            SolverResult solved = solver_->solve(problem);

            switch (solved.status)
            {
            case SolverStatus::SOLVED:
            case SolverStatus::SOLVED_INACCURATE:
                break;
            case SolverStatus::PRIMAL_INFEASIBLE:
                throw AdvisorError(ErrorCode::INFEASIBLE_TARGET,
                                   "No long-only portfolio reaches the target return",
                                   {{"target_return", target_return},
                                    {"solver_status", to_string(solved.status)}});
            default:
                throw AdvisorError(ErrorCode::ILL_CONDITIONED_COVARIANCE,
                                   "Solver failed on the covariance matrix: " + solved.message,
                                   {{"solver", solver_->get_name()},
                                    {"solver_status", to_string(solved.status)},
                                    {"iterations", solved.iterations}});
            }

            verify_solution(solved, expected_returns, target_return);

            Eigen::VectorXd weights = clean_weights(solved.solution, options_.feasibility_tolerance);

            OptimizationResult result = calculate_statistics(
                weights, expected_returns, covariance, options_.risk_free_rate);
            result.success = true;
            result.solver_status = solved.status;
            result.iterations = solved.iterations;
            result.objective_value = weights.dot(covariance * weights);
            result.message = to_string(solved.status);

            return result;
        }

        nlohmann::json MeanVarianceOptimizer::get_parameters() const
        {
            return {
                {"risk_free_rate", options_.risk_free_rate},
                {"tolerance", options_.tolerance},
                {"max_iterations", options_.max_iterations},
                {"feasibility_tolerance", options_.feasibility_tolerance},
                {"solver", solver_->get_name()}};
        }

        QuadraticProblem MeanVarianceOptimizer::build_problem(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            double target_return)
        {
            const Eigen::Index n = expected_returns.size();

            QuadraticProblem problem;
            problem.P = 2.0 * covariance;
            problem.q = Eigen::VectorXd::Zero(n);

            // Budget and target-return rows
            problem.A_eq = Eigen::MatrixXd(2, n);
            problem.A_eq.row(0).setOnes();
            problem.A_eq.row(1) = expected_returns.transpose();
            problem.b_eq = Eigen::VectorXd(2);
            problem.b_eq << 1.0, target_return;

            problem.lower_bounds = Eigen::VectorXd::Zero(n);
            problem.upper_bounds = Eigen::VectorXd::Ones(n);

            return problem;
        }

        // ============================================================================
        // Pre- and Post-Checks
        // ============================================================================

        void MeanVarianceOptimizer::check_covariance(const Eigen::MatrixXd &covariance) const
        {
            if (!covariance.allFinite())
            {
                throw AdvisorError(ErrorCode::ILL_CONDITIONED_COVARIANCE,
                                   "Covariance matrix contains NaN or Inf values",
                                   {{"dimension", covariance.rows()}});
            }

            double scale = std::max(1.0, covariance.cwiseAbs().maxCoeff());
            if (!risk::RiskModel::is_symmetric(covariance, 1e-12 * scale))
            {
                throw AdvisorError(ErrorCode::ILL_CONDITIONED_COVARIANCE,
                                   "Covariance matrix is not symmetric",
                                   {{"dimension", covariance.rows()}});
            }

            if (!risk::RiskModel::is_positive_semidefinite(covariance, options_.psd_tolerance))
            {
                throw AdvisorError(ErrorCode::ILL_CONDITIONED_COVARIANCE,
                                   "Covariance matrix is not positive semi-definite",
                                   {{"dimension", covariance.rows()},
                                    {"min_eigenvalue", risk::RiskModel::minimum_eigenvalue(covariance)}});
            }
        }

        void MeanVarianceOptimizer::check_target_range(const Eigen::VectorXd &expected_returns,
                                                       double target_return) const
        {
            double min_return = expected_returns.minCoeff();
            double max_return = expected_returns.maxCoeff();

            if (target_return > max_return + options_.target_tolerance)
            {
                throw AdvisorError(ErrorCode::INFEASIBLE_TARGET,
                                   "Target return exceeds the highest expected return",
                                   {{"constraint", "target_return <= max(mu)"},
                                    {"target_return", target_return},
                                    {"min_return", min_return},
                                    {"max_return", max_return}});
            }

            if (target_return < min_return - options_.target_tolerance)
            {
                throw AdvisorError(ErrorCode::INFEASIBLE_TARGET,
                                   "Target return is below the lowest expected return",
                                   {{"constraint", "target_return >= min(mu)"},
                                    {"target_return", target_return},
                                    {"min_return", min_return},
                                    {"max_return", max_return}});
            }
        }

        void MeanVarianceOptimizer::verify_solution(const SolverResult &solved,
                                                    const Eigen::VectorXd &expected_returns,
                                                    double target_return) const
        {
            // Target already lies in [min(mu), max(mu)]: a residual here is a convergence failure
            const Eigen::VectorXd &weights = solved.solution;
            const double tol = options_.feasibility_tolerance;
            const std::string status = to_string(solved.status);

            if (weights.size() != expected_returns.size() || !weights.allFinite())
            {
                throw AdvisorError(ErrorCode::ILL_CONDITIONED_COVARIANCE,
                                   "Solver returned a malformed weight vector",
                                   {{"solver_status", status}});
            }

            double budget_residual = std::abs(weights.sum() - 1.0);
            if (budget_residual > tol)
            {
                throw AdvisorError(ErrorCode::ILL_CONDITIONED_COVARIANCE,
                                   "Solver output violates the budget constraint",
                                   {{"constraint", "sum(w) = 1"},
                                    {"residual", budget_residual},
                                    {"solver_status", status}});
            }

            double return_residual = std::abs(expected_returns.dot(weights) - target_return);
            if (return_residual > tol)
            {
                throw AdvisorError(ErrorCode::ILL_CONDITIONED_COVARIANCE,
                                   "Solver output misses the target return",
                                   {{"constraint", "mu . w = target_return"},
                                    {"target_return", target_return},
                                    {"residual", return_residual},
                                    {"solver_status", status}});
            }

            double min_weight = weights.minCoeff();
            if (min_weight < -tol)
            {
                throw AdvisorError(ErrorCode::ILL_CONDITIONED_COVARIANCE,
                                   "Solver output violates the long-only constraint",
                                   {{"constraint", "w >= 0"},
                                    {"min_weight", min_weight},
                                    {"solver_status", status}});
            }
        }

    } // namespace optimizer
} // namespace advisor
