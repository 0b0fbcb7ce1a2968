/**
 * @file quadratic_solver.hpp
 * @brief Quadratic programming problem description and solver interface
 *
 * Solves problems of the form:
 *
 * Minimize:     (1/2) * x^T * P * x + q^T * x
 * Subject to:   A_eq * x = b_eq    (equality constraints)
 *               l <= x <= u        (box constraints)
 *
 * Solvers report a SolverStatus so callers can tell an infeasible problem
 * from a non-convex one or from a solver that ran out of iterations.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace advisor
{
    namespace optimizer
    {

        /**
         * @struct QuadraticProblem
         * @brief Quadratic programming problem definition
         */
        struct QuadraticProblem
        {
            Eigen::MatrixXd P; ///< Quadratic term (N x N)
            Eigen::VectorXd q; ///< Linear term (N x 1)

            Eigen::MatrixXd A_eq; ///< Equality constraint matrix
            Eigen::VectorXd b_eq; ///< Equality constraint values

            Eigen::VectorXd lower_bounds; ///< Lower bounds (empty = unbounded)
            Eigen::VectorXd upper_bounds; ///< Upper bounds (empty = unbounded)

            QuadraticProblem() = default;

            /**
             * @brief Validate problem dimensions and bounds
             * @throws std::invalid_argument if problem is ill-formed
             */
            void validate() const;
        };

        /**
         * @struct SolverOptions
         * @brief Options for quadratic solver
         */
        struct SolverOptions
        {
            int max_iterations = 10000; ///< Maximum iterations
            double tolerance = 1e-6;    ///< Absolute and relative convergence tolerance
            bool polish = true;         ///< Refine the solution on the active set
            bool verbose = false;       ///< Print solver progress
        };

        /**
         * @enum SolverStatus
         * @brief Outcome of a solve
         */
        enum class SolverStatus
        {
            SOLVED,            ///< Converged to tolerance
            SOLVED_INACCURATE, ///< Converged to a relaxed tolerance
            PRIMAL_INFEASIBLE, ///< Constraints cannot be satisfied
            DUAL_INFEASIBLE,   ///< Objective unbounded below
            MAX_ITERATIONS,    ///< Iteration limit reached
            NON_CONVEX,        ///< P is not positive semi-definite
            SETUP_FAILED,      ///< Solver rejected the problem data
            UNSOLVED           ///< Any other failure
        };

        std::string to_string(SolverStatus status);

        /**
         * @struct SolverResult
         * @brief Result from quadratic solver
         */
        struct SolverResult
        {
            Eigen::VectorXd solution; ///< Optimal solution
            double objective_value;   ///< Final objective value
            bool success;             ///< Convergence achieved
            SolverStatus status;      ///< Detailed outcome
            int iterations;           ///< Number of iterations
            std::string message;      ///< Solver status text

            SolverResult();
        };

        /**
         * @class QuadraticSolver
         * @brief Abstract quadratic programming solver
         *
         * Thread Safety: Implementations keep no state between solves and are
         * safe for concurrent use.
         */
        class QuadraticSolver
        {
        public:
            virtual ~QuadraticSolver() = default;

            /**
             * @brief Solve quadratic program
             * @param problem Problem definition
             * @return Solver result; failures are reported through status
             * @throws std::invalid_argument if problem is ill-formed
             */
            virtual SolverResult solve(const QuadraticProblem &problem) const = 0;

            virtual std::string get_name() const = 0;
        };

    } // namespace optimizer
} // namespace advisor
