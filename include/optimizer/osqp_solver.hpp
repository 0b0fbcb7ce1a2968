/**
 * @file osqp_solver.hpp
 * @brief OSQP-based quadratic programming solver
 *
 * Wraps the OSQP library (Operator Splitting Quadratic Program) for the
 * baseline portfolio problem.
 *
 * Problem formulation:
 *   minimize     (1/2) x^T P x + q^T x
 *   subject to   A_eq x = b_eq
 *                lb <= x <= ub
 *
 * OSQP detects primal and dual infeasibility, which the optimizer turns
 * into distinguishable errors instead of returning a garbage iterate.
 */

#pragma once

#include "quadratic_solver.hpp"
#include <Eigen/Dense>
#include <osqp/osqp.h>
#include <vector>

namespace advisor
{
    namespace optimizer
    {

        /**
         * @class OSQPSolver
         * @brief Quadratic programming solver using OSQP library
         *
         * Usage Example:
         * @code
         * SolverOptions options;
         * options.tolerance = 1e-7;
         * OSQPSolver solver(options);
         *
         * SolverResult result = solver.solve(problem);
         * if (result.status == SolverStatus::PRIMAL_INFEASIBLE) { ... }
         * @endcode
         */
        class OSQPSolver : public QuadraticSolver
        {
        public:
            explicit OSQPSolver(const SolverOptions &options = SolverOptions());

            ~OSQPSolver() override = default;

            void set_options(const SolverOptions &options);

            const SolverOptions &get_options() const { return options_; }

            /**
             * @brief Solve quadratic programming problem
             * @param problem QP problem definition
             * @return Solution with status, iterations, and objective value
             * @throws std::invalid_argument if problem is ill-formed
             *
             * Time complexity: O(n^3) worst case for the KKT factorization
             */
            SolverResult solve(const QuadraticProblem &problem) const override;

            std::string get_name() const override { return "OSQPSolver"; }

        private:
            SolverOptions options_; ///< Solver configuration

            /**
             * @brief Convert Eigen dense matrix to OSQP sparse CSC format
             * @param upper_triangular_only Only store upper triangle (for symmetric P)
             */
            void convert_to_csc(
                const Eigen::MatrixXd &dense,
                std::vector<OSQPFloat> &data,
                std::vector<OSQPInt> &indices,
                std::vector<OSQPInt> &indptr,
                bool upper_triangular_only = false) const;

            /**
             * @brief Build constraint matrix for OSQP
             * @return Number of constraints (m)
             *
             * Constructs constraint matrix as:
             *   A = [A_eq; I]
             *   l = [b_eq; lb]
             *   u = [b_eq; ub]
             */
            OSQPInt build_constraint_matrix(
                const QuadraticProblem &problem,
                std::vector<OSQPFloat> &A_data,
                std::vector<OSQPInt> &A_indices,
                std::vector<OSQPInt> &A_indptr,
                std::vector<OSQPFloat> &l,
                std::vector<OSQPFloat> &u) const;

            static SolverStatus map_status(OSQPInt status_val);
        };

    } // namespace optimizer
} // namespace advisor
