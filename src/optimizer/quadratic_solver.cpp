/**
 * @file quadratic_solver.cpp
 * @brief Implementation of quadratic problem structures
 */

#include "optimizer/quadratic_solver.hpp"
#include <stdexcept>

namespace advisor
{
    namespace optimizer
    {

        // ============================================================================
        // QuadraticProblem Implementation
        // ============================================================================

        void QuadraticProblem::validate() const
        {
            const Eigen::Index n = q.size();

            if (n == 0)
            {
                throw std::invalid_argument("Problem dimension is zero");
            }

            if (P.rows() != n || P.cols() != n)
            {
                throw std::invalid_argument("P matrix dimensions do not match q vector");
            }

            if (!P.allFinite())
            {
                throw std::invalid_argument("P matrix contains NaN or Inf");
            }

            if (!q.allFinite())
            {
                throw std::invalid_argument("q vector contains NaN or Inf");
            }

            if (A_eq.rows() > 0)
            {
                if (A_eq.cols() != n)
                {
                    throw std::invalid_argument("A_eq columns do not match problem dimension");
                }
                if (b_eq.size() != A_eq.rows())
                {
                    throw std::invalid_argument("b_eq size does not match A_eq rows");
                }
                if (!A_eq.allFinite() || !b_eq.allFinite())
                {
                    throw std::invalid_argument("Equality constraints contain NaN or Inf");
                }
            }

            if (lower_bounds.size() > 0 && lower_bounds.size() != n)
            {
                throw std::invalid_argument("Lower bounds size does not match problem dimension");
            }
            if (upper_bounds.size() > 0 && upper_bounds.size() != n)
            {
                throw std::invalid_argument("Upper bounds size does not match problem dimension");
            }
        }

        // ============================================================================
        // SolverResult Implementation
        // ============================================================================

        SolverResult::SolverResult()
            : objective_value(0.0),
              success(false),
              status(SolverStatus::UNSOLVED),
              iterations(0)
        {
        }

        std::string to_string(SolverStatus status)
        {
            switch (status)
            {
            case SolverStatus::SOLVED:
                return "solved";
            case SolverStatus::SOLVED_INACCURATE:
                return "solved inaccurate";
            case SolverStatus::PRIMAL_INFEASIBLE:
                return "primal infeasible";
            case SolverStatus::DUAL_INFEASIBLE:
                return "dual infeasible";
            case SolverStatus::MAX_ITERATIONS:
                return "maximum iterations reached";
            case SolverStatus::NON_CONVEX:
                return "problem non convex";
            case SolverStatus::SETUP_FAILED:
                return "setup failed";
            case SolverStatus::UNSOLVED:
                return "unsolved";
            }
            return "unknown";
        }

    } // namespace optimizer
} // namespace advisor
