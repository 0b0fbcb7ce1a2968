/**
 * @file osqp_solver.cpp
 * @brief Implementation of OSQP solver wrapper
 */

#include "optimizer/osqp_solver.hpp"
#include <cmath>
#include <iostream>
#include <memory>

namespace advisor
{
    namespace optimizer
    {

        namespace
        {
            struct OSQPWorkspaceDeleter
            {
                void operator()(::OSQPSolver *work) const
                {
                    if (work != nullptr)
                    {
                        osqp_cleanup(work);
                    }
                }
            };

            using OSQPWorkspace = std::unique_ptr<::OSQPSolver, OSQPWorkspaceDeleter>;
        } // anonymous namespace

        OSQPSolver::OSQPSolver(const SolverOptions &options)
            : options_(options)
        {
        }

        void OSQPSolver::set_options(const SolverOptions &options)
        {
            options_ = options;
        }

        void OSQPSolver::convert_to_csc(
            const Eigen::MatrixXd &dense,
            std::vector<OSQPFloat> &data,
            std::vector<OSQPInt> &indices,
            std::vector<OSQPInt> &indptr,
            bool upper_triangular_only) const
        {
            const Eigen::Index rows = dense.rows();
            const Eigen::Index cols = dense.cols();

            data.clear();
            indices.clear();
            indptr.clear();
            indptr.reserve(cols + 1);

            indptr.push_back(0);

            // Iterate over columns (CSC format)
            for (Eigen::Index j = 0; j < cols; ++j)
            {
                Eigen::Index row_limit = upper_triangular_only ? (j + 1) : rows;

                for (Eigen::Index i = 0; i < row_limit; ++i)
                {
                    double val = dense(i, j);
                    // Keep the diagonal so OSQP sees the full P pattern
                    if (std::abs(val) > 1e-14 || (upper_triangular_only && i == j))
                    {
                        data.push_back(val);
                        indices.push_back(static_cast<OSQPInt>(i));
                    }
                }
                indptr.push_back(static_cast<OSQPInt>(data.size()));
            }
        }

        OSQPInt OSQPSolver::build_constraint_matrix(
            const QuadraticProblem &problem,
            std::vector<OSQPFloat> &A_data,
            std::vector<OSQPInt> &A_indices,
            std::vector<OSQPInt> &A_indptr,
            std::vector<OSQPFloat> &l,
            std::vector<OSQPFloat> &u) const
        {
            const Eigen::Index n = problem.q.size();
            const Eigen::Index n_eq = (problem.A_eq.size() > 0) ? problem.A_eq.rows() : 0;

            // Total constraints: equality rows + one box row per variable
            const Eigen::Index m = n_eq + n;

            A_data.clear();
            A_indices.clear();
            A_indptr.clear();
            l.resize(m);
            u.resize(m);

            A_indptr.push_back(0);

            for (Eigen::Index j = 0; j < n; ++j)
            {
                for (Eigen::Index i = 0; i < n_eq; ++i)
                {
                    double val = problem.A_eq(i, j);
                    if (std::abs(val) > 1e-14)
                    {
                        A_data.push_back(val);
                        A_indices.push_back(static_cast<OSQPInt>(i));
                    }
                }

                // Box row for x_j
                A_data.push_back(1.0);
                A_indices.push_back(static_cast<OSQPInt>(n_eq + j));

                A_indptr.push_back(static_cast<OSQPInt>(A_data.size()));
            }

            // Equality constraints: l = u = b_eq
            for (Eigen::Index i = 0; i < n_eq; ++i)
            {
                l[i] = problem.b_eq(i);
                u[i] = problem.b_eq(i);
            }

            for (Eigen::Index i = 0; i < n; ++i)
            {
                l[n_eq + i] = (problem.lower_bounds.size() > 0) ? problem.lower_bounds(i) : -OSQP_INFTY;
                u[n_eq + i] = (problem.upper_bounds.size() > 0) ? problem.upper_bounds(i) : OSQP_INFTY;
            }

            return static_cast<OSQPInt>(m);
        }

        SolverStatus OSQPSolver::map_status(OSQPInt status_val)
        {
            switch (status_val)
            {
            case OSQP_SOLVED:
                return SolverStatus::SOLVED;
            case OSQP_SOLVED_INACCURATE:
                return SolverStatus::SOLVED_INACCURATE;
            case OSQP_PRIMAL_INFEASIBLE:
            case OSQP_PRIMAL_INFEASIBLE_INACCURATE:
                return SolverStatus::PRIMAL_INFEASIBLE;
            case OSQP_DUAL_INFEASIBLE:
            case OSQP_DUAL_INFEASIBLE_INACCURATE:
                return SolverStatus::DUAL_INFEASIBLE;
            case OSQP_MAX_ITER_REACHED:
                return SolverStatus::MAX_ITERATIONS;
            case OSQP_NON_CVX:
                return SolverStatus::NON_CONVEX;
            default:
                return SolverStatus::UNSOLVED;
            }
        }

        SolverResult OSQPSolver::solve(const QuadraticProblem &problem) const
        {
            problem.validate();

            SolverResult result;
            const Eigen::Index n = problem.q.size();

            std::vector<OSQPFloat> P_data;
            std::vector<OSQPInt> P_indices;
            std::vector<OSQPInt> P_indptr;
            convert_to_csc(problem.P, P_data, P_indices, P_indptr, true);

            std::vector<OSQPFloat> q(problem.q.data(), problem.q.data() + n);

            std::vector<OSQPFloat> A_data;
            std::vector<OSQPInt> A_indices;
            std::vector<OSQPInt> A_indptr;
            std::vector<OSQPFloat> l;
            std::vector<OSQPFloat> u;

            OSQPInt m = build_constraint_matrix(problem, A_data, A_indices, A_indptr, l, u);

            OSQPCscMatrix P_csc;
            P_csc.m = static_cast<OSQPInt>(n);
            P_csc.n = static_cast<OSQPInt>(n);
            P_csc.p = P_indptr.data();
            P_csc.i = P_indices.data();
            P_csc.x = P_data.data();
            P_csc.nzmax = static_cast<OSQPInt>(P_data.size());
            P_csc.nz = -1; // -1 means CSC format (not triplet)

            OSQPCscMatrix A_csc;
            A_csc.m = m;
            A_csc.n = static_cast<OSQPInt>(n);
            A_csc.p = A_indptr.data();
            A_csc.i = A_indices.data();
            A_csc.x = A_data.data();
            A_csc.nzmax = static_cast<OSQPInt>(A_data.size());
            A_csc.nz = -1;

            OSQPSettings settings;
            osqp_set_default_settings(&settings);
            settings.verbose = options_.verbose ? 1 : 0;
            settings.eps_abs = options_.tolerance;
            settings.eps_rel = options_.tolerance;
            settings.max_iter = options_.max_iterations;
            settings.polishing = options_.polish ? 1 : 0;

            ::OSQPSolver *raw_work = nullptr;
            OSQPInt exit_flag = osqp_setup(&raw_work, &P_csc, q.data(), &A_csc,
                                           l.data(), u.data(), m, static_cast<OSQPInt>(n), &settings);
            OSQPWorkspace work(raw_work);

            if (exit_flag != 0)
            {
                result.success = false;
                result.status = (exit_flag == OSQP_NONCVX_ERROR) ? SolverStatus::NON_CONVEX
                                                                 : SolverStatus::SETUP_FAILED;
                result.message = "OSQP setup failed (exit flag " + std::to_string(exit_flag) + ")";
                result.solution = Eigen::VectorXd::Zero(n);
                return result;
            }

            osqp_solve(work.get());

            result.solution = Eigen::VectorXd::Zero(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                result.solution(i) = work->solution->x[i];
            }

            result.iterations = static_cast<int>(work->info->iter);
            result.objective_value = work->info->obj_val;
            result.status = map_status(work->info->status_val);
            result.message = std::string(work->info->status);
            result.success = result.status == SolverStatus::SOLVED ||
                             result.status == SolverStatus::SOLVED_INACCURATE;

            if (options_.verbose)
            {
                std::cout << "OSQP: " << result.message << " after "
                          << result.iterations << " iterations\n";
            }

            return result;
        }

    } // namespace optimizer
} // namespace advisor
