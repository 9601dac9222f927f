/**
 * @file osqp_solver.cpp
 * @brief Implementation of OSQP solver wrapper
 */

#include "folio/optimizer/osqp_solver.hpp"

#include <cmath>
#include <iostream>
#include <memory>

namespace folio
{
    namespace optimizer
    {

        namespace
        {
            struct OsqpWorkspaceDeleter
            {
                void operator()(::OSQPSolver *solver) const
                {
                    if (solver != nullptr)
                    {
                        osqp_cleanup(solver);
                    }
                }
            };

            using OsqpWorkspace = std::unique_ptr<::OSQPSolver, OsqpWorkspaceDeleter>;

            void fill_csc(OSQPCscMatrix &matrix, OSQPInt rows, OSQPInt cols,
                          std::vector<OSQPFloat> &data,
                          std::vector<OSQPInt> &indices,
                          std::vector<OSQPInt> &indptr)
            {
                matrix.m = rows;
                matrix.n = cols;
                matrix.p = indptr.data();
                matrix.i = indices.data();
                matrix.x = data.data();
                matrix.nzmax = static_cast<OSQPInt>(data.size());
                matrix.nz = -1; // compressed column, not triplet
            }
        } // anonymous namespace

        OsqpSolver::OsqpSolver(const SolverOptions &options) : options_(options)
        {
        }

        void OsqpSolver::set_options(const SolverOptions &options)
        {
            options_ = options;
        }

        void OsqpSolver::convert_to_csc(
            const Eigen::MatrixXd &dense,
            std::vector<OSQPFloat> &data,
            std::vector<OSQPInt> &indices,
            std::vector<OSQPInt> &indptr,
            bool upper_triangular_only)
        {
            const Eigen::Index rows = dense.rows();
            const Eigen::Index cols = dense.cols();

            data.clear();
            indices.clear();
            indptr.clear();
            indptr.reserve(cols + 1);
            indptr.push_back(0);

            for (Eigen::Index j = 0; j < cols; ++j)
            {
                Eigen::Index row_limit = upper_triangular_only ? (j + 1) : rows;

                for (Eigen::Index i = 0; i < row_limit; ++i)
                {
                    double val = dense(i, j);
                    if (val != 0.0)
                    {
                        data.push_back(val);
                        indices.push_back(static_cast<OSQPInt>(i));
                    }
                }
                indptr.push_back(static_cast<OSQPInt>(data.size()));
            }
        }

        OSQPInt OsqpSolver::build_constraint_matrix(
            const LinearConstraints &constraints,
            Eigen::Index n,
            std::vector<OSQPFloat> &A_data,
            std::vector<OSQPInt> &A_indices,
            std::vector<OSQPInt> &A_indptr,
            std::vector<OSQPFloat> &l,
            std::vector<OSQPFloat> &u)
        {
            const Eigen::Index n_eq = (constraints.A_eq.size() > 0) ? constraints.A_eq.rows() : 0;
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
                    double val = constraints.A_eq(i, j);
                    if (val != 0.0)
                    {
                        A_data.push_back(val);
                        A_indices.push_back(static_cast<OSQPInt>(i));
                    }
                }

                // Bound row for x_j
                A_data.push_back(1.0);
                A_indices.push_back(static_cast<OSQPInt>(n_eq + j));

                A_indptr.push_back(static_cast<OSQPInt>(A_data.size()));
            }

            for (Eigen::Index i = 0; i < n_eq; ++i)
            {
                l[i] = constraints.b_eq(i);
                u[i] = constraints.b_eq(i);
            }
            for (Eigen::Index i = 0; i < n; ++i)
            {
                l[n_eq + i] = std::isfinite(constraints.lower_bounds(i)) ? constraints.lower_bounds(i) : -OSQP_INFTY;
                u[n_eq + i] = std::isfinite(constraints.upper_bounds(i)) ? constraints.upper_bounds(i) : OSQP_INFTY;
            }

            return static_cast<OSQPInt>(m);
        }

        SolverResult OsqpSolver::solve(const QuadraticProblem &problem) const
        {
            problem.validate();

            SolverResult result;
            const Eigen::Index n = problem.q.size();
            const Eigen::Index n_eq = (problem.constraints.A_eq.size() > 0) ? problem.constraints.A_eq.rows() : 0;

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
            OSQPInt m = build_constraint_matrix(problem.constraints, n, A_data, A_indices, A_indptr, l, u);

            OSQPCscMatrix P_csc;
            fill_csc(P_csc, static_cast<OSQPInt>(n), static_cast<OSQPInt>(n), P_data, P_indices, P_indptr);

            OSQPCscMatrix A_csc;
            fill_csc(A_csc, m, static_cast<OSQPInt>(n), A_data, A_indices, A_indptr);

            OSQPSettings settings;
            osqp_set_default_settings(&settings);
            settings.verbose = options_.verbose ? 1 : 0;
            settings.eps_abs = options_.tolerance;
            settings.eps_rel = options_.tolerance;
            settings.max_iter = options_.max_iterations;
            settings.polishing = 1;
            settings.warm_starting = problem.initial_guess.size() == n ? 1 : 0;

            ::OSQPSolver *raw_workspace = nullptr;
            OSQPInt exit_flag = osqp_setup(&raw_workspace, &P_csc, q.data(), &A_csc,
                                           l.data(), u.data(), m, static_cast<OSQPInt>(n), &settings);
            OsqpWorkspace workspace(raw_workspace);

            if (exit_flag != 0 || !workspace)
            {
                result.success = false;
                result.message = "OSQP setup failed (code " + std::to_string(exit_flag) + ")";
                return result;
            }

            if (settings.warm_starting)
            {
                std::vector<OSQPFloat> x0(problem.initial_guess.data(), problem.initial_guess.data() + n);
                osqp_warm_start(workspace.get(), x0.data(), nullptr);
            }

            osqp_solve(workspace.get());

            const OSQPInfo *info = workspace->info;
            result.iterations = static_cast<int>(info->iter);
            result.objective_value = info->obj_val;
            result.message = info->status;

            result.success = (info->status_val == OSQP_SOLVED ||
                              info->status_val == OSQP_SOLVED_INACCURATE);

            if (result.success)
            {
                const OSQPSolution *solution = workspace->solution;
                result.solution = Eigen::Map<const Eigen::Matrix<OSQPFloat, Eigen::Dynamic, 1>>(solution->x, n).cast<double>();
                result.dual_solution = Eigen::Map<const Eigen::Matrix<OSQPFloat, Eigen::Dynamic, 1>>(solution->y, n_eq).cast<double>();
            }
            else if (options_.verbose)
            {
                std::cerr << "Warning: OSQP did not converge: " << result.message << std::endl;
            }

            return result;
        }

    } // namespace optimizer
} // namespace folio
