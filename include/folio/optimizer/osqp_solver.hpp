/**
 * @file osqp_solver.hpp
 * @brief OSQP-based quadratic programming solver
 *
 * Wraps the OSQP library (v1 API) for the portfolio quadratic programs:
 *   minimize     (1/2) x^T P x + q^T x
 *   subject to   A_eq x = b_eq,  lb <= x <= ub
 *
 * OSQP takes a single constraint block l <= A x <= u, so the wrapper
 * stacks the equality rows on top of an identity block for the bounds.
 */

#ifndef FOLIO_OPTIMIZER_OSQP_SOLVER_HPP
#define FOLIO_OPTIMIZER_OSQP_SOLVER_HPP

#include "folio/optimizer/quadratic_problem.hpp"

#include <Eigen/Dense>
#include <osqp/osqp.h>
#include <vector>

namespace folio
{
    namespace optimizer
    {

        /**
         * @class OsqpSolver
         * @brief Quadratic programming solver using the OSQP library
         *
         * Usage Example:
         * @code
         * SolverOptions options;
         * options.tolerance = 1e-8;
         * OsqpSolver solver(options);
         *
         * QuadraticProblem problem = ...;
         * SolverResult result = solver.solve(problem);
         * if (result.success) {
         *     std::cout << result.solution.transpose() << "\n";
         * }
         * @endcode
         *
         * Polishing is always enabled so active bounds are met exactly
         * when the active set is identified. Solutions reported as
         * "solved inaccurate" count as success; callers that need a
         * strict feasibility guarantee check the constraints themselves.
         */
        class OsqpSolver
        {
        public:
            explicit OsqpSolver(const SolverOptions &options = SolverOptions());

            ~OsqpSolver() = default;

            void set_options(const SolverOptions &options);

            const SolverOptions &get_options() const { return options_; }

            /**
             * @brief Solve quadratic programming problem
             * @param problem QP problem specification
             * @return Solution with status, iterations, and objective value
             * @throws std::invalid_argument if the problem is ill-formed
             */
            SolverResult solve(const QuadraticProblem &problem) const;

        private:
            SolverOptions options_;

            /**
             * @brief Convert Eigen dense matrix to OSQP CSC format
             * @param upper_triangular_only Store the upper triangle only (for P)
             */
            static void convert_to_csc(
                const Eigen::MatrixXd &dense,
                std::vector<OSQPFloat> &data,
                std::vector<OSQPInt> &indices,
                std::vector<OSQPInt> &indptr,
                bool upper_triangular_only);

            /**
             * @brief Build A = [A_eq; I] with l = [b_eq; lb], u = [b_eq; ub]
             * @return Number of constraint rows m
             */
            static OSQPInt build_constraint_matrix(
                const LinearConstraints &constraints,
                Eigen::Index n,
                std::vector<OSQPFloat> &A_data,
                std::vector<OSQPInt> &A_indices,
                std::vector<OSQPInt> &A_indptr,
                std::vector<OSQPFloat> &l,
                std::vector<OSQPFloat> &u);
        };

    } // namespace optimizer
} // namespace folio

#endif // FOLIO_OPTIMIZER_OSQP_SOLVER_HPP
