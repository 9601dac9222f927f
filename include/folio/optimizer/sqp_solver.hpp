/**
 * @file sqp_solver.hpp
 * @brief Sequential quadratic programming for smooth objectives
 *
 * Minimizes a differentiable objective f(x) subject to linear equality
 * and box constraints:
 *
 * Minimize:     f(x)
 * Subject to:   A_eq * x = b_eq
 *               l <= x <= u
 *
 * Algorithm (per iteration k):
 * 1. Solve the QP sub-problem
 *        min  (1/2) d^T B_k d + g_k^T d
 *        s.t. A_eq d = b_eq - A_eq x_k,  l - x_k <= d <= u - x_k
 *    with OSQP, B_k a positive definite BFGS approximation of the Hessian
 * 2. Backtracking line search on the L1 merit f(x) + mu |A_eq x - b_eq|_1
 * 3. Damped (Powell) BFGS update of B_k
 *
 * Constraints are linear, so a full step restores feasibility and every
 * accepted iterate stays inside the bounds.
 */

#ifndef FOLIO_OPTIMIZER_SQP_SOLVER_HPP
#define FOLIO_OPTIMIZER_SQP_SOLVER_HPP

#include "folio/optimizer/objective_function.hpp"
#include "folio/optimizer/quadratic_problem.hpp"

#include <Eigen/Dense>

namespace folio
{
    namespace optimizer
    {

        /**
         * @struct SqpOptions
         * @brief Options for the SQP solver
         */
        struct SqpOptions
        {
            int max_iterations = 100;         ///< Outer iteration cap
            double function_tolerance = 1e-12; ///< Relative objective change for convergence
            double step_tolerance = 1e-9;      ///< Max-norm of the QP step for convergence
            double feasibility_tolerance = 1e-8; ///< Allowed constraint violation
            int max_line_search_steps = 40;    ///< Step halvings before giving up
            bool verbose = false;              ///< Print per-iteration progress
        };

        /**
         * @class SqpSolver
         * @brief SQP solver with BFGS updates and OSQP sub-problems
         *
         * The returned solution is always the best accepted iterate, so a
         * run that stops early still reports a point no worse than the
         * starting point under the merit function. success is true only
         * when a convergence test passed within the iteration cap.
         *
         * Usage Example:
         * @code
         * NegativeSharpeObjective objective(mu, sigma, rf);
         * LinearConstraints constraints = ...;
         * SqpSolver solver;
         * SolverResult result = solver.solve(objective, constraints, x0);
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class SqpSolver
        {
        public:
            explicit SqpSolver(const SqpOptions &options = SqpOptions());

            /**
             * @brief Minimize objective from a starting point
             * @param objective Differentiable objective
             * @param constraints Equality and box constraints
             * @param initial_point Starting point x0
             * @return Solver result with the best accepted iterate
             * @throws std::invalid_argument if sizes disagree
             */
            SolverResult solve(const ObjectiveFunction &objective,
                               const LinearConstraints &constraints,
                               const Eigen::VectorXd &initial_point) const;

            void set_options(const SqpOptions &options) { options_ = options; }

            const SqpOptions &get_options() const { return options_; }

        private:
            SqpOptions options_;

            /**
             * @brief Damped BFGS update keeping B positive definite
             */
            static void update_hessian(Eigen::MatrixXd &B,
                                       const Eigen::VectorXd &s,
                                       const Eigen::VectorXd &y);
        };

    } // namespace optimizer
} // namespace folio

#endif // FOLIO_OPTIMIZER_SQP_SOLVER_HPP
