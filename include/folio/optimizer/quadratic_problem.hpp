/**
 * @file quadratic_problem.hpp
 * @brief Problem, option and result structures shared by the solvers
 *
 * Quadratic programs have the form:
 *
 * Minimize:     (1/2) * x^T * P * x + q^T * x
 * Subject to:   A_eq * x = b_eq      (equality constraints)
 *               l <= x <= u          (box constraints)
 *
 * The same equality and box constraints describe the feasible set of the
 * nonlinear solver, which solves a sequence of such programs.
 */

#ifndef FOLIO_OPTIMIZER_QUADRATIC_PROBLEM_HPP
#define FOLIO_OPTIMIZER_QUADRATIC_PROBLEM_HPP

#include <Eigen/Dense>
#include <string>

namespace folio
{
    namespace optimizer
    {

        /**
         * @struct LinearConstraints
         * @brief Equality and box constraints on the decision vector
         */
        struct LinearConstraints
        {
            Eigen::MatrixXd A_eq; ///< Equality constraint matrix (m x N), may be empty
            Eigen::VectorXd b_eq; ///< Equality constraint values (m)

            Eigen::VectorXd lower_bounds; ///< Lower bounds (N)
            Eigen::VectorXd upper_bounds; ///< Upper bounds (N)

            /**
             * @brief Validate sizes and bound ordering for N variables
             * @throws std::invalid_argument if ill-formed
             */
            void validate(Eigen::Index n) const;

            /**
             * @brief Largest violation of any constraint at x (0 if feasible)
             */
            double max_violation(const Eigen::VectorXd &x) const;

            /**
             * @brief L1 norm of the equality residual A_eq x - b_eq
             */
            double equality_residual_l1(const Eigen::VectorXd &x) const;

            /**
             * @brief Clip x into [lower_bounds, upper_bounds]
             */
            Eigen::VectorXd clip_to_bounds(const Eigen::VectorXd &x) const;
        };

        /**
         * @struct QuadraticProblem
         * @brief Quadratic programming problem specification
         */
        struct QuadraticProblem
        {
            Eigen::MatrixXd P; ///< Quadratic term (N x N), symmetric PSD
            Eigen::VectorXd q; ///< Linear term (N x 1)

            LinearConstraints constraints; ///< Feasible set

            Eigen::VectorXd initial_guess; ///< Optional warm start (empty = none)

            /**
             * @brief Validate problem specification
             * @throws std::invalid_argument if problem is ill-formed
             */
            void validate() const;
        };

        /**
         * @struct SolverOptions
         * @brief Options for the quadratic and nonlinear solvers
         */
        struct SolverOptions
        {
            int max_iterations = 10000; ///< Maximum iterations
            double tolerance = 1e-8;    ///< Convergence tolerance
            bool verbose = false;       ///< Print progress
        };

        /**
         * @struct SolverResult
         * @brief Result from a solver run
         */
        struct SolverResult
        {
            Eigen::VectorXd solution;      ///< Final iterate
            Eigen::VectorXd dual_solution; ///< Multipliers of the equality rows (QP only)
            double objective_value;        ///< Final objective value
            bool success;                  ///< Convergence achieved
            int iterations;                ///< Number of iterations
            std::string message;           ///< Status message

            SolverResult();
        };

    } // namespace optimizer
} // namespace folio

#endif // FOLIO_OPTIMIZER_QUADRATIC_PROBLEM_HPP
