/**
 * @file sqp_solver.cpp
 * @brief Implementation of the SQP solver
 */

#include "folio/optimizer/sqp_solver.hpp"
#include "folio/optimizer/osqp_solver.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace folio
{
    namespace optimizer
    {

        SqpSolver::SqpSolver(const SqpOptions &options) : options_(options)
        {
            if (options_.max_iterations < 1)
            {
                throw std::invalid_argument(
                    "SQP max_iterations must be positive, got: " + std::to_string(options_.max_iterations));
            }
        }

        SolverResult SqpSolver::solve(const ObjectiveFunction &objective,
                                      const LinearConstraints &constraints,
                                      const Eigen::VectorXd &initial_point) const
        {
            const Eigen::Index n = initial_point.size();
            if (n == 0)
            {
                throw std::invalid_argument("Initial point is empty");
            }
            constraints.validate(n);

            SolverResult result;
            Eigen::VectorXd x = constraints.clip_to_bounds(initial_point);
            double f = objective.value(x);

            result.solution = x;
            result.objective_value = f;

            if (!objective.is_admissible(f))
            {
                result.message = "Objective is not admissible at the starting point";
                return result;
            }

            Eigen::VectorXd g = objective.gradient(x);
            Eigen::MatrixXd B = Eigen::MatrixXd::Identity(n, n);
            double penalty = 1.0;

            SolverOptions qp_options;
            qp_options.max_iterations = 20000;
            qp_options.tolerance = 1e-10;
            OsqpSolver qp_solver(qp_options);

            const bool has_equalities = constraints.A_eq.size() > 0;
            result.message = "Maximum iterations reached";

            for (int k = 0; k < options_.max_iterations; ++k)
            {
                result.iterations = k + 1;

                // QP sub-problem in the step d
                QuadraticProblem sub_problem;
                sub_problem.P = B;
                sub_problem.q = g;
                if (has_equalities)
                {
                    sub_problem.constraints.A_eq = constraints.A_eq;
                    sub_problem.constraints.b_eq = constraints.b_eq - constraints.A_eq * x;
                }
                sub_problem.constraints.lower_bounds = constraints.lower_bounds - x;
                sub_problem.constraints.upper_bounds = constraints.upper_bounds - x;
                sub_problem.initial_guess = Eigen::VectorXd::Zero(n);

                SolverResult qp_result = qp_solver.solve(sub_problem);
                if (!qp_result.success)
                {
                    result.message = "QP sub-problem failed: " + qp_result.message;
                    break;
                }

                Eigen::VectorXd d = qp_result.solution
                                        .cwiseMax(sub_problem.constraints.lower_bounds)
                                        .cwiseMin(sub_problem.constraints.upper_bounds);

                if (qp_result.dual_solution.size() > 0)
                {
                    penalty = std::max(penalty, 2.0 * qp_result.dual_solution.cwiseAbs().maxCoeff());
                }

                const double violation = constraints.max_violation(x);
                if (d.lpNorm<Eigen::Infinity>() <= options_.step_tolerance &&
                    violation <= options_.feasibility_tolerance)
                {
                    result.success = true;
                    result.message = "Converged: step below tolerance";
                    break;
                }

                // Backtracking on the L1 merit function
                const double residual = constraints.equality_residual_l1(x);
                const double merit = f + penalty * residual;
                const double directional = g.dot(d) - penalty * residual;

                double alpha = 1.0;
                bool accepted = false;
                Eigen::VectorXd x_trial;
                double f_trial = f;

                for (int ls = 0; ls < options_.max_line_search_steps; ++ls)
                {
                    x_trial = constraints.clip_to_bounds(x + alpha * d);
                    f_trial = objective.value(x_trial);

                    if (objective.is_admissible(f_trial))
                    {
                        double merit_trial = f_trial + penalty * constraints.equality_residual_l1(x_trial);
                        if (merit_trial <= merit + 1e-4 * alpha * std::min(directional, 0.0))
                        {
                            accepted = true;
                            break;
                        }
                    }
                    alpha *= 0.5;
                }

                if (!accepted)
                {
                    // No descent left along d: stationary up to rounding
                    if (std::abs(directional) <= options_.function_tolerance * (1.0 + std::abs(f)) &&
                        violation <= options_.feasibility_tolerance)
                    {
                        result.success = true;
                        result.message = "Converged: no further descent";
                    }
                    else
                    {
                        result.message = "Line search failed";
                    }
                    break;
                }

                Eigen::VectorXd g_trial = objective.gradient(x_trial);
                Eigen::VectorXd s = x_trial - x;
                Eigen::VectorXd y = g_trial - g;
                const double f_previous = f;

                x = x_trial;
                f = f_trial;
                g = g_trial;
                result.solution = x;
                result.objective_value = f;

                if (options_.verbose)
                {
                    std::cout << "  SQP iteration " << std::setw(3) << (k + 1)
                              << ": f = " << std::setprecision(10) << f
                              << ", step = " << alpha
                              << ", violation = " << constraints.max_violation(x) << std::endl;
                }

                update_hessian(B, s, y);

                if (alpha == 1.0 &&
                    std::abs(f_previous - f) <= options_.function_tolerance * (1.0 + std::abs(f)) &&
                    constraints.max_violation(x) <= options_.feasibility_tolerance)
                {
                    result.success = true;
                    result.message = "Converged: objective change below tolerance";
                    break;
                }
            }

            return result;
        }

        void SqpSolver::update_hessian(Eigen::MatrixXd &B,
                                       const Eigen::VectorXd &s,
                                       const Eigen::VectorXd &y)
        {
            Eigen::VectorXd Bs = B * s;
            const double sBs = s.dot(Bs);
            if (sBs <= 0.0)
            {
                return;
            }

            // Powell damping keeps s'y sufficiently positive
            Eigen::VectorXd y_damped = y;
            double sy = s.dot(y);
            if (sy < 0.2 * sBs)
            {
                double theta = 0.8 * sBs / (sBs - sy);
                y_damped = theta * y + (1.0 - theta) * Bs;
                sy = s.dot(y_damped);
            }
            if (sy <= 0.0)
            {
                return;
            }

            B += (y_damped * y_damped.transpose()) / sy - (Bs * Bs.transpose()) / sBs;
            B = 0.5 * (B + B.transpose());
        }

    } // namespace optimizer
} // namespace folio
