/**
 * @file quadratic_problem.cpp
 * @brief Validation and feasibility helpers for solver problems
 */

#include "folio/optimizer/quadratic_problem.hpp"

#include <algorithm>
#include <stdexcept>

namespace folio
{
    namespace optimizer
    {

        void LinearConstraints::validate(Eigen::Index n) const
        {
            if (A_eq.size() > 0)
            {
                if (A_eq.cols() != n)
                {
                    throw std::invalid_argument(
                        "A_eq must have " + std::to_string(n) + " columns, got: " +
                        std::to_string(A_eq.cols()));
                }
                if (b_eq.size() != A_eq.rows())
                {
                    throw std::invalid_argument("b_eq size must match A_eq rows");
                }
            }

            if (lower_bounds.size() != n || upper_bounds.size() != n)
            {
                throw std::invalid_argument(
                    "Bounds must have size " + std::to_string(n));
            }

            for (Eigen::Index i = 0; i < n; ++i)
            {
                if (lower_bounds(i) > upper_bounds(i))
                {
                    throw std::invalid_argument(
                        "Lower bound exceeds upper bound at index " + std::to_string(i));
                }
            }
        }

        double LinearConstraints::max_violation(const Eigen::VectorXd &x) const
        {
            double violation = 0.0;
            if (A_eq.size() > 0)
            {
                violation = (A_eq * x - b_eq).cwiseAbs().maxCoeff();
            }
            for (Eigen::Index i = 0; i < x.size(); ++i)
            {
                violation = std::max(violation, lower_bounds(i) - x(i));
                violation = std::max(violation, x(i) - upper_bounds(i));
            }
            return violation;
        }

        double LinearConstraints::equality_residual_l1(const Eigen::VectorXd &x) const
        {
            if (A_eq.size() == 0)
            {
                return 0.0;
            }
            return (A_eq * x - b_eq).cwiseAbs().sum();
        }

        Eigen::VectorXd LinearConstraints::clip_to_bounds(const Eigen::VectorXd &x) const
        {
            return x.cwiseMax(lower_bounds).cwiseMin(upper_bounds);
        }

        void QuadraticProblem::validate() const
        {
            const Eigen::Index n = q.size();
            if (n == 0)
            {
                throw std::invalid_argument("Quadratic problem is empty");
            }
            if (P.rows() != n || P.cols() != n)
            {
                throw std::invalid_argument(
                    "P matrix must be " + std::to_string(n) + "x" + std::to_string(n));
            }
            if (!P.allFinite() || !q.allFinite())
            {
                throw std::invalid_argument("Quadratic problem contains NaN or Inf values");
            }
            if (initial_guess.size() != 0 && initial_guess.size() != n)
            {
                throw std::invalid_argument("Initial guess size must match problem size");
            }
            constraints.validate(n);
        }

        SolverResult::SolverResult()
            : objective_value(0.0), success(false), iterations(0)
        {
        }

    } // namespace optimizer
} // namespace folio
