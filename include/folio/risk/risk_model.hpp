/**
 * @file risk_model.hpp
 * @brief Base interface for estimating co-movement of asset returns
 *
 * Input is a T x N matrix of simple periodic returns, one row per date and
 * one column per asset. Estimators never throw on a sample that is merely
 * too small or too flat: the affected entries come back as NaN and the
 * report layer turns them into absent values.
 */

#ifndef FOLIO_RISK_RISK_MODEL_HPP
#define FOLIO_RISK_RISK_MODEL_HPP

#include <Eigen/Dense>
#include <string>

namespace folio
{
    namespace risk
    {

        /**
         * @class RiskModel
         * @brief Covariance estimator interface
         *
         * @code
         * risk::SampleCovariance model;
         * Eigen::MatrixXd sigma = model.estimate_covariance(returns.get_returns());
         * Eigen::MatrixXd rho = model.estimate_correlation(returns.get_returns());
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @brief Daily covariance of the return columns
             * @return Symmetric N x N matrix, all NaN when T is too small
             * @throws std::invalid_argument on an empty or non-finite sample
             */
            virtual Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const = 0;

            /**
             * @brief Pairwise correlation, derived from estimate_covariance()
             */
            virtual Eigen::MatrixXd estimate_correlation(
                const Eigen::MatrixXd &returns) const;

            virtual std::string get_name() const = 0;

            /**
             * @brief Normalize a covariance matrix to correlations
             *
             * An asset with zero or NaN variance has no defined correlation:
             * its whole row and column, diagonal included, is NaN.
             *
             * @throws std::invalid_argument if the matrix is empty or not square
             */
            static Eigen::MatrixXd covariance_to_correlation(
                const Eigen::MatrixXd &covariance);

        protected:
            /// @throws std::invalid_argument on an empty or non-finite matrix
            static void validate_returns(const Eigen::MatrixXd &returns);

            /// Average with the transpose so rounding never breaks symmetry
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);
        };

    } // namespace risk
} // namespace folio

#endif // FOLIO_RISK_RISK_MODEL_HPP
