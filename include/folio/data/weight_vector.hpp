/**
 * @file weight_vector.hpp
 * @brief Portfolio weight validation and defaults
 *
 * Weights are plain Eigen vectors aligned positionally with the asset
 * columns of a ReturnMatrix. They are validated once, before any analytics
 * run, and are never renormalized.
 */

#ifndef FOLIO_DATA_WEIGHT_VECTOR_HPP
#define FOLIO_DATA_WEIGHT_VECTOR_HPP

#include <Eigen/Dense>
#include <stdexcept>
#include <string>

namespace folio
{

    /**
     * @class ValidationError
     * @brief Rejected caller input, tagged with the offending field
     *
     * Derives from std::invalid_argument so callers that only know the
     * standard hierarchy still catch it.
     */
    class ValidationError : public std::invalid_argument
    {
    public:
        /**
         * @brief Construct a validation error
         * @param field Name of the rejected input (e.g. "weights")
         * @param message Human readable description
         */
        ValidationError(const std::string &field, const std::string &message);

        /**
         * @brief Name of the rejected input
         */
        const std::string &field() const noexcept { return field_; }

    private:
        std::string field_;
    };

    /// Default absolute tolerance on |sum(w) - 1|
    constexpr double DEFAULT_WEIGHT_TOLERANCE = 0.01;

    /**
     * @brief Validate a weight vector against an asset count
     * @param weights Candidate weights
     * @param num_assets Number of asset columns
     * @param tolerance Absolute tolerance on the sum
     * @throws ValidationError if the size differs, an entry is negative or
     *         non-finite, or the sum is outside 1 +/- tolerance
     */
    void validate_weights(const Eigen::VectorXd &weights,
                          Eigen::Index num_assets,
                          double tolerance = DEFAULT_WEIGHT_TOLERANCE);

    /**
     * @brief Equal weighting, 1/N per asset
     * @throws std::invalid_argument if num_assets < 1
     */
    Eigen::VectorXd equal_weights(Eigen::Index num_assets);

} // namespace folio

#endif // FOLIO_DATA_WEIGHT_VECTOR_HPP
