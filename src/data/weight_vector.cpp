/**
 * @file weight_vector.cpp
 * @brief Weight validation helpers
 */

#include "folio/data/weight_vector.hpp"

#include <cmath>
#include <sstream>

namespace folio
{

    ValidationError::ValidationError(const std::string &field, const std::string &message)
        : std::invalid_argument(field + ": " + message), field_(field)
    {
    }

    void validate_weights(const Eigen::VectorXd &weights,
                          Eigen::Index num_assets,
                          double tolerance)
    {
        if (weights.size() != num_assets)
        {
            throw ValidationError("weights",
                                  "Expected " + std::to_string(num_assets) + " weights, got " +
                                      std::to_string(weights.size()));
        }

        for (Eigen::Index i = 0; i < weights.size(); ++i)
        {
            if (!std::isfinite(weights(i)))
            {
                throw ValidationError("weights", "Weight at index " + std::to_string(i) + " is not finite");
            }
            if (weights(i) < 0.0)
            {
                throw ValidationError("weights",
                                      "Weights must be non-negative, got " + std::to_string(weights(i)) +
                                          " at index " + std::to_string(i));
            }
        }

        double sum = weights.sum();
        if (std::abs(sum - 1.0) > tolerance)
        {
            std::ostringstream msg;
            msg << "Weights must sum to 1.0 (tolerance " << tolerance << "), got " << sum;
            throw ValidationError("weights", msg.str());
        }
    }

    Eigen::VectorXd equal_weights(Eigen::Index num_assets)
    {
        if (num_assets < 1)
        {
            throw std::invalid_argument("Expected at least one asset, got: " + std::to_string(num_assets));
        }
        return Eigen::VectorXd::Constant(num_assets, 1.0 / static_cast<double>(num_assets));
    }

} // namespace folio
