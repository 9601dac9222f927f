/**
 * @file return_matrix.cpp
 * @brief Implementation of ReturnMatrix class
 */

#include "folio/data/return_matrix.hpp"
#include "folio/data/weight_vector.hpp"

#include <cctype>
#include <stdexcept>

namespace folio
{

    // ============================================================================
    // Constructors
    // ============================================================================

    ReturnMatrix::ReturnMatrix(const Eigen::MatrixXd &returns,
                               const std::vector<std::string> &dates,
                               const std::vector<std::string> &tickers)
        : returns_(returns), dates_(dates), tickers_(tickers)
    {
        validate();

        for (size_t i = 0; i < tickers_.size(); ++i)
        {
            ticker_index_[tickers_[i]] = static_cast<int>(i);
        }
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    Eigen::VectorXd ReturnMatrix::get_asset_returns(const std::string &ticker) const
    {
        int idx = find_ticker_index(ticker);
        if (idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        return returns_.col(idx);
    }

    int ReturnMatrix::find_ticker_index(const std::string &ticker) const
    {
        auto it = ticker_index_.find(ticker);
        return (it != ticker_index_.end()) ? it->second : -1;
    }

    bool ReturnMatrix::is_valid_date(const std::string &date)
    {
        if (date.length() != 10)
            return false;
        if (date[4] != '-' || date[7] != '-')
            return false;

        for (size_t i = 0; i < date.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }

        int month = std::stoi(date.substr(5, 2));
        int day = std::stoi(date.substr(8, 2));
        return month >= 1 && month <= 12 && day >= 1 && day <= 31;
    }

    // ============================================================================
    // Validation
    // ============================================================================

    void ReturnMatrix::validate()
    {
        if (returns_.rows() == 0 || returns_.cols() == 0)
        {
            throw ValidationError("returns", "Return matrix cannot be empty");
        }
        if (returns_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw ValidationError("dates",
                                  "Return matrix rows (" + std::to_string(returns_.rows()) +
                                      ") must match dates vector size (" + std::to_string(dates_.size()) + ")");
        }
        if (returns_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw ValidationError("tickers",
                                  "Return matrix columns (" + std::to_string(returns_.cols()) +
                                      ") must match tickers vector size (" + std::to_string(tickers_.size()) + ")");
        }

        for (size_t i = 0; i < dates_.size(); ++i)
        {
            if (!is_valid_date(dates_[i]))
            {
                throw ValidationError("dates", "Invalid date (expected YYYY-MM-DD): '" + dates_[i] + "'");
            }
            // ISO dates compare correctly as strings
            if (i > 0 && dates_[i] <= dates_[i - 1])
            {
                throw ValidationError("dates",
                                      "Dates must be strictly increasing: '" + dates_[i - 1] +
                                          "' followed by '" + dates_[i] + "'");
            }
        }

        std::map<std::string, int> seen;
        for (const auto &ticker : tickers_)
        {
            if (ticker.empty())
            {
                throw ValidationError("tickers", "Asset names cannot be empty");
            }
            if (++seen[ticker] > 1)
            {
                throw ValidationError("tickers", "Duplicate asset name: " + ticker);
            }
        }

        if (!returns_.allFinite())
        {
            throw ValidationError("returns", "Return matrix contains NaN or Inf values");
        }
    }

} // namespace folio
