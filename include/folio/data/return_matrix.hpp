/**
 * @file return_matrix.hpp
 * @brief Dense matrix of daily asset returns indexed by date and ticker.
 *
 * Stores daily fractional returns as an Eigen matrix (dates x assets) with
 * the associated ISO dates and asset names. The matrix is validated on
 * construction and immutable afterwards.
 */

#ifndef FOLIO_DATA_RETURN_MATRIX_HPP
#define FOLIO_DATA_RETURN_MATRIX_HPP

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace folio
{

    /**
     * @class ReturnMatrix
     * @brief Container for multi-asset daily return series.
     *
     * Invariants enforced by the constructor:
     * - at least one date row and one asset column
     * - one date per row, in YYYY-MM-DD format, strictly increasing
     * - unique, non-empty asset names, one per column
     * - every cell is finite (rows with gaps are dropped before construction)
     *
     * @note Data is stored time x assets, matching the row-per-observation
     *       convention of the risk models.
     */
    class ReturnMatrix
    {
    public:
        /**
         * @brief Constructor with data.
         * @param returns Return matrix (dates x assets).
         * @param dates Date strings, one per row.
         * @param tickers Asset names, one per column.
         * @throws ValidationError if any invariant above is violated.
         */
        ReturnMatrix(const Eigen::MatrixXd &returns,
                     const std::vector<std::string> &dates,
                     const std::vector<std::string> &tickers);

        ~ReturnMatrix() = default;

        /**
         * @brief Get the full return matrix (dates x assets).
         */
        const Eigen::MatrixXd &get_returns() const { return returns_; }

        /**
         * @brief Get returns for a single asset.
         * @throws std::invalid_argument if the ticker is unknown.
         */
        Eigen::VectorXd get_asset_returns(const std::string &ticker) const;

        const std::vector<std::string> &get_dates() const { return dates_; }

        const std::vector<std::string> &get_tickers() const { return tickers_; }

        size_t num_dates() const { return dates_.size(); }

        size_t num_assets() const { return tickers_.size(); }

        /**
         * @brief Column index of a ticker.
         * @return Index, or -1 if the ticker is not present.
         */
        int find_ticker_index(const std::string &ticker) const;

        bool has_ticker(const std::string &ticker) const { return find_ticker_index(ticker) >= 0; }

        /**
         * @brief Check a YYYY-MM-DD date string (month 01-12, day 01-31).
         */
        static bool is_valid_date(const std::string &date);

    private:
        Eigen::MatrixXd returns_;
        std::vector<std::string> dates_;
        std::vector<std::string> tickers_;
        std::map<std::string, int> ticker_index_;

        void validate();
    };

} // namespace folio

#endif // FOLIO_DATA_RETURN_MATRIX_HPP
