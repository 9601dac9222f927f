/**
 * @file data_loader.hpp
 * @brief Loading of return matrices and run configuration
 *
 * Reads wide-format return CSV files (date column followed by one column
 * per asset, with an optional "Weights" row) and JSON configuration files,
 * and generates reproducible synthetic return data for tests and demos.
 */

#ifndef FOLIO_DATA_DATA_LOADER_HPP
#define FOLIO_DATA_DATA_LOADER_HPP

#include "folio/data/return_matrix.hpp"
#include "folio/report/analytics_config.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace folio {

/**
 * @struct DataConfig
 * @brief Input section of a run configuration
 */
struct DataConfig {
    std::string returns_file;                   ///< Path to the returns CSV
    std::optional<std::vector<double>> weights; ///< Portfolio weights in column order

    /**
     * @brief Load from the "data" JSON object
     */
    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct RunConfig
 * @brief Complete configuration of one analytics run
 */
struct RunConfig {
    DataConfig data;
    report::AnalyticsConfig analytics;
};

/**
 * @struct ReturnsDataset
 * @brief Parsed contents of a returns CSV
 */
struct ReturnsDataset {
    ReturnMatrix returns;                  ///< Complete rows only
    std::optional<Eigen::VectorXd> weights; ///< From the "Weights" row, if present
    size_t dropped_rows = 0;               ///< Rows discarded for missing values
};

/**
 * @class DataLoader
 * @brief Loads return data and configuration from files
 *
 * Expected CSV format:
 * @code
 * date,AAPL,MSFT,SPY
 * 2024-01-02,0.0012,-0.0040,0.0005
 * 2024-01-03,-0.0075,0.0021,-0.0031
 * Weights,0.4,0.4,0.2
 * @endcode
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading
    // ========================================================================

    /**
     * @brief Load a wide-format returns CSV
     *
     * Rows with an empty or non-numeric cell are dropped with a warning on
     * stderr. A row whose first cell is "Weights" (any case) supplies the
     * weight vector and is not part of the return matrix.
     *
     * @param filepath Path to CSV file
     * @return Return matrix and optional weights
     * @throws std::runtime_error if the file cannot be read or is malformed
     * @throws ValidationError if the remaining rows violate ReturnMatrix invariants
     */
    static ReturnsDataset load_returns_csv(const std::string& filepath);

    /**
     * @brief Write a return matrix (and optional weights row) as CSV
     * @throws std::runtime_error if the file cannot be written
     */
    static void save_returns_csv(const ReturnMatrix& returns,
                                 const std::string& filepath,
                                 const std::optional<Eigen::VectorXd>& weights = std::nullopt);

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load a run configuration ("data", "analytics", "optimizer")
     * @throws std::runtime_error if the file cannot be read or parsed
     * @throws std::invalid_argument if a value is out of range
     */
    static RunConfig load_config(const std::string& config_path);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate reproducible Gaussian daily returns on weekday dates
     *
     * Each asset's return is drift + volatility * (sqrt(rho) * m + sqrt(1 - rho) * e)
     * with a common factor m and idiosyncratic noise e, both standard normal.
     *
     * @param tickers Asset names
     * @param num_days Number of trading days
     * @param start_date First date (YYYY-MM-DD); weekends are skipped
     * @param volatility Daily volatility
     * @param drift Daily mean return
     * @param correlation Pairwise correlation rho in [0, 1]
     * @param seed Random seed
     * @throws std::invalid_argument on an empty universe or bad parameters
     */
    static ReturnMatrix generate_synthetic_returns(
        const std::vector<std::string>& tickers,
        size_t num_days,
        const std::string& start_date = "2020-01-01",
        double volatility = 0.01,
        double drift = 0.0004,
        double correlation = 0.3,
        unsigned int seed = 42
    );

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);

    static std::string trim(const std::string& str);

    /**
     * @brief Parse a numeric cell; absent if empty or not a number
     */
    static std::optional<double> parse_number(const std::string& str);

    /**
     * @brief Next weekday strictly after a YYYY-MM-DD date
     */
    static std::string next_weekday(const std::string& date);
};

} // namespace folio

#endif // FOLIO_DATA_DATA_LOADER_HPP
