/**
 * @file generate_synthetic_returns.cpp
 * @brief Generate a synthetic daily returns CSV for the analytics engine
 */

#include "folio/analytics/asset_statistics.hpp"
#include "folio/data/data_loader.hpp"
#include "folio/data/weight_vector.hpp"
#include "folio/risk/sample_covariance.hpp"
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace folio;

int main(int argc, char* argv[]) {
    std::vector<std::string> tickers = {
        "AAPL", "MSFT", "JPM", "JNJ", "XOM", "WMT", "SPY"
    };

    std::string output_file = "data/returns.csv";
    std::string start_date = "2022-01-03";
    size_t num_days = 504;
    double volatility = 0.012;
    double drift = 0.0003;
    double correlation = 0.3;
    unsigned int seed = 42;
    bool with_weights = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) {
                output_file = argv[++i];
            } else if (arg == "--start" && i + 1 < argc) {
                start_date = argv[++i];
            } else if (arg == "--days" && i + 1 < argc) {
                num_days = std::stoul(argv[++i]);
            } else if (arg == "--volatility" && i + 1 < argc) {
                volatility = std::stod(argv[++i]);
            } else if (arg == "--drift" && i + 1 < argc) {
                drift = std::stod(argv[++i]);
            } else if (arg == "--correlation" && i + 1 < argc) {
                correlation = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<unsigned int>(std::stoul(argv[++i]));
            } else if (arg == "--weights") {
                with_weights = true;
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output FILE        Output CSV file (default: data/returns.csv)\n"
                          << "  --start DATE         First date, YYYY-MM-DD (default: 2022-01-03)\n"
                          << "  --days N             Number of trading days (default: 504)\n"
                          << "  --volatility VAL     Daily volatility (default: 0.012)\n"
                          << "  --drift VAL          Daily drift (default: 0.0003)\n"
                          << "  --correlation VAL    Pairwise correlation (default: 0.3)\n"
                          << "  --seed N             Random seed (default: 42)\n"
                          << "  --weights            Append an equal-weight Weights row\n"
                          << "  --help               Show this help\n";
                return 0;
            } else {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        std::cout << "Generating " << num_days << " days for " << tickers.size()
                  << " assets starting " << start_date << "..." << std::endl;

        ReturnMatrix returns = DataLoader::generate_synthetic_returns(
            tickers, num_days, start_date, volatility, drift, correlation, seed);

        std::optional<Eigen::VectorXd> weights;
        if (with_weights) {
            weights = equal_weights(static_cast<Eigen::Index>(tickers.size()));
        }

        std::cout << "Saving to " << output_file << "..." << std::endl;
        DataLoader::save_returns_csv(returns, output_file, weights);

        auto stats = analytics::AssetStatistics::compute(
            returns.get_returns(), risk::SampleCovariance());

        std::cout << "\nDates: " << returns.num_dates() << " ("
                  << returns.get_dates().front() << " to "
                  << returns.get_dates().back() << ")\n";
        std::cout << "\nAsset Statistics (Annualized):\n";
        std::cout << std::string(45, '-') << "\n";
        std::cout << std::setw(8) << "Ticker"
                  << std::setw(18) << "Mean Return"
                  << std::setw(18) << "Volatility" << "\n";
        std::cout << std::string(45, '-') << "\n";

        for (size_t i = 0; i < returns.num_assets(); ++i) {
            double ann_return = stats.means(i) * 252.0;
            double ann_vol = stats.volatilities(i) * std::sqrt(252.0);
            std::cout << std::setw(8) << returns.get_tickers()[i]
                      << std::setw(17) << std::fixed << std::setprecision(2)
                      << (ann_return * 100) << "%"
                      << std::setw(17) << (ann_vol * 100) << "%\n";
        }
        std::cout << std::string(45, '-') << "\n";

        std::cout << "\nYou can now run:\n"
                  << "  ./build/folio_analyze --returns " << output_file << " --verbose\n"
                  << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
