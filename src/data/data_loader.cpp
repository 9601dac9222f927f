/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader and configuration structures
 */

#include "folio/data/data_loader.hpp"
#include "folio/data/weight_vector.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <stdexcept>

namespace folio
{

    namespace
    {
        std::string to_lower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        // Days since 1970-01-01 for a proleptic Gregorian date
        long days_from_civil(int y, unsigned m, unsigned d)
        {
            y -= m <= 2;
            const long era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<long>(doe) - 719468;
        }

        std::string civil_from_days(long z)
        {
            z += 719468;
            const long era = (z >= 0 ? z : z - 146096) / 146097;
            const unsigned doe = static_cast<unsigned>(z - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const long y = static_cast<long>(yoe) + era * 400;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            const unsigned d = doy - (153 * mp + 2) / 5 + 1;
            const unsigned m = mp < 10 ? mp + 3 : mp - 9;

            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04ld-%02u-%02u", y + (m <= 2), m, d);
            return std::string(buffer);
        }

        long parse_days(const std::string &date)
        {
            if (!ReturnMatrix::is_valid_date(date))
            {
                throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + date);
            }
            const int y = std::stoi(date.substr(0, 4));
            const unsigned m = static_cast<unsigned>(std::stoi(date.substr(5, 2)));
            const unsigned d = static_cast<unsigned>(std::stoi(date.substr(8, 2)));
            return days_from_civil(y, m, d);
        }

        bool is_weekend(long days)
        {
            // 1970-01-01 was a Thursday; 0 = Sunday
            const long weekday = ((days % 7) + 11) % 7;
            return weekday == 0 || weekday == 6;
        }
    } // anonymous namespace

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.returns_file = j.value("returns_file", "");
        if (j.contains("weights") && !j.at("weights").is_null())
        {
            config.weights = j.at("weights").get<std::vector<double>>();
        }
        return config;
    }

    // ===========================
    // CSV Loading
    // ===========================

    ReturnsDataset DataLoader::load_returns_csv(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.size() < 2 || to_lower(trim(header[0])) != "date")
        {
            throw std::runtime_error("CSV must start with a 'date' column followed by asset columns");
        }

        std::vector<std::string> tickers;
        for (size_t i = 1; i < header.size(); ++i)
        {
            tickers.push_back(trim(header[i]));
        }
        const size_t num_assets = tickers.size();

        std::vector<std::string> dates;
        std::vector<std::vector<double>> rows;
        std::optional<Eigen::VectorXd> weights;
        size_t dropped = 0;
        size_t line_number = 1;

        while (std::getline(file, line))
        {
            ++line_number;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() > num_assets + 1)
            {
                throw std::runtime_error(
                    "Line " + std::to_string(line_number) + " has " + std::to_string(fields.size()) +
                    " fields, header has " + std::to_string(num_assets + 1));
            }

            const std::string label = trim(fields[0]);

            if (to_lower(label) == "weights")
            {
                if (weights)
                {
                    throw std::runtime_error("Duplicate Weights row at line " + std::to_string(line_number));
                }
                Eigen::VectorXd w(static_cast<Eigen::Index>(num_assets));
                for (size_t j = 0; j < num_assets; ++j)
                {
                    std::optional<double> value;
                    if (j + 1 < fields.size())
                    {
                        value = parse_number(fields[j + 1]);
                    }
                    if (!value)
                    {
                        throw std::runtime_error(
                            "Weights row is missing a value for asset '" + tickers[j] + "'");
                    }
                    w(static_cast<Eigen::Index>(j)) = *value;
                }
                weights = w;
                continue;
            }

            if (!ReturnMatrix::is_valid_date(label))
            {
                throw std::runtime_error(
                    "Invalid date '" + label + "' at line " + std::to_string(line_number));
            }

            std::vector<double> row;
            row.reserve(num_assets);
            bool complete = fields.size() == num_assets + 1;
            for (size_t j = 0; complete && j < num_assets; ++j)
            {
                std::optional<double> value = parse_number(fields[j + 1]);
                if (!value)
                {
                    complete = false;
                    break;
                }
                row.push_back(*value);
            }

            if (!complete)
            {
                ++dropped;
                continue;
            }

            dates.push_back(label);
            rows.push_back(std::move(row));
        }

        if (dates.empty())
        {
            throw std::runtime_error("No complete data rows found in CSV file: " + filepath);
        }

        if (dropped > 0)
        {
            std::cerr << "Warning: dropped " << dropped << " rows with missing values from "
                      << filepath << std::endl;
        }

        Eigen::MatrixXd matrix(static_cast<Eigen::Index>(dates.size()), static_cast<Eigen::Index>(num_assets));
        for (size_t i = 0; i < rows.size(); ++i)
        {
            for (size_t j = 0; j < num_assets; ++j)
            {
                matrix(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
            }
        }

        return ReturnsDataset{ReturnMatrix(matrix, dates, tickers), weights, dropped};
    }

    void DataLoader::save_returns_csv(const ReturnMatrix &returns,
                                      const std::string &filepath,
                                      const std::optional<Eigen::VectorXd> &weights)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date";
        for (const auto &ticker : returns.get_tickers())
        {
            file << "," << ticker;
        }
        file << "\n";

        const auto &matrix = returns.get_returns();
        const auto &dates = returns.get_dates();
        file << std::setprecision(10);

        for (size_t i = 0; i < dates.size(); ++i)
        {
            file << dates[i];
            for (Eigen::Index j = 0; j < matrix.cols(); ++j)
            {
                file << "," << matrix(static_cast<Eigen::Index>(i), j);
            }
            file << "\n";
        }

        if (weights)
        {
            if (weights->size() != matrix.cols())
            {
                throw std::invalid_argument(
                    "Weights size (" + std::to_string(weights->size()) +
                    ") does not match number of assets (" + std::to_string(matrix.cols()) + ")");
            }
            file << "Weights";
            for (Eigen::Index j = 0; j < weights->size(); ++j)
            {
                file << "," << (*weights)(j);
            }
            file << "\n";
        }

        if (!file)
        {
            throw std::runtime_error("Failed writing file: " + filepath);
        }
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        return j;
    }

    RunConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        RunConfig config;
        try
        {
            if (j.contains("data"))
            {
                config.data = DataConfig::from_json(j.at("data"));
            }
            config.analytics = report::AnalyticsConfig::from_json(j);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("Invalid configuration in " + config_path + ": " + e.what());
        }

        return config;
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    ReturnMatrix DataLoader::generate_synthetic_returns(
        const std::vector<std::string> &tickers,
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        double correlation,
        unsigned int seed)
    {
        if (tickers.empty() || num_days == 0)
        {
            throw std::invalid_argument("Synthetic data needs at least one ticker and one day");
        }
        if (!(volatility >= 0.0) || !std::isfinite(drift))
        {
            throw std::invalid_argument("Volatility must be non-negative and drift finite");
        }
        if (!(correlation >= 0.0 && correlation <= 1.0))
        {
            throw std::invalid_argument(
                "Correlation must be in [0, 1], got: " + std::to_string(correlation));
        }

        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(0.0, 1.0);

        const double common = std::sqrt(correlation);
        const double specific = std::sqrt(1.0 - correlation);

        Eigen::MatrixXd matrix(static_cast<Eigen::Index>(num_days), static_cast<Eigen::Index>(tickers.size()));
        for (Eigen::Index i = 0; i < matrix.rows(); ++i)
        {
            const double market = dist(gen);
            for (Eigen::Index j = 0; j < matrix.cols(); ++j)
            {
                matrix(i, j) = drift + volatility * (common * market + specific * dist(gen));
            }
        }

        std::vector<std::string> dates;
        dates.reserve(num_days);
        std::string date = start_date;
        if (is_weekend(parse_days(date)))
        {
            date = next_weekday(date);
        }
        for (size_t i = 0; i < num_days; ++i)
        {
            dates.push_back(date);
            date = next_weekday(date);
        }

        return ReturnMatrix(matrix, dates, tickers);
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    std::optional<double> DataLoader::parse_number(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty())
        {
            return std::nullopt;
        }

        char *end = nullptr;
        double value = std::strtod(trimmed.c_str(), &end);
        if (end != trimmed.c_str() + trimmed.size() || !std::isfinite(value))
        {
            return std::nullopt;
        }
        return value;
    }

    std::string DataLoader::next_weekday(const std::string &date)
    {
        long days = parse_days(date) + 1;
        while (is_weekend(days))
        {
            ++days;
        }
        return civil_from_days(days);
    }

} // namespace folio
