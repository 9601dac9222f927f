/**
 * @file main.cpp
 * @brief Command-line front end of the folio analytics engine
 *
 * Loads a returns CSV (and optionally a JSON configuration), runs the
 * analytics engine and writes the report as JSON.
 */

#include "folio/data/data_loader.hpp"
#include "folio/data/weight_vector.hpp"
#include "folio/report/analytics_report.hpp"
#include "folio/report/report_assembler.hpp"

#include <chrono>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace folio;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "folio portfolio analytics\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --returns PATH        Returns CSV (date column, one column per asset)\n"
              << "  --config PATH         Configuration JSON (data, analytics, optimizer)\n"
              << "  --weights W1,W2,...   Portfolio weights in column order\n"
              << "  --risk-free RATE      Annualized risk-free rate (default 0.04)\n"
              << "  --output PATH         Write the JSON report to PATH (default: stdout)\n"
              << "  --verbose             Print progress and a summary\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --returns data/returns.csv --weights 0.5,0.3,0.2 --output report.json\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string returns_path;
    std::string config_path;
    std::string weights;
    std::string risk_free;
    std::string output_path;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--returns" && i + 1 < argc)
            {
                args.returns_path = argv[++i];
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--weights" && i + 1 < argc)
            {
                args.weights = argv[++i];
            }
            else if (arg == "--risk-free" && i + 1 < argc)
            {
                args.risk_free = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && (!returns_path.empty() || !config_path.empty());
    }
};

/**
 * @brief Parse a number given on the command line
 */
double parse_number_argument(const std::string &name, const std::string &text)
{
    try
    {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size())
        {
            throw std::invalid_argument(text);
        }
        return value;
    }
    catch (const std::logic_error &)
    {
        throw std::runtime_error("Invalid value for " + name + ": '" + text + "'");
    }
}

/**
 * @brief Parse "w1,w2,..." into a weight vector
 */
Eigen::VectorXd parse_weights(const std::string &text)
{
    std::vector<double> values;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ','))
    {
        values.push_back(parse_number_argument("--weights", item));
    }
    return Eigen::Map<Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

void print_metric(std::ostream &out, const std::string &label, const report::Metric &value,
                  double scale = 1.0, const char *suffix = "")
{
    out << "  " << std::left << std::setw(22) << label << std::right;
    if (value)
    {
        out << std::fixed << std::setprecision(4) << *value * scale << suffix << "\n";
    }
    else
    {
        out << "n/a\n";
    }
}

/**
 * @brief Print a short summary of the report
 */
void print_summary(std::ostream &out, const report::AnalyticsReport &report)
{
    out << "\n" << std::string(60, '-') << "\n";
    out << "Portfolio (annualized):\n";
    print_metric(out, "Return", report.portfolio_return_annual, 100.0, "%");
    print_metric(out, "Volatility", report.portfolio_vol_annual, 100.0, "%");
    print_metric(out, "Sharpe", report.portfolio_sharpe_annual);
    print_metric(out, "Sortino", report.sortino_ratio_annual);
    print_metric(out, "Max drawdown", report.max_drawdown, 100.0, "%");
    print_metric(out, "Beta", report.beta);
    print_metric(out, "Diversification ratio", report.diversification_ratio);

    const std::pair<const char *, const report::PortfolioSummary *> optimal[] = {
        {"Minimum variance", &report.min_variance},
        {"Maximum Sharpe", &report.max_sharpe}};
    for (const auto &entry : optimal)
    {
        out << "\n" << entry.first << (entry.second->converged ? "" : " (not converged)") << ":\n";
        print_metric(out, "Return", entry.second->annual_return, 100.0, "%");
        print_metric(out, "Volatility", entry.second->annual_volatility, 100.0, "%");
        print_metric(out, "Sharpe", entry.second->annual_sharpe);
        for (const auto &weight : entry.second->weights)
        {
            print_metric(out, "  " + weight.first, weight.second, 100.0, "%");
        }
    }

    out << "\nEfficient frontier points: " << report.efficient_frontier.size() << "\n";
    out << std::string(60, '-') << "\n";
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::steady_clock::now();

    // Progress stays off stdout when the report itself goes there
    std::ostream &log = args.output_path.empty() ? std::cerr : std::cout;

    try
    {
        RunConfig config;
        if (!args.config_path.empty())
        {
            config = DataLoader::load_config(args.config_path);
            if (args.verbose)
            {
                log << "Loaded configuration from " << args.config_path << std::endl;
            }
        }

        if (!args.risk_free.empty())
        {
            config.analytics.risk_free_rate = parse_number_argument("--risk-free", args.risk_free);
        }
        config.analytics.verbose = args.verbose && !args.output_path.empty();

        std::string returns_path = args.returns_path.empty() ? config.data.returns_file : args.returns_path;
        if (returns_path.empty())
        {
            throw std::runtime_error("No returns file given (use --returns or data.returns_file)");
        }

        ReturnsDataset dataset = DataLoader::load_returns_csv(returns_path);
        if (args.verbose)
        {
            log << "Loaded " << dataset.returns.num_dates() << " dates, "
                << dataset.returns.num_assets() << " assets from " << returns_path;
            if (dataset.dropped_rows > 0)
            {
                log << " (" << dataset.dropped_rows << " incomplete rows dropped)";
            }
            log << std::endl;
        }

        // Precedence: command line, CSV Weights row, configuration file
        std::optional<Eigen::VectorXd> weights;
        if (!args.weights.empty())
        {
            weights = parse_weights(args.weights);
        }
        else if (dataset.weights)
        {
            weights = dataset.weights;
        }
        else if (config.data.weights)
        {
            const auto &w = *config.data.weights;
            weights = Eigen::Map<const Eigen::VectorXd>(w.data(), static_cast<Eigen::Index>(w.size()));
        }

        report::AnalyticsEngine engine(config.analytics);
        report::AnalyticsReport result = engine.analyze(dataset.returns, weights);

        const std::string json = report::to_json(result).dump(2);
        if (args.output_path.empty())
        {
            std::cout << json << std::endl;
        }
        else
        {
            std::ofstream file(args.output_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + args.output_path);
            }
            file << json << "\n";
            if (!file)
            {
                throw std::runtime_error("Failed writing file: " + args.output_path);
            }
        }

        if (args.verbose)
        {
            print_summary(log, result);

            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start_time)
                                .count();
            log << "Analysis completed in " << duration << " ms";
            if (!args.output_path.empty())
            {
                log << ", report written to " << args.output_path;
            }
            log << std::endl;
        }

        return 0;
    }
    catch (const ValidationError &e)
    {
        std::cerr << "Error: invalid input: " << e.what() << std::endl;
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    return run(args);
}
