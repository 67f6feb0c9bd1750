/**
 * @file main.cpp
 * @brief Main entry point for the Portfolio Risk Engine
 *
 * Command-line application that loads configuration and daily return data,
 * runs one risk analysis pass (volatility, correlation, beta, VaR, drawdown,
 * stress) and writes the results.
 */

#include "analytics/risk_analysis_engine.hpp"
#include "data/data_loader.hpp"
#include "risk/var_model_factory.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using namespace riskengine;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Portfolio Risk Engine v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --returns PATH        Override return CSV path from config\n"
              << "  --output PATH         Path to output directory (default: results/)\n"
              << "  --confidence C        VaR confidence level: 0.90, 0.95 or 0.99\n"
              << "  --method NAME         VaR method: historical | variance_covariance\n"
              << "  --shock S             One-day benchmark shock, e.g. -0.07\n"
              << "  --days N              Trailing trading days to analyse (0 = all)\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/risk_config.json --verbose\n"
              << "  " << program_name << " --config data/config/risk_config.json --confidence 0.99 --method variance_covariance\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Portfolio Risk Engine v1.0.0                            \n"
              << "       Volatility, Beta, VaR, Drawdown and Stress              \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string output_dir = "results";
    std::optional<std::string> returns_path;
    std::optional<std::string> confidence;
    std::optional<std::string> method;
    std::optional<std::string> shock;
    std::optional<std::string> days;
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
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--returns" && i + 1 < argc)
            {
                args.returns_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--confidence" && i + 1 < argc)
            {
                args.confidence = argv[++i];
            }
            else if (arg == "--method" && i + 1 < argc)
            {
                args.method = argv[++i];
            }
            else if (arg == "--shock" && i + 1 < argc)
            {
                args.shock = argv[++i];
            }
            else if (arg == "--days" && i + 1 < argc)
            {
                args.days = argv[++i];
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
        return !show_help && !config_path.empty();
    }

    /**
     * @brief Command-line values win over configuration values
     */
    void apply_overrides(data::RiskAnalysisConfig &config) const
    {
        if (returns_path)
        {
            config.data.returns_file = *returns_path;
        }
        if (confidence)
        {
            config.risk_config.confidence = std::stod(*confidence);
        }
        if (method)
        {
            config.risk_config.var_method = *method;
        }
        if (shock)
        {
            config.risk_config.stress_shock = std::stod(*shock);
        }
        if (days)
        {
            config.data.window_days = std::stoi(*days);
        }
    }
};

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        auto config = data::DataLoader::load_config(args.config_path);
        args.apply_overrides(config);
        auto settings = config.to_settings();

        if (args.verbose)
        {
            std::cout << "  - Tickers: ";
            for (const auto &ticker : config.data.universe)
            {
                std::cout << ticker << " ";
            }
            std::cout << "\n  - Benchmark: " << config.data.benchmark << "\n";
            std::cout << "  - Window: " << config.data.window_days << " days\n";
            std::cout << "  - Confidence: " << config.risk_config.confidence << "\n";
            std::cout << "  - VaR method: " << risk::VaRModelFactory::to_string(settings.var_method) << "\n";
            std::cout << "  - Stress shock: " << config.risk_config.stress_shock << "\n";
        }

        // ====================================================================
        // 2. Load Return Data
        // ====================================================================
        std::cout << "[2/4] Loading return data..." << std::endl;

        auto dataset = data::DataLoader::load_dataset(config);

        std::cout << "  - Loaded " << dataset.dates.size() << " dates, "
                  << dataset.universe.size() << " assets + benchmark "
                  << dataset.benchmark.id() << std::endl;

        if (!dataset.universe.is_aligned())
        {
            std::cerr << "Warning: asset series have unequal length, truncating to "
                      << dataset.universe.min_length() << " observations" << std::endl;
        }

        double weight_sum = 0.0;
        for (double w : settings.raw_weights)
        {
            weight_sum += w;
        }
        if (weight_sum == 0.0)
        {
            std::cerr << "Warning: all portfolio weights are zero, normalization skipped" << std::endl;
        }

        // ====================================================================
        // 3. Risk Analysis
        // ====================================================================
        std::cout << "[3/4] Running risk analysis..." << std::endl;

        analytics::RiskAnalysisEngine engine;
        auto report = engine.run(dataset.universe, dataset.benchmark, settings);

        if (args.verbose)
        {
            std::cout << "  - Observations used: " << report.num_observations << "\n";
            std::cout << "  - Covariance matrix: " << report.covariance.rows()
                      << "x" << report.covariance.cols() << "\n";
        }

        std::cout << "\n"
                  << report.report() << std::endl;

        // ====================================================================
        // 4. Export
        // ====================================================================
        std::cout << "[4/4] Writing results..." << std::endl;

        std::filesystem::create_directories(args.output_dir);

        std::string json_file = args.output_dir + "/risk_report.json";
        std::string nav_file = args.output_dir + "/nav_path.csv";

        data::DataLoader::save_text(report.to_json(), json_file);
        report.to_csv(nav_file);

        std::cout << "  - Report: " << json_file << "\n";
        std::cout << "  - NAV path: " << nav_file << "\n";

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Risk analysis completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    auto args = CommandLineArgs::parse(argc, argv);

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
