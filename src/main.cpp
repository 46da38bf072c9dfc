/**
 * @file main.cpp
 * @brief Main entry point for the DCF Valuation Engine
 *
 * Command-line application that loads a financial input bundle, runs the
 * multi-scenario DCF analysis with its sensitivity grid, and writes the
 * report files.
 */

#include "data/bundle_loader.hpp"
#include "engine/dcf_engine.hpp"
#include <chrono>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

using namespace valuation;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "DCF Valuation Engine v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --input PATH          Path to financial input bundle JSON (required)\n"
              << "  --config PATH         Path to engine configuration JSON\n"
              << "  --custom PATH         Path to custom scenario JSON\n"
              << "  --output PATH         Path to output directory (default: results/)\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --input data/samples/sample_bundle.json --verbose\n"
              << "  " << program_name << " --input data/samples/sample_bundle.json"
              << " --config data/config/engine_config.json --custom data/samples/custom_scenario.json\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       DCF Valuation Engine v1.0.0                              \n"
              << "       Multi-Scenario Discounted Cash Flow Analysis             \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string input_path;
    std::string config_path;
    std::string custom_path;
    std::string output_dir = "results";
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
            else if (arg == "--input" && i + 1 < argc)
            {
                args.input_path = argv[++i];
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--custom" && i + 1 < argc)
            {
                args.custom_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
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
        return !show_help && !input_path.empty();
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

        engine::EngineConfig config;
        if (!args.config_path.empty())
        {
            config = BundleLoader::load_config(args.config_path);
        }
        config.verbose = config.verbose || args.verbose;

        if (args.verbose)
        {
            std::cout << "  - Debt spread: " << config.debt_spread << "\n";
            std::cout << "  - Growth blend weight: " << config.historical_growth_weight
                      << ", decay: " << config.growth_decay_factor << "\n";
            std::cout << "  - Sensitivity grid: " << config.sensitivity.num_points << "x"
                      << config.sensitivity.num_points << "\n";
            std::cout << "  - Parallel scenarios: " << (config.parallel_scenarios ? "Yes" : "No") << "\n";
        }

        // ====================================================================
        // 2. Load Inputs
        // ====================================================================
        std::cout << "[2/4] Loading financial inputs..." << std::endl;

        auto bundle = BundleLoader::load_bundle(args.input_path);

        std::cout << "  - " << bundle.identifier << ": " << bundle.num_years()
                  << " years of history, price " << std::fixed << std::setprecision(2)
                  << bundle.current_price << std::endl;

        std::optional<scenario::ScenarioAssumptions> custom;
        if (!args.custom_path.empty())
        {
            custom = BundleLoader::load_scenario(args.custom_path);
            std::cout << "  - Custom scenario: " << custom->scenario_name << std::endl;
        }

        // ====================================================================
        // 3. Valuation
        // ====================================================================
        std::cout << "[3/4] Running DCF analysis..." << std::endl;

        engine::DCFCalculationEngine dcf_engine(config);
        const auto now = std::chrono::system_clock::now();

        auto report = custom ? dcf_engine.calculate_comprehensive_dcf(bundle, *custom, now)
                             : dcf_engine.calculate_comprehensive_dcf(bundle, now);

        report.print_summary();

        if (args.verbose)
        {
            for (const auto &entry : report.scenarios)
            {
                entry.second.print_summary();
            }
        }

        report.sensitivity_grid.print_summary();

        if (!report.recommendations.empty())
        {
            std::cout << "\nRecommendations:\n";
            for (const auto &recommendation : report.recommendations)
            {
                std::cout << "  - " << recommendation << "\n";
            }
        }

        // ====================================================================
        // 4. Export
        // ====================================================================
        std::cout << "\n[4/4] Writing results..." << std::endl;

        std::filesystem::create_directories(args.output_dir);

        const std::string report_file = args.output_dir + "/dcf_report.json";
        const std::string grid_file = args.output_dir + "/sensitivity_grid.csv";
        const std::string scenarios_file = args.output_dir + "/scenarios.csv";

        BundleLoader::save_json(report.to_json(), report_file);
        report.sensitivity_grid.export_to_csv(grid_file);
        report.export_scenarios_csv(scenarios_file);

        std::cout << "  - Report: " << report_file << "\n"
                  << "  - Sensitivity grid: " << grid_file << "\n"
                  << "  - Scenarios: " << scenarios_file << std::endl;

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Valuation completed successfully in "
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
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
