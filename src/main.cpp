/**
 * @file main.cpp
 * @brief Main entry point for the Portfolio Advisor
 *
 * Command-line application that loads configuration and a request, runs the
 * recommendation pipeline, and prints or writes the ranked suggestions.
 *
 * stdout carries only the response JSON (or the error JSON on failure);
 * the banner, progress stages and summaries go to stderr.
 */

#include "core/advisor_error.hpp"
#include "data/data_loader.hpp"
#include "data/data_provider.hpp"
#include "features/feature_schema.hpp"
#include "scoring/linear_scorer.hpp"
#include "service/recommendation_engine.hpp"
#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace advisor;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cerr << "Portfolio Advisor v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --request PATH        Path to request JSON file (required)\n"
              << "  --output PATH         Write the response JSON to this file\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name
              << " --config data/config/advisor_config.json --request data/requests/example_request.json\n"
              << std::endl;
}

void print_banner()
{
    std::cerr << "\n"
              << "================================================================\n"
              << "       Portfolio Advisor v1.0.0                                \n"
              << "       Mean-Variance Baseline + Marginal Utility Ranking       \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string request_path;
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
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--request" && i + 1 < argc)
            {
                args.request_path = argv[++i];
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
        return !show_help && !config_path.empty() && !request_path.empty();
    }
};

/**
 * @brief Pick the series source named by the configuration
 */
std::shared_ptr<data::DataProvider> make_provider(const AdvisorConfig &config, bool verbose)
{
    if (!config.data.prices_csv.empty())
    {
        auto series = DataLoader::load_weekly_csv(config.data.prices_csv, config.data.universe);
        if (verbose)
        {
            std::cerr << "  - CSV: " << config.data.prices_csv << " (" << series.size() << " series)\n";
        }
        return std::make_shared<data::InMemoryDataProvider>(series);
    }

    if (verbose)
    {
        std::cerr << "  - Cache directory: " << config.data.data_dir << "\n";
    }
    return std::make_shared<data::FileDataProvider>(config.data.data_dir,
                                                    std::make_shared<data::SeriesCache>());
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration and Request
        // ====================================================================
        std::cerr << "[1/5] Loading configuration..." << std::endl;

        auto config = DataLoader::load_config(args.config_path);
        auto request = service::RecommendationRequest::from_json(DataLoader::load_json(args.request_path));

        if (args.verbose)
        {
            std::cerr << "  - Universe: ";
            for (const auto &ticker : config.data.universe)
            {
                std::cerr << ticker << " ";
            }
            std::cerr << "\n  - Target return: " << request.target_return
                      << "\n  - Budget: " << request.budget
                      << "\n  - Holdings: " << request.holdings.size()
                      << "\n  - Donor policy: " << config.marginal.donor_policy << "\n";
        }

        // ====================================================================
        // 2. Data Provider
        // ====================================================================
        std::cerr << "[2/5] Preparing market data..." << std::endl;

        auto provider = make_provider(config, args.verbose);

        // ====================================================================
        // 3. Scorer and Feature Schema
        // ====================================================================
        std::cerr << "[3/5] Loading scoring model..." << std::endl;

        auto scorer = std::make_shared<scoring::LinearScorer>(scoring::LinearScorer::load(config.model_file));
        auto schema = config.schema_file.empty()
                          ? features::FeatureSchema::default_schema()
                          : features::FeatureSchema::load(config.schema_file);

        if (args.verbose)
        {
            std::cerr << "  - Model: " << config.model_file << " (" << scorer->get_name()
                      << ", schema v" << scorer->schema_version() << ")\n";
        }

        service::RecommendationEngine engine(config, provider, scorer, schema, args.verbose);

        // ====================================================================
        // 4. Recommendation Pipeline
        // ====================================================================
        std::cerr << "[4/5] Computing recommendations..." << std::endl;

        auto response = engine.recommend(request);

        if (args.verbose)
        {
            std::cerr << "\nBASELINE PORTFOLIO\n";
            response.baseline.print_summary(response.universe, std::cerr);
        }
        std::cerr << "\n";
        response.print_summary(std::cerr);

        // ====================================================================
        // 5. Output
        // ====================================================================
        std::cerr << "[5/5] Writing response..." << std::endl;

        const std::string body = response.to_json().dump(2);
        if (args.output_path.empty())
        {
            std::cout << body << std::endl;
        }
        else
        {
            std::ofstream out(args.output_path);
            if (!out)
            {
                throw std::runtime_error("Could not open file for writing: " + args.output_path);
            }
            out << body << "\n";
            std::cerr << "  - Response written to: " << args.output_path << "\n";
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cerr << "\n================================================================\n";
        std::cerr << "Recommendations completed in " << duration << " ms\n";
        std::cerr << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const AdvisorError &e)
    {
        std::cout << e.to_json().dump(2) << std::endl;
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
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
