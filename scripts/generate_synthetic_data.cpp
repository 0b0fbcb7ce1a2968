/**
 * @file generate_synthetic_data.cpp
 * @brief Generate a synthetic weekly data cache for the portfolio advisor
 */

#include "data/data_loader.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <map>

using namespace advisor;

struct SyntheticAsset {
    std::string ticker;
    double volatility;    // weekly
    double drift;         // weekly
    double dividend;      // paid every 13 weeks
    double beta;
    double market_cap;
    std::string sector;
};

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Weekly Data Generator ===\n" << std::endl;

    std::vector<SyntheticAsset> assets = {
        {"AMZN", 0.045, 0.0030, 0.00, 1.15, 1.9e12, "CONSUMER CYCLICAL"},
        {"GOOG", 0.040, 0.0028, 0.20, 1.05, 2.1e12, "COMMUNICATION SERVICES"},
        {"JPM",  0.032, 0.0020, 1.15, 1.10, 5.5e11, "FINANCIAL SERVICES"},
        {"MA",   0.030, 0.0022, 0.66, 1.08, 4.3e11, "FINANCIAL SERVICES"},
        {"XOM",  0.035, 0.0015, 0.99, 0.85, 4.6e11, "ENERGY"},
        {"CVX",  0.034, 0.0013, 1.63, 0.95, 2.9e11, "ENERGY"}
    };

    size_t num_weeks = 156;  // three years
    std::string start_date = "2022-01-07";
    std::string output_dir = "data-cache";
    std::string csv_file;
    unsigned int seed = 42;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--csv" && i + 1 < argc) {
            csv_file = argv[++i];
        } else if (arg == "--weeks" && i + 1 < argc) {
            num_weeks = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned int>(std::stoul(argv[++i]));
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --output DIR       Cache directory (default: data-cache)\n"
                      << "  --csv FILE         Also write a long-format CSV\n"
                      << "  --weeks N          Number of weekly bars (default: 156)\n"
                      << "  --seed N           Random seed (default: 42)\n"
                      << std::endl;
            return 0;
        }
    }

    std::cout << "Generating " << num_weeks << " weeks for " << assets.size()
              << " assets starting " << start_date << std::endl;

    try {
        std::map<std::string, PriceSeries> all_series;

        for (size_t i = 0; i < assets.size(); ++i) {
            const auto& asset = assets[i];
            PriceSeries series = DataLoader::generate_synthetic_series(
                asset.ticker, num_weeks, start_date,
                asset.volatility, asset.drift,
                seed + static_cast<unsigned int>(i), asset.dividend);

            DataLoader::save_weekly_cache(series, output_dir);

            // Overview fields are string-encoded like the provider's
            nlohmann::json overview = {
                {"Symbol", asset.ticker},
                {"Beta", std::to_string(asset.beta)},
                {"MarketCapitalization", std::to_string(static_cast<long long>(asset.market_cap))},
                {"Sector", asset.sector}
            };
            std::ofstream out((std::filesystem::path(output_dir) / ("overview_" + asset.ticker + ".json")).string());
            if (!out) {
                throw std::runtime_error("Could not write overview for " + asset.ticker);
            }
            out << overview.dump(2) << "\n";

            std::cout << "  " << std::setw(6) << std::left << asset.ticker
                      << " last close " << std::fixed << std::setprecision(2)
                      << series.last_close() << std::endl;

            all_series.emplace(asset.ticker, series);
        }

        if (!csv_file.empty()) {
            DataLoader::save_weekly_csv(all_series, csv_file);
            std::cout << "CSV written to: " << csv_file << std::endl;
        }

        std::cout << "\nCache written to: " << output_dir << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
