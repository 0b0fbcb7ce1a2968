/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>

namespace advisor
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.universe = j.value("universe", std::vector<std::string>{});
        config.data_dir = j.value("data_dir", "data-cache");
        config.prices_csv = j.value("prices_csv", "");
        config.min_observations = j.value("min_observations", 30);
        config.min_aligned_dates = j.value("min_aligned_dates", 3);
        config.periods_per_year = j.value("periods_per_year", 52);
        return config;
    }

    OptimizerConfig OptimizerConfig::from_json(const nlohmann::json &j)
    {
        OptimizerConfig config;
        config.risk_free_rate = j.value("risk_free_rate", 0.043);
        config.tolerance = j.value("tolerance", 1e-7);
        config.max_iterations = j.value("max_iterations", 20000);
        config.feasibility_tolerance = j.value("feasibility_tolerance", 1e-5);
        return config;
    }

    MarginalConfig MarginalConfig::from_json(const nlohmann::json &j)
    {
        MarginalConfig config;
        config.epsilon = j.value("epsilon", 0.01);
        config.cvar_confidence = j.value("cvar_confidence", 0.95);
        config.donor_policy = j.value("donor_policy", "largest_holding");
        return config;
    }

    AdvisorConfig AdvisorConfig::defaults()
    {
        return from_json(nlohmann::json::object());
    }

    AdvisorConfig AdvisorConfig::from_json(const nlohmann::json &j)
    {
        const nlohmann::json empty = nlohmann::json::object();

        AdvisorConfig config;
        config.data = DataConfig::from_json(j.contains("data") ? j["data"] : empty);
        config.optimizer = OptimizerConfig::from_json(j.contains("optimizer") ? j["optimizer"] : empty);
        config.marginal = MarginalConfig::from_json(j.contains("marginal") ? j["marginal"] : empty);

        config.schema_file = "";
        if (j.contains("features"))
        {
            config.schema_file = j["features"].value("schema_file", "");
        }

        config.model_file = "model/recommend_model.json";
        if (j.contains("scorer"))
        {
            config.model_file = j["scorer"].value("model_file", config.model_file);
        }

        config.top_k = 5;
        if (j.contains("ranker"))
        {
            config.top_k = j["ranker"].value("top_k", 5);
        }

        config.validate();
        return config;
    }

    void AdvisorConfig::validate() const
    {
        if (data.min_observations < 2)
        {
            throw std::invalid_argument(
                "min_observations must be at least 2, got: " + std::to_string(data.min_observations));
        }

        if (data.min_aligned_dates < 3)
        {
            throw std::invalid_argument(
                "min_aligned_dates must be at least 3, got: " + std::to_string(data.min_aligned_dates));
        }

        if (data.periods_per_year <= 0)
        {
            throw std::invalid_argument(
                "periods_per_year must be positive, got: " + std::to_string(data.periods_per_year));
        }

        if (!std::isfinite(optimizer.risk_free_rate))
        {
            throw std::invalid_argument("risk_free_rate must be finite");
        }

        if (optimizer.tolerance <= 0.0 || optimizer.feasibility_tolerance <= 0.0)
        {
            throw std::invalid_argument("Optimizer tolerances must be positive");
        }

        if (optimizer.max_iterations <= 0)
        {
            throw std::invalid_argument(
                "max_iterations must be positive, got: " + std::to_string(optimizer.max_iterations));
        }

        if (marginal.epsilon <= 0.0 || marginal.epsilon >= 1.0)
        {
            throw std::invalid_argument(
                "epsilon must be in (0, 1), got: " + std::to_string(marginal.epsilon));
        }

        if (marginal.cvar_confidence <= 0.0 || marginal.cvar_confidence >= 1.0)
        {
            throw std::invalid_argument(
                "cvar_confidence must be in (0, 1), got: " + std::to_string(marginal.cvar_confidence));
        }

        if (marginal.donor_policy != "largest_holding" && marginal.donor_policy != "pro_rata")
        {
            throw std::invalid_argument("Unknown donor_policy: " + marginal.donor_policy);
        }

        if (top_k < 1)
        {
            throw std::invalid_argument("top_k must be at least 1, got: " + std::to_string(top_k));
        }
    }

    // ===========================
    // CSV Loading - Long Format
    // ===========================

    std::map<std::string, PriceSeries> DataLoader::load_weekly_csv(
        const std::string &filepath,
        const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file");
        }

        auto header = parse_csv_line(line);
        if (header.size() < 3 || trim(header[0]) != "date")
        {
            throw std::runtime_error("CSV must start with 'date,ticker,close' columns");
        }
        const bool has_dividends = header.size() >= 4;

        std::set<std::string> wanted;
        for (const auto &t : tickers)
        {
            std::string normalized = normalize_ticker(t);
            if (!normalized.empty())
                wanted.insert(normalized);
        }

        std::map<std::string, PriceSeries> result;

        while (std::getline(file, line))
        {
            if (line.empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() < 3)
                continue;

            std::string date = trim(fields[0]);
            std::string ticker = normalize_ticker(fields[1]);

            if (!PriceSeries::is_valid_date(date) || ticker.empty())
                continue;

            // Filter by tickers if specified
            if (!wanted.empty() && wanted.count(ticker) == 0)
            {
                continue;
            }

            double close = safe_stod(fields[2]);
            double dividend = 0.0;
            if (has_dividends && fields.size() >= 4)
            {
                dividend = safe_stod(fields[3]);
            }

            auto it = result.find(ticker);
            if (it == result.end())
            {
                it = result.emplace(ticker, PriceSeries(ticker)).first;
            }
            it->second.add_bar(date, close, dividend);
        }

        if (result.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        return result;
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

    AdvisorConfig DataLoader::load_config(const std::string &config_path)
    {
        return AdvisorConfig::from_json(load_json(config_path));
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    PriceSeries DataLoader::generate_synthetic_series(
        const std::string &ticker,
        size_t num_weeks,
        const std::string &start_date,
        double volatility,
        double drift,
        unsigned int seed,
        double dividend)
    {
        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(drift, volatility);

        PriceSeries series(ticker);
        double price = 100.0;

        for (size_t i = 0; i < num_weeks; ++i)
        {
            if (i > 0)
            {
                price *= (1.0 + dist(gen));
            }
            double paid = (dividend > 0.0 && i % 13 == 12) ? dividend : 0.0;
            series.add_bar(add_days(start_date, static_cast<int>(i) * 7), price, paid);
        }

        return series;
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_weekly_csv(const std::map<std::string, PriceSeries> &series,
                                     const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date,ticker,close,dividend\n";

        for (const auto &entry : series)
        {
            for (const auto &bar : entry.second.bars())
            {
                file << bar.first << "," << entry.first << ","
                     << std::fixed << std::setprecision(6) << bar.second.close << ","
                     << bar.second.dividend << "\n";
            }
        }
    }

    void DataLoader::save_weekly_cache(const PriceSeries &series, const std::string &cache_dir)
    {
        std::filesystem::create_directories(cache_dir);
        const std::string path =
            (std::filesystem::path(cache_dir) / ("weekly_" + series.ticker() + ".json")).string();

        std::ofstream file(path);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + path);
        }

        // Provider encodes numbers as strings
        nlohmann::json j = nlohmann::json::object();
        for (const auto &bar : series.bars())
        {
            std::ostringstream close;
            std::ostringstream dividend;
            close << std::fixed << std::setprecision(4) << bar.second.close;
            dividend << std::fixed << std::setprecision(4) << bar.second.dividend;
            j[bar.first] = {{"4. close", close.str()}, {"7. dividend amount", dividend.str()}};
        }

        file << j.dump(2) << "\n";
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

    double DataLoader::safe_stod(const std::string &str)
    {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return nan;
        }

        try
        {
            return std::stod(trimmed);
        }
        catch (const std::invalid_argument &)
        {
            return nan;
        }
        catch (const std::out_of_range &)
        {
            return nan;
        }
    }

    std::string DataLoader::add_days(const std::string &start_date, int days_offset)
    {
        struct tm tm = {};
        std::istringstream ss(start_date);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail())
        {
            throw std::invalid_argument("Invalid start date: " + start_date);
        }

        // Anchor at noon so DST transitions never move the calendar day
        tm.tm_hour = 12;
        tm.tm_isdst = -1;
        tm.tm_mday += days_offset;
        std::mktime(&tm);

        char buffer[11];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);

        return std::string(buffer);
    }

} // namespace advisor
