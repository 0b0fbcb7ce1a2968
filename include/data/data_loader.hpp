/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Provides functionality to load weekly price series from CSV files,
 * the advisor configuration from JSON files, and synthetic series for
 * testing and demos.
 */

#ifndef ADVISOR_DATA_DATA_LOADER_HPP
#define ADVISOR_DATA_DATA_LOADER_HPP

#include "price_series.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>


namespace advisor {

/**
 * @struct DataConfig
 * @brief Configuration parameters for data loading and statistics
 */
struct DataConfig {
    std::vector<std::string> universe;         ///< Candidate tickers, in order
    std::string data_dir;                      ///< Provider JSON cache directory
    std::string prices_csv;                    ///< Optional long-format CSV instead of the cache
    int min_observations;                      ///< Minimum valid weekly returns per instrument
    int min_aligned_dates;                     ///< Minimum aligned calendar dates
    int periods_per_year;                      ///< Annualization factor (weekly = 52)

    /**
     * @brief Load from JSON object
     */
    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct OptimizerConfig
 * @brief Configuration for the baseline optimizer
 */
struct OptimizerConfig {
    double risk_free_rate;                     ///< Annual risk-free rate for Sharpe
    double tolerance;                          ///< OSQP eps_abs / eps_rel
    int max_iterations;                        ///< OSQP iteration cap
    double feasibility_tolerance;              ///< Allowed constraint residual

    static OptimizerConfig from_json(const nlohmann::json& j);
};

/**
 * @struct MarginalConfig
 * @brief Configuration for the perturbation engine
 */
struct MarginalConfig {
    double epsilon;                            ///< Weight moved into each candidate
    double cvar_confidence;                    ///< CVaR confidence level
    std::string donor_policy;                  ///< "largest_holding" or "pro_rata"

    static MarginalConfig from_json(const nlohmann::json& j);
};

/**
 * @struct AdvisorConfig
 * @brief Complete advisor configuration
 */
struct AdvisorConfig {
    DataConfig data;
    OptimizerConfig optimizer;
    MarginalConfig marginal;
    std::string schema_file;                   ///< Optional feature schema file
    std::string model_file;                    ///< Scorer model file
    int top_k;                                 ///< Number of recommendations

    /**
     * @brief Defaults for every section
     */
    static AdvisorConfig defaults();

    /**
     * @brief Parse and validate a complete configuration object
     * @throws std::invalid_argument if a value is out of range
     */
    static AdvisorConfig from_json(const nlohmann::json& j);

    /**
     * @brief Range checks
     * @throws std::invalid_argument on the first invalid value
     */
    void validate() const;
};

/**
 * @class DataLoader
 * @brief Loads and parses weekly series and configuration
 *
 * Supports long-format CSV files:
 * date,ticker,close[,dividend]
 */
class DataLoader {
public:
    DataLoader() = default;

    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load weekly series from a long-format CSV file
     *
     * Expected format:
     * date,ticker,close,dividend
     * 2024-01-05,XOM,101.20,0.00
     * 2024-01-05,CVX,150.10,1.63
     *
     * Tickers (in the file and in the filter) are trimmed and upper-cased.
     * The dividend column is optional. Rows with invalid dates are skipped;
     * unparseable closes are kept as NaN.
     *
     * @param filepath Path to CSV file
     * @param tickers Optional list of tickers to load (loads all if empty)
     * @return Ticker to series map
     * @throws std::runtime_error if file cannot be loaded
     */
    static std::map<std::string, PriceSeries> load_weekly_csv(
        const std::string& filepath,
        const std::vector<std::string>& tickers = {});

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON file
     * @param filepath Path to JSON file
     * @return JSON object
     * @throws std::runtime_error if file cannot be loaded
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete advisor configuration
     * @param config_path Path to config JSON file
     * @return AdvisorConfig struct
     */
    static AdvisorConfig load_config(const std::string& config_path);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate a synthetic weekly series (geometric random walk)
     * @param ticker Ticker symbol
     * @param num_weeks Number of weekly bars
     * @param start_date First bar date
     * @param volatility Weekly volatility
     * @param drift Weekly drift
     * @param seed Random seed
     * @param dividend Dividend paid every 13 weeks
     * @return Weekly series
     */
    static PriceSeries generate_synthetic_series(
        const std::string& ticker,
        size_t num_weeks,
        const std::string& start_date = "2022-01-07",
        double volatility = 0.03,
        double drift = 0.002,
        unsigned int seed = 42,
        double dividend = 0.0
    );

    // ========================================================================
    // Export Methods
    // ========================================================================

    /**
     * @brief Save series to long-format CSV
     */
    static void save_weekly_csv(const std::map<std::string, PriceSeries>& series,
                                const std::string& filepath);

    /**
     * @brief Save one series as weekly_<TICKER>.json in a cache directory
     */
    static void save_weekly_cache(const PriceSeries& series, const std::string& cache_dir);

private:
    // ========================
    // Private Helper Methods
    // ========================

    static std::vector<std::string> parse_csv_line(const std::string& line);

    static std::string trim(const std::string& str);

    /**
     * @brief Convert string to double safely
     * @return Double value, or NaN if conversion fails
     */
    static double safe_stod(const std::string& str);

    static std::string add_days(const std::string& start_date, int days_offset);
};

} // namespace advisor

#endif // ADVISOR_DATA_DATA_LOADER_HPP
