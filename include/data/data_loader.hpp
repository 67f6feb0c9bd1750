/**
 * @file data_loader.hpp
 * @brief Return data loading and configuration parsing
 *
 * Provides functionality to load daily return series from CSV files and
 * risk-analysis configuration from JSON files.
 */

#ifndef RISKENGINE_DATA_DATA_LOADER_HPP
#define RISKENGINE_DATA_DATA_LOADER_HPP

#include "analytics/risk_analysis_engine.hpp"
#include "data/return_series.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace riskengine
{
    namespace data
    {

        /**
         * @struct DataConfig
         * @brief Where the return data comes from and which series to use
         */
        struct DataConfig
        {
            std::string returns_file;          ///< Path to wide CSV of daily returns
            std::vector<std::string> universe; ///< Asset tickers, in weight order
            std::string benchmark;             ///< Benchmark ticker
            int window_days;                   ///< Trailing observations (<= 0: all)

            /**
             * @brief Load from JSON object
             */
            static DataConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct PortfolioConfig
         * @brief Raw portfolio weights keyed by ticker
         */
        struct PortfolioConfig
        {
            std::map<std::string, double> weights; ///< Ticker -> raw weight

            static PortfolioConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct RiskConfig
         * @brief VaR and stress parameters
         */
        struct RiskConfig
        {
            double confidence;         ///< VaR confidence level
            std::string var_method;    ///< "historical" or "variance_covariance"
            double stress_shock;       ///< One-day benchmark shock
            int trading_days_per_year; ///< Annualization factor

            static RiskConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct RiskAnalysisConfig
         * @brief Complete configuration of a risk analysis run
         */
        struct RiskAnalysisConfig
        {
            DataConfig data;
            PortfolioConfig portfolio;
            RiskConfig risk_config;
            std::map<std::string, AssetMetadata> assets; ///< Optional display metadata

            /**
             * @brief Build engine settings with weights aligned to data.universe
             * @throws std::invalid_argument if a weight names a ticker outside the universe
             *         or the VaR method is unknown
             */
            analytics::RiskSettings to_settings() const;
        };

        /**
         * @struct ReturnDataset
         * @brief Asset universe and benchmark loaded together
         */
        struct ReturnDataset
        {
            std::vector<std::string> dates;
            AssetUniverse universe;
            ReturnSeries benchmark;
        };

        /**
         * @class DataLoader
         * @brief Loads return series and configuration
         *
         * Supports CSV files in wide format:
         * date,MSFT,AAPL,GLD,AGG,SPY
         * 2023-01-03,0.0123,-0.0045,0.0011,0.0002,0.0067
         */
        class DataLoader
        {
        public:
            DataLoader() = default;
            ~DataLoader() = default;

            // ====================================================================
            // CSV Loading Methods
            // ====================================================================

            /**
             * @brief Load daily return series from a wide CSV file
             *
             * @param filepath Path to CSV file
             * @param tickers Columns to load, in output order (loads all if empty)
             * @param dates Optional output for the date column
             * @return One ReturnSeries per requested ticker
             * @throws std::runtime_error if the file cannot be read, the header is
             *         malformed, or a requested ticker is missing
             */
            static std::vector<ReturnSeries> load_returns_csv(const std::string &filepath,
                                                              const std::vector<std::string> &tickers = {},
                                                              std::vector<std::string> *dates = nullptr);

            /**
             * @brief Load the universe and benchmark described by a configuration
             * @throws std::runtime_error on I/O or format errors
             * @throws std::invalid_argument if the universe is empty or duplicated
             */
            static ReturnDataset load_dataset(const RiskAnalysisConfig &config);

            // ====================================================================
            // Configuration Loading
            // ====================================================================

            /**
             * @brief Load JSON configuration file
             * @param filepath Path to JSON config file
             * @return JSON object
             * @throws std::runtime_error if file cannot be loaded
             */
            static nlohmann::json load_json(const std::string &filepath);

            /**
             * @brief Load complete risk analysis configuration
             * @param config_path Path to config JSON file
             */
            static RiskAnalysisConfig load_config(const std::string &config_path);

            /**
             * @brief Parse configuration from an already loaded JSON document
             */
            static RiskAnalysisConfig parse_config(const nlohmann::json &j);

            // ====================================================================
            // Export Methods
            // ====================================================================

            /**
             * @brief Write text content (report, JSON) to file
             * @throws std::runtime_error if the file cannot be opened
             */
            static void save_text(const std::string &content, const std::string &filepath);

        private:
            /**
             * @brief Parse CSV line into tokens
             */
            static std::vector<std::string> parse_csv_line(const std::string &line);

            /**
             * @brief Validate date format (YYYY-MM-DD)
             */
            static bool is_valid_date_format(const std::string &date);

            /**
             * @brief Trim whitespace from string
             */
            static std::string trim(const std::string &str);

            /**
             * @brief Convert string to double safely
             * @return Double value, or NaN if conversion fails
             */
            static double safe_stod(const std::string &str);
        };

    } // namespace data
} // namespace riskengine

#endif // RISKENGINE_DATA_DATA_LOADER_HPP
