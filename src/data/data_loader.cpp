/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "risk/var_model_factory.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace riskengine
{
    namespace data
    {

        // =============================================
        // Configuration Structures - from_json Methods
        // =============================================

        DataConfig DataConfig::from_json(const nlohmann::json &j)
        {
            DataConfig config;
            config.returns_file = j.value("returns_file", "data/market/sample_returns.csv");
            config.universe = j.value("universe", std::vector<std::string>{});
            config.benchmark = j.value("benchmark", "SPY");
            config.window_days = j.value("window_days", 252);
            return config;
        }

        PortfolioConfig PortfolioConfig::from_json(const nlohmann::json &j)
        {
            PortfolioConfig config;
            config.weights = j.value("weights", std::map<std::string, double>{});
            return config;
        }

        RiskConfig RiskConfig::from_json(const nlohmann::json &j)
        {
            RiskConfig config;
            config.confidence = j.value("confidence", 0.95);
            config.var_method = j.value("var_method", "historical");
            config.stress_shock = j.value("stress_shock", -0.07);
            config.trading_days_per_year = j.value("trading_days_per_year", risk::TRADING_DAYS_PER_YEAR);
            return config;
        }

        analytics::RiskSettings RiskAnalysisConfig::to_settings() const
        {
            for (const auto &entry : portfolio.weights)
            {
                if (std::find(data.universe.begin(), data.universe.end(), entry.first) == data.universe.end())
                {
                    throw std::invalid_argument("Weight given for ticker not in universe: " + entry.first);
                }
            }

            analytics::RiskSettings settings;
            settings.raw_weights.reserve(data.universe.size());
            for (const auto &ticker : data.universe)
            {
                // Tickers without a weight hold nothing
                auto it = portfolio.weights.find(ticker);
                settings.raw_weights.push_back(it != portfolio.weights.end() ? it->second : 0.0);
            }

            settings.confidence = risk_config.confidence;
            settings.var_method = risk::VaRModelFactory::parse_method(risk_config.var_method);
            settings.stress_shock = risk_config.stress_shock;
            settings.window_days = data.window_days;
            settings.trading_days_per_year = risk_config.trading_days_per_year;
            return settings;
        }

        // ===========================
        // CSV Loading - Wide Format
        // ===========================

        std::vector<ReturnSeries> DataLoader::load_returns_csv(const std::string &filepath,
                                                               const std::vector<std::string> &tickers,
                                                               std::vector<std::string> *dates)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;

            // Read header line
            if (!std::getline(file, line))
            {
                throw std::runtime_error("Empty CSV file: " + filepath);
            }

            auto header = parse_csv_line(line);
            if (header.empty() || trim(header[0]) != "date")
            {
                throw std::runtime_error("CSV must start with 'date' column");
            }

            std::vector<std::string> all_tickers;
            for (size_t i = 1; i < header.size(); ++i)
            {
                all_tickers.push_back(trim(header[i]));
            }

            // Determine which columns to load, in requested order
            std::vector<std::string> selected_tickers = tickers.empty() ? all_tickers : tickers;
            std::vector<size_t> column_indices;
            column_indices.reserve(selected_tickers.size());

            for (const auto &ticker : selected_tickers)
            {
                auto it = std::find(all_tickers.begin(), all_tickers.end(), ticker);
                if (it == all_tickers.end())
                {
                    throw std::runtime_error("Ticker '" + ticker + "' not found in CSV: " + filepath);
                }
                column_indices.push_back(static_cast<size_t>(std::distance(all_tickers.begin(), it)));
            }

            std::vector<std::vector<double>> columns(selected_tickers.size());
            std::vector<std::string> row_dates;

            // Read data rows
            while (std::getline(file, line))
            {
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                std::string date = trim(fields[0]);
                if (!is_valid_date_format(date))
                {
                    continue; // Skip invalid dates
                }

                row_dates.push_back(date);

                for (size_t k = 0; k < column_indices.size(); ++k)
                {
                    size_t idx = column_indices[k];
                    if (idx + 1 < fields.size())
                    {
                        columns[k].push_back(safe_stod(fields[idx + 1]));
                    }
                    else
                    {
                        columns[k].push_back(std::numeric_limits<double>::quiet_NaN());
                    }
                }
            }

            if (row_dates.empty())
            {
                throw std::runtime_error("No valid data found in CSV file: " + filepath);
            }

            if (dates != nullptr)
            {
                *dates = row_dates;
            }

            std::vector<ReturnSeries> result;
            result.reserve(selected_tickers.size());
            for (size_t k = 0; k < selected_tickers.size(); ++k)
            {
                result.emplace_back(selected_tickers[k], std::move(columns[k]));
            }
            return result;
        }

        ReturnDataset DataLoader::load_dataset(const RiskAnalysisConfig &config)
        {
            std::vector<std::string> tickers = config.data.universe;
            if (tickers.empty())
            {
                throw std::invalid_argument("Configuration must list at least one ticker in data.universe");
            }
            tickers.push_back(config.data.benchmark);

            std::vector<std::string> dates;
            auto series = load_returns_csv(config.data.returns_file, tickers, &dates);

            ReturnSeries benchmark = series.back();
            series.pop_back();

            // Metadata may also describe the benchmark; keep universe entries only
            std::map<std::string, AssetMetadata> metadata;
            for (const auto &entry : config.assets)
            {
                if (std::find(config.data.universe.begin(), config.data.universe.end(), entry.first) != config.data.universe.end())
                {
                    metadata.insert(entry);
                }
            }

            return ReturnDataset{dates, AssetUniverse(std::move(series), std::move(metadata)), benchmark};
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

        RiskAnalysisConfig DataLoader::load_config(const std::string &config_path)
        {
            return parse_config(load_json(config_path));
        }

        RiskAnalysisConfig DataLoader::parse_config(const nlohmann::json &j)
        {
            RiskAnalysisConfig config;

            config.data = DataConfig::from_json(j.value("data", nlohmann::json::object()));
            config.portfolio = PortfolioConfig::from_json(j.value("portfolio", nlohmann::json::object()));
            config.risk_config = RiskConfig::from_json(j.value("risk", nlohmann::json::object()));

            if (j.contains("assets"))
            {
                for (const auto &item : j["assets"].items())
                {
                    AssetMetadata meta;
                    meta.label = item.value().value("label", item.key());
                    meta.color = item.value().value("color", "");
                    config.assets[item.key()] = meta;
                }
            }

            return config;
        }

        // ==================
        // Export Methods
        // ==================

        void DataLoader::save_text(const std::string &content, const std::string &filepath)
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }
            file << content;
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

        bool DataLoader::is_valid_date_format(const std::string &date)
        {
            // Simple check for YYYY-MM-DD format
            if (date.length() != 10)
                return false;
            if (date[4] != '-' || date[7] != '-')
                return false;

            for (size_t i = 0; i < date.length(); ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(date[i])))
                    return false;
            }

            return true;
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
            std::string trimmed = trim(str);
            if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            try
            {
                size_t consumed = 0;
                double value = std::stod(trimmed, &consumed);
                if (consumed != trimmed.size())
                {
                    return std::numeric_limits<double>::quiet_NaN();
                }
                return value;
            }
            catch (const std::invalid_argument &)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            catch (const std::out_of_range &)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
        }

    } // namespace data
} // namespace riskengine
