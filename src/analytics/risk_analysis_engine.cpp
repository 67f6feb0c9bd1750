/**
 * @file risk_analysis_engine.cpp
 * @brief Implementation of the RiskAnalysisEngine and RiskReport export.
 *
 * A pass runs leaves first: windowing, weight normalization, covariance
 * and correlation, portfolio aggregation, betas, then the consumers of the
 * portfolio return series (VaR, drawdown) and the stress propagator.
 */

#include "analytics/risk_analysis_engine.hpp"
#include "analytics/beta_engine.hpp"
#include "risk/covariance_matrix_builder.hpp"
#include "risk/var_model_factory.hpp"
#include "stats/stat_moments.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace riskengine
{
    namespace analytics
    {

        namespace
        {
            /**
             * @brief Percentage with fixed decimals, e.g. 0.1234 -> "12.34%".
             */
            std::string to_pct(double x, int digits = 2)
            {
                if (!std::isfinite(x))
                {
                    return "n/a";
                }
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(digits) << x * 100.0 << "%";
                return oss.str();
            }

            std::string to_fixed(double x, int digits = 4)
            {
                if (!std::isfinite(x))
                {
                    return "n/a";
                }
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(digits) << x;
                return oss.str();
            }

            nlohmann::json matrix_to_json(const Eigen::MatrixXd &m)
            {
                nlohmann::json rows = nlohmann::json::array();
                for (int i = 0; i < m.rows(); ++i)
                {
                    std::vector<double> row(m.cols());
                    for (int j = 0; j < m.cols(); ++j)
                    {
                        row[j] = m(i, j);
                    }
                    rows.push_back(row);
                }
                return rows;
            }
        } // namespace

        // ===================================================================
        // RiskAnalysisEngine
        // ===================================================================

        RiskReport RiskAnalysisEngine::run(const data::AssetUniverse &universe,
                                           const data::ReturnSeries &benchmark,
                                           const RiskSettings &settings) const
        {
            const data::AssetUniverse assets = universe.tail(settings.window_days);
            const data::ReturnSeries bench = benchmark.tail(settings.window_days);

            validate(assets, bench, settings);

            RiskReport report;
            report.asset_ids = assets.identifiers();
            for (const auto &id : report.asset_ids)
            {
                report.asset_labels.push_back(assets.metadata(id).label);
            }
            report.benchmark_id = bench.id();

            // Weights
            report.normalized_weights = risk::normalize_weights(settings.raw_weights);
            report.weights_normalized = report.normalized_weights.sum() != 0.0;

            // Covariance structure
            risk::CovarianceMatrixBuilder builder;
            auto matrices = builder.build(assets);
            report.covariance = std::move(matrices.covariance);
            report.correlation = std::move(matrices.correlation);

            // Portfolio aggregation
            report.portfolio_returns = risk::portfolio_returns(assets, report.normalized_weights);
            report.num_observations = static_cast<int>(report.portfolio_returns.size());
            report.trading_days_per_year = settings.trading_days_per_year;
            report.portfolio_mean = stats::mean(report.portfolio_returns);
            report.portfolio_std = stats::std_dev(report.portfolio_returns);
            report.volatility_direct = risk::volatility_direct(report.portfolio_returns,
                                                               settings.trading_days_per_year);
            report.volatility_matrix = risk::volatility_via_matrix(report.normalized_weights,
                                                                   report.covariance,
                                                                   settings.trading_days_per_year);

            // Betas
            BetaEngine betas(assets, bench);
            report.asset_betas = betas.asset_betas();
            report.portfolio_beta = betas.portfolio_beta(report.normalized_weights);

            // Value at Risk, both methods; the selected one is the headline figure
            report.confidence = settings.confidence;
            report.var_method = settings.var_method;
            report.var_historical = risk::VaRModelFactory::create(risk::VaRMethod::HISTORICAL)
                                        ->estimate(report.portfolio_returns, settings.confidence);
            report.var_parametric = risk::VaRModelFactory::create(risk::VaRMethod::VARIANCE_COVARIANCE)
                                        ->estimate(report.portfolio_returns, settings.confidence);
            report.var_estimate = settings.var_method == risk::VaRMethod::HISTORICAL
                                      ? report.var_historical
                                      : report.var_parametric;

            // Drawdown
            report.drawdown = analyze_drawdown(report.portfolio_returns);

            // Stress
            risk::StressPropagator stress(assets, bench);
            report.stress = stress.apply(settings.stress_shock, report.normalized_weights);

            return report;
        }

        void RiskAnalysisEngine::validate(const data::AssetUniverse &universe,
                                          const data::ReturnSeries &benchmark,
                                          const RiskSettings &settings)
        {
            if (settings.raw_weights.size() != universe.size())
            {
                throw std::invalid_argument(
                    "Weight vector size (" + std::to_string(settings.raw_weights.size()) + ") must match universe size (" + std::to_string(universe.size()) + ")");
            }
            // Portfolio returns span the shortest asset series; the benchmark must line up with them
            if (benchmark.size() != universe.min_length())
            {
                throw std::invalid_argument(
                    "Benchmark series '" + benchmark.id() + "' length (" + std::to_string(benchmark.size()) + ") must match portfolio series length (" + std::to_string(universe.min_length()) + ")");
            }
            if (!(settings.confidence > 0.0 && settings.confidence < 1.0))
            {
                throw std::invalid_argument(
                    "Confidence level must be in (0, 1), got: " + std::to_string(settings.confidence));
            }
            if (settings.trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(settings.trading_days_per_year));
            }
        }

        // ===================================================================
        // RiskReport export
        // ===================================================================

        std::string RiskReport::report() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Portfolio Risk Report\n";
            oss << "=====================\n\n";

            oss << "Universe:\n";
            oss << "  Observations:        " << num_observations << " days (~"
                << std::setprecision(1) << static_cast<double>(num_observations) / trading_days_per_year << " years)\n";
            oss << "  Benchmark:           " << benchmark_id << "\n";
            if (!weights_normalized)
            {
                oss << "  Note:                raw weights sum to zero, normalization skipped\n";
            }
            oss << "\n";

            oss << "  " << std::left << std::setw(12) << "Asset"
                << std::right << std::setw(10) << "Weight"
                << std::setw(10) << "Beta"
                << std::setw(12) << "Stress" << "\n";
            oss << "  " << std::string(44, '-') << "\n";
            for (size_t i = 0; i < asset_ids.size(); ++i)
            {
                oss << "  " << std::left << std::setw(12) << asset_labels[i]
                    << std::right << std::setw(10) << to_pct(normalized_weights(static_cast<int>(i)))
                    << std::setw(10) << to_fixed(asset_betas[i], 3)
                    << std::setw(12) << to_pct(stress.asset_shocks[i]) << "\n";
            }
            oss << "\n";

            oss << "Volatility:\n";
            oss << "  Daily Mean:          " << to_pct(portfolio_mean, 4) << "\n";
            oss << "  Daily Std Dev:       " << to_pct(portfolio_std, 4) << "\n";
            oss << "  Annualized (series): " << to_pct(volatility_direct) << "\n";
            oss << "  Annualized (matrix): " << to_pct(volatility_matrix) << "\n";
            oss << "  Portfolio Beta:      " << to_fixed(portfolio_beta, 3) << "\n";
            oss << "\n";

            oss << "Value at Risk (1-day, " << std::setprecision(0) << confidence * 100.0 << "%):\n";
            oss << "  Historical:          " << to_pct(var_historical)
                << (var_method == risk::VaRMethod::HISTORICAL ? "  <- selected" : "") << "\n";
            oss << "  Variance-Covariance: " << to_pct(var_parametric)
                << (var_method == risk::VaRMethod::VARIANCE_COVARIANCE ? "  <- selected" : "") << "\n";
            oss << "\n";

            oss << "Drawdown:\n";
            oss << "  Max Drawdown:        " << to_pct(drawdown.max_drawdown) << "\n";
            if (drawdown.peak_index >= 0)
            {
                oss << "  Peak -> Trough:      day " << drawdown.peak_index
                    << " -> day " << drawdown.trough_index << "\n";
            }
            if (!drawdown.nav.empty())
            {
                oss << "  Final NAV:           " << to_fixed(drawdown.nav.back()) << "\n";
            }
            oss << "\n";

            oss << "Stress Test (linear single-factor approximation):\n";
            oss << "  Benchmark Shock:     " << to_pct(stress.benchmark_shock) << " ("
                << to_fixed(stress.benchmark_z, 2) << " sd)\n";
            oss << "  Portfolio Impact:    " << to_pct(stress.portfolio_impact) << "\n";
            oss << "\n";

            oss << "Correlation Matrix:\n";
            oss << "  " << std::setw(10) << "";
            for (const auto &label : asset_labels)
            {
                oss << std::right << std::setw(10) << label.substr(0, 9);
            }
            oss << "\n";
            for (int i = 0; i < correlation.rows(); ++i)
            {
                oss << "  " << std::left << std::setw(10) << asset_labels[i].substr(0, 9);
                for (int j = 0; j < correlation.cols(); ++j)
                {
                    oss << std::right << std::setw(10) << to_fixed(correlation(i, j), 2);
                }
                oss << "\n";
            }

            return oss.str();
        }

        std::string RiskReport::to_json() const
        {
            nlohmann::json j;

            j["universe"]["assets"] = asset_ids;
            j["universe"]["labels"] = asset_labels;
            j["universe"]["benchmark"] = benchmark_id;
            j["universe"]["num_observations"] = num_observations;
            j["universe"]["trading_days_per_year"] = trading_days_per_year;

            std::vector<double> weights(normalized_weights.data(),
                                        normalized_weights.data() + normalized_weights.size());
            j["weights"]["normalized"] = weights;
            j["weights"]["normalization_applied"] = weights_normalized;

            j["matrices"]["covariance"] = matrix_to_json(covariance);
            j["matrices"]["correlation"] = matrix_to_json(correlation);

            j["volatility"]["daily_mean"] = portfolio_mean;
            j["volatility"]["daily_std"] = portfolio_std;
            j["volatility"]["annualized_direct"] = volatility_direct;
            j["volatility"]["annualized_matrix"] = volatility_matrix;

            j["beta"]["assets"] = asset_betas;
            j["beta"]["portfolio"] = portfolio_beta;

            j["var"]["confidence"] = confidence;
            j["var"]["method"] = risk::VaRModelFactory::to_string(var_method);
            j["var"]["historical"] = var_historical;
            j["var"]["variance_covariance"] = var_parametric;
            j["var"]["estimate"] = var_estimate;

            j["drawdown"]["max_drawdown"] = drawdown.max_drawdown;
            j["drawdown"]["peak_index"] = drawdown.peak_index;
            j["drawdown"]["trough_index"] = drawdown.trough_index;
            j["drawdown"]["nav_path"] = drawdown.nav;

            j["stress"]["benchmark_shock"] = stress.benchmark_shock;
            j["stress"]["benchmark_z"] = stress.benchmark_z;
            j["stress"]["asset_shocks"] = stress.asset_shocks;
            j["stress"]["portfolio_impact"] = stress.portfolio_impact;

            j["portfolio_returns"] = portfolio_returns;

            return j.dump(2);
        }

        void RiskReport::to_csv(const std::string &filepath) const
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open file for writing: " + filepath);
            }

            file << "index,nav,drawdown\n";
            file << std::fixed << std::setprecision(8);

            for (size_t i = 0; i < drawdown.nav.size(); ++i)
            {
                file << i << "," << drawdown.nav[i] << "," << drawdown.underwater_curve[i] << "\n";
            }
        }

    } // namespace analytics
} // namespace riskengine
