/**
 * @file risk_analysis_engine.hpp
 * @brief One full risk computation pass over a weighted asset universe.
 *
 * Composes the statistics, covariance, aggregation, beta, VaR, drawdown and
 * stress components into a single stateless call:
 *
 *   (universe, benchmark, settings) -> RiskReport
 *
 * Nothing is cached between calls; a caller that changes any input simply
 * calls run() again.
 *
 * Contract violations (weight vector length, confidence outside (0, 1), a
 * benchmark whose length differs from the shortest asset series, which is
 * the length of the portfolio return series) throw std::invalid_argument
 * before any computation.
 * Numeric degeneracies (too few observations, constant series) do not
 * throw; they surface as NaN or Inf in the affected fields.
 */

#ifndef RISKENGINE_ANALYTICS_RISK_ANALYSIS_ENGINE_HPP
#define RISKENGINE_ANALYTICS_RISK_ANALYSIS_ENGINE_HPP

#include "analytics/drawdown_engine.hpp"
#include "data/return_series.hpp"
#include "risk/portfolio_aggregator.hpp"
#include "risk/stress_propagator.hpp"
#include "risk/value_at_risk.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace riskengine
{
    namespace analytics
    {

        /**
         * @struct RiskSettings
         * @brief User-controlled inputs of a computation pass.
         */
        struct RiskSettings
        {
            std::vector<double> raw_weights;                          ///< Raw weights in universe order
            double confidence = 0.95;                                 ///< VaR confidence level
            risk::VaRMethod var_method = risk::VaRMethod::HISTORICAL; ///< Selected VaR method
            double stress_shock = -0.07;                              ///< One-day benchmark shock
            int window_days = 0;                                      ///< Trailing observations to use (<= 0: all)
            int trading_days_per_year = risk::TRADING_DAYS_PER_YEAR;  ///< Annualization factor
        };

        /**
         * @struct RiskReport
         * @brief All outputs of a computation pass.
         */
        struct RiskReport
        {
            std::vector<std::string> asset_ids;    ///< Universe order
            std::vector<std::string> asset_labels; ///< Display labels, universe order
            std::string benchmark_id;
            int num_observations = 0; ///< Length of the portfolio return series
            int trading_days_per_year = risk::TRADING_DAYS_PER_YEAR; ///< Annualization factor used

            Eigen::VectorXd normalized_weights;
            bool weights_normalized = true; ///< false when raw weights summed to zero

            Eigen::MatrixXd covariance;
            Eigen::MatrixXd correlation;

            std::vector<double> portfolio_returns;
            double portfolio_mean = 0.0; ///< Daily mean return
            double portfolio_std = 0.0;  ///< Daily std dev
            double volatility_direct = 0.0;
            double volatility_matrix = 0.0;

            std::vector<double> asset_betas;
            double portfolio_beta = 0.0;

            double confidence = 0.95;
            risk::VaRMethod var_method = risk::VaRMethod::HISTORICAL;
            double var_historical = 0.0;
            double var_parametric = 0.0;
            double var_estimate = 0.0; ///< VaR of the selected method

            DrawdownResult drawdown;
            risk::StressScenario stress;

            const std::vector<double> &nav_path() const { return drawdown.nav; }
            double max_drawdown() const { return drawdown.max_drawdown; }
            double stress_impact() const { return stress.portfolio_impact; }

            /**
             * @brief Formatted multi-line text report.
             */
            std::string report() const;

            /**
             * @brief JSON serialization (pretty-printed, non-finite values as null).
             */
            std::string to_json() const;

            /**
             * @brief Write the NAV chart series as CSV (index,nav,drawdown).
             * @throws std::runtime_error if the file cannot be opened.
             */
            void to_csv(const std::string &filepath) const;
        };

        /**
         * @class RiskAnalysisEngine
         * @brief Stateless driver for a full risk computation pass.
         *
         * Usage:
         * @code
         *   RiskSettings settings;
         *   settings.raw_weights = {0.4, 0.4, 0.2, 0.0};
         *   settings.confidence = 0.99;
         *   auto report = RiskAnalysisEngine().run(universe, benchmark, settings);
         *   std::cout << report.report();
         * @endcode
         */
        class RiskAnalysisEngine
        {
        public:
            RiskAnalysisEngine() = default;
            ~RiskAnalysisEngine() = default;

            /**
             * @brief Run all risk computations.
             * @param universe Asset universe (not modified).
             * @param benchmark Benchmark return series (not modified).
             * @param settings Weights, confidence, method, shock and window.
             * @return Newly computed report.
             * @throws std::invalid_argument on contract violations.
             */
            RiskReport run(const data::AssetUniverse &universe,
                           const data::ReturnSeries &benchmark,
                           const RiskSettings &settings) const;

        private:
            static void validate(const data::AssetUniverse &universe,
                                 const data::ReturnSeries &benchmark,
                                 const RiskSettings &settings);
        };

    } // namespace analytics
} // namespace riskengine

#endif // RISKENGINE_ANALYTICS_RISK_ANALYSIS_ENGINE_HPP
