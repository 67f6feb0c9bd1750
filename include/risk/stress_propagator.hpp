/**
 * @file stress_propagator.hpp
 * @brief One-day benchmark shock propagated to the portfolio
 *
 * Linear, single-factor approximation. A benchmark shock s is expressed in
 * benchmark standard deviations and passed to each asset through its
 * correlation with the benchmark and its own volatility:
 *
 *     z_shock   = s / sigma_b
 *     shock_i   = z_shock * corr(asset_i, bench) * sigma_i
 *     impact    = sum_i w_i * shock_i
 *
 * This is not a joint simulation and not a stress VaR. It ignores
 * non-linear payoffs, fat tails and correlation breakdown under stress.
 */

#pragma once

#include "data/return_series.hpp"

#include <Eigen/Dense>
#include <vector>

namespace riskengine
{
    namespace risk
    {

        /// Floor applied to benchmark and asset volatility before use
        constexpr double STRESS_VOLATILITY_FLOOR = 1e-9;

        /**
         * @struct StressScenario
         * @brief Result of propagating one benchmark shock.
         */
        struct StressScenario
        {
            double benchmark_shock;           ///< Input one-day benchmark return, e.g. -0.07
            double benchmark_std;             ///< Benchmark daily std dev after flooring
            double benchmark_z;               ///< Shock in benchmark std dev units
            std::vector<double> asset_shocks; ///< Estimated one-day return per asset
            double portfolio_impact;          ///< Weighted sum of asset shocks
        };

        /**
         * @class StressPropagator
         * @brief Propagates a benchmark shock through correlation and relative volatility
         *
         * Usage:
         * @code
         *   StressPropagator stress(universe, benchmark);
         *   auto scenario = stress.apply(-0.07, weights);
         *   double loss = scenario.portfolio_impact;
         * @endcode
         *
         * The constructor precomputes per-asset correlation and volatility;
         * apply() can then be called for several shocks on the same data.
         * Instances are immutable after construction.
         */
        class StressPropagator
        {
        public:
            /**
             * @brief Construct from asset and benchmark history.
             * @param universe Asset universe (borrowed for the duration of construction only).
             * @param benchmark Benchmark return series.
             */
            StressPropagator(const data::AssetUniverse &universe,
                             const data::ReturnSeries &benchmark);

            ~StressPropagator() = default;

            /**
             * @brief Propagate a benchmark shock.
             * @param benchmark_shock One-day benchmark return (can be positive).
             * @param weights Normalized weights in universe order.
             * @return Scenario with per-asset shocks and portfolio impact.
             * @throws std::invalid_argument if weights size != number of assets.
             */
            StressScenario apply(double benchmark_shock, const Eigen::VectorXd &weights) const;

            /** @brief Correlation of each asset with the benchmark (may be non-finite). */
            const std::vector<double> &correlations() const { return correlations_; }

            /** @brief Daily std dev of each asset after flooring. */
            const std::vector<double> &asset_volatilities() const { return asset_stds_; }

            /** @brief Daily std dev of the benchmark after flooring. */
            double benchmark_volatility() const { return benchmark_std_; }

        private:
            static double floored(double sigma);

            std::vector<double> correlations_;
            std::vector<double> asset_stds_;
            double benchmark_std_;
        };

    } // namespace risk
} // namespace riskengine
