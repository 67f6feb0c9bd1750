/**
 * @file beta_engine.hpp
 * @brief Asset and portfolio beta against a benchmark.
 *
 * Beta measures sensitivity to the benchmark:
 *
 *   beta_i = Cov(r_i, r_b) / Cov(r_b, r_b)
 *
 * Portfolio beta is the weight-averaged asset beta, sum_i w_i * beta_i,
 * which equals the beta of the portfolio return series when all series
 * are aligned.
 */

#ifndef RISKENGINE_ANALYTICS_BETA_ENGINE_HPP
#define RISKENGINE_ANALYTICS_BETA_ENGINE_HPP

#include "data/return_series.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace riskengine
{
    namespace analytics
    {

        /**
         * @brief Beta of one return series against a benchmark.
         * @return NaN or Inf if the benchmark variance is zero or undefined.
         */
        double beta(const std::vector<double> &asset_returns,
                    const std::vector<double> &benchmark_returns);

        /**
         * @class BetaEngine
         * @brief Computes per-asset betas and the weighted portfolio beta.
         *
         * Usage:
         * @code
         *   BetaEngine betas(universe, benchmark);
         *   double msft_beta = betas.asset_beta(0);
         *   double port_beta = betas.portfolio_beta(weights);
         * @endcode
         *
         * Thread safety: Instances are effectively immutable after construction.
         */
        class BetaEngine
        {
        public:
            // ---------------------------------------------------------------
            // Constructors
            // ---------------------------------------------------------------

            /**
             * @brief Compute betas for every asset in the universe.
             * @param universe Asset universe.
             * @param benchmark Benchmark return series.
             */
            BetaEngine(const data::AssetUniverse &universe,
                       const data::ReturnSeries &benchmark);

            /** @brief Default destructor. */
            ~BetaEngine() = default;

            // ---------------------------------------------------------------
            // Results
            // ---------------------------------------------------------------

            /**
             * @brief Betas in universe order.
             */
            const std::vector<double> &asset_betas() const;

            /**
             * @brief Beta of a single asset.
             * @throws std::out_of_range if index >= number of assets.
             */
            double asset_beta(size_t index) const;

            /**
             * @brief Weighted average of asset betas.
             * @param weights Normalized weights in universe order.
             * @return Portfolio beta.
             * @throws std::invalid_argument if weights size != number of assets.
             */
            double portfolio_beta(const Eigen::VectorXd &weights) const;

            /**
             * @brief Benchmark identifier used for the computation.
             */
            const std::string &benchmark_id() const;

        private:
            std::vector<double> betas_;
            std::string benchmark_id_;
        };

    } // namespace analytics
} // namespace riskengine

#endif // RISKENGINE_ANALYTICS_BETA_ENGINE_HPP
