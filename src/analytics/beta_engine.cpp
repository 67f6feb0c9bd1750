/**
 * @file beta_engine.cpp
 * @brief Implementation of the BetaEngine class.
 */

#include "analytics/beta_engine.hpp"
#include "stats/stat_moments.hpp"

#include <stdexcept>

namespace riskengine
{
    namespace analytics
    {

        double beta(const std::vector<double> &asset_returns,
                    const std::vector<double> &benchmark_returns)
        {
            // Zero benchmark variance is left to IEEE division
            return stats::covariance(asset_returns, benchmark_returns) /
                   stats::covariance(benchmark_returns, benchmark_returns);
        }

        // ===================================================================
        // Constructors
        // ===================================================================

        BetaEngine::BetaEngine(const data::AssetUniverse &universe,
                               const data::ReturnSeries &benchmark)
            : benchmark_id_(benchmark.id())
        {
            betas_.reserve(universe.size());
            for (const auto &asset : universe.assets())
            {
                betas_.push_back(beta(asset.values(), benchmark.values()));
            }
        }

        // ===================================================================
        // Results
        // ===================================================================

        const std::vector<double> &BetaEngine::asset_betas() const
        {
            return betas_;
        }

        double BetaEngine::asset_beta(size_t index) const
        {
            if (index >= betas_.size())
            {
                throw std::out_of_range(
                    "Asset index " + std::to_string(index) + " out of range, number of assets: " + std::to_string(betas_.size()));
            }
            return betas_[index];
        }

        double BetaEngine::portfolio_beta(const Eigen::VectorXd &weights) const
        {
            if (static_cast<size_t>(weights.size()) != betas_.size())
            {
                throw std::invalid_argument(
                    "Weight vector size (" + std::to_string(weights.size()) + ") must match number of assets (" + std::to_string(betas_.size()) + ")");
            }

            double result = 0.0;
            for (size_t i = 0; i < betas_.size(); ++i)
            {
                result += weights(static_cast<int>(i)) * betas_[i];
            }
            return result;
        }

        const std::string &BetaEngine::benchmark_id() const
        {
            return benchmark_id_;
        }

    } // namespace analytics
} // namespace riskengine
