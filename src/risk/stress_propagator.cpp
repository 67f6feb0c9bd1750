/**
 * @file stress_propagator.cpp
 * @brief Implementation of the single-factor stress propagator
 */

#include "risk/stress_propagator.hpp"
#include "stats/stat_moments.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace riskengine
{
    namespace risk
    {

        StressPropagator::StressPropagator(const data::AssetUniverse &universe,
                                           const data::ReturnSeries &benchmark)
            : benchmark_std_(floored(stats::std_dev(benchmark.values())))
        {
            correlations_.reserve(universe.size());
            asset_stds_.reserve(universe.size());

            for (const auto &asset : universe.assets())
            {
                correlations_.push_back(stats::correlation(asset.values(), benchmark.values()));
                asset_stds_.push_back(floored(stats::std_dev(asset.values())));
            }
        }

        StressScenario StressPropagator::apply(double benchmark_shock, const Eigen::VectorXd &weights) const
        {
            if (static_cast<size_t>(weights.size()) != correlations_.size())
            {
                throw std::invalid_argument(
                    "Weight vector size (" + std::to_string(weights.size()) + ") must match number of assets (" + std::to_string(correlations_.size()) + ")");
            }

            StressScenario scenario;
            scenario.benchmark_shock = benchmark_shock;
            scenario.benchmark_std = benchmark_std_;
            scenario.benchmark_z = benchmark_shock / benchmark_std_;
            scenario.asset_shocks.resize(correlations_.size());
            scenario.portfolio_impact = 0.0;

            for (size_t i = 0; i < correlations_.size(); ++i)
            {
                double shock = scenario.benchmark_z * correlations_[i] * asset_stds_[i];
                scenario.asset_shocks[i] = shock;
                scenario.portfolio_impact += weights(static_cast<int>(i)) * shock;
            }

            return scenario;
        }

        double StressPropagator::floored(double sigma)
        {
            if (std::isnan(sigma) || sigma < STRESS_VOLATILITY_FLOOR)
            {
                return STRESS_VOLATILITY_FLOOR;
            }
            return sigma;
        }

    } // namespace risk
} // namespace riskengine
