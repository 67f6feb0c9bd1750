/**
 * @file portfolio_aggregator.cpp
 * @brief Implementation of portfolio aggregation and volatility
 */

#include "risk/portfolio_aggregator.hpp"
#include "stats/stat_moments.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace riskengine
{
    namespace risk
    {

        Eigen::VectorXd normalize_weights(const Eigen::VectorXd &raw_weights)
        {
            if (raw_weights.size() == 0)
            {
                throw std::invalid_argument("Weight vector cannot be empty");
            }

            for (int i = 0; i < raw_weights.size(); ++i)
            {
                if (!std::isfinite(raw_weights(i)) || raw_weights(i) < 0.0)
                {
                    throw std::invalid_argument(
                        "Weights must be finite and non-negative, got " + std::to_string(raw_weights(i)) + " at index " + std::to_string(i));
                }
            }

            double total = raw_weights.sum();

            // All-zero weights pass through untouched
            if (total == 0.0)
            {
                return raw_weights;
            }

            return raw_weights / total;
        }

        Eigen::VectorXd normalize_weights(const std::vector<double> &raw_weights)
        {
            Eigen::VectorXd w(static_cast<int>(raw_weights.size()));
            for (size_t i = 0; i < raw_weights.size(); ++i)
            {
                w(static_cast<int>(i)) = raw_weights[i];
            }
            return normalize_weights(w);
        }

        std::vector<double> portfolio_returns(const data::AssetUniverse &universe,
                                              const Eigen::VectorXd &weights)
        {
            if (static_cast<size_t>(weights.size()) != universe.size())
            {
                throw std::invalid_argument(
                    "Weight vector size (" + std::to_string(weights.size()) + ") must match universe size (" + std::to_string(universe.size()) + ")");
            }

            // First asset is canonical; never index past the shortest series
            const size_t n = universe.min_length();

            std::vector<double> result(n, 0.0);
            for (size_t t = 0; t < n; ++t)
            {
                double value = 0.0;
                for (size_t i = 0; i < universe.size(); ++i)
                {
                    value += weights(static_cast<int>(i)) * universe[i][t];
                }
                result[t] = value;
            }

            return result;
        }

        double volatility_direct(const std::vector<double> &portfolio_returns,
                                 int trading_days_per_year)
        {
            return stats::std_dev(portfolio_returns) * std::sqrt(static_cast<double>(trading_days_per_year));
        }

        double volatility_via_matrix(const Eigen::VectorXd &weights,
                                     const Eigen::MatrixXd &covariance,
                                     int trading_days_per_year)
        {
            if (covariance.rows() != covariance.cols() || covariance.rows() != weights.size())
            {
                throw std::invalid_argument(
                    "Covariance matrix (" + std::to_string(covariance.rows()) + "x" + std::to_string(covariance.cols()) + ") does not match weight vector size " + std::to_string(weights.size()));
            }

            double variance = weights.dot(covariance * weights);
            return std::sqrt(variance) * std::sqrt(static_cast<double>(trading_days_per_year));
        }

    } // namespace risk
} // namespace riskengine
