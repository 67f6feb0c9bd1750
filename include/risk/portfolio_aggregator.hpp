/**
 * @file portfolio_aggregator.hpp
 * @brief Weight normalization, portfolio return series and volatility
 *
 * Aggregates per-asset daily returns into a single portfolio return series
 * using normalized weights, and annualizes its volatility two independent
 * ways:
 *
 *     direct:  std(p) * sqrt(252)
 *     matrix:  sqrt(w^T * Cov * w) * sqrt(252)
 *
 * The two figures agree up to floating-point rounding when every series
 * has the same length.
 */

#pragma once

#include "data/return_series.hpp"

#include <Eigen/Dense>
#include <vector>

namespace riskengine
{
    namespace risk
    {

        /// Trading days per year used for annualization
        constexpr int TRADING_DAYS_PER_YEAR = 252;

        /**
         * @brief Normalize raw weights so they sum to one.
         *
         * If the raw weights sum to exactly zero they are returned unchanged.
         *
         * @param raw_weights Non-negative raw weights.
         * @return Normalized weights (same length).
         * @throws std::invalid_argument if raw_weights is empty or has a
         *         negative or non-finite entry.
         */
        Eigen::VectorXd normalize_weights(const Eigen::VectorXd &raw_weights);

        /**
         * @brief Convenience overload for std::vector input.
         */
        Eigen::VectorXd normalize_weights(const std::vector<double> &raw_weights);

        /**
         * @brief Weighted portfolio return at each time index.
         *
         * p_t = sum_i w_i * r_i,t. The first asset's length is taken as the
         * canonical length; if a later asset is shorter the result stops at
         * the shortest series, so no out-of-range index is ever read and no
         * series is padded.
         *
         * @param universe Asset universe.
         * @param weights Weights in universe order (normally normalized).
         * @return Portfolio return series.
         * @throws std::invalid_argument if weights.size() != universe.size().
         */
        std::vector<double> portfolio_returns(const data::AssetUniverse &universe,
                                              const Eigen::VectorXd &weights);

        /**
         * @brief Annualized volatility from the portfolio return series.
         * @return NaN if fewer than 2 observations.
         */
        double volatility_direct(const std::vector<double> &portfolio_returns,
                                 int trading_days_per_year = TRADING_DAYS_PER_YEAR);

        /**
         * @brief Annualized volatility from the quadratic form w^T Cov w.
         * @throws std::invalid_argument on dimension mismatch.
         */
        double volatility_via_matrix(const Eigen::VectorXd &weights,
                                     const Eigen::MatrixXd &covariance,
                                     int trading_days_per_year = TRADING_DAYS_PER_YEAR);

    } // namespace risk
} // namespace riskengine
