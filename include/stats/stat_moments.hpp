/**
 * @file stat_moments.hpp
 * @brief Sample moments over daily return sequences.
 *
 * Mean, sample standard deviation (Bessel-corrected), covariance and
 * correlation over plain double sequences. These are the building blocks
 * for every other risk computation in the library.
 *
 * Degenerate inputs do not throw. A sequence too short for the statistic
 * yields NaN, and a zero-variance sequence fed to correlation yields the
 * IEEE result of the division (NaN or +/-Inf). Callers inspect the result
 * with std::isfinite rather than catching.
 */

#ifndef RISKENGINE_STATS_STAT_MOMENTS_HPP
#define RISKENGINE_STATS_STAT_MOMENTS_HPP

#include <vector>

namespace riskengine
{
    namespace stats
    {

        /**
         * @brief Arithmetic mean.
         * @param series Input values.
         * @return Mean, or NaN if the series is empty.
         */
        double mean(const std::vector<double> &series);

        /**
         * @brief Sample standard deviation with n-1 divisor.
         * @param series Input values.
         * @return Standard deviation, or NaN if fewer than 2 values.
         */
        double std_dev(const std::vector<double> &series);

        /**
         * @brief Sample covariance of two sequences.
         *
         * Means are taken over each full sequence. When the lengths differ,
         * only the overlapping prefix of length min(|a|, |b|) enters the sum
         * and the divisor is min(|a|, |b|) - 1.
         *
         * @return Covariance, or NaN if the overlap has fewer than 2 values.
         */
        double covariance(const std::vector<double> &a, const std::vector<double> &b);

        /**
         * @brief Pearson correlation: covariance(a, b) / (std(a) * std(b)).
         *
         * Not clamped. A constant input produces NaN or Inf, which is
         * distinct from a genuine zero correlation.
         */
        double correlation(const std::vector<double> &a, const std::vector<double> &b);

    } // namespace stats
} // namespace riskengine

#endif // RISKENGINE_STATS_STAT_MOMENTS_HPP
