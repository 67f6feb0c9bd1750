/**
 * @file stat_moments.cpp
 * @brief Implementation of the sample moment functions.
 */

#include "stats/stat_moments.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace riskengine
{
    namespace stats
    {

        double mean(const std::vector<double> &series)
        {
            if (series.empty())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            return std::accumulate(series.begin(), series.end(), 0.0) /
                   static_cast<double>(series.size());
        }

        double std_dev(const std::vector<double> &series)
        {
            if (series.size() < 2)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            double m = mean(series);
            double sum_sq = 0.0;
            for (double r : series)
            {
                double diff = r - m;
                sum_sq += diff * diff;
            }

            return std::sqrt(sum_sq / static_cast<double>(series.size() - 1));
        }

        double covariance(const std::vector<double> &a, const std::vector<double> &b)
        {
            const size_t n = std::min(a.size(), b.size());
            if (n < 2)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            // Means over the full sequences, sum over the common prefix only
            double mean_a = mean(a);
            double mean_b = mean(b);

            double sum = 0.0;
            for (size_t i = 0; i < n; ++i)
            {
                sum += (a[i] - mean_a) * (b[i] - mean_b);
            }

            return sum / static_cast<double>(n - 1);
        }

        double correlation(const std::vector<double> &a, const std::vector<double> &b)
        {
            return covariance(a, b) / (std_dev(a) * std_dev(b));
        }

    } // namespace stats
} // namespace riskengine
