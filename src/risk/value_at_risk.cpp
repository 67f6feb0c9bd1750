/**
 * @file value_at_risk.cpp
 * @brief Implementation of the historical and variance-covariance VaR models
 */

#include "risk/value_at_risk.hpp"
#include "stats/stat_moments.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace riskengine
{
    namespace risk
    {

        double z_score(double confidence)
        {
            // Match on two decimals, e.g. 0.95000001 -> 95
            const long key = std::lround(confidence * 100.0);

            switch (key)
            {
            case 90:
                return 1.282;
            case 95:
                return 1.645;
            case 99:
                return 2.326;
            default:
                return 1.645;
            }
        }

        double quantile(const std::vector<double> &series, double q)
        {
            if (!(q >= 0.0 && q <= 1.0))
            {
                throw std::invalid_argument(
                    "Quantile must be in [0, 1], got: " + std::to_string(q));
            }
            if (series.empty())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            std::vector<double> sorted(series);
            std::sort(sorted.begin(), sorted.end());

            const double pos = static_cast<double>(sorted.size() - 1) * q;
            const size_t base = static_cast<size_t>(std::floor(pos));
            const double rest = pos - static_cast<double>(base);

            if (base + 1 < sorted.size())
            {
                return sorted[base] + rest * (sorted[base + 1] - sorted[base]);
            }
            return sorted[base];
        }

        // ===================================================================
        // VaRModel
        // ===================================================================

        void VaRModel::validate_confidence(double confidence)
        {
            if (!(confidence > 0.0 && confidence < 1.0))
            {
                throw std::invalid_argument(
                    "Confidence level must be in (0, 1), got: " + std::to_string(confidence));
            }
        }

        double VaRModel::floor_at_zero(double value)
        {
            if (std::isnan(value))
            {
                return value;
            }
            return std::max(0.0, value);
        }

        // ===================================================================
        // HistoricalVaR
        // ===================================================================

        double HistoricalVaR::estimate(const std::vector<double> &returns,
                                       double confidence) const
        {
            validate_confidence(confidence);

            // Loss at the (1 - confidence) tail, sign-flipped
            double q = quantile(returns, 1.0 - confidence);
            return floor_at_zero(-q);
        }

        std::string HistoricalVaR::get_name() const
        {
            return "HistoricalVaR";
        }

        // ===================================================================
        // VarianceCovarianceVaR
        // ===================================================================

        double VarianceCovarianceVaR::estimate(const std::vector<double> &returns,
                                               double confidence) const
        {
            validate_confidence(confidence);

            double z = z_score(confidence);
            return floor_at_zero(z * stats::std_dev(returns) - stats::mean(returns));
        }

        std::string VarianceCovarianceVaR::get_name() const
        {
            return "VarianceCovarianceVaR";
        }

        double value_at_risk(const std::vector<double> &returns,
                             double confidence,
                             VaRMethod method)
        {
            if (method == VaRMethod::VARIANCE_COVARIANCE)
            {
                return VarianceCovarianceVaR().estimate(returns, confidence);
            }
            return HistoricalVaR().estimate(returns, confidence);
        }

    } // namespace risk
} // namespace riskengine
