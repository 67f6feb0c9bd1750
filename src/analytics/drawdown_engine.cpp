/**
 * @file drawdown_engine.cpp
 * @brief Implementation of NAV compounding and drawdown tracking.
 */

#include "analytics/drawdown_engine.hpp"

#include <cstddef>
#include <limits>

namespace riskengine
{
    namespace analytics
    {

        std::vector<double> nav_path(const std::vector<double> &returns)
        {
            std::vector<double> nav;
            nav.reserve(returns.size());

            double acc = 1.0;
            for (double r : returns)
            {
                acc *= (1.0 + r);
                nav.push_back(acc);
            }

            return nav;
        }

        double max_drawdown(const std::vector<double> &returns)
        {
            return analyze_drawdown(returns).max_drawdown;
        }

        DrawdownResult analyze_drawdown(const std::vector<double> &returns)
        {
            DrawdownResult result;
            result.nav = nav_path(returns);
            result.underwater_curve.resize(result.nav.size());
            result.max_drawdown = 0.0;
            result.peak_index = -1;
            result.trough_index = -1;

            double peak = -std::numeric_limits<double>::infinity();
            int peak_idx = -1;

            for (size_t i = 0; i < result.nav.size(); ++i)
            {
                const double value = result.nav[i];
                if (value > peak)
                {
                    peak = value;
                    peak_idx = static_cast<int>(i);
                }

                const double dd = (peak - value) / peak;
                result.underwater_curve[i] = dd;

                if (dd > result.max_drawdown)
                {
                    result.max_drawdown = dd;
                    result.peak_index = peak_idx;
                    result.trough_index = static_cast<int>(i);
                }
            }

            return result;
        }

    } // namespace analytics
} // namespace riskengine
