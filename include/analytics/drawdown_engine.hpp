/**
 * @file drawdown_engine.hpp
 * @brief Cumulative NAV path and maximum drawdown from a return series.
 *
 * The NAV path compounds daily returns from a unit baseline:
 *
 *   NAV_t = NAV_{t-1} * (1 + r_t),  NAV_{-1} = 1.0
 *
 * so the first emitted value already reflects the first return. The
 * drawdown at t is (peak_t - NAV_t) / peak_t, where peak_t is the running
 * maximum of the NAV path. The running peak starts at negative infinity,
 * so the first point never registers a drawdown.
 */

#ifndef RISKENGINE_ANALYTICS_DRAWDOWN_ENGINE_HPP
#define RISKENGINE_ANALYTICS_DRAWDOWN_ENGINE_HPP

#include <vector>

namespace riskengine
{
    namespace analytics
    {

        /**
         * @struct DrawdownResult
         * @brief NAV path plus the worst peak-to-trough decline.
         *
         * If the NAV never falls below a prior peak, max_drawdown is 0.0 and
         * peak_index / trough_index are -1.
         */
        struct DrawdownResult
        {
            std::vector<double> nav;              ///< Compounded NAV, one value per return
            std::vector<double> underwater_curve; ///< Drawdown at each point as a positive fraction
            double max_drawdown;                  ///< Maximum drawdown as a positive fraction (e.g., 0.15 = 15%)
            int peak_index;                       ///< Index of the peak before the worst drawdown
            int trough_index;                     ///< Index of the trough of the worst drawdown
        };

        /**
         * @brief Compounded NAV path starting from 1.0.
         * @param returns Daily fractional returns.
         * @return NAV values, same length as returns.
         */
        std::vector<double> nav_path(const std::vector<double> &returns);

        /**
         * @brief Maximum drawdown of the compounded return series.
         * @return Value in [0, 1] for returns > -1; 0.0 for an empty series.
         */
        double max_drawdown(const std::vector<double> &returns);

        /**
         * @brief Full drawdown analysis: NAV, underwater curve and worst event.
         */
        DrawdownResult analyze_drawdown(const std::vector<double> &returns);

    } // namespace analytics
} // namespace riskengine

#endif // RISKENGINE_ANALYTICS_DRAWDOWN_ENGINE_HPP
