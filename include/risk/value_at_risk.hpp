/**
 * @file value_at_risk.hpp
 * @brief One-day Value-at-Risk estimators on a portfolio return series
 *
 * Provides a common interface for the two supported VaR methods:
 *
 * - Historical simulation: empirical (1 - confidence) quantile of the
 *   observed returns, using linear interpolation between order statistics
 *   (the "type 7" quantile).
 * - Variance-covariance: normal approximation z * std - mean, with z taken
 *   from a fixed one-tailed lookup table.
 *
 * Both estimators report VaR as a non-negative loss fraction: a result that
 * would be negative (a gain at the chosen tail) is floored at zero.
 *
 * Thread Safety: Estimators are stateless and safe for concurrent use.
 */

#pragma once

#include <string>
#include <vector>

namespace riskengine
{
    namespace risk
    {

        /**
         * @enum VaRMethod
         * @brief Method used for Value at Risk.
         */
        enum class VaRMethod
        {
            HISTORICAL,         ///< Empirical quantile of observed returns
            VARIANCE_COVARIANCE ///< Normal approximation from mean and std dev
        };

        /**
         * @brief One-tailed z-score for a confidence level.
         *
         * Lookup on the confidence rounded to two decimals:
         * 0.90 -> 1.282, 0.95 -> 1.645, 0.99 -> 2.326. Any other value falls
         * back to the 0.95 z-score; there is no interpolation.
         */
        double z_score(double confidence);

        /**
         * @brief Type-7 sample quantile.
         *
         * Sorts a copy ascending, takes position (n - 1) * q and interpolates
         * linearly between the two bracketing order statistics.
         *
         * @param series Input values (not modified).
         * @param q Quantile in [0, 1].
         * @return Quantile value, or NaN if series is empty.
         * @throws std::invalid_argument if q is outside [0, 1] or NaN.
         */
        double quantile(const std::vector<double> &series, double q);

        /**
         * @class VaRModel
         * @brief Abstract base class for one-day VaR estimation
         *
         * Usage Example:
         * @code
         * auto model = VaRModelFactory::create(VaRMethod::HISTORICAL);
         * double var95 = model->estimate(portfolio_returns, 0.95);
         * @endcode
         */
        class VaRModel
        {
        public:
            virtual ~VaRModel() = default;

            /**
             * @brief Estimate one-day VaR
             * @param returns Daily portfolio returns
             * @param confidence Confidence level in (0, 1), e.g. 0.95
             * @return Non-negative loss fraction, or NaN for insufficient data
             * @throws std::invalid_argument if confidence is outside (0, 1)
             */
            virtual double estimate(const std::vector<double> &returns,
                                    double confidence) const = 0;

            /**
             * @brief Method implemented by this model
             */
            virtual VaRMethod method() const = 0;

            /**
             * @brief Get the name of the model
             */
            virtual std::string get_name() const = 0;

        protected:
            /**
             * @brief Validate confidence level
             * @throws std::invalid_argument if not in (0, 1)
             */
            static void validate_confidence(double confidence);

            /**
             * @brief Floor a VaR figure at zero, letting NaN through
             */
            static double floor_at_zero(double value);
        };

        /**
         * @class HistoricalVaR
         * @brief Historical-simulation VaR: max(0, -quantile(returns, 1 - confidence))
         *
         * Makes no distributional assumption. With few observations the
         * estimate moves in steps between order statistics.
         */
        class HistoricalVaR : public VaRModel
        {
        public:
            HistoricalVaR() = default;
            ~HistoricalVaR() override = default;

            double estimate(const std::vector<double> &returns,
                            double confidence) const override;

            VaRMethod method() const override { return VaRMethod::HISTORICAL; }

            std::string get_name() const override;
        };

        /**
         * @class VarianceCovarianceVaR
         * @brief Parametric VaR: max(0, z(confidence) * std - mean)
         *
         * Assumes normally distributed daily returns. Requires at least 2
         * observations; fewer yield NaN.
         */
        class VarianceCovarianceVaR : public VaRModel
        {
        public:
            VarianceCovarianceVaR() = default;
            ~VarianceCovarianceVaR() override = default;

            double estimate(const std::vector<double> &returns,
                            double confidence) const override;

            VaRMethod method() const override { return VaRMethod::VARIANCE_COVARIANCE; }

            std::string get_name() const override;
        };

        /**
         * @brief Estimate VaR with the selected method
         */
        double value_at_risk(const std::vector<double> &returns,
                             double confidence,
                             VaRMethod method);

    } // namespace risk
} // namespace riskengine
