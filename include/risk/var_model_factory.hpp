/**
 * @file var_model_factory.hpp
 * @brief Factory for creating VaR models from configuration
 *
 * Maps the method flag (enum or configuration string) to a concrete
 * VaRModel so callers can switch between historical simulation and the
 * variance-covariance approximation without code changes.
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "risk": {
 *     "var_method": "variance_covariance",
 *     "confidence": 0.99
 *   }
 * }
 * @endcode
 */

#pragma once

#include "risk/value_at_risk.hpp"

#include <memory>
#include <string>
#include <vector>

namespace riskengine
{
    namespace risk
    {

        /**
         * @class VaRModelFactory
         * @brief Creates VaRModel instances by method
         *
         * Thread Safety: All methods are static and thread-safe.
         */
        class VaRModelFactory
        {
        public:
            /**
             * @brief Create a model for the given method
             */
            static std::unique_ptr<VaRModel> create(VaRMethod method);

            /**
             * @brief Create a model from a configuration string
             * @param method_name See parse_method
             * @throws std::invalid_argument if the name is not recognized
             */
            static std::unique_ptr<VaRModel> create(const std::string &method_name);

            /**
             * @brief Parse a method name (case-insensitive)
             *
             * Supported values:
             * - "historical" or "historical_simulation"
             * - "variance_covariance", "parametric" or "normal"
             *
             * @throws std::invalid_argument if the name is not recognized
             */
            static VaRMethod parse_method(const std::string &method_name);

            /**
             * @brief Canonical configuration name of a method
             */
            static std::string to_string(VaRMethod method);

            /**
             * @brief Get list of supported method names
             */
            static std::vector<std::string> get_supported_methods();

        private:
            static std::string normalize_name(const std::string &name);
        };

    } // namespace risk
} // namespace riskengine
