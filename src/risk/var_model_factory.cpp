/**
 * @file var_model_factory.cpp
 * @brief Implementation of VaR model factory
 */

#include "risk/var_model_factory.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace riskengine
{
    namespace risk
    {

        std::string VaRModelFactory::normalize_name(const std::string &name)
        {
            std::string normalized = name;

            // Convert to lowercase, treat '-' like '_'
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return c == '-' ? '_' : static_cast<char>(std::tolower(c)); });
            return normalized;
        }

        VaRMethod VaRModelFactory::parse_method(const std::string &method_name)
        {
            std::string normalized = normalize_name(method_name);

            if (normalized == "historical" || normalized == "historical_simulation")
            {
                return VaRMethod::HISTORICAL;
            }
            else if (normalized == "variance_covariance" || normalized == "parametric" || normalized == "normal")
            {
                return VaRMethod::VARIANCE_COVARIANCE;
            }
            else
            {
                throw std::invalid_argument(
                    "Unknown VaR method: '" + method_name + "'. Valid options: historical, variance_covariance");
            }
        }

        std::string VaRModelFactory::to_string(VaRMethod method)
        {
            switch (method)
            {
            case VaRMethod::HISTORICAL:
                return "historical";
            case VaRMethod::VARIANCE_COVARIANCE:
                return "variance_covariance";
            }
            return "historical";
        }

        std::unique_ptr<VaRModel> VaRModelFactory::create(VaRMethod method)
        {
            if (method == VaRMethod::VARIANCE_COVARIANCE)
            {
                return std::make_unique<VarianceCovarianceVaR>();
            }
            return std::make_unique<HistoricalVaR>();
        }

        std::unique_ptr<VaRModel> VaRModelFactory::create(const std::string &method_name)
        {
            return create(parse_method(method_name));
        }

        std::vector<std::string> VaRModelFactory::get_supported_methods()
        {
            return {
                "historical",
                "historical_simulation",
                "variance_covariance",
                "parametric",
                "normal"};
        }

    } // namespace risk
} // namespace riskengine
