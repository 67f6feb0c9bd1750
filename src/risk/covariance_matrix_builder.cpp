/**
 * @file covariance_matrix_builder.cpp
 * @brief Implementation of the pairwise covariance / correlation builder
 */

#include "risk/covariance_matrix_builder.hpp"
#include "stats/stat_moments.hpp"

#include <cmath>
#include <functional>

namespace riskengine
{
    namespace risk
    {
        namespace
        {
            using PairwiseStatistic = std::function<double(const std::vector<double> &,
                                                           const std::vector<double> &)>;

            // Evaluate the upper triangle and mirror it
            Eigen::MatrixXd pairwise_matrix(const data::AssetUniverse &universe,
                                            const PairwiseStatistic &statistic)
            {
                const int n = static_cast<int>(universe.size());
                Eigen::MatrixXd result(n, n);

                for (int i = 0; i < n; ++i)
                {
                    for (int j = i; j < n; ++j)
                    {
                        double value = statistic(universe[i].values(), universe[j].values());
                        result(i, j) = value;
                        result(j, i) = value;
                    }
                }

                return result;
            }
        } // namespace

        Eigen::MatrixXd CovarianceMatrixBuilder::covariance(const data::AssetUniverse &universe) const
        {
            return pairwise_matrix(universe, [](const std::vector<double> &a, const std::vector<double> &b)
                                   { return stats::covariance(a, b); });
        }

        Eigen::MatrixXd CovarianceMatrixBuilder::correlation(const data::AssetUniverse &universe) const
        {
            return pairwise_matrix(universe, [](const std::vector<double> &a, const std::vector<double> &b)
                                   { return stats::correlation(a, b); });
        }

        CovarianceResult CovarianceMatrixBuilder::build(const data::AssetUniverse &universe) const
        {
            CovarianceResult result;
            result.covariance = covariance(universe);
            result.correlation = correlation(universe);
            return result;
        }

        bool CovarianceMatrixBuilder::is_symmetric(const Eigen::MatrixXd &matrix, double tolerance)
        {
            if (matrix.rows() != matrix.cols())
            {
                return false;
            }

            for (int i = 0; i < matrix.rows(); ++i)
            {
                for (int j = i + 1; j < matrix.cols(); ++j)
                {
                    double a = matrix(i, j);
                    double b = matrix(j, i);
                    if (std::isfinite(a) && std::isfinite(b))
                    {
                        if (std::abs(a - b) > tolerance)
                        {
                            return false;
                        }
                    }
                    else if (std::isnan(a) != std::isnan(b))
                    {
                        return false;
                    }
                }
            }

            return true;
        }

    } // namespace risk
} // namespace riskengine
