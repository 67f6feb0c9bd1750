/**
 * @file covariance_matrix_builder.hpp
 * @brief Pairwise covariance and correlation matrices over an asset universe
 *
 * Builds the N x N sample covariance and correlation matrices by applying
 * the pairwise moment functions of stats/stat_moments.hpp to every (i, j)
 * pair of the universe, in universe order.
 *
 * Formula (per cell):
 *     Cov(i,j)  = sum_t (r_i,t - mean_i)(r_j,t - mean_j) / (n - 1)
 *     Corr(i,j) = Cov(i,j) / (std_i * std_j)
 *
 * Only the upper triangle is evaluated and mirrored. The pairwise formula
 * is symmetric in its arguments, so the mirrored matrix is identical to a
 * full evaluation.
 *
 * Performance: O(N^2 * n)
 */

#pragma once

#include "data/return_series.hpp"

#include <Eigen/Dense>

namespace riskengine
{
    namespace risk
    {

        /**
         * @struct CovarianceResult
         * @brief Covariance and correlation matrices built in one pass.
         */
        struct CovarianceResult
        {
            Eigen::MatrixXd covariance;  ///< N x N sample covariance
            Eigen::MatrixXd correlation; ///< N x N correlation (diagonal ~1.0)
        };

        /**
         * @class CovarianceMatrixBuilder
         * @brief Pairwise sample covariance / correlation estimator
         *
         * Unlike a centred-matrix estimator, every cell is computed from the
         * two series involved, so ragged series are truncated pairwise to the
         * common prefix rather than rejected.
         *
         * Degenerate series are not rejected either: a series with fewer than
         * 2 observations produces NaN cells, and a constant series produces
         * non-finite correlations in its row and column. Correlations are
         * never clamped to [-1, 1].
         *
         * Usage Example:
         * @code
         * CovarianceMatrixBuilder builder;
         * auto result = builder.build(universe);
         * double rho = result.correlation(0, 1);
         * @endcode
         *
         * Thread Safety: Stateless, safe for concurrent use
         */
        class CovarianceMatrixBuilder
        {
        public:
            CovarianceMatrixBuilder() = default;
            ~CovarianceMatrixBuilder() = default;

            /**
             * @brief Sample covariance matrix (n-1 divisor)
             * @param universe Asset universe (N assets)
             * @return N x N matrix, symmetric
             */
            Eigen::MatrixXd covariance(const data::AssetUniverse &universe) const;

            /**
             * @brief Correlation matrix derived cell by cell from covariance
             * @param universe Asset universe (N assets)
             * @return N x N matrix, symmetric
             */
            Eigen::MatrixXd correlation(const data::AssetUniverse &universe) const;

            /**
             * @brief Both matrices in one call
             */
            CovarianceResult build(const data::AssetUniverse &universe) const;

            /**
             * @brief Check symmetry of a matrix within tolerance
             * @return true if |M(i,j) - M(j,i)| <= tolerance for all finite cells
             */
            static bool is_symmetric(const Eigen::MatrixXd &matrix, double tolerance = 1e-12);
        };

    } // namespace risk
} // namespace riskengine
