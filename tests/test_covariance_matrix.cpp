/**
 * @file test_covariance_matrix.cpp
 * @brief Unit tests for CovarianceMatrixBuilder
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "risk/covariance_matrix_builder.hpp"
#include "stats/stat_moments.hpp"

#include <cmath>
#include <random>
#include <string>
#include <vector>

using namespace riskengine;
using Catch::Matchers::WithinAbs;

namespace
{
    data::AssetUniverse make_universe(int n_obs, int n_assets, unsigned seed)
    {
        std::mt19937 gen(seed);
        std::normal_distribution<double> market(0.0005, 0.01);
        std::normal_distribution<double> noise(0.0, 0.008);

        std::vector<std::vector<double>> cols(n_assets);
        for (int t = 0; t < n_obs; ++t)
        {
            double m = market(gen);
            for (int i = 0; i < n_assets; ++i)
            {
                cols[i].push_back((0.5 + 0.25 * i) * m + noise(gen));
            }
        }

        std::vector<data::ReturnSeries> series;
        for (int i = 0; i < n_assets; ++i)
        {
            series.emplace_back("A" + std::to_string(i), cols[i]);
        }
        return data::AssetUniverse(series);
    }
}

TEST_CASE("Covariance matrix structure", "[CovarianceMatrix]")
{
    auto universe = make_universe(252, 5, 42);
    risk::CovarianceMatrixBuilder builder;
    auto cov = builder.covariance(universe);

    SECTION("Dimensions")
    {
        REQUIRE(cov.rows() == 5);
        REQUIRE(cov.cols() == 5);
    }

    SECTION("Symmetric")
    {
        REQUIRE(risk::CovarianceMatrixBuilder::is_symmetric(cov));
        for (int i = 0; i < cov.rows(); ++i)
        {
            for (int j = 0; j < cov.cols(); ++j)
            {
                REQUIRE(cov(i, j) == cov(j, i));
            }
        }
    }

    SECTION("Entries match pairwise sample covariance")
    {
        for (int i = 0; i < 5; ++i)
        {
            for (int j = 0; j < 5; ++j)
            {
                double expected = stats::covariance(universe[i].values(), universe[j].values());
                REQUIRE_THAT(cov(i, j), WithinAbs(expected, 1e-15));
            }
        }
    }

    SECTION("Diagonal is variance")
    {
        for (int i = 0; i < 5; ++i)
        {
            double sd = stats::std_dev(universe[i].values());
            REQUIRE_THAT(cov(i, i), WithinAbs(sd * sd, 1e-15));
        }
    }
}

TEST_CASE("Correlation matrix structure", "[CovarianceMatrix]")
{
    auto universe = make_universe(252, 4, 7);
    risk::CovarianceMatrixBuilder builder;
    auto result = builder.build(universe);
    const auto &corr = result.correlation;

    SECTION("Unit diagonal")
    {
        for (int i = 0; i < corr.rows(); ++i)
        {
            REQUIRE_THAT(corr(i, i), WithinAbs(1.0, 1e-12));
        }
    }

    SECTION("Symmetric and bounded")
    {
        REQUIRE(risk::CovarianceMatrixBuilder::is_symmetric(corr));
        for (int i = 0; i < corr.rows(); ++i)
        {
            for (int j = 0; j < corr.cols(); ++j)
            {
                REQUIRE(corr(i, j) <= 1.0 + 1e-12);
                REQUIRE(corr(i, j) >= -1.0 - 1e-12);
            }
        }
    }

    SECTION("Consistent with covariance")
    {
        const auto &cov = result.covariance;
        for (int i = 0; i < corr.rows(); ++i)
        {
            for (int j = 0; j < corr.cols(); ++j)
            {
                double expected = cov(i, j) / std::sqrt(cov(i, i) * cov(j, j));
                REQUIRE_THAT(corr(i, j), WithinAbs(expected, 1e-10));
            }
        }
    }
}

TEST_CASE("Degenerate assets", "[CovarianceMatrix]")
{
    data::AssetUniverse universe({data::ReturnSeries("LIVE", {0.01, -0.02, 0.015, 0.003}),
                                  data::ReturnSeries("FLAT", {0.0, 0.0, 0.0, 0.0})});
    risk::CovarianceMatrixBuilder builder;

    SECTION("Constant series has zero covariance")
    {
        auto cov = builder.covariance(universe);
        REQUIRE(cov(1, 1) == 0.0);
        REQUIRE(cov(0, 1) == 0.0);
    }

    SECTION("Constant series correlation is flagged, not zero")
    {
        auto corr = builder.correlation(universe);
        REQUIRE_THAT(corr(0, 0), WithinAbs(1.0, 1e-12));
        REQUIRE_FALSE(std::isfinite(corr(1, 1)));
        REQUIRE_FALSE(std::isfinite(corr(0, 1)));
    }
}

TEST_CASE("Symmetry check", "[CovarianceMatrix]")
{
    Eigen::MatrixXd m(2, 2);
    m << 1.0, 0.5,
        0.4, 1.0;
    REQUIRE_FALSE(risk::CovarianceMatrixBuilder::is_symmetric(m));
    REQUIRE(risk::CovarianceMatrixBuilder::is_symmetric(m, 0.2));

    Eigen::MatrixXd rect(2, 3);
    rect.setZero();
    REQUIRE_FALSE(risk::CovarianceMatrixBuilder::is_symmetric(rect));
}
