/**
 * @file test_portfolio_aggregator.cpp
 * @brief Unit tests for weight normalization, portfolio returns and volatility
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "risk/covariance_matrix_builder.hpp"
#include "risk/portfolio_aggregator.hpp"
#include "stats/stat_moments.hpp"

#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

using namespace riskengine;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Weight normalization", "[PortfolioAggregator]")
{
    SECTION("Sums to one")
    {
        auto w = risk::normalize_weights(std::vector<double>{0.4, 0.4, 0.2, 0.0});
        REQUIRE_THAT(w.sum(), WithinAbs(1.0, 1e-9));

        auto v = risk::normalize_weights(std::vector<double>{3.0, 1.0});
        REQUIRE_THAT(v(0), WithinAbs(0.75, 1e-12));
        REQUIRE_THAT(v(1), WithinAbs(0.25, 1e-12));
    }

    SECTION("Already normalized weights are unchanged")
    {
        Eigen::VectorXd raw(3);
        raw << 0.5, 0.3, 0.2;
        auto w = risk::normalize_weights(raw);
        REQUIRE((w - raw).cwiseAbs().maxCoeff() < 1e-15);
    }

    SECTION("All-zero weights pass through unchanged")
    {
        auto w = risk::normalize_weights(std::vector<double>{0.0, 0.0, 0.0});
        REQUIRE(w.size() == 3);
        REQUIRE(w.sum() == 0.0);
    }

    SECTION("Invalid weights are rejected")
    {
        REQUIRE_THROWS_AS(risk::normalize_weights(std::vector<double>{}), std::invalid_argument);
        REQUIRE_THROWS_AS(risk::normalize_weights(std::vector<double>{0.5, -0.1}), std::invalid_argument);
        REQUIRE_THROWS_AS(risk::normalize_weights(std::vector<double>{0.5, std::numeric_limits<double>::quiet_NaN()}),
                          std::invalid_argument);
    }
}

TEST_CASE("Portfolio return series", "[PortfolioAggregator]")
{
    data::AssetUniverse universe({data::ReturnSeries("A", {0.01, 0.02, -0.01}),
                                  data::ReturnSeries("B", {0.03, -0.01, 0.00})});

    SECTION("Weighted sum per day")
    {
        Eigen::VectorXd w(2);
        w << 0.25, 0.75;
        auto p = risk::portfolio_returns(universe, w);
        REQUIRE(p.size() == 3);
        REQUIRE_THAT(p[0], WithinAbs(0.25 * 0.01 + 0.75 * 0.03, 1e-15));
        REQUIRE_THAT(p[1], WithinAbs(0.25 * 0.02 - 0.75 * 0.01, 1e-15));
        REQUIRE_THAT(p[2], WithinAbs(-0.0025, 1e-15));
    }

    SECTION("Ragged universe is truncated to the shortest series")
    {
        data::AssetUniverse ragged({data::ReturnSeries("A", {0.01, 0.02, -0.01}),
                                    data::ReturnSeries("B", {0.03, -0.01})});
        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        auto p = risk::portfolio_returns(ragged, w);
        REQUIRE(p.size() == 2);
        REQUIRE_THAT(p[1], WithinAbs(0.005, 1e-15));
    }

    SECTION("Weight vector must match universe")
    {
        Eigen::VectorXd w(3);
        w << 0.2, 0.3, 0.5;
        REQUIRE_THROWS_AS(risk::portfolio_returns(universe, w), std::invalid_argument);
    }
}

TEST_CASE("Volatility derivations agree", "[PortfolioAggregator]")
{
    // Well-conditioned 4-asset universe, equal weights
    std::mt19937 gen(2024);
    std::normal_distribution<double> market(0.0004, 0.011);
    std::normal_distribution<double> noise(0.0, 0.007);

    std::vector<std::vector<double>> cols(4);
    const double betas[4] = {1.15, 1.2, 0.05, -0.05};
    for (int t = 0; t < 500; ++t)
    {
        double m = market(gen);
        for (int i = 0; i < 4; ++i)
        {
            cols[i].push_back(betas[i] * m + noise(gen));
        }
    }
    data::AssetUniverse universe({data::ReturnSeries("MSFT", cols[0]),
                                  data::ReturnSeries("AAPL", cols[1]),
                                  data::ReturnSeries("GLD", cols[2]),
                                  data::ReturnSeries("AGG", cols[3])});

    auto w = risk::normalize_weights(std::vector<double>{1.0, 1.0, 1.0, 1.0});
    auto p = risk::portfolio_returns(universe, w);
    auto cov = risk::CovarianceMatrixBuilder().covariance(universe);

    double direct = risk::volatility_direct(p);
    double via_matrix = risk::volatility_via_matrix(w, cov);

    REQUIRE(direct > 0.0);
    REQUIRE(std::abs(direct - via_matrix) / direct < 1e-6);

    SECTION("Annualization factor")
    {
        REQUIRE_THAT(direct, WithinRel(stats::std_dev(p) * std::sqrt(252.0), 1e-12));
        REQUIRE_THAT(risk::volatility_direct(p, 12), WithinRel(stats::std_dev(p) * std::sqrt(12.0), 1e-12));
    }

    SECTION("Dimension mismatch")
    {
        Eigen::VectorXd short_w(3);
        short_w << 0.3, 0.3, 0.4;
        REQUIRE_THROWS_AS(risk::volatility_via_matrix(short_w, cov), std::invalid_argument);
    }
}

TEST_CASE("Single asset volatility", "[PortfolioAggregator]")
{
    data::AssetUniverse universe({data::ReturnSeries("ONLY", {0.01, -0.02, 0.015, 0.003})});
    Eigen::VectorXd w(1);
    w << 1.0;

    double sd = stats::std_dev(universe[0].values());
    auto cov = risk::CovarianceMatrixBuilder().covariance(universe);

    REQUIRE_THAT(risk::volatility_direct(risk::portfolio_returns(universe, w)),
                 WithinRel(sd * std::sqrt(252.0), 1e-12));
    REQUIRE_THAT(risk::volatility_via_matrix(w, cov), WithinRel(sd * std::sqrt(252.0), 1e-12));
}
