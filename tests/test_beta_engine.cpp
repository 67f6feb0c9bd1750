/**
 * @file test_beta_engine.cpp
 * @brief Unit tests for asset and portfolio beta
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/beta_engine.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace riskengine;
using Catch::Matchers::WithinAbs;

namespace
{
    const std::vector<double> kBenchmark = {0.012, -0.008, 0.004, -0.015, 0.02, 0.001, -0.003};

    std::vector<double> scaled(const std::vector<double> &x, double k)
    {
        std::vector<double> out;
        for (double v : x)
        {
            out.push_back(k * v);
        }
        return out;
    }
}

TEST_CASE("Beta of a single series", "[BetaEngine]")
{
    SECTION("Identical to benchmark")
    {
        REQUIRE_THAT(analytics::beta(kBenchmark, kBenchmark), WithinAbs(1.0, 1e-12));
    }

    SECTION("Scaled benchmark")
    {
        REQUIRE_THAT(analytics::beta(scaled(kBenchmark, 2.0), kBenchmark), WithinAbs(2.0, 1e-12));
        REQUIRE_THAT(analytics::beta(scaled(kBenchmark, -0.5), kBenchmark), WithinAbs(-0.5, 1e-12));
    }

    SECTION("Constant benchmark is undefined")
    {
        std::vector<double> flat(kBenchmark.size(), 0.0);
        REQUIRE_FALSE(std::isfinite(analytics::beta(kBenchmark, flat)));
    }
}

TEST_CASE("BetaEngine over a universe", "[BetaEngine]")
{
    data::AssetUniverse universe({data::ReturnSeries("HIGH", scaled(kBenchmark, 1.5)),
                                  data::ReturnSeries("LOW", scaled(kBenchmark, 0.5)),
                                  data::ReturnSeries("SAME", kBenchmark)});
    data::ReturnSeries benchmark("SPY", kBenchmark);

    analytics::BetaEngine engine(universe, benchmark);

    SECTION("Asset betas in universe order")
    {
        const auto &betas = engine.asset_betas();
        REQUIRE(betas.size() == 3);
        REQUIRE_THAT(betas[0], WithinAbs(1.5, 1e-12));
        REQUIRE_THAT(betas[1], WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(engine.asset_beta(2), WithinAbs(1.0, 1e-12));
        REQUIRE(engine.benchmark_id() == "SPY");
    }

    SECTION("Portfolio beta is the weighted sum")
    {
        Eigen::VectorXd w(3);
        w << 0.2, 0.5, 0.3;
        REQUIRE_THAT(engine.portfolio_beta(w), WithinAbs(0.2 * 1.5 + 0.5 * 0.5 + 0.3 * 1.0, 1e-12));
    }

    SECTION("Errors")
    {
        REQUIRE_THROWS_AS(engine.asset_beta(3), std::out_of_range);

        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        REQUIRE_THROWS_AS(engine.portfolio_beta(w), std::invalid_argument);
    }
}
