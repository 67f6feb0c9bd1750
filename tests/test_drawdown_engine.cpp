/**
 * @file test_drawdown_engine.cpp
 * @brief Unit tests for NAV compounding and maximum drawdown
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/drawdown_engine.hpp"

#include <random>
#include <vector>

using namespace riskengine::analytics;
using Catch::Matchers::WithinAbs;

TEST_CASE("NAV path", "[Drawdown]")
{
    SECTION("Compounds from 1.0, first value includes first return")
    {
        auto nav = nav_path({0.10, -0.20, 0.05});
        REQUIRE(nav.size() == 3);
        REQUIRE_THAT(nav[0], WithinAbs(1.10, 1e-12));
        REQUIRE_THAT(nav[1], WithinAbs(0.88, 1e-12));
        REQUIRE_THAT(nav[2], WithinAbs(0.924, 1e-12));
    }

    SECTION("Empty returns")
    {
        REQUIRE(nav_path({}).empty());
    }
}

TEST_CASE("Maximum drawdown", "[Drawdown]")
{
    SECTION("Peak to trough")
    {
        // NAV: 1.1, 0.88, 0.924, 1.2012
        auto result = analyze_drawdown({0.10, -0.20, 0.05, 0.30});
        REQUIRE_THAT(result.max_drawdown, WithinAbs(0.2, 1e-12));
        REQUIRE(result.peak_index == 0);
        REQUIRE(result.trough_index == 1);
        REQUIRE(result.underwater_curve.size() == 4);
        REQUIRE_THAT(result.underwater_curve[2], WithinAbs(1.0 - 0.924 / 1.1, 1e-12));
        REQUIRE(result.underwater_curve[3] == 0.0);
    }

    SECTION("Worst of several drawdowns")
    {
        // 10% dip, recovery to a new high, then a 25% dip
        auto result = analyze_drawdown({0.0, -0.10, 0.20, -0.25, 0.05});
        REQUIRE_THAT(result.max_drawdown, WithinAbs(0.25, 1e-12));
        REQUIRE(result.peak_index == 2);
        REQUIRE(result.trough_index == 3);
    }

    SECTION("Monotonic gains have no drawdown")
    {
        auto result = analyze_drawdown({0.01, 0.02, 0.0, 0.03});
        REQUIRE(result.max_drawdown == 0.0);
        REQUIRE(result.peak_index == -1);
        REQUIRE(result.trough_index == -1);
    }

    SECTION("Initial loss is not a drawdown")
    {
        // The first NAV is the first peak
        REQUIRE(max_drawdown({-0.10}) == 0.0);
        REQUIRE_THAT(max_drawdown({-0.10, -0.10}), WithinAbs(0.10, 1e-12));
    }

    SECTION("Empty returns")
    {
        auto result = analyze_drawdown({});
        REQUIRE(result.nav.empty());
        REQUIRE(result.max_drawdown == 0.0);
        REQUIRE(result.peak_index == -1);
    }
}

TEST_CASE("Drawdown is bounded", "[Drawdown]")
{
    std::mt19937 gen(99);
    std::uniform_real_distribution<double> dist(-0.5, 0.5);

    for (int trial = 0; trial < 20; ++trial)
    {
        std::vector<double> returns;
        for (int i = 0; i < 200; ++i)
        {
            returns.push_back(dist(gen));
        }

        double mdd = max_drawdown(returns);
        REQUIRE(mdd >= 0.0);
        REQUIRE(mdd <= 1.0);
    }
}
