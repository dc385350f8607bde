// AMMSim - Liquidity Profile Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <ammsim/liquidity_profile.hpp>
#include "fixtures.hpp"

using namespace ammsim;
using namespace ammsim::testing;
using Catch::Approx;

namespace {

const I256 INNER("1500000000000000000");
const I256 OUTER("1000000000000000000");

}  // namespace

TEST_CASE("Build profile", "[liquidity]") {
    PoolState pool = nested_pool();

    SECTION("Segments on both sides, sorted") {
        auto profile = build_profile(pool);
        REQUIRE(profile.size() == 4);

        REQUIRE(profile[0].tick_lower == -600);
        REQUIRE(profile[0].tick_upper == -60);
        REQUIRE(profile[0].liquidity == OUTER);

        REQUIRE(profile[1].tick_lower == -60);
        REQUIRE(profile[1].tick_upper == 0);
        REQUIRE(profile[1].liquidity == INNER);

        REQUIRE(profile[2].tick_lower == 0);
        REQUIRE(profile[2].tick_upper == 60);
        REQUIRE(profile[2].liquidity == INNER);

        REQUIRE(profile[3].tick_lower == 60);
        REQUIRE(profile[3].tick_upper == 600);
        REQUIRE(profile[3].liquidity == OUTER);
    }

    SECTION("Human prices at the boundaries") {
        auto profile = build_profile(pool);
        REQUIRE(profile[2].price_lower == Approx(1.0));
        REQUIRE(profile[2].price_upper == Approx(1.006017).epsilon(1e-6));
    }

    SECTION("Segment cap fills the upward side first") {
        auto profile = build_profile(pool, 2);
        REQUIRE(profile.size() == 2);
        REQUIRE(profile[0].tick_lower == 0);
        REQUIRE(profile[1].tick_lower == 60);
    }

    SECTION("Current tick on an initialized boundary") {
        pool.tick = -60;
        pool.sqrt_price_x96 = tick_math::sqrt_ratio_at_tick(-60);

        auto profile = build_profile(pool);
        REQUIRE(profile.size() == 3);

        // No zero-width segment, and the boundary still moves liquidity
        REQUIRE(profile[0].tick_lower == -600);
        REQUIRE(profile[0].tick_upper == -60);
        REQUIRE(profile[0].liquidity == OUTER);
        REQUIRE(profile[1].tick_lower == -60);
        REQUIRE(profile[1].tick_upper == 60);
        REQUIRE(profile[1].liquidity == INNER);
    }

    SECTION("Nothing to walk") {
        pool.ticks.clear();
        REQUIRE(build_profile(pool).empty());

        REQUIRE(build_profile(0, 0, U256(1), nested_pool().ticks, 18, 18).empty());
    }
}

TEST_CASE("Detect gaps", "[liquidity]") {
    auto profile = build_profile(nested_pool());

    SECTION("Percentile threshold") {
        auto gaps = detect_gaps(profile, 0.1);
        REQUIRE(gaps.size() == 2);
        for (const auto& gap : gaps) {
            REQUIRE(gap.liquidity == OUTER);
        }
    }

    SECTION("Explicit minimum") {
        REQUIRE(detect_gaps(profile, 0.1, I256("1200000000000000000")).size() == 2);
        REQUIRE(detect_gaps(profile, 0.1, I256("2000000000000000000")).size() == 4);
        REQUIRE(detect_gaps(profile, 0.1, I256(0)).empty());
    }

    SECTION("Percentile above one is clamped") {
        REQUIRE(detect_gaps(profile, 5.0).size() == 4);
    }

    SECTION("Empty profile") {
        REQUIRE(detect_gaps({}).empty());
    }
}
