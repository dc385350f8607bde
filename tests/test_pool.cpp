// AMMSim - Pool Simulator Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <ammsim/pool.hpp>
#include "fixtures.hpp"

using namespace ammsim;
using namespace ammsim::testing;
using Catch::Approx;

namespace {

PoolSimulator simulator(PoolState state) {
    return PoolSimulator(std::make_shared<const PoolState>(std::move(state)));
}

}  // namespace

TEST_CASE("Pool validation", "[pool]") {
    SECTION("Well-formed snapshot") {
        REQUIRE_NOTHROW(validate(nested_pool()));
    }

    SECTION("Zero sqrt price") {
        PoolState pool = nested_pool();
        pool.sqrt_price_x96 = 0;
        REQUIRE_THROWS_AS(validate(pool), InvalidPoolState);
    }

    SECTION("Zero liquidity") {
        PoolState pool = nested_pool();
        pool.liquidity = 0;
        REQUIRE_THROWS_AS(simulator(pool), InvalidPoolState);
    }

    SECTION("Fee of 100%") {
        PoolState pool = nested_pool();
        pool.fee = FEE_DENOMINATOR;
        REQUIRE_THROWS_AS(validate(pool), InvalidPoolState);
    }

    SECTION("Non-positive tick spacing") {
        PoolState pool = nested_pool();
        pool.tick_spacing = 0;
        REQUIRE_THROWS_AS(validate(pool), InvalidPoolState);
    }

    SECTION("Initialized tick outside the tick range") {
        PoolState pool = nested_pool();
        pool.ticks[tick_math::MAX_TICK + 60] = I256(1);
        REQUIRE_THROWS_AS(validate(pool), InvalidPoolState);
    }

    SECTION("Error code") {
        PoolState pool = nested_pool();
        pool.liquidity = 0;
        try {
            validate(pool);
            FAIL("expected InvalidPoolState");
        } catch (const Exception& e) {
            REQUIRE(e.code() == errors::INVALID_POOL_STATE);
        }
    }
}

TEST_CASE("next_initialized_tick", "[pool]") {
    PoolSimulator sim = simulator(nested_pool());

    SECTION("Downward includes the current tick") {
        REQUIRE(sim.next_initialized_tick(0, true) == -60);
        REQUIRE(sim.next_initialized_tick(-60, true) == -60);
        REQUIRE(sim.next_initialized_tick(-61, true) == -600);
        REQUIRE_FALSE(sim.next_initialized_tick(-601, true).has_value());
    }

    SECTION("Upward is strictly above") {
        REQUIRE(sim.next_initialized_tick(0, false) == 60);
        REQUIRE(sim.next_initialized_tick(60, false) == 600);
        REQUIRE_FALSE(sim.next_initialized_tick(600, false).has_value());
    }
}

TEST_CASE("Swap exact input", "[pool]") {
    PoolSimulator sim = simulator(nested_pool());
    const U256 outer("1000000000000000000");

    SECTION("Within one range") {
        SwapOutcome out = sim.simulate_swap_exact_in(U256(1'000'000'000), true);
        REQUIRE(out.amount_out == U256(996'999'999));
        REQUIRE_FALSE(out.diagnostics.incomplete);
        REQUIRE(out.diagnostics.stop_reason == StopReason::Filled);
        REQUIRE(out.diagnostics.ticks_crossed == 0);
        REQUIRE(out.diagnostics.amount_in_left == 0);
        REQUIRE(out.diagnostics.amount_in_consumed == U256(1'000'000'000));
    }

    SECTION("Crossing applies the stored delta downward") {
        SwapOutcome out = sim.simulate_swap_exact_in(U256("10000000000000000"), true);
        REQUIRE_FALSE(out.diagnostics.incomplete);
        REQUIRE(out.diagnostics.ticks_crossed == 1);
        REQUIRE(out.diagnostics.final_liquidity == I256(outer));
        REQUIRE(out.diagnostics.final_tick == -169);
        REQUIRE(out.amount_out == U256("9894398499457380"));
    }

    SECTION("Crossing applies the stored delta upward") {
        SwapOutcome out = sim.simulate_swap_exact_in(U256("10000000000000000"), false);
        REQUIRE_FALSE(out.diagnostics.incomplete);
        REQUIRE(out.diagnostics.ticks_crossed == 1);
        REQUIRE(out.diagnostics.final_liquidity == I256(outer));
        REQUIRE(out.diagnostics.final_tick == 168);
    }

    SECTION("Starting on an initialized tick crosses it first") {
        PoolState state = nested_pool();
        state.tick = -60;
        state.sqrt_price_x96 = tick_math::sqrt_ratio_at_tick(-60);
        PoolSimulator on_boundary = simulator(state);

        SwapOutcome out = on_boundary.simulate_swap_exact_in(U256(1'000'000'000'000), true);
        REQUIRE_FALSE(out.diagnostics.incomplete);
        REQUIRE(out.diagnostics.stop_reason == StopReason::Filled);
        REQUIRE(out.diagnostics.ticks_crossed == 1);
        REQUIRE(out.diagnostics.final_liquidity == I256(outer));
        REQUIRE(out.diagnostics.final_tick == -61);
        REQUIRE(out.amount_out == U256(991'035'222'350));
    }

    SECTION("Crossing limit") {
        SwapOutcome out = sim.simulate_swap_exact_in(U256("10000000000000000"), true, 0);
        REQUIRE(out.diagnostics.incomplete);
        REQUIRE(out.diagnostics.stop_reason == StopReason::CrossingLimit);
        REQUIRE(out.diagnostics.ticks_crossed == 0);
        REQUIRE(out.diagnostics.final_tick == -61);
        REQUIRE(out.diagnostics.final_sqrt_price_x96 == tick_math::sqrt_ratio_at_tick(-60));
        REQUIRE(out.diagnostics.amount_in_left > 0);
    }

    SECTION("Liquidity runs out") {
        SwapOutcome out = sim.simulate_swap_exact_in(U256("100000000000000000000"), true);
        REQUIRE(out.diagnostics.incomplete);
        REQUIRE(out.diagnostics.stop_reason == StopReason::LiquidityExhausted);
        REQUIRE(out.diagnostics.ticks_crossed == 2);
        REQUIRE(out.diagnostics.final_liquidity == 0);
        REQUIRE(out.amount_out == U256("31050688357092559"));
    }

    SECTION("Output is non-decreasing in input") {
        const char* amounts[] = {"1000000000", "1000000000000", "100000000000000", "1000000000000000",
                                 "4000000000000000", "10000000000000000", "20000000000000000"};
        U256 previous = 0;
        for (const char* amount : amounts) {
            SwapOutcome out = sim.simulate_swap_exact_in(U256(amount), true);
            REQUIRE(out.amount_out >= previous);
            previous = out.amount_out;
        }
    }

    SECTION("Zero input") {
        SwapOutcome out = sim.simulate_swap_exact_in(U256(0), true);
        REQUIRE(out.amount_out == 0);
        REQUIRE_FALSE(out.diagnostics.incomplete);
        REQUIRE(out.diagnostics.final_sqrt_price_x96 == Q96);
    }

    SECTION("Snapshot is not mutated") {
        sim.simulate_swap_exact_in(U256("100000000000000000000"), true);
        REQUIRE(sim.state().liquidity == U256("1500000000000000000"));
        REQUIRE(sim.state().sqrt_price_x96 == Q96);
    }
}

TEST_CASE("Incomplete snapshots", "[pool]") {
    SECTION("No initialized ticks") {
        PoolState pool = nested_pool();
        pool.ticks.clear();
        SwapOutcome out = simulator(pool).simulate_swap_exact_in(U256(1'000'000), true);
        REQUIRE(out.amount_out == 0);
        REQUIRE(out.diagnostics.incomplete);
        REQUIRE(out.diagnostics.stop_reason == StopReason::NoInitializedTick);
        REQUIRE(out.diagnostics.amount_in_left == U256(1'000'000));
    }

    SECTION("Tick field disagrees with the price") {
        PoolState pool = nested_pool();
        pool.tick = 100;
        SwapOutcome out = simulator(pool).simulate_swap_exact_in(U256(1'000'000), true);
        REQUIRE(out.diagnostics.incomplete);
        REQUIRE(out.diagnostics.stop_reason == StopReason::TickAlreadyPassed);
    }
}

TEST_CASE("Spot price and in-range estimate", "[pool]") {
    PoolSimulator sim = simulator(nested_pool());

    REQUIRE(sim.spot_price().convert_to<double>() == Approx(1.0));

    InRangeEstimate estimate = sim.estimate_in_range(U256(1'000'000'000), true);
    REQUIRE(estimate.sqrt_price_before == Approx(1.0));
    REQUIRE(estimate.sqrt_price_after < 1.0);
    REQUIRE(estimate.price_impact < 0.0);
    // Same range, so the exact simulation agrees to within rounding
    REQUIRE(to_double(estimate.amount_out) == Approx(996'999'999.0).epsilon(1e-6));
}
