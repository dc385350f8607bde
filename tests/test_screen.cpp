// AMMSim - Spot Price Screen Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <ammsim/arbitrage/gas.hpp>
#include <ammsim/arbitrage/screen.hpp>
#include "fixtures.hpp"

using namespace ammsim;
using namespace ammsim::arbitrage;
using namespace ammsim::testing;
using Catch::Approx;

namespace {

PoolQuote quote(const std::string& id, double price, uint32_t fee = fees::FEE_030) {
    PoolQuote q;
    q.pool_id = id;
    q.token0 = token_a();
    q.token1 = token_b();
    q.fee = fee;
    q.liquidity = "1000";
    q.price = price;
    return q;
}

}  // namespace

TEST_CASE("Screen two quotes", "[screen]") {
    GasConfig gas;
    SearchReport report = screen_pools({quote("high", 101.0), quote("low", 100.0)}, ScreenConfig{}, gas);

    REQUIRE(report.mode == SearchMode::Screen);
    REQUIRE(report.pool_count == 2);
    REQUIRE(report.pairs_evaluated == 1);
    REQUIRE(report.warnings.empty());
    REQUIRE(report.opportunities.size() == 1);

    const ArbitrageOpportunity& opp = report.opportunities[0];
    SECTION("Spread figures") {
        REQUIRE(opp.gross_spread_bps == Approx(100.0));
        REQUIRE(opp.fee_bps == Approx(60.0));
        REQUIRE(opp.net_spread_bps_without_gas == Approx(40.0));
        REQUIRE(opp.net_spread_bps == Approx(40.0));
        REQUIRE(opp.profit == Approx(40.0));
    }

    SECTION("Route") {
        REQUIRE(opp.buy_pool == "low");
        REQUIRE(opp.sell_pool == "high");
        REQUIRE(opp.buy_price == Approx(100.0));
        REQUIRE(opp.sell_price == Approx(101.0));
    }

    SECTION("Not executable without simulation") {
        REQUIRE_FALSE(opp.executable);
        REQUIRE_FALSE(opp.reason.empty());
        REQUIRE_FALSE(opp.gas.bps.has_value());
        REQUIRE(report.best.has_value());
        REQUIRE(report.best->buy_pool == "low");
    }
}

TEST_CASE("Screen warnings", "[screen]") {
    PoolQuote anonymous = quote("anon", 100.0);
    anonymous.token1 = TokenInfo{};
    PoolQuote unpriced = quote("unpriced", 0.0);

    SearchReport report = screen_pools({quote("a", 100.0), anonymous, unpriced}, ScreenConfig{}, GasConfig{});

    REQUIRE(report.pool_count == 3);
    REQUIRE(report.opportunities.empty());
    REQUIRE(report.warnings.size() == 2);
    REQUIRE(report.warnings[0] == "pool missing token0/token1: anon");
    REQUIRE(report.warnings[1] == "pool missing price_token1_per_token0: unpriced");
}

TEST_CASE("Screen ranking and caps", "[screen]") {
    std::vector<PoolQuote> quotes = {quote("p100", 100.0), quote("p101", 101.0), quote("p103", 103.0),
                                     quote("p100b", 100.0)};

    SECTION("Best net spread first") {
        SearchReport report = screen_pools(quotes, ScreenConfig{}, GasConfig{});
        // Five pairs with a positive spread; equal prices are skipped
        REQUIRE(report.pairs_evaluated == 6);
        REQUIRE(report.opportunities.size() == 5);
        REQUIRE(report.opportunities[0].sell_pool == "p103");
        for (size_t i = 1; i < report.opportunities.size(); ++i) {
            REQUIRE(report.opportunities[i - 1].net_spread_bps >= report.opportunities[i].net_spread_bps);
        }
    }

    SECTION("max_results") {
        ScreenConfig config;
        config.max_results = 2;
        SearchReport report = screen_pools(quotes, config, GasConfig{});
        REQUIRE(report.opportunities.size() == 2);
    }

    SECTION("Pair budget") {
        RunLimits limits;
        limits.max_pair_evaluations = 2;
        SearchReport report = screen_pools(quotes, ScreenConfig{}, GasConfig{}, limits);
        REQUIRE(report.pairs_evaluated == 2);
        REQUIRE(report.warnings.size() == 1);
        REQUIRE(report.warnings[0] == "pair budget reached: 4 pairs skipped");
    }
}

TEST_CASE("Gas conversion", "[screen][gas]") {
    GasConfig gas;
    gas.gas_price_wei = U256(30'000'000'000ULL);
    gas.gas_units = 320'000;

    SECTION("Token0 numeraire") {
        GasEstimate estimate = estimate_gas(gas, "WETH", "USDC", 2000.0, 1.0);
        REQUIRE(estimate.cost_wei == U256(9'600'000'000'000'000ULL));
        REQUIRE(estimate.cost_token0.has_value());
        REQUIRE(*estimate.cost_token0 == Approx(0.0096));
        REQUIRE(*estimate.bps == Approx(96.0));
    }

    SECTION("Token1 numeraire is converted through the price") {
        GasEstimate estimate = estimate_gas(gas, "USDC", "weth", 0.0005, 2000.0);
        REQUIRE(*estimate.cost_token0 == Approx(19.2));
        REQUIRE(*estimate.bps == Approx(96.0));
    }

    SECTION("Token1 numeraire without a price") {
        GasEstimate estimate = estimate_gas(gas, "USDC", "ETH", 0.0, 2000.0);
        REQUIRE_FALSE(estimate.cost_token0.has_value());
        REQUIRE_FALSE(estimate.note.empty());
    }

    SECTION("No numeraire") {
        GasEstimate estimate = estimate_gas(gas, "TKA", "TKB", 1.0, 1.0);
        REQUIRE_FALSE(estimate.cost_token0.has_value());
        REQUIRE_FALSE(estimate.bps.has_value());
    }

    SECTION("Screen subtracts gas") {
        PoolQuote low = quote("low", 100.0);
        PoolQuote high = quote("high", 101.0);
        low.token0.symbol = high.token0.symbol = "WETH";
        gas.trade_size_token0 = 1.0;

        SearchReport report = screen_pools({low, high}, ScreenConfig{}, gas);
        const ArbitrageOpportunity& opp = report.opportunities.at(0);
        REQUIRE(opp.net_spread_bps_without_gas == Approx(40.0));
        REQUIRE(opp.net_spread_bps == Approx(-56.0));
        REQUIRE(opp.profitable_after_gas == false);
    }
}

TEST_CASE("Fee tier comparison", "[screen]") {
    PoolState cheap = deep_pool("tier-500", 0);
    cheap.fee = fees::FEE_005;
    PoolState dear = deep_pool("tier-3000", 198);
    PoolState middle = deep_pool("tier-10000", 100);
    middle.fee = fees::FEE_100;

    auto spreads = compare_fee_tiers({dear, cheap, middle});
    REQUIRE(spreads.size() == 1);
    REQUIRE(spreads[0].low_pool == "tier-500");
    REQUIRE(spreads[0].high_pool == "tier-3000");
    REQUIRE(spreads[0].low_fee == fees::FEE_005);
    REQUIRE(spreads[0].spread == Approx(0.0199963).epsilon(1e-5));
}

TEST_CASE("Quote from a pool state", "[screen]") {
    PoolQuote q = quote_from_state(deep_pool("deep", 0));
    REQUIRE(q.pool_id == "deep");
    REQUIRE(q.price == Approx(1.0));
    REQUIRE(q.liquidity == "1000000000000000000000000000");
    REQUIRE(q.fee == fees::FEE_030);
}
