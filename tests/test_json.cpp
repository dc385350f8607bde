// AMMSim - JSON Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <ammsim/arbitrage/exact.hpp>
#include <ammsim/json.hpp>
#include "fixtures.hpp"

using namespace ammsim;
using namespace ammsim::arbitrage;
using namespace ammsim::testing;
using Catch::Approx;
using nlohmann::json;

TEST_CASE("Pool state JSON", "[json]") {
    SECTION("Wide integers are decimal strings") {
        json j = deep_pool("deep", 0);
        REQUIRE(j["pool_id"] == "deep");
        REQUIRE(j["sqrt_price_x96"] == "79228162514264337593543950336");
        REQUIRE(j["liquidity"] == "1000000000000000000000000000");
        REQUIRE(j["ticks"].size() == 2);
        REQUIRE(j["ticks"][0]["tick"] == -6000);
        REQUIRE(j["ticks"][1]["liquidity_net"] == "-1000000000000000000000000000");
        REQUIRE(j["token0"]["symbol"] == "TKA");
    }

    SECTION("Parsed from a document") {
        auto j = json::parse(R"({
            "pool_id": "0xpool",
            "token0": {"address": "0x01", "symbol": "WETH", "decimals": 18},
            "token1": {"address": "0x02", "symbol": "USDC", "decimals": 6},
            "fee": 500,
            "tick_spacing": 10,
            "sqrt_price_x96": "1771595571142957166518320255467520",
            "tick": 200000,
            "liquidity": 12345678901234567890,
            "ticks": [{"tick": 199990, "liquidity_net": "-42"}]
        })");
        PoolState pool = j.get<PoolState>();

        REQUIRE(pool.pool_id == "0xpool");
        REQUIRE(pool.chain == "ethereum");
        REQUIRE(pool.token1.decimals == 6);
        REQUIRE(pool.fee == 500);
        REQUIRE(pool.sqrt_price_x96 == U256("1771595571142957166518320255467520"));
        REQUIRE(pool.liquidity == U256("12345678901234567890"));
        REQUIRE(pool.ticks.size() == 1);
        REQUIRE(pool.ticks.at(199990) == I256(-42));
    }

    SECTION("Lossless round trip") {
        PoolState original = nested_pool();
        PoolState copy = json(original).get<PoolState>();
        REQUIRE(copy.sqrt_price_x96 == original.sqrt_price_x96);
        REQUIRE(copy.liquidity == original.liquidity);
        REQUIRE(copy.ticks == original.ticks);
        REQUIRE(copy.token0.address == original.token0.address);
    }

    SECTION("Missing required field") {
        auto j = json::parse(R"({"pool_id": "x"})");
        REQUIRE_THROWS_AS(j.get<PoolState>(), json::exception);
    }

    SECTION("Bad wide integer") {
        json j = nested_pool();
        j["liquidity"] = "12.5";
        REQUIRE_THROWS_AS(j.get<PoolState>(), Exception);
    }
}

TEST_CASE("Reserve pool and quote JSON", "[json]") {
    SECTION("Reserve pool") {
        json j = reserve_pool("v2", 1'000'000, 2'000'000, 25);
        REQUIRE(j["reserve1"] == "2000000");
        ReservePool pool = j.get<ReservePool>();
        REQUIRE(pool.reserve0 == U256(1'000'000));
        REQUIRE(pool.fee_bps == 25);
    }

    SECTION("Quote with a null price") {
        auto j = json::parse(R"({"pool_id": "q", "price_token1_per_token0": null, "liquidity": 77})");
        PoolQuote quote = j.get<PoolQuote>();
        REQUIRE(quote.price == 0.0);
        REQUIRE(quote.liquidity == "77");
    }
}

TEST_CASE("Report JSON", "[json]") {
    auto result = evaluate_exact_pair(deep_pool("cheap", 0), deep_pool("dear", 198), ExactConfig{}, GasConfig{});
    REQUIRE(result.ok());

    SearchReport report;
    report.mode = SearchMode::Exact;
    report.pool_count = 2;
    report.pairs_evaluated = 1;
    report.opportunities.push_back(result.value);
    report.best = result.value;
    report.warnings.push_back("pool missing token0/token1: x");

    json j = report;
    REQUIRE(j["mode"] == "exact");
    REQUIRE(j["pairs_evaluated"] == 1);
    REQUIRE(j["warnings"].size() == 1);

    const json& opp = j["opportunities"][0];
    REQUIRE(opp["strategy"] == "exact");
    REQUIRE(opp["amount_out"] == "9745028454961080124258");
    REQUIRE(opp["executable"] == true);
    REQUIRE(opp["gas"]["cost_token0"].is_null());
    REQUIRE(opp["legs"].size() == 2);
    REQUIRE(opp["legs"][0]["swap"]["stop_reason"] == "filled");
    REQUIRE(opp["gross_spread_bps"].get<double>() == Approx(-254.97).margin(0.01));
    REQUIRE(j["best"]["buy_pool"] == "cheap");
}

TEST_CASE("Liquidity segment JSON", "[json]") {
    LiquiditySegment segment;
    segment.tick_lower = -60;
    segment.tick_upper = 0;
    segment.liquidity = I256("1500000000000000000");
    segment.price_lower = 0.994;
    segment.price_upper = 1.0;

    json j = segment;
    REQUIRE(j["liquidity"] == "1500000000000000000");
    REQUIRE(j["tick_lower"] == -60);
}

TEST_CASE("Market document", "[json]") {
    SECTION("Bad entries are skipped with a warning") {
        json doc;
        doc["states"] = json::array({json(deep_pool("good", 0)), json(deep_pool("bad", 0)), 42});
        doc["states"][1]["liquidity"] = "not-a-number";
        doc["reserves"] = json::array({json(reserve_pool("v2", 10, 20)), json{{"pool_id", "v2-broken"}}});

        MarketSnapshot market = market_from_json(doc);
        REQUIRE(market.states.size() == 1);
        REQUIRE(market.states[0].pool_id == "good");
        REQUIRE(market.reserves.size() == 1);
        REQUIRE(market.quotes.empty());

        REQUIRE(market.warnings.size() == 3);
        REQUIRE(market.warnings[0].rfind("skipping states[1] bad: ", 0) == 0);
        REQUIRE(market.warnings[0].find("not-a-number") != std::string::npos);
        REQUIRE(market.warnings[1].rfind("skipping states[2]: ", 0) == 0);
        REQUIRE(market.warnings[2].rfind("skipping reserves[1] v2-broken: ", 0) == 0);
    }

    SECTION("Missing sections are empty") {
        MarketSnapshot market = market_from_json(json::object());
        REQUIRE(market.states.empty());
        REQUIRE(market.warnings.empty());
    }

    SECTION("A section that is not an array") {
        REQUIRE_THROWS_AS(market_from_json(json{{"states", "none"}}), Exception);
        REQUIRE_THROWS_AS(market_from_json(json::array()), Exception);
    }
}
