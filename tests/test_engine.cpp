// AMMSim - Engine Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <ammsim/arbitrage/engine.hpp>
#include <ammsim/log.hpp>
#include "fixtures.hpp"

using namespace ammsim;
using namespace ammsim::arbitrage;
using namespace ammsim::testing;
using Catch::Approx;

namespace {

MarketSnapshot sample_market() {
    MarketSnapshot market;
    market.states = {deep_pool("cheap", 0), deep_pool("dear", 198)};
    market.reserves = {reserve_pool("v2-a", 1'000'000, 1'000'000), reserve_pool("v2-b", 1'010'000, 990'000)};
    return market;
}

Config quiet_config() {
    Config config;
    config.set_log_level("off");
    return config;
}

}  // namespace

TEST_CASE("Engine mode dispatch", "[engine]") {
    MarketSnapshot market = sample_market();
    Config config = quiet_config();
    config.set_max_fraction_of_reserve(0.01);
    ArbitrageEngine engine{config};

    SECTION("Screen reads pool states") {
        SearchReport report = engine.run(SearchMode::Screen, market);
        REQUIRE(report.mode == SearchMode::Screen);
        REQUIRE(report.opportunities.size() == 1);
        REQUIRE(report.opportunities[0].buy_pool == "cheap");
        REQUIRE(report.opportunities[0].gross_spread_bps == Approx(199.96).margin(0.01));
    }

    SECTION("Screen merges explicit quotes") {
        PoolQuote extra;
        extra.pool_id = "quoted";
        extra.token0 = token_a();
        extra.token1 = token_b();
        extra.fee = fees::FEE_005;
        extra.price = 1.05;
        market.quotes.push_back(extra);

        SearchReport report = engine.run(SearchMode::Screen, market);
        REQUIRE(report.pool_count == 3);
        REQUIRE(report.pairs_evaluated == 3);
        REQUIRE(report.best->sell_pool == "quoted");
    }

    SECTION("Exact") {
        SearchReport report = engine.run(SearchMode::Exact, market);
        REQUIRE(report.mode == SearchMode::Exact);
        REQUIRE(report.best.has_value());
        REQUIRE(report.best->executable);
        REQUIRE(report.best->legs[0].pool_id == "cheap");
        REQUIRE(report.best->profit_raw < 0);
    }

    SECTION("Exact selling first") {
        Config sell_first = config;
        sell_first.set_leg_order(LegOrder::SellFirst);
        ArbitrageEngine sell_engine{sell_first};

        SearchReport report = sell_engine.run(SearchMode::Exact, market);
        REQUIRE(report.best.has_value());
        REQUIRE(report.best->legs[0].pool_id == "dear");
        REQUIRE(report.best->profit_raw > 0);
    }

    SECTION("Constant product") {
        SearchReport report = engine.run(SearchMode::ConstantProduct, market);
        REQUIRE(report.mode == SearchMode::ConstantProduct);
        REQUIRE(report.opportunities.size() == 2);
    }

    SECTION("Configured mode") {
        Config exact = quiet_config();
        exact.set_mode(SearchMode::Exact);
        ArbitrageEngine exact_engine{exact};
        REQUIRE(exact_engine.run(market).mode == SearchMode::Exact);
    }
}

TEST_CASE("Engine limits", "[engine]") {
    MarketSnapshot market = sample_market();
    market.states.push_back(deep_pool("flat", 0));

    Config config = quiet_config();
    config.set_max_pair_evaluations(2).set_worker_threads(0);
    ArbitrageEngine engine{config};

    REQUIRE(engine.config().general.worker_threads == 1);

    SearchReport report = engine.run(SearchMode::Exact, market);
    REQUIRE(report.pairs_evaluated == 2);
    REQUIRE(report.warnings.size() == 1);
}

TEST_CASE("Engine reports loading warnings", "[engine]") {
    MarketSnapshot market = sample_market();
    market.warnings.push_back("skipping states[2] broken: liquidity: expected a decimal string");

    ArbitrageEngine engine{quiet_config()};
    SearchReport report = engine.run(SearchMode::Exact, market);
    REQUIRE(report.pairs_evaluated == 1);
    REQUIRE(report.warnings.size() == 1);
    REQUIRE(report.warnings[0] == market.warnings[0]);
}

TEST_CASE("Engine liquidity analysis", "[engine]") {
    Config config = quiet_config();
    config.set_max_segments(3).set_gap_percentile(0.0);
    ArbitrageEngine engine{config};

    auto profile = engine.profile(nested_pool());
    REQUIRE(profile.size() == 3);

    auto gaps = engine.gaps(nested_pool());
    REQUIRE_FALSE(gaps.empty());
    for (const auto& gap : gaps) {
        REQUIRE(gap.liquidity == I256("1000000000000000000"));
    }

    auto tiers = engine.fee_tiers(sample_market().states);
    REQUIRE(tiers.size() == 1);
}

TEST_CASE("Engine applies the log level", "[engine][log]") {
    Config config;
    config.set_log_level("error");
    ArbitrageEngine engine{config};
    REQUIRE(log::level() == log::Level::Error);

    Config unknown;
    unknown.set_log_level("chatty");
    ArbitrageEngine unchanged{unknown};
    REQUIRE(log::level() == log::Level::Error);

    log::set_level(log::Level::Info);
}
