// AMMSim - Spot Price Screen Implementation

#include <ammsim/arbitrage/screen.hpp>
#include <ammsim/arbitrage/gas.hpp>
#include <ammsim/log.hpp>
#include <ammsim/tick_math.hpp>
#include <algorithm>
#include <cmath>
#include <map>

namespace ammsim::arbitrage {

namespace {

double fee_to_bps(uint32_t fee_ppm) {
    return static_cast<double>(fee_ppm) / 100.0;
}

ArbitrageOpportunity make_screen_opportunity(const PoolQuote& low, const PoolQuote& high,
                                             const GasConfig& gas_config) {
    ArbitrageOpportunity opp;
    opp.strategy = SearchMode::Screen;
    opp.token0 = low.token0.address;
    opp.token1 = low.token1.address;
    opp.symbol0 = low.token0.symbol;
    opp.symbol1 = low.token1.symbol;
    opp.buy_pool = low.pool_id;
    opp.sell_pool = high.pool_id;
    opp.buy_fee = low.fee;
    opp.sell_fee = high.fee;
    opp.buy_liquidity = low.liquidity;
    opp.sell_liquidity = high.liquidity;
    opp.buy_price = low.price;
    opp.sell_price = high.price;
    opp.trade_size = gas_config.trade_size_token0;

    opp.gross_spread_bps = (high.price - low.price) / low.price * 10000.0;
    opp.spot_spread_bps = opp.gross_spread_bps;
    opp.fee_bps = fee_to_bps(low.fee) + fee_to_bps(high.fee);

    opp.gas = estimate_gas(gas_config, opp.symbol0, opp.symbol1, low.price, opp.trade_size);

    opp.net_spread_bps_without_gas = opp.gross_spread_bps - opp.fee_bps;
    opp.net_spread_bps = opp.net_spread_bps_without_gas;
    opp.profit = opp.trade_size * opp.net_spread_bps_without_gas / 10000.0;
    if (opp.gas.bps) {
        opp.net_spread_bps -= *opp.gas.bps;
        opp.profit_after_gas = opp.profit - opp.gas.cost_token0.value_or(0.0);
        opp.profitable_after_gas = *opp.profit_after_gas > 0.0;
    }

    opp.executable = false;
    opp.reason = "spot-price screen; slippage not simulated";
    return opp;
}

}  // namespace

PoolQuote quote_from_state(const PoolState& state) {
    PoolQuote quote;
    quote.pool_id = state.pool_id;
    quote.token0 = state.token0;
    quote.token1 = state.token1;
    quote.fee = state.fee;
    quote.liquidity = ammsim::to_string(state.liquidity);
    if (!state.sqrt_price_x96.is_zero()) {
        quote.price = tick_math::price_from_sqrt(state.sqrt_price_x96, state.token0.decimals,
                                                 state.token1.decimals).convert_to<double>();
    }
    return quote;
}

SearchReport screen_pools(const std::vector<PoolQuote>& quotes,
                          const ScreenConfig& config,
                          const GasConfig& gas,
                          const RunLimits& limits) {
    SearchReport report;
    report.mode = SearchMode::Screen;
    report.pool_count = quotes.size();

    std::map<std::string, std::vector<const PoolQuote*>> groups;
    for (const auto& quote : quotes) {
        if (quote.token0.empty() || quote.token1.empty()) {
            report.warnings.push_back("pool missing token0/token1: " + quote.pool_id);
            continue;
        }
        if (!std::isfinite(quote.price) || quote.price <= 0.0) {
            report.warnings.push_back("pool missing price_token1_per_token0: " + quote.pool_id);
            continue;
        }
        groups[pair_key(quote.token0, quote.token1)].push_back(&quote);
    }

    size_t skipped = 0;
    for (auto& [key, group] : groups) {
        if (group.size() < 2) continue;

        std::stable_sort(group.begin(), group.end(),
                         [](const PoolQuote* a, const PoolQuote* b) { return a->price < b->price; });

        for (size_t i = 0; i < group.size(); ++i) {
            for (size_t j = i + 1; j < group.size(); ++j) {
                if (report.pairs_evaluated >= limits.max_pair_evaluations) {
                    skipped++;
                    continue;
                }
                report.pairs_evaluated++;

                const PoolQuote& low = *group[i];
                const PoolQuote& high = *group[j];
                if (high.price <= low.price) continue;

                report.opportunities.push_back(make_screen_opportunity(low, high, gas));
            }
        }
    }

    if (skipped > 0) {
        report.warnings.push_back("pair budget reached: " + std::to_string(skipped) + " pairs skipped");
    }

    rank(report, config.max_results);
    log::debug("screen: " + std::to_string(report.pairs_evaluated) + " pairs, " +
               std::to_string(report.opportunities.size()) + " opportunities");
    return report;
}

std::vector<FeeTierSpread> compare_fee_tiers(const std::vector<PoolState>& states) {
    std::map<std::string, std::vector<std::pair<double, const PoolState*>>> groups;
    for (const auto& state : states) {
        if (state.token0.empty() || state.token1.empty()) continue;
        if (state.sqrt_price_x96.is_zero()) continue;
        double mid = tick_math::price_from_sqrt(state.sqrt_price_x96, state.token0.decimals,
                                                state.token1.decimals).convert_to<double>();
        if (!(mid > 0.0)) continue;
        groups[pair_key(state.token0, state.token1)].emplace_back(mid, &state);
    }

    std::vector<FeeTierSpread> out;
    for (auto& [key, mids] : groups) {
        if (mids.size() < 2) continue;
        std::stable_sort(mids.begin(), mids.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });

        const auto& [low_mid, low] = mids.front();
        const auto& [high_mid, high] = mids.back();

        FeeTierSpread spread;
        spread.pair = key;
        spread.low_pool = low->pool_id;
        spread.high_pool = high->pool_id;
        spread.low_fee = low->fee;
        spread.high_fee = high->fee;
        spread.low_mid_price = low_mid;
        spread.high_mid_price = high_mid;
        spread.spread = (high_mid - low_mid) / low_mid;
        out.push_back(spread);
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const FeeTierSpread& a, const FeeTierSpread& b) { return a.spread > b.spread; });
    return out;
}

}  // namespace ammsim::arbitrage
