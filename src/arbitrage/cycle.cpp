// AMMSim - Constant Product Cycle Search Implementation

#include <ammsim/arbitrage/cycle.hpp>
#include <ammsim/arbitrage/gas.hpp>
#include <ammsim/arbitrage/parallel.hpp>
#include <ammsim/log.hpp>
#include <algorithm>
#include <cmath>
#include <map>

namespace ammsim::arbitrage {

using constant_product::StartToken;

namespace {

// Token1 per token0 in human units
double human_price(const ReservePool& pool) {
    return pool.raw_price() * std::pow(10.0, pool.token0.decimals - pool.token1.decimals);
}

LegDiagnostics v2_leg(const ReservePool& pool, bool zero_for_one, const U256& in, const U256& out) {
    LegDiagnostics leg;
    leg.pool_id = pool.pool_id;
    leg.zero_for_one = zero_for_one;
    leg.amount_in = in;
    leg.amount_out = out;
    leg.swap.amount_in_consumed = in;
    leg.swap.stop_reason = StopReason::Filled;
    return leg;
}

struct CycleTask {
    size_t buy;
    size_t sell;
    StartToken start;
    std::string group;
};

}  // namespace

Result<ArbitrageOpportunity> evaluate_cycle_pair(const ReservePool& buy,
                                                 const ReservePool& sell,
                                                 StartToken start,
                                                 const CycleConfig& config,
                                                 const GasConfig& gas) {
    using R = Result<ArbitrageOpportunity>;

    return capture_errors([&]() -> R {
        if (!same_token(buy.token0, sell.token0) || !same_token(buy.token1, sell.token1)) {
            throw TokenMismatch(buy.pool_id + " vs " + sell.pool_id);
        }

        bool from_token0 = start == StartToken::Token0;
        const TokenInfo& start_token = from_token0 ? buy.token0 : buy.token1;
        const TokenInfo& other_token = from_token0 ? buy.token1 : buy.token0;

        ArbitrageOpportunity opp;
        opp.strategy = SearchMode::ConstantProduct;
        opp.direction = constant_product::to_string(start);
        opp.token0 = buy.token0.address;
        opp.token1 = buy.token1.address;
        opp.symbol0 = buy.token0.symbol;
        opp.symbol1 = buy.token1.symbol;
        opp.buy_pool = buy.pool_id;
        opp.sell_pool = sell.pool_id;
        opp.buy_fee = buy.fee_bps;
        opp.sell_fee = sell.fee_bps;
        opp.buy_liquidity = ammsim::to_string(from_token0 ? buy.reserve0 : buy.reserve1);
        opp.sell_liquidity = ammsim::to_string(from_token0 ? sell.reserve0 : sell.reserve1);
        opp.buy_price = human_price(buy);
        opp.sell_price = human_price(sell);
        double low = std::min(opp.buy_price, opp.sell_price);
        opp.spot_spread_bps = low > 0.0 ? std::fabs(opp.sell_price - opp.buy_price) / low * 10000.0 : 0.0;
        opp.fee_bps = static_cast<double>(buy.fee_bps + sell.fee_bps);

        constant_product::ScanResult scan = constant_product::scan_best_cycle(
            buy, sell, start, config.max_fraction_of_reserve, config.steps);
        if (!scan.found) {
            opp.executable = false;
            opp.reason = "no profitable trade size in scan range";
            return R::success(std::move(opp));
        }

        const constant_product::CycleResult& best = scan.best;
        opp.amount_in = best.amount_in;
        opp.intermediate_amount = best.mid_amount;
        opp.amount_out = best.amount_out;
        opp.profit_raw = best.profit;
        opp.legs.push_back(v2_leg(buy, from_token0, best.amount_in, best.mid_amount));
        opp.legs.push_back(v2_leg(sell, !from_token0, best.mid_amount, best.amount_out));

        double in_human = to_human(best.amount_in, start_token.decimals);
        double mid_human = to_human(best.mid_amount, other_token.decimals);
        double out_human = to_human(best.amount_out, start_token.decimals);

        opp.trade_size = in_human;
        opp.profit = out_human - in_human;
        opp.gross_spread_bps = in_human > 0.0 ? opp.profit / in_human * 10000.0 : 0.0;
        opp.net_spread_bps_without_gas = opp.gross_spread_bps;
        opp.net_spread_bps = opp.gross_spread_bps;

        // Effective prices as token1 per token0
        if (from_token0) {
            opp.effective_buy_price = mid_human / in_human;
            opp.effective_sell_price = mid_human / out_human;
        } else {
            opp.effective_buy_price = in_human / mid_human;
            opp.effective_sell_price = out_human / mid_human;
        }

        // Gas expressed in the start token
        double other_per_start = from_token0 ? opp.buy_price
                                             : (opp.buy_price > 0.0 ? 1.0 / opp.buy_price : 0.0);
        opp.gas = estimate_gas(gas, start_token.symbol, other_token.symbol, other_per_start, in_human);
        if (opp.gas.bps && opp.gas.cost_token0) {
            opp.net_spread_bps -= *opp.gas.bps;
            opp.profit_after_gas = opp.profit - *opp.gas.cost_token0;
            opp.profitable_after_gas = *opp.profit_after_gas > 0.0;
        }

        if (best.profit < config.min_profit_raw) {
            opp.profitable_after_gas = false;
            opp.reason = "profit below configured minimum";
        }
        opp.executable = true;
        return R::success(std::move(opp));
    });
}

SearchReport run_constant_product(const std::vector<ReservePool>& pools,
                                  const CycleConfig& config,
                                  const GasConfig& gas,
                                  const RunLimits& limits) {
    SearchReport report;
    report.mode = SearchMode::ConstantProduct;
    report.pool_count = pools.size();

    std::map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < pools.size(); ++i) {
        const ReservePool& pool = pools[i];
        if (pool.token0.empty() || pool.token1.empty()) {
            report.warnings.push_back("pool missing token0/token1: " + pool.pool_id);
            continue;
        }
        if (pool.reserve0.is_zero() || pool.reserve1.is_zero()) {
            report.warnings.push_back("pool has an empty reserve: " + pool.pool_id);
            continue;
        }
        groups[pair_key(pool.token0, pool.token1)].push_back(i);
    }

    std::vector<CycleTask> tasks;
    size_t skipped = 0;
    for (const auto& [key, members] : groups) {
        for (size_t buy : members) {
            for (size_t sell : members) {
                if (buy == sell) continue;
                if (report.pairs_evaluated >= limits.max_pair_evaluations) {
                    skipped++;
                    continue;
                }
                report.pairs_evaluated++;
                tasks.push_back(CycleTask{buy, sell, StartToken::Token0, key});
                tasks.push_back(CycleTask{buy, sell, StartToken::Token1, key});
            }
        }
    }
    if (skipped > 0) {
        report.warnings.push_back("pair budget reached: " + std::to_string(skipped) + " pairs skipped");
    }

    auto results = parallel_map(tasks, limits.worker_threads, [&](const CycleTask& task) {
        return evaluate_cycle_pair(pools[task.buy], pools[task.sell], task.start, config, gas);
    });

    // Best profitable cycle per (group, start token), first found wins ties
    std::map<std::pair<std::string, StartToken>, ArbitrageOpportunity> best;
    for (size_t i = 0; i < results.size(); ++i) {
        auto& result = results[i];
        const CycleTask& task = tasks[i];
        if (!result.ok()) {
            report.warnings.push_back("cycle " + pools[task.buy].pool_id + "/" + pools[task.sell].pool_id +
                                      " failed: " + result.error.message);
            continue;
        }
        if (!result.value.executable) continue;

        auto key = std::make_pair(task.group, task.start);
        auto it = best.find(key);
        if (it == best.end() || result.value.profit_raw > it->second.profit_raw) {
            best[key] = std::move(result.value);
        }
    }

    for (auto& [key, opp] : best) {
        report.opportunities.push_back(std::move(opp));
    }

    rank(report, config.max_results);
    log::debug("constant product: " + std::to_string(report.pairs_evaluated) + " ordered pairs, " +
               std::to_string(report.opportunities.size()) + " profitable cycles");
    return report;
}

}  // namespace ammsim::arbitrage
