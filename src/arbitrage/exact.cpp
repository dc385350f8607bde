// AMMSim - Exact Two-Leg Arbitrage Implementation

#include <ammsim/arbitrage/exact.hpp>
#include <ammsim/arbitrage/gas.hpp>
#include <ammsim/arbitrage/parallel.hpp>
#include <ammsim/log.hpp>
#include <algorithm>
#include <map>
#include <memory>

namespace ammsim::arbitrage {

namespace {

double fee_to_bps(uint32_t fee_ppm) {
    return static_cast<double>(fee_ppm) / 100.0;
}

bool leg_failed(const SwapOutcome& leg) {
    return leg.diagnostics.incomplete || leg.amount_out.is_zero();
}

bool ran_out_of_ticks(const ArbitrageOpportunity& opp) {
    return std::any_of(opp.legs.begin(), opp.legs.end(), [](const LegDiagnostics& leg) {
        return leg.swap.incomplete && leg.swap.stop_reason == StopReason::NoInitializedTick;
    });
}

LegDiagnostics describe_leg(const PoolState& pool, bool zero_for_one, const U256& amount_in,
                            const SwapOutcome& outcome) {
    LegDiagnostics leg;
    leg.pool_id = pool.pool_id;
    leg.zero_for_one = zero_for_one;
    leg.amount_in = amount_in;
    leg.amount_out = outcome.amount_out;
    leg.swap = outcome.diagnostics;
    return leg;
}

struct PairTask {
    size_t a;
    size_t b;
};

}  // namespace

Result<ArbitrageOpportunity> evaluate_exact_pair(const PoolSimulator& a,
                                                 const PoolSimulator& b,
                                                 const ExactConfig& config,
                                                 const GasConfig& gas) {
    using R = Result<ArbitrageOpportunity>;

    return capture_errors([&]() -> R {
        const PoolState& sa = a.state();
        const PoolState& sb = b.state();
        if (!same_token(sa.token0, sb.token0) || !same_token(sa.token1, sb.token1)) {
            throw TokenMismatch(sa.pool_id + " (" + sa.token0.address + "/" + sa.token1.address + ") vs " +
                                sb.pool_id + " (" + sb.token0.address + "/" + sb.token1.address + ")");
        }

        double price_a = a.spot_price().convert_to<double>();
        double price_b = b.spot_price().convert_to<double>();

        const PoolSimulator& buy = price_a <= price_b ? a : b;
        const PoolSimulator& sell = price_a <= price_b ? b : a;
        const PoolState& buy_state = buy.state();
        const PoolState& sell_state = sell.state();
        double low_spot = std::min(price_a, price_b);
        double high_spot = std::max(price_a, price_b);

        ArbitrageOpportunity opp;
        opp.strategy = SearchMode::Exact;
        opp.token0 = buy_state.token0.address;
        opp.token1 = buy_state.token1.address;
        opp.symbol0 = buy_state.token0.symbol;
        opp.symbol1 = buy_state.token1.symbol;
        opp.buy_pool = buy_state.pool_id;
        opp.sell_pool = sell_state.pool_id;
        opp.buy_fee = buy_state.fee;
        opp.sell_fee = sell_state.fee;
        opp.buy_liquidity = ammsim::to_string(buy_state.liquidity);
        opp.sell_liquidity = ammsim::to_string(sell_state.liquidity);
        opp.buy_price = low_spot;
        opp.sell_price = high_spot;
        opp.spot_spread_bps = low_spot > 0.0 ? (high_spot - low_spot) / low_spot * 10000.0 : 0.0;
        opp.fee_bps = fee_to_bps(buy_state.fee) + fee_to_bps(sell_state.fee);
        opp.trade_size = gas.trade_size_token0;

        int decimals0 = buy_state.token0.decimals;
        int decimals1 = buy_state.token1.decimals;

        opp.amount_in = from_human(gas.trade_size_token0, decimals0);
        if (opp.amount_in.is_zero()) {
            return R::failure(errors::INVALID_ARGUMENT,
                              "invalid trade size: " + std::to_string(gas.trade_size_token0));
        }

        const bool buy_first = config.leg_order == LegOrder::BuyFirst;
        const PoolSimulator& first_pool = buy_first ? buy : sell;
        const PoolSimulator& second_pool = buy_first ? sell : buy;

        SwapOutcome first = first_pool.simulate_swap_exact_in(opp.amount_in, true, config.max_tick_crossings);
        opp.legs.push_back(describe_leg(first_pool.state(), true, opp.amount_in, first));
        opp.intermediate_amount = first.amount_out;
        if (leg_failed(first)) {
            opp.executable = false;
            opp.reason = "first leg (token0 -> token1) incomplete or zero output";
            return R::success(std::move(opp));
        }

        SwapOutcome second = second_pool.simulate_swap_exact_in(first.amount_out, false, config.max_tick_crossings);
        opp.legs.push_back(describe_leg(second_pool.state(), false, first.amount_out, second));
        opp.amount_out = second.amount_out;
        if (leg_failed(second)) {
            opp.executable = false;
            opp.reason = "second leg (token1 -> token0) incomplete or zero output";
            return R::success(std::move(opp));
        }

        double in_human = to_human(opp.amount_in, decimals0);
        double mid_human = to_human(opp.intermediate_amount, decimals1);
        double out_human = to_human(opp.amount_out, decimals0);

        opp.profit_raw = I256(opp.amount_out) - I256(opp.amount_in);
        opp.profit = out_human - in_human;
        opp.gross_spread_bps = in_human > 0.0 ? opp.profit / in_human * 10000.0 : 0.0;
        // Both legs as token1 per token0
        std::optional<double> first_price =
            in_human > 0.0 ? std::optional<double>(mid_human / in_human) : std::nullopt;
        std::optional<double> second_price =
            out_human > 0.0 ? std::optional<double>(mid_human / out_human) : std::nullopt;
        opp.effective_buy_price = buy_first ? first_price : second_price;
        opp.effective_sell_price = buy_first ? second_price : first_price;

        // Pool fees are already inside the simulated amounts
        opp.net_spread_bps_without_gas = opp.gross_spread_bps;
        opp.net_spread_bps = opp.gross_spread_bps;

        opp.gas = estimate_gas(gas, opp.symbol0, opp.symbol1, low_spot, in_human);
        if (opp.gas.bps && opp.gas.cost_token0) {
            opp.net_spread_bps -= *opp.gas.bps;
            opp.profit_after_gas = opp.profit - *opp.gas.cost_token0;
            opp.profitable_after_gas = *opp.profit_after_gas > 0.0;
        }

        opp.executable = true;
        return R::success(std::move(opp));
    });
}

Result<ArbitrageOpportunity> evaluate_exact_pair(const PoolState& a,
                                                 const PoolState& b,
                                                 const ExactConfig& config,
                                                 const GasConfig& gas) {
    using R = Result<ArbitrageOpportunity>;
    return capture_errors([&]() -> R {
        PoolSimulator sim_a(std::make_shared<const PoolState>(a));
        PoolSimulator sim_b(std::make_shared<const PoolState>(b));
        return evaluate_exact_pair(sim_a, sim_b, config, gas);
    });
}

Result<ArbitrageOpportunity> evaluate_exact_pair(PoolDataSource& source,
                                                 const std::string& pool_a,
                                                 const std::string& pool_b,
                                                 const ExactConfig& config,
                                                 const GasConfig& gas) {
    using R = Result<ArbitrageOpportunity>;

    TickWindow window = config.window;
    for (uint32_t attempt = 0;; ++attempt) {
        std::optional<PoolState> a = source.snapshot(pool_a, window);
        std::optional<PoolState> b = source.snapshot(pool_b, window);
        if (!a || !b) {
            return R::failure(errors::DATA_UNAVAILABLE,
                              "failed to load snapshot for " + (a ? pool_b : pool_a));
        }

        R result = evaluate_exact_pair(*a, *b, config, gas);
        if (!result.ok() || result.value.executable || attempt >= config.widen_retries ||
            !ran_out_of_ticks(result.value)) {
            return result;
        }

        window = window.widened();
        log::debug("exact: " + pool_a + "/" + pool_b + " ran out of ticks, retrying with " +
                   std::to_string(window.words_each_side) + " words each side");
    }
}

SearchReport run_exact(const std::vector<PoolState>& states,
                       const ExactConfig& config,
                       const GasConfig& gas,
                       const RunLimits& limits) {
    SearchReport report;
    report.mode = SearchMode::Exact;
    report.pool_count = states.size();

    // Validate once per pool; simulators are shared read-only across workers
    std::vector<std::unique_ptr<PoolSimulator>> sims;
    std::map<std::string, std::vector<size_t>> groups;
    for (const auto& state : states) {
        if (state.token0.empty() || state.token1.empty()) {
            report.warnings.push_back("pool missing token0/token1: " + state.pool_id);
            continue;
        }
        try {
            sims.push_back(std::make_unique<PoolSimulator>(std::make_shared<const PoolState>(state)));
        } catch (const InvalidPoolState& e) {
            report.warnings.push_back(std::string("skipping pool: ") + e.what());
            continue;
        }
        groups[pair_key(state.token0, state.token1)].push_back(sims.size() - 1);
    }

    std::vector<PairTask> tasks;
    size_t skipped = 0;
    for (const auto& [key, members] : groups) {
        for (size_t i = 0; i < members.size(); ++i) {
            for (size_t j = i + 1; j < members.size(); ++j) {
                if (tasks.size() >= limits.max_pair_evaluations) {
                    skipped++;
                    continue;
                }
                tasks.push_back(PairTask{members[i], members[j]});
            }
        }
    }
    if (skipped > 0) {
        report.warnings.push_back("pair budget reached: " + std::to_string(skipped) + " pairs skipped");
    }

    auto results = parallel_map(tasks, limits.worker_threads, [&](const PairTask& task) {
        return evaluate_exact_pair(*sims[task.a], *sims[task.b], config, gas);
    });
    report.pairs_evaluated = tasks.size();

    for (size_t i = 0; i < results.size(); ++i) {
        auto& result = results[i];
        if (!result.ok()) {
            report.warnings.push_back("exact pair " + sims[tasks[i].a]->state().pool_id + "/" +
                                      sims[tasks[i].b]->state().pool_id + " failed: " + result.error.message);
            continue;
        }
        report.opportunities.push_back(std::move(result.value));
    }

    rank(report, config.max_results);
    log::debug("exact: " + std::to_string(report.pairs_evaluated) + " pairs, " +
               std::to_string(report.warnings.size()) + " warnings");
    return report;
}

}  // namespace ammsim::arbitrage
