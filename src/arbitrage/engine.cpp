// AMMSim - Arbitrage Engine Implementation

#include <ammsim/arbitrage/engine.hpp>
#include <ammsim/arbitrage/cycle.hpp>
#include <ammsim/arbitrage/exact.hpp>
#include <ammsim/log.hpp>

namespace ammsim::arbitrage {

ArbitrageEngine::ArbitrageEngine(Config config)
    : config_(std::move(config)) {
    if (auto level = log::parse_level(config_.general.log_level)) {
        log::set_level(*level);
    } else {
        log::warn("unknown log level '" + config_.general.log_level + "', keeping " +
                  log::to_string(log::level()));
    }
    if (config_.general.worker_threads == 0) {
        config_.general.worker_threads = 1;
    }
}

SearchReport ArbitrageEngine::run(SearchMode mode, const MarketSnapshot& market) const {
    log::info(std::string("running ") + to_string(mode) + " search");

    SearchReport report;
    switch (mode) {
        case SearchMode::Screen:
            report = run_screen(market);
            break;
        case SearchMode::Exact:
            report = run_exact(market.states, config_.exact, config_.gas, config_.limits());
            break;
        case SearchMode::ConstantProduct:
            report = run_constant_product(market.reserves, config_.cycle, config_.gas, config_.limits());
            break;
    }
    report.warnings.insert(report.warnings.begin(), market.warnings.begin(), market.warnings.end());

    for (const auto& warning : report.warnings) {
        log::warn(warning);
    }
    log::info(std::string(to_string(mode)) + ": " + std::to_string(report.pool_count) + " pools, " +
              std::to_string(report.pairs_evaluated) + " pairs, " +
              std::to_string(report.opportunities.size()) + " opportunities");
    return report;
}

SearchReport ArbitrageEngine::run(const MarketSnapshot& market) const {
    return run(config_.general.mode, market);
}

SearchReport ArbitrageEngine::run_screen(const MarketSnapshot& market) const {
    std::vector<PoolQuote> quotes = market.quotes;
    std::vector<std::string> warnings;
    quotes.reserve(quotes.size() + market.states.size());
    for (const auto& state : market.states) {
        try {
            quotes.push_back(quote_from_state(state));
        } catch (const Exception& e) {
            warnings.push_back("skipping pool " + state.pool_id + ": " + e.what());
        }
    }

    SearchReport report = screen_pools(quotes, config_.screen, config_.gas, config_.limits());
    report.warnings.insert(report.warnings.begin(), warnings.begin(), warnings.end());
    return report;
}

Result<ArbitrageOpportunity> ArbitrageEngine::evaluate(PoolDataSource& source,
                                                       const std::string& pool_a,
                                                       const std::string& pool_b) const {
    return evaluate_exact_pair(source, pool_a, pool_b, config_.exact, config_.gas);
}

std::vector<LiquiditySegment> ArbitrageEngine::profile(const PoolState& state) const {
    return build_profile(state, config_.profile.max_segments);
}

std::vector<LiquiditySegment> ArbitrageEngine::gaps(const PoolState& state) const {
    return detect_gaps(profile(state), config_.profile.gap_percentile, config_.profile.min_liquidity);
}

std::vector<FeeTierSpread> ArbitrageEngine::fee_tiers(const std::vector<PoolState>& states) const {
    return compare_fee_tiers(states);
}

}  // namespace ammsim::arbitrage
