// AMMSim - Arbitrage Engine
// Dispatches a market snapshot to the configured search mode

#pragma once

#include <ammsim/arbitrage/screen.hpp>
#include <ammsim/arbitrage/types.hpp>
#include <ammsim/config.hpp>
#include <ammsim/data_source.hpp>
#include <ammsim/liquidity_profile.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ammsim::arbitrage {

/// Everything one run looks at. Screen mode reads quotes plus a quote derived
/// from every pool state; Exact reads states; ConstantProduct reads reserves.
struct MarketSnapshot {
    std::vector<PoolState> states;
    std::vector<ReservePool> reserves;
    std::vector<PoolQuote> quotes;
    std::vector<std::string> warnings;   // Entries dropped while loading; copied into every report
};

class ArbitrageEngine {
public:
    explicit ArbitrageEngine(Config config = {});

    // Non-copyable
    ArbitrageEngine(const ArbitrageEngine&) = delete;
    ArbitrageEngine& operator=(const ArbitrageEngine&) = delete;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    // Search
    SearchReport run(SearchMode mode, const MarketSnapshot& market) const;
    SearchReport run(const MarketSnapshot& market) const;

    // Single pair against a data source, honouring widen_retries
    Result<ArbitrageOpportunity> evaluate(PoolDataSource& source,
                                          const std::string& pool_a,
                                          const std::string& pool_b) const;

    // Liquidity analysis
    std::vector<LiquiditySegment> profile(const PoolState& state) const;
    std::vector<LiquiditySegment> gaps(const PoolState& state) const;
    std::vector<FeeTierSpread> fee_tiers(const std::vector<PoolState>& states) const;

private:
    SearchReport run_screen(const MarketSnapshot& market) const;

    Config config_;
};

}  // namespace ammsim::arbitrage
