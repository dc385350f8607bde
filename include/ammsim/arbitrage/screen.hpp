// AMMSim - Spot Price Screen
// Fast pass over many pools: compares spot prices only, ignores slippage

#pragma once

#include <ammsim/arbitrage/types.hpp>
#include <string>
#include <vector>

namespace ammsim::arbitrage {

/// Minimal per-pool record for screening
struct PoolQuote {
    std::string pool_id;
    TokenInfo token0;
    TokenInfo token1;
    uint32_t fee = 0;            // ppm
    std::string liquidity;       // Reported only
    double price = 0.0;          // Token1 per token0, human units
};

PoolQuote quote_from_state(const PoolState& state);

/// Group by (token0, token1), compare every pair in each group.
/// gross = (high - low) / low, fees = sum of both pool fees, gas converted
/// into token0 when possible. Ranked by net bps, capped at max_results;
/// malformed quotes become warnings.
SearchReport screen_pools(const std::vector<PoolQuote>& quotes,
                          const ScreenConfig& config,
                          const GasConfig& gas,
                          const RunLimits& limits = RunLimits{});

/// Mid-price spread between the cheapest and dearest fee tier of one pair
struct FeeTierSpread {
    std::string pair;
    std::string low_pool;
    std::string high_pool;
    uint32_t low_fee = 0;
    uint32_t high_fee = 0;
    double low_mid_price = 0.0;
    double high_mid_price = 0.0;
    double spread = 0.0;         // Relative
};

std::vector<FeeTierSpread> compare_fee_tiers(const std::vector<PoolState>& states);

}  // namespace ammsim::arbitrage
