// AMMSim - Liquidity Profile
// Piecewise-constant active liquidity around the current tick, and thin-range detection

#pragma once

#include <ammsim/types.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace ammsim {

struct PoolState;

struct LiquiditySegment {
    int32_t tick_lower = 0;
    int32_t tick_upper = 0;
    I256 liquidity;
    double price_lower = 0.0;   // Token1 per token0, human units
    double price_upper = 0.0;
};

constexpr size_t DEFAULT_MAX_SEGMENTS = 300;
constexpr double DEFAULT_GAP_PERCENTILE = 0.1;

/// Walk the initialized ticks outward from current_tick. Upward segments are
/// [last, t) followed by L += net; downward segments are [t, last) followed by
/// L -= net. At most max_segments in total, upward side first; the result is
/// sorted by tick_lower. Empty for tick_spacing <= 0 or no ticks.
std::vector<LiquiditySegment> build_profile(int32_t current_tick,
                                            int32_t tick_spacing,
                                            const U256& current_liquidity,
                                            const std::map<int32_t, I256>& ticks,
                                            int decimals0,
                                            int decimals1,
                                            size_t max_segments = DEFAULT_MAX_SEGMENTS);

std::vector<LiquiditySegment> build_profile(const PoolState& state,
                                            size_t max_segments = DEFAULT_MAX_SEGMENTS);

/// Segments whose liquidity is at or below a threshold. The threshold is
/// min_liquidity when given, otherwise the liquidity found at index
/// floor(n * percentile) (clamped to [0, n-1]) of the sorted liquidities.
std::vector<LiquiditySegment> detect_gaps(const std::vector<LiquiditySegment>& profile,
                                          double percentile = DEFAULT_GAP_PERCENTILE,
                                          std::optional<I256> min_liquidity = std::nullopt);

}  // namespace ammsim
