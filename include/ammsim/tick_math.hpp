// AMMSim - Tick Math
// Conversions between ticks, Q64.96 sqrt prices and human prices

#pragma once

#include <ammsim/types.hpp>
#include <cstdint>

namespace ammsim::tick_math {

constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;

// sqrt_ratio_at_tick(MIN_TICK) and sqrt_ratio_at_tick(MAX_TICK)
inline const U256 MIN_SQRT_RATIO = U256(4295128739ULL);
inline const U256 MAX_SQRT_RATIO = U256("1461446703485210103287273052203988822378723970342");

/// sqrt(1.0001^tick) * 2^96, bit-exact with the on-chain TickMath library.
/// Throws TickOutOfRange when |tick| > MAX_TICK.
U256 sqrt_ratio_at_tick(int32_t tick);

/// Greatest tick whose sqrt ratio is <= sqrt_price_x96.
/// Throws SqrtPriceOutOfRange outside [MIN_SQRT_RATIO, MAX_SQRT_RATIO).
int32_t tick_at_sqrt_ratio(const U256& sqrt_price_x96);

/// Token1 per token0 in human units: (sqrt^2 / 2^192) * 10^(decimals0 - decimals1)
HighPrecision price_from_sqrt(const U256& sqrt_price_x96, int decimals0, int decimals1);

/// 1.0001^tick * 10^(decimals0 - decimals1)
HighPrecision tick_to_price(int32_t tick, int decimals0, int decimals1);

/// Nearest tick for a raw price (token1 per token0, no decimal scaling).
/// Floating point, for display only. Returns 0 for non-positive prices.
int32_t price_to_tick_approx(double price);

/// Round a tick down to the nearest multiple of tick_spacing
[[nodiscard]] inline int32_t floor_to_spacing(int32_t tick, int32_t tick_spacing) {
    int32_t compressed = tick / tick_spacing;
    if (tick < 0 && tick % tick_spacing != 0) compressed--;
    return compressed * tick_spacing;
}

}  // namespace ammsim::tick_math
