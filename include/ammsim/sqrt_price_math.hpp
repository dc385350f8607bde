// AMMSim - Sqrt Price Math
// Token amounts between two sqrt prices and price movement for a given input

#pragma once

#include <ammsim/types.hpp>

namespace ammsim::sqrt_price_math {

/// Token0 needed to move between two sqrt prices at constant liquidity:
/// L * 2^96 * (b - a) / (b * a). Argument order does not matter.
U256 amount0_delta(const U256& sqrt_a, const U256& sqrt_b, const U256& liquidity, bool round_up);

/// Token1 needed to move between two sqrt prices: L * (b - a) / 2^96
U256 amount1_delta(const U256& sqrt_a, const U256& sqrt_b, const U256& liquidity, bool round_up);

/// Price after adding amount_in of token0 (price moves down), rounded up
U256 next_sqrt_price_from_amount0(const U256& sqrt_price, const U256& liquidity, const U256& amount_in);

/// Price after adding amount_in of token1 (price moves up), rounded down
U256 next_sqrt_price_from_amount1(const U256& sqrt_price, const U256& liquidity, const U256& amount_in);

/// Dispatches on direction; zero sqrt price or liquidity throws InvalidPoolState
U256 next_sqrt_price_from_input(const U256& sqrt_price, const U256& liquidity,
                                const U256& amount_in, bool zero_for_one);

}  // namespace ammsim::sqrt_price_math
