// AMMSim - Swap Step
// One exact-input swap step within a single liquidity range

#pragma once

#include <ammsim/types.hpp>
#include <cstdint>

namespace ammsim::swap_math {

struct SwapStepResult {
    U256 sqrt_price_next;
    U256 amount_in;
    U256 amount_out;
    U256 fee_amount;

    /// True when the step stopped short of its target price
    bool partial = false;
};

/// amount * (1e6 - fee_ppm) / 1e6, rounded down
U256 amount_less_fee(const U256& amount, uint32_t fee_ppm);

/// Swap amount_remaining (fee inclusive) toward sqrt_price_target.
///
/// Either reaches the target, or consumes all of amount_remaining and stops
/// between the two prices. Amounts owed to the pool round up, amounts paid
/// out round down. For a partial step amount_in + fee_amount == amount_remaining.
///
/// Throws InvalidPoolState for fee_ppm >= 1e6 or zero liquidity, and
/// Exception(INVALID_ARGUMENT) when the target lies on the wrong side of the
/// current price for the given direction.
SwapStepResult compute_swap_step(const U256& sqrt_price,
                                 const U256& sqrt_price_target,
                                 const U256& liquidity,
                                 const U256& amount_remaining,
                                 uint32_t fee_ppm,
                                 bool zero_for_one);

}  // namespace ammsim::swap_math
