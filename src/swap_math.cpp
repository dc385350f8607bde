// AMMSim - Swap Step Implementation

#include <ammsim/swap_math.hpp>
#include <ammsim/full_math.hpp>
#include <ammsim/sqrt_price_math.hpp>

namespace ammsim::swap_math {

using sqrt_price_math::amount0_delta;
using sqrt_price_math::amount1_delta;

U256 amount_less_fee(const U256& amount, uint32_t fee_ppm) {
    if (fee_ppm >= FEE_DENOMINATOR) {
        throw InvalidPoolState("fee " + std::to_string(fee_ppm) + " ppm >= 100%");
    }
    return full_math::mul_div(amount, U256(FEE_DENOMINATOR - fee_ppm), U256(FEE_DENOMINATOR));
}

SwapStepResult compute_swap_step(const U256& sqrt_price,
                                 const U256& sqrt_price_target,
                                 const U256& liquidity,
                                 const U256& amount_remaining,
                                 uint32_t fee_ppm,
                                 bool zero_for_one) {
    if (liquidity.is_zero()) {
        throw InvalidPoolState("zero liquidity in swap step");
    }
    if (zero_for_one ? sqrt_price_target > sqrt_price : sqrt_price_target < sqrt_price) {
        throw Exception(errors::INVALID_ARGUMENT, "swap target on the wrong side of the current price");
    }

    SwapStepResult step;
    U256 remaining_less_fee = amount_less_fee(amount_remaining, fee_ppm);

    U256 max_in = zero_for_one
        ? amount0_delta(sqrt_price_target, sqrt_price, liquidity, true)
        : amount1_delta(sqrt_price, sqrt_price_target, liquidity, true);

    if (remaining_less_fee >= max_in) {
        step.sqrt_price_next = sqrt_price_target;
    } else {
        step.sqrt_price_next = sqrt_price_math::next_sqrt_price_from_input(
            sqrt_price, liquidity, remaining_less_fee, zero_for_one);
    }

    bool reached_target = step.sqrt_price_next == sqrt_price_target;

    if (zero_for_one) {
        step.amount_in = reached_target
            ? max_in
            : amount0_delta(step.sqrt_price_next, sqrt_price, liquidity, true);
        step.amount_out = amount1_delta(step.sqrt_price_next, sqrt_price, liquidity, false);
    } else {
        step.amount_in = reached_target
            ? max_in
            : amount1_delta(sqrt_price, step.sqrt_price_next, liquidity, true);
        step.amount_out = amount0_delta(sqrt_price, step.sqrt_price_next, liquidity, false);
    }

    if (!reached_target) {
        // Whatever the price move did not absorb is kept as fee
        step.fee_amount = amount_remaining - step.amount_in;
        step.partial = true;
    } else {
        step.fee_amount = full_math::mul_div_rounding_up(
            step.amount_in, U256(fee_ppm), U256(FEE_DENOMINATOR - fee_ppm));
    }

    return step;
}

}  // namespace ammsim::swap_math
