// AMMSim - Sqrt Price Math Implementation

#include <ammsim/sqrt_price_math.hpp>
#include <ammsim/full_math.hpp>

namespace ammsim::sqrt_price_math {

namespace {

const U512& max_u256_wide() {
    static const U512 value = (U512(1) << 256) - 1;
    return value;
}

const U256& max_u160() {
    static const U256 value = (U256(1) << 160) - 1;
    return value;
}

}  // namespace

U256 amount0_delta(const U256& sqrt_a, const U256& sqrt_b, const U256& liquidity, bool round_up) {
    const U256& lower = sqrt_a < sqrt_b ? sqrt_a : sqrt_b;
    const U256& upper = sqrt_a < sqrt_b ? sqrt_b : sqrt_a;
    if (lower.is_zero()) {
        throw InvalidPoolState("zero sqrt price");
    }

    U256 numerator1 = liquidity << 96;
    U256 numerator2 = upper - lower;

    if (round_up) {
        return full_math::div_rounding_up(
            full_math::mul_div_rounding_up(numerator1, numerator2, upper), lower);
    }
    return full_math::mul_div(numerator1, numerator2, upper) / lower;
}

U256 amount1_delta(const U256& sqrt_a, const U256& sqrt_b, const U256& liquidity, bool round_up) {
    const U256& lower = sqrt_a < sqrt_b ? sqrt_a : sqrt_b;
    const U256& upper = sqrt_a < sqrt_b ? sqrt_b : sqrt_a;
    U256 diff = upper - lower;

    return round_up
        ? full_math::mul_div_rounding_up(liquidity, diff, Q96)
        : full_math::mul_div(liquidity, diff, Q96);
}

U256 next_sqrt_price_from_amount0(const U256& sqrt_price, const U256& liquidity, const U256& amount_in) {
    if (amount_in.is_zero()) {
        return sqrt_price;
    }
    U256 numerator1 = liquidity << 96;

    U512 product = U512(amount_in) * U512(sqrt_price);
    U512 denominator = U512(numerator1) + product;
    if (denominator <= max_u256_wide()) {
        return full_math::mul_div_rounding_up(numerator1, sqrt_price, static_cast<U256>(denominator));
    }

    // amount * price overflows 256 bits; the reduced form loses a little precision
    U512 alt = U512(numerator1 / sqrt_price) + U512(amount_in);
    if (alt > max_u256_wide()) {
        throw MathOverflow("next_sqrt_price_from_amount0");
    }
    return full_math::div_rounding_up(numerator1, static_cast<U256>(alt));
}

U256 next_sqrt_price_from_amount1(const U256& sqrt_price, const U256& liquidity, const U256& amount_in) {
    U256 quotient = full_math::mul_div(amount_in, Q96, liquidity);
    U512 next = U512(sqrt_price) + U512(quotient);
    if (next > U512(max_u160())) {
        throw MathOverflow("next_sqrt_price_from_amount1");
    }
    return static_cast<U256>(next);
}

U256 next_sqrt_price_from_input(const U256& sqrt_price, const U256& liquidity,
                                const U256& amount_in, bool zero_for_one) {
    if (sqrt_price.is_zero()) {
        throw InvalidPoolState("zero sqrt price");
    }
    if (liquidity.is_zero()) {
        throw InvalidPoolState("zero liquidity");
    }
    return zero_for_one
        ? next_sqrt_price_from_amount0(sqrt_price, liquidity, amount_in)
        : next_sqrt_price_from_amount1(sqrt_price, liquidity, amount_in);
}

}  // namespace ammsim::sqrt_price_math
