// AMMSim - Tick Math Implementation

#include <ammsim/tick_math.hpp>
#include <array>
#include <cmath>
#include <cstdlib>

namespace ammsim::tick_math {

namespace {

// Q128 factors sqrt(1.0001)^-(2^i), i = 1..19
const std::array<U256, 19>& ratio_factors() {
    static const std::array<U256, 19> factors = {
        U256("0xfff97272373d413259a46990580e213a"),
        U256("0xfff2e50f5f656932ef12357cf3c7fdcc"),
        U256("0xffe5caca7e10e4e61c3624eaa0941cd0"),
        U256("0xffcb9843d60f6159c9db58835c926644"),
        U256("0xff973b41fa98c081472e6896dfb254c0"),
        U256("0xff2ea16466c96a3843ec78b326b52861"),
        U256("0xfe5dee046a99a2a811c461f1969c3053"),
        U256("0xfcbe86c7900a88aedcffc83b479aa3a4"),
        U256("0xf987a7253ac413176f2b074cf7815e54"),
        U256("0xf3392b0822b70005940c7a398e4b70f3"),
        U256("0xe7159475a2c29b7443b29c7fa6e889d9"),
        U256("0xd097f3bdfd2022b8845ad8f792aa5825"),
        U256("0xa9f746462d870fdf8a65dc1f90e061e5"),
        U256("0x70d869a156d2a1b890bb3df62baf32f7"),
        U256("0x31be135f97d08fd981231505542fcfa6"),
        U256("0x9aa508b5b7a84e1c677de54f3e99bc9"),
        U256("0x5d6af8dedb81196699c329225ee604"),
        U256("0x2216e584f5fa1ea926041bedfe98"),
        U256("0x48a170391f7dc42444e8fa2"),
    };
    return factors;
}

// Arithmetic shift right (floor division by 2^bits) for sign-magnitude values
I256 floor_shift(const I256& value, unsigned bits) {
    if (value >= 0) {
        I256 shifted = value >> bits;
        return shifted;
    }
    I256 magnitude = -value;
    I256 bias = (I256(1) << bits) - 1;
    I256 shifted = (magnitude + bias) >> bits;
    return I256(-shifted);
}

HighPrecision decimal_scale(int decimals0, int decimals1) {
    return mp::pow(HighPrecision(10), decimals0 - decimals1);
}

}  // namespace

U256 sqrt_ratio_at_tick(int32_t tick) {
    if (tick < MIN_TICK || tick > MAX_TICK) {
        throw TickOutOfRange(tick);
    }
    uint32_t abs_tick = static_cast<uint32_t>(std::abs(tick));

    U256 ratio = (abs_tick & 0x1) != 0
        ? U256("0xfffcb933bd6fad37aa2d162d1a594001")
        : Q128;

    const auto& factors = ratio_factors();
    for (size_t i = 0; i < factors.size(); ++i) {
        if ((abs_tick & (1u << (i + 1))) != 0) {
            ratio = (ratio * factors[i]) >> 128;
        }
    }

    if (tick > 0) {
        ratio = MAX_U256 / ratio;
    }

    // Q128.128 -> Q64.96, rounding up so tick_at_sqrt_ratio stays consistent
    U256 low_bits = ratio & U256(0xffffffffULL);
    U256 result = ratio >> 32;
    if (!low_bits.is_zero()) {
        result += 1;
    }
    return result;
}

int32_t tick_at_sqrt_ratio(const U256& sqrt_price_x96) {
    if (sqrt_price_x96 < MIN_SQRT_RATIO || sqrt_price_x96 >= MAX_SQRT_RATIO) {
        throw SqrtPriceOutOfRange(sqrt_price_x96);
    }

    U256 ratio = sqrt_price_x96 << 32;
    unsigned most_significant = mp::msb(ratio);

    U256 r = most_significant >= 128
        ? U256(ratio >> (most_significant - 127))
        : U256(ratio << (127 - most_significant));

    // 14 fractional bits of log2(ratio), highest first
    U256 fraction = 0;
    for (unsigned i = 0; i < 14; ++i) {
        r = (r * r) >> 127;
        U256 f = r >> 128;
        fraction |= f << (63 - i);
        r >>= f.convert_to<unsigned>();
    }

    I256 log_2 = I256(static_cast<int>(most_significant) - 128) * (I256(1) << 64) + I256(fraction);
    I256 log_sqrt10001 = log_2 * I256("255738958999603826347141");

    int32_t tick_low = floor_shift(log_sqrt10001 - I256("3402992956809132418596140100660247210"), 128)
        .convert_to<int32_t>();
    int32_t tick_high = floor_shift(log_sqrt10001 + I256("291339464771989622907027621153398088495"), 128)
        .convert_to<int32_t>();

    if (tick_low == tick_high) {
        return tick_low;
    }
    return sqrt_ratio_at_tick(tick_high) <= sqrt_price_x96 ? tick_high : tick_low;
}

HighPrecision price_from_sqrt(const U256& sqrt_price_x96, int decimals0, int decimals1) {
    HighPrecision sqrt_price(sqrt_price_x96.str());
    HighPrecision q96(Q96.str());
    HighPrecision ratio = sqrt_price / q96;
    return ratio * ratio * decimal_scale(decimals0, decimals1);
}

HighPrecision tick_to_price(int32_t tick, int decimals0, int decimals1) {
    if (tick < MIN_TICK || tick > MAX_TICK) {
        throw TickOutOfRange(tick);
    }
    HighPrecision base("1.0001");
    return mp::pow(base, tick) * decimal_scale(decimals0, decimals1);
}

int32_t price_to_tick_approx(double price) {
    if (!(price > 0.0)) {
        return 0;
    }
    double tick = std::log(price) / std::log(1.0001);
    if (tick < MIN_TICK) return MIN_TICK;
    if (tick > MAX_TICK) return MAX_TICK;
    // Nearest tick; truncation would turn -3999.9999 into -3999
    return static_cast<int32_t>(std::lround(tick));
}

}  // namespace ammsim::tick_math
