// AMMSim - Full Precision Math Implementation

#include <ammsim/full_math.hpp>

namespace ammsim::full_math {

namespace {

const U512& max_u256_wide() {
    static const U512 value = (U512(1) << 256) - 1;
    return value;
}

U256 narrow(const U512& v, const char* op) {
    if (v > max_u256_wide()) {
        throw MathOverflow(op);
    }
    return static_cast<U256>(v);
}

}  // namespace

U256 mul_div(const U256& a, const U256& b, const U256& denominator) {
    if (denominator.is_zero()) {
        throw DivisionByZero();
    }
    U512 product = U512(a) * U512(b);
    U512 quotient = product / U512(denominator);
    return narrow(quotient, "mul_div");
}

U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denominator) {
    if (denominator.is_zero()) {
        throw DivisionByZero();
    }
    U512 product = U512(a) * U512(b);
    U512 d(denominator);
    U512 quotient = product / d;
    U512 remainder = product % d;
    if (!remainder.is_zero()) {
        quotient += 1;
    }
    return narrow(quotient, "mul_div_rounding_up");
}

U256 div_rounding_up(const U256& a, const U256& b) {
    if (b.is_zero()) {
        throw DivisionByZero();
    }
    U256 quotient = a / b;
    U256 remainder = a % b;
    if (!remainder.is_zero()) {
        quotient += 1;
    }
    return quotient;
}

}  // namespace ammsim::full_math
