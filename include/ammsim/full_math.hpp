// AMMSim - Full Precision Math
// 256-bit multiply-divide with a 512-bit intermediate

#pragma once

#include <ammsim/types.hpp>

namespace ammsim::full_math {

// floor(a * b / denominator). Throws DivisionByZero when denominator == 0
// and MathOverflow when the quotient does not fit in 256 bits.
U256 mul_div(const U256& a, const U256& b, const U256& denominator);

// ceil(a * b / denominator), same failure modes as mul_div
U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denominator);

// ceil(a / b)
U256 div_rounding_up(const U256& a, const U256& b);

}  // namespace ammsim::full_math
