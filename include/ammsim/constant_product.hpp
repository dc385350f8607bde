// AMMSim - Constant Product Pools
// x*y=k output formula and the two-pool cycle with a geometric trade-size scan

#pragma once

#include <ammsim/pool.hpp>
#include <ammsim/types.hpp>
#include <cstdint>
#include <string>

namespace ammsim {

constexpr uint32_t DEFAULT_V2_FEE_BPS = 30;

struct ReservePool {
    std::string pool_id;
    TokenInfo token0;
    TokenInfo token1;
    U256 reserve0;
    U256 reserve1;
    uint32_t fee_bps = DEFAULT_V2_FEE_BPS;

    // Token1 per token0, raw units
    [[nodiscard]] double raw_price() const {
        return reserve0.is_zero() ? 0.0 : to_double(reserve1) / to_double(reserve0);
    }
};

namespace constant_product {

/// floor(in' * reserve_out / (reserve_in + in')), in' = floor(amount_in * (10000 - fee_bps) / 10000).
/// Zero when any input is zero or the fee consumes the whole input.
U256 amount_out(const U256& amount_in, const U256& reserve_in, const U256& reserve_out, uint32_t fee_bps);

enum class StartToken : uint8_t {
    /// token0 -> token1 on buy, token1 -> token0 on sell
    Token0 = 0,
    /// token1 -> token0 on buy, token0 -> token1 on sell
    Token1 = 1
};

inline constexpr const char* to_string(StartToken t) noexcept {
    switch (t) {
        case StartToken::Token0: return "token0_cycle";
        case StartToken::Token1: return "token1_cycle";
    }
    return "unknown";
}

struct CycleResult {
    U256 amount_in;
    U256 mid_amount;     // Output of the first leg
    U256 amount_out;     // Output of the second leg, in the start token
    I256 profit;         // amount_out - amount_in
};

CycleResult simulate_cycle(const U256& amount_in, const ReservePool& buy, const ReservePool& sell,
                           StartToken start);

constexpr uint32_t MIN_SCAN_STEPS = 6;
constexpr uint32_t DEFAULT_SCAN_STEPS = 18;
constexpr double DEFAULT_MAX_FRACTION_OF_RESERVE = 0.003;

struct ScanResult {
    CycleResult best;      // Zero unless found
    bool found = false;    // A strictly positive profit was seen
    U256 min_in;           // Scan floor
    U256 max_in;           // Scan ceiling
    uint32_t points = 0;
};

// Bounded search for a profitable trade size. The ceiling is a fraction of
// the smaller start-token reserve across both pools, the floor is
// max(1, ceiling / 10000), and steps points (at least 6) are spaced
// geometrically between them. Not a closed-form optimum.
ScanResult scan_best_cycle(const ReservePool& buy, const ReservePool& sell, StartToken start,
                           double max_fraction_of_reserve = DEFAULT_MAX_FRACTION_OF_RESERVE,
                           uint32_t steps = DEFAULT_SCAN_STEPS);

}  // namespace constant_product

}  // namespace ammsim
