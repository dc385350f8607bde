// AMMSim - Constant Product Pools Implementation

#include <ammsim/constant_product.hpp>
#include <algorithm>
#include <cmath>

namespace ammsim::constant_product {

namespace {

constexpr uint32_t BPS = 10000;

U256 scaled_reserve(const U256& reserve, double fraction) {
    if (!(fraction > 0.0)) {
        return U256(0);
    }
    HighPrecision scaled = mp::trunc(HighPrecision(reserve.str()) * HighPrecision(fraction));
    return static_cast<U256>(scaled);
}

U256 geometric_point(const U256& lo, const U256& hi, uint32_t i, uint32_t steps) {
    if (i == 0) return lo;
    if (i + 1 == steps) return hi;
    double t = static_cast<double>(i) / static_cast<double>(steps - 1);
    double ratio = to_double(hi) / to_double(lo);
    HighPrecision point = mp::trunc(HighPrecision(lo.str()) * HighPrecision(std::pow(ratio, t)));
    U256 amount = static_cast<U256>(point);
    return std::clamp(amount, lo, hi);
}

}  // namespace

U256 amount_out(const U256& amount_in, const U256& reserve_in, const U256& reserve_out, uint32_t fee_bps) {
    if (amount_in.is_zero() || reserve_in.is_zero() || reserve_out.is_zero() || fee_bps >= BPS) {
        return U256(0);
    }
    U512 in_after_fee = U512(amount_in) * (BPS - fee_bps) / BPS;
    if (in_after_fee.is_zero()) {
        return U256(0);
    }
    U512 out = in_after_fee * U512(reserve_out) / (U512(reserve_in) + in_after_fee);
    return static_cast<U256>(out);
}

CycleResult simulate_cycle(const U256& amount_in, const ReservePool& buy, const ReservePool& sell,
                           StartToken start) {
    CycleResult result;
    result.amount_in = amount_in;

    if (start == StartToken::Token0) {
        result.mid_amount = amount_out(amount_in, buy.reserve0, buy.reserve1, buy.fee_bps);
        result.amount_out = amount_out(result.mid_amount, sell.reserve1, sell.reserve0, sell.fee_bps);
    } else {
        result.mid_amount = amount_out(amount_in, buy.reserve1, buy.reserve0, buy.fee_bps);
        result.amount_out = amount_out(result.mid_amount, sell.reserve0, sell.reserve1, sell.fee_bps);
    }

    result.profit = I256(result.amount_out) - I256(amount_in);
    return result;
}

ScanResult scan_best_cycle(const ReservePool& buy, const ReservePool& sell, StartToken start,
                           double max_fraction_of_reserve, uint32_t steps) {
    steps = std::max(steps, MIN_SCAN_STEPS);

    ScanResult scan;
    const U256& reserve_buy = start == StartToken::Token0 ? buy.reserve0 : buy.reserve1;
    const U256& reserve_sell = start == StartToken::Token0 ? sell.reserve0 : sell.reserve1;
    U256 shallow = std::min(reserve_buy, reserve_sell);
    if (shallow.is_zero()) {
        return scan;
    }

    scan.max_in = scaled_reserve(shallow, max_fraction_of_reserve);
    if (scan.max_in.is_zero()) {
        return scan;
    }
    scan.min_in = std::max(U256(1), U256(scan.max_in / 10000));

    for (uint32_t i = 0; i < steps; ++i) {
        U256 amount = geometric_point(scan.min_in, scan.max_in, i, steps);
        CycleResult cycle = simulate_cycle(amount, buy, sell, start);
        scan.points++;
        if (cycle.profit > 0 && (!scan.found || cycle.profit > scan.best.profit)) {
            scan.best = cycle;
            scan.found = true;
        }
    }
    return scan;
}

}  // namespace ammsim::constant_product
