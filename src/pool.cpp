// AMMSim - Concentrated Liquidity Pool Implementation

#include <ammsim/pool.hpp>
#include <ammsim/swap_math.hpp>
#include <ammsim/tick_math.hpp>
#include <algorithm>
#include <cctype>

namespace ammsim {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

bool same_token(const TokenInfo& a, const TokenInfo& b) {
    return !a.address.empty() && lower(a.address) == lower(b.address);
}

// =============================================================================
// Validation
// =============================================================================

void validate(const PoolState& state) {
    const std::string& id = state.pool_id;
    if (state.sqrt_price_x96.is_zero()) {
        throw InvalidPoolState(id + ": zero sqrt price");
    }
    if (state.sqrt_price_x96 < tick_math::MIN_SQRT_RATIO ||
        state.sqrt_price_x96 >= tick_math::MAX_SQRT_RATIO) {
        throw InvalidPoolState(id + ": sqrt price " + to_string(state.sqrt_price_x96) + " out of range");
    }
    if (state.liquidity.is_zero()) {
        throw InvalidPoolState(id + ": zero active liquidity");
    }
    if (state.liquidity > MAX_U128) {
        throw InvalidPoolState(id + ": liquidity exceeds uint128");
    }
    if (state.fee >= FEE_DENOMINATOR) {
        throw InvalidPoolState(id + ": fee " + std::to_string(state.fee) + " ppm");
    }
    if (state.tick_spacing <= 0) {
        throw InvalidPoolState(id + ": tick spacing " + std::to_string(state.tick_spacing));
    }
    if (state.tick < tick_math::MIN_TICK || state.tick > tick_math::MAX_TICK) {
        throw InvalidPoolState(id + ": tick " + std::to_string(state.tick) + " out of range");
    }
    for (const auto& [tick, net] : state.ticks) {
        if (tick < tick_math::MIN_TICK || tick > tick_math::MAX_TICK) {
            throw InvalidPoolState(id + ": initialized tick " + std::to_string(tick) + " out of range");
        }
        if (net > MAX_I128 || net < MIN_I128) {
            throw InvalidPoolState(id + ": liquidity_net at tick " + std::to_string(tick) + " exceeds int128");
        }
    }
}

// =============================================================================
// PoolSimulator
// =============================================================================

PoolSimulator::PoolSimulator(std::shared_ptr<const PoolState> state)
    : state_(std::move(state)) {
    if (!state_) {
        throw InvalidPoolState("null snapshot");
    }
    validate(*state_);
}

std::optional<int32_t> PoolSimulator::next_initialized_tick(int32_t tick, bool zero_for_one) const {
    const auto& ticks = state_->ticks;
    if (zero_for_one) {
        auto it = ticks.upper_bound(tick);
        if (it == ticks.begin()) {
            return std::nullopt;
        }
        --it;
        return it->first;
    }
    auto it = ticks.upper_bound(tick);
    if (it == ticks.end()) {
        return std::nullopt;
    }
    return it->first;
}

SwapOutcome PoolSimulator::simulate_swap_exact_in(const U256& amount_in, bool zero_for_one,
                                                  uint32_t max_tick_crossings) const {
    const PoolState& pool = *state_;

    SwapOutcome outcome;
    SwapDiagnostics& diag = outcome.diagnostics;

    U256 sqrt_price = pool.sqrt_price_x96;
    int32_t tick = pool.tick;
    I256 liquidity(pool.liquidity);
    U256 remaining = amount_in;
    U256 amount_out = 0;

    auto stop = [&](StopReason reason) {
        diag.incomplete = true;
        diag.stop_reason = reason;
    };

    while (!remaining.is_zero()) {
        std::optional<int32_t> next = next_initialized_tick(tick, zero_for_one);
        if (!next) {
            stop(StopReason::NoInitializedTick);
            break;
        }

        U256 target = tick_math::sqrt_ratio_at_tick(*next);
        if (zero_for_one ? target > sqrt_price : target < sqrt_price) {
            stop(StopReason::TickAlreadyPassed);
            break;
        }

        // Sitting exactly on the boundary: cross without a step
        if (target != sqrt_price) {
            swap_math::SwapStepResult step = swap_math::compute_swap_step(
                sqrt_price, target, static_cast<U256>(liquidity), remaining, pool.fee, zero_for_one);

            U256 consumed = step.amount_in + step.fee_amount;
            remaining = consumed >= remaining ? U256(0) : U256(remaining - consumed);
            amount_out += step.amount_out;
            sqrt_price = step.sqrt_price_next;

            if (step.partial) {
                tick = tick_math::tick_at_sqrt_ratio(sqrt_price);
                break;
            }
        }

        // Price is at the boundary of *next
        if (diag.ticks_crossed >= max_tick_crossings) {
            tick = zero_for_one ? *next - 1 : *next;
            if (!remaining.is_zero()) {
                stop(StopReason::CrossingLimit);
            }
            break;
        }

        const I256& net = pool.ticks.at(*next);
        if (zero_for_one) {
            liquidity -= net;
        } else {
            liquidity += net;
        }
        tick = zero_for_one ? *next - 1 : *next;
        diag.ticks_crossed++;

        if (liquidity <= 0 && !remaining.is_zero()) {
            stop(StopReason::LiquidityExhausted);
            break;
        }
    }

    outcome.amount_out = amount_out;
    diag.final_sqrt_price_x96 = sqrt_price;
    diag.final_tick = tick;
    diag.final_liquidity = liquidity;
    diag.amount_in_left = remaining;
    diag.amount_in_consumed = amount_in - remaining;
    return outcome;
}

HighPrecision PoolSimulator::spot_price() const {
    return tick_math::price_from_sqrt(state_->sqrt_price_x96, state_->token0.decimals, state_->token1.decimals);
}

InRangeEstimate PoolSimulator::estimate_in_range(const U256& amount_in, bool zero_for_one) const {
    const PoolState& pool = *state_;

    HighPrecision liquidity(pool.liquidity.str());
    HighPrecision sqrt_p = HighPrecision(pool.sqrt_price_x96.str()) / HighPrecision(Q96.str());
    HighPrecision fee_fraction = HighPrecision(pool.fee) / HighPrecision(FEE_DENOMINATOR);
    HighPrecision effective_in = HighPrecision(amount_in.str()) * (HighPrecision(1) - fee_fraction);

    HighPrecision sqrt_q;
    HighPrecision out;
    if (zero_for_one) {
        sqrt_q = (liquidity * sqrt_p) / (liquidity + effective_in * sqrt_p);
        out = liquidity * (sqrt_p - sqrt_q);
    } else {
        sqrt_q = sqrt_p + effective_in / liquidity;
        out = liquidity * (HighPrecision(1) / sqrt_p - HighPrecision(1) / sqrt_q);
    }
    if (out < 0) {
        out = 0;
    }

    HighPrecision mid_before = sqrt_p * sqrt_p;
    HighPrecision mid_after = sqrt_q * sqrt_q;

    InRangeEstimate estimate;
    estimate.amount_out = static_cast<U256>(HighPrecision(mp::trunc(out)));
    estimate.sqrt_price_before = sqrt_p.convert_to<double>();
    estimate.sqrt_price_after = sqrt_q.convert_to<double>();
    estimate.price_impact = HighPrecision((mid_after - mid_before) / mid_before).convert_to<double>();
    return estimate;
}

}  // namespace ammsim
