// AMMSim - Concentrated Liquidity Pool
// Pool snapshots and the tick-crossing exact-input swap simulator

#pragma once

#include <ammsim/types.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ammsim {

// =============================================================================
// Pool Snapshot
// =============================================================================

struct TokenInfo {
    std::string address;
    std::string symbol;
    int decimals = 18;

    [[nodiscard]] bool empty() const noexcept { return address.empty(); }
};

// Same token when the addresses match, ignoring hex case
bool same_token(const TokenInfo& a, const TokenInfo& b);

struct PoolState {
    std::string pool_id;
    std::string chain = "ethereum";
    TokenInfo token0;
    TokenInfo token1;
    uint32_t fee = 0;            // Parts per million of the input
    int32_t tick_spacing = 0;
    U256 sqrt_price_x96;         // Current sqrt(price) as Q64.96
    int32_t tick = 0;            // Current tick
    U256 liquidity;              // Active liquidity, uint128 range
    std::map<int32_t, I256> ticks;  // Initialized tick -> liquidity_net
};

/// Throws InvalidPoolState unless the snapshot can be simulated
void validate(const PoolState& state);

// =============================================================================
// Simulation Results
// =============================================================================

enum class StopReason : uint8_t {
    /// Input fully consumed
    Filled = 0,
    /// No initialized tick left in the direction of travel
    NoInitializedTick = 1,
    /// Next tick lies behind the current price (inconsistent snapshot)
    TickAlreadyPassed = 2,
    /// Crossing budget exhausted with input remaining
    CrossingLimit = 3,
    /// Active liquidity dropped to zero or below after a crossing
    LiquidityExhausted = 4
};

inline constexpr const char* to_string(StopReason r) noexcept {
    switch (r) {
        case StopReason::Filled: return "filled";
        case StopReason::NoInitializedTick: return "no_initialized_tick";
        case StopReason::TickAlreadyPassed: return "tick_already_passed";
        case StopReason::CrossingLimit: return "crossing_limit";
        case StopReason::LiquidityExhausted: return "liquidity_exhausted";
    }
    return "unknown";
}

struct SwapDiagnostics {
    U256 final_sqrt_price_x96;
    int32_t final_tick = 0;
    I256 final_liquidity;
    uint32_t ticks_crossed = 0;
    U256 amount_in_consumed;
    U256 amount_in_left;
    bool incomplete = false;
    StopReason stop_reason = StopReason::Filled;
};

struct SwapOutcome {
    U256 amount_out;
    SwapDiagnostics diagnostics;
};

// Single-range approximation (no tick crossing), display only
struct InRangeEstimate {
    U256 amount_out;
    double sqrt_price_before = 0.0;
    double sqrt_price_after = 0.0;
    double price_impact = 0.0;   // Relative change of the raw price, signed
};

// =============================================================================
// PoolSimulator
// =============================================================================

constexpr uint32_t DEFAULT_MAX_TICK_CROSSINGS = 80;

class PoolSimulator {
public:
    /// Validates the snapshot; throws InvalidPoolState
    explicit PoolSimulator(std::shared_ptr<const PoolState> state);

    [[nodiscard]] const PoolState& state() const noexcept { return *state_; }
    [[nodiscard]] const std::shared_ptr<const PoolState>& shared_state() const noexcept { return state_; }

    // Swap amount_in of token0 (zero_for_one) or token1 across initialized
    // ticks. Never mutates the snapshot. Running out of ticks, liquidity or
    // crossing budget sets diagnostics.incomplete rather than throwing.
    SwapOutcome simulate_swap_exact_in(const U256& amount_in, bool zero_for_one,
                                       uint32_t max_tick_crossings = DEFAULT_MAX_TICK_CROSSINGS) const;

    // Token1 per token0 in human units
    HighPrecision spot_price() const;

    InRangeEstimate estimate_in_range(const U256& amount_in, bool zero_for_one) const;

    // Downward: greatest initialized tick <= tick. Upward: smallest > tick.
    std::optional<int32_t> next_initialized_tick(int32_t tick, bool zero_for_one) const;

private:
    std::shared_ptr<const PoolState> state_;
};

}  // namespace ammsim
