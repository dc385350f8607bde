// AMMSim - Arbitrage Types
// Two-pool arbitrage: buy token1 where token0 is expensive, sell it back where token0 is cheap.
// All profitability figures are denominated in token0 of the pair.

#pragma once

#include <ammsim/constant_product.hpp>
#include <ammsim/data_source.hpp>
#include <ammsim/pool.hpp>
#include <ammsim/types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ammsim::arbitrage {

/// Search strategy
enum class SearchMode : uint8_t {
    /// Spot-price screen, no simulation (ignores slippage)
    Screen = 0,
    /// Tick-level two-leg simulation on concentrated-liquidity pools
    Exact = 1,
    /// Constant-product two-pool cycle with trade-size scan
    ConstantProduct = 2
};

inline constexpr const char* to_string(SearchMode m) noexcept {
    switch (m) {
        case SearchMode::Screen: return "screen";
        case SearchMode::Exact: return "exact";
        case SearchMode::ConstantProduct: return "constant_product";
    }
    return "unknown";
}

std::optional<SearchMode> parse_search_mode(const std::string& text);

/// Which pool the exact round trip starts on. Both legs always go
/// token0 -> token1 first and token1 -> token0 second.
enum class LegOrder : uint8_t {
    /// Leg 1 on the lower-price (buy) pool, leg 2 on the sell pool
    BuyFirst = 0,
    /// Leg 1 on the higher-price (sell) pool, leg 2 on the buy pool
    SellFirst = 1
};

inline constexpr const char* to_string(LegOrder o) noexcept {
    switch (o) {
        case LegOrder::BuyFirst: return "buy_first";
        case LegOrder::SellFirst: return "sell_first";
    }
    return "unknown";
}

std::optional<LegOrder> parse_leg_order(const std::string& text);

/// Gas and numeraire assumptions supplied by the caller
struct GasConfig {
    U256 gas_price_wei = U256(30'000'000'000ULL);   // 30 gwei
    uint64_t gas_units = 320'000;
    std::vector<std::string> numeraire_symbols{"WETH", "ETH"};
    double trade_size_token0 = 10'000.0;            // Human units of token0

    [[nodiscard]] bool is_numeraire(const std::string& symbol) const;
    [[nodiscard]] U256 gas_cost_wei() const { return gas_price_wei * gas_units; }
};

/// Gas cost expressed in the pair's token0, when convertible
struct GasEstimate {
    uint64_t units = 0;
    U256 price_wei;
    U256 cost_wei;
    std::optional<double> cost_token0;   // Human units
    std::optional<double> bps;           // Relative to the trade size
    std::string note;
};

/// One simulated swap leg
struct LegDiagnostics {
    std::string pool_id;
    bool zero_for_one = true;
    U256 amount_in;
    U256 amount_out;
    SwapDiagnostics swap;
};

struct ArbitrageOpportunity {
    SearchMode strategy = SearchMode::Screen;

    // Pair identity
    std::string token0;
    std::string token1;
    std::string symbol0;
    std::string symbol1;

    // Route. Screen and Exact: the buy pool has the lower token1-per-token0
    // spot price. ConstantProduct: the buy pool runs the first leg.
    std::string buy_pool;
    std::string sell_pool;
    uint32_t buy_fee = 0;     // Pool fee units (ppm, or bps for constant product)
    uint32_t sell_fee = 0;
    std::string buy_liquidity;
    std::string sell_liquidity;

    // Spot prices, token1 per token0
    double buy_price = 0.0;
    double sell_price = 0.0;

    // Trade
    double trade_size = 0.0;             // Human token0
    U256 amount_in;                      // Raw start token
    U256 intermediate_amount;            // Raw, after the first leg
    U256 amount_out;                     // Raw start token, after the second leg
    std::optional<double> effective_buy_price;
    std::optional<double> effective_sell_price;
    std::string direction;               // Cycle start for constant product

    // Profitability
    double gross_spread_bps = 0.0;
    double spot_spread_bps = 0.0;
    double fee_bps = 0.0;
    GasEstimate gas;
    double net_spread_bps = 0.0;
    double net_spread_bps_without_gas = 0.0;
    I256 profit_raw;
    double profit = 0.0;                 // Human start token
    std::optional<double> profit_after_gas;
    std::optional<bool> profitable_after_gas;

    // Executability
    bool executable = true;
    std::string reason;
    std::vector<LegDiagnostics> legs;
};

/// Spot-price screen settings
struct ScreenConfig {
    size_t max_results{25};

    static ScreenConfig defaults() {
        return ScreenConfig{};
    }
};

/// Tick-level two-leg simulation settings
struct ExactConfig {
    uint32_t max_tick_crossings{DEFAULT_MAX_TICK_CROSSINGS};
    TickWindow window{};
    uint32_t widen_retries{0};     // Refetch with a doubled window when a leg runs out of ticks
    LegOrder leg_order{LegOrder::BuyFirst};
    size_t max_results{25};

    static ExactConfig defaults() {
        return ExactConfig{};
    }
};

/// Constant-product cycle scan settings
struct CycleConfig {
    uint32_t steps{constant_product::DEFAULT_SCAN_STEPS};
    double max_fraction_of_reserve{constant_product::DEFAULT_MAX_FRACTION_OF_RESERVE};
    I256 min_profit_raw{0};        // Below this a cycle is reported but not marked profitable
    size_t max_results{25};

    static CycleConfig defaults() {
        return CycleConfig{};
    }
};

/// Bounds on one batch run
struct RunLimits {
    size_t max_pair_evaluations{100'000};
    unsigned worker_threads{1};
};

struct SearchReport {
    SearchMode mode = SearchMode::Screen;
    size_t pool_count = 0;
    size_t pairs_evaluated = 0;
    std::vector<ArbitrageOpportunity> opportunities;
    std::optional<ArbitrageOpportunity> best;
    std::vector<std::string> warnings;
};

// Grouping key for pools trading the same ordered token pair
std::string pair_key(const TokenInfo& token0, const TokenInfo& token1);

// Executable results first, then by net spread descending; sets best, then caps the list
void rank(SearchReport& report, size_t max_results);

}  // namespace ammsim::arbitrage
