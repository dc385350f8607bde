// AMMSim - Configuration
// Builder pattern for fluent configuration, loadable from TOML

#pragma once

#include <ammsim/arbitrage/types.hpp>
#include <ammsim/liquidity_profile.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ammsim {

// General engine settings
struct GeneralConfig {
    std::string log_level = "info";
    arbitrage::SearchMode mode = arbitrage::SearchMode::Screen;
    size_t max_pair_evaluations = 100'000;
    unsigned worker_threads = 1;
};

// Liquidity profile / gap detection settings
struct ProfileConfig {
    size_t max_segments = DEFAULT_MAX_SEGMENTS;
    double gap_percentile = DEFAULT_GAP_PERCENTILE;
    std::optional<I256> min_liquidity;
};

// Main configuration
class Config {
public:
    GeneralConfig general;
    arbitrage::GasConfig gas;
    arbitrage::ScreenConfig screen;
    arbitrage::ExactConfig exact;
    arbitrage::CycleConfig cycle;
    ProfileConfig profile;

    Config() = default;

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    [[nodiscard]] arbitrage::RunLimits limits() const {
        return arbitrage::RunLimits{general.max_pair_evaluations, general.worker_threads};
    }

    // Builder methods
    Config& set_mode(arbitrage::SearchMode mode) {
        general.mode = mode;
        return *this;
    }

    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& set_worker_threads(unsigned threads) {
        general.worker_threads = threads;
        return *this;
    }

    Config& set_max_pair_evaluations(size_t pairs) {
        general.max_pair_evaluations = pairs;
        return *this;
    }

    Config& set_gas_price_wei(const U256& price) {
        gas.gas_price_wei = price;
        return *this;
    }

    Config& set_gas_units(uint64_t units) {
        gas.gas_units = units;
        return *this;
    }

    Config& set_numeraires(std::vector<std::string> symbols) {
        gas.numeraire_symbols = std::move(symbols);
        return *this;
    }

    Config& set_trade_size(double token0_amount) {
        gas.trade_size_token0 = token0_amount;
        return *this;
    }

    Config& set_max_tick_crossings(uint32_t crossings) {
        exact.max_tick_crossings = crossings;
        return *this;
    }

    Config& set_tick_window(TickWindow window) {
        exact.window = window;
        return *this;
    }

    Config& set_widen_retries(uint32_t retries) {
        exact.widen_retries = retries;
        return *this;
    }

    Config& set_leg_order(arbitrage::LegOrder order) {
        exact.leg_order = order;
        return *this;
    }

    Config& set_scan_steps(uint32_t steps) {
        cycle.steps = steps;
        return *this;
    }

    Config& set_max_fraction_of_reserve(double fraction) {
        cycle.max_fraction_of_reserve = fraction;
        return *this;
    }

    Config& set_max_segments(size_t segments) {
        profile.max_segments = segments;
        return *this;
    }

    Config& set_gap_percentile(double percentile) {
        profile.gap_percentile = percentile;
        return *this;
    }
};

}  // namespace ammsim
