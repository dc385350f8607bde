// AMMSim - Gas Conversion

#pragma once

#include <ammsim/arbitrage/types.hpp>
#include <string>

namespace ammsim::arbitrage {

/// Gas cost in token0 of a pair. Convertible only when one side is a
/// numeraire: token0 pays gas 1:1, token1 pays gas / price_token1_per_token0.
/// bps is relative to trade_size_token0 when that is positive.
GasEstimate estimate_gas(const GasConfig& config,
                         const std::string& symbol0,
                         const std::string& symbol1,
                         double price_token1_per_token0,
                         double trade_size_token0);

}  // namespace ammsim::arbitrage
