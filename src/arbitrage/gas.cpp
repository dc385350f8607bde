// AMMSim - Gas Conversion Implementation

#include <ammsim/arbitrage/gas.hpp>

namespace ammsim::arbitrage {

GasEstimate estimate_gas(const GasConfig& config,
                         const std::string& symbol0,
                         const std::string& symbol1,
                         double price_token1_per_token0,
                         double trade_size_token0) {
    GasEstimate gas;
    gas.units = config.gas_units;
    gas.price_wei = config.gas_price_wei;
    gas.cost_wei = config.gas_cost_wei();

    double gas_eth = to_human(gas.cost_wei, 18);
    if (config.is_numeraire(symbol0)) {
        gas.cost_token0 = gas_eth;
        gas.note = "token0 is numeraire";
    } else if (config.is_numeraire(symbol1)) {
        if (price_token1_per_token0 <= 0.0) {
            gas.note = "missing price for gas conversion";
            return gas;
        }
        gas.cost_token0 = gas_eth / price_token1_per_token0;
        gas.note = "token1 is numeraire";
    } else {
        gas.note = "no numeraire in pair; gas not converted to token0";
        return gas;
    }

    if (trade_size_token0 > 0.0) {
        gas.bps = *gas.cost_token0 / trade_size_token0 * 10000.0;
    }
    return gas;
}

}  // namespace ammsim::arbitrage
