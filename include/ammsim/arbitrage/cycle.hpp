// AMMSim - Constant Product Cycle Search

#pragma once

#include <ammsim/arbitrage/types.hpp>
#include <ammsim/constant_product.hpp>
#include <vector>

namespace ammsim::arbitrage {

/// Scan trade sizes for one ordered pool pair and start token. The first leg
/// runs on buy, the second on sell; profit is in the start token.
/// executable is false when no size in the scan range is profitable.
Result<ArbitrageOpportunity> evaluate_cycle_pair(const ReservePool& buy,
                                                 const ReservePool& sell,
                                                 constant_product::StartToken start,
                                                 const CycleConfig& config,
                                                 const GasConfig& gas);

/// Every ordered pool pair of each (token0, token1) group, from both start
/// tokens. Reports the best token0 cycle and the best token1 cycle per group.
SearchReport run_constant_product(const std::vector<ReservePool>& pools,
                                  const CycleConfig& config,
                                  const GasConfig& gas,
                                  const RunLimits& limits = RunLimits{});

}  // namespace ammsim::arbitrage
