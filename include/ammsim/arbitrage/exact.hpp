// AMMSim - Exact Two-Leg Arbitrage
// Tick-level simulation of token0 -> token1 on one pool and back on the other

#pragma once

#include <ammsim/arbitrage/types.hpp>
#include <ammsim/data_source.hpp>
#include <ammsim/pool.hpp>
#include <string>
#include <vector>

namespace ammsim::arbitrage {

/// Simulate one round trip between two pools of the same token pair.
///
/// The buy pool is the one with the lower token1-per-token0 spot price, the
/// sell pool the other. The first leg swaps trade_size_token0 of token0 to
/// token1 on the buy pool; the second leg swaps all resulting token1 back to
/// token0 on the sell pool. LegOrder::SellFirst starts on the sell pool instead.
/// An incomplete or empty leg yields executable = false with a reason, not an
/// error. Mismatched tokens yield a TOKEN_MISMATCH error.
Result<ArbitrageOpportunity> evaluate_exact_pair(const PoolSimulator& a,
                                                 const PoolSimulator& b,
                                                 const ExactConfig& config,
                                                 const GasConfig& gas);

/// Same, validating the snapshots first (INVALID_POOL_STATE on failure)
Result<ArbitrageOpportunity> evaluate_exact_pair(const PoolState& a,
                                                 const PoolState& b,
                                                 const ExactConfig& config,
                                                 const GasConfig& gas);

/// Same, loading snapshots from a data source. When a leg runs out of
/// initialized ticks the pair is refetched with a doubled window, up to
/// config.widen_retries times.
Result<ArbitrageOpportunity> evaluate_exact_pair(PoolDataSource& source,
                                                 const std::string& pool_a,
                                                 const std::string& pool_b,
                                                 const ExactConfig& config,
                                                 const GasConfig& gas);

/// Every unordered pair within each (token0, token1) group. Invalid pools
/// and failed pairs become warnings; the batch always completes.
SearchReport run_exact(const std::vector<PoolState>& states,
                       const ExactConfig& config,
                       const GasConfig& gas,
                       const RunLimits& limits = RunLimits{});

}  // namespace ammsim::arbitrage
