// AMMSim - JSON Serialization
// nlohmann::json bindings; wide integers travel as decimal strings

#pragma once

#include <ammsim/arbitrage/engine.hpp>
#include <ammsim/arbitrage/screen.hpp>
#include <ammsim/arbitrage/types.hpp>
#include <ammsim/constant_product.hpp>
#include <ammsim/liquidity_profile.hpp>
#include <ammsim/pool.hpp>
#include <nlohmann/json.hpp>

namespace ammsim {

NLOHMANN_JSON_SERIALIZE_ENUM(StopReason, {
    {StopReason::Filled, "filled"},
    {StopReason::NoInitializedTick, "no_initialized_tick"},
    {StopReason::TickAlreadyPassed, "tick_already_passed"},
    {StopReason::CrossingLimit, "crossing_limit"},
    {StopReason::LiquidityExhausted, "liquidity_exhausted"}
})

void to_json(nlohmann::json& j, const TokenInfo& t);
void from_json(const nlohmann::json& j, TokenInfo& t);

// ticks: [{"tick": -60, "liquidity_net": "123"}, ...]
void to_json(nlohmann::json& j, const PoolState& p);
void from_json(const nlohmann::json& j, PoolState& p);

void to_json(nlohmann::json& j, const ReservePool& p);
void from_json(const nlohmann::json& j, ReservePool& p);

void to_json(nlohmann::json& j, const SwapDiagnostics& d);
void to_json(nlohmann::json& j, const LiquiditySegment& s);

namespace arbitrage {

NLOHMANN_JSON_SERIALIZE_ENUM(SearchMode, {
    {SearchMode::Screen, "screen"},
    {SearchMode::Exact, "exact"},
    {SearchMode::ConstantProduct, "constant_product"}
})

void to_json(nlohmann::json& j, const PoolQuote& q);
void from_json(const nlohmann::json& j, PoolQuote& q);

void to_json(nlohmann::json& j, const GasEstimate& g);
void to_json(nlohmann::json& j, const LegDiagnostics& l);
void to_json(nlohmann::json& j, const ArbitrageOpportunity& o);
void to_json(nlohmann::json& j, const SearchReport& r);
void to_json(nlohmann::json& j, const FeeTierSpread& f);

/// Read {"states": [...], "reserves": [...], "quotes": [...]}; every key is
/// optional. An entry that fails to parse is dropped with a warning in
/// MarketSnapshot::warnings. Throws only when a present key is not an array.
MarketSnapshot market_from_json(const nlohmann::json& doc);

}  // namespace arbitrage

}  // namespace ammsim
