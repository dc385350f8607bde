// AMMSim - JSON Serialization Implementation

#include <ammsim/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ammsim {

using nlohmann::json;

namespace {

// Accepts a decimal string or a non-negative JSON integer
U256 wide_unsigned(const json& j, const char* field) {
    if (j.is_string()) return parse_u256(j.get<std::string>());
    if (j.is_number_unsigned()) return U256(j.get<uint64_t>());
    throw Exception(errors::INVALID_ARGUMENT, std::string(field) + ": expected a decimal string");
}

I256 wide_signed(const json& j, const char* field) {
    if (j.is_string()) return parse_i256(j.get<std::string>());
    if (j.is_number_integer()) return I256(j.get<int64_t>());
    throw Exception(errors::INVALID_ARGUMENT, std::string(field) + ": expected a decimal string");
}

template<typename T>
json optional_value(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

}  // namespace

void to_json(json& j, const TokenInfo& t) {
    j = json{{"address", t.address}, {"symbol", t.symbol}, {"decimals", t.decimals}};
}

void from_json(const json& j, TokenInfo& t) {
    if (j.contains("address")) j.at("address").get_to(t.address);
    if (j.contains("symbol")) j.at("symbol").get_to(t.symbol);
    if (j.contains("decimals")) j.at("decimals").get_to(t.decimals);
}

void to_json(json& j, const PoolState& p) {
    json ticks = json::array();
    for (const auto& [tick, net] : p.ticks) {
        ticks.push_back(json{{"tick", tick}, {"liquidity_net", to_string(net)}});
    }
    j = json{
        {"pool_id", p.pool_id},
        {"chain", p.chain},
        {"token0", p.token0},
        {"token1", p.token1},
        {"fee", p.fee},
        {"tick_spacing", p.tick_spacing},
        {"sqrt_price_x96", to_string(p.sqrt_price_x96)},
        {"tick", p.tick},
        {"liquidity", to_string(p.liquidity)},
        {"ticks", ticks}
    };
}

void from_json(const json& j, PoolState& p) {
    j.at("pool_id").get_to(p.pool_id);
    if (j.contains("chain")) j.at("chain").get_to(p.chain);
    j.at("token0").get_to(p.token0);
    j.at("token1").get_to(p.token1);
    j.at("fee").get_to(p.fee);
    j.at("tick_spacing").get_to(p.tick_spacing);
    p.sqrt_price_x96 = wide_unsigned(j.at("sqrt_price_x96"), "sqrt_price_x96");
    j.at("tick").get_to(p.tick);
    p.liquidity = wide_unsigned(j.at("liquidity"), "liquidity");

    p.ticks.clear();
    if (j.contains("ticks")) {
        for (const auto& entry : j.at("ticks")) {
            int32_t tick = entry.at("tick").get<int32_t>();
            p.ticks[tick] = wide_signed(entry.at("liquidity_net"), "liquidity_net");
        }
    }
}

void to_json(json& j, const ReservePool& p) {
    j = json{
        {"pool_id", p.pool_id},
        {"token0", p.token0},
        {"token1", p.token1},
        {"reserve0", to_string(p.reserve0)},
        {"reserve1", to_string(p.reserve1)},
        {"fee_bps", p.fee_bps}
    };
}

void from_json(const json& j, ReservePool& p) {
    j.at("pool_id").get_to(p.pool_id);
    j.at("token0").get_to(p.token0);
    j.at("token1").get_to(p.token1);
    p.reserve0 = wide_unsigned(j.at("reserve0"), "reserve0");
    p.reserve1 = wide_unsigned(j.at("reserve1"), "reserve1");
    if (j.contains("fee_bps")) j.at("fee_bps").get_to(p.fee_bps);
}

void to_json(json& j, const SwapDiagnostics& d) {
    j = json{
        {"final_sqrt_price_x96", to_string(d.final_sqrt_price_x96)},
        {"final_tick", d.final_tick},
        {"final_liquidity", to_string(d.final_liquidity)},
        {"ticks_crossed", d.ticks_crossed},
        {"amount_in_consumed", to_string(d.amount_in_consumed)},
        {"amount_in_left", to_string(d.amount_in_left)},
        {"incomplete", d.incomplete},
        {"stop_reason", d.stop_reason}
    };
}

void to_json(json& j, const LiquiditySegment& s) {
    j = json{
        {"tick_lower", s.tick_lower},
        {"tick_upper", s.tick_upper},
        {"liquidity", to_string(s.liquidity)},
        {"price_lower", s.price_lower},
        {"price_upper", s.price_upper}
    };
}

namespace arbitrage {

void to_json(json& j, const PoolQuote& q) {
    j = json{
        {"pool_id", q.pool_id},
        {"token0", q.token0},
        {"token1", q.token1},
        {"fee", q.fee},
        {"liquidity", q.liquidity},
        {"price_token1_per_token0", q.price}
    };
}

void from_json(const json& j, PoolQuote& q) {
    j.at("pool_id").get_to(q.pool_id);
    if (j.contains("token0")) j.at("token0").get_to(q.token0);
    if (j.contains("token1")) j.at("token1").get_to(q.token1);
    if (j.contains("fee")) j.at("fee").get_to(q.fee);
    if (j.contains("liquidity")) {
        const json& liquidity = j.at("liquidity");
        q.liquidity = liquidity.is_string() ? liquidity.get<std::string>() : liquidity.dump();
    }
    // Missing or null price stays 0 and is reported by the screen
    if (j.contains("price_token1_per_token0") && j.at("price_token1_per_token0").is_number()) {
        j.at("price_token1_per_token0").get_to(q.price);
    }
}

void to_json(json& j, const GasEstimate& g) {
    j = json{
        {"units", g.units},
        {"price_wei", ammsim::to_string(g.price_wei)},
        {"cost_wei", ammsim::to_string(g.cost_wei)},
        {"cost_token0", optional_value(g.cost_token0)},
        {"bps", optional_value(g.bps)},
        {"note", g.note}
    };
}

void to_json(json& j, const LegDiagnostics& l) {
    j = json{
        {"pool_id", l.pool_id},
        {"zero_for_one", l.zero_for_one},
        {"amount_in", ammsim::to_string(l.amount_in)},
        {"amount_out", ammsim::to_string(l.amount_out)},
        {"swap", l.swap}
    };
}

void to_json(json& j, const ArbitrageOpportunity& o) {
    j = json{
        {"strategy", o.strategy},
        {"token0", o.token0},
        {"token1", o.token1},
        {"symbol0", o.symbol0},
        {"symbol1", o.symbol1},
        {"buy_pool", o.buy_pool},
        {"sell_pool", o.sell_pool},
        {"buy_fee", o.buy_fee},
        {"sell_fee", o.sell_fee},
        {"buy_liquidity", o.buy_liquidity},
        {"sell_liquidity", o.sell_liquidity},
        {"buy_price", o.buy_price},
        {"sell_price", o.sell_price},
        {"trade_size", o.trade_size},
        {"amount_in", ammsim::to_string(o.amount_in)},
        {"intermediate_amount", ammsim::to_string(o.intermediate_amount)},
        {"amount_out", ammsim::to_string(o.amount_out)},
        {"effective_buy_price", optional_value(o.effective_buy_price)},
        {"effective_sell_price", optional_value(o.effective_sell_price)},
        {"gross_spread_bps", o.gross_spread_bps},
        {"spot_spread_bps", o.spot_spread_bps},
        {"fee_bps", o.fee_bps},
        {"gas", o.gas},
        {"net_spread_bps", o.net_spread_bps},
        {"net_spread_bps_without_gas", o.net_spread_bps_without_gas},
        {"profit_raw", ammsim::to_string(o.profit_raw)},
        {"profit", o.profit},
        {"profit_after_gas", optional_value(o.profit_after_gas)},
        {"profitable_after_gas", optional_value(o.profitable_after_gas)},
        {"executable", o.executable},
        {"legs", o.legs}
    };
    if (!o.direction.empty()) j["direction"] = o.direction;
    if (!o.reason.empty()) j["reason"] = o.reason;
}

void to_json(json& j, const SearchReport& r) {
    j = json{
        {"mode", r.mode},
        {"pool_count", r.pool_count},
        {"pairs_evaluated", r.pairs_evaluated},
        {"opportunities", r.opportunities},
        {"best", r.best ? json(*r.best) : json(nullptr)},
        {"warnings", r.warnings}
    };
}

void to_json(json& j, const FeeTierSpread& f) {
    j = json{
        {"pair", f.pair},
        {"low_pool", f.low_pool},
        {"high_pool", f.high_pool},
        {"low_fee", f.low_fee},
        {"high_fee", f.high_fee},
        {"low_mid_price", f.low_mid_price},
        {"high_mid_price", f.high_mid_price},
        {"spread", f.spread}
    };
}

namespace {

template<typename T>
void read_entries(const json& doc, const char* key, std::vector<T>& out, std::vector<std::string>& warnings) {
    if (!doc.contains(key)) {
        return;
    }
    const json& entries = doc.at(key);
    if (!entries.is_array()) {
        throw Exception(errors::INVALID_ARGUMENT, std::string(key) + ": expected an array");
    }

    for (size_t i = 0; i < entries.size(); ++i) {
        const json& entry = entries[i];
        std::string label = std::string(key) + "[" + std::to_string(i) + "]";
        if (entry.is_object() && entry.contains("pool_id") && entry["pool_id"].is_string()) {
            label += " " + entry["pool_id"].get<std::string>();
        }
        try {
            out.push_back(entry.get<T>());
        } catch (const json::exception& e) {
            warnings.push_back("skipping " + label + ": " + e.what());
        } catch (const Exception& e) {
            warnings.push_back("skipping " + label + ": " + e.what());
        }
    }
}

}  // namespace

MarketSnapshot market_from_json(const json& doc) {
    if (!doc.is_object()) {
        throw Exception(errors::INVALID_ARGUMENT, "market: expected an object");
    }
    MarketSnapshot market;
    read_entries(doc, "states", market.states, market.warnings);
    read_entries(doc, "reserves", market.reserves, market.warnings);
    read_entries(doc, "quotes", market.quotes, market.warnings);
    return market;
}

}  // namespace arbitrage

}  // namespace ammsim
