// AMMSim - Test Fixtures
// Small hand-built snapshots shared by the test files

#pragma once

#include <ammsim/constant_product.hpp>
#include <ammsim/pool.hpp>
#include <ammsim/tick_math.hpp>
#include <string>

namespace ammsim::testing {

inline TokenInfo token(const std::string& address, const std::string& symbol, int decimals = 18) {
    return TokenInfo{address, symbol, decimals};
}

inline TokenInfo token_a() { return token("0xAaAa000000000000000000000000000000000001", "TKA"); }
inline TokenInfo token_b() { return token("0xbBbB000000000000000000000000000000000002", "TKB"); }

// Two nested positions around tick 0: [-600, 600) with 1e18 and [-60, 60) with 5e17
inline PoolState nested_pool(const std::string& id = "nested") {
    PoolState pool;
    pool.pool_id = id;
    pool.token0 = token_a();
    pool.token1 = token_b();
    pool.fee = fees::FEE_030;
    pool.tick_spacing = 60;
    pool.sqrt_price_x96 = Q96;
    pool.tick = 0;
    pool.liquidity = U256("1500000000000000000");
    pool.ticks = {
        {-600, I256("1000000000000000000")},
        {-60, I256("500000000000000000")},
        {60, I256("-500000000000000000")},
        {600, I256("-1000000000000000000")},
    };
    return pool;
}

// One deep position over [-6000, 6000) with 1e27 liquidity, price at the given tick
inline PoolState deep_pool(const std::string& id, int32_t tick) {
    PoolState pool;
    pool.pool_id = id;
    pool.token0 = token_a();
    pool.token1 = token_b();
    pool.fee = fees::FEE_030;
    pool.tick_spacing = 60;
    pool.sqrt_price_x96 = tick_math::sqrt_ratio_at_tick(tick);
    pool.tick = tick;
    pool.liquidity = U256("1000000000000000000000000000");
    pool.ticks = {
        {-6000, I256("1000000000000000000000000000")},
        {6000, I256("-1000000000000000000000000000")},
    };
    return pool;
}

inline ReservePool reserve_pool(const std::string& id, uint64_t reserve0, uint64_t reserve1,
                                uint32_t fee_bps = DEFAULT_V2_FEE_BPS) {
    ReservePool pool;
    pool.pool_id = id;
    pool.token0 = token_a();
    pool.token1 = token_b();
    pool.reserve0 = U256(reserve0);
    pool.reserve1 = U256(reserve1);
    pool.fee_bps = fee_bps;
    return pool;
}

}  // namespace ammsim::testing
