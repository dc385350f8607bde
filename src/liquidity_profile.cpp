// AMMSim - Liquidity Profile Implementation

#include <ammsim/liquidity_profile.hpp>
#include <ammsim/pool.hpp>
#include <ammsim/tick_math.hpp>
#include <algorithm>

namespace ammsim {

namespace {

double price_at(int32_t tick, int decimals0, int decimals1) {
    int32_t clamped = std::clamp(tick, tick_math::MIN_TICK, tick_math::MAX_TICK);
    return tick_math::tick_to_price(clamped, decimals0, decimals1).convert_to<double>();
}

LiquiditySegment make_segment(int32_t lower, int32_t upper, const I256& liquidity,
                              int decimals0, int decimals1) {
    LiquiditySegment seg;
    seg.tick_lower = lower;
    seg.tick_upper = upper;
    seg.liquidity = liquidity;
    seg.price_lower = price_at(lower, decimals0, decimals1);
    seg.price_upper = price_at(upper, decimals0, decimals1);
    return seg;
}

}  // namespace

std::vector<LiquiditySegment> build_profile(int32_t current_tick,
                                            int32_t tick_spacing,
                                            const U256& current_liquidity,
                                            const std::map<int32_t, I256>& ticks,
                                            int decimals0,
                                            int decimals1,
                                            size_t max_segments) {
    std::vector<LiquiditySegment> segments;
    if (tick_spacing <= 0 || ticks.empty()) {
        return segments;
    }

    // Upward: ticks strictly above the current tick
    I256 liquidity(current_liquidity);
    int32_t last = current_tick;
    for (auto it = ticks.upper_bound(current_tick); it != ticks.end(); ++it) {
        if (segments.size() >= max_segments) break;
        segments.push_back(make_segment(last, it->first, liquidity, decimals0, decimals1));
        liquidity += it->second;
        last = it->first;
    }

    // Downward: ticks at or below the current tick, nearest first
    liquidity = I256(current_liquidity);
    last = current_tick;
    auto first_above = ticks.upper_bound(current_tick);
    for (auto it = std::make_reverse_iterator(first_above); it != ticks.rend(); ++it) {
        if (segments.size() >= max_segments) break;
        if (it->first < last) {
            segments.push_back(make_segment(it->first, last, liquidity, decimals0, decimals1));
        }
        // A boundary on the current tick yields no segment but still changes liquidity
        liquidity -= it->second;
        last = it->first;
    }

    std::sort(segments.begin(), segments.end(),
              [](const LiquiditySegment& a, const LiquiditySegment& b) {
                  return a.tick_lower < b.tick_lower;
              });
    return segments;
}

std::vector<LiquiditySegment> build_profile(const PoolState& state, size_t max_segments) {
    return build_profile(state.tick, state.tick_spacing, state.liquidity, state.ticks,
                         state.token0.decimals, state.token1.decimals, max_segments);
}

std::vector<LiquiditySegment> detect_gaps(const std::vector<LiquiditySegment>& profile,
                                          double percentile,
                                          std::optional<I256> min_liquidity) {
    std::vector<LiquiditySegment> gaps;
    if (profile.empty()) {
        return gaps;
    }

    I256 threshold;
    if (min_liquidity) {
        threshold = *min_liquidity;
    } else {
        std::vector<I256> sorted;
        sorted.reserve(profile.size());
        for (const auto& seg : profile) {
            sorted.push_back(seg.liquidity);
        }
        std::sort(sorted.begin(), sorted.end());

        auto n = static_cast<long long>(sorted.size());
        auto k = static_cast<long long>(static_cast<double>(n) * percentile);
        k = std::clamp(k, 0LL, n - 1);
        threshold = sorted[static_cast<size_t>(k)];
    }

    for (const auto& seg : profile) {
        if (seg.liquidity <= threshold) {
            gaps.push_back(seg);
        }
    }
    return gaps;
}

}  // namespace ammsim
