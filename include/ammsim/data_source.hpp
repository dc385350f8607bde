// AMMSim - Pool Data Source
// Interface to whatever fetches snapshots, plus a caller-owned token metadata cache

#pragma once

#include <ammsim/constant_product.hpp>
#include <ammsim/pool.hpp>
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace ammsim {

/// How much of the tick bitmap to load around the current tick
struct TickWindow {
    uint32_t words_each_side{8};     // 256-tick-spacing bitmap words on each side
    uint32_t max_ticks{1200};        // Cap on initialized ticks returned

    [[nodiscard]] TickWindow widened() const {
        return TickWindow{words_each_side * 2, max_ticks * 2};
    }
};

/// Supplies read-only snapshots. Fetching, retries and pagination live behind
/// this interface; std::nullopt means the pool could not be loaded.
class PoolDataSource {
public:
    virtual ~PoolDataSource() = default;

    virtual std::optional<PoolState> snapshot(const std::string& pool_id, const TickWindow& window) = 0;

    virtual std::optional<ReservePool> reserves(const std::string& pool_id) {
        (void)pool_id;
        return std::nullopt;
    }
};

/// Bounded LRU of token metadata keyed by lowercase address. Thread-safe.
class TokenCache {
public:
    explicit TokenCache(size_t capacity = 1024);

    // Non-copyable
    TokenCache(const TokenCache&) = delete;
    TokenCache& operator=(const TokenCache&) = delete;

    std::optional<TokenInfo> get(const std::string& address);
    void put(const TokenInfo& token);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    using Entry = std::pair<std::string, TokenInfo>;

    size_t capacity_;
    std::list<Entry> order_;   // Most recently used first
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    mutable std::mutex mutex_;
};

/// Fixed snapshots keyed by pool id; the window is ignored
class StaticDataSource : public PoolDataSource {
public:
    void add(PoolState state);
    void add(ReservePool pool);

    std::optional<PoolState> snapshot(const std::string& pool_id, const TickWindow& window) override;
    std::optional<ReservePool> reserves(const std::string& pool_id) override;

private:
    std::unordered_map<std::string, PoolState> states_;
    std::unordered_map<std::string, ReservePool> reserves_;
    std::mutex mutex_;
};

}  // namespace ammsim
