// AMMSim - Pool Data Source Implementation

#include <ammsim/data_source.hpp>
#include <algorithm>
#include <cctype>

namespace ammsim {

namespace {

std::string normalize(std::string address) {
    std::transform(address.begin(), address.end(), address.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return address;
}

}  // namespace

// =============================================================================
// TokenCache
// =============================================================================

TokenCache::TokenCache(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

std::optional<TokenInfo> TokenCache::get(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(normalize(address));
    if (it == index_.end()) {
        return std::nullopt;
    }
    order_.splice(order_.begin(), order_, it->second);
    return it->second->second;
}

void TokenCache::put(const TokenInfo& token) {
    std::string key = normalize(token.address);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = token;
        order_.splice(order_.begin(), order_, it->second);
        return;
    }

    order_.emplace_front(key, token);
    index_[key] = order_.begin();

    while (order_.size() > capacity_) {
        index_.erase(order_.back().first);
        order_.pop_back();
    }
}

size_t TokenCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

// =============================================================================
// StaticDataSource
// =============================================================================

void StaticDataSource::add(PoolState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = state.pool_id;
    states_[id] = std::move(state);
}

void StaticDataSource::add(ReservePool pool) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = pool.pool_id;
    reserves_[id] = std::move(pool);
}

std::optional<PoolState> StaticDataSource::snapshot(const std::string& pool_id, const TickWindow&) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(pool_id);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ReservePool> StaticDataSource::reserves(const std::string& pool_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reserves_.find(pool_id);
    if (it == reserves_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace ammsim
