/*
 * device_cache.cpp - Cache of per-platform discovery results implementation
 */

#include "device_cache.hpp"
#include <mutex>

DeviceCache::DeviceCache(const Clock& clock, std::chrono::seconds ttl)
    : clock_(clock), ttl_(ttl) {}

std::optional<CacheEntry> DeviceCache::get(Platform platform) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(platform);
    if (it == entries_.end() || is_stale_unlocked(it->second)) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<CacheEntry> DeviceCache::get_last_known(Platform platform) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(platform);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void DeviceCache::update(Platform platform, std::vector<Choice> device_types,
                         std::vector<Choice> api_levels) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    CacheEntry& entry = entries_[platform];
    entry.device_types = std::move(device_types);
    entry.api_levels = std::move(api_levels);
    entry.last_updated = clock_.now();
    entry.invalidated = false;
}

void DeviceCache::invalidate(Platform platform) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(platform);
    if (it != entries_.end()) {
        it->second.invalidated = true;
    }
}

bool DeviceCache::is_stale(Platform platform) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(platform);
    return it == entries_.end() || is_stale_unlocked(it->second);
}

bool DeviceCache::begin_loading(Platform platform) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    bool& loading = loading_[platform];
    if (loading) {
        return false;
    }
    loading = true;
    return true;
}

void DeviceCache::finish_loading(Platform platform) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    loading_[platform] = false;
}

bool DeviceCache::is_loading(Platform platform) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = loading_.find(platform);
    return it != loading_.end() && it->second;
}

void DeviceCache::set_ttl(std::chrono::seconds ttl) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ttl_ = ttl;
}

bool DeviceCache::is_stale_unlocked(const CacheEntry& entry) const {
    if (entry.invalidated) {
        return true;
    }
    return clock_.now() - entry.last_updated > ttl_;
}
