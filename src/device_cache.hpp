/*
 * device_cache.hpp - Cache of per-platform discovery results
 *
 * Device type and API level lists are expensive to discover (each is a
 * round trip to the platform tooling), so they are cached per platform with
 * a TTL. Readers may run concurrently; updates and invalidation take the
 * lock exclusively.
 *
 * invalidate() only force-expires an entry: the data stays available
 * through get_last_known() so the create form can show the previous lists
 * while a reload runs in the background.
 */

#pragma once

#include "clock.hpp"
#include "device.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

struct CacheEntry {
    std::vector<Choice> device_types;
    std::vector<Choice> api_levels;
    Clock::time_point last_updated;
    bool invalidated = false;
};

class DeviceCache {
public:
    static constexpr std::chrono::seconds DEFAULT_TTL{300};

    explicit DeviceCache(const Clock& clock, std::chrono::seconds ttl = DEFAULT_TTL);

    // Non-copyable
    DeviceCache(const DeviceCache&) = delete;
    DeviceCache& operator=(const DeviceCache&) = delete;

    // Entry for the platform if present and fresh
    std::optional<CacheEntry> get(Platform platform) const;

    // Entry for the platform regardless of staleness
    std::optional<CacheEntry> get_last_known(Platform platform) const;

    void update(Platform platform, std::vector<Choice> device_types, std::vector<Choice> api_levels);
    void invalidate(Platform platform);
    bool is_stale(Platform platform) const;

    // Load guard: begin_loading() returns false while another load for the
    // same platform is in flight
    bool begin_loading(Platform platform);
    void finish_loading(Platform platform);
    bool is_loading(Platform platform) const;

    void set_ttl(std::chrono::seconds ttl);

private:
    const Clock& clock_;
    std::chrono::seconds ttl_;
    mutable std::shared_mutex mutex_;
    std::map<Platform, CacheEntry> entries_;
    std::map<Platform, bool> loading_;

    bool is_stale_unlocked(const CacheEntry& entry) const;
};
