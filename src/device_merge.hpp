/*
 * device_merge.hpp - Incremental device list merge
 *
 * Combines the previous device list with a freshly polled one, keyed by
 * (platform, identity). Unchanged devices are carried over untouched so
 * their revision stays put and the renderer sees no change; devices whose
 * fields moved keep their place with the new values and a bumped revision.
 * Devices missing from the poll are dropped, new ones are appended in poll
 * order.
 */

#pragma once

#include "device.hpp"
#include <vector>

struct MergeResult {
    std::vector<Device> devices;
    std::vector<DeviceKey> added;
    std::vector<DeviceKey> updated;
    std::vector<DeviceKey> removed;
    // Devices that were known before and are now running but were not
    std::vector<DeviceKey> started;

    bool changed() const { return !added.empty() || !updated.empty() || !removed.empty(); }
};

MergeResult merge_devices(std::vector<Device> previous, const std::vector<Device>& fresh);
