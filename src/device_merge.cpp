/*
 * device_merge.cpp - Incremental device list merge implementation
 *
 * The result follows the order of the fresh poll so the list matches what
 * the platform reports; only the per-device payload is reused.
 */

#include "device_merge.hpp"
#include <map>

MergeResult merge_devices(std::vector<Device> previous, const std::vector<Device>& fresh) {
    MergeResult result;

    std::map<DeviceKey, size_t> previous_index;
    for (size_t i = 0; i < previous.size(); ++i) {
        previous_index.emplace(previous[i].key(), i);
    }

    std::map<DeviceKey, bool> seen;
    result.devices.reserve(fresh.size());

    for (const Device& incoming : fresh) {
        DeviceKey key = incoming.key();

        // Duplicate identities within one poll: first one wins
        if (seen.count(key)) {
            continue;
        }
        seen[key] = true;

        auto it = previous_index.find(key);
        if (it == previous_index.end()) {
            result.devices.push_back(incoming);
            result.devices.back().revision = 0;
            result.added.push_back(key);
            continue;
        }

        Device& existing = previous[it->second];
        if (existing.same_state(incoming)) {
            result.devices.push_back(std::move(existing));
            continue;
        }

        bool was_running = existing.is_running;
        existing.name = incoming.name;
        existing.device_type = incoming.device_type;
        existing.version = incoming.version;
        existing.status = incoming.status;
        existing.is_running = incoming.is_running;
        existing.revision++;

        if (!was_running && existing.is_running) {
            result.started.push_back(key);
        }
        result.updated.push_back(key);
        result.devices.push_back(std::move(existing));
    }

    for (const auto& entry : previous_index) {
        if (!seen.count(entry.first)) {
            result.removed.push_back(entry.first);
        }
    }

    return result;
}
