/*
 * device_manager.hpp - Platform device manager interface
 *
 * Each platform (Android emulators, iOS simulators) is driven through one
 * DeviceManager implementation. Every call may block for as long as the
 * underlying tooling takes, so they are only ever made from background
 * tasks, never from the UI thread.
 *
 * Calls report failure by returning false (or std::nullopt) and filling in
 * a human readable error.
 */

#pragma once

#include "device.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class DeviceManager {
public:
    // Return false to stop the stream
    using LineCallback = std::function<bool(const LogLine&)>;
    // Polled by stream_logs(); returning false ends the stream
    using KeepGoing = std::function<bool()>;

    virtual ~DeviceManager() = default;

    virtual Platform platform() const = 0;

    virtual bool list_devices(std::vector<Device>& devices, std::string& error) = 0;
    virtual bool start_device(const std::string& identity, std::string& error) = 0;
    virtual bool stop_device(const std::string& identity, std::string& error) = 0;
    virtual bool create_device(const DeviceConfig& config, std::string& error) = 0;
    virtual bool delete_device(const std::string& identity, std::string& error) = 0;
    virtual bool wipe_device(const std::string& identity, std::string& error) = 0;
    virtual std::optional<DeviceDetails> get_device_details(const std::string& identity,
                                                            std::string& error) = 0;

    // Discovery lists backing the device cache
    virtual bool list_device_types(std::vector<Choice>& types, std::string& error) = 0;
    virtual bool list_api_levels(std::vector<Choice>& levels, std::string& error) = 0;

    // Blocks while delivering log lines of a running device. Returns when the
    // device stops, on_line returns false or keep_going() turns false.
    // Returns false only if the log source failed.
    virtual bool stream_logs(const Device& device, const LineCallback& on_line,
                             const KeepGoing& keep_going, std::string& error) = 0;
};

// Managers selected at startup, one per platform
struct DeviceBackends {
    std::shared_ptr<DeviceManager> android;
    std::shared_ptr<DeviceManager> ios;  // null where simulators are unavailable

    DeviceManager* get(Platform platform) const {
        return platform == Platform::ANDROID ? android.get() : ios.get();
    }
};
