/*
 * device.hpp - Virtual device data model
 *
 * Plain records shared by every layer: the device list entries polled from
 * a platform manager, the extended details shown in the detail panel, the
 * configuration used to create a device, and the log lines streamed from a
 * running device.
 *
 * A device is identified by its DeviceKey (platform + identity). Identity is
 * the AVD name on Android and the UDID on iOS; display names are not unique
 * and are never used as keys.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class Platform { ANDROID, IOS };

enum class DeviceStatus { RUNNING, STOPPED, STARTING, STOPPING, CREATING, ERROR, UNKNOWN };

enum class LogLevel { ERROR, WARN, INFO, DEBUG };

const char* platform_name(Platform platform);
Platform other_platform(Platform platform);
const char* status_name(DeviceStatus status);
const char* log_level_name(LogLevel level);

// Parses "E"/"ERROR", "W"/"WARN", ... (case-insensitive). Unknown levels map to INFO.
LogLevel parse_log_level(const std::string& text);

// "API 30 (Android 11)" for known levels, "API 30" otherwise
std::string describe_api_level(const std::string& api_level);

struct DeviceKey {
    Platform platform = Platform::ANDROID;
    std::string identity;

    bool operator==(const DeviceKey& other) const {
        return platform == other.platform && identity == other.identity;
    }
    bool operator!=(const DeviceKey& other) const { return !(*this == other); }
    bool operator<(const DeviceKey& other) const {
        if (platform != other.platform) return platform < other.platform;
        return identity < other.identity;
    }
};

struct Device {
    Platform platform = Platform::ANDROID;
    std::string identity;
    std::string name;
    std::string device_type;
    std::string version;
    DeviceStatus status = DeviceStatus::STOPPED;
    bool is_running = false;

    // Bumped by the refresher whenever a poll changes one of the fields above
    uint64_t revision = 0;

    DeviceKey key() const { return DeviceKey{platform, identity}; }

    // True when every refreshable field matches (revision is ignored)
    bool same_state(const Device& other) const;
};

struct DeviceDetails {
    DeviceKey key;
    std::string name;
    std::string status;
    std::string device_type;
    std::string version;
    std::optional<std::string> ram_size;
    std::optional<std::string> storage_size;
    std::optional<std::string> resolution;
    std::optional<std::string> dpi;
    std::optional<std::string> device_path;
    std::optional<std::string> system_image;

    // Minimal details derived from the list entry, shown until the full
    // details for the selection arrive
    static DeviceDetails basic_from(const Device& device);
};

struct DeviceConfig {
    std::string name;
    std::string device_type;
    std::string version;
    std::optional<std::string> ram_size;
    std::optional<std::string> storage_size;
    std::vector<std::pair<std::string, std::string>> additional_options;
};

// Selectable option in a list (id used for commands, display for the UI)
struct Choice {
    std::string id;
    std::string display;

    bool operator==(const Choice& other) const {
        return id == other.id && display == other.display;
    }
};

struct LogLine {
    LogLevel level = LogLevel::INFO;
    std::string message;
};

struct LogEntry {
    std::string timestamp;  // HH:MM:SS, local time
    LogLevel level = LogLevel::INFO;
    std::string message;

    static LogEntry now(LogLevel level, std::string message);
};
