/*
 * device.cpp - Virtual device data model helpers
 */

#include "device.hpp"
#include <cctype>
#include <ctime>
#include <map>

const char* platform_name(Platform platform) {
    return platform == Platform::ANDROID ? "Android" : "iOS";
}

Platform other_platform(Platform platform) {
    return platform == Platform::ANDROID ? Platform::IOS : Platform::ANDROID;
}

const char* status_name(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::RUNNING:  return "Running";
        case DeviceStatus::STOPPED:  return "Stopped";
        case DeviceStatus::STARTING: return "Starting";
        case DeviceStatus::STOPPING: return "Stopping";
        case DeviceStatus::CREATING: return "Creating";
        case DeviceStatus::ERROR:    return "Error";
        case DeviceStatus::UNKNOWN:  return "Unknown";
    }
    return "Unknown";
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

LogLevel parse_log_level(const std::string& text) {
    std::string upper;
    upper.reserve(text.size());
    for (char c : text) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (upper == "E" || upper == "ERROR" || upper == "F" || upper == "FATAL") {
        return LogLevel::ERROR;
    }
    if (upper == "W" || upper == "WARN" || upper == "WARNING") {
        return LogLevel::WARN;
    }
    if (upper == "D" || upper == "DEBUG" || upper == "V" || upper == "VERBOSE") {
        return LogLevel::DEBUG;
    }
    return LogLevel::INFO;
}

std::string describe_api_level(const std::string& api_level) {
    static const std::map<std::string, std::string> versions = {
        {"23", "6.0"}, {"24", "7.0"}, {"25", "7.1"}, {"26", "8.0"},
        {"27", "8.1"}, {"28", "9"},   {"29", "10"},  {"30", "11"},
        {"31", "12"},  {"32", "12L"}, {"33", "13"},  {"34", "14"},
        {"35", "15"}
    };

    auto it = versions.find(api_level);
    if (it == versions.end()) {
        return "API " + api_level;
    }
    return "API " + api_level + " (Android " + it->second + ")";
}

bool Device::same_state(const Device& other) const {
    return platform == other.platform &&
           identity == other.identity &&
           name == other.name &&
           device_type == other.device_type &&
           version == other.version &&
           status == other.status &&
           is_running == other.is_running;
}

DeviceDetails DeviceDetails::basic_from(const Device& device) {
    DeviceDetails details;
    details.key = device.key();
    details.name = device.name;
    details.device_type = device.device_type;

    if (device.platform == Platform::ANDROID) {
        details.status = status_name(device.status);
        details.version = describe_api_level(device.version);
    } else {
        details.status = device.is_running ? "Booted" : "Shutdown";
        details.version = device.version;
    }
    return details;
}

LogEntry LogEntry::now(LogLevel level, std::string message) {
    LogEntry entry;
    entry.level = level;
    entry.message = std::move(message);

    std::time_t t = std::time(nullptr);
    struct tm local;
    localtime_r(&t, &local);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    entry.timestamp = buf;
    return entry;
}
