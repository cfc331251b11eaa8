/*
 * simulated_device_manager.cpp - In-memory device manager implementation
 *
 * Started devices report STARTING until the boot time has passed on the
 * injected clock, then RUNNING. The log source cycles through a fixed set
 * of platform-flavoured lines at the configured interval.
 */

#include "simulated_device_manager.hpp"
#include <algorithm>
#include <cstdio>
#include <thread>

namespace {

struct ScriptedLine {
    LogLevel level;
    const char* message;
};

const std::vector<ScriptedLine>& android_script() {
    static const std::vector<ScriptedLine> lines = {
        {LogLevel::INFO,  "ActivityManager: Start proc com.android.systemui"},
        {LogLevel::DEBUG, "WindowManager: Relayout Window{statusbar}"},
        {LogLevel::INFO,  "PackageManager: Scanning installed packages"},
        {LogLevel::WARN,  "BatteryStatsService: Battery level low in emulator"},
        {LogLevel::DEBUG, "ConnectivityService: NetworkAgentInfo [WIFI () - 100]"},
        {LogLevel::ERROR, "AudioFlinger: Unable to open output stream"},
        {LogLevel::INFO,  "Zygote: Process 1234 exited cleanly (0)"}
    };
    return lines;
}

const std::vector<ScriptedLine>& ios_script() {
    static const std::vector<ScriptedLine> lines = {
        {LogLevel::INFO,  "SpringBoard: Application launched"},
        {LogLevel::DEBUG, "backboardd: HID event dispatched"},
        {LogLevel::INFO,  "locationd: Simulated location updated"},
        {LogLevel::WARN,  "assertiond: Process exceeded memory threshold"},
        {LogLevel::ERROR, "CoreSimulatorBridge: Failed to connect to service"},
        {LogLevel::DEBUG, "runningboardd: Acquiring assertion"}
    };
    return lines;
}

// Keeps the active stream counter accurate however the stream ends
class StreamGuard {
public:
    StreamGuard(std::atomic<int>& active, std::atomic<int>& max) : active_(active) {
        int now = ++active_;
        int seen = max.load();
        while (now > seen && !max.compare_exchange_weak(seen, now)) {
        }
    }
    ~StreamGuard() { --active_; }

private:
    std::atomic<int>& active_;
};

} // namespace

const char* operation_name(Operation op) {
    switch (op) {
        case Operation::LIST:         return "list";
        case Operation::START:        return "start";
        case Operation::STOP:         return "stop";
        case Operation::CREATE:       return "create";
        case Operation::DELETE:       return "delete";
        case Operation::WIPE:         return "wipe";
        case Operation::DETAILS:      return "details";
        case Operation::DEVICE_TYPES: return "device_types";
        case Operation::API_LEVELS:   return "api_levels";
        case Operation::LOGS:         return "logs";
    }
    return "unknown";
}

SimulatedDeviceManager::SimulatedDeviceManager(Platform platform, const Clock& clock, bool with_defaults)
    : platform_(platform), clock_(clock) {
    if (with_defaults) {
        add_defaults();
    }
}

void SimulatedDeviceManager::add_defaults() {
    if (platform_ == Platform::ANDROID) {
        Device pixel4;
        pixel4.platform = Platform::ANDROID;
        pixel4.identity = "Pixel_4_API_30";
        pixel4.name = "Pixel_4_API_30";
        pixel4.device_type = "pixel_4";
        pixel4.version = "30";
        add_device(pixel4);

        Device pixel6 = pixel4;
        pixel6.identity = "Pixel_6_API_33";
        pixel6.name = "Pixel_6_API_33";
        pixel6.device_type = "pixel_6";
        pixel6.version = "33";
        add_device(pixel6);
    } else {
        Device iphone;
        iphone.platform = Platform::IOS;
        iphone.name = "iPhone 14";
        iphone.device_type = "iPhone 14";
        iphone.version = "iOS 16.0";
        {
            std::lock_guard<std::mutex> lock(mutex_);
            iphone.identity = generate_udid_unlocked();
        }
        add_device(iphone);

        Device ipad = iphone;
        ipad.name = "iPad Pro";
        ipad.device_type = "iPad Pro (12.9-inch)";
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ipad.identity = generate_udid_unlocked();
        }
        add_device(ipad);
    }
}

void SimulatedDeviceManager::add_device(const Device& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    SimulatedDevice sim;
    sim.device = device;
    sim.device.platform = platform_;
    sim.device.revision = 0;
    devices_.push_back(sim);
}

void SimulatedDeviceManager::configure_failure(Operation op, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[op] = message;
}

void SimulatedDeviceManager::clear_failure(Operation op) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.erase(op);
}

void SimulatedDeviceManager::configure_delay(Operation op, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    delays_[op] = delay;
}

void SimulatedDeviceManager::set_boot_time(std::chrono::milliseconds boot_time) {
    std::lock_guard<std::mutex> lock(mutex_);
    boot_time_ = boot_time;
}

void SimulatedDeviceManager::set_log_interval(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_interval_ = interval;
}

std::vector<std::string> SimulatedDeviceManager::operations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_;
}

size_t SimulatedDeviceManager::call_count(Operation op) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string prefix = std::string(operation_name(op)) + ":";
    size_t count = 0;
    for (const auto& entry : operations_) {
        if (entry.compare(0, prefix.size(), prefix) == 0) {
            count++;
        }
    }
    return count;
}

bool SimulatedDeviceManager::enter(Operation op, const std::string& argument, std::string& error) {
    std::chrono::milliseconds delay{0};
    std::optional<std::string> failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        operations_.push_back(std::string(operation_name(op)) + ":" + argument);

        auto d = delays_.find(op);
        if (d != delays_.end()) {
            delay = d->second;
        }
        auto f = failures_.find(op);
        if (f != failures_.end()) {
            failure = f->second;
        }
    }

    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    if (failure) {
        error = *failure;
        return false;
    }
    return true;
}

SimulatedDeviceManager::SimulatedDevice* SimulatedDeviceManager::find_unlocked(const std::string& identity) {
    for (auto& sim : devices_) {
        if (sim.device.identity == identity) {
            return &sim;
        }
    }
    return nullptr;
}

void SimulatedDeviceManager::settle_boot_unlocked(SimulatedDevice& sim) {
    if (sim.boot_started && clock_.now() - *sim.boot_started >= boot_time_) {
        sim.device.status = DeviceStatus::RUNNING;
        sim.device.is_running = true;
        sim.boot_started.reset();
    }
}

std::string SimulatedDeviceManager::generate_udid_unlocked() {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "5A1E0000-0000-4000-8000-%012llX",
                  static_cast<unsigned long long>(next_udid_++));
    return buf;
}

bool SimulatedDeviceManager::list_devices(std::vector<Device>& devices, std::string& error) {
    if (!enter(Operation::LIST, "", error)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    devices.clear();
    for (auto& sim : devices_) {
        settle_boot_unlocked(sim);
        devices.push_back(sim.device);
    }
    return true;
}

bool SimulatedDeviceManager::start_device(const std::string& identity, std::string& error) {
    if (!enter(Operation::START, identity, error)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    SimulatedDevice* sim = find_unlocked(identity);
    if (!sim) {
        error = "Device '" + identity + "' not found";
        return false;
    }
    settle_boot_unlocked(*sim);
    if (sim->device.is_running || sim->boot_started) {
        error = "Device '" + sim->device.name + "' is already running";
        return false;
    }

    sim->device.status = DeviceStatus::STARTING;
    sim->boot_started = clock_.now();
    settle_boot_unlocked(*sim);
    return true;
}

bool SimulatedDeviceManager::stop_device(const std::string& identity, std::string& error) {
    if (!enter(Operation::STOP, identity, error)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    SimulatedDevice* sim = find_unlocked(identity);
    if (!sim) {
        error = "Device '" + identity + "' not found";
        return false;
    }
    settle_boot_unlocked(*sim);
    if (!sim->device.is_running && !sim->boot_started) {
        error = "Device '" + sim->device.name + "' is not running";
        return false;
    }

    sim->device.status = DeviceStatus::STOPPED;
    sim->device.is_running = false;
    sim->boot_started.reset();
    return true;
}

bool SimulatedDeviceManager::create_device(const DeviceConfig& config, std::string& error) {
    if (!enter(Operation::CREATE, config.name, error)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sim : devices_) {
        if (sim.device.name == config.name) {
            error = "Device '" + config.name + "' already exists";
            return false;
        }
    }

    SimulatedDevice sim;
    sim.device.platform = platform_;
    sim.device.identity = platform_ == Platform::ANDROID ? config.name : generate_udid_unlocked();
    sim.device.name = config.name;
    sim.device.device_type = config.device_type;
    sim.device.version = config.version;
    sim.device.status = DeviceStatus::STOPPED;
    if (config.ram_size) {
        sim.ram_size = *config.ram_size;
    }
    if (config.storage_size) {
        sim.storage_size = *config.storage_size;
    }
    devices_.push_back(sim);
    return true;
}

bool SimulatedDeviceManager::delete_device(const std::string& identity, std::string& error) {
    if (!enter(Operation::DELETE, identity, error)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = devices_.begin(); it != devices_.end(); ++it) {
        if (it->device.identity == identity) {
            devices_.erase(it);
            return true;
        }
    }
    error = "Device '" + identity + "' not found";
    return false;
}

bool SimulatedDeviceManager::wipe_device(const std::string& identity, std::string& error) {
    if (!enter(Operation::WIPE, identity, error)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    SimulatedDevice* sim = find_unlocked(identity);
    if (!sim) {
        error = "Device '" + identity + "' not found";
        return false;
    }
    settle_boot_unlocked(*sim);
    if (sim->device.is_running || sim->boot_started) {
        error = "Device '" + sim->device.name + "' must be stopped before wiping";
        return false;
    }
    sim->wipe_count++;
    return true;
}

std::optional<DeviceDetails> SimulatedDeviceManager::get_device_details(const std::string& identity,
                                                                        std::string& error) {
    if (!enter(Operation::DETAILS, identity, error)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    SimulatedDevice* sim = find_unlocked(identity);
    if (!sim) {
        error = "Device '" + identity + "' not found";
        return std::nullopt;
    }
    settle_boot_unlocked(*sim);

    DeviceDetails details = DeviceDetails::basic_from(sim->device);
    if (platform_ == Platform::ANDROID) {
        details.ram_size = sim->ram_size + " MB";
        details.storage_size = sim->storage_size + " MB";
        details.resolution = "1080x2280";
        details.dpi = "440";
        details.device_path = "~/.android/avd/" + identity + ".avd";
        details.system_image = "system-images;android-" + sim->device.version + ";google_apis;x86_64";
    } else {
        details.resolution = "1170x2532";
        details.device_path = "~/Library/Developer/CoreSimulator/Devices/" + identity;
    }
    return details;
}

bool SimulatedDeviceManager::list_device_types(std::vector<Choice>& types, std::string& error) {
    if (!enter(Operation::DEVICE_TYPES, "", error)) {
        return false;
    }

    if (platform_ == Platform::ANDROID) {
        types = {
            {"pixel_4", "Pixel 4"},
            {"pixel_6", "Pixel 6"},
            {"pixel_7_pro", "Pixel 7 Pro"},
            {"pixel_tablet", "Pixel Tablet"},
            {"wearos_large_round", "Wear OS Large Round"},
            {"tv_1080p", "Android TV (1080p)"},
            {"automotive_1024p_landscape", "Automotive (1024p landscape)"},
            {"desktop_medium", "Medium Desktop"}
        };
    } else {
        types = {
            {"com.apple.CoreSimulator.SimDeviceType.iPhone-15", "iPhone 15"},
            {"com.apple.CoreSimulator.SimDeviceType.iPhone-15-Pro", "iPhone 15 Pro"},
            {"com.apple.CoreSimulator.SimDeviceType.iPad-Pro-12-9-inch-6th-generation",
             "iPad Pro (12.9-inch) (6th generation)"}
        };
    }
    return true;
}

bool SimulatedDeviceManager::list_api_levels(std::vector<Choice>& levels, std::string& error) {
    if (!enter(Operation::API_LEVELS, "", error)) {
        return false;
    }

    levels.clear();
    if (platform_ == Platform::ANDROID) {
        for (int level = 35; level >= 28; --level) {
            std::string id = std::to_string(level);
            levels.push_back({id, describe_api_level(id)});
        }
    } else {
        levels = {
            {"com.apple.CoreSimulator.SimRuntime.iOS-17-2", "iOS 17.2"},
            {"com.apple.CoreSimulator.SimRuntime.iOS-16-4", "iOS 16.4"}
        };
    }
    return true;
}

bool SimulatedDeviceManager::stream_logs(const Device& device, const LineCallback& on_line,
                                         const KeepGoing& keep_going, std::string& error) {
    if (!enter(Operation::LOGS, device.identity, error)) {
        return false;
    }

    StreamGuard guard(active_streams_, max_streams_);
    const auto& script = platform_ == Platform::ANDROID ? android_script() : ios_script();
    size_t next_line = 0;

    while (keep_going()) {
        std::chrono::milliseconds interval;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            SimulatedDevice* sim = find_unlocked(device.identity);
            if (!sim) {
                return true;
            }
            settle_boot_unlocked(*sim);
            if (!sim->device.is_running) {
                return true;
            }
            interval = log_interval_;
        }

        const ScriptedLine& scripted = script[next_line++ % script.size()];
        if (!on_line(LogLine{scripted.level, scripted.message})) {
            return true;
        }

        // Sleep in short slices so a cancelled stream ends promptly
        auto waited = std::chrono::milliseconds(0);
        while (waited < interval) {
            if (!keep_going()) {
                return true;
            }
            auto slice = std::min(POLL_SLICE, interval - waited);
            std::this_thread::sleep_for(slice);
            waited += slice;
        }
    }
    return true;
}
