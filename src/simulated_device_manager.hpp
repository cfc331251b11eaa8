/*
 * simulated_device_manager.hpp - In-memory device manager
 *
 * A DeviceManager that keeps its devices in memory and simulates the
 * behaviour of the real tooling: configurable call latency, a boot time
 * before a started device reports running, injected failures per operation
 * and a synthetic log source. It backs the demo mode of the dashboard and
 * the unit tests.
 *
 * Every call is recorded as "<operation>:<argument>" so tests can assert on
 * the exact sequence of commands that reached the backend.
 */

#pragma once

#include "clock.hpp"
#include "device_manager.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

enum class Operation {
    LIST, START, STOP, CREATE, DELETE, WIPE, DETAILS, DEVICE_TYPES, API_LEVELS, LOGS
};

const char* operation_name(Operation op);

class SimulatedDeviceManager : public DeviceManager {
public:
    static constexpr std::chrono::milliseconds DEFAULT_BOOT_TIME{3000};
    static constexpr std::chrono::milliseconds DEFAULT_LOG_INTERVAL{400};
    static constexpr std::chrono::milliseconds POLL_SLICE{20};

    SimulatedDeviceManager(Platform platform, const Clock& clock, bool with_defaults = true);

    // Non-copyable
    SimulatedDeviceManager(const SimulatedDeviceManager&) = delete;
    SimulatedDeviceManager& operator=(const SimulatedDeviceManager&) = delete;

    // Setup
    void add_device(const Device& device);
    void configure_failure(Operation op, const std::string& message);
    void clear_failure(Operation op);
    void configure_delay(Operation op, std::chrono::milliseconds delay);
    void set_boot_time(std::chrono::milliseconds boot_time);
    void set_log_interval(std::chrono::milliseconds interval);

    // Inspection
    std::vector<std::string> operations() const;
    size_t call_count(Operation op) const;
    int active_log_streams() const { return active_streams_.load(); }
    int max_concurrent_log_streams() const { return max_streams_.load(); }

    // DeviceManager
    Platform platform() const override { return platform_; }
    bool list_devices(std::vector<Device>& devices, std::string& error) override;
    bool start_device(const std::string& identity, std::string& error) override;
    bool stop_device(const std::string& identity, std::string& error) override;
    bool create_device(const DeviceConfig& config, std::string& error) override;
    bool delete_device(const std::string& identity, std::string& error) override;
    bool wipe_device(const std::string& identity, std::string& error) override;
    std::optional<DeviceDetails> get_device_details(const std::string& identity,
                                                    std::string& error) override;
    bool list_device_types(std::vector<Choice>& types, std::string& error) override;
    bool list_api_levels(std::vector<Choice>& levels, std::string& error) override;
    bool stream_logs(const Device& device, const LineCallback& on_line,
                     const KeepGoing& keep_going, std::string& error) override;

private:
    struct SimulatedDevice {
        Device device;
        std::optional<Clock::time_point> boot_started;
        std::string ram_size = "2048";
        std::string storage_size = "8192";
        uint64_t wipe_count = 0;
    };

    Platform platform_;
    const Clock& clock_;

    mutable std::mutex mutex_;
    std::vector<SimulatedDevice> devices_;
    std::map<Operation, std::string> failures_;
    std::map<Operation, std::chrono::milliseconds> delays_;
    std::vector<std::string> operations_;
    std::chrono::milliseconds boot_time_ = DEFAULT_BOOT_TIME;
    std::chrono::milliseconds log_interval_ = DEFAULT_LOG_INTERVAL;
    uint64_t next_udid_ = 1;

    std::atomic<int> active_streams_{0};
    std::atomic<int> max_streams_{0};

    // Records the call, applies the configured delay and failure.
    // Returns false (with error set) if a failure is configured.
    bool enter(Operation op, const std::string& argument, std::string& error);

    SimulatedDevice* find_unlocked(const std::string& identity);
    void settle_boot_unlocked(SimulatedDevice& sim);
    std::string generate_udid_unlocked();
    void add_defaults();
};
