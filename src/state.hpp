/*
 * state.hpp - Application state
 *
 * AppState is the single record of everything the dashboard knows: both
 * device lists and the selection in each, the current mode and dialogs,
 * the streamed log buffer, cached device details, notifications and the
 * pending-start marker.
 *
 * AppState itself is not synchronised. The only instance lives inside
 * StateStore, which serialises every access under one mutex; the methods
 * here are the plain logic the store runs while holding that lock, which is
 * also what the unit tests exercise directly.
 */

#pragma once

#include "clock.hpp"
#include "create_form.hpp"
#include "device.hpp"
#include "notification.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class Mode { NORMAL, CREATE_DEVICE, CONFIRM_DELETE, CONFIRM_WIPE, MANAGE_API_LEVELS, HELP };

struct ConfirmDialog {
    DeviceKey key;
    std::string name;
};

struct StateLimits {
    size_t max_log_entries = 1000;
    size_t max_notifications = NotificationQueue::DEFAULT_CAPACITY;
    std::chrono::milliseconds notification_dismiss = Notification::DEFAULT_DISMISS;
    std::chrono::seconds auto_refresh_interval{3};
    std::chrono::seconds pending_refresh_interval{1};
};

struct RefreshOutcome {
    bool changed = false;
    // A different device (or none) is selected in the active panel now
    bool selection_changed = false;
    // The selected device transitioned to running during this refresh
    bool selected_started = false;
    // The streamed device disappeared or stopped running
    bool log_device_gone = false;
    // Name whose pending start was confirmed by this refresh
    std::optional<std::string> confirmed_start;
};

struct LogBuffer {
    std::deque<LogEntry> entries;
    std::optional<LogLevel> filter;
    size_t scroll_offset = 0;  // lines scrolled up from the newest entry
    bool auto_scroll = true;
    bool fullscreen = false;

    // Owning stream: generation is bumped every time a stream begins or ends
    std::optional<DeviceKey> device;
    uint64_t generation = 0;

    bool passes_filter(const LogEntry& entry) const;
    size_t filtered_count() const;
};

// Read-only copy of the state handed to the renderer
struct AppSnapshot {
    Platform active_panel = Platform::ANDROID;
    Mode mode = Mode::NORMAL;
    bool is_loading = false;

    std::vector<Device> android_devices;
    std::vector<Device> ios_devices;
    size_t android_selected = 0;
    size_t ios_selected = 0;
    size_t android_scroll = 0;
    size_t ios_scroll = 0;

    std::optional<Device> selected;
    std::optional<DeviceDetails> details;

    std::vector<LogEntry> visible_logs;
    size_t total_logs = 0;
    size_t log_scroll = 0;
    bool log_auto_scroll = true;
    std::optional<LogLevel> log_filter;
    bool fullscreen_logs = false;
    std::optional<DeviceKey> log_device;

    std::vector<Notification> notifications;
    std::optional<std::string> operation_status;
    std::optional<std::string> pending_start;

    std::optional<CreateDeviceForm> form;
    std::optional<ConfirmDialog> confirm;
    size_t api_level_index = 0;

    const std::vector<Device>& devices(Platform p) const {
        return p == Platform::ANDROID ? android_devices : ios_devices;
    }
};

struct AppState {
    explicit AppState(StateLimits limits = StateLimits());

    StateLimits limits;

    // Devices and selection
    std::vector<Device> android_devices;
    std::vector<Device> ios_devices;
    Platform active_panel = Platform::ANDROID;
    size_t android_selected = 0;
    size_t ios_selected = 0;
    size_t android_scroll = 0;
    size_t ios_scroll = 0;
    size_t list_rows = 10;
    bool is_loading = true;

    // Mode and dialogs
    Mode mode = Mode::NORMAL;
    std::optional<CreateDeviceForm> form;
    std::optional<ConfirmDialog> confirm;
    size_t api_level_index = 0;

    LogBuffer logs;
    std::optional<DeviceDetails> cached_details;
    NotificationQueue notifications;

    std::optional<std::string> pending_device_start;
    std::optional<std::string> operation_status;
    std::optional<Clock::time_point> last_refresh;
    uint64_t android_poll_sequence = 0;
    uint64_t ios_poll_sequence = 0;

    // Selection
    std::vector<Device>& devices(Platform p);
    const std::vector<Device>& devices(Platform p) const;
    size_t& selected_index(Platform p);
    size_t selected_index(Platform p) const;
    size_t& scroll_offset(Platform p);
    uint64_t& poll_sequence(Platform p);
    const Device* selected_device() const;
    Device* find_device(const DeviceKey& key);

    // Moves the active selection by delta with wrap-around. Returns true if
    // a different index is now selected.
    bool move_selection(int delta);
    bool select_first();
    bool select_last();
    void switch_panel();
    void set_list_rows(size_t rows);
    void ensure_visible(Platform p);

    // Merges polled lists (std::nullopt = that platform's poll failed and
    // keeps its current list) and applies pending-start handling
    RefreshOutcome apply_refresh(std::optional<std::vector<Device>> android,
                                 std::optional<std::vector<Device>> ios,
                                 Clock::time_point now);
    std::chrono::seconds auto_refresh_interval() const;
    bool should_auto_refresh(Clock::time_point now) const;

    // Optimistic device updates; the returned copy is used for rollback
    std::optional<Device> set_device_status(const DeviceKey& key, DeviceStatus status);
    bool restore_device(const Device& previous);
    std::optional<std::pair<size_t, Device>> remove_device(const DeviceKey& key);
    void insert_device(size_t index, Device device);

    // Logs
    uint64_t begin_log_stream(const DeviceKey& key);
    void end_log_stream();
    bool append_log_if_current(uint64_t generation, LogEntry entry);
    void append_log(LogEntry entry);
    void clear_logs();
    void cycle_log_filter();
    void scroll_logs(int lines);
    void scroll_logs_to_end();

    // Details
    bool set_details_if_selected(DeviceDetails details);
    void clear_details_for(const DeviceKey& key);
    void smart_clear_details();
    std::optional<DeviceDetails> resolved_details() const;

    // Notifications
    void notify(NotificationType type, std::string message, Clock::time_point now);
    void notify_persistent(NotificationType type, std::string message, Clock::time_point now);

    AppSnapshot snapshot(size_t log_rows) const;
};
