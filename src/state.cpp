/*
 * state.cpp - Application state logic
 *
 * Nothing in here blocks or calls out: every method is run by StateStore
 * while it holds its lock.
 */

#include "state.hpp"
#include "device_merge.hpp"
#include <algorithm>

bool LogBuffer::passes_filter(const LogEntry& entry) const {
    if (!filter) {
        return true;
    }
    return entry.level == *filter;
}

size_t LogBuffer::filtered_count() const {
    if (!filter) {
        return entries.size();
    }
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
                                             [this](const LogEntry& e) { return passes_filter(e); }));
}

AppState::AppState(StateLimits limits_in)
    : limits(limits_in), notifications(limits_in.max_notifications) {}

// =============================================================================
// Selection
// =============================================================================

std::vector<Device>& AppState::devices(Platform p) {
    return p == Platform::ANDROID ? android_devices : ios_devices;
}

const std::vector<Device>& AppState::devices(Platform p) const {
    return p == Platform::ANDROID ? android_devices : ios_devices;
}

size_t& AppState::selected_index(Platform p) {
    return p == Platform::ANDROID ? android_selected : ios_selected;
}

size_t AppState::selected_index(Platform p) const {
    return p == Platform::ANDROID ? android_selected : ios_selected;
}

size_t& AppState::scroll_offset(Platform p) {
    return p == Platform::ANDROID ? android_scroll : ios_scroll;
}

uint64_t& AppState::poll_sequence(Platform p) {
    return p == Platform::ANDROID ? android_poll_sequence : ios_poll_sequence;
}

const Device* AppState::selected_device() const {
    const auto& list = devices(active_panel);
    size_t index = selected_index(active_panel);
    if (index >= list.size()) {
        return nullptr;
    }
    return &list[index];
}

Device* AppState::find_device(const DeviceKey& key) {
    for (auto& device : devices(key.platform)) {
        if (device.identity == key.identity) {
            return &device;
        }
    }
    return nullptr;
}

bool AppState::move_selection(int delta) {
    const auto& list = devices(active_panel);
    if (list.empty() || delta == 0) {
        return false;
    }

    long long count = static_cast<long long>(list.size());
    size_t& index = selected_index(active_panel);
    long long next = (static_cast<long long>(index) + delta) % count;
    if (next < 0) {
        next += count;
    }

    size_t previous = index;
    index = static_cast<size_t>(next);
    ensure_visible(active_panel);
    return index != previous;
}

bool AppState::select_first() {
    if (devices(active_panel).empty()) {
        return false;
    }
    size_t& index = selected_index(active_panel);
    size_t previous = index;
    index = 0;
    ensure_visible(active_panel);
    return index != previous;
}

bool AppState::select_last() {
    const auto& list = devices(active_panel);
    if (list.empty()) {
        return false;
    }
    size_t& index = selected_index(active_panel);
    size_t previous = index;
    index = list.size() - 1;
    ensure_visible(active_panel);
    return index != previous;
}

void AppState::switch_panel() {
    active_panel = other_platform(active_panel);
    smart_clear_details();
}

void AppState::set_list_rows(size_t rows) {
    list_rows = std::max<size_t>(rows, 1);
    ensure_visible(Platform::ANDROID);
    ensure_visible(Platform::IOS);
}

void AppState::ensure_visible(Platform p) {
    size_t count = devices(p).size();
    size_t& scroll = scroll_offset(p);
    size_t index = selected_index(p);

    if (count <= list_rows) {
        scroll = 0;
        return;
    }
    if (index < scroll) {
        scroll = index;
    } else if (index >= scroll + list_rows) {
        scroll = index - list_rows + 1;
    }
    scroll = std::min(scroll, count - list_rows);
}

// =============================================================================
// Refresh
// =============================================================================

RefreshOutcome AppState::apply_refresh(std::optional<std::vector<Device>> android,
                                       std::optional<std::vector<Device>> ios,
                                       Clock::time_point now) {
    RefreshOutcome outcome;

    std::optional<DeviceKey> before;
    if (const Device* selected = selected_device()) {
        before = selected->key();
    }

    std::vector<DeviceKey> started;

    auto merge_platform = [&](Platform p, std::optional<std::vector<Device>>& fresh) {
        if (!fresh) {
            return;
        }

        std::vector<Device>& list = devices(p);
        size_t& index = selected_index(p);
        std::optional<DeviceKey> selected_key;
        if (index < list.size()) {
            selected_key = list[index].key();
        }

        MergeResult merged = merge_devices(std::move(list), *fresh);
        outcome.changed = outcome.changed || merged.changed();
        started.insert(started.end(), merged.started.begin(), merged.started.end());
        list = std::move(merged.devices);

        // Follow the selected device by identity, clamp if it is gone
        bool found = false;
        if (selected_key) {
            for (size_t i = 0; i < list.size(); ++i) {
                if (list[i].key() == *selected_key) {
                    index = i;
                    found = true;
                    break;
                }
            }
        }
        if (!found) {
            index = list.empty() ? 0 : std::min(index, list.size() - 1);
        }
        ensure_visible(p);
    };

    merge_platform(Platform::ANDROID, android);
    merge_platform(Platform::IOS, ios);

    is_loading = false;
    last_refresh = now;

    const Device* after = selected_device();
    if (before.has_value() != (after != nullptr) || (after && *before != after->key())) {
        outcome.selection_changed = true;
    }
    if (after && std::find(started.begin(), started.end(), after->key()) != started.end()) {
        outcome.selected_started = true;
    }

    if (logs.device) {
        Device* streamed = find_device(*logs.device);
        if (!streamed || !streamed->is_running) {
            outcome.log_device_gone = true;
        }
    }

    if (pending_device_start) {
        for (Platform p : {Platform::ANDROID, Platform::IOS}) {
            for (const auto& device : devices(p)) {
                if (device.name == *pending_device_start && device.is_running) {
                    outcome.confirmed_start = device.name;
                    break;
                }
            }
            if (outcome.confirmed_start) {
                break;
            }
        }
        if (outcome.confirmed_start) {
            notify(NotificationType::SUCCESS,
                   "Device '" + *outcome.confirmed_start + "' is now running!", now);
            pending_device_start.reset();
            operation_status.reset();
        }
    }

    return outcome;
}

std::chrono::seconds AppState::auto_refresh_interval() const {
    return pending_device_start ? limits.pending_refresh_interval : limits.auto_refresh_interval;
}

bool AppState::should_auto_refresh(Clock::time_point now) const {
    if (!last_refresh) {
        return true;
    }
    return now - *last_refresh >= auto_refresh_interval();
}

// =============================================================================
// Optimistic updates
// =============================================================================

std::optional<Device> AppState::set_device_status(const DeviceKey& key, DeviceStatus status) {
    Device* device = find_device(key);
    if (!device) {
        return std::nullopt;
    }

    Device previous = *device;
    device->status = status;
    if (status == DeviceStatus::RUNNING) {
        device->is_running = true;
    } else if (status == DeviceStatus::STOPPED) {
        device->is_running = false;
    }
    device->revision++;
    return previous;
}

bool AppState::restore_device(const Device& previous) {
    Device* device = find_device(previous.key());
    if (!device) {
        return false;
    }
    uint64_t revision = device->revision;
    *device = previous;
    device->revision = revision + 1;
    return true;
}

std::optional<std::pair<size_t, Device>> AppState::remove_device(const DeviceKey& key) {
    auto& list = devices(key.platform);
    for (size_t i = 0; i < list.size(); ++i) {
        if (list[i].identity != key.identity) {
            continue;
        }

        Device removed = std::move(list[i]);
        list.erase(list.begin() + static_cast<std::ptrdiff_t>(i));

        size_t& index = selected_index(key.platform);
        if (list.empty()) {
            index = 0;
        } else if (index >= list.size()) {
            index = list.size() - 1;
        }
        ensure_visible(key.platform);

        if (cached_details && cached_details->key == key) {
            cached_details.reset();
        }
        return std::make_pair(i, std::move(removed));
    }
    return std::nullopt;
}

void AppState::insert_device(size_t index, Device device) {
    if (find_device(device.key())) {
        return;
    }
    auto& list = devices(device.platform);
    index = std::min(index, list.size());
    list.insert(list.begin() + static_cast<std::ptrdiff_t>(index), std::move(device));
    ensure_visible(list[index].platform);
}

// =============================================================================
// Logs
// =============================================================================

uint64_t AppState::begin_log_stream(const DeviceKey& key) {
    logs.generation++;
    logs.device = key;
    logs.entries.clear();
    logs.scroll_offset = 0;
    logs.auto_scroll = true;
    return logs.generation;
}

void AppState::end_log_stream() {
    logs.generation++;
    logs.device.reset();
}

bool AppState::append_log_if_current(uint64_t generation, LogEntry entry) {
    if (!logs.device || generation != logs.generation) {
        return false;
    }
    append_log(std::move(entry));
    return true;
}

void AppState::append_log(LogEntry entry) {
    bool visible = logs.passes_filter(entry);
    logs.entries.push_back(std::move(entry));

    if (logs.entries.size() > limits.max_log_entries) {
        logs.entries.pop_front();
    }

    // Keep a manually scrolled view on the same lines
    if (!logs.auto_scroll && visible) {
        size_t count = logs.filtered_count();
        logs.scroll_offset = std::min(logs.scroll_offset + 1, count == 0 ? 0 : count - 1);
    }
}

void AppState::clear_logs() {
    logs.entries.clear();
    logs.scroll_offset = 0;
    logs.auto_scroll = true;
}

void AppState::cycle_log_filter() {
    if (!logs.filter) {
        logs.filter = LogLevel::ERROR;
    } else if (*logs.filter == LogLevel::ERROR) {
        logs.filter = LogLevel::WARN;
    } else if (*logs.filter == LogLevel::WARN) {
        logs.filter = LogLevel::INFO;
    } else if (*logs.filter == LogLevel::INFO) {
        logs.filter = LogLevel::DEBUG;
    } else {
        logs.filter.reset();
    }
    scroll_logs_to_end();
}

void AppState::scroll_logs(int lines) {
    size_t count = logs.filtered_count();
    size_t max_offset = count == 0 ? 0 : count - 1;

    long long next = static_cast<long long>(logs.scroll_offset) + lines;
    if (next < 0) {
        next = 0;
    }
    logs.scroll_offset = std::min(static_cast<size_t>(next), max_offset);
    logs.auto_scroll = logs.scroll_offset == 0;
}

void AppState::scroll_logs_to_end() {
    logs.scroll_offset = 0;
    logs.auto_scroll = true;
}

// =============================================================================
// Details
// =============================================================================

bool AppState::set_details_if_selected(DeviceDetails details) {
    const Device* selected = selected_device();
    if (!selected || selected->key() != details.key) {
        return false;
    }
    cached_details = std::move(details);
    return true;
}

void AppState::clear_details_for(const DeviceKey& key) {
    if (cached_details && cached_details->key == key) {
        cached_details.reset();
    }
}

void AppState::smart_clear_details() {
    if (cached_details && cached_details->key.platform != active_panel) {
        cached_details.reset();
    }
}

std::optional<DeviceDetails> AppState::resolved_details() const {
    const Device* selected = selected_device();
    if (!selected) {
        return std::nullopt;
    }
    if (cached_details && cached_details->key == selected->key()) {
        return cached_details;
    }
    return DeviceDetails::basic_from(*selected);
}

// =============================================================================
// Notifications
// =============================================================================

void AppState::notify(NotificationType type, std::string message, Clock::time_point now) {
    notifications.push(Notification::make(type, std::move(message), now, limits.notification_dismiss));
}

void AppState::notify_persistent(NotificationType type, std::string message, Clock::time_point now) {
    notifications.push(Notification::make(type, std::move(message), now, std::nullopt));
}

// =============================================================================
// Snapshot
// =============================================================================

AppSnapshot AppState::snapshot(size_t log_rows) const {
    AppSnapshot snap;
    snap.active_panel = active_panel;
    snap.mode = mode;
    snap.is_loading = is_loading;

    snap.android_devices = android_devices;
    snap.ios_devices = ios_devices;
    snap.android_selected = android_selected;
    snap.ios_selected = ios_selected;
    snap.android_scroll = android_scroll;
    snap.ios_scroll = ios_scroll;

    if (const Device* selected = selected_device()) {
        snap.selected = *selected;
    }
    snap.details = resolved_details();

    // Only the window the log panel can show is copied out
    snap.total_logs = logs.filtered_count();
    snap.log_scroll = logs.scroll_offset;
    snap.log_auto_scroll = logs.auto_scroll;
    snap.log_filter = logs.filter;
    snap.fullscreen_logs = logs.fullscreen;
    snap.log_device = logs.device;

    size_t skip = logs.scroll_offset;
    for (auto it = logs.entries.rbegin(); it != logs.entries.rend() && snap.visible_logs.size() < log_rows; ++it) {
        if (!logs.passes_filter(*it)) {
            continue;
        }
        if (skip > 0) {
            skip--;
            continue;
        }
        snap.visible_logs.push_back(*it);
    }
    std::reverse(snap.visible_logs.begin(), snap.visible_logs.end());

    snap.notifications.assign(notifications.entries().begin(), notifications.entries().end());
    snap.operation_status = operation_status;
    snap.pending_start = pending_device_start;
    snap.form = form;
    snap.confirm = confirm;
    snap.api_level_index = api_level_index;
    return snap;
}
