/*
 * state_store.hpp - Thread-safe application state
 *
 * StateStore owns the one AppState instance and is the only way to reach
 * it. Every public method takes the mutex for the duration of a short,
 * non-blocking update and releases it before returning, so the UI thread
 * and any number of background tasks can share the state without ever
 * holding the lock across a device manager call or a sleep.
 *
 * Background tasks must not act on state they read earlier: checks that
 * guard a write (is this stream still current, is this still the selected
 * device) are folded into a single method so the check and the write
 * happen under the same lock hold.
 */

#pragma once

#include "clock.hpp"
#include "state.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class FormEdit { NEXT_FIELD, PREV_FIELD, NEXT_OPTION, PREV_OPTION, INSERT_CHAR, BACKSPACE };

class StateStore {
public:
    explicit StateStore(const Clock& clock, StateLimits limits = StateLimits());

    // Non-copyable
    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    const Clock& clock() const { return clock_; }

    // Copy of everything the renderer needs; log_rows bounds the log window
    AppSnapshot snapshot(size_t log_rows) const;

    // Selection
    Platform active_panel() const;
    std::optional<Device> selected_device() const;
    std::optional<Device> find_device(const DeviceKey& key) const;
    std::vector<Device> devices(Platform platform) const;
    bool move_selection(int delta);
    bool select_first();
    bool select_last();
    Platform switch_panel();
    void set_list_rows(size_t rows);

    // Mode and dialogs
    Mode mode() const;
    void set_mode(Mode mode);
    bool open_create_form();
    void close_create_form();
    bool edit_form(FormEdit edit, char c = 0);
    void set_form_choices(Platform platform, std::vector<Choice> device_types,
                          std::vector<Choice> api_levels, bool stale);
    void set_form_loading(Platform platform, bool loading);
    // Validates the open form and marks it as submitting. On a validation
    // failure the error is shown inline and std::nullopt is returned.
    std::optional<std::pair<Platform, DeviceConfig>> begin_form_submit();
    void finish_form_submit(bool success, const std::string& error);
    bool open_confirm(Mode mode);
    std::optional<ConfirmDialog> take_confirm();
    void move_api_level_selection(int delta, size_t count);

    // Refresh
    RefreshOutcome apply_refresh(std::optional<std::vector<Device>> android,
                                 std::optional<std::vector<Device>> ios);
    // Same, for a poll numbered when it started: a platform list older than
    // the last one applied for that platform is discarded. Returns
    // std::nullopt when every supplied list was discarded.
    std::optional<RefreshOutcome> apply_refresh_if_newer(uint64_t sequence,
                                                         std::optional<std::vector<Device>> android,
                                                         std::optional<std::vector<Device>> ios);
    bool should_auto_refresh() const;
    bool is_loading() const;

    // Pending start and device operation status
    void set_pending_start(const std::string& name);
    void clear_pending_start();
    std::optional<std::string> pending_start() const;
    std::chrono::seconds auto_refresh_interval() const;
    void set_operation_status(const std::string& status);
    void clear_operation_status();

    // Optimistic updates
    std::optional<Device> set_device_status(const DeviceKey& key, DeviceStatus status);
    bool restore_device(const Device& previous);
    std::optional<std::pair<size_t, Device>> remove_device(const DeviceKey& key);
    void insert_device(size_t index, Device device);

    // Log streaming
    std::optional<DeviceKey> log_device() const;
    // Starts a stream generation for key if it is still the selected,
    // running device. Returns 0 if the selection moved on.
    uint64_t begin_log_stream_for(const DeviceKey& key);
    void end_log_stream();
    bool end_log_stream_if(uint64_t generation);
    void end_log_stream_for(const DeviceKey& key);
    bool append_log_if_current(uint64_t generation, LogEntry entry);
    bool is_current_log_stream(uint64_t generation) const;

    // Log view
    void clear_logs();
    void cycle_log_filter();
    void toggle_fullscreen_logs();
    void scroll_logs(int lines);
    void scroll_logs_to_end();

    // Details
    bool set_details_if_selected(DeviceDetails details);
    void clear_details_for(const DeviceKey& key);

    // Notifications
    void notify(NotificationType type, const std::string& message);
    void notify_persistent(NotificationType type, const std::string& message);
    size_t dismiss_expired_notifications();
    void dismiss_all_notifications();
    size_t notification_count() const;

private:
    const Clock& clock_;
    mutable std::mutex mutex_;
    AppState state_;
};
