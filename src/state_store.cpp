/*
 * state_store.cpp - Thread-safe application state implementation
 */

#include "state_store.hpp"

StateStore::StateStore(const Clock& clock, StateLimits limits)
    : clock_(clock), state_(limits) {}

AppSnapshot StateStore::snapshot(size_t log_rows) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.snapshot(log_rows);
}

// =============================================================================
// Selection
// =============================================================================

Platform StateStore::active_panel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.active_panel;
}

std::optional<Device> StateStore::selected_device() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Device* device = state_.selected_device();
    if (!device) {
        return std::nullopt;
    }
    return *device;
}

std::optional<Device> StateStore::find_device(const DeviceKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& device : state_.devices(key.platform)) {
        if (device.identity == key.identity) {
            return device;
        }
    }
    return std::nullopt;
}

std::vector<Device> StateStore::devices(Platform platform) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.devices(platform);
}

bool StateStore::move_selection(int delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.move_selection(delta);
}

bool StateStore::select_first() {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.select_first();
}

bool StateStore::select_last() {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.select_last();
}

Platform StateStore::switch_panel() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.switch_panel();
    // Lines from the previous panel's stream must not land after the switch
    state_.end_log_stream();
    return state_.active_panel;
}

void StateStore::set_list_rows(size_t rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.set_list_rows(rows);
}

// =============================================================================
// Mode and dialogs
// =============================================================================

Mode StateStore::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.mode;
}

void StateStore::set_mode(Mode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.mode = mode;
    if (mode == Mode::MANAGE_API_LEVELS) {
        state_.api_level_index = 0;
    }
}

bool StateStore::open_create_form() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.mode != Mode::NORMAL) {
        return false;
    }
    state_.form.emplace(state_.active_panel);
    state_.mode = Mode::CREATE_DEVICE;
    return true;
}

void StateStore::close_create_form() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.form.reset();
    if (state_.mode == Mode::CREATE_DEVICE) {
        state_.mode = Mode::NORMAL;
    }
}

bool StateStore::edit_form(FormEdit edit, char c) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.form || state_.form->is_creating) {
        return false;
    }

    CreateDeviceForm& form = *state_.form;
    switch (edit) {
        case FormEdit::NEXT_FIELD:  form.next_field(); break;
        case FormEdit::PREV_FIELD:  form.prev_field(); break;
        case FormEdit::NEXT_OPTION: form.select_next(); break;
        case FormEdit::PREV_OPTION: form.select_prev(); break;
        case FormEdit::INSERT_CHAR: form.insert_char(c); break;
        case FormEdit::BACKSPACE:   form.backspace(); break;
    }
    return true;
}

void StateStore::set_form_choices(Platform platform, std::vector<Choice> device_types,
                                  std::vector<Choice> api_levels, bool stale) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.form || state_.form->platform() != platform) {
        return;
    }
    state_.form->set_choices(std::move(device_types), std::move(api_levels), stale);
}

void StateStore::set_form_loading(Platform platform, bool loading) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.form && state_.form->platform() == platform) {
        state_.form->is_loading = loading;
    }
}

std::optional<std::pair<Platform, DeviceConfig>> StateStore::begin_form_submit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.form || state_.form->is_creating) {
        return std::nullopt;
    }

    std::string error;
    std::optional<DeviceConfig> config = state_.form->to_config(error);
    if (!config) {
        state_.form->error_message = error;
        return std::nullopt;
    }

    state_.form->error_message.clear();
    state_.form->is_creating = true;
    state_.operation_status = "Creating device '" + config->name + "'...";
    return std::make_pair(state_.form->platform(), std::move(*config));
}

void StateStore::finish_form_submit(bool success, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.operation_status.reset();
    if (!state_.form) {
        return;
    }

    if (success) {
        state_.form.reset();
        if (state_.mode == Mode::CREATE_DEVICE) {
            state_.mode = Mode::NORMAL;
        }
    } else {
        state_.form->is_creating = false;
        state_.form->error_message = error;
    }
}

bool StateStore::open_confirm(Mode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Device* device = state_.selected_device();
    if (!device || state_.mode != Mode::NORMAL) {
        return false;
    }
    state_.confirm = ConfirmDialog{device->key(), device->name};
    state_.mode = mode;
    return true;
}

std::optional<ConfirmDialog> StateStore::take_confirm() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<ConfirmDialog> dialog = std::move(state_.confirm);
    state_.confirm.reset();
    state_.mode = Mode::NORMAL;
    return dialog;
}

void StateStore::move_api_level_selection(int delta, size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count == 0) {
        state_.api_level_index = 0;
        return;
    }
    long long next = (static_cast<long long>(state_.api_level_index) + delta) % static_cast<long long>(count);
    if (next < 0) {
        next += static_cast<long long>(count);
    }
    state_.api_level_index = static_cast<size_t>(next);
}

// =============================================================================
// Refresh
// =============================================================================

RefreshOutcome StateStore::apply_refresh(std::optional<std::vector<Device>> android,
                                         std::optional<std::vector<Device>> ios) {
    Clock::time_point now = clock_.now();
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.apply_refresh(std::move(android), std::move(ios), now);
}

std::optional<RefreshOutcome> StateStore::apply_refresh_if_newer(uint64_t sequence,
                                                                std::optional<std::vector<Device>> android,
                                                                std::optional<std::vector<Device>> ios) {
    Clock::time_point now = clock_.now();
    std::lock_guard<std::mutex> lock(mutex_);

    bool supplied = android.has_value() || ios.has_value();
    auto keep_if_newer = [this, sequence](Platform p, std::optional<std::vector<Device>>& list) {
        if (!list) {
            return;
        }
        uint64_t& applied = state_.poll_sequence(p);
        if (sequence < applied) {
            list.reset();
        } else {
            applied = sequence;
        }
    };
    keep_if_newer(Platform::ANDROID, android);
    keep_if_newer(Platform::IOS, ios);

    if (supplied && !android && !ios) {
        return std::nullopt;
    }
    return state_.apply_refresh(std::move(android), std::move(ios), now);
}

bool StateStore::should_auto_refresh() const {
    Clock::time_point now = clock_.now();
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.should_auto_refresh(now);
}

bool StateStore::is_loading() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.is_loading;
}

// =============================================================================
// Pending start and operation status
// =============================================================================

void StateStore::set_pending_start(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.pending_device_start = name;
}

void StateStore::clear_pending_start() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.pending_device_start.reset();
}

std::optional<std::string> StateStore::pending_start() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.pending_device_start;
}

std::chrono::seconds StateStore::auto_refresh_interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.auto_refresh_interval();
}

void StateStore::set_operation_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.operation_status = status;
}

void StateStore::clear_operation_status() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.operation_status.reset();
}

// =============================================================================
// Optimistic updates
// =============================================================================

std::optional<Device> StateStore::set_device_status(const DeviceKey& key, DeviceStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.set_device_status(key, status);
}

bool StateStore::restore_device(const Device& previous) {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.restore_device(previous);
}

std::optional<std::pair<size_t, Device>> StateStore::remove_device(const DeviceKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.remove_device(key);
}

void StateStore::insert_device(size_t index, Device device) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.insert_device(index, std::move(device));
}

// =============================================================================
// Log streaming
// =============================================================================

std::optional<DeviceKey> StateStore::log_device() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.logs.device;
}

uint64_t StateStore::begin_log_stream_for(const DeviceKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Device* selected = state_.selected_device();
    if (!selected || selected->key() != key || !selected->is_running) {
        return 0;
    }
    return state_.begin_log_stream(key);
}

void StateStore::end_log_stream() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.end_log_stream();
}

bool StateStore::end_log_stream_if(uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.logs.device || state_.logs.generation != generation) {
        return false;
    }
    state_.end_log_stream();
    return true;
}

void StateStore::end_log_stream_for(const DeviceKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.logs.device && *state_.logs.device == key) {
        state_.end_log_stream();
    }
}

bool StateStore::append_log_if_current(uint64_t generation, LogEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.append_log_if_current(generation, std::move(entry));
}

bool StateStore::is_current_log_stream(uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.logs.device.has_value() && state_.logs.generation == generation;
}

// =============================================================================
// Log view
// =============================================================================

void StateStore::clear_logs() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.clear_logs();
}

void StateStore::cycle_log_filter() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.cycle_log_filter();
}

void StateStore::toggle_fullscreen_logs() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.logs.fullscreen = !state_.logs.fullscreen;
}

void StateStore::scroll_logs(int lines) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.scroll_logs(lines);
}

void StateStore::scroll_logs_to_end() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.scroll_logs_to_end();
}

// =============================================================================
// Details
// =============================================================================

bool StateStore::set_details_if_selected(DeviceDetails details) {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.set_details_if_selected(std::move(details));
}

void StateStore::clear_details_for(const DeviceKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.clear_details_for(key);
}

// =============================================================================
// Notifications
// =============================================================================

void StateStore::notify(NotificationType type, const std::string& message) {
    Clock::time_point now = clock_.now();
    std::lock_guard<std::mutex> lock(mutex_);
    state_.notify(type, message, now);
}

void StateStore::notify_persistent(NotificationType type, const std::string& message) {
    Clock::time_point now = clock_.now();
    std::lock_guard<std::mutex> lock(mutex_);
    state_.notify_persistent(type, message, now);
}

size_t StateStore::dismiss_expired_notifications() {
    Clock::time_point now = clock_.now();
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.notifications.dismiss_expired(now);
}

void StateStore::dismiss_all_notifications() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.notifications.dismiss_all();
}

size_t StateStore::notification_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.notifications.size();
}
