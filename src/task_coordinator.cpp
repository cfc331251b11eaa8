/*
 * task_coordinator.cpp - Background task lifecycle implementation
 *
 * Threads are never joined while a lock is held unless they have already
 * finished: a running task may itself call back into the coordinator (a
 * refresh that notices a new selection schedules detail and log tasks).
 */

#include "task_coordinator.hpp"
#include <spdlog/spdlog.h>

const char* task_kind_name(TaskKind kind) {
    switch (kind) {
        case TaskKind::LOG_STREAM:    return "log-stream";
        case TaskKind::DETAIL_UPDATE: return "detail-update";
        case TaskKind::PANEL_SWITCH:  return "panel-switch";
        case TaskKind::STATUS_CHECK:  return "status-check";
        case TaskKind::REFRESH:       return "refresh";
    }
    return "unknown";
}

TaskCoordinator::TaskCoordinator(StateStore& store, DeviceCache& cache, DeviceBackends backends,
                                 TaskTimings timings)
    : store_(store), cache_(cache), backends_(std::move(backends)), timings_(timings) {}

TaskCoordinator::~TaskCoordinator() {
    shutdown();
}

// =============================================================================
// Handle management
// =============================================================================

TaskCoordinator::TaskHandle TaskCoordinator::spawn(std::function<void(CancellationToken&)> body) {
    TaskHandle handle;
    handle.token = std::make_shared<CancellationToken>();
    handle.done = std::make_shared<std::atomic<bool>>(false);

    CancellationTokenPtr token = handle.token;
    std::shared_ptr<std::atomic<bool>> done = handle.done;
    handle.thread = std::thread([body = std::move(body), token, done]() {
        body(*token);
        done->store(true);
    });
    return handle;
}

void TaskCoordinator::replace(TaskSlot slot, std::function<void(CancellationToken&)> body) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
        return;
    }

    // The superseded task is cancelled before its replacement exists
    auto it = tasks_.find(slot);
    if (it != tasks_.end()) {
        it->second.token->cancel();
        retired_.push_back(std::move(it->second));
        tasks_.erase(it);
        spdlog::debug("cancelled {} task", task_kind_name(slot.first));
    }
    reap_unlocked();

    tasks_.emplace(slot, spawn(std::move(body)));
    spdlog::debug("started {} task", task_kind_name(slot.first));
}

void TaskCoordinator::run_job(const std::string& name, std::function<void()> job) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
        spdlog::warn("dropping job '{}' during shutdown", name);
        return;
    }

    reap_unlocked();
    spdlog::debug("started job '{}'", name);
    retired_.push_back(spawn([job = std::move(job)](CancellationToken&) { job(); }));
}

bool TaskCoordinator::is_active(TaskKind kind, std::optional<Platform> platform) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(TaskSlot(kind, platform));
    return it != tasks_.end() && !it->second.done->load();
}

void TaskCoordinator::cancel(TaskKind kind, std::optional<Platform> platform) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(TaskSlot(kind, platform));
    if (it == tasks_.end()) {
        return;
    }
    it->second.token->cancel();
    retired_.push_back(std::move(it->second));
    tasks_.erase(it);
}

void TaskCoordinator::reap() {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_unlocked();
}

void TaskCoordinator::reap_unlocked() {
    // Only finished threads: joining them cannot wait on our mutex
    for (auto it = retired_.begin(); it != retired_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = retired_.erase(it);
        } else {
            ++it;
        }
    }
}

void TaskCoordinator::shutdown() {
    std::vector<TaskHandle> handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        for (auto& entry : tasks_) {
            entry.second.token->cancel();
            handles.push_back(std::move(entry.second));
        }
        tasks_.clear();
        for (auto& handle : retired_) {
            handle.token->cancel();
            handles.push_back(std::move(handle));
        }
        retired_.clear();
    }

    for (auto& handle : handles) {
        if (handle.thread.joinable()) {
            handle.thread.join();
        }
    }
}

// =============================================================================
// Scheduling
// =============================================================================

void TaskCoordinator::on_selection_changed() {
    schedule_detail_update(timings_.detail_debounce);
    start_log_stream(timings_.log_delay);
}

void TaskCoordinator::on_panel_switched() {
    cancel(TaskKind::LOG_STREAM);
    cancel(TaskKind::DETAIL_UPDATE);

    replace(TaskSlot(TaskKind::PANEL_SWITCH, std::nullopt), [this](CancellationToken& token) {
        if (!token.sleep_for(timings_.fast_detail_debounce)) {
            return;
        }
        // Each replacement runs on its own thread
        schedule_detail_update(std::chrono::milliseconds(0));
        start_log_stream(timings_.fast_log_delay);
    });
}

void TaskCoordinator::start_log_stream(std::chrono::milliseconds delay) {
    std::optional<Device> selected = store_.selected_device();
    if (!selected || !selected->is_running) {
        cancel(TaskKind::LOG_STREAM);
        store_.end_log_stream();
        return;
    }

    std::optional<DeviceKey> streaming = store_.log_device();
    if (streaming && *streaming == selected->key() && is_active(TaskKind::LOG_STREAM)) {
        return;
    }

    Device device = *selected;
    replace(TaskSlot(TaskKind::LOG_STREAM, std::nullopt), [this, device, delay](CancellationToken& token) {
        run_log_stream(device, delay, token);
    });
}

void TaskCoordinator::schedule_detail_update(std::chrono::milliseconds delay) {
    replace(TaskSlot(TaskKind::DETAIL_UPDATE, std::nullopt), [this, delay](CancellationToken& token) {
        run_detail_update(delay, token);
    });
}

void TaskCoordinator::schedule_status_check(Platform platform) {
    replace(TaskSlot(TaskKind::STATUS_CHECK, platform), [this, platform](CancellationToken& token) {
        run_status_check(platform, token);
    });
}

void TaskCoordinator::request_refresh(bool user_initiated) {
    if (!user_initiated && is_active(TaskKind::REFRESH)) {
        return;
    }
    replace(TaskSlot(TaskKind::REFRESH, std::nullopt), [this, user_initiated](CancellationToken& token) {
        run_refresh(user_initiated, token);
    });
}

void TaskCoordinator::load_cache(Platform platform, bool force) {
    if (!backends_.get(platform)) {
        return;
    }

    if (force) {
        cache_.invalidate(platform);
    }

    if (std::optional<CacheEntry> entry = cache_.get(platform)) {
        store_.set_form_choices(platform, entry->device_types, entry->api_levels, false);
        return;
    }

    // Show what we had while the reload runs
    if (std::optional<CacheEntry> stale = cache_.get_last_known(platform)) {
        store_.set_form_choices(platform, stale->device_types, stale->api_levels, true);
    }

    if (!cache_.begin_loading(platform)) {
        return;
    }
    store_.set_form_loading(platform, true);
    run_job(std::string("cache load ") + platform_name(platform), [this, platform]() {
        run_cache_load(platform);
    });
}

// =============================================================================
// Task bodies
// =============================================================================

void TaskCoordinator::run_log_stream(const Device& device, std::chrono::milliseconds delay,
                                     CancellationToken& token) {
    if (!token.sleep_for(delay)) {
        return;
    }

    DeviceManager* manager = backends_.get(device.platform);
    if (!manager) {
        return;
    }

    uint64_t generation = store_.begin_log_stream_for(device.key());
    if (generation == 0) {
        return;
    }
    spdlog::debug("log stream {} attached to {}", generation, device.identity);

    auto on_line = [this, generation](const LogLine& line) {
        if (store_.append_log_if_current(generation, LogEntry::now(line.level, line.message))) {
            return true;
        }
        stale_writes_++;
        return false;
    };
    auto keep_going = [this, &token, generation]() {
        return !token.is_cancelled() && store_.is_current_log_stream(generation);
    };

    std::string error;
    if (!manager->stream_logs(device, on_line, keep_going, error)) {
        spdlog::warn("log stream for {} failed: {}", device.identity, error);
    }

    store_.end_log_stream_if(generation);
    spdlog::debug("log stream {} ended", generation);
}

void TaskCoordinator::run_detail_update(std::chrono::milliseconds delay, CancellationToken& token) {
    if (!token.sleep_for(delay)) {
        return;
    }

    std::optional<Device> selected = store_.selected_device();
    if (!selected) {
        return;
    }
    DeviceManager* manager = backends_.get(selected->platform);
    if (!manager) {
        return;
    }

    std::string error;
    std::optional<DeviceDetails> details = manager->get_device_details(selected->identity, error);
    if (token.is_cancelled()) {
        return;
    }
    if (!details) {
        spdlog::warn("details for {} unavailable: {}", selected->identity, error);
        return;
    }

    if (!store_.set_details_if_selected(std::move(*details))) {
        stale_writes_++;
    }
}

bool TaskCoordinator::poll(Platform platform, std::optional<std::vector<Device>>& out, std::string& error) {
    DeviceManager* manager = backends_.get(platform);
    if (!manager) {
        return true;
    }

    std::vector<Device> devices;
    if (!manager->list_devices(devices, error)) {
        spdlog::warn("listing {} devices failed: {}", platform_name(platform), error);
        return false;
    }
    out = std::move(devices);
    return true;
}

void TaskCoordinator::run_refresh(bool user_initiated, CancellationToken& token) {
    std::optional<std::vector<Device>> android;
    std::optional<std::vector<Device>> ios;
    std::string android_error;
    std::string ios_error;

    uint64_t sequence = ++refresh_sequence_;
    bool android_ok = poll(Platform::ANDROID, android, android_error);
    if (token.is_cancelled()) {
        return;
    }
    bool ios_ok = poll(Platform::IOS, ios, ios_error);
    if (token.is_cancelled()) {
        return;
    }

    if (user_initiated && !android_ok) {
        store_.notify(NotificationType::ERROR, "Failed to refresh Android devices: " + android_error);
    }
    if (user_initiated && !ios_ok) {
        store_.notify(NotificationType::ERROR, "Failed to refresh iOS devices: " + ios_error);
    }

    apply_poll(sequence, std::move(android), std::move(ios));
}

void TaskCoordinator::run_status_check(Platform platform, CancellationToken& token) {
    if (!token.sleep_for(timings_.settle_delay)) {
        return;
    }

    std::optional<std::vector<Device>> devices;
    std::string error;
    uint64_t sequence = ++refresh_sequence_;
    if (!poll(platform, devices, error) || token.is_cancelled()) {
        return;
    }

    if (platform == Platform::ANDROID) {
        apply_poll(sequence, std::move(devices), std::nullopt);
    } else {
        apply_poll(sequence, std::nullopt, std::move(devices));
    }
}

void TaskCoordinator::run_cache_load(Platform platform) {
    DeviceManager* manager = backends_.get(platform);
    std::vector<Choice> types;
    std::vector<Choice> levels;
    std::string error;

    bool ok = manager->list_device_types(types, error) && manager->list_api_levels(levels, error);
    if (ok) {
        cache_.update(platform, types, levels);
        store_.set_form_choices(platform, std::move(types), std::move(levels), false);
    } else {
        spdlog::warn("loading {} device types failed: {}", platform_name(platform), error);
    }

    cache_.finish_loading(platform);
    store_.set_form_loading(platform, false);
}

void TaskCoordinator::apply_poll(uint64_t sequence, std::optional<std::vector<Device>> android,
                                 std::optional<std::vector<Device>> ios) {
    std::optional<RefreshOutcome> outcome =
        store_.apply_refresh_if_newer(sequence, std::move(android), std::move(ios));
    if (!outcome) {
        stale_writes_++;
        spdlog::debug("dropped poll {}: newer results already applied", sequence);
        return;
    }
    handle_refresh_outcome(*outcome);
}

void TaskCoordinator::handle_refresh_outcome(const RefreshOutcome& outcome) {
    if (outcome.log_device_gone) {
        cancel(TaskKind::LOG_STREAM);
        store_.end_log_stream();
    }

    if (outcome.selection_changed) {
        on_selection_changed();
    } else if (outcome.selected_started) {
        // One-shot refresh so the details show the booted device
        schedule_detail_update(std::chrono::milliseconds(0));
        start_log_stream(std::chrono::milliseconds(0));
    }
}
