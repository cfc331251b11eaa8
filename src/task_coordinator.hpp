/*
 * task_coordinator.hpp - Background task lifecycle
 *
 * Owns every background thread the dashboard starts. Work is grouped into
 * categories and each category has at most one live handle: starting a new
 * log stream, detail update, panel switch, status check or refresh cancels
 * the previous task of that category before the new one is installed.
 * Cancellation is cooperative; a superseded thread is moved to a retired
 * list and joined once it has finished (or at shutdown).
 *
 * Tasks only touch shared state through StateStore, and every write they
 * make is guarded by a relevance check performed under the store's lock,
 * so a task that lost the race to cancellation still cannot write stale
 * data. Rejected writes are counted in stale_writes().
 *
 * One-off jobs (device commands, cache loads) are not keyed by category
 * but are tracked the same way so shutdown can wait for them.
 */

#pragma once

#include "cancellation.hpp"
#include "device_cache.hpp"
#include "device_manager.hpp"
#include "state_store.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

enum class TaskKind { LOG_STREAM, DETAIL_UPDATE, PANEL_SWITCH, STATUS_CHECK, REFRESH };

const char* task_kind_name(TaskKind kind);

struct TaskTimings {
    std::chrono::milliseconds detail_debounce{100};
    std::chrono::milliseconds fast_detail_debounce{25};
    std::chrono::milliseconds log_delay{100};
    std::chrono::milliseconds fast_log_delay{50};
    std::chrono::milliseconds settle_delay{2000};
};

class TaskCoordinator {
public:
    TaskCoordinator(StateStore& store, DeviceCache& cache, DeviceBackends backends,
                    TaskTimings timings = TaskTimings());
    ~TaskCoordinator();

    // Non-copyable
    TaskCoordinator(const TaskCoordinator&) = delete;
    TaskCoordinator& operator=(const TaskCoordinator&) = delete;

    // Selection moved within a panel: refresh details and follow with logs
    void on_selection_changed();

    // Active panel changed: cancels the previous panel's log and detail
    // tasks, then restarts both concurrently after the short window
    void on_panel_switched();

    // Streams logs of the selected device if it is running. A no-op when
    // that device is already being streamed.
    void start_log_stream(std::chrono::milliseconds delay);
    void schedule_detail_update(std::chrono::milliseconds delay);

    // Re-polls the platform after the settle delay and merges real state
    // over optimistic updates. Each platform has its own pending check.
    void schedule_status_check(Platform platform);

    // Auto refreshes are skipped while one is in flight, user refreshes
    // replace it
    void request_refresh(bool user_initiated);

    // Fills the form lists for the platform from the cache, loading it in
    // the background when missing or stale
    void load_cache(Platform platform, bool force);

    void run_job(const std::string& name, std::function<void()> job);

    // Status checks run one per platform; other kinds ignore the platform
    bool is_active(TaskKind kind, std::optional<Platform> platform = std::nullopt) const;
    void cancel(TaskKind kind, std::optional<Platform> platform = std::nullopt);

    // Joins finished superseded threads
    void reap();
    void shutdown();

    uint64_t stale_writes() const { return stale_writes_.load(); }

    const TaskTimings& timings() const { return timings_; }

private:
    struct TaskHandle {
        CancellationTokenPtr token;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    StateStore& store_;
    DeviceCache& cache_;
    DeviceBackends backends_;
    TaskTimings timings_;

    using TaskSlot = std::pair<TaskKind, std::optional<Platform>>;

    mutable std::mutex mutex_;
    std::map<TaskSlot, TaskHandle> tasks_;
    std::vector<TaskHandle> retired_;
    bool shutting_down_ = false;

    std::atomic<uint64_t> stale_writes_{0};
    // Polls take a number when they start; older results never overwrite newer ones
    std::atomic<uint64_t> refresh_sequence_{0};

    void replace(TaskSlot slot, std::function<void(CancellationToken&)> body);
    static TaskHandle spawn(std::function<void(CancellationToken&)> body);
    void reap_unlocked();

    void run_log_stream(const Device& device, std::chrono::milliseconds delay, CancellationToken& token);
    void run_detail_update(std::chrono::milliseconds delay, CancellationToken& token);
    void run_refresh(bool user_initiated, CancellationToken& token);
    void run_status_check(Platform platform, CancellationToken& token);
    void run_cache_load(Platform platform);

    bool poll(Platform platform, std::optional<std::vector<Device>>& out, std::string& error);
    void apply_poll(uint64_t sequence, std::optional<std::vector<Device>> android,
                    std::optional<std::vector<Device>> ios);
    void handle_refresh_outcome(const RefreshOutcome& outcome);
};
