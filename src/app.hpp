/*
 * app.hpp - Main application controller
 *
 * Owns every component of the dashboard: the ncurses UI, the StateStore,
 * the DeviceCache, the TaskCoordinator running background work, the
 * DeviceActions issuing commands, the InputDebouncer and the panels.
 *
 * The event loop sweeps expired notifications every 500ms, checks every
 * second whether an auto-refresh is due, drains batched input, renders a
 * snapshot of the state and then waits for the next key or frame tick.
 * Keys are routed by the current mode: the device lists in normal mode, or
 * the open form, confirmation, API level list or help overlay.
 */

#pragma once

#include "clock.hpp"
#include "device_actions.hpp"
#include "device_cache.hpp"
#include "input_debouncer.hpp"
#include "panels/detail.hpp"
#include "panels/device_list.hpp"
#include "panels/dialogs.hpp"
#include "panels/log.hpp"
#include "settings.hpp"
#include "state_store.hpp"
#include "task_coordinator.hpp"
#include "ui.hpp"
#include <chrono>

class App {
public:
    static constexpr std::chrono::milliseconds NOTIFICATION_SWEEP_INTERVAL{500};
    static constexpr std::chrono::milliseconds REFRESH_CHECK_INTERVAL{1000};

    App(const Settings& settings, DeviceBackends backends);
    ~App();

    // Non-copyable
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Main lifecycle
    bool init();
    void run();
    void shutdown();

private:
    Settings settings_;
    SteadyClock clock_;
    UI ui_;
    StateStore store_;
    DeviceCache cache_;
    DeviceBackends backends_;
    TaskCoordinator coordinator_;
    DeviceActions actions_;
    InputDebouncer debouncer_;

    // Panels
    DeviceListPanel android_panel_;
    DeviceListPanel ios_panel_;
    DetailPanel detail_panel_;
    LogPanel log_panel_;
    Dialogs dialogs_;

    // Windows
    WINDOW* top_bar_ = nullptr;
    WINDOW* android_win_ = nullptr;
    WINDOW* ios_win_ = nullptr;
    WINDOW* detail_win_ = nullptr;
    WINDOW* log_win_ = nullptr;
    WINDOW* status_bar_ = nullptr;
    bool fullscreen_layout_ = false;

    // State
    bool running_ = false;
    bool shut_down_ = false;
    Clock::time_point last_notification_sweep_;
    Clock::time_point last_refresh_check_;

    // Event handling
    void handle_action(const InputAction& action);
    void handle_key(int key);
    void handle_normal_key(int key);
    void handle_form_key(int key);
    void handle_confirm_key(int key, Mode mode);
    void handle_api_levels_key(int key);
    void handle_resize();
    void move_selection(int delta);
    void switch_panel();

    // Rendering
    void create_windows(bool fullscreen_logs);
    void destroy_windows();
    void render();
    void render_top_bar(const AppSnapshot& snap);
    void render_status_bar(const AppSnapshot& snap);
    size_t log_rows() const;
};
