/*
 * app.cpp - Main application controller implementation
 *
 * Implements the event loop, window layout and key routing. The loop
 * renders at the configured frame interval (8ms by default) and skips the
 * frame wait while input is still queued, so key repeat never backs up.
 */

#include "app.hpp"
#include "keys.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

App::App(const Settings& settings, DeviceBackends backends)
    : settings_(settings),
      store_(clock_, settings.limits),
      cache_(clock_, settings.cache_ttl),
      backends_(backends),
      coordinator_(store_, cache_, backends, settings.timings),
      actions_(store_, coordinator_, backends),
      debouncer_(settings.debounce, clock_),
      android_panel_(Platform::ANDROID, ui_),
      ios_panel_(Platform::IOS, ui_),
      detail_panel_(ui_),
      log_panel_(ui_),
      dialogs_(ui_) {}

App::~App() {
    shutdown();
}

bool App::init() {
    ui_.init();
    create_windows(false);

    // Initial loads run in the background so the first frame is immediate
    coordinator_.request_refresh(true);
    coordinator_.load_cache(Platform::ANDROID, false);
    coordinator_.load_cache(Platform::IOS, false);

    last_notification_sweep_ = clock_.now();
    last_refresh_check_ = clock_.now();

    if (!backends_.ios) {
        store_.notify(NotificationType::INFO, "iOS simulators are not available on this host");
    }
    spdlog::info("ui initialised ({}x{})", ui_.get_max_x(), ui_.get_max_y());
    return true;
}

void App::create_windows(bool fullscreen_logs) {
    int max_y = ui_.get_max_y();
    int max_x = ui_.get_max_x();

    constexpr int TOP_BAR_HEIGHT = 3;
    constexpr int STATUS_BAR_HEIGHT = 3;

    int main_height = std::max(max_y - TOP_BAR_HEIGHT - STATUS_BAR_HEIGHT, 4);
    int upper_height = fullscreen_logs ? 0 : std::max(main_height * 2 / 5, 5);
    int lower_height = std::max(main_height - upper_height, 3);
    int column_width = max_x / 3;

    top_bar_ = newwin(TOP_BAR_HEIGHT, max_x, 0, 0);
    status_bar_ = newwin(STATUS_BAR_HEIGHT, max_x, max_y - STATUS_BAR_HEIGHT, 0);
    log_win_ = newwin(lower_height, max_x, TOP_BAR_HEIGHT + upper_height, 0);

    if (!fullscreen_logs) {
        android_win_ = newwin(upper_height, column_width, TOP_BAR_HEIGHT, 0);
        ios_win_ = newwin(upper_height, column_width, TOP_BAR_HEIGHT, column_width);
        detail_win_ = newwin(upper_height, max_x - 2 * column_width, TOP_BAR_HEIGHT, 2 * column_width);
        store_.set_list_rows(static_cast<size_t>(upper_height - 2));
    }

    fullscreen_layout_ = fullscreen_logs;
}

void App::destroy_windows() {
    if (top_bar_) { delwin(top_bar_); top_bar_ = nullptr; }
    if (android_win_) { delwin(android_win_); android_win_ = nullptr; }
    if (ios_win_) { delwin(ios_win_); ios_win_ = nullptr; }
    if (detail_win_) { delwin(detail_win_); detail_win_ = nullptr; }
    if (log_win_) { delwin(log_win_); log_win_ = nullptr; }
    if (status_bar_) { delwin(status_bar_); status_bar_ = nullptr; }
}

void App::run() {
    running_ = true;
    auto frame_ms = static_cast<int>(settings_.frame_interval.count());

    while (running_) {
        Clock::time_point now = clock_.now();

        if (now - last_notification_sweep_ >= NOTIFICATION_SWEEP_INTERVAL) {
            store_.dismiss_expired_notifications();
            last_notification_sweep_ = now;
        }

        if (now - last_refresh_check_ >= REFRESH_CHECK_INTERVAL) {
            last_refresh_check_ = now;
            if (store_.should_auto_refresh()) {
                coordinator_.request_refresh(false);
            }
            coordinator_.reap();
        }

        DrainResult input = debouncer_.drain(
            ui_,
            [this](int key) { return navigation_delta(key, store_.mode()); },
            [this](const InputAction& action) { handle_action(action); });

        if (!running_) {
            break;
        }

        render();

        if (!input.more_pending) {
            ui_.wait_for_input(frame_ms);
        }
    }
}

void App::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    coordinator_.shutdown();
    destroy_windows();
    ui_.shutdown();
    spdlog::info("shut down");
}

// =============================================================================
// Input
// =============================================================================

void App::handle_action(const InputAction& action) {
    if (action.kind == InputAction::Kind::MOVE) {
        move_selection(action.delta);
    } else {
        handle_key(action.key);
    }
}

void App::handle_key(int key) {
    if (key == KEY_RESIZE) {
        handle_resize();
        return;
    }
    if (key == KEY_CTRL_C || key == KEY_CTRL_Q) {
        running_ = false;
        return;
    }

    Mode mode = store_.mode();
    switch (mode) {
        case Mode::NORMAL:
            handle_normal_key(key);
            break;
        case Mode::CREATE_DEVICE:
            handle_form_key(key);
            break;
        case Mode::CONFIRM_DELETE:
        case Mode::CONFIRM_WIPE:
            handle_confirm_key(key, mode);
            break;
        case Mode::MANAGE_API_LEVELS:
            handle_api_levels_key(key);
            break;
        case Mode::HELP:
            store_.set_mode(Mode::NORMAL);
            break;
    }
}

void App::handle_normal_key(int key) {
    switch (key) {
        case 'q':
            running_ = false;
            return;

        case KEY_ESCAPE:
            store_.dismiss_all_notifications();
            return;

        case 'r':
            coordinator_.request_refresh(true);
            return;

        case '\t':
        case KEY_BTAB:
        case KEY_LEFT:
        case KEY_RIGHT:
        case 'h':
        case 'l':
            switch_panel();
            return;

        case KEY_HOME:
        case 'g':
            if (store_.select_first()) {
                coordinator_.on_selection_changed();
            }
            return;

        case KEY_END:
        case 'G':
            if (store_.select_last()) {
                coordinator_.on_selection_changed();
            }
            return;

        case '\n':
        case KEY_ENTER:
        case ' ':
            actions_.toggle_selected();
            return;

        case 'c':
            if (store_.open_create_form()) {
                coordinator_.load_cache(store_.active_panel(), false);
            }
            return;

        case 'd':
            store_.open_confirm(Mode::CONFIRM_DELETE);
            return;

        case 'w':
            store_.open_confirm(Mode::CONFIRM_WIPE);
            return;

        case 'a':
            store_.set_mode(Mode::MANAGE_API_LEVELS);
            coordinator_.load_cache(store_.active_panel(), false);
            return;

        case '?':
            store_.set_mode(Mode::HELP);
            return;

        case 'f':
            store_.cycle_log_filter();
            return;

        case 'F':
            store_.toggle_fullscreen_logs();
            return;

        case 'L':
            store_.clear_logs();
            store_.notify(NotificationType::INFO, "Logs cleared");
            return;

        case KEY_PPAGE:
            store_.scroll_logs(static_cast<int>(std::max<size_t>(log_rows() / 2, 1)));
            return;

        case KEY_NPAGE:
            store_.scroll_logs(-static_cast<int>(std::max<size_t>(log_rows() / 2, 1)));
            return;

        case 'e':
            store_.scroll_logs_to_end();
            return;
    }
}

void App::handle_form_key(int key) {
    switch (key) {
        case KEY_ESCAPE:
            store_.close_create_form();
            return;
        case '\t':
        case KEY_DOWN:
            store_.edit_form(FormEdit::NEXT_FIELD);
            return;
        case KEY_BTAB:
        case KEY_UP:
            store_.edit_form(FormEdit::PREV_FIELD);
            return;
        case KEY_LEFT:
            store_.edit_form(FormEdit::PREV_OPTION);
            return;
        case KEY_RIGHT:
            store_.edit_form(FormEdit::NEXT_OPTION);
            return;
        case '\n':
        case KEY_ENTER:
            actions_.submit_create_form();
            return;
        case KEY_BACKSPACE:
        case 127:
        case 8:
            store_.edit_form(FormEdit::BACKSPACE);
            return;
        default:
            if (key >= 32 && key < 127) {
                store_.edit_form(FormEdit::INSERT_CHAR, static_cast<char>(key));
            }
            return;
    }
}

void App::handle_confirm_key(int key, Mode mode) {
    switch (key) {
        case 'y':
        case 'Y':
        case '\n':
        case KEY_ENTER:
            actions_.confirm_dialog(mode);
            return;
        case 'n':
        case 'N':
        case 'q':
        case KEY_ESCAPE:
            store_.take_confirm();
            return;
    }
}

void App::handle_api_levels_key(int key) {
    switch (key) {
        case KEY_ESCAPE:
        case 'q':
        case 'a':
            store_.set_mode(Mode::NORMAL);
            return;
        case 'r':
            coordinator_.load_cache(store_.active_panel(), true);
            return;
    }
}

void App::move_selection(int delta) {
    Mode mode = store_.mode();
    if (mode == Mode::NORMAL) {
        if (store_.move_selection(delta)) {
            coordinator_.on_selection_changed();
        }
    } else if (mode == Mode::MANAGE_API_LEVELS) {
        std::optional<CacheEntry> entry = cache_.get_last_known(store_.active_panel());
        store_.move_api_level_selection(delta, entry ? entry->api_levels.size() : 0);
    }
}

void App::switch_panel() {
    Platform panel = store_.switch_panel();
    coordinator_.on_panel_switched();
    spdlog::debug("switched to {} panel", platform_name(panel));
}

void App::handle_resize() {
    destroy_windows();
    clear();
    refresh();
    create_windows(fullscreen_layout_);
}

// =============================================================================
// Rendering
// =============================================================================

size_t App::log_rows() const {
    if (!log_win_) {
        return 0;
    }
    int rows = getmaxy(log_win_) - 2;
    return rows > 0 ? static_cast<size_t>(rows) : 0;
}

void App::render() {
    AppSnapshot snap = store_.snapshot(log_rows());

    if (snap.fullscreen_logs != fullscreen_layout_) {
        destroy_windows();
        create_windows(snap.fullscreen_logs);
        snap = store_.snapshot(log_rows());
    }

    render_top_bar(snap);
    if (!fullscreen_layout_) {
        android_panel_.render(android_win_, snap);
        ios_panel_.render(ios_win_, snap);
        detail_panel_.render(detail_win_, snap);
    }
    log_panel_.render(log_win_, snap);
    render_status_bar(snap);

    std::optional<CacheEntry> api_levels;
    if (snap.mode == Mode::MANAGE_API_LEVELS) {
        api_levels = cache_.get_last_known(snap.active_panel);
    }
    dialogs_.render(snap, api_levels);

    doupdate();
}

void App::render_top_bar(const AppSnapshot& snap) {
    UI::clear_window(top_bar_);

    wattron(top_bar_, A_BOLD);
    mvwprintw(top_bar_, 1, 2, "emu - Virtual Device Manager");
    wattroff(top_bar_, A_BOLD);

    // Platform tabs
    int x = 34;
    for (Platform platform : {Platform::ANDROID, Platform::IOS}) {
        bool active = platform == snap.active_panel;
        if (active) wattron(top_bar_, A_REVERSE | A_BOLD);
        mvwprintw(top_bar_, 1, x, " %s ", platform_name(platform));
        if (active) wattroff(top_bar_, A_REVERSE | A_BOLD);
        x += static_cast<int>(std::string(platform_name(platform)).size()) + 3;
    }

    if (snap.pending_start) {
        ui_.set_color(top_bar_, COLOR_TRANSITION);
        UI::print_right_aligned(top_bar_, 1, "Waiting for '" + *snap.pending_start + "' to boot");
        ui_.unset_color(top_bar_, COLOR_TRANSITION);
    } else if (snap.is_loading) {
        UI::print_right_aligned(top_bar_, 1, "Loading devices...");
    }

    UI::draw_box(top_bar_, false);
    wnoutrefresh(top_bar_);
}

void App::render_status_bar(const AppSnapshot& snap) {
    UI::clear_window(status_bar_);

    int max_x = getmaxx(status_bar_);
    const std::string hints = "?:Help q:Quit";
    int available = max_x - static_cast<int>(hints.size()) - 6;

    int x = 2;
    if (snap.operation_status) {
        std::string status = UI::truncate(*snap.operation_status, static_cast<size_t>(std::max(available / 2, 1)));
        ui_.set_color(status_bar_, COLOR_TRANSITION);
        mvwprintw(status_bar_, 1, x, "%s", status.c_str());
        ui_.unset_color(status_bar_, COLOR_TRANSITION);
        x += static_cast<int>(status.size()) + 2;
    }

    if (!snap.notifications.empty()) {
        const Notification& latest = snap.notifications.back();
        ColorPair color = COLOR_INFO;
        switch (latest.type) {
            case NotificationType::SUCCESS: color = COLOR_SUCCESS; break;
            case NotificationType::ERROR:   color = COLOR_ERROR; break;
            case NotificationType::WARNING: color = COLOR_WARNING; break;
            case NotificationType::INFO:    color = COLOR_INFO; break;
        }

        std::string text = latest.message;
        if (snap.notifications.size() > 1) {
            text = "[" + std::to_string(snap.notifications.size()) + "] " + text;
        }
        int room = available - x;
        if (room > 3) {
            ui_.set_color(status_bar_, color);
            wattron(status_bar_, A_BOLD);
            mvwprintw(status_bar_, 1, x, "%s", UI::truncate(text, static_cast<size_t>(room)).c_str());
            wattroff(status_bar_, A_BOLD);
            ui_.unset_color(status_bar_, color);
        }
    } else if (!snap.operation_status) {
        mvwprintw(status_bar_, 1, x, "Ready");
    }

    UI::print_right_aligned(status_bar_, 1, hints);
    UI::draw_box(status_bar_, false);
    wnoutrefresh(status_bar_);
}
