/*
 * log.cpp - Device log panel implementation
 */

#include "log.hpp"

LogPanel::LogPanel(UI& ui)
    : Panel("Logs", ui) {}

ColorPair LogPanel::level_color(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return COLOR_ERROR;
        case LogLevel::WARN:  return COLOR_WARNING;
        case LogLevel::INFO:  return COLOR_DEFAULT;
        case LogLevel::DEBUG: return COLOR_DEBUG;
    }
    return COLOR_DEFAULT;
}

std::string LogPanel::header(const AppSnapshot& snap) const {
    std::string text = title_;
    if (snap.log_device) {
        text += " - " + snap.log_device->identity;
    }
    if (snap.log_filter) {
        text += " [" + std::string(log_level_name(*snap.log_filter)) + "]";
    }
    if (!snap.log_auto_scroll) {
        text += " (scrolled " + std::to_string(snap.log_scroll) + "/" + std::to_string(snap.total_logs) + ")";
    }
    return text;
}

void LogPanel::render(WINDOW* win, const AppSnapshot& snap) {
    UI::clear_window(win);
    draw_frame(win, header(snap));

    if (snap.visible_logs.empty()) {
        const char* hint;
        if (!snap.selected) {
            hint = "(No device selected)";
        } else if (!snap.selected->is_running) {
            hint = "(Device is not running)";
        } else {
            hint = "(Waiting for log output...)";
        }
        UI::print_centered(win, content_height(win) / 2 + 1, hint);
        wnoutrefresh(win);
        return;
    }

    int width = content_width(win) - 2;
    int rows = content_height(win);
    size_t first = snap.visible_logs.size() > static_cast<size_t>(rows)
        ? snap.visible_logs.size() - static_cast<size_t>(rows) : 0;

    int y = 1;
    for (size_t i = first; i < snap.visible_logs.size(); ++i) {
        const LogEntry& entry = snap.visible_logs[i];
        ColorPair color = level_color(entry.level);

        mvwprintw(win, y, 2, "%s ", entry.timestamp.c_str());
        ui_.set_color(win, color);
        wprintw(win, "%-5s", log_level_name(entry.level));
        ui_.unset_color(win, color);

        int used = static_cast<int>(entry.timestamp.size()) + 7;
        if (width > used) {
            wprintw(win, " %s", UI::truncate(entry.message, static_cast<size_t>(width - used)).c_str());
        }
        y++;
    }

    wnoutrefresh(win);
}
