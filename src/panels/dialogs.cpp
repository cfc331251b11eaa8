/*
 * dialogs.cpp - Modal overlays implementation
 */

#include "dialogs.hpp"
#include <algorithm>

Dialogs::Dialogs(UI& ui) : ui_(ui) {}

WINDOW* Dialogs::open_window(int height, int width, const std::string& title) {
    int max_y = ui_.get_max_y();
    int max_x = ui_.get_max_x();
    height = std::min(height, max_y);
    width = std::min(width, max_x);

    WINDOW* win = newwin(height, width, (max_y - height) / 2, (max_x - width) / 2);
    if (!win) {
        return nullptr;
    }
    werase(win);
    UI::draw_box(win, true);
    wattron(win, A_BOLD);
    mvwprintw(win, 0, 2, " %s ", title.c_str());
    wattroff(win, A_BOLD);
    return win;
}

void Dialogs::close_window(WINDOW* win) {
    wnoutrefresh(win);
    delwin(win);
}

void Dialogs::render(const AppSnapshot& snap, const std::optional<CacheEntry>& api_levels) {
    switch (snap.mode) {
        case Mode::CREATE_DEVICE:
            if (snap.form) {
                render_create_form(*snap.form);
            }
            break;
        case Mode::CONFIRM_DELETE:
        case Mode::CONFIRM_WIPE:
            if (snap.confirm) {
                render_confirm(*snap.confirm, snap.mode);
            }
            break;
        case Mode::MANAGE_API_LEVELS:
            render_api_levels(snap, api_levels);
            break;
        case Mode::HELP:
            render_help();
            break;
        case Mode::NORMAL:
            break;
    }
}

void Dialogs::render_create_form(const CreateDeviceForm& form) {
    const auto& fields = form.fields();
    int height = static_cast<int>(fields.size()) * 2 + 7;
    std::string title = std::string("Create ") + platform_name(form.platform()) +
                        (form.platform() == Platform::ANDROID ? " Device" : " Simulator");
    WINDOW* win = open_window(height, 64, title);
    if (!win) {
        return;
    }

    int value_width = getmaxx(win) - 22;
    int y = 2;
    for (FormField field : fields) {
        bool active = field == form.active_field();
        bool is_list = field == FormField::API_LEVEL || field == FormField::CATEGORY ||
                       field == FormField::DEVICE_TYPE;
        std::string label = field == FormField::API_LEVEL && form.platform() == Platform::IOS
            ? "Runtime" : form_field_label(field);

        if (active) wattron(win, A_BOLD);
        mvwprintw(win, y, 2, "%s%-14s", active ? "> " : "  ", label.c_str());
        if (active) wattroff(win, A_BOLD);

        std::string value = form.field_value(field);
        if (value.empty() && is_list) {
            value = form.is_loading ? "(loading...)" : "(none)";
        }
        if (is_list) {
            value = "< " + value + " >";
        } else if (active) {
            value += "_";
        }

        if (active) wattron(win, A_REVERSE);
        mvwprintw(win, y, 20, "%s", UI::truncate(value, static_cast<size_t>(std::max(value_width, 1))).c_str());
        if (active) wattroff(win, A_REVERSE);
        y += 2;
    }

    if (!form.error_message.empty()) {
        ui_.set_color(win, COLOR_ERROR);
        mvwprintw(win, y, 2, "%s", UI::truncate(form.error_message, static_cast<size_t>(getmaxx(win) - 4)).c_str());
        ui_.unset_color(win, COLOR_ERROR);
    } else if (form.is_creating) {
        ui_.set_color(win, COLOR_TRANSITION);
        mvwprintw(win, y, 2, "Creating device...");
        ui_.unset_color(win, COLOR_TRANSITION);
    } else if (form.stale_choices) {
        mvwprintw(win, y, 2, "Showing last known lists, refreshing...");
    }

    mvwprintw(win, getmaxy(win) - 2, 2, "Tab/Up/Down: field  Left/Right: change  Enter: create  Esc: cancel");
    close_window(win);
}

void Dialogs::render_confirm(const ConfirmDialog& dialog, Mode mode) {
    bool is_delete = mode == Mode::CONFIRM_DELETE;
    WINDOW* win = open_window(7, 56, is_delete ? "Delete Device" : "Wipe Device");
    if (!win) {
        return;
    }

    std::string question = std::string(is_delete ? "Delete" : "Wipe all data of") + " '" + dialog.name + "'?";
    UI::print_centered(win, 2, question);
    if (!is_delete) {
        ui_.set_color(win, COLOR_WARNING);
        UI::print_centered(win, 3, "The device is reset to its initial state.");
        ui_.unset_color(win, COLOR_WARNING);
    }
    UI::print_centered(win, 5, "y/Enter: confirm   n/Esc: cancel");
    close_window(win);
}

void Dialogs::render_api_levels(const AppSnapshot& snap, const std::optional<CacheEntry>& entry) {
    std::string title = snap.active_panel == Platform::ANDROID ? "Android API Levels" : "iOS Runtimes";
    WINDOW* win = open_window(ui_.get_max_y() - 6, 56, title);
    if (!win) {
        return;
    }

    int rows = getmaxy(win) - 4;
    if (!entry || entry->api_levels.empty()) {
        UI::print_centered(win, rows / 2 + 1, "(Loading...)");
    } else {
        const auto& levels = entry->api_levels;
        size_t selected = std::min(snap.api_level_index, levels.size() - 1);
        size_t first = selected >= static_cast<size_t>(rows) ? selected - static_cast<size_t>(rows) + 1 : 0;

        for (int row = 0; row < rows && first + static_cast<size_t>(row) < levels.size(); ++row) {
            size_t index = first + static_cast<size_t>(row);
            if (index == selected) wattron(win, A_REVERSE);
            mvwprintw(win, row + 1, 2, "%-*s", getmaxx(win) - 4,
                      UI::truncate(levels[index].display, static_cast<size_t>(getmaxx(win) - 4)).c_str());
            if (index == selected) wattroff(win, A_REVERSE);
        }
        if (entry->invalidated) {
            mvwprintw(win, getmaxy(win) - 3, 2, "Refreshing...");
        }
    }

    mvwprintw(win, getmaxy(win) - 2, 2, "Up/Down: move  r: reload  Esc: close");
    close_window(win);
}

void Dialogs::render_help() {
    static const char* lines[] = {
        "Navigation",
        "  Up/k, Down/j     Move selection",
        "  Home/g, End/G    First / last device",
        "  Tab, Left/Right  Switch platform panel",
        "",
        "Devices",
        "  Enter/Space      Start or stop",
        "  c                Create device",
        "  d                Delete device",
        "  w                Wipe device data",
        "  a                API levels / runtimes",
        "  r                Refresh",
        "",
        "Logs",
        "  f                Cycle level filter",
        "  F                Toggle fullscreen logs",
        "  L                Clear logs",
        "  PgUp/PgDn, e     Scroll / follow newest",
        "",
        "  Esc              Dismiss notifications",
        "  q                Quit"
    };
    constexpr int count = static_cast<int>(sizeof(lines) / sizeof(lines[0]));

    WINDOW* win = open_window(count + 4, 50, "Help");
    if (!win) {
        return;
    }
    for (int i = 0; i < count && i + 1 < getmaxy(win) - 2; ++i) {
        mvwprintw(win, i + 1, 2, "%s", lines[i]);
    }
    mvwprintw(win, getmaxy(win) - 2, 2, "Press any key to close");
    close_window(win);
}
