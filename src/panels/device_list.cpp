/*
 * device_list.cpp - Device list panel implementation
 */

#include "device_list.hpp"

DeviceListPanel::DeviceListPanel(Platform platform, UI& ui)
    : Panel(platform == Platform::ANDROID ? "Android Devices" : "iOS Simulators", ui),
      platform_(platform) {}

ColorPair DeviceListPanel::status_color(const Device& device) {
    switch (device.status) {
        case DeviceStatus::RUNNING:  return COLOR_RUNNING;
        case DeviceStatus::STARTING:
        case DeviceStatus::STOPPING:
        case DeviceStatus::CREATING: return COLOR_TRANSITION;
        case DeviceStatus::ERROR:    return COLOR_ERROR;
        default:                     return device.is_running ? COLOR_RUNNING : COLOR_STOPPED;
    }
}

char DeviceListPanel::status_marker(const Device& device) {
    switch (device.status) {
        case DeviceStatus::STARTING:
        case DeviceStatus::STOPPING:
        case DeviceStatus::CREATING: return '~';
        case DeviceStatus::ERROR:    return '!';
        default:                     return device.is_running ? '*' : '-';
    }
}

void DeviceListPanel::render(WINDOW* win, const AppSnapshot& snap) {
    UI::clear_window(win);
    set_active(snap.active_panel == platform_);

    const std::vector<Device>& devices = snap.devices(platform_);
    size_t selected = platform_ == Platform::ANDROID ? snap.android_selected : snap.ios_selected;
    size_t scroll = platform_ == Platform::ANDROID ? snap.android_scroll : snap.ios_scroll;

    draw_frame(win, title_ + " (" + std::to_string(devices.size()) + ")");

    int rows = content_height(win);
    if (devices.empty()) {
        UI::print_centered(win, rows / 2 + 1, snap.is_loading ? "Loading..." : "No devices");
        wnoutrefresh(win);
        return;
    }

    for (int row = 0; row < rows; ++row) {
        size_t index = scroll + static_cast<size_t>(row);
        if (index >= devices.size()) {
            break;
        }
        render_row(win, row + 1, devices[index], index == selected);
    }

    // Scroll hints
    if (scroll > 0) {
        mvwaddch(win, 1, getmaxx(win) - 2, ACS_UARROW);
    }
    if (scroll + static_cast<size_t>(rows) < devices.size()) {
        mvwaddch(win, rows, getmaxx(win) - 2, ACS_DARROW);
    }

    wnoutrefresh(win);
}

void DeviceListPanel::render_row(WINDOW* win, int y, const Device& device, bool selected) const {
    int width = content_width(win) - 2;
    if (width <= 4) {
        return;
    }

    std::string version = platform_ == Platform::ANDROID ? "API " + device.version : device.version;
    size_t name_width = static_cast<size_t>(width) > version.size() + 4
        ? static_cast<size_t>(width) - version.size() - 4 : 1;
    std::string name = UI::truncate(device.name, name_width);

    if (selected) {
        wattron(win, active_ ? A_REVERSE : A_BOLD);
        mvwhline(win, y, 1, ' ', content_width(win));
    }

    ColorPair color = status_color(device);
    ui_.set_color(win, color);
    mvwaddch(win, y, 2, static_cast<chtype>(status_marker(device)));
    ui_.unset_color(win, color);

    mvwprintw(win, y, 4, "%s", name.c_str());
    mvwprintw(win, y, width + 1 - static_cast<int>(version.size()), "%s", version.c_str());

    if (selected) {
        wattroff(win, active_ ? A_REVERSE : A_BOLD);
    }
}
