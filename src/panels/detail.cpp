/*
 * detail.cpp - Device detail panel implementation
 */

#include "detail.hpp"

DetailPanel::DetailPanel(UI& ui)
    : Panel("Device Details", ui) {}

void DetailPanel::render(WINDOW* win, const AppSnapshot& snap) {
    UI::clear_window(win);
    draw_frame(win, title_);

    if (!snap.details) {
        UI::print_centered(win, content_height(win) / 2 + 1, "(No device selected)");
        wnoutrefresh(win);
        return;
    }

    const DeviceDetails& details = *snap.details;
    int y = 1;

    wattron(win, A_BOLD);
    mvwprintw(win, y++, 2, "%s", UI::truncate(details.name, static_cast<size_t>(content_width(win) - 2)).c_str());
    wattroff(win, A_BOLD);
    y++;

    render_field(win, y, "Status", details.status);
    render_field(win, y, details.key.platform == Platform::ANDROID ? "API Level" : "Runtime", details.version);
    render_field(win, y, "Type", details.device_type);
    if (details.ram_size) render_field(win, y, "RAM", *details.ram_size);
    if (details.storage_size) render_field(win, y, "Storage", *details.storage_size);
    if (details.resolution) render_field(win, y, "Resolution", *details.resolution);
    if (details.dpi) render_field(win, y, "DPI", *details.dpi);
    if (details.system_image) render_field(win, y, "Image", *details.system_image);
    if (details.device_path) render_field(win, y, "Path", *details.device_path);
    if (details.key.platform == Platform::IOS) render_field(win, y, "UDID", details.key.identity);

    wnoutrefresh(win);
}

void DetailPanel::render_field(WINDOW* win, int& y, const char* label, const std::string& value) const {
    if (y > content_height(win)) {
        return;
    }
    constexpr int LABEL_WIDTH = 12;
    int value_width = content_width(win) - LABEL_WIDTH - 3;
    if (value_width <= 0) {
        return;
    }

    ui_.set_color(win, COLOR_HEADER);
    mvwprintw(win, y, 2, "%-*s", LABEL_WIDTH, label);
    ui_.unset_color(win, COLOR_HEADER);
    mvwprintw(win, y, 2 + LABEL_WIDTH + 1, "%s",
              UI::truncate(value, static_cast<size_t>(value_width)).c_str());
    y++;
}
