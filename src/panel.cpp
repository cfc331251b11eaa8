/*
 * panel.cpp - Base panel class implementation
 */

#include "panel.hpp"

Panel::Panel(const std::string& title, UI& ui)
    : title_(title), ui_(ui) {}

void Panel::draw_frame(WINDOW* win, const std::string& title) const {
    UI::draw_box(win, active_);

    int width = content_width(win) - 2;
    if (width <= 0) {
        return;
    }
    if (active_) {
        wattron(win, A_BOLD);
    }
    mvwprintw(win, 0, 2, " %s ", UI::truncate(title, static_cast<size_t>(width - 2)).c_str());
    if (active_) {
        wattroff(win, A_BOLD);
    }
}
