/*
 * panel.hpp - Base class for UI panels
 *
 * Abstract base class for the content panels (the two device lists, the
 * detail view and the log view). Panels are pure views: they draw from the
 * AppSnapshot copied out of the StateStore for the current frame and never
 * touch shared state. Key handling lives in App, which routes keys by mode.
 */

#pragma once

#include "state.hpp"
#include "ui.hpp"
#include <ncurses.h>
#include <string>

class Panel {
public:
    Panel(const std::string& title, UI& ui);
    virtual ~Panel() = default;

    // Render the panel content; the caller flushes with doupdate()
    virtual void render(WINDOW* win, const AppSnapshot& snap) = 0;

    // Panel state
    void set_active(bool active) { active_ = active; }
    bool is_active() const { return active_; }

    const std::string& get_title() const { return title_; }

protected:
    std::string title_;
    UI& ui_;
    bool active_ = false;

    // Draws the box with the title set into the top border
    void draw_frame(WINDOW* win, const std::string& title) const;

    // Helper to get content area dimensions (inside box)
    static int content_height(WINDOW* win) { return getmaxy(win) - 2; }
    static int content_width(WINDOW* win) { return getmaxx(win) - 2; }
};
