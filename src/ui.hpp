/*
 * ui.hpp - ncurses wrapper
 *
 * Terminal setup and teardown, colour pairs and small drawing helpers
 * shared by the panels. UI is also the InputSource the input debouncer
 * drains each frame: reads never block, and wait_for_input() is the one
 * place the main loop sleeps.
 */

#pragma once

#include "input_debouncer.hpp"
#include <ncurses.h>
#include <string>

// Color pair IDs
enum ColorPair {
    COLOR_DEFAULT = 0,
    COLOR_HEADER = 1,
    COLOR_SELECTED = 2,
    COLOR_RUNNING = 3,
    COLOR_STOPPED = 4,
    COLOR_TRANSITION = 5,
    COLOR_STATUS = 6,
    COLOR_ACTIVE_BORDER = 7,
    COLOR_ERROR = 8,
    COLOR_WARNING = 9,
    COLOR_SUCCESS = 10,
    COLOR_INFO = 11,
    COLOR_DEBUG = 12
};

class UI : public InputSource {
public:
    void init();
    void shutdown();

    // InputSource
    int read_key() override;
    bool has_pending() override;

    // Sleeps until a key arrives or ms elapse; the key stays queued
    void wait_for_input(int ms);

    // Screen info
    int get_max_y() const;
    int get_max_x() const;

    // Color support
    bool has_colors() const { return has_colors_; }
    void set_color(WINDOW* win, ColorPair pair);
    void unset_color(WINDOW* win, ColorPair pair);

    // Window utilities
    static void draw_box(WINDOW* win, bool active = false);
    static void clear_window(WINDOW* win);
    static void print_centered(WINDOW* win, int y, const std::string& text);
    static void print_right_aligned(WINDOW* win, int y, const std::string& text);

    // Formatting helpers
    static std::string truncate(const std::string& str, size_t max_len);

private:
    void init_colors();
    bool has_colors_ = false;
    bool initialised_ = false;
};
