/*
 * ui.cpp - ncurses wrapper implementation
 */

#include "ui.hpp"

void UI::init() {
    initscr();
    cbreak();
    noecho();
    raw();  // Ctrl-C and Ctrl-Q arrive as keys
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);
    init_colors();
    initialised_ = true;
}

void UI::init_colors() {
    has_colors_ = ::has_colors();
    if (!has_colors_) {
        return;
    }

    start_color();
    use_default_colors();
    init_pair(COLOR_HEADER, COLOR_CYAN, -1);
    init_pair(COLOR_SELECTED, COLOR_BLACK, COLOR_CYAN);
    init_pair(COLOR_RUNNING, COLOR_GREEN, -1);
    init_pair(COLOR_STOPPED, COLOR_WHITE, -1);
    init_pair(COLOR_TRANSITION, COLOR_YELLOW, -1);
    init_pair(COLOR_STATUS, COLOR_BLACK, COLOR_WHITE);
    init_pair(COLOR_ACTIVE_BORDER, COLOR_CYAN, -1);
    init_pair(COLOR_ERROR, COLOR_RED, -1);
    init_pair(COLOR_WARNING, COLOR_YELLOW, -1);
    init_pair(COLOR_SUCCESS, COLOR_GREEN, -1);
    init_pair(COLOR_INFO, COLOR_BLUE, -1);
    init_pair(COLOR_DEBUG, COLOR_MAGENTA, -1);
}

void UI::shutdown() {
    if (initialised_) {
        endwin();
        initialised_ = false;
    }
}

int UI::read_key() {
    int ch = getch();
    return ch == ERR ? NO_KEY : ch;
}

bool UI::has_pending() {
    int ch = getch();
    if (ch == ERR) {
        return false;
    }
    ungetch(ch);
    return true;
}

void UI::wait_for_input(int ms) {
    timeout(ms);
    int ch = getch();
    if (ch != ERR) {
        ungetch(ch);
    }
    nodelay(stdscr, TRUE);
}

int UI::get_max_y() const {
    return getmaxy(stdscr);
}

int UI::get_max_x() const {
    return getmaxx(stdscr);
}

void UI::set_color(WINDOW* win, ColorPair pair) {
    if (has_colors_ && pair != COLOR_DEFAULT) {
        wattron(win, COLOR_PAIR(pair));
    }
}

void UI::unset_color(WINDOW* win, ColorPair pair) {
    if (has_colors_ && pair != COLOR_DEFAULT) {
        wattroff(win, COLOR_PAIR(pair));
    }
}

void UI::draw_box(WINDOW* win, bool active) {
    if (active) {
        wattron(win, A_BOLD | COLOR_PAIR(COLOR_ACTIVE_BORDER));
    }
    box(win, 0, 0);
    if (active) {
        wattroff(win, A_BOLD | COLOR_PAIR(COLOR_ACTIVE_BORDER));
    }
}

void UI::clear_window(WINDOW* win) {
    werase(win);
}

void UI::print_centered(WINDOW* win, int y, const std::string& text) {
    int width = getmaxx(win);
    std::string shown = truncate(text, width > 2 ? static_cast<size_t>(width - 2) : 0);
    int x = (width - static_cast<int>(shown.length())) / 2;
    mvwprintw(win, y, x < 1 ? 1 : x, "%s", shown.c_str());
}

void UI::print_right_aligned(WINDOW* win, int y, const std::string& text) {
    int width = getmaxx(win);
    std::string shown = truncate(text, width > 4 ? static_cast<size_t>(width - 4) : 0);
    mvwprintw(win, y, width - static_cast<int>(shown.length()) - 2, "%s", shown.c_str());
}

std::string UI::truncate(const std::string& str, size_t max_len) {
    if (str.length() <= max_len) {
        return str;
    }
    if (max_len <= 3) {
        return str.substr(0, max_len);
    }
    return str.substr(0, max_len - 3) + "...";
}
