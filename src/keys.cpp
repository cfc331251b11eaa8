/*
 * keys.cpp - Key classification implementation
 */

#include "keys.hpp"
#include <ncurses.h>

int navigation_delta(int key, Mode mode) {
    if (mode != Mode::NORMAL && mode != Mode::MANAGE_API_LEVELS) {
        return 0;
    }

    switch (key) {
        case KEY_UP:
        case 'k':
            return -1;
        case KEY_DOWN:
        case 'j':
            return 1;
        default:
            return 0;
    }
}
