/*
 * keys.hpp - Key classification
 *
 * Tells the input debouncer which keys move the selection in the current
 * mode. Vertical movement is only coalesced where it moves through a list;
 * in the create form j and k are text and arrows step between fields.
 */

#pragma once

#include "state.hpp"

constexpr int KEY_CTRL_C = 3;
constexpr int KEY_CTRL_Q = 17;
constexpr int KEY_ESCAPE = 27;

// -1 for up, +1 for down, 0 for keys that are not list navigation
int navigation_delta(int key, Mode mode);
