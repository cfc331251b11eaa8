/*
 * dialogs.hpp - Modal overlays
 *
 * Draws the create-device form, the delete/wipe confirmations, the API
 * level list and the help screen centred over the main layout. Each
 * overlay gets a temporary window for the frame it is drawn in.
 */

#pragma once

#include "../device_cache.hpp"
#include "../state.hpp"
#include "../ui.hpp"
#include <optional>

class Dialogs {
public:
    explicit Dialogs(UI& ui);

    void render(const AppSnapshot& snap, const std::optional<CacheEntry>& api_levels);

private:
    UI& ui_;

    WINDOW* open_window(int height, int width, const std::string& title);
    void close_window(WINDOW* win);

    void render_create_form(const CreateDeviceForm& form);
    void render_confirm(const ConfirmDialog& dialog, Mode mode);
    void render_api_levels(const AppSnapshot& snap, const std::optional<CacheEntry>& entry);
    void render_help();
};
