/*
 * device_list.hpp - Device list panel
 *
 * One instance per platform. Shows each device with a status marker, its
 * name and version, highlighting the selection and scrolling with the
 * selection kept in view.
 */

#pragma once

#include "../panel.hpp"

class DeviceListPanel : public Panel {
public:
    DeviceListPanel(Platform platform, UI& ui);

    void render(WINDOW* win, const AppSnapshot& snap) override;

    Platform platform() const { return platform_; }

private:
    Platform platform_;

    void render_row(WINDOW* win, int y, const Device& device, bool selected) const;
    static ColorPair status_color(const Device& device);
    static char status_marker(const Device& device);
};
