/*
 * log.hpp - Device log panel
 *
 * Shows the streamed log of the selected running device, newest at the
 * bottom. The snapshot already holds only the lines that fit, filtered and
 * offset by the current scroll position.
 */

#pragma once

#include "../panel.hpp"

class LogPanel : public Panel {
public:
    explicit LogPanel(UI& ui);

    void render(WINDOW* win, const AppSnapshot& snap) override;

private:
    static ColorPair level_color(LogLevel level);
    std::string header(const AppSnapshot& snap) const;
};
