/*
 * detail.hpp - Device detail panel
 *
 * Shows the details of the selected device. Until the background detail
 * update for the selection lands, the basic fields from the list entry are
 * shown instead.
 */

#pragma once

#include "../panel.hpp"

class DetailPanel : public Panel {
public:
    explicit DetailPanel(UI& ui);

    void render(WINDOW* win, const AppSnapshot& snap) override;

private:
    void render_field(WINDOW* win, int& y, const char* label, const std::string& value) const;
};
