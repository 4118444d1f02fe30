#pragma once

#include <ncurses.h>

namespace kls::tui::colors {

// Color pair IDs for ncurses
enum ColorPair {
    DEFAULT = 0,

    // Panels
    TITLE_ACTIVE = 1,
    ROW_SELECTED = 2,
    BORDER = 3,
    TEXT_DIM = 4,

    // Bottom line
    STATUS = 5,
    STATUS_MESSAGE = 6,

    // Confirmation overlay
    DIALOG = 7,

    MAX_PAIRS = 8
};

// Initialize all color pairs
inline void init_color_pairs() {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    init_pair(TITLE_ACTIVE, COLOR_WHITE, COLOR_BLUE);
    init_pair(ROW_SELECTED, COLOR_WHITE, COLOR_BLUE);
    init_pair(BORDER, COLOR_WHITE, -1);
    init_pair(TEXT_DIM, COLOR_WHITE, -1);

    init_pair(STATUS, COLOR_YELLOW, -1);
    init_pair(STATUS_MESSAGE, COLOR_RED, -1);

    init_pair(DIALOG, COLOR_WHITE, COLOR_RED);
}

} // namespace kls::tui::colors
