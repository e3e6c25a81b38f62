/**
 * @file TerminalView.h
 * @brief Declares TerminalView: ncurses rendering of a Universe plus a one-line status bar.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <string>
#include <ncurses.h>

#include "Universe.h"
#include "Viewport.h"

/** @brief Values shown on the status line that the Universe itself does not track. */
struct StatusInfo {
    std::uint64_t generation{0};
    bool running{false};
    int stepDelayMs{0};
    std::string note;
};

/**
 * @brief Truncate @p text so it fits a row of @p cols cells without touching the last column.
 *
 * Writing the bottom-right cell of a window makes ncurses return ERR, so at most cols-1 characters are kept.
 */
std::string fitStatusLine(std::string text, int cols);

/**
 * @class TerminalView
 * @brief Draws the visible part of the grid into a WINDOW; the bottom row holds the status line.
 *
 * The grid is read through Universe::cells() each frame, so no copy of the state is kept here.
 */
class TerminalView {
public:
    /** @brief Bind to @p win (usually stdscr). Call layout() before the first draw. */
    explicit TerminalView(WINDOW* win);

    /** @brief Initialize color pairs used for live cells and the cursor. */
    static void initColors();

    /** @brief Recompute the viewport from the current terminal size. */
    void layout(const Universe& u);
    /** @brief Redraw every visible cell; the cursor cell is drawn in reverse video. */
    void draw(const Universe& u, std::uint32_t cursorRow, std::uint32_t cursorCol);
    /** @brief Rewrite the status line. */
    void drawStatusLine(const Universe& u, const StatusInfo& info);

    Viewport& viewport() { return view; }
    const Viewport& viewport() const { return view; }

private:
    WINDOW* win;
    Viewport view;
};
