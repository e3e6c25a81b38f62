/**
 * @file TerminalView.cpp
 * @brief TerminalView implementation: full-frame grid drawing from the packed word buffer and the status line.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "TerminalView.h"

#include <utility>

namespace {
constexpr short kAlivePair = 1;
constexpr short kCursorPair = 2;
constexpr short kStatusPair = 3;
constexpr chtype kAliveGlyph = '#';
constexpr chtype kDeadGlyph = ' ';

/** @brief Read bit @p i from a packed word buffer laid out as Universe::cells() documents. */
inline bool bitAt(const std::uint32_t* words, std::size_t i) {
    return (words[i >> 5] >> (i & 31u)) & 1u;
}
}

/** @copydoc fitStatusLine */
std::string fitStatusLine(std::string text, int cols) {
    const std::size_t limit = cols > 0 ? static_cast<std::size_t>(cols - 1) : 0;
    if (text.size() > limit) text.resize(limit);
    return text;
}

/** @copydoc TerminalView::TerminalView */
TerminalView::TerminalView(WINDOW* w) : win(w) {}

/** @copydoc TerminalView::initColors */
void TerminalView::initColors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    init_pair(kAlivePair, COLOR_GREEN, -1);
    init_pair(kCursorPair, COLOR_YELLOW, -1);
    init_pair(kStatusPair, COLOR_CYAN, -1);
}

/** @copydoc TerminalView::layout */
void TerminalView::layout(const Universe& u) {
    int rows, cols;
    getmaxyx(win, rows, cols);
    view.resize(rows - 1, cols, u.height(), u.width());
}

/** @copydoc TerminalView::draw */
void TerminalView::draw(const Universe& u, std::uint32_t cursorRow, std::uint32_t cursorCol) {
    const std::uint32_t* words = u.cells();
    for (int y = 0; y < view.rows; ++y) {
        for (int x = 0; x < view.cols; ++x) {
            std::uint32_t row, col;
            if (!view.toGrid(y, x, u.height(), u.width(), row, col)) {
                mvwaddch(win, y, x, kDeadGlyph);
                continue;
            }
            const bool alive = bitAt(words, u.getIndex(row, col));
            const bool isCursor = (row == cursorRow && col == cursorCol);
            if (isCursor) {
                wattron(win, A_REVERSE | COLOR_PAIR(kCursorPair));
                mvwaddch(win, y, x, alive ? kAliveGlyph : kDeadGlyph);
                wattroff(win, A_REVERSE | COLOR_PAIR(kCursorPair));
            } else if (alive) {
                wattron(win, COLOR_PAIR(kAlivePair));
                mvwaddch(win, y, x, kAliveGlyph);
                wattroff(win, COLOR_PAIR(kAlivePair));
            } else {
                mvwaddch(win, y, x, kDeadGlyph);
            }
        }
    }
    wnoutrefresh(win);
}

/** @copydoc TerminalView::drawStatusLine */
void TerminalView::drawStatusLine(const Universe& u, const StatusInfo& info) {
    int rows, cols;
    getmaxyx(win, rows, cols);
    wmove(win, rows - 1, 0);
    wclrtoeol(win);

    std::string status = "Gen: " + std::to_string(info.generation) +
                         "  Pop: " + std::to_string(u.population()) +
                         "  Size: " + std::to_string(u.width()) + "x" + std::to_string(u.height()) +
                         "  Delay(ms): " + std::to_string(info.stepDelayMs);
    status += info.running ? "  | RUNNING" : "  | PAUSED";
    status += "  | [s]tart [p]ause [n]ext [r]andom [c]lear [g]lider pulsar[o] speed[-/+] [q]uit";
    if (!info.note.empty()) { status += "  | "; status += info.note; }
    status = fitStatusLine(std::move(status), cols);

    wattron(win, COLOR_PAIR(kStatusPair));
    mvwprintw(win, rows - 1, 0, "%s", status.c_str());
    wattroff(win, COLOR_PAIR(kStatusPair));
    wnoutrefresh(win);
}
