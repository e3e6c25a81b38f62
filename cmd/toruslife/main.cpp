/**
 * @file main.cpp
 * @brief toruslife entry: loads configuration, initializes ncurses, runs the single-threaded tick/draw loop.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <ncurses.h>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <thread>
#include "Config.h"
#include "Logger.h"
#include "TerminalView.h"
#include "Universe.h"

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

static bool g_curses_inited = false;
static volatile sig_atomic_t g_needs_full_redraw = 0;
static void atexit_cleanup() {
    if (g_curses_inited) {
        endwin();
        g_curses_inited = false;
    }
}

static void configure_curses() {
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE); // non-blocking getch
    timeout(0);
    mousemask(BUTTON1_CLICKED | BUTTON_CTRL | BUTTON_SHIFT, nullptr);
    mouseinterval(0);
    TerminalView::initColors();
}

// Handle terminal suspension (Ctrl+Z): restore tty before stopping.
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode();
        endwin();
        g_curses_inited = false;
    }
    struct sigaction sa{};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume after suspension: restore curses program mode and redraw everything
static void handle_sigcont(int) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);

    reset_prog_mode();
    configure_curses();
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
    g_needs_full_redraw = 1;
}

/** @brief Mutable front-end state around the Universe. */
struct Session {
    Universe universe;
    StatusInfo status;
    std::uint32_t cursorRow{0};
    std::uint32_t cursorCol{0};
};

/** @brief Run a pattern stamp; a stamp too close to the edge is reported instead of ending the program. */
template <class F>
static void stamp(Session& s, const char* what, std::uint32_t row, std::uint32_t col, F&& f) {
    try {
        f(row, col);
        s.status.note = std::string(what) + " at (" + std::to_string(row) + "," + std::to_string(col) + ")";
        Logger::info(s.status.note);
    } catch (const std::out_of_range& e) {
        Logger::warn(std::string("rejected ") + what + ": " + e.what());
        s.status.note = std::string(what) + " does not fit here";
    }
}

static void insertGliderAt(Session& s, std::uint32_t row, std::uint32_t col) {
    stamp(s, "glider", row, col, [&s](std::uint32_t r, std::uint32_t c) { s.universe.insertGlider(r, c); });
}

static void insertPulsarAt(Session& s, std::uint32_t row, std::uint32_t col) {
    stamp(s, "pulsar", row, col, [&s](std::uint32_t r, std::uint32_t c) { s.universe.insertPulsar(r, c); });
}

/** @brief Translate one mouse event into toggle / glider / pulsar. */
static void handleMouse(Session& s, const TerminalView& view) {
    MEVENT ev;
    if (getmouse(&ev) != OK) return;
    if (!(ev.bstate & BUTTON1_CLICKED)) return;
    std::uint32_t row, col;
    if (!view.viewport().toGrid(ev.y, ev.x, s.universe.height(), s.universe.width(), row, col)) return;
    s.cursorRow = row;
    s.cursorCol = col;
    if (ev.bstate & BUTTON_CTRL) insertGliderAt(s, row, col);
    else if (ev.bstate & BUTTON_SHIFT) insertPulsarAt(s, row, col);
    else s.universe.toggleCell(row, col);
}

/** @brief Step @p v one cell in direction @p d (-1, 0, +1) on a ring of @p n cells. */
static std::uint32_t stepWrapped(std::uint32_t v, int d, std::uint32_t n) {
    if (d < 0) return static_cast<std::uint32_t>((std::uint64_t(v) + n - 1) % n);
    if (d > 0) return static_cast<std::uint32_t>((std::uint64_t(v) + 1) % n);
    return v;
}

/** @brief Move the cursor by (dr, dc), wrapping like the torus it sits on. */
static void moveCursor(Session& s, int dr, int dc) {
    s.cursorRow = stepWrapped(s.cursorRow, dr, s.universe.height());
    s.cursorCol = stepWrapped(s.cursorCol, dc, s.universe.width());
}

/** @brief Program entry: sets up the terminal UI, seeds the universe, handles input, and exits cleanly on signals. */
int main(int argc, char** argv) {
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (toruslife)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (toruslife)"); }
            } else {
                Logger::error("std::terminate (toruslife): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });

    LifeConfig cfg;
    try {
        cfg = configFromEnv();
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "toruslife: %s\n", e.what());
        return 2;
    }
    Logger::setLevel(cfg.logLevel);
    if (cfg.logFile.empty()) Logger::initFromArgv0((argc > 0) ? argv[0] : "toruslife");
    else if (!Logger::init(cfg.logFile)) std::fprintf(stderr, "toruslife: cannot open log file %s\n", cfg.logFile.c_str());
    Logger::info("toruslife starting");

    try {
    Session s;
    applyStart(cfg, s.universe);
    s.status.stepDelayMs = cfg.stepDelayMs;
    s.cursorRow = s.universe.height() / 2;
    s.cursorCol = s.universe.width() / 2;
    Logger::info("universe initialized: " + std::to_string(s.universe.width()) + "x" +
                 std::to_string(s.universe.height()) + " start=" + startModeName(cfg.start) +
                 " population=" + std::to_string(s.universe.population()));

    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    struct sigaction sc{}; sc.sa_handler = handle_sigcont; sigemptyset(&sc.sa_mask); sc.sa_flags = 0; sigaction(SIGCONT, &sc, nullptr);

    initscr();
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    configure_curses();

    TerminalView view(stdscr);
    view.layout(s.universe);
    view.viewport().follow(s.cursorRow, s.cursorCol);

    using clock = std::chrono::steady_clock;
    auto lastTick = clock::now();
    bool done = false;
    while (!done) {
        if (g_stop) done = true;
        if (g_needs_full_redraw) {
            view.layout(s.universe);
            g_needs_full_redraw = 0;
        }

        int ch = getch();
        switch (ch) {
            case 'q': case 'Q':
                Logger::info("quit requested");
                done = true; break;
            case 's': case 'S':
                s.status.running = !s.status.running;
                lastTick = clock::now();
                Logger::info(std::string("running = ") + (s.status.running ? "true" : "false"));
                break;
            case 'p': case 'P':
                s.status.running = false;
                Logger::info("paused");
                break;
            case 'n': case 'N':
                s.universe.tick();
                ++s.status.generation;
                break;
            case 'r': case 'R':
                s.universe.random();
                s.status.generation = 0;
                Logger::info("random fill: population=" + std::to_string(s.universe.population()));
                break;
            case 'c': case 'C':
                s.universe.clear();
                s.status.generation = 0;
                Logger::info("clear requested");
                break;
            case ' ':
                s.universe.toggleCell(s.cursorRow, s.cursorCol);
                break;
            case 'g': case 'G':
                insertGliderAt(s, s.cursorRow, s.cursorCol);
                break;
            case 'o': case 'O':
                insertPulsarAt(s, s.cursorRow, s.cursorCol);
                break;
            case KEY_UP: moveCursor(s, -1, 0); break;
            case KEY_DOWN: moveCursor(s, 1, 0); break;
            case KEY_LEFT: moveCursor(s, 0, -1); break;
            case KEY_RIGHT: moveCursor(s, 0, 1); break;
            case KEY_MOUSE:
                handleMouse(s, view);
                break;
            case KEY_RESIZE:
                view.layout(s.universe);
                break;
            case '+':
                s.status.stepDelayMs = clampStepDelayMs(s.status.stepDelayMs - 10);
                Logger::info("delay set(ms): " + std::to_string(s.status.stepDelayMs));
                break;
            case '-':
                s.status.stepDelayMs = clampStepDelayMs(s.status.stepDelayMs + 10);
                Logger::info("delay set(ms): " + std::to_string(s.status.stepDelayMs));
                break;
            default:
                break;
        }
        view.viewport().follow(s.cursorRow, s.cursorCol);

        if (s.status.running) {
            auto now = clock::now();
            if (now - lastTick >= std::chrono::milliseconds(s.status.stepDelayMs)) {
                s.universe.tick();
                ++s.status.generation;
                lastTick = now;
            }
        }

        view.draw(s.universe, s.cursorRow, s.cursorCol);
        view.drawStatusLine(s.universe, s.status);
        doupdate();

        std::this_thread::sleep_for(std::chrono::milliseconds(16)); // ~60 FPS UI
    }

    endwin();
    g_curses_inited = false;
    Logger::info("toruslife terminating after " + std::to_string(s.status.generation) + " generations");
    Logger::shutdown();
    return 0;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (toruslife)", e);
        std::fprintf(stderr, "toruslife: %s\n", e.what());
        Logger::shutdown();
        return 2;
    }
}
