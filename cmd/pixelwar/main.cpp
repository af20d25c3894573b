/**
 * @file main.cpp
 * @brief Live pixelwar entry: builds a ledger, lets simulated bidders fight over it, and draws it with ncurses.
 *
 * Time runs on a ManualClock that follows the wall clock; [e] jumps it past the inactivity window so a
 * cycle end can be watched without waiting a day.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <ncurses.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>
#include <thread>
#include "BidderPool.h"
#include "Clock.h"
#include "Dashboard.h"
#include "LedgerConfig.h"
#include "LocalBank.h"
#include "Logger.h"
#include "PixelLedger.h"

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

// Handle terminal suspension (Ctrl+Z): restore tty before stopping.
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode(); // save current curses state
        endwin();        // restore tty modes for the shell
        g_curses_inited = false;
    }
    // Revert to default action and re-raise to actually stop the process
    struct sigaction sa{};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume after suspension: restore curses program mode and redraw UI
static void handle_sigcont(int) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);

    reset_prog_mode();
    refresh();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    Dashboard::initColors();
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
    g_needs_full_redraw = 1;
}

/** @brief Read a small positive integer flag (--bidders N / --bidders=N); returns @p fallback if absent. */
static unsigned read_count_flag(int argc, char** argv, const char* name, unsigned fallback) {
    std::string eq = std::string(name) + "=";
    for (int i = 1; i < argc; ++i) {
        const char* v = nullptr;
        if (std::strcmp(argv[i], name) == 0 && i + 1 < argc) v = argv[i + 1];
        else if (std::strncmp(argv[i], eq.c_str(), eq.size()) == 0) v = argv[i] + eq.size();
        Amount n = 0;
        if (v && parseAmount(v, n) && n > 0 && n <= 1000) return static_cast<unsigned>(n);
    }
    return fallback;
}

/** @brief Program entry: sets up the ledger and terminal UI, runs the cycle timer, and exits cleanly on signals. */
int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "pixelwar");
    Logger::info("pixelwar starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (pixelwar)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (pixelwar)"); }
            } else {
                Logger::error("std::terminate (pixelwar): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    LedgerConfig cfg;
    cfg.applyEnv();
    cfg.applyArgs(argc, argv);
    cfg.validate();
    const unsigned bidderCount = read_count_flag(argc, argv, "--bidders", 12);
    // Enough for a few dozen purchases at early prices.
    const Amount budget = cfg.initialPrice * 40;

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
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE); // non-blocking getch
    timeout(0);
    Dashboard::initColors();

    int rows, cols;
    getmaxyx(stdscr, rows, cols);
    if (rows - 1 < cfg.height || cols < cfg.width) {
        endwin();
        g_curses_inited = false;
        Logger::error("terminal too small for " + std::to_string(cfg.width) + "x" + std::to_string(cfg.height) + " grid");
        Logger::shutdown();
        return 1;
    }

    SystemClock wall;
    ManualClock clock(wall.now());
    LocalBank bank;
    PixelLedger ledger(cfg, clock, bank);
    BidderPool bidders(ledger, bank);
    Dashboard dash(ledger, bidders);

    ledger.start();
    bidders.reseed(bidderCount, budget);
    bidders.setRunning(false); // start paused
    werase(stdscr);
    dash.draw(stdscr);
    dash.drawStatusLine(stdscr);
    Logger::info("ledger initialized: " + cfg.describe() + " bidders=" + std::to_string(bidderCount));

    using namespace std::chrono;
    auto lastTick = steady_clock::now();
    long long carryMs = 0;
    int frame = 0;
    bool done = false;
    while (!done) {
        if (g_stop) done = true;

        // Follow the wall clock in whole seconds.
        auto t = steady_clock::now();
        carryMs += duration_cast<milliseconds>(t - lastTick).count();
        lastTick = t;
        if (carryMs >= 1000) {
            clock.advance(carryMs / 1000);
            carryMs %= 1000;
        }

        CycleSummary summary;
        if (ledger.tryEndCycle(&summary)) {
            std::string note = "cycle " + std::to_string(summary.cycleId) + " won by ";
            if (summary.winners.empty()) note += "nobody";
            for (size_t i = 0; i < summary.winners.size(); ++i) {
                if (i) note += ",";
                note += bidders.symbolFor(summary.winners[i]);
            }
            note += " paid " + std::to_string(summary.distributed);
            dash.setStatusNote(note);
            g_needs_full_redraw = 1;
        }

        if (g_needs_full_redraw) {
            werase(stdscr);
            g_needs_full_redraw = 0;
            frame = 0;
        }
        // Grid every ~100ms, status line every frame.
        if (frame++ % 6 == 0) dash.draw(stdscr);
        dash.drawStatusLine(stdscr);

        int ch = getch();
        switch (ch) {
            case 'q':
            case 'Q':
                dash.setStatusNote("terminating");
                dash.drawStatusLine(stdscr);
                Logger::info("quit requested");
                done = true; break;
            case 's': case 'S':
                bidders.toggleRunning();
                Logger::info(std::string("running = ") + (bidders.isRunning() ? "true" : "false"));
                break;
            case 'p': case 'P':
                bidders.setRunning(false);
                Logger::info("paused");
                break;
            case 'r': case 'R':
                bidders.reseed(bidderCount, budget);
                Logger::info("reseed: bidders=" + std::to_string(bidderCount));
                break;
            case 'c': case 'C':
                bidders.clear();
                Logger::info("bidders cleared");
                break;
            case 'e': case 'E': {
                Seconds left = ledger.cycleState().remainingTime;
                clock.advance(left);
                Logger::info("clock advanced by " + std::to_string(left) + "s to close the window");
                break; }
            case '+': {
                bidders.setStepDelayMs(bidders.getStepDelayMs() - 10);
                Logger::info("delay set(ms): " + std::to_string(bidders.getStepDelayMs()));
                break; }
            case '-': {
                bidders.setStepDelayMs(bidders.getStepDelayMs() + 10);
                Logger::info("delay set(ms): " + std::to_string(bidders.getStepDelayMs()));
                break; }
            case KEY_RESIZE:
                g_needs_full_redraw = 1;
                break;
            default:
                break;
        }

        std::this_thread::sleep_for(milliseconds(16)); // ~60 FPS UI
    }

    // Graceful shutdown: stop bidder threads and cleanup
    bidders.setRunning(false);
    bidders.clear();
    endwin();
    g_curses_inited = false;
    CycleState cs = ledger.cycleState();
    Logger::info("pixelwar terminating: cycle=" + std::to_string(cs.cycleId) + " pool=" + std::to_string(cs.prizePool) +
                 " operator=" + std::to_string(cs.operatorEarnings));
    Logger::shutdown();
    return 0;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (pixelwar)", e);
        Logger::shutdown();
        return 2;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("unhandled exception (pixelwar)");
        Logger::shutdown();
        return 2;
    }
}
