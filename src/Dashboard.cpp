/**
 * @file Dashboard.cpp
 * @brief Dashboard implementation: snapshot-based ncurses drawing of the ledger.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Dashboard.h"
#include "BidderPool.h"
#include "PixelLedger.h"

#include <cstdio>
#include <cstring>

/** @copydoc Dashboard::Dashboard */
Dashboard::Dashboard(PixelLedger& l, BidderPool& b)
    : ledger(l), bidders(b) {}

/** @copydoc Dashboard::initColors */
void Dashboard::initColors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    // Price tiers, cheap to expensive
    // 1: initial   -> white
    // 2..7         -> blue, cyan, green, yellow, magenta, red
    // 8: hottest   -> red (drawn bold)
    init_pair(1, COLOR_WHITE, -1);
    init_pair(2, COLOR_BLUE, -1);
    init_pair(3, COLOR_CYAN, -1);
    init_pair(4, COLOR_GREEN, -1);
    init_pair(5, COLOR_YELLOW, -1);
    init_pair(6, COLOR_MAGENTA, -1);
    init_pair(7, COLOR_RED, -1);
    init_pair(8, COLOR_RED, -1);
}

/** @copydoc Dashboard::colorPairForPrice */
int Dashboard::colorPairForPrice(Amount price) const {
    const LedgerConfig& cfg = ledger.config();
    // Count escalations needed to reach this price; two escalations per tier.
    int steps = 0;
    Amount p = cfg.initialPrice;
    while (p < price && steps < 2 * (PriceTiers - 1)) {
        p = mulDivFloor(p, cfg.priceNumerator, cfg.priceDenominator);
        ++steps;
    }
    return 1 + (steps + 1) / 2;
}

/** @copydoc Dashboard::draw */
void Dashboard::draw(WINDOW* win) {
    CanvasSnapshot snap = ledger.snapshot();
    for (int y = 0; y < snap.height; ++y) {
        for (int x = 0; x < snap.width; ++x) {
            size_t i = static_cast<size_t>(y) * static_cast<size_t>(snap.width) + static_cast<size_t>(x);
            const ActorId& owner = snap.owners[i];
            if (owner.empty()) {
                mvwaddch(win, y, x, '.');
                continue;
            }
            int pair = colorPairForPrice(snap.prices[i]);
            bool bold = (pair >= PriceTiers);
            if (bold) wattron(win, A_BOLD);
            wattron(win, COLOR_PAIR(pair));
            mvwaddch(win, y, x, bidders.symbolFor(owner));
            wattroff(win, COLOR_PAIR(pair));
            if (bold) wattroff(win, A_BOLD);
        }
    }
    wrefresh(win);
}

/** @copydoc Dashboard::setStatusNote */
void Dashboard::setStatusNote(const std::string& note) {
    std::lock_guard<std::mutex> lock(noteMtx);
    statusNote = note;
}

/** @copydoc Dashboard::drawStatusLine */
void Dashboard::drawStatusLine(WINDOW* win) {
    int rows, cols; getmaxyx(win, rows, cols);
    CycleState cs = ledger.cycleState();
    std::uint64_t top = 0;
    std::vector<ActorId> lead = ledger.leaders(&top);

    wmove(win, rows - 1, 0);
    wclrtoeol(win);
    // Legend for price tiers
    int x = 0;
    mvwprintw(win, rows - 1, x, "P:"); x += 2;
    for (int t = 1; t <= PriceTiers; ++t) {
        bool bold = (t >= PriceTiers);
        if (bold) wattron(win, A_BOLD);
        wattron(win, COLOR_PAIR(t));
        char buf[4];
        std::snprintf(buf, sizeof(buf), "%d", t);
        mvwprintw(win, rows - 1, x, "%s", buf);
        x += static_cast<int>(std::strlen(buf));
        wattroff(win, COLOR_PAIR(t));
        if (bold) wattroff(win, A_BOLD);
    }

    std::string status = "  | cycle " + std::to_string(cs.cycleId);
    status += cs.active ? " ends in " + std::to_string(cs.remainingTime) + "s" : " idle";
    status += "  pool " + std::to_string(cs.prizePool);
    status += "  fee " + std::to_string(cs.operatorEarnings);
    status += "  owned " + std::to_string(ledger.totalOwned());
    if (!lead.empty()) {
        status += "  lead ";
        status += bidders.symbolFor(lead.front());
        if (lead.size() > 1) status += "+" + std::to_string(lead.size() - 1);
        status += "(" + std::to_string(top) + ")";
    }
    status += "  | bidders " + std::to_string(bidders.threadCount());
    status += " buys " + std::to_string(bidders.purchaseCount());
    status += "  delay " + std::to_string(bidders.getStepDelayMs()) + "ms";
    status += bidders.isRunning() ? "  RUNNING" : "  PAUSED";
    status += "  | [s]tart [p]ause [r]eseed [c]lear [e]nd-window [-/+] [q]uit";
    {
        std::lock_guard<std::mutex> lock(noteMtx);
        if (!statusNote.empty()) { status += "  | "; status += statusNote; }
    }
    if (static_cast<int>(status.size()) + x > cols && cols > x) status.resize(static_cast<size_t>(cols - x));
    mvwprintw(win, rows - 1, x, "%s", status.c_str());
    wrefresh(win);
}
