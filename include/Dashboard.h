/**
 * @file Dashboard.h
 * @brief Declares Dashboard: ncurses view of a PixelLedger (cell owners by price tier plus a status line).
 *
 * The dashboard only reads the ledger through its public API; every frame comes from one
 * consistent snapshot.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "LedgerTypes.h"

#include <mutex>
#include <ncurses.h>
#include <string>

class BidderPool;
class PixelLedger;

/**
 * @class Dashboard
 * @brief Renders the grid (one character per cell) and the bottom status line.
 */
class Dashboard {
public:
    Dashboard(PixelLedger& ledger, BidderPool& bidders);

    /** @brief Number of color pairs used for price tiers (1..PriceTiers). */
    static constexpr int PriceTiers = 8;

    /** @brief Register the price-tier color pairs; no-op on terminals without color. */
    static void initColors();

    /** @brief Redraw every cell from a fresh ledger snapshot. */
    void draw(WINDOW* win);
    /** @brief Update the bottom status line (cycle, pool, leader, controls); cursor is kept at bottom. */
    void drawStatusLine(WINDOW* win);
    /** @brief Map a cell price to a color pair id: tier 1 at the initial price, rising with each escalation. */
    int colorPairForPrice(Amount price) const;

    /** @brief Short message appended to the status line (e.g. last cycle winner). */
    void setStatusNote(const std::string& note);

private:
    PixelLedger& ledger;
    BidderPool& bidders;
    std::mutex noteMtx;
    std::string statusNote;
};
