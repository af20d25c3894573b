/**
 * @file PixelLedger.h
 * @brief Declares PixelLedger, the thread-safe owner of the grid, ownership counts and game cycle.
 *
 * PixelLedger centralizes all mutable ledger state. Collaborators (dashboard, bidders, an API
 * layer) only see the operations below; each one runs under a single internal mutex, so every
 * purchase and every cycle end appears in one total order.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "GameCycleController.h"
#include "GridStore.h"
#include "LedgerConfig.h"
#include "LedgerTypes.h"
#include "OwnershipLedger.h"
#include "PaymentSplitter.h"
#include "PricingEngine.h"
#include "PurchaseProcessor.h"

#include <atomic>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

class Clock;
class PaymentGateway;

/**
 * @class PixelLedger
 * @brief Grid ownership game: escalating-price purchases, inactivity-terminated cycles, prize payout.
 *
 * Responsibilities:
 * - Validate the configuration once (throws std::invalid_argument)
 * - Serialize purchases and cycle ends under one lock
 * - Reject calls made back into the ledger from inside a PaymentGateway transfer
 * - Expose read-only views of cells, owners and cycle state
 */
class PixelLedger {
public:
    /** @brief Build a ledger over @p clock and @p gateway; both must outlive it. */
    PixelLedger(const LedgerConfig& cfg, Clock& clock, PaymentGateway& gateway);

    PixelLedger(const PixelLedger&) = delete;
    PixelLedger& operator=(const PixelLedger&) = delete;

    /** @brief Open the first cycle at clock time. Returns false if already started. */
    bool start();

    /**
     * @brief Buy (x,y) for @p actor with @p amountTendered; the whole amount is split, nothing refunded.
     *
     * If the inactivity window has already run out, the expired cycle is closed first and the
     * purchase lands in the new cycle.
     */
    PurchaseResult purchase(int x, int y, const std::string& tag, Amount amountTendered, const ActorId& actor);

    /** @brief Owner, price and tag of (x,y) in the current cycle. Throws std::out_of_range. */
    CellView getCell(int x, int y) const;
    /** @brief Coordinates owned by @p actor in the current cycle, row-major order. */
    std::vector<std::pair<int, int>> ownedCells(const ActorId& actor) const;
    /** @brief Ledger count for @p actor. */
    std::uint64_t ownedCount(const ActorId& actor) const;
    /** @brief Number of owned cells in the current cycle. */
    std::uint64_t totalOwned() const;
    /** @brief Actors currently holding the most cells (live view of what would win now). */
    std::vector<ActorId> leaders(std::uint64_t* topCount = nullptr) const;

    /** @brief Active flag, ids, times, remaining time (at clock time) and pool. */
    CycleState cycleState() const;

    /**
     * @brief End the cycle if the inactivity window has passed at @p now; otherwise no-op.
     * @param summary optional; filled when a cycle was closed.
     * @return true only for the call that actually closed the cycle.
     */
    bool tryEndCycle(Timestamp now, CycleSummary* summary = nullptr);
    /** @brief tryEndCycle at clock time. */
    bool tryEndCycle(CycleSummary* summary = nullptr);

    /** @brief Summary of the most recently closed cycle; false if none has closed yet. */
    bool lastCycleSummary(CycleSummary& out) const;

    /** @brief Whole canvas in one consistent read. */
    CanvasSnapshot snapshot() const;

    const LedgerConfig& config() const { return cfg; }
    int width() const { return cfg.width; }
    int height() const { return cfg.height; }

private:
    /** @brief Throws std::logic_error when called from inside a transfer on the writer thread. */
    void checkNotReentrant(const char* op) const;
    /** @brief End the cycle if due at @p now (caller holds mtx and the writer slot). */
    bool closeCycleLocked(Timestamp now, CycleSummary* summary);
    /** @brief Cell view without locking (caller holds mtx). */
    CellView viewLocked(int x, int y) const;

    const LedgerConfig cfg;
    Clock& clock;
    PaymentGateway& gateway;

    GridStore grid;
    OwnershipLedger owners;
    GameCycleController cycle;
    PricingEngine pricing;
    PaymentSplitter splitter;
    PurchaseProcessor processor;

    Amount operatorEarnings{0}; /**< lifetime operator shares paid */
    CycleSummary lastSummary;
    bool haveSummary{false};

    mutable std::mutex mtx;                 /**< single writer lock over all state above */
    std::atomic<std::thread::id> writer{};  /**< thread currently holding mtx for a mutation */
};
