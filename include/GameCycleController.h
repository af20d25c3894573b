/**
 * @file GameCycleController.h
 * @brief Declares GameCycleController: the active/ended state machine of one game cycle and its prize pool.
 *
 * A cycle stays Active while purchases keep arriving. Once no purchase has happened for the
 * inactivity window, endAndRestart() resolves winners, pays out the pool, clears ownership and
 * opens the next cycle immediately. Cells are not touched here; they reset lazily when next
 * bought because their lastUpdateCycle is older than the new cycle id.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "LedgerTypes.h"

class OwnershipLedger;
class PaymentGateway;

/**
 * @class GameCycleController
 * @brief Cycle bookkeeping. Not thread-safe; PixelLedger serializes all calls.
 */
class GameCycleController {
public:
    /** @brief Mutable cycle fields, copied out so a failed purchase can put them back. */
    struct State {
        bool active{false};
        std::uint64_t cycleId{0};
        Timestamp startedAt{0};
        Timestamp lastActivityAt{0};
        Amount prizePool{0};
    };

    explicit GameCycleController(Seconds inactivityWindow);

    /** @brief Open cycle 1 at @p now. Returns false if a cycle was already started. */
    bool start(Timestamp now);

    bool active() const { return st.active; }
    std::uint64_t cycleId() const { return st.cycleId; }
    Timestamp startedAt() const { return st.startedAt; }
    Timestamp lastActivityAt() const { return st.lastActivityAt; }
    Amount prizePool() const { return st.prizePool; }
    Seconds inactivityWindow() const { return window; }

    /** @brief Mark a purchase at @p now. Throws std::logic_error when no cycle is active. */
    void recordActivity(Timestamp now);
    /** @brief Add @p amount to the pool. Throws std::overflow_error if the pool would wrap. */
    void creditPool(Amount amount);

    /** @brief active && now - lastActivityAt >= inactivityWindow. */
    bool shouldEnd(Timestamp now) const;
    /** @brief Seconds left before shouldEnd() turns true; 0 if inactive or already due. */
    Seconds remainingTime(Timestamp now) const;

    /**
     * @brief Close the current cycle and open the next one, if shouldEnd(now).
     *
     * Resolves winners, distributes the pool to all owners through @p gateway, zeroes the pool,
     * clears @p ledger and starts cycle id + 1 at @p now. The undistributed remainder (truncation
     * plus failed payouts) seeds the new cycle's pool.
     *
     * @return false (and changes nothing) when the cycle is not due.
     */
    bool endAndRestart(Timestamp now, OwnershipLedger& ledger, PaymentGateway& gateway, CycleSummary& summary);

    const State& state() const { return st; }
    /** @brief Put back a State previously obtained from state(). */
    void restore(const State& s) { st = s; }

private:
    Seconds window;
    State st;
};
