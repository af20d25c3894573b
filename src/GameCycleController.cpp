/**
 * @file GameCycleController.cpp
 * @brief Cycle state machine: activity clock, inactivity deadline, end-of-cycle payout and restart.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "GameCycleController.h"
#include "Logger.h"
#include "OwnershipLedger.h"
#include "PrizeDistributor.h"
#include "WinnerResolver.h"

#include <limits>
#include <stdexcept>

/** @copydoc GameCycleController::GameCycleController */
GameCycleController::GameCycleController(Seconds inactivityWindow)
    : window(inactivityWindow) {
    if (window <= 0) throw std::invalid_argument("GameCycleController: inactivity window must be positive");
}

/** @copydoc GameCycleController::start */
bool GameCycleController::start(Timestamp now) {
    if (st.cycleId != 0) return false;
    st.active = true;
    st.cycleId = 1;
    st.startedAt = now;
    st.lastActivityAt = now;
    Logger::info("cycle 1 started at " + std::to_string(now));
    return true;
}

/** @copydoc GameCycleController::recordActivity */
void GameCycleController::recordActivity(Timestamp now) {
    if (!st.active) throw std::logic_error("GameCycleController: activity outside an active cycle");
    // Clock going backwards must not move the deadline earlier than it already is.
    if (now > st.lastActivityAt) st.lastActivityAt = now;
}

/** @copydoc GameCycleController::creditPool */
void GameCycleController::creditPool(Amount amount) {
    if (amount > std::numeric_limits<Amount>::max() - st.prizePool) {
        throw std::overflow_error("GameCycleController: prize pool overflow");
    }
    st.prizePool += amount;
}

/** @copydoc GameCycleController::shouldEnd */
bool GameCycleController::shouldEnd(Timestamp now) const {
    return st.active && (now - st.lastActivityAt) >= window;
}

/** @copydoc GameCycleController::remainingTime */
Seconds GameCycleController::remainingTime(Timestamp now) const {
    if (!st.active) return 0;
    Seconds elapsed = now - st.lastActivityAt;
    if (elapsed < 0) elapsed = 0;
    if (elapsed >= window) return 0;
    return window - elapsed;
}

/** @copydoc GameCycleController::endAndRestart */
bool GameCycleController::endAndRestart(Timestamp now, OwnershipLedger& ledger, PaymentGateway& gateway,
                                        CycleSummary& summary) {
    if (!shouldEnd(now)) return false;

    summary = CycleSummary{};
    summary.cycleId = st.cycleId;
    summary.endedAt = now;
    summary.prizePool = st.prizePool;
    st.active = false;

    summary.winners = WinnerResolver::resolve(ledger, &summary.winningCount);
    summary.payouts = PrizeDistributor::plan(st.prizePool, ledger);
    summary.distributed = PrizeDistributor::pay(summary.payouts, gateway);
    summary.carriedOver = st.prizePool - summary.distributed;

    std::string who;
    for (const auto& w : summary.winners) { if (!who.empty()) who += ","; who += w; }
    Logger::info("cycle " + std::to_string(summary.cycleId) + " ended: winners=[" + who + "] cells=" +
                 std::to_string(summary.winningCount) + " pool=" + std::to_string(summary.prizePool) +
                 " paid=" + std::to_string(summary.distributed) + " carried=" + std::to_string(summary.carriedOver));

    st.prizePool = 0;
    ledger.clear();

    st.cycleId += 1;
    st.active = true;
    st.startedAt = now;
    st.lastActivityAt = now;
    st.prizePool = summary.carriedOver;
    Logger::info("cycle " + std::to_string(st.cycleId) + " started at " + std::to_string(now));
    return true;
}
