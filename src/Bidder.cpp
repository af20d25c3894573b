/**
 * @file Bidder.cpp
 * @brief Bidder implementation: threaded decision loop issuing purchases through the ledger.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Bidder.h"
#include "BidderPool.h"
#include "LocalBank.h"
#include "Logger.h"
#include "PixelLedger.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <utility>

/** @copydoc Bidder::Bidder */
Bidder::Bidder(BidderPool& p, ActorId id, char symbol)
    : pool(p), actor(std::move(id)), sym(symbol) {}

/** @copydoc Bidder::~Bidder */
Bidder::~Bidder() {
    requestStop();
    if (worker.joinable()) {
        // Avoid joining self; detach if needed
        if (std::this_thread::get_id() != worker.get_id()) worker.join();
        else worker.detach();
    }
}

/** @copydoc Bidder::start */
void Bidder::start() {
    alive.store(true);
    try {
        worker = std::thread(&Bidder::run, this);
    } catch (...) {
        alive.store(false);
        throw;
    }
}

/** @copydoc Bidder::requestStop */
void Bidder::requestStop() {
    alive.store(false);
}

/** @copydoc Bidder::join */
void Bidder::join() {
    if (worker.joinable()) worker.join();
}

/** @copydoc Bidder::step */
bool Bidder::step() {
    PixelLedger& ledger = pool.ledger();
    LocalBank& bank = pool.bank();

    if (!ledger.cycleState().active) return false;

    int x = pool.randInt(0, ledger.width() - 1);
    int y = pool.randInt(0, ledger.height() - 1);
    CellView cell = ledger.getCell(x, y);
    if (cell.owner == actor) return false;

    // Usually pay the listed price; now and then overpay by up to 5% (the excess goes into the split).
    Amount tender = cell.price;
    if (pool.rand01() < 0.1) tender += cell.price / 100 * static_cast<Amount>(pool.randInt(1, 5));
    if (bank.balanceOf(actor) < tender) {
        ++misses;
        return false;
    }
    if (!bank.debit(actor, tender)) {
        ++misses;
        return false;
    }

    std::string tag(1, sym);
    PurchaseResult r = ledger.purchase(x, y, tag, tender, actor);
    if (!r.ok()) {
        // Rejected purchases never keep the money.
        bank.deposit(actor, tender);
        pool.noteRejection();
        ++misses;
        Logger::debug("bidder " + actor + " lost race at (" + std::to_string(x) + "," + std::to_string(y) +
                      "): " + purchaseErrorName(r.error));
        return false;
    }
    misses = 0;
    won.fetch_add(1);
    pool.notePurchase();
    return true;
}

/** @brief Worker loop: step -> sleep, until stopped. */
void Bidder::run() {
    using namespace std::chrono;
    try {
        Logger::debug("bidder thread starting: " + actor);
        while (isAlive()) {
            if (!pool.isRunning()) {
                std::this_thread::sleep_for(10ms);
                continue;
            }
            step();
            int delay = pool.getStepDelayMs();
            if (misses >= MissBackoffThreshold) {
                delay = std::min(delay * 4, 2000);
                misses = 0;
            }
            std::this_thread::sleep_for(milliseconds(delay));
        }
        Logger::debug("bidder thread exiting: " + actor);
    } catch (const std::exception& e) {
        Logger::logException("bidder " + actor + " run loop", e);
    } catch (...) {
        Logger::logUnknownException("bidder " + actor + " run loop");
    }
    alive.store(false);
}
