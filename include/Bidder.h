/**
 * @file Bidder.h
 * @brief Declares the Bidder class: an autonomous, threaded buyer competing for cells on a PixelLedger.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "LedgerTypes.h"

#include <atomic>
#include <thread>

class BidderPool;

/**
 * @class Bidder
 * @brief One simulated actor. Each instance runs in its own thread and only goes through the ledger API.
 *
 * Responsibilities:
 * - Pick a cell, check it is affordable and not already its own
 * - Pay the listed price (sometimes a little more) out of its LocalBank balance
 * - Get the tendered amount back when the ledger rejects the purchase
 */
class Bidder {
public:
    /** @brief Construct a bidder in @p pool identified by @p id and drawn as @p symbol. */
    Bidder(BidderPool& pool, ActorId id, char symbol);
    /** @brief Destructor; requests stop and joins the worker thread if needed. */
    ~Bidder();

    // Lifecycle
    /** @brief Start the bidder worker thread. */
    void start();
    /** @brief Ask the worker thread to stop at the next opportunity. */
    void requestStop();
    /** @brief Whether the worker has been started and is still running. */
    bool isAlive() const { return alive.load(); }
    /** @brief Join the worker thread if joinable. */
    void join();

    // Identity
    const ActorId& id() const { return actor; }
    /** @brief Display letter (A-Z). */
    char symbol() const { return sym; }

    /** @brief Purchases this bidder completed. */
    unsigned wins() const { return won.load(); }

    /** @brief One sense-decide-act step; returns true if a purchase committed. Used by run() and tests. */
    bool step();

private:
    /** @brief Worker loop: step, sleep, until stopped. */
    void run();

    BidderPool& pool;                /**< owning pool (ledger, bank, pacing) */
    ActorId actor;                   /**< ledger identity */
    char sym;                        /**< display letter */
    std::atomic<bool> alive{false};  /**< set by start(); cleared by requestStop() or loop exit */
    std::atomic<unsigned> won{0};    /**< committed purchases */
    std::thread worker;              /**< worker thread */

    // Backoff after a run of rejections so broke bidders stop hammering the lock
    int misses{0};
    static constexpr int MissBackoffThreshold = 8;
};
