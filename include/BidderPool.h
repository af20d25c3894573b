/**
 * @file BidderPool.h
 * @brief Declares BidderPool, which seeds, paces and tears down the simulated bidders of a ledger.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "LedgerTypes.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <random>
#include <unordered_map>
#include <vector>

class Bidder;
class LocalBank;
class PixelLedger;

/**
 * @class BidderPool
 * @brief Owner of the bidder threads plus the run/pause switch and step delay they obey.
 */
class BidderPool {
public:
    BidderPool(PixelLedger& ledger, LocalBank& bank);
    /** @brief Destructor; stops and joins all bidders. */
    ~BidderPool();

    // Simulation control
    /** @brief Set the bidders running (true) or paused (false). */
    void setRunning(bool on) { running.store(on); }
    /** @brief Query whether the bidders are running. */
    bool isRunning() const { return running.load(); }
    /** @brief Toggle running/paused. */
    void toggleRunning() { setRunning(!isRunning()); }

    /** @brief Set per-bidder sleep delay in milliseconds; clamped to [5,2000]. */
    void setStepDelayMs(int ms);
    /** @brief Get the current per-bidder sleep delay in milliseconds. */
    int getStepDelayMs() const { return stepDelayMs.load(); }

    // Bidder management
    /** @brief Stop all bidders and join their threads. Ledger state is not touched. */
    void clear();
    /** @brief Replace the bidders with @p count new ones, each funded with @p budget. */
    void reseed(unsigned count, Amount budget);
    /** @brief Create @p count bidders without starting threads (tests drive Bidder::step directly). */
    std::vector<std::shared_ptr<Bidder>> populate(unsigned count, Amount budget);

    /** @brief Display letter for @p actor, '?' for unknown actors. */
    char symbolFor(const ActorId& actor) const;
    /** @brief Count of live bidder threads (best-effort snapshot). */
    size_t threadCount() const;

    // Random helpers (shared PRNG, guarded)
    /** @brief Uniform integer in [lo,hi]. */
    int randInt(int lo, int hi);
    /** @brief Uniform real in [0,1). */
    double rand01();

    // Statistics updated by bidders
    void notePurchase() { purchases.fetch_add(1); }
    void noteRejection() { rejections.fetch_add(1); }
    unsigned long purchaseCount() const { return purchases.load(); }
    unsigned long rejectionCount() const { return rejections.load(); }

    PixelLedger& ledger() { return led; }
    LocalBank& bank() { return bnk; }

private:
    PixelLedger& led;
    LocalBank& bnk;

    std::vector<std::shared_ptr<Bidder>> bidders; /**< owned bidders */
    std::unordered_map<ActorId, char> symbols;    /**< actor -> display letter */
    mutable std::mutex mtx;                       /**< guards bidders and symbols */

    std::atomic<bool> running{false};  /**< run/pause flag */
    std::atomic<int> stepDelayMs{150}; /**< per-bidder sleep delay (ms) */
    std::atomic<unsigned long> purchases{0};
    std::atomic<unsigned long> rejections{0};
    unsigned nextSerial{1};            /**< next bidder number; never reused so ids stay unique */

    std::mutex rngMtx;
    std::random_device rd; /**< entropy for PRNG seeding */
    std::mt19937 prng;     /**< pool PRNG */
};
