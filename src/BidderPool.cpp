/**
 * @file BidderPool.cpp
 * @brief BidderPool implementation: bidder lifecycle, pacing and the shared PRNG.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "BidderPool.h"
#include "Bidder.h"
#include "LocalBank.h"
#include "Logger.h"

#include <cstdio>
#include <exception>

namespace {
ActorId makeId(unsigned serial) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "bidder-%03u", serial);
    return ActorId(buf);
}
}

/** @copydoc BidderPool::BidderPool */
BidderPool::BidderPool(PixelLedger& ledger, LocalBank& bank)
    : led(ledger), bnk(bank), prng(rd()) {}

/** @copydoc BidderPool::~BidderPool */
BidderPool::~BidderPool() {
    Logger::info("BidderPool destructor: stopping bidders");
    clear();
}

/** @copydoc BidderPool::setStepDelayMs */
void BidderPool::setStepDelayMs(int ms) {
    if (ms < 5) ms = 5;
    if (ms > 2000) ms = 2000;
    stepDelayMs.store(ms);
}

/** @copydoc BidderPool::clear */
void BidderPool::clear() {
    std::vector<std::shared_ptr<Bidder>> toJoin;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto& b : bidders) if (b) b->requestStop();
        if (!bidders.empty()) Logger::info("BidderPool::clear: stopping bidders count=" + std::to_string(bidders.size()));
        toJoin.swap(bidders);
    }
    // Join outside the lock; bidders may be blocked on the ledger, never on this pool.
    for (auto& b : toJoin) if (b) b->join();
}

/** @copydoc BidderPool::populate */
std::vector<std::shared_ptr<Bidder>> BidderPool::populate(unsigned count, Amount budget) {
    std::vector<std::shared_ptr<Bidder>> made;
    std::lock_guard<std::mutex> lock(mtx);
    for (unsigned i = 0; i < count; ++i) {
        unsigned serial = nextSerial++;
        char sym = static_cast<char>('A' + (serial - 1) % 26);
        auto b = std::make_shared<Bidder>(*this, makeId(serial), sym);
        bnk.deposit(b->id(), budget);
        symbols[b->id()] = sym;
        bidders.push_back(b);
        made.push_back(b);
    }
    return made;
}

/** @copydoc BidderPool::reseed */
void BidderPool::reseed(unsigned count, Amount budget) {
    clear();
    auto made = populate(count, budget);
    unsigned started = 0;
    for (auto& b : made) {
        try {
            b->start();
            ++started;
        } catch (const std::exception& e) {
            Logger::logException("BidderPool::reseed start failed for " + b->id(), e);
            b->requestStop();
        }
    }
    Logger::info("BidderPool::reseed: started bidders count=" + std::to_string(started) +
                 " budget=" + std::to_string(budget));
}

/** @copydoc BidderPool::symbolFor */
char BidderPool::symbolFor(const ActorId& actor) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = symbols.find(actor);
    return it == symbols.end() ? '?' : it->second;
}

/** @copydoc BidderPool::threadCount */
size_t BidderPool::threadCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    size_t live = 0;
    for (auto& b : bidders) if (b && b->isAlive()) ++live;
    return live;
}

/** @copydoc BidderPool::randInt */
int BidderPool::randInt(int lo, int hi) {
    std::lock_guard<std::mutex> lock(rngMtx);
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(prng);
}

/** @copydoc BidderPool::rand01 */
double BidderPool::rand01() {
    std::lock_guard<std::mutex> lock(rngMtx);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(prng);
}
