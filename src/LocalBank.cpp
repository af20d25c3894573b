/**
 * @file LocalBank.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "LocalBank.h"
#include "Logger.h"

#include <string>

/** @copydoc LocalBank::transfer */
bool LocalBank::transfer(const ActorId& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mtx);
    if (to.empty()) return false;
    if (failing.count(to)) {
        Logger::debug("bank: refusing transfer to " + to);
        return false;
    }
    balances[to] += amount;
    transferred += amount;
    ++transfers;
    return true;
}

/** @copydoc LocalBank::reclaim */
bool LocalBank::reclaim(const ActorId& from, Amount amount) {
    std::lock_guard<std::mutex> lock(mtx);
    auto& bal = balances[from];
    // Only what is still in the account comes back; the rest stays counted as paid out.
    const Amount recovered = bal < amount ? bal : amount;
    bal -= recovered;
    transferred = transferred >= recovered ? transferred - recovered : 0;
    if (transfers > 0) --transfers;
    if (recovered < amount) {
        shortfall += amount - recovered;
        Logger::warn("bank: reclaim from " + from + " short by " + std::to_string(amount - recovered));
        return false;
    }
    return true;
}

/** @copydoc LocalBank::deposit */
void LocalBank::deposit(const ActorId& who, Amount amount) {
    std::lock_guard<std::mutex> lock(mtx);
    balances[who] += amount;
}

/** @copydoc LocalBank::debit */
bool LocalBank::debit(const ActorId& who, Amount amount) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = balances.find(who);
    if (it == balances.end() || it->second < amount) return false;
    it->second -= amount;
    return true;
}

/** @copydoc LocalBank::balanceOf */
Amount LocalBank::balanceOf(const ActorId& who) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = balances.find(who);
    return it == balances.end() ? 0 : it->second;
}

/** @copydoc LocalBank::setFailing */
void LocalBank::setFailing(const ActorId& who, bool on) {
    std::lock_guard<std::mutex> lock(mtx);
    if (on) failing.insert(who);
    else failing.erase(who);
}

/** @copydoc LocalBank::totalTransferred */
Amount LocalBank::totalTransferred() const {
    std::lock_guard<std::mutex> lock(mtx);
    return transferred;
}

/** @copydoc LocalBank::transferCount */
size_t LocalBank::transferCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return transfers;
}

/** @copydoc LocalBank::reclaimShortfall */
Amount LocalBank::reclaimShortfall() const {
    std::lock_guard<std::mutex> lock(mtx);
    return shortfall;
}
