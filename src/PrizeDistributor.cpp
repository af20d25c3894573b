/**
 * @file PrizeDistributor.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "PrizeDistributor.h"
#include "Logger.h"

#include <exception>

/** @copydoc PrizeDistributor::plan */
std::vector<Payout> PrizeDistributor::plan(Amount pool, const OwnershipLedger& ledger) {
    std::vector<Payout> out;
    const std::uint64_t total = ledger.totalOwned();
    if (pool == 0 || total == 0) return out;
    out.reserve(ledger.owners());
    for (const auto& e : ledger.entries()) {
        if (e.second == 0) continue;
        Payout p;
        p.actor = e.first;
        p.cells = e.second;
        p.amount = mulDivFloor(pool, e.second, total);
        out.push_back(p);
    }
    return out;
}

/** @copydoc PrizeDistributor::pay */
Amount PrizeDistributor::pay(std::vector<Payout>& payouts, PaymentGateway& gateway) {
    Amount delivered = 0;
    for (auto& p : payouts) {
        if (p.amount == 0) {
            // Nothing to move; counts as settled.
            p.delivered = true;
            continue;
        }
        try {
            p.delivered = gateway.transfer(p.actor, p.amount);
        } catch (const std::exception& e) {
            Logger::logException("prize payout to " + p.actor, e);
            p.delivered = false;
        }
        if (p.delivered) {
            delivered += p.amount;
        } else {
            Logger::warn("prize payout failed: actor=" + p.actor + " amount=" + std::to_string(p.amount));
        }
    }
    return delivered;
}
