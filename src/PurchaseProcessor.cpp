/**
 * @file PurchaseProcessor.cpp
 * @brief Purchase pipeline: validate, price, split, mutate, disburse, and unwind on transfer failure.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "PurchaseProcessor.h"
#include "GameCycleController.h"
#include "GridStore.h"
#include "Logger.h"
#include "OwnershipLedger.h"
#include "PaymentGateway.h"
#include "PaymentSplitter.h"
#include "PricingEngine.h"

#include <exception>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {
std::string where(int x, int y) {
    return "(" + std::to_string(x) + "," + std::to_string(y) + ")";
}

PurchaseResult reject(PurchaseError e, const ActorId& buyer, int x, int y) {
    Logger::debug("purchase rejected: " + std::string(purchaseErrorName(e)) + " buyer=" + buyer + " at " + where(x, y));
    PurchaseResult r;
    r.error = e;
    return r;
}
}

/** @copydoc PurchaseProcessor::PurchaseProcessor */
PurchaseProcessor::PurchaseProcessor(GridStore& g, OwnershipLedger& l, GameCycleController& c,
                                     const PricingEngine& p, const PaymentSplitter& s,
                                     PaymentGateway& gw, ActorId op, Amount initial)
    : grid(g), ledger(l), cycle(c), pricing(p), splitter(s), gateway(gw),
      operatorId(std::move(op)), initialPrice(initial) {}

bool PurchaseProcessor::isStale(const Cell& c) const {
    return c.lastUpdateCycle < cycle.cycleId();
}

/** @copydoc PurchaseProcessor::effectiveCell */
Cell PurchaseProcessor::effectiveCell(int x, int y) const {
    Cell c = grid.get(x, y);
    if (isStale(c)) {
        c.owner.clear();
        c.price = initialPrice;
    }
    return c;
}

/** @copydoc PurchaseProcessor::purchase */
PurchaseResult PurchaseProcessor::purchase(int x, int y, const std::string& tag, Amount amountTendered,
                                           const ActorId& buyer, Timestamp now) {
    // Validating
    if (!cycle.active()) return reject(PurchaseError::GameNotActive, buyer, x, y);
    if (!grid.inBounds(x, y)) return reject(PurchaseError::OutOfBounds, buyer, x, y);
    if (tag.empty()) return reject(PurchaseError::EmptyTag, buyer, x, y);

    const Cell stored = grid.get(x, y);
    const Cell current = effectiveCell(x, y);
    if (amountTendered < current.price) return reject(PurchaseError::InsufficientPayment, buyer, x, y);
    if (current.owner == buyer) return reject(PurchaseError::AlreadyOwner, buyer, x, y);

    // Pricing
    Amount newPrice = 0;
    try {
        newPrice = pricing.nextPrice(current.price);
    } catch (const std::overflow_error&) {
        return reject(PurchaseError::PriceOverflow, buyer, x, y);
    }

    // Splitting: over the full amount tendered, overpayment included.
    const bool hasPrevious = current.hasOwner();
    PaymentSplit split = splitter.split(amountTendered, hasPrevious);
    if (split.poolShare > std::numeric_limits<Amount>::max() - cycle.prizePool()) {
        return reject(PurchaseError::PriceOverflow, buyer, x, y);
    }

    Receipt r;
    r.buyer = buyer;
    r.x = x;
    r.y = y;
    r.tag = tag;
    r.amountPaid = amountTendered;
    r.listedPrice = current.price;
    r.newPrice = newPrice;
    r.previousOwner = current.owner;
    r.split = split;
    r.cycleId = cycle.cycleId();
    r.at = now;

    // Mutating
    const GameCycleController::State savedCycle = cycle.state();
    if (hasPrevious) ledger.decrement(current.owner);
    ledger.increment(buyer);

    Cell next;
    next.owner = buyer;
    next.price = newPrice;
    next.tag = tag;
    next.lastUpdateCycle = cycle.cycleId();
    grid.set(x, y, next);

    cycle.recordActivity(now);
    cycle.creditPool(split.poolShare);

    // Disbursing
    if (!disburse(r)) {
        grid.set(x, y, stored);
        ledger.decrement(buyer);
        if (hasPrevious) ledger.increment(current.owner);
        cycle.restore(savedCycle);
        Logger::warn("purchase rolled back: transfer failed, buyer=" + buyer + " at " + where(x, y) +
                     " amount=" + std::to_string(amountTendered));
        PurchaseResult fail;
        fail.error = PurchaseError::TransferFailed;
        return fail;
    }

    // Committed
    Logger::debug("purchase: " + buyer + " bought " + where(x, y) + " for " + std::to_string(amountTendered) +
                  (hasPrevious ? " from " + current.owner : std::string(" (fresh)")) +
                  " next=" + std::to_string(newPrice) + " pool=" + std::to_string(cycle.prizePool()));
    PurchaseResult ok;
    ok.receipt = std::move(r);
    return ok;
}

bool PurchaseProcessor::disburse(const Receipt& r) {
    std::vector<std::pair<ActorId, Amount>> plan;
    if (!r.previousOwner.empty() && r.split.previousOwnerShare > 0) plan.emplace_back(r.previousOwner, r.split.previousOwnerShare);
    if (r.split.operatorShare > 0) plan.emplace_back(operatorId, r.split.operatorShare);

    std::vector<std::pair<ActorId, Amount>> done;
    for (const auto& t : plan) {
        bool paid = false;
        try {
            paid = gateway.transfer(t.first, t.second);
        } catch (const std::exception& e) {
            Logger::logException("transfer to " + t.first, e);
        }
        if (!paid) {
            Logger::warn("transfer failed: to=" + t.first + " amount=" + std::to_string(t.second));
            for (auto it = done.rbegin(); it != done.rend(); ++it) {
                if (!gateway.reclaim(it->first, it->second)) {
                    Logger::error("reclaim incomplete: from=" + it->first + " amount=" + std::to_string(it->second));
                }
            }
            return false;
        }
        done.push_back(t);
    }
    return true;
}
