/**
 * @file PaymentGateway.h
 * @brief Outbound payment capability consumed by the ledger.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "LedgerTypes.h"

/**
 * @class PaymentGateway
 * @brief Moves funds held by the ledger to an actor.
 *
 * transfer() is called with the ledger lock held. Implementations must not call back into the
 * ledger from transfer(); such calls are rejected with PurchaseError::ReentrantCall.
 */
class PaymentGateway {
public:
    virtual ~PaymentGateway() = default;

    /** @brief Pay @p amount to @p to. Returns false (or throws) if the payment was not made. */
    virtual bool transfer(const ActorId& to, Amount amount) = 0;

    /**
     * @brief Undo a transfer this gateway already accepted in the current purchase.
     *
     * Only used to unwind a purchase whose later transfer failed.
     * @return false if less than @p amount could be recovered (the recipient already spent it).
     */
    virtual bool reclaim(const ActorId& from, Amount amount) = 0;
};
