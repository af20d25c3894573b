/**
 * @file PrizeDistributor.h
 * @brief Apportions a closed cycle's prize pool across every owner in proportion to cells held.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "OwnershipLedger.h"
#include "PaymentGateway.h"

#include <vector>

/**
 * @class PrizeDistributor
 * @brief share = floor(pool * count / totalOwned), computed once per owner.
 *
 * The truncation remainder is not paid out; the caller carries it into the next cycle.
 * Payouts are independent: a failed transfer is reported on its Payout and does not affect others.
 */
class PrizeDistributor {
public:
    /** @brief Per-owner shares in actor id order. Empty when @p pool is 0 or nobody owns a cell. */
    static std::vector<Payout> plan(Amount pool, const OwnershipLedger& ledger);

    /**
     * @brief Transfer each planned share through @p gateway, marking Payout::delivered.
     * @return sum of delivered amounts.
     */
    static Amount pay(std::vector<Payout>& payouts, PaymentGateway& gateway);
};
