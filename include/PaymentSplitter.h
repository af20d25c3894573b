/**
 * @file PaymentSplitter.h
 * @brief Partition of a tendered amount into previous-owner, prize-pool and operator shares.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "LedgerTypes.h"

/**
 * @class PaymentSplitter
 * @brief Fixed percentages, configured once. Every unit of the amount lands in exactly one share.
 *
 * - operator = floor(amount * operatorPct / 100)
 * - with a previous owner: owner = floor(amount * ownerPct / 100), pool = floor(amount * poolPct / 100)
 * - without one: owner = 0, pool = floor(amount * (ownerPct + poolPct) / 100)
 * - carry = amount - (owner + pool + operator) is then added to pool.
 */
class PaymentSplitter {
public:
    /** @brief Throws std::invalid_argument unless the three percentages sum to 100. */
    PaymentSplitter(unsigned ownerPct, unsigned poolPct, unsigned operatorPct);

    PaymentSplit split(Amount amount, bool hasPreviousOwner) const;

    unsigned ownerPct() const { return owner; }
    unsigned poolPct() const { return pool; }
    unsigned operatorPct() const { return op; }

private:
    unsigned owner;
    unsigned pool;
    unsigned op;
};
