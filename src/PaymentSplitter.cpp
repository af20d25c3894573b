/**
 * @file PaymentSplitter.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "PaymentSplitter.h"

#include <stdexcept>
#include <string>

/** @copydoc PaymentSplitter::PaymentSplitter */
PaymentSplitter::PaymentSplitter(unsigned ownerPct, unsigned poolPct, unsigned operatorPct)
    : owner(ownerPct), pool(poolPct), op(operatorPct) {
    if (ownerPct > 100 || poolPct > 100 || operatorPct > 100 || ownerPct + poolPct + operatorPct != 100) {
        throw std::invalid_argument("PaymentSplitter: percentages " + std::to_string(ownerPct) + "/" +
                                    std::to_string(poolPct) + "/" + std::to_string(operatorPct) +
                                    " do not sum to 100");
    }
}

/** @copydoc PaymentSplitter::split */
PaymentSplit PaymentSplitter::split(Amount amount, bool hasPreviousOwner) const {
    PaymentSplit s;
    s.operatorShare = mulDivFloor(amount, op, 100);
    if (hasPreviousOwner) {
        s.previousOwnerShare = mulDivFloor(amount, owner, 100);
        s.poolShare = mulDivFloor(amount, pool, 100);
    } else {
        // Nobody to pay: the owner share goes to the pool.
        s.poolShare = mulDivFloor(amount, owner + pool, 100);
    }
    s.carry = amount - (s.previousOwnerShare + s.poolShare + s.operatorShare);
    s.poolShare += s.carry;
    return s;
}
