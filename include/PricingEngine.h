/**
 * @file PricingEngine.h
 * @brief Price escalation applied to a cell after every purchase.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "LedgerTypes.h"

/**
 * @class PricingEngine
 * @brief next = floor(current * numerator / denominator), integer arithmetic only.
 *
 * Truncation is the rounding rule. Compounding with floor lands slightly below the exact
 * geometric series (e.g. 100 -> 110 -> 121 -> 133, not 133.1); that under-escalation is the
 * reference behavior and must be reproduced exactly.
 */
class PricingEngine {
public:
    /** @brief Throws std::invalid_argument for a zero denominator or a multiplier not above 1. */
    PricingEngine(Amount numerator, Amount denominator);

    /** @brief Price after one purchase at @p current. Throws std::overflow_error past 64 bits. */
    Amount nextPrice(Amount current) const;

    Amount numerator() const { return num; }
    Amount denominator() const { return den; }

private:
    Amount num;
    Amount den;
};
