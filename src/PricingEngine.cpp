/**
 * @file PricingEngine.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "PricingEngine.h"

#include <stdexcept>

/** @copydoc PricingEngine::PricingEngine */
PricingEngine::PricingEngine(Amount numerator, Amount denominator)
    : num(numerator), den(denominator) {
    if (den == 0) throw std::invalid_argument("PricingEngine: zero denominator");
    if (num <= den) throw std::invalid_argument("PricingEngine: multiplier must exceed 1");
}

/** @copydoc PricingEngine::nextPrice */
Amount PricingEngine::nextPrice(Amount current) const {
    return mulDivFloor(current, num, den);
}
