/**
 * @file OwnershipLedger.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "OwnershipLedger.h"

#include <stdexcept>

/** @copydoc OwnershipLedger::increment */
void OwnershipLedger::increment(const ActorId& actor) {
    ++counts[actor];
    ++total;
}

/** @copydoc OwnershipLedger::decrement */
void OwnershipLedger::decrement(const ActorId& actor) {
    auto it = counts.find(actor);
    if (it == counts.end()) throw std::logic_error("OwnershipLedger: decrement for non-owner " + actor);
    if (--it->second == 0) counts.erase(it);
    --total;
}

/** @copydoc OwnershipLedger::count */
std::uint64_t OwnershipLedger::count(const ActorId& actor) const {
    auto it = counts.find(actor);
    return it == counts.end() ? 0 : it->second;
}

/** @copydoc OwnershipLedger::clear */
void OwnershipLedger::clear() {
    counts.clear();
    total = 0;
}
