/**
 * @file WinnerResolver.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "WinnerResolver.h"

/** @copydoc WinnerResolver::resolve */
std::vector<ActorId> WinnerResolver::resolve(const OwnershipLedger& ledger, std::uint64_t* topCount) {
    std::vector<ActorId> winners;
    std::uint64_t best = 0;
    // Ledger iterates in id order, so the result comes out sorted.
    for (const auto& e : ledger.entries()) {
        if (e.second == 0) continue;
        if (e.second > best) {
            best = e.second;
            winners.clear();
        }
        if (e.second == best) winners.push_back(e.first);
    }
    if (topCount) *topCount = best;
    return winners;
}
