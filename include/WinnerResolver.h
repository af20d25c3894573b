/**
 * @file WinnerResolver.h
 * @brief Finds every actor holding the maximum number of cells.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "OwnershipLedger.h"

#include <vector>

class WinnerResolver {
public:
    /**
     * @brief All actors whose count equals the highest count, sorted by id. Ties are all kept.
     * @param topCount receives the winning count (0 when nobody owns a cell).
     */
    static std::vector<ActorId> resolve(const OwnershipLedger& ledger, std::uint64_t* topCount = nullptr);
};
