/**
 * @file OwnershipLedger.h
 * @brief Mapping actor -> number of cells currently owned in the running cycle.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "LedgerTypes.h"

#include <cstdint>
#include <map>

/**
 * @class OwnershipLedger
 * @brief Counts are kept strictly positive: an actor whose count drops to zero is erased.
 *
 * Iteration order is by actor id, which keeps winner lists and payout order deterministic.
 */
class OwnershipLedger {
public:
    using Counts = std::map<ActorId, std::uint64_t>;

    /** @brief Add one cell to @p actor. */
    void increment(const ActorId& actor);
    /** @brief Remove one cell from @p actor. Throws std::logic_error if @p actor owns nothing. */
    void decrement(const ActorId& actor);

    /** @brief Cells owned by @p actor (0 if none). */
    std::uint64_t count(const ActorId& actor) const;
    /** @brief Sum of all counts, i.e. the number of owned cells. */
    std::uint64_t totalOwned() const { return total; }
    /** @brief Number of distinct owners. */
    size_t owners() const { return counts.size(); }
    bool empty() const { return counts.empty(); }

    const Counts& entries() const { return counts; }

    /** @brief Drop every count (start of a new cycle). */
    void clear();

private:
    Counts counts;
    std::uint64_t total{0};
};
