/**
 * @file LocalBank.h
 * @brief In-memory PaymentGateway with per-actor balances, used by the simulators and tests.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "PaymentGateway.h"

#include <mutex>
#include <unordered_map>
#include <unordered_set>

/**
 * @class LocalBank
 * @brief Thread-safe account book. Transfers credit the recipient; debits are the actors' own spending.
 */
class LocalBank : public PaymentGateway {
public:
    bool transfer(const ActorId& to, Amount amount) override;
    bool reclaim(const ActorId& from, Amount amount) override;

    /** @brief Credit @p amount to @p who (funding a bidder, or refunding a rejected tender). */
    void deposit(const ActorId& who, Amount amount);
    /** @brief Take @p amount from @p who; false if the balance is too small. */
    bool debit(const ActorId& who, Amount amount);
    /** @brief Current balance of @p who (0 if unknown). */
    Amount balanceOf(const ActorId& who) const;

    /** @brief Make transfers to @p who fail (true) or succeed again (false). */
    void setFailing(const ActorId& who, bool failing);

    /** @brief Sum of all successful transfers net of reclaims. */
    Amount totalTransferred() const;
    /** @brief Number of transfer() calls that returned true. */
    size_t transferCount() const;
    /** @brief Reclaimed amounts that could not be recovered because the balance was already spent. */
    Amount reclaimShortfall() const;

private:
    mutable std::mutex mtx;
    std::unordered_map<ActorId, Amount> balances;
    std::unordered_set<ActorId> failing;
    Amount transferred{0};
    size_t transfers{0};
    Amount shortfall{0};
};
