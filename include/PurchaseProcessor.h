/**
 * @file PurchaseProcessor.h
 * @brief Declares PurchaseProcessor, which carries one purchase from validation to commit (or rollback).
 *
 * Stages: Validating -> Pricing -> Splitting -> Mutating -> Committed, or Rejected at any check.
 * All state is mutated before any money leaves; if a transfer then fails, every mutation and every
 * transfer already made for this purchase is undone.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "LedgerTypes.h"

#include <string>

class GridStore;
class OwnershipLedger;
class GameCycleController;
class PricingEngine;
class PaymentSplitter;
class PaymentGateway;

/**
 * @class PurchaseProcessor
 * @brief Stateless orchestrator over components owned by PixelLedger. Caller holds the ledger lock.
 */
class PurchaseProcessor {
public:
    PurchaseProcessor(GridStore& grid, OwnershipLedger& ledger, GameCycleController& cycle,
                      const PricingEngine& pricing, const PaymentSplitter& splitter,
                      PaymentGateway& gateway, ActorId operatorId, Amount initialPrice);

    /**
     * @brief Cell at (x,y) as the current cycle sees it: a cell last written in an older cycle
     *        reads as unowned at the initial price (its tag is kept).
     *
     * Does not modify the grid. Throws std::out_of_range outside the grid.
     */
    Cell effectiveCell(int x, int y) const;

    /** @brief Run one purchase at time @p now. Never throws for caller mistakes; see PurchaseError. */
    PurchaseResult purchase(int x, int y, const std::string& tag, Amount amountTendered,
                            const ActorId& buyer, Timestamp now);

private:
    /** @brief Whether @p c was written in an earlier cycle and must be treated as fresh. */
    bool isStale(const Cell& c) const;
    /** @brief Pay the previous owner and operator; on failure undo what was paid. Returns success. */
    bool disburse(const Receipt& r);

    GridStore& grid;
    OwnershipLedger& ledger;
    GameCycleController& cycle;
    const PricingEngine& pricing;
    const PaymentSplitter& splitter;
    PaymentGateway& gateway;
    ActorId operatorId;
    Amount initialPrice;
};
