/**
 * @file LedgerConfig.h
 * @brief Construction-time parameters of a PixelLedger, with environment and command-line overrides.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "LedgerTypes.h"

#include <string>

/**
 * @struct LedgerConfig
 * @brief Grid size, pricing, revenue split and inactivity window. Immutable once a ledger is built.
 *
 * The split defaults to 84/15/1 (previous owner / prize pool / operator).
 */
struct LedgerConfig {
    int width{32};
    int height{32};
    Amount initialPrice{100000000000000ULL}; /**< 0.0001 of a unit with 18 decimals */
    Amount priceNumerator{110};
    Amount priceDenominator{100};
    unsigned ownerPct{84};
    unsigned poolPct{15};
    unsigned operatorPct{1};
    Seconds inactivityWindow{24 * 60 * 60};
    ActorId operatorId{"operator"};

    /** @brief Largest accepted width or height. */
    static constexpr int MaxSide = 4096;

    /** @brief Throw std::invalid_argument describing the first violated constraint. */
    void validate() const;

    /** @brief Override fields from PIXELWAR_* environment variables; unparseable values are logged and skipped. */
    void applyEnv();
    /** @brief Override fields from --name N / --name=N flags; unknown flags are left for the caller. */
    void applyArgs(int argc, char** argv);

    /** @brief One-line human readable summary for logs. */
    std::string describe() const;
};

/** @brief Parse a non-negative decimal integer; false on empty input, junk or overflow. */
bool parseAmount(const char* s, Amount& out);
