/**
 * @file LedgerTypes.h
 * @brief Value types shared by every ledger component: cells, receipts, payouts, cycle state.
 *
 * Amounts are unsigned integers in the smallest currency unit. Timestamps and durations are
 * whole seconds. An actor is an opaque, non-empty string; the empty string means "no owner".
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <iosfwd>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using ActorId = std::string;
using Amount = std::uint64_t;
using Timestamp = std::int64_t;
using Seconds = std::int64_t;

/**
 * @brief floor(a * b / c) with a 128-bit intermediate.
 * @throws std::overflow_error if the quotient does not fit in 64 bits.
 * @throws std::invalid_argument if @p c is zero.
 */
inline Amount mulDivFloor(Amount a, Amount b, Amount c) {
    if (c == 0) throw std::invalid_argument("mulDivFloor: zero divisor");
    unsigned __int128 q = static_cast<unsigned __int128>(a) * b / c;
    if (q > std::numeric_limits<Amount>::max()) throw std::overflow_error("mulDivFloor: result exceeds 64 bits");
    return static_cast<Amount>(q);
}

/**
 * @struct Cell
 * @brief Stored state of one grid coordinate.
 */
struct Cell {
    ActorId owner;                  /**< current owner; empty when unowned */
    Amount price{0};                /**< price the next buyer must pay */
    std::string tag;                /**< opaque payload (color); non-empty when owned */
    std::uint64_t lastUpdateCycle{0}; /**< cycle id that last wrote this cell; 0 = never */

    bool hasOwner() const { return !owner.empty(); }
};

/** @brief Read-only view of a cell as exposed to collaborators. */
struct CellView {
    ActorId owner;
    Amount price{0};
    std::string tag;
};

/**
 * @struct PaymentSplit
 * @brief Partition of one tendered amount. previousOwnerShare + poolShare + operatorShare == amount.
 *
 * poolShare already includes carry; carry is kept separately so callers can report it.
 */
struct PaymentSplit {
    Amount previousOwnerShare{0};
    Amount poolShare{0};
    Amount operatorShare{0};
    Amount carry{0};

    Amount total() const { return previousOwnerShare + poolShare + operatorShare; }
};

enum class PurchaseError {
    None,
    GameNotActive,
    OutOfBounds,
    EmptyTag,
    InsufficientPayment,
    AlreadyOwner,
    PriceOverflow,
    TransferFailed,
    ReentrantCall
};

/** @brief Stable text name of @p e, e.g. "InsufficientPayment". */
const char* purchaseErrorName(PurchaseError e);
/** @brief Writes purchaseErrorName(e). */
std::ostream& operator<<(std::ostream& os, PurchaseError e);

/** @brief Record of one committed purchase. */
struct Receipt {
    ActorId buyer;
    int x{0};
    int y{0};
    std::string tag;
    Amount amountPaid{0};   /**< full amount tendered */
    Amount listedPrice{0};  /**< price the cell was listed at before the purchase */
    Amount newPrice{0};     /**< price after escalation */
    ActorId previousOwner;  /**< empty for a fresh cell */
    PaymentSplit split;
    std::uint64_t cycleId{0};
    Timestamp at{0};
};

struct PurchaseResult {
    PurchaseError error{PurchaseError::None};
    Receipt receipt; /**< valid only when ok() */

    bool ok() const { return error == PurchaseError::None; }
};

/** @brief Snapshot of the current game cycle for collaborators. */
struct CycleState {
    bool active{false};
    std::uint64_t cycleId{0};
    Timestamp startedAt{0};
    Timestamp lastActivityAt{0};
    Seconds remainingTime{0};
    Amount prizePool{0};
    Amount operatorEarnings{0};
};

/** @brief One recipient's share of a closed cycle's prize pool. */
struct Payout {
    ActorId actor;
    std::uint64_t cells{0};
    Amount amount{0};
    bool delivered{false};
};

/** @brief Everything that happened when a cycle was closed. */
struct CycleSummary {
    std::uint64_t cycleId{0};
    Timestamp endedAt{0};
    std::vector<ActorId> winners;  /**< sorted; empty when no cell was owned */
    std::uint64_t winningCount{0};
    Amount prizePool{0};           /**< pool at the moment the cycle closed */
    std::vector<Payout> payouts;   /**< one per owner, ordered by actor id */
    Amount distributed{0};         /**< sum of delivered payouts */
    Amount carriedOver{0};         /**< seeded into the next cycle's pool */
};

/** @brief Bulk row-major export of the canvas with lazy reset applied. */
struct CanvasSnapshot {
    int width{0};
    int height{0};
    std::vector<ActorId> owners;
    std::vector<std::string> tags;
    std::vector<Amount> prices;
};
