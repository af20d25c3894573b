/**
 * @file LedgerTypes.cpp
 * @brief Text names for ledger error codes.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "LedgerTypes.h"

#include <ostream>

const char* purchaseErrorName(PurchaseError e) {
    switch (e) {
        case PurchaseError::None: return "None";
        case PurchaseError::GameNotActive: return "GameNotActive";
        case PurchaseError::OutOfBounds: return "OutOfBounds";
        case PurchaseError::EmptyTag: return "EmptyTag";
        case PurchaseError::InsufficientPayment: return "InsufficientPayment";
        case PurchaseError::AlreadyOwner: return "AlreadyOwner";
        case PurchaseError::PriceOverflow: return "PriceOverflow";
        case PurchaseError::TransferFailed: return "TransferFailed";
        case PurchaseError::ReentrantCall: return "ReentrantCall";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, PurchaseError e) {
    return os << purchaseErrorName(e);
}
