#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Причина движения по складскому журналу
 */
enum class LedgerReason {
    PURCHASE,
    SALE,
    WASTAGE,
    ADJUSTMENT,
    COUNT_ADJUSTMENT,
    CYCLE_COUNT,
    TRANSFER_IN,
    TRANSFER_OUT,
    INITIAL,
    VENDOR_RETURN,
    PRODUCTION_CONSUME,
    PRODUCTION_PRODUCE
};

inline std::string toString(LedgerReason reason) {
    switch (reason) {
        case LedgerReason::PURCHASE: return "PURCHASE";
        case LedgerReason::SALE: return "SALE";
        case LedgerReason::WASTAGE: return "WASTAGE";
        case LedgerReason::ADJUSTMENT: return "ADJUSTMENT";
        case LedgerReason::COUNT_ADJUSTMENT: return "COUNT_ADJUSTMENT";
        case LedgerReason::CYCLE_COUNT: return "CYCLE_COUNT";
        case LedgerReason::TRANSFER_IN: return "TRANSFER_IN";
        case LedgerReason::TRANSFER_OUT: return "TRANSFER_OUT";
        case LedgerReason::INITIAL: return "INITIAL";
        case LedgerReason::VENDOR_RETURN: return "VENDOR_RETURN";
        case LedgerReason::PRODUCTION_CONSUME: return "PRODUCTION_CONSUME";
        case LedgerReason::PRODUCTION_PRODUCE: return "PRODUCTION_PRODUCE";
    }
    return "UNKNOWN";
}

inline LedgerReason parseLedgerReason(const std::string& str) {
    if (str == "PURCHASE") return LedgerReason::PURCHASE;
    if (str == "SALE") return LedgerReason::SALE;
    if (str == "WASTAGE") return LedgerReason::WASTAGE;
    if (str == "ADJUSTMENT") return LedgerReason::ADJUSTMENT;
    if (str == "COUNT_ADJUSTMENT") return LedgerReason::COUNT_ADJUSTMENT;
    if (str == "CYCLE_COUNT") return LedgerReason::CYCLE_COUNT;
    if (str == "TRANSFER_IN") return LedgerReason::TRANSFER_IN;
    if (str == "TRANSFER_OUT") return LedgerReason::TRANSFER_OUT;
    if (str == "INITIAL") return LedgerReason::INITIAL;
    if (str == "VENDOR_RETURN") return LedgerReason::VENDOR_RETURN;
    if (str == "PRODUCTION_CONSUME") return LedgerReason::PRODUCTION_CONSUME;
    if (str == "PRODUCTION_PRODUCE") return LedgerReason::PRODUCTION_PRODUCE;
    throw std::invalid_argument("Unknown ledger reason: " + str);
}

/**
 * @brief Безусловный приход: количество всегда положительное, проверка остатка не нужна
 */
inline bool isInboundReason(LedgerReason reason) {
    return reason == LedgerReason::PURCHASE
        || reason == LedgerReason::TRANSFER_IN
        || reason == LedgerReason::INITIAL
        || reason == LedgerReason::PRODUCTION_PRODUCE;
}

/**
 * @brief Расход: количество всегда отрицательное
 */
inline bool isOutboundReason(LedgerReason reason) {
    return reason == LedgerReason::SALE
        || reason == LedgerReason::WASTAGE
        || reason == LedgerReason::TRANSFER_OUT
        || reason == LedgerReason::VENDOR_RETURN
        || reason == LedgerReason::PRODUCTION_CONSUME;
}

} // namespace inventory::domain
