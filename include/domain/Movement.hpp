#pragma once

#include "Decimal.hpp"
#include "GlDocument.hpp"
#include "Lot.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

// ============================================================================
// Приход товара
// ============================================================================

struct ReceiptLine {
    std::string itemId;
    std::string locationId;
    Decimal qty;
    Decimal unitCost;
    std::optional<std::string> lotNumber;
    std::optional<Timestamp> expiryDate;
};

struct ReceiptRequest {
    std::string orgId;
    std::string branchId;
    std::string receiptId;
    std::string actor;
    std::vector<ReceiptLine> lines;
};

struct ReceiptLineResult {
    std::string ledgerEntryId;
    std::string costLayerId;
    std::optional<std::string> lotId;
    Decimal onHandAfter;
};

struct ReceiptResult {
    std::string receiptId;
    bool isAlreadyPosted = false;
    std::vector<ReceiptLineResult> lines;
    std::vector<std::string> ledgerEntryIds;
    Decimal totalValue;
    GlPostingResult gl;
};

// ============================================================================
// Списание (продажа / порча)
// ============================================================================

struct IssueLine {
    std::string itemId;
    std::string locationId;
    Decimal qty;                ///< Положительное количество к списанию
};

struct IssueRequest {
    std::string orgId;
    std::string branchId;
    std::string documentId;     ///< depletionId или wasteId
    std::string actor;
    std::vector<IssueLine> lines;
};

struct IssueLineResult {
    std::string ledgerEntryId;
    Decimal onHandAfter;
    std::vector<FefoAllocation> lotAllocations;
    Decimal lotShortfall;       ///< Количество вне партий (не ошибка)
    Decimal value;              ///< Себестоимость списанного
};

struct IssueResult {
    std::string documentId;
    bool isAlreadyPosted = false;
    std::vector<IssueLineResult> lines;
    std::vector<std::string> ledgerEntryIds;
    Decimal totalValue;
    GlPostingResult gl;
};

struct VoidResult {
    std::string documentId;
    bool isAlreadyPosted = false;
    std::vector<std::string> ledgerEntryIds;
    std::vector<LotMutationResult> restoredLots;
    Decimal restoredValue;
    GlPostingResult gl;
};

// ============================================================================
// Инвентаризация
// ============================================================================

struct StocktakeLine {
    std::string itemId;
    std::string locationId;
    Decimal countedQty;
};

struct StocktakeRequest {
    std::string orgId;
    std::string branchId;
    std::string sessionId;
    std::string actor;
    std::vector<StocktakeLine> lines;
};

struct StocktakeLineResult {
    std::string itemId;
    std::string locationId;
    Decimal expectedQty;
    Decimal countedQty;
    Decimal delta;
    Decimal value;                          ///< delta × WAC
    std::optional<std::string> ledgerEntryId;
};

struct StocktakeResult {
    std::string sessionId;
    bool isAlreadyPosted = false;
    std::vector<StocktakeLineResult> lines;
    Decimal totalVariance;
    GlPostingResult gl;
};

} // namespace inventory::domain
