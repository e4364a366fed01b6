#pragma once

#include "Decimal.hpp"
#include "JournalEntry.hpp"
#include "PostingMapping.hpp"
#include "enums/GlPostingStatus.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace inventory::domain {

/**
 * @file GlDocument.hpp
 * @brief Виды складских документов, проводимых в GL
 *
 * Каждый вид — отдельная альтернатива std::variant со своей функцией
 * формирования строк проводки. Добавление нового вида без перегрузки
 * journalLines() не скомпилируется.
 *
 * | Документ       | Дебет                  | Кредит                     |
 * |----------------|------------------------|----------------------------|
 * | Goods receipt  | Inventory Asset        | GRNI                       |
 * | Depletion      | COGS                   | Inventory Asset            |
 * | Waste          | Waste Expense          | Inventory Asset            |
 * | Stocktake (+)  | Inventory Asset        | Inventory Gain (или Shrink)|
 * | Stocktake (-)  | Shrink Expense         | Inventory Asset            |
 */

struct GoodsReceiptDocument {
    static constexpr const char* kSource = "INV_GOODS_RECEIPT";
    static constexpr const char* kVoidSource = "INV_GOODS_RECEIPT_VOID";
    static constexpr const char* kType = "GOODS_RECEIPT";
    static constexpr const char* kMemo = "Goods Receipt";
    static constexpr const char* kVoidMemo = "Void Goods Receipt";

    Decimal amount;
};

struct DepletionDocument {
    static constexpr const char* kSource = "INV_DEPLETION";
    static constexpr const char* kVoidSource = "INV_DEPLETION_VOID";
    static constexpr const char* kType = "DEPLETION";
    static constexpr const char* kMemo = "Order Depletion COGS";
    static constexpr const char* kVoidMemo = "Void Depletion";

    Decimal amount;
};

struct WasteDocument {
    static constexpr const char* kSource = "INV_WASTE";
    static constexpr const char* kVoidSource = "INV_WASTE_VOID";
    static constexpr const char* kType = "WASTE";
    static constexpr const char* kMemo = "Inventory Waste";
    static constexpr const char* kVoidMemo = "Void Waste Document";

    Decimal amount;
};

struct StocktakeDocument {
    static constexpr const char* kSource = "INV_STOCKTAKE";
    static constexpr const char* kVoidSource = "INV_STOCKTAKE_VOID";
    static constexpr const char* kType = "STOCKTAKE";
    static constexpr const char* kMemo = "Stocktake Variance";
    static constexpr const char* kVoidMemo = "Void Stocktake";

    Decimal variance;    ///< > 0 излишек, < 0 недостача

    bool isGain() const { return variance.isPositive(); }
};

using GlDocument = std::variant<GoodsReceiptDocument, DepletionDocument, WasteDocument, StocktakeDocument>;

// ----------------------------------------------------------------------------
// Причина пропуска (нулевая сумма)
// ----------------------------------------------------------------------------

inline std::optional<std::string> skipReason(const GoodsReceiptDocument& doc) {
    if (!doc.amount.isPositive()) return std::string("Zero or negative receipt value");
    return std::nullopt;
}

inline std::optional<std::string> skipReason(const DepletionDocument& doc) {
    if (doc.amount.isZero()) return std::string("Zero COGS amount");
    return std::nullopt;
}

inline std::optional<std::string> skipReason(const WasteDocument& doc) {
    if (doc.amount.isZero()) return std::string("Zero waste value");
    return std::nullopt;
}

inline std::optional<std::string> skipReason(const StocktakeDocument& doc) {
    if (doc.variance.isZero()) return std::string("Zero variance value");
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Строки проводки
// ----------------------------------------------------------------------------

namespace detail {

inline JournalLine debitLine(const std::string& account, const Decimal& amount, const char* type) {
    return JournalLine{account, amount, Decimal::zero(), {{"type", type}}};
}

inline JournalLine creditLine(const std::string& account, const Decimal& amount, const char* type) {
    return JournalLine{account, Decimal::zero(), amount, {{"type", type}}};
}

} // namespace detail

inline std::vector<JournalLine> journalLines(const GoodsReceiptDocument& doc, const PostingMapping& m) {
    return {
        detail::debitLine(m.inventoryAssetAccountId, doc.amount, "INVENTORY_ASSET_INCREASE"),
        detail::creditLine(m.grniAccountId, doc.amount, "GRNI_LIABILITY_INCREASE"),
    };
}

inline std::vector<JournalLine> journalLines(const DepletionDocument& doc, const PostingMapping& m) {
    // COGS всегда положительный расход
    Decimal amount = doc.amount.abs();
    return {
        detail::debitLine(m.cogsAccountId, amount, "COGS_EXPENSE"),
        detail::creditLine(m.inventoryAssetAccountId, amount, "INVENTORY_ASSET_DECREASE"),
    };
}

inline std::vector<JournalLine> journalLines(const WasteDocument& doc, const PostingMapping& m) {
    Decimal amount = doc.amount.abs();
    return {
        detail::debitLine(m.wasteExpenseAccountId, amount, "WASTE_EXPENSE"),
        detail::creditLine(m.inventoryAssetAccountId, amount, "INVENTORY_ASSET_DECREASE"),
    };
}

inline std::vector<JournalLine> journalLines(const StocktakeDocument& doc, const PostingMapping& m) {
    Decimal amount = doc.variance.abs();
    if (doc.isGain()) {
        const std::string& gainAccount = m.inventoryGainAccountId.value_or(m.shrinkExpenseAccountId);
        return {
            detail::debitLine(m.inventoryAssetAccountId, amount, "INVENTORY_ASSET_INCREASE"),
            detail::creditLine(gainAccount, amount, "INVENTORY_GAIN"),
        };
    }
    return {
        detail::debitLine(m.shrinkExpenseAccountId, amount, "SHRINK_EXPENSE"),
        detail::creditLine(m.inventoryAssetAccountId, amount, "INVENTORY_ASSET_DECREASE"),
    };
}

/**
 * @brief Сумма документа для аудита и логов
 */
inline Decimal documentAmount(const GoodsReceiptDocument& doc) { return doc.amount; }
inline Decimal documentAmount(const DepletionDocument& doc) { return doc.amount.abs(); }
inline Decimal documentAmount(const WasteDocument& doc) { return doc.amount.abs(); }
inline Decimal documentAmount(const StocktakeDocument& doc) { return doc.variance; }

inline std::string memoFor(const GoodsReceiptDocument&, const std::string& sourceId) {
    return std::string(GoodsReceiptDocument::kMemo) + ": " + sourceId;
}

inline std::string memoFor(const DepletionDocument&, const std::string& sourceId) {
    return std::string(DepletionDocument::kMemo) + ": " + sourceId;
}

inline std::string memoFor(const WasteDocument&, const std::string& sourceId) {
    return std::string(WasteDocument::kMemo) + ": " + sourceId;
}

inline std::string memoFor(const StocktakeDocument& doc, const std::string& sourceId) {
    return std::string(StocktakeDocument::kMemo) + ": " + sourceId + (doc.isGain() ? " (Gain)" : " (Shrinkage)");
}

/**
 * @brief Результат проводки, возвращаемый вызывающему
 */
struct GlPostingResult {
    std::optional<std::string> journalEntryId;
    GlPostingStatus status = GlPostingStatus::SKIPPED;
    std::optional<std::string> error;
    bool isIdempotent = false;
};

/**
 * @brief Предпросмотр проводки без записи
 */
struct GlPreview {
    std::string documentType;
    std::vector<JournalLine> lines;
    Decimal totalDebit;
    Decimal totalCredit;
    bool balanced = false;
};

} // namespace inventory::domain
