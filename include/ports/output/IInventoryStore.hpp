#pragma once

#include "domain/CostLayer.hpp"
#include "domain/FiscalPeriod.hpp"
#include "domain/IdempotencyRecord.hpp"
#include "domain/JournalEntry.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/Lot.hpp"
#include "domain/PostingMapping.hpp"
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Операции хранилища внутри одной транзакции
 *
 * Все чтения видят записи этой же транзакции. Сессия живёт только
 * внутри IInventoryStore::transact() и не должна сохраняться.
 */
class IStoreSession {
public:
    virtual ~IStoreSession() = default;

    // ------------------------------------------------------------------
    // Ledger
    // ------------------------------------------------------------------

    /**
     * @brief Сериализовать писателей одного ключа остатка до конца транзакции
     */
    virtual void lockStockKey(const domain::StockKey& key) = 0;

    virtual domain::Decimal sumOnHand(const domain::StockKey& key) = 0;

    virtual std::vector<domain::OnHandRow> sumOnHandByLocation(
        const std::string& orgId, const std::string& branchId, const std::string& itemId) = 0;

    virtual std::vector<domain::OnHandRow> sumOnHandByBranch(
        const std::string& orgId, const std::string& branchId,
        const std::optional<std::string>& locationId) = 0;

    virtual void insertLedgerEntry(const domain::LedgerEntry& entry) = 0;

    virtual std::optional<domain::LedgerEntry> findLedgerEntry(
        const std::string& orgId, const std::string& entryId) = 0;

    virtual domain::LedgerPage findLedgerEntries(const domain::LedgerQuery& query) = 0;

    // ------------------------------------------------------------------
    // Lots
    // ------------------------------------------------------------------

    virtual std::optional<domain::Lot> findLotByNumber(
        const domain::StockKey& key, const std::string& lotNumber) = 0;

    /**
     * @param forUpdate блокировать строку до конца транзакции
     */
    virtual std::optional<domain::Lot> findLot(const std::string& lotId, bool forUpdate) = 0;

    /**
     * @return false, если партия с таким номером уже есть (уникальный ключ)
     */
    virtual bool insertLot(const domain::Lot& lot) = 0;

    virtual void updateLot(const domain::Lot& lot) = 0;

    /**
     * @brief Партии ключа остатка с remainingQty > 0
     */
    virtual std::vector<domain::Lot> findLotsWithStock(const domain::StockKey& key, bool forUpdate) = 0;

    virtual domain::LotPage findLots(const domain::LotQuery& query) = 0;

    /**
     * @brief ACTIVE партии с остатком и сроком годности <= cutoff
     */
    virtual std::vector<domain::Lot> findActiveLotsExpiringBy(
        const std::string& orgId, const std::optional<std::string>& branchId,
        const domain::Timestamp& cutoff) = 0;

    virtual void insertLotAllocation(const domain::LotAllocation& allocation) = 0;

    virtual std::vector<domain::LotAllocation> findAllocationsByLot(const std::string& lotId) = 0;

    virtual std::vector<domain::LotAllocation> findAllocationsBySource(
        const std::string& orgId, const std::string& sourceType, const std::string& sourceId) = 0;

    virtual void insertLotIncrement(const domain::LotIncrement& increment) = 0;

    virtual std::vector<domain::LotIncrement> findIncrementsByLot(const std::string& lotId) = 0;

    // ------------------------------------------------------------------
    // Cost layers
    // ------------------------------------------------------------------

    virtual void insertCostLayer(const domain::CostLayer& layer) = 0;

    virtual std::optional<domain::CostLayer> findCostLayer(const std::string& layerId) = 0;

    virtual std::vector<domain::CostLayer> findCostLayers(const domain::CostLayerQuery& query) = 0;

    virtual void updateCostLayerRemaining(const std::string& layerId, const domain::Decimal& qtyRemaining) = 0;

    // ------------------------------------------------------------------
    // Journal
    // ------------------------------------------------------------------

    virtual std::optional<domain::JournalEntry> findJournalBySource(
        const std::string& orgId, const std::string& source, const std::string& sourceId) = 0;

    virtual std::optional<domain::JournalEntry> findJournalById(
        const std::string& orgId, const std::string& entryId) = 0;

    /**
     * @return false, если (orgId, source, sourceId) уже занят
     */
    virtual bool insertJournalEntry(const domain::JournalEntry& entry) = 0;

    virtual void markJournalReversed(
        const std::string& entryId, const std::string& reversedBy, const domain::Timestamp& reversedAt) = 0;

    virtual std::vector<domain::JournalEntry> findJournalEntries(const domain::JournalQuery& query) = 0;

    // ------------------------------------------------------------------
    // Настройки GL
    // ------------------------------------------------------------------

    /**
     * @brief Точное совпадение по (orgId, branchId); nullopt branchId — умолчание организации
     */
    virtual std::optional<domain::PostingMapping> findPostingMapping(
        const std::string& orgId, const std::optional<std::string>& branchId) = 0;

    virtual void upsertPostingMapping(const domain::PostingMapping& mapping) = 0;

    virtual std::optional<domain::FiscalPeriod> findFiscalPeriod(
        const std::string& orgId, const domain::Timestamp& date) = 0;

    virtual void upsertFiscalPeriod(const domain::FiscalPeriod& period) = 0;

    // ------------------------------------------------------------------
    // Идемпотентность и хуки
    // ------------------------------------------------------------------

    /**
     * @return true, если ключ захвачен этой транзакцией; false, если уже существовал
     */
    virtual bool claimIdempotencyKey(const domain::IdempotencyRecord& record) = 0;

    /**
     * @brief Выполнить действие после успешного коммита
     */
    virtual void onCommit(std::function<void()> hook) = 0;
};

/**
 * @brief Транзакционное хранилище складского учёта
 */
class IInventoryStore {
public:
    virtual ~IInventoryStore() = default;

    /**
     * @brief Выполнить work атомарно
     *
     * Исключение из work откатывает все изменения и пробрасывается дальше.
     * Хуки onCommit выполняются только после успешного коммита.
     */
    virtual void transact(const std::function<void(IStoreSession&)>& work) = 0;

    /**
     * @brief transact() с возвратом значения
     */
    template <typename Work>
    auto inTransaction(Work&& work) {
        using Result = std::invoke_result_t<Work&, IStoreSession&>;
        if constexpr (std::is_void_v<Result>) {
            transact([&](IStoreSession& session) { work(session); });
        } else {
            std::optional<Result> result;
            transact([&](IStoreSession& session) { result.emplace(work(session)); });
            return std::move(*result);
        }
    }
};

} // namespace inventory::ports::output
