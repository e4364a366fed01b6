#pragma once

#include "ports/output/IInventoryStore.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace inventory::tests {

/**
 * @brief Хранилище-обёртка, записывающее порядок блокировок и чтений
 *
 * Делегирует всё вложенному хранилищу. В журнал попадают:
 * "lock:<key>", "layers:<key>", "layer-update:<id>", "ledger-query:<sourceId>",
 * "ledger-insert:<key>", "claim:<operation>:<key>".
 */
class LockTrackingStore : public ports::output::IInventoryStore {
public:
    explicit LockTrackingStore(std::shared_ptr<ports::output::IInventoryStore> inner)
        : inner_(std::move(inner)) {}

    void transact(const std::function<void(ports::output::IStoreSession&)>& work) override {
        inner_->transact([&](ports::output::IStoreSession& session) {
            Session tracking(session, *this);
            work(tracking);
        });
    }

    std::vector<std::string> getEvents() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    void clearEvents() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

    /**
     * @brief Индекс первого события; -1, если его нет
     */
    int indexOf(const std::string& event) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < events_.size(); ++i) {
            if (events_[i] == event) return static_cast<int>(i);
        }
        return -1;
    }

private:
    std::shared_ptr<ports::output::IInventoryStore> inner_;
    mutable std::mutex mutex_;
    std::vector<std::string> events_;

    void record(std::string event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }

    class Session : public ports::output::IStoreSession {
    public:
        Session(ports::output::IStoreSession& inner, LockTrackingStore& owner)
            : inner_(inner), owner_(owner) {}

        void lockStockKey(const domain::StockKey& key) override {
            owner_.record("lock:" + key.toString());
            inner_.lockStockKey(key);
        }

        domain::Decimal sumOnHand(const domain::StockKey& key) override {
            return inner_.sumOnHand(key);
        }

        std::vector<domain::OnHandRow> sumOnHandByLocation(
            const std::string& orgId, const std::string& branchId, const std::string& itemId) override
        {
            return inner_.sumOnHandByLocation(orgId, branchId, itemId);
        }

        std::vector<domain::OnHandRow> sumOnHandByBranch(
            const std::string& orgId, const std::string& branchId,
            const std::optional<std::string>& locationId) override
        {
            return inner_.sumOnHandByBranch(orgId, branchId, locationId);
        }

        void insertLedgerEntry(const domain::LedgerEntry& entry) override {
            owner_.record("ledger-insert:" +
                domain::StockKey{entry.orgId, entry.branchId, entry.itemId, entry.locationId}.toString());
            inner_.insertLedgerEntry(entry);
        }

        std::optional<domain::LedgerEntry> findLedgerEntry(
            const std::string& orgId, const std::string& entryId) override
        {
            return inner_.findLedgerEntry(orgId, entryId);
        }

        domain::LedgerPage findLedgerEntries(const domain::LedgerQuery& query) override {
            owner_.record("ledger-query:" + query.sourceId.value_or(""));
            return inner_.findLedgerEntries(query);
        }

        std::optional<domain::Lot> findLotByNumber(const domain::StockKey& key, const std::string& lotNumber) override {
            return inner_.findLotByNumber(key, lotNumber);
        }

        std::optional<domain::Lot> findLot(const std::string& lotId, bool forUpdate) override {
            return inner_.findLot(lotId, forUpdate);
        }

        bool insertLot(const domain::Lot& lot) override { return inner_.insertLot(lot); }

        void updateLot(const domain::Lot& lot) override { inner_.updateLot(lot); }

        std::vector<domain::Lot> findLotsWithStock(const domain::StockKey& key, bool forUpdate) override {
            return inner_.findLotsWithStock(key, forUpdate);
        }

        domain::LotPage findLots(const domain::LotQuery& query) override { return inner_.findLots(query); }

        std::vector<domain::Lot> findActiveLotsExpiringBy(
            const std::string& orgId, const std::optional<std::string>& branchId,
            const domain::Timestamp& cutoff) override
        {
            return inner_.findActiveLotsExpiringBy(orgId, branchId, cutoff);
        }

        void insertLotAllocation(const domain::LotAllocation& allocation) override {
            inner_.insertLotAllocation(allocation);
        }

        std::vector<domain::LotAllocation> findAllocationsByLot(const std::string& lotId) override {
            return inner_.findAllocationsByLot(lotId);
        }

        std::vector<domain::LotAllocation> findAllocationsBySource(
            const std::string& orgId, const std::string& sourceType, const std::string& sourceId) override
        {
            return inner_.findAllocationsBySource(orgId, sourceType, sourceId);
        }

        void insertLotIncrement(const domain::LotIncrement& increment) override {
            inner_.insertLotIncrement(increment);
        }

        std::vector<domain::LotIncrement> findIncrementsByLot(const std::string& lotId) override {
            return inner_.findIncrementsByLot(lotId);
        }

        void insertCostLayer(const domain::CostLayer& layer) override { inner_.insertCostLayer(layer); }

        std::optional<domain::CostLayer> findCostLayer(const std::string& layerId) override {
            return inner_.findCostLayer(layerId);
        }

        std::vector<domain::CostLayer> findCostLayers(const domain::CostLayerQuery& query) override {
            if (query.branchId && query.itemId && query.locationId) {
                owner_.record("layers:" +
                    domain::StockKey{query.orgId, *query.branchId, *query.itemId, *query.locationId}.toString());
            }
            return inner_.findCostLayers(query);
        }

        void updateCostLayerRemaining(const std::string& layerId, const domain::Decimal& qtyRemaining) override {
            owner_.record("layer-update:" + layerId);
            inner_.updateCostLayerRemaining(layerId, qtyRemaining);
        }

        std::optional<domain::JournalEntry> findJournalBySource(
            const std::string& orgId, const std::string& source, const std::string& sourceId) override
        {
            return inner_.findJournalBySource(orgId, source, sourceId);
        }

        std::optional<domain::JournalEntry> findJournalById(
            const std::string& orgId, const std::string& entryId) override
        {
            return inner_.findJournalById(orgId, entryId);
        }

        bool insertJournalEntry(const domain::JournalEntry& entry) override {
            return inner_.insertJournalEntry(entry);
        }

        void markJournalReversed(
            const std::string& entryId, const std::string& reversedBy, const domain::Timestamp& reversedAt) override
        {
            inner_.markJournalReversed(entryId, reversedBy, reversedAt);
        }

        std::vector<domain::JournalEntry> findJournalEntries(const domain::JournalQuery& query) override {
            return inner_.findJournalEntries(query);
        }

        std::optional<domain::PostingMapping> findPostingMapping(
            const std::string& orgId, const std::optional<std::string>& branchId) override
        {
            return inner_.findPostingMapping(orgId, branchId);
        }

        void upsertPostingMapping(const domain::PostingMapping& mapping) override {
            inner_.upsertPostingMapping(mapping);
        }

        std::optional<domain::FiscalPeriod> findFiscalPeriod(
            const std::string& orgId, const domain::Timestamp& date) override
        {
            return inner_.findFiscalPeriod(orgId, date);
        }

        void upsertFiscalPeriod(const domain::FiscalPeriod& period) override { inner_.upsertFiscalPeriod(period); }

        bool claimIdempotencyKey(const domain::IdempotencyRecord& record) override {
            owner_.record("claim:" + record.operation + ":" + record.key);
            return inner_.claimIdempotencyKey(record);
        }

        void onCommit(std::function<void()> hook) override { inner_.onCommit(std::move(hook)); }

    private:
        ports::output::IStoreSession& inner_;
        LockTrackingStore& owner_;
    };
};

} // namespace inventory::tests
