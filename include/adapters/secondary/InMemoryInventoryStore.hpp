#pragma once

#include "ports/output/IInventoryStore.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <tuple>
#include <vector>

namespace inventory::adapters::secondary {

/**
 * @brief In-Memory реализация транзакционного хранилища
 *
 * Транзакции сериализуются одним мьютексом. Работа ведётся над копией
 * состояния, которая заменяет живое состояние только при успехе, поэтому
 * исключение внутри transact() не оставляет следов.
 */
class InMemoryInventoryStore : public ports::output::IInventoryStore {
public:
    InMemoryInventoryStore() {
        std::cout << "[InMemoryInventoryStore] Created" << std::endl;
    }

    void transact(const std::function<void(ports::output::IStoreSession&)>& work) override {
        std::vector<std::function<void()>> hooks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            State working = state_;
            Session session(working, hooks);
            work(session);
            state_ = std::move(working);
        }

        for (auto& hook : hooks) {
            hook();
        }
    }

    // Test helpers
    size_t ledgerEntryCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.ledger.size();
    }

    size_t journalEntryCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.journals.size();
    }

    size_t costLayerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.costLayers.size();
    }

private:
    using IdempotencyKey = std::tuple<std::string, std::string, std::string>;

    struct State {
        std::vector<domain::LedgerEntry> ledger;          ///< В порядке вставки
        std::map<std::string, domain::Lot> lots;
        std::vector<domain::LotAllocation> allocations;
        std::vector<domain::LotIncrement> increments;
        std::vector<domain::CostLayer> costLayers;        ///< В порядке вставки
        std::vector<domain::JournalEntry> journals;
        std::vector<domain::PostingMapping> mappings;
        std::vector<domain::FiscalPeriod> periods;
        std::set<IdempotencyKey> idempotencyKeys;
    };

    class Session : public ports::output::IStoreSession {
    public:
        Session(State& state, std::vector<std::function<void()>>& hooks)
            : state_(state), hooks_(hooks) {}

        // Ledger

        void lockStockKey(const domain::StockKey&) override {
            // Транзакции уже сериализованы мьютексом хранилища
        }

        domain::Decimal sumOnHand(const domain::StockKey& key) override {
            domain::Decimal total;
            for (const auto& e : state_.ledger) {
                if (e.orgId == key.orgId && e.branchId == key.branchId &&
                    e.itemId == key.itemId && e.locationId == key.locationId) {
                    total += e.qty;
                }
            }
            return total;
        }

        std::vector<domain::OnHandRow> sumOnHandByLocation(
            const std::string& orgId, const std::string& branchId, const std::string& itemId) override
        {
            std::map<std::string, domain::Decimal> byLocation;
            for (const auto& e : state_.ledger) {
                if (e.orgId == orgId && e.branchId == branchId && e.itemId == itemId) {
                    byLocation[e.locationId] += e.qty;
                }
            }

            std::vector<domain::OnHandRow> rows;
            for (const auto& [locationId, qty] : byLocation) {
                rows.push_back({itemId, locationId, branchId, qty});
            }
            return rows;
        }

        std::vector<domain::OnHandRow> sumOnHandByBranch(
            const std::string& orgId, const std::string& branchId,
            const std::optional<std::string>& locationId) override
        {
            std::map<std::pair<std::string, std::string>, domain::Decimal> grouped;
            for (const auto& e : state_.ledger) {
                if (e.orgId != orgId || e.branchId != branchId) continue;
                if (locationId && e.locationId != *locationId) continue;
                grouped[{e.itemId, e.locationId}] += e.qty;
            }

            std::vector<domain::OnHandRow> rows;
            for (const auto& [key, qty] : grouped) {
                rows.push_back({key.first, key.second, branchId, qty});
            }
            return rows;
        }

        void insertLedgerEntry(const domain::LedgerEntry& entry) override {
            state_.ledger.push_back(entry);
        }

        std::optional<domain::LedgerEntry> findLedgerEntry(
            const std::string& orgId, const std::string& entryId) override
        {
            for (const auto& e : state_.ledger) {
                if (e.orgId == orgId && e.id == entryId) return e;
            }
            return std::nullopt;
        }

        domain::LedgerPage findLedgerEntries(const domain::LedgerQuery& q) override {
            std::vector<domain::LedgerEntry> matched;
            for (auto it = state_.ledger.rbegin(); it != state_.ledger.rend(); ++it) {
                const auto& e = *it;
                if (e.orgId != q.orgId || e.branchId != q.branchId) continue;
                if (q.itemId && e.itemId != *q.itemId) continue;
                if (q.locationId && e.locationId != *q.locationId) continue;
                if (q.reason && e.reason != *q.reason) continue;
                if (q.sourceType && e.sourceType != *q.sourceType) continue;
                if (q.sourceId && e.sourceId != q.sourceId) continue;
                if (q.from && e.createdAt < *q.from) continue;
                if (q.to && e.createdAt > *q.to) continue;
                matched.push_back(e);
            }
            std::stable_sort(matched.begin(), matched.end(),
                [](const auto& a, const auto& b) { return a.createdAt > b.createdAt; });

            domain::LedgerPage page;
            page.total = matched.size();
            for (size_t i = q.offset; i < matched.size() && page.entries.size() < q.limit; ++i) {
                page.entries.push_back(matched[i]);
            }
            return page;
        }

        // Lots

        std::optional<domain::Lot> findLotByNumber(
            const domain::StockKey& key, const std::string& lotNumber) override
        {
            for (const auto& [id, lot] : state_.lots) {
                if (atKey(lot, key) && lot.lotNumber == lotNumber) return lot;
            }
            return std::nullopt;
        }

        std::optional<domain::Lot> findLot(const std::string& lotId, bool) override {
            auto it = state_.lots.find(lotId);
            if (it == state_.lots.end()) return std::nullopt;
            return it->second;
        }

        bool insertLot(const domain::Lot& lot) override {
            domain::StockKey key{lot.orgId, lot.branchId, lot.itemId, lot.locationId};
            if (findLotByNumber(key, lot.lotNumber)) {
                return false;
            }
            state_.lots[lot.id] = lot;
            return true;
        }

        void updateLot(const domain::Lot& lot) override {
            state_.lots[lot.id] = lot;
        }

        std::vector<domain::Lot> findLotsWithStock(const domain::StockKey& key, bool) override {
            std::vector<domain::Lot> result;
            for (const auto& [id, lot] : state_.lots) {
                if (atKey(lot, key) && lot.remainingQty.isPositive()) {
                    result.push_back(lot);
                }
            }
            return result;
        }

        domain::LotPage findLots(const domain::LotQuery& q) override {
            std::vector<domain::Lot> matched;
            for (const auto& [id, lot] : state_.lots) {
                if (lot.orgId != q.orgId) continue;
                if (q.branchId && lot.branchId != *q.branchId) continue;
                if (q.itemId && lot.itemId != *q.itemId) continue;
                if (q.locationId && lot.locationId != *q.locationId) continue;
                if (!q.statuses.empty() &&
                    std::find(q.statuses.begin(), q.statuses.end(), lot.status) == q.statuses.end()) {
                    continue;
                }
                matched.push_back(lot);
            }
            std::sort(matched.begin(), matched.end(),
                [](const auto& a, const auto& b) { return domain::fefoKey(a) < domain::fefoKey(b); });

            domain::LotPage page;
            page.total = matched.size();
            for (size_t i = q.offset; i < matched.size() && page.lots.size() < q.limit; ++i) {
                page.lots.push_back(matched[i]);
            }
            return page;
        }

        std::vector<domain::Lot> findActiveLotsExpiringBy(
            const std::string& orgId, const std::optional<std::string>& branchId,
            const domain::Timestamp& cutoff) override
        {
            std::vector<domain::Lot> result;
            for (const auto& [id, lot] : state_.lots) {
                if (lot.orgId != orgId) continue;
                if (branchId && lot.branchId != *branchId) continue;
                if (lot.status != domain::LotStatus::ACTIVE || !lot.remainingQty.isPositive()) continue;
                if (!lot.expiryDate || *lot.expiryDate > cutoff) continue;
                result.push_back(lot);
            }
            std::sort(result.begin(), result.end(),
                [](const auto& a, const auto& b) { return domain::fefoKey(a) < domain::fefoKey(b); });
            return result;
        }

        void insertLotAllocation(const domain::LotAllocation& allocation) override {
            state_.allocations.push_back(allocation);
        }

        std::vector<domain::LotAllocation> findAllocationsByLot(const std::string& lotId) override {
            std::vector<domain::LotAllocation> result;
            for (const auto& a : state_.allocations) {
                if (a.lotId == lotId) result.push_back(a);
            }
            return result;
        }

        std::vector<domain::LotAllocation> findAllocationsBySource(
            const std::string& orgId, const std::string& sourceType, const std::string& sourceId) override
        {
            std::vector<domain::LotAllocation> result;
            for (const auto& a : state_.allocations) {
                if (a.orgId == orgId && a.sourceType == sourceType && a.sourceId == sourceId) {
                    result.push_back(a);
                }
            }
            return result;
        }

        void insertLotIncrement(const domain::LotIncrement& increment) override {
            state_.increments.push_back(increment);
        }

        std::vector<domain::LotIncrement> findIncrementsByLot(const std::string& lotId) override {
            std::vector<domain::LotIncrement> result;
            for (const auto& i : state_.increments) {
                if (i.lotId == lotId) result.push_back(i);
            }
            return result;
        }

        // Cost layers

        void insertCostLayer(const domain::CostLayer& layer) override {
            state_.costLayers.push_back(layer);
        }

        std::optional<domain::CostLayer> findCostLayer(const std::string& layerId) override {
            for (const auto& l : state_.costLayers) {
                if (l.id == layerId) return l;
            }
            return std::nullopt;
        }

        std::vector<domain::CostLayer> findCostLayers(const domain::CostLayerQuery& q) override {
            std::vector<domain::CostLayer> result;
            for (const auto& l : state_.costLayers) {
                if (l.orgId != q.orgId) continue;
                if (q.branchId && l.branchId != *q.branchId) continue;
                if (q.itemId && l.itemId != *q.itemId) continue;
                if (q.locationId && l.locationId != *q.locationId) continue;
                if (q.onlyRemaining && !l.qtyRemaining.isPositive()) continue;
                result.push_back(l);
            }
            std::stable_sort(result.begin(), result.end(),
                [](const auto& a, const auto& b) { return a.createdAt < b.createdAt; });
            return result;
        }

        void updateCostLayerRemaining(const std::string& layerId, const domain::Decimal& qtyRemaining) override {
            for (auto& l : state_.costLayers) {
                if (l.id == layerId) {
                    l.qtyRemaining = qtyRemaining;
                    return;
                }
            }
        }

        // Journal

        std::optional<domain::JournalEntry> findJournalBySource(
            const std::string& orgId, const std::string& source, const std::string& sourceId) override
        {
            for (const auto& j : state_.journals) {
                if (j.orgId == orgId && j.source == source && j.sourceId == sourceId) return j;
            }
            return std::nullopt;
        }

        std::optional<domain::JournalEntry> findJournalById(
            const std::string& orgId, const std::string& entryId) override
        {
            for (const auto& j : state_.journals) {
                if (j.orgId == orgId && j.id == entryId) return j;
            }
            return std::nullopt;
        }

        bool insertJournalEntry(const domain::JournalEntry& entry) override {
            if (findJournalBySource(entry.orgId, entry.source, entry.sourceId)) {
                return false;
            }
            state_.journals.push_back(entry);
            return true;
        }

        void markJournalReversed(
            const std::string& entryId, const std::string& reversedBy, const domain::Timestamp& reversedAt) override
        {
            for (auto& j : state_.journals) {
                if (j.id == entryId) {
                    j.status = domain::JournalStatus::REVERSED;
                    j.reversedBy = reversedBy;
                    j.reversedAt = reversedAt;
                    return;
                }
            }
        }

        std::vector<domain::JournalEntry> findJournalEntries(const domain::JournalQuery& q) override {
            std::vector<domain::JournalEntry> result;
            for (const auto& j : state_.journals) {
                if (j.orgId != q.orgId) continue;
                if (q.branchId && j.branchId != *q.branchId) continue;
                if (!q.sources.empty() &&
                    std::find(q.sources.begin(), q.sources.end(), j.source) == q.sources.end()) {
                    continue;
                }
                if (q.from && j.date < *q.from) continue;
                if (q.to && j.date > *q.to) continue;
                result.push_back(j);
            }
            return result;
        }

        // Настройки GL

        std::optional<domain::PostingMapping> findPostingMapping(
            const std::string& orgId, const std::optional<std::string>& branchId) override
        {
            for (const auto& m : state_.mappings) {
                if (m.orgId == orgId && m.branchId == branchId) return m;
            }
            return std::nullopt;
        }

        void upsertPostingMapping(const domain::PostingMapping& mapping) override {
            for (auto& m : state_.mappings) {
                if (m.orgId == mapping.orgId && m.branchId == mapping.branchId) {
                    m = mapping;
                    return;
                }
            }
            state_.mappings.push_back(mapping);
        }

        std::optional<domain::FiscalPeriod> findFiscalPeriod(
            const std::string& orgId, const domain::Timestamp& date) override
        {
            for (const auto& p : state_.periods) {
                if (p.orgId == orgId && p.contains(date)) return p;
            }
            return std::nullopt;
        }

        void upsertFiscalPeriod(const domain::FiscalPeriod& period) override {
            for (auto& p : state_.periods) {
                if (p.id == period.id) {
                    p = period;
                    return;
                }
            }
            state_.periods.push_back(period);
        }

        // Идемпотентность и хуки

        bool claimIdempotencyKey(const domain::IdempotencyRecord& record) override {
            return state_.idempotencyKeys.emplace(record.orgId, record.operation, record.key).second;
        }

        void onCommit(std::function<void()> hook) override {
            hooks_.push_back(std::move(hook));
        }

    private:
        State& state_;
        std::vector<std::function<void()>>& hooks_;

        static bool atKey(const domain::Lot& lot, const domain::StockKey& key) {
            return lot.orgId == key.orgId && lot.branchId == key.branchId &&
                   lot.itemId == key.itemId && lot.locationId == key.locationId;
        }
    };

    mutable std::mutex mutex_;
    State state_;
};

} // namespace inventory::adapters::secondary
