#pragma once

#include "ports/output/IInventoryStore.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace inventory::adapters::secondary {

/**
 * @brief PostgreSQL реализация транзакционного хранилища
 *
 * Одна pqxx::work на вызов transact(). Писатели одного ключа остатка
 * сериализуются через pg_advisory_xact_lock, партии читаются FOR UPDATE.
 * Уникальность партий, проводок и ключей идемпотентности обеспечивают
 * UNIQUE ограничения (ON CONFLICT DO NOTHING).
 *
 * Числа передаются текстом и приводятся к NUMERIC; время хранится как
 * TIMESTAMPTZ и передаётся микросекундами от эпохи.
 */
class PostgresInventoryStore : public ports::output::IInventoryStore {
public:
    explicit PostgresInventoryStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresInventoryStore] Connecting to " << settings_->getHost()
                  << "/" << settings_->getName() << std::endl;
        try {
            initSchema();
            std::cout << "[PostgresInventoryStore] Schema ready" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresInventoryStore] Schema init failed: " << e.what() << std::endl;
            throw;
        }
    }

    void transact(const std::function<void(ports::output::IStoreSession&)>& work) override {
        std::vector<std::function<void()>> hooks;
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            Session session(t, hooks);
            try {
                work(session);
                t.commit();
            } catch (const std::exception& e) {
                std::cerr << "[PostgresInventoryStore] Transaction rolled back: " << e.what() << std::endl;
                throw;
            }
        }

        for (auto& hook : hooks) {
            hook();
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work t(c);

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS inventory_ledger_entries (
                seq BIGSERIAL PRIMARY KEY,
                id TEXT NOT NULL UNIQUE,
                org_id TEXT NOT NULL,
                branch_id TEXT NOT NULL,
                item_id TEXT NOT NULL,
                location_id TEXT NOT NULL,
                qty NUMERIC NOT NULL CHECK (qty <> 0),
                reason TEXT NOT NULL,
                source_type TEXT NOT NULL,
                source_id TEXT,
                notes TEXT,
                created_at TIMESTAMPTZ NOT NULL,
                created_by TEXT,
                metadata JSONB NOT NULL DEFAULT '{}'::jsonb
            )
        )");
        t.exec("CREATE INDEX IF NOT EXISTS idx_ledger_stock ON inventory_ledger_entries "
               "(org_id, branch_id, item_id, location_id)");
        t.exec("CREATE INDEX IF NOT EXISTS idx_ledger_source ON inventory_ledger_entries "
               "(org_id, source_type, source_id)");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS inventory_lots (
                id TEXT PRIMARY KEY,
                org_id TEXT NOT NULL,
                branch_id TEXT NOT NULL,
                item_id TEXT NOT NULL,
                location_id TEXT NOT NULL,
                lot_number TEXT NOT NULL,
                received_qty NUMERIC NOT NULL,
                remaining_qty NUMERIC NOT NULL,
                unit_cost NUMERIC,
                expiry_date TIMESTAMPTZ,
                status TEXT NOT NULL,
                source_type TEXT NOT NULL,
                source_id TEXT,
                created_at TIMESTAMPTZ NOT NULL,
                created_by TEXT,
                UNIQUE (org_id, branch_id, item_id, location_id, lot_number),
                CHECK (remaining_qty >= 0 AND remaining_qty <= received_qty)
            )
        )");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS inventory_lot_allocations (
                id TEXT PRIMARY KEY,
                org_id TEXT NOT NULL,
                lot_id TEXT NOT NULL REFERENCES inventory_lots(id),
                allocated_qty NUMERIC NOT NULL CHECK (allocated_qty > 0),
                source_type TEXT NOT NULL,
                source_id TEXT NOT NULL,
                allocation_order INT NOT NULL,
                ledger_entry_id TEXT,
                created_at TIMESTAMPTZ NOT NULL
            )
        )");
        t.exec("CREATE INDEX IF NOT EXISTS idx_lot_alloc_source ON inventory_lot_allocations "
               "(org_id, source_type, source_id)");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS inventory_lot_increments (
                id TEXT PRIMARY KEY,
                org_id TEXT NOT NULL,
                lot_id TEXT NOT NULL REFERENCES inventory_lots(id),
                qty NUMERIC NOT NULL CHECK (qty > 0),
                source_type TEXT NOT NULL,
                source_id TEXT,
                created_at TIMESTAMPTZ NOT NULL
            )
        )");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS inventory_cost_layers (
                seq BIGSERIAL PRIMARY KEY,
                id TEXT NOT NULL UNIQUE,
                org_id TEXT NOT NULL,
                branch_id TEXT NOT NULL,
                item_id TEXT NOT NULL,
                location_id TEXT NOT NULL,
                qty_received NUMERIC NOT NULL,
                qty_remaining NUMERIC NOT NULL,
                unit_cost NUMERIC NOT NULL,
                source_type TEXT NOT NULL,
                source_id TEXT,
                created_at TIMESTAMPTZ NOT NULL,
                created_by TEXT,
                CHECK (qty_remaining >= 0 AND qty_remaining <= qty_received)
            )
        )");
        t.exec("CREATE INDEX IF NOT EXISTS idx_cost_layers_item ON inventory_cost_layers "
               "(org_id, item_id, branch_id, location_id)");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS gl_journal_entries (
                seq BIGSERIAL PRIMARY KEY,
                id TEXT NOT NULL UNIQUE,
                org_id TEXT NOT NULL,
                branch_id TEXT NOT NULL,
                entry_date TIMESTAMPTZ NOT NULL,
                memo TEXT NOT NULL,
                source TEXT NOT NULL,
                source_id TEXT NOT NULL,
                status TEXT NOT NULL,
                posted_by TEXT,
                reverses_entry_id TEXT,
                reversed_by TEXT,
                reversed_at TIMESTAMPTZ,
                UNIQUE (org_id, source, source_id)
            )
        )");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS gl_journal_lines (
                entry_id TEXT NOT NULL REFERENCES gl_journal_entries(id),
                line_no INT NOT NULL,
                account_id TEXT NOT NULL,
                debit NUMERIC NOT NULL DEFAULT 0,
                credit NUMERIC NOT NULL DEFAULT 0,
                meta JSONB NOT NULL DEFAULT '{}'::jsonb,
                PRIMARY KEY (entry_id, line_no)
            )
        )");

        // branch_id = '' - маппинг по умолчанию для организации
        t.exec(R"(
            CREATE TABLE IF NOT EXISTS gl_posting_mappings (
                org_id TEXT NOT NULL,
                branch_id TEXT NOT NULL DEFAULT '',
                inventory_asset_account_id TEXT NOT NULL,
                cogs_account_id TEXT NOT NULL,
                waste_expense_account_id TEXT NOT NULL,
                shrink_expense_account_id TEXT NOT NULL,
                grni_account_id TEXT NOT NULL,
                inventory_gain_account_id TEXT,
                PRIMARY KEY (org_id, branch_id)
            )
        )");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS gl_fiscal_periods (
                id TEXT PRIMARY KEY,
                org_id TEXT NOT NULL,
                name TEXT NOT NULL,
                starts_at TIMESTAMPTZ NOT NULL,
                ends_at TIMESTAMPTZ NOT NULL,
                status TEXT NOT NULL
            )
        )");

        t.exec(R"(
            CREATE TABLE IF NOT EXISTS inventory_idempotency_keys (
                org_id TEXT NOT NULL,
                operation TEXT NOT NULL,
                key TEXT NOT NULL,
                created_at TIMESTAMPTZ NOT NULL,
                PRIMARY KEY (org_id, operation, key)
            )
        )");

        t.commit();
    }

    class Session : public ports::output::IStoreSession {
    public:
        Session(pqxx::work& t, std::vector<std::function<void()>>& hooks)
            : t_(t), hooks_(hooks) {}

        // ------------------------------------------------------------------
        // Ledger
        // ------------------------------------------------------------------

        void lockStockKey(const domain::StockKey& key) override {
            t_.exec_params("SELECT pg_advisory_xact_lock(hashtextextended($1, 0))", key.toString());
        }

        domain::Decimal sumOnHand(const domain::StockKey& key) override {
            auto r = t_.exec_params(
                "SELECT COALESCE(SUM(qty), 0)::text FROM inventory_ledger_entries "
                "WHERE org_id = $1 AND branch_id = $2 AND item_id = $3 AND location_id = $4",
                key.orgId, key.branchId, key.itemId, key.locationId);
            return dec(r[0][0]);
        }

        std::vector<domain::OnHandRow> sumOnHandByLocation(
            const std::string& orgId, const std::string& branchId, const std::string& itemId) override
        {
            auto r = t_.exec_params(
                "SELECT item_id, location_id, branch_id, SUM(qty)::text FROM inventory_ledger_entries "
                "WHERE org_id = $1 AND branch_id = $2 AND item_id = $3 "
                "GROUP BY item_id, location_id, branch_id ORDER BY location_id",
                orgId, branchId, itemId);
            return onHandRows(r);
        }

        std::vector<domain::OnHandRow> sumOnHandByBranch(
            const std::string& orgId, const std::string& branchId,
            const std::optional<std::string>& locationId) override
        {
            auto r = t_.exec_params(
                "SELECT item_id, location_id, branch_id, SUM(qty)::text FROM inventory_ledger_entries "
                "WHERE org_id = $1 AND branch_id = $2 AND ($3::text IS NULL OR location_id = $3) "
                "GROUP BY item_id, location_id, branch_id ORDER BY item_id, location_id",
                orgId, branchId, locationId);
            return onHandRows(r);
        }

        void insertLedgerEntry(const domain::LedgerEntry& e) override {
            t_.exec_params(
                "INSERT INTO inventory_ledger_entries (id, org_id, branch_id, item_id, location_id, qty, reason, "
                "source_type, source_id, notes, created_at, created_by, metadata) "
                "VALUES ($1, $2, $3, $4, $5, $6::numeric, $7, $8, $9, $10, " + ts(11) + ", $12, $13::jsonb)",
                e.id, e.orgId, e.branchId, e.itemId, e.locationId, e.qty.toString(), domain::toString(e.reason),
                e.sourceType, e.sourceId, e.notes, e.createdAt.toEpochMicros(), e.createdBy, e.metadata.dump());
        }

        std::optional<domain::LedgerEntry> findLedgerEntry(
            const std::string& orgId, const std::string& entryId) override
        {
            auto r = t_.exec_params(
                "SELECT " + ledgerColumns() + " FROM inventory_ledger_entries WHERE org_id = $1 AND id = $2",
                orgId, entryId);
            if (r.empty()) return std::nullopt;
            return toLedgerEntry(r[0]);
        }

        domain::LedgerPage findLedgerEntries(const domain::LedgerQuery& q) override {
            static const std::string where =
                " WHERE org_id = $1 AND branch_id = $2"
                " AND ($3::text IS NULL OR item_id = $3)"
                " AND ($4::text IS NULL OR location_id = $4)"
                " AND ($5::text IS NULL OR reason = $5)"
                " AND ($6::text IS NULL OR source_type = $6)"
                " AND ($7::text IS NULL OR source_id = $7)"
                " AND ($8::bigint IS NULL OR created_at >= " + ts(8) + ")"
                " AND ($9::bigint IS NULL OR created_at <= " + ts(9) + ")";

            std::optional<std::string> reason;
            if (q.reason) reason = domain::toString(*q.reason);
            auto from = micros(q.from);
            auto to = micros(q.to);

            auto count = t_.exec_params(
                "SELECT COUNT(*) FROM inventory_ledger_entries" + where,
                q.orgId, q.branchId, q.itemId, q.locationId, reason, q.sourceType, q.sourceId, from, to);

            auto r = t_.exec_params(
                "SELECT " + ledgerColumns() + " FROM inventory_ledger_entries" + where +
                " ORDER BY created_at DESC, seq DESC LIMIT $10 OFFSET $11",
                q.orgId, q.branchId, q.itemId, q.locationId, reason, q.sourceType, q.sourceId, from, to,
                static_cast<int64_t>(q.limit), static_cast<int64_t>(q.offset));

            domain::LedgerPage page;
            page.total = count[0][0].as<size_t>();
            for (const auto& row : r) {
                page.entries.push_back(toLedgerEntry(row));
            }
            return page;
        }

        // ------------------------------------------------------------------
        // Lots
        // ------------------------------------------------------------------

        std::optional<domain::Lot> findLotByNumber(
            const domain::StockKey& key, const std::string& lotNumber) override
        {
            auto r = t_.exec_params(
                "SELECT " + lotColumns() + " FROM inventory_lots "
                "WHERE org_id = $1 AND branch_id = $2 AND item_id = $3 AND location_id = $4 AND lot_number = $5",
                key.orgId, key.branchId, key.itemId, key.locationId, lotNumber);
            if (r.empty()) return std::nullopt;
            return toLot(r[0]);
        }

        std::optional<domain::Lot> findLot(const std::string& lotId, bool forUpdate) override {
            auto r = t_.exec_params(
                "SELECT " + lotColumns() + " FROM inventory_lots WHERE id = $1" +
                std::string(forUpdate ? " FOR UPDATE" : ""),
                lotId);
            if (r.empty()) return std::nullopt;
            return toLot(r[0]);
        }

        bool insertLot(const domain::Lot& lot) override {
            std::optional<std::string> unitCost;
            if (lot.unitCost) unitCost = lot.unitCost->toString();

            auto r = t_.exec_params(
                "INSERT INTO inventory_lots (id, org_id, branch_id, item_id, location_id, lot_number, received_qty, "
                "remaining_qty, unit_cost, expiry_date, status, source_type, source_id, created_at, created_by) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7::numeric, $8::numeric, $9::numeric, " + ts(10) + ", $11, $12, $13, " +
                ts(14) + ", $15) "
                "ON CONFLICT (org_id, branch_id, item_id, location_id, lot_number) DO NOTHING RETURNING id",
                lot.id, lot.orgId, lot.branchId, lot.itemId, lot.locationId, lot.lotNumber,
                lot.receivedQty.toString(), lot.remainingQty.toString(), unitCost, micros(lot.expiryDate),
                domain::toString(lot.status), lot.sourceType, lot.sourceId, lot.createdAt.toEpochMicros(),
                lot.createdBy);
            return !r.empty();
        }

        void updateLot(const domain::Lot& lot) override {
            t_.exec_params(
                "UPDATE inventory_lots SET remaining_qty = $2::numeric, status = $3 WHERE id = $1",
                lot.id, lot.remainingQty.toString(), domain::toString(lot.status));
        }

        std::vector<domain::Lot> findLotsWithStock(const domain::StockKey& key, bool forUpdate) override {
            auto r = t_.exec_params(
                "SELECT " + lotColumns() + " FROM inventory_lots "
                "WHERE org_id = $1 AND branch_id = $2 AND item_id = $3 AND location_id = $4 AND remaining_qty > 0 "
                "ORDER BY expiry_date ASC NULLS LAST, created_at ASC, id ASC" +
                std::string(forUpdate ? " FOR UPDATE" : ""),
                key.orgId, key.branchId, key.itemId, key.locationId);
            return toLots(r);
        }

        domain::LotPage findLots(const domain::LotQuery& q) override {
            static const std::string where =
                " WHERE org_id = $1"
                " AND ($2::text IS NULL OR branch_id = $2)"
                " AND ($3::text IS NULL OR item_id = $3)"
                " AND ($4::text IS NULL OR location_id = $4)"
                " AND ($5::text[] IS NULL OR status = ANY($5::text[]))";

            std::optional<std::string> statuses;
            if (!q.statuses.empty()) {
                std::vector<std::string> names;
                for (auto status : q.statuses) names.push_back(domain::toString(status));
                statuses = arrayLiteral(names);
            }

            auto count = t_.exec_params(
                "SELECT COUNT(*) FROM inventory_lots" + where,
                q.orgId, q.branchId, q.itemId, q.locationId, statuses);

            auto r = t_.exec_params(
                "SELECT " + lotColumns() + " FROM inventory_lots" + where +
                " ORDER BY expiry_date ASC NULLS LAST, created_at ASC, id ASC LIMIT $6 OFFSET $7",
                q.orgId, q.branchId, q.itemId, q.locationId, statuses,
                static_cast<int64_t>(q.limit), static_cast<int64_t>(q.offset));

            domain::LotPage page;
            page.total = count[0][0].as<size_t>();
            page.lots = toLots(r);
            return page;
        }

        std::vector<domain::Lot> findActiveLotsExpiringBy(
            const std::string& orgId, const std::optional<std::string>& branchId,
            const domain::Timestamp& cutoff) override
        {
            auto r = t_.exec_params(
                "SELECT " + lotColumns() + " FROM inventory_lots "
                "WHERE org_id = $1 AND ($2::text IS NULL OR branch_id = $2) AND status = 'ACTIVE' "
                "AND remaining_qty > 0 AND expiry_date IS NOT NULL AND expiry_date <= " + ts(3) +
                " ORDER BY expiry_date ASC, created_at ASC, id ASC",
                orgId, branchId, cutoff.toEpochMicros());
            return toLots(r);
        }

        void insertLotAllocation(const domain::LotAllocation& a) override {
            t_.exec_params(
                "INSERT INTO inventory_lot_allocations (id, org_id, lot_id, allocated_qty, source_type, source_id, "
                "allocation_order, ledger_entry_id, created_at) "
                "VALUES ($1, $2, $3, $4::numeric, $5, $6, $7, $8, " + ts(9) + ")",
                a.id, a.orgId, a.lotId, a.allocatedQty.toString(), a.sourceType, a.sourceId,
                a.allocationOrder, a.ledgerEntryId, a.createdAt.toEpochMicros());
        }

        std::vector<domain::LotAllocation> findAllocationsByLot(const std::string& lotId) override {
            auto r = t_.exec_params(
                "SELECT " + allocationColumns() + " FROM inventory_lot_allocations "
                "WHERE lot_id = $1 ORDER BY created_at, allocation_order",
                lotId);
            return toAllocations(r);
        }

        std::vector<domain::LotAllocation> findAllocationsBySource(
            const std::string& orgId, const std::string& sourceType, const std::string& sourceId) override
        {
            auto r = t_.exec_params(
                "SELECT " + allocationColumns() + " FROM inventory_lot_allocations "
                "WHERE org_id = $1 AND source_type = $2 AND source_id = $3 ORDER BY created_at, allocation_order",
                orgId, sourceType, sourceId);
            return toAllocations(r);
        }

        void insertLotIncrement(const domain::LotIncrement& i) override {
            t_.exec_params(
                "INSERT INTO inventory_lot_increments (id, org_id, lot_id, qty, source_type, source_id, created_at) "
                "VALUES ($1, $2, $3, $4::numeric, $5, $6, " + ts(7) + ")",
                i.id, i.orgId, i.lotId, i.qty.toString(), i.sourceType, i.sourceId, i.createdAt.toEpochMicros());
        }

        std::vector<domain::LotIncrement> findIncrementsByLot(const std::string& lotId) override {
            auto r = t_.exec_params(
                "SELECT id, org_id, lot_id, qty::text, source_type, source_id, " + epoch("created_at") +
                " FROM inventory_lot_increments WHERE lot_id = $1 ORDER BY created_at",
                lotId);

            std::vector<domain::LotIncrement> result;
            for (const auto& row : r) {
                domain::LotIncrement i;
                i.id = row[0].as<std::string>();
                i.orgId = row[1].as<std::string>();
                i.lotId = row[2].as<std::string>();
                i.qty = dec(row[3]);
                i.sourceType = row[4].as<std::string>();
                i.sourceId = optStr(row[5]);
                i.createdAt = ts(row[6]);
                result.push_back(std::move(i));
            }
            return result;
        }

        // ------------------------------------------------------------------
        // Cost layers
        // ------------------------------------------------------------------

        void insertCostLayer(const domain::CostLayer& l) override {
            t_.exec_params(
                "INSERT INTO inventory_cost_layers (id, org_id, branch_id, item_id, location_id, qty_received, "
                "qty_remaining, unit_cost, source_type, source_id, created_at, created_by) "
                "VALUES ($1, $2, $3, $4, $5, $6::numeric, $7::numeric, $8::numeric, $9, $10, " + ts(11) + ", $12)",
                l.id, l.orgId, l.branchId, l.itemId, l.locationId, l.qtyReceived.toString(),
                l.qtyRemaining.toString(), l.unitCost.toString(), l.sourceType, l.sourceId,
                l.createdAt.toEpochMicros(), l.createdBy);
        }

        std::optional<domain::CostLayer> findCostLayer(const std::string& layerId) override {
            auto r = t_.exec_params(
                "SELECT " + layerColumns() + " FROM inventory_cost_layers WHERE id = $1 FOR UPDATE", layerId);
            if (r.empty()) return std::nullopt;
            return toLayer(r[0]);
        }

        std::vector<domain::CostLayer> findCostLayers(const domain::CostLayerQuery& q) override {
            auto r = t_.exec_params(
                "SELECT " + layerColumns() + " FROM inventory_cost_layers "
                "WHERE org_id = $1 AND ($2::text IS NULL OR branch_id = $2) "
                "AND ($3::text IS NULL OR item_id = $3) AND ($4::text IS NULL OR location_id = $4) "
                "AND (NOT $5 OR qty_remaining > 0) ORDER BY created_at, seq" +
                std::string(q.forUpdate ? " FOR UPDATE" : ""),
                q.orgId, q.branchId, q.itemId, q.locationId, q.onlyRemaining);

            std::vector<domain::CostLayer> result;
            for (const auto& row : r) {
                result.push_back(toLayer(row));
            }
            return result;
        }

        void updateCostLayerRemaining(const std::string& layerId, const domain::Decimal& qtyRemaining) override {
            t_.exec_params(
                "UPDATE inventory_cost_layers SET qty_remaining = $2::numeric WHERE id = $1",
                layerId, qtyRemaining.toString());
        }

        // ------------------------------------------------------------------
        // Journal
        // ------------------------------------------------------------------

        std::optional<domain::JournalEntry> findJournalBySource(
            const std::string& orgId, const std::string& source, const std::string& sourceId) override
        {
            auto r = t_.exec_params(
                "SELECT " + journalColumns() + " FROM gl_journal_entries "
                "WHERE org_id = $1 AND source = $2 AND source_id = $3",
                orgId, source, sourceId);
            if (r.empty()) return std::nullopt;
            return toJournal(r[0]);
        }

        std::optional<domain::JournalEntry> findJournalById(
            const std::string& orgId, const std::string& entryId) override
        {
            auto r = t_.exec_params(
                "SELECT " + journalColumns() + " FROM gl_journal_entries WHERE org_id = $1 AND id = $2",
                orgId, entryId);
            if (r.empty()) return std::nullopt;
            return toJournal(r[0]);
        }

        bool insertJournalEntry(const domain::JournalEntry& e) override {
            auto r = t_.exec_params(
                "INSERT INTO gl_journal_entries (id, org_id, branch_id, entry_date, memo, source, source_id, status, "
                "posted_by, reverses_entry_id) "
                "VALUES ($1, $2, $3, " + ts(4) + ", $5, $6, $7, $8, $9, $10) "
                "ON CONFLICT (org_id, source, source_id) DO NOTHING RETURNING id",
                e.id, e.orgId, e.branchId, e.date.toEpochMicros(), e.memo, e.source, e.sourceId,
                domain::toString(e.status), e.postedBy, e.reversesEntryId);
            if (r.empty()) {
                return false;
            }

            int lineNo = 1;
            for (const auto& line : e.lines) {
                t_.exec_params(
                    "INSERT INTO gl_journal_lines (entry_id, line_no, account_id, debit, credit, meta) "
                    "VALUES ($1, $2, $3, $4::numeric, $5::numeric, $6::jsonb)",
                    e.id, lineNo++, line.accountId, line.debit.toString(), line.credit.toString(), line.meta.dump());
            }
            return true;
        }

        void markJournalReversed(
            const std::string& entryId, const std::string& reversedBy, const domain::Timestamp& reversedAt) override
        {
            t_.exec_params(
                "UPDATE gl_journal_entries SET status = 'REVERSED', reversed_by = $2, reversed_at = " + ts(3) +
                " WHERE id = $1",
                entryId, reversedBy, reversedAt.toEpochMicros());
        }

        std::vector<domain::JournalEntry> findJournalEntries(const domain::JournalQuery& q) override {
            std::optional<std::string> sources;
            if (!q.sources.empty()) sources = arrayLiteral(q.sources);

            auto r = t_.exec_params(
                "SELECT " + journalColumns() + " FROM gl_journal_entries "
                "WHERE org_id = $1 AND ($2::text IS NULL OR branch_id = $2) "
                "AND ($3::text[] IS NULL OR source = ANY($3::text[])) "
                "AND ($4::bigint IS NULL OR entry_date >= " + ts(4) + ") "
                "AND ($5::bigint IS NULL OR entry_date <= " + ts(5) + ") "
                "ORDER BY entry_date, seq",
                q.orgId, q.branchId, sources, micros(q.from), micros(q.to));

            std::vector<domain::JournalEntry> result;
            for (const auto& row : r) {
                result.push_back(toJournal(row));
            }
            return result;
        }

        // ------------------------------------------------------------------
        // Настройки GL
        // ------------------------------------------------------------------

        std::optional<domain::PostingMapping> findPostingMapping(
            const std::string& orgId, const std::optional<std::string>& branchId) override
        {
            auto r = t_.exec_params(
                "SELECT org_id, branch_id, inventory_asset_account_id, cogs_account_id, waste_expense_account_id, "
                "shrink_expense_account_id, grni_account_id, inventory_gain_account_id "
                "FROM gl_posting_mappings WHERE org_id = $1 AND branch_id = $2",
                orgId, branchId.value_or(""));
            if (r.empty()) return std::nullopt;

            const auto& row = r[0];
            domain::PostingMapping m;
            m.orgId = row[0].as<std::string>();
            std::string branch = row[1].as<std::string>();
            if (!branch.empty()) m.branchId = branch;
            m.inventoryAssetAccountId = row[2].as<std::string>();
            m.cogsAccountId = row[3].as<std::string>();
            m.wasteExpenseAccountId = row[4].as<std::string>();
            m.shrinkExpenseAccountId = row[5].as<std::string>();
            m.grniAccountId = row[6].as<std::string>();
            m.inventoryGainAccountId = optStr(row[7]);
            return m;
        }

        void upsertPostingMapping(const domain::PostingMapping& m) override {
            t_.exec_params(
                "INSERT INTO gl_posting_mappings (org_id, branch_id, inventory_asset_account_id, cogs_account_id, "
                "waste_expense_account_id, shrink_expense_account_id, grni_account_id, inventory_gain_account_id) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8) "
                "ON CONFLICT (org_id, branch_id) DO UPDATE SET "
                "inventory_asset_account_id = EXCLUDED.inventory_asset_account_id, "
                "cogs_account_id = EXCLUDED.cogs_account_id, "
                "waste_expense_account_id = EXCLUDED.waste_expense_account_id, "
                "shrink_expense_account_id = EXCLUDED.shrink_expense_account_id, "
                "grni_account_id = EXCLUDED.grni_account_id, "
                "inventory_gain_account_id = EXCLUDED.inventory_gain_account_id",
                m.orgId, m.branchId.value_or(""), m.inventoryAssetAccountId, m.cogsAccountId,
                m.wasteExpenseAccountId, m.shrinkExpenseAccountId, m.grniAccountId, m.inventoryGainAccountId);
        }

        std::optional<domain::FiscalPeriod> findFiscalPeriod(
            const std::string& orgId, const domain::Timestamp& date) override
        {
            auto r = t_.exec_params(
                "SELECT id, org_id, name, " + epoch("starts_at") + ", " + epoch("ends_at") + ", status "
                "FROM gl_fiscal_periods WHERE org_id = $1 "
                "AND starts_at <= " + ts(2) + " AND ends_at >= " + ts(2) +
                " ORDER BY starts_at DESC LIMIT 1",
                orgId, date.toEpochMicros());
            if (r.empty()) return std::nullopt;

            const auto& row = r[0];
            domain::FiscalPeriod p;
            p.id = row[0].as<std::string>();
            p.orgId = row[1].as<std::string>();
            p.name = row[2].as<std::string>();
            p.startsAt = ts(row[3]);
            p.endsAt = ts(row[4]);
            p.status = domain::parseFiscalPeriodStatus(row[5].as<std::string>());
            return p;
        }

        void upsertFiscalPeriod(const domain::FiscalPeriod& p) override {
            t_.exec_params(
                "INSERT INTO gl_fiscal_periods (id, org_id, name, starts_at, ends_at, status) "
                "VALUES ($1, $2, $3, " + ts(4) + ", " + ts(5) + ", $6) "
                "ON CONFLICT (id) DO UPDATE SET name = EXCLUDED.name, starts_at = EXCLUDED.starts_at, "
                "ends_at = EXCLUDED.ends_at, status = EXCLUDED.status",
                p.id, p.orgId, p.name, p.startsAt.toEpochMicros(), p.endsAt.toEpochMicros(),
                domain::toString(p.status));
        }

        // ------------------------------------------------------------------
        // Идемпотентность и хуки
        // ------------------------------------------------------------------

        bool claimIdempotencyKey(const domain::IdempotencyRecord& record) override {
            auto r = t_.exec_params(
                "INSERT INTO inventory_idempotency_keys (org_id, operation, key, created_at) "
                "VALUES ($1, $2, $3, " + ts(4) + ") "
                "ON CONFLICT (org_id, operation, key) DO NOTHING RETURNING key",
                record.orgId, record.operation, record.key, record.createdAt.toEpochMicros());
            return !r.empty();
        }

        void onCommit(std::function<void()> hook) override {
            hooks_.push_back(std::move(hook));
        }

    private:
        pqxx::work& t_;
        std::vector<std::function<void()>>& hooks_;

        // ---- SQL helpers ----

        static std::string ts(int param) {
            return "(TIMESTAMPTZ 'epoch' + $" + std::to_string(param) + "::bigint * INTERVAL '1 microsecond')";
        }

        static std::string epoch(const std::string& column) {
            return "(EXTRACT(EPOCH FROM " + column + ") * 1000000)::bigint";
        }

        static std::optional<int64_t> micros(const std::optional<domain::Timestamp>& value) {
            if (!value) return std::nullopt;
            return value->toEpochMicros();
        }

        static std::string arrayLiteral(const std::vector<std::string>& values) {
            std::string literal = "{";
            for (size_t i = 0; i < values.size(); ++i) {
                if (i > 0) literal += ",";
                literal += "\"";
                for (char ch : values[i]) {
                    if (ch == '"' || ch == '\\') literal += '\\';
                    literal += ch;
                }
                literal += "\"";
            }
            return literal + "}";
        }

        static const std::string& ledgerColumns() {
            static const std::string columns =
                "id, org_id, branch_id, item_id, location_id, qty::text, reason, source_type, source_id, notes, " +
                epoch("created_at") + ", created_by, metadata::text";
            return columns;
        }

        static const std::string& lotColumns() {
            static const std::string columns =
                "id, org_id, branch_id, item_id, location_id, lot_number, received_qty::text, remaining_qty::text, "
                "unit_cost::text, " + epoch("expiry_date") + ", status, source_type, source_id, " +
                epoch("created_at") + ", created_by";
            return columns;
        }

        static const std::string& allocationColumns() {
            static const std::string columns =
                "id, org_id, lot_id, allocated_qty::text, source_type, source_id, allocation_order, ledger_entry_id, " +
                epoch("created_at");
            return columns;
        }

        static const std::string& layerColumns() {
            static const std::string columns =
                "id, org_id, branch_id, item_id, location_id, qty_received::text, qty_remaining::text, "
                "unit_cost::text, source_type, source_id, " + epoch("created_at") + ", created_by";
            return columns;
        }

        static const std::string& journalColumns() {
            static const std::string columns =
                "id, org_id, branch_id, " + epoch("entry_date") + ", memo, source, source_id, status, posted_by, "
                "reverses_entry_id, reversed_by, " + epoch("reversed_at");
            return columns;
        }

        // ---- Row mapping ----

        static domain::Decimal dec(const pqxx::field& f) {
            return domain::Decimal::parse(f.as<std::string>());
        }

        static std::optional<std::string> optStr(const pqxx::field& f) {
            if (f.is_null()) return std::nullopt;
            return f.as<std::string>();
        }

        static domain::Timestamp ts(const pqxx::field& f) {
            return domain::Timestamp::fromEpochMicros(f.as<int64_t>());
        }

        static std::optional<domain::Timestamp> optTs(const pqxx::field& f) {
            if (f.is_null()) return std::nullopt;
            return ts(f);
        }

        static std::vector<domain::OnHandRow> onHandRows(const pqxx::result& r) {
            std::vector<domain::OnHandRow> rows;
            for (const auto& row : r) {
                rows.push_back({row[0].as<std::string>(), row[1].as<std::string>(),
                                row[2].as<std::string>(), dec(row[3])});
            }
            return rows;
        }

        static domain::LedgerEntry toLedgerEntry(const pqxx::row& row) {
            domain::LedgerEntry e;
            e.id = row[0].as<std::string>();
            e.orgId = row[1].as<std::string>();
            e.branchId = row[2].as<std::string>();
            e.itemId = row[3].as<std::string>();
            e.locationId = row[4].as<std::string>();
            e.qty = dec(row[5]);
            e.reason = domain::parseLedgerReason(row[6].as<std::string>());
            e.sourceType = row[7].as<std::string>();
            e.sourceId = optStr(row[8]);
            e.notes = optStr(row[9]);
            e.createdAt = ts(row[10]);
            e.createdBy = optStr(row[11]);
            e.metadata = nlohmann::json::parse(row[12].as<std::string>());
            return e;
        }

        static domain::Lot toLot(const pqxx::row& row) {
            domain::Lot lot;
            lot.id = row[0].as<std::string>();
            lot.orgId = row[1].as<std::string>();
            lot.branchId = row[2].as<std::string>();
            lot.itemId = row[3].as<std::string>();
            lot.locationId = row[4].as<std::string>();
            lot.lotNumber = row[5].as<std::string>();
            lot.receivedQty = dec(row[6]);
            lot.remainingQty = dec(row[7]);
            if (!row[8].is_null()) lot.unitCost = dec(row[8]);
            lot.expiryDate = optTs(row[9]);
            lot.status = domain::parseLotStatus(row[10].as<std::string>());
            lot.sourceType = row[11].as<std::string>();
            lot.sourceId = optStr(row[12]);
            lot.createdAt = ts(row[13]);
            lot.createdBy = optStr(row[14]);
            return lot;
        }

        static std::vector<domain::Lot> toLots(const pqxx::result& r) {
            std::vector<domain::Lot> lots;
            for (const auto& row : r) {
                lots.push_back(toLot(row));
            }
            return lots;
        }

        static std::vector<domain::LotAllocation> toAllocations(const pqxx::result& r) {
            std::vector<domain::LotAllocation> result;
            for (const auto& row : r) {
                domain::LotAllocation a;
                a.id = row[0].as<std::string>();
                a.orgId = row[1].as<std::string>();
                a.lotId = row[2].as<std::string>();
                a.allocatedQty = dec(row[3]);
                a.sourceType = row[4].as<std::string>();
                a.sourceId = row[5].as<std::string>();
                a.allocationOrder = row[6].as<int>();
                a.ledgerEntryId = optStr(row[7]);
                a.createdAt = ts(row[8]);
                result.push_back(std::move(a));
            }
            return result;
        }

        static domain::CostLayer toLayer(const pqxx::row& row) {
            domain::CostLayer l;
            l.id = row[0].as<std::string>();
            l.orgId = row[1].as<std::string>();
            l.branchId = row[2].as<std::string>();
            l.itemId = row[3].as<std::string>();
            l.locationId = row[4].as<std::string>();
            l.qtyReceived = dec(row[5]);
            l.qtyRemaining = dec(row[6]);
            l.unitCost = dec(row[7]);
            l.sourceType = row[8].as<std::string>();
            l.sourceId = optStr(row[9]);
            l.createdAt = ts(row[10]);
            l.createdBy = optStr(row[11]);
            return l;
        }

        domain::JournalEntry toJournal(const pqxx::row& row) {
            domain::JournalEntry e;
            e.id = row[0].as<std::string>();
            e.orgId = row[1].as<std::string>();
            e.branchId = row[2].as<std::string>();
            e.date = ts(row[3]);
            e.memo = row[4].as<std::string>();
            e.source = row[5].as<std::string>();
            e.sourceId = row[6].as<std::string>();
            e.status = domain::parseJournalStatus(row[7].as<std::string>());
            e.postedBy = optStr(row[8]);
            e.reversesEntryId = optStr(row[9]);
            e.reversedBy = optStr(row[10]);
            e.reversedAt = optTs(row[11]);

            auto lines = t_.exec_params(
                "SELECT account_id, debit::text, credit::text, meta::text FROM gl_journal_lines "
                "WHERE entry_id = $1 ORDER BY line_no",
                e.id);
            for (const auto& line : lines) {
                e.lines.push_back({line[0].as<std::string>(), dec(line[1]), dec(line[2]),
                                   nlohmann::json::parse(line[3].as<std::string>())});
            }
            return e;
        }
    };
};

} // namespace inventory::adapters::secondary
