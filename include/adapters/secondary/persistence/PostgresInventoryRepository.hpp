// include/adapters/secondary/persistence/PostgresInventoryRepository.hpp
#pragma once

#include "ports/output/IInventoryRepository.hpp"
#include "adapters/secondary/persistence/PostgresSupport.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace hospitality::adapters::secondary {

/**
 * @brief PostgreSQL реализация склада и журнала движений
 *
 * Таблица: inventory_items
 * - current_stock BIGINT NOT NULL CHECK (current_stock >= 0)
 * - unit_cost_units BIGINT, unit_cost_nano INTEGER
 *
 * Таблица: stock_transactions (append-only)
 * - seq BIGSERIAL - порядок вставки
 * - kind, quantity, delta, balance_after
 */
class PostgresInventoryRepository : public ports::output::IInventoryRepository {
public:
    explicit PostgresInventoryRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    void saveItem(const domain::InventoryItem& item) override {
        postgres::guarded(COMPONENT, "saveItem", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            // current_stock здесь не обновляется: он меняется только вместе с журналом
            txn.exec_params(
                "INSERT INTO inventory_items (id, property_id, sku, name, unit, current_stock, "
                "min_stock, max_stock, reorder_point, reorder_quantity, "
                "unit_cost_units, unit_cost_nano, currency, status, created_at, updated_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, "
                "$15::timestamptz, $16::timestamptz) "
                "ON CONFLICT (id) DO UPDATE SET "
                "name = EXCLUDED.name, unit = EXCLUDED.unit, "
                "min_stock = EXCLUDED.min_stock, max_stock = EXCLUDED.max_stock, "
                "reorder_point = EXCLUDED.reorder_point, reorder_quantity = EXCLUDED.reorder_quantity, "
                "unit_cost_units = EXCLUDED.unit_cost_units, unit_cost_nano = EXCLUDED.unit_cost_nano, "
                "currency = EXCLUDED.currency, status = EXCLUDED.status, updated_at = EXCLUDED.updated_at",
                item.id,
                item.propertyId,
                item.sku,
                item.name,
                domain::toString(item.unit),
                item.currentStock,
                item.minStock,
                item.maxStock,
                item.reorderPoint,
                item.reorderQuantity,
                item.unitCost.units,
                item.unitCost.nano,
                item.unitCost.currency,
                domain::toString(item.status),
                item.createdAt.toString(),
                item.updatedAt.toString()
            );

            txn.commit();
            std::cout << "[" << COMPONENT << "] Saved item " << item.id << " sku=" << item.sku << std::endl;
        });
    }

    std::optional<domain::InventoryItem> findItem(const std::string& itemId) override {
        return postgres::guarded(COMPONENT, "findItem", [&]() -> std::optional<domain::InventoryItem> {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + itemColumns() + " FROM inventory_items WHERE id = $1",
                itemId
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToItem(result[0]);
        });
    }

    std::vector<domain::InventoryItem> findItemsByProperty(const std::string& propertyId) override {
        return postgres::guarded(COMPONENT, "findItemsByProperty", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + itemColumns() + " FROM inventory_items WHERE property_id = $1 ORDER BY sku",
                propertyId
            );

            std::vector<domain::InventoryItem> items;
            for (const auto& row : result) {
                items.push_back(rowToItem(row));
            }
            return items;
        });
    }

    std::vector<domain::StockTransaction> findTransactions(const std::string& itemId, size_t limit) override {
        return postgres::guarded(COMPONENT, "findTransactions", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + transactionColumns() + " FROM stock_transactions "
                "WHERE item_id = $1 ORDER BY created_at DESC, seq DESC LIMIT $2",
                itemId,
                static_cast<int64_t>(limit)
            );
            return rowsToTransactions(result);
        });
    }

    std::vector<domain::StockTransaction> findAllTransactions(const std::string& itemId) override {
        return postgres::guarded(COMPONENT, "findAllTransactions", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + transactionColumns() + " FROM stock_transactions "
                "WHERE item_id = $1 ORDER BY seq",
                itemId
            );
            return rowsToTransactions(result);
        });
    }

    std::vector<domain::StockTransaction> findExpiringReceipts(
        const std::string& propertyId,
        const domain::Timestamp& before
    ) override {
        return postgres::guarded(COMPONENT, "findExpiringReceipts", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + transactionColumns("t.") + " FROM stock_transactions t "
                "JOIN inventory_items i ON i.id = t.item_id "
                "WHERE i.property_id = $1 AND t.kind IN ('PURCHASE', 'RETURN') "
                "AND t.expiry_date IS NOT NULL AND t.expiry_date <= $2::timestamptz "
                "ORDER BY t.expiry_date",
                propertyId,
                before.toString()
            );
            return rowsToTransactions(result);
        });
    }

    std::unique_ptr<ports::output::IStockUnitOfWork> lockItem(const std::string& itemId) override {
        return postgres::guarded(COMPONENT, "lockItem",
            [&]() -> std::unique_ptr<ports::output::IStockUnitOfWork> {
                auto unit = std::make_unique<UnitOfWork>(*settings_);
                if (!unit->lock(itemId)) {
                    return nullptr;
                }
                return unit;
            });
    }

private:
    static constexpr const char* COMPONENT = "PostgresInventoryRepository";
    static constexpr const char* CHECK_VIOLATION = "23514";

    std::shared_ptr<settings::DbSettings> settings_;

    /**
     * @brief Транзакция с заблокированной строкой позиции (FOR UPDATE)
     */
    class UnitOfWork : public ports::output::IStockUnitOfWork {
    public:
        explicit UnitOfWork(const settings::DbSettings& settings)
            : conn_(settings.getConnectionString())
            , txn_(conn_)
        {
            postgres::applyLockTimeout(txn_, settings);
        }

        bool lock(const std::string& itemId) {
            auto result = txn_.exec_params(
                "SELECT " + itemColumns() + " FROM inventory_items WHERE id = $1 FOR UPDATE",
                itemId
            );
            if (result.empty()) {
                return false;
            }
            item_ = rowToItem(result[0]);
            return true;
        }

        const domain::InventoryItem& item() const override {
            return item_;
        }

        int64_t append(const domain::StockTransaction& transaction) override {
            auto sequence = postgres::guarded(COMPONENT, "append", [&]() -> int64_t {
                try {
                    auto inserted = txn_.exec_params(
                        "INSERT INTO stock_transactions (id, item_id, kind, quantity, delta, balance_after, "
                        "reason, actor, reference_id, expiry_date, created_at) "
                        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10::timestamptz, $11::timestamptz) "
                        "RETURNING seq",
                        transaction.id,
                        transaction.itemId,
                        domain::toString(transaction.kind),
                        transaction.quantity,
                        transaction.delta,
                        transaction.balanceAfter,
                        transaction.reason,
                        transaction.actor,
                        transaction.referenceId,
                        postgres::optionalTimestampParam(transaction.expiryDate),
                        transaction.createdAt.toString()
                    );

                    txn_.exec_params(
                        "UPDATE inventory_items SET current_stock = $2, updated_at = $3::timestamptz "
                        "WHERE id = $1",
                        transaction.itemId,
                        transaction.balanceAfter,
                        transaction.createdAt.toString()
                    );
                    return inserted[0]["seq"].as<int64_t>();
                } catch (const pqxx::sql_error& e) {
                    if (e.sqlstate() == CHECK_VIOLATION) {
                        throw domain::InsufficientStockException(
                            item_.id, item_.currentStock, transaction.delta);
                    }
                    throw;
                }
            });

            item_.currentStock = transaction.balanceAfter;
            item_.updatedAt = transaction.createdAt;
            return sequence;
        }

        void commit() override {
            postgres::guarded(COMPONENT, "commit", [&] {
                txn_.commit();
            });
        }

    private:
        pqxx::connection conn_;
        pqxx::work txn_;
        domain::InventoryItem item_;
    };

    static std::string itemColumns() {
        return "id, property_id, sku, name, unit, current_stock, min_stock, max_stock, "
               "reorder_point, reorder_quantity, unit_cost_units, unit_cost_nano, currency, status, " +
               postgres::micros("created_at") + ", " + postgres::micros("updated_at");
    }

    static std::string transactionColumns(const std::string& prefix = "") {
        return prefix + "id, " + prefix + "item_id, " + prefix + "kind, " + prefix + "quantity, " +
               prefix + "delta, " + prefix + "balance_after, " + prefix + "reason, " + prefix + "actor, " +
               prefix + "reference_id, " + prefix + "seq, " +
               "(EXTRACT(EPOCH FROM " + prefix + "expiry_date) * 1000000)::BIGINT AS expiry_date_us, " +
               "(EXTRACT(EPOCH FROM " + prefix + "created_at) * 1000000)::BIGINT AS created_at_us";
    }

    static domain::InventoryItem rowToItem(const pqxx::row& row) {
        domain::InventoryItem item;
        item.id = row["id"].as<std::string>();
        item.propertyId = row["property_id"].as<std::string>();
        item.sku = row["sku"].as<std::string>();
        item.name = row["name"].as<std::string>();
        item.unit = domain::unitOfMeasureFromString(row["unit"].as<std::string>());
        item.currentStock = row["current_stock"].as<int64_t>();
        item.minStock = row["min_stock"].as<int64_t>();
        if (!row["max_stock"].is_null()) {
            item.maxStock = row["max_stock"].as<int64_t>();
        }
        item.reorderPoint = row["reorder_point"].as<int64_t>();
        item.reorderQuantity = row["reorder_quantity"].as<int64_t>();
        item.unitCost = domain::Money(
            row["unit_cost_units"].as<int64_t>(),
            row["unit_cost_nano"].as<int32_t>(),
            row["currency"].as<std::string>());
        item.status = domain::itemStatusFromString(row["status"].as<std::string>());
        item.createdAt = postgres::readTimestamp(row, "created_at");
        item.updatedAt = postgres::readTimestamp(row, "updated_at");
        return item;
    }

    static domain::StockTransaction rowToTransaction(const pqxx::row& row) {
        domain::StockTransaction tx;
        tx.id = row["id"].as<std::string>();
        tx.itemId = row["item_id"].as<std::string>();
        tx.kind = domain::transactionKindFromString(row["kind"].as<std::string>());
        tx.quantity = row["quantity"].as<int64_t>();
        tx.delta = row["delta"].as<int64_t>();
        tx.balanceAfter = row["balance_after"].as<int64_t>();
        tx.reason = row["reason"].as<std::string>();
        tx.actor = row["actor"].as<std::string>();
        tx.referenceId = postgres::readOptionalString(row, "reference_id");
        tx.expiryDate = postgres::readOptionalTimestamp(row, "expiry_date");
        tx.createdAt = postgres::readTimestamp(row, "created_at");
        tx.sequence = row["seq"].as<int64_t>();
        return tx;
    }

    static std::vector<domain::StockTransaction> rowsToTransactions(const pqxx::result& result) {
        std::vector<domain::StockTransaction> transactions;
        transactions.reserve(result.size());
        for (const auto& row : result) {
            transactions.push_back(rowToTransaction(row));
        }
        return transactions;
    }

    void initSchema() {
        postgres::guarded(COMPONENT, "initSchema", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS inventory_items (
                    id VARCHAR(64) PRIMARY KEY,
                    property_id VARCHAR(64) NOT NULL,
                    sku VARCHAR(64) NOT NULL,
                    name VARCHAR(255) NOT NULL,
                    unit VARCHAR(16) NOT NULL,
                    current_stock BIGINT NOT NULL DEFAULT 0 CHECK (current_stock >= 0),
                    min_stock BIGINT NOT NULL DEFAULT 0,
                    max_stock BIGINT,
                    reorder_point BIGINT NOT NULL DEFAULT 0,
                    reorder_quantity BIGINT NOT NULL DEFAULT 0,
                    unit_cost_units BIGINT NOT NULL DEFAULT 0,
                    unit_cost_nano INTEGER NOT NULL DEFAULT 0,
                    currency VARCHAR(3) NOT NULL DEFAULT 'NAD',
                    status VARCHAR(16) NOT NULL DEFAULT 'ACTIVE',
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS stock_transactions (
                    seq BIGSERIAL UNIQUE,
                    id VARCHAR(64) PRIMARY KEY,
                    item_id VARCHAR(64) NOT NULL REFERENCES inventory_items(id),
                    kind VARCHAR(16) NOT NULL,
                    quantity BIGINT NOT NULL CHECK (quantity >= 0),
                    delta BIGINT NOT NULL,
                    balance_after BIGINT NOT NULL CHECK (balance_after >= 0),
                    reason TEXT NOT NULL DEFAULT '',
                    actor VARCHAR(64) NOT NULL DEFAULT '',
                    reference_id VARCHAR(64),
                    expiry_date TIMESTAMPTZ,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_inventory_items_property ON inventory_items (property_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_stock_transactions_item ON stock_transactions (item_id, created_at)");

            txn.commit();
            std::cout << "[" << COMPONENT << "] Schema initialized" << std::endl;
        });
    }
};

} // namespace hospitality::adapters::secondary
