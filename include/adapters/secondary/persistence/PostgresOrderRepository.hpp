// include/adapters/secondary/persistence/PostgresOrderRepository.hpp
#pragma once

#include "ports/output/IOrderRepository.hpp"
#include "adapters/secondary/persistence/PostgresSupport.hpp"
#include "settings/DbSettings.hpp"
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace hospitality::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория заказов
 *
 * Таблица: orders
 * - status VARCHAR(16) - строка OrderStatus
 * - items JSONB - снимок позиций заказа
 * - *_cents BIGINT - итоги в центах
 *
 * Таблица: order_status_history (append-only, seq BIGSERIAL)
 */
class PostgresOrderRepository : public ports::output::IOrderRepository {
public:
    explicit PostgresOrderRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    void create(const domain::Order& order, const domain::OrderStatusHistoryEntry& initialEntry) override {
        postgres::guarded(COMPONENT, "create", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO orders (id, order_number, property_id, customer_id, order_type, status, items, "
                "subtotal_cents, tax_cents, tip_cents, delivery_fee_cents, total_cents, currency, "
                "created_at, updated_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7::jsonb, $8, $9, $10, $11, $12, $13, "
                "$14::timestamptz, $15::timestamptz)",
                order.id,
                order.orderNumber,
                order.propertyId,
                order.customerId,
                domain::toString(order.type),
                domain::toString(order.status),
                itemsToJson(order.items).dump(),
                order.totals.subtotal.toCents(),
                order.totals.taxAmount.toCents(),
                order.totals.tipAmount.toCents(),
                order.totals.deliveryFee.toCents(),
                order.totals.total.toCents(),
                order.totals.total.currency,
                order.createdAt.toString(),
                order.updatedAt.toString()
            );
            insertHistory(txn, initialEntry);

            txn.commit();
            std::cout << "[" << COMPONENT << "] Created order " << order.orderNumber << std::endl;
        });
    }

    std::optional<domain::Order> findById(const std::string& orderId) override {
        return postgres::guarded(COMPONENT, "findById", [&]() -> std::optional<domain::Order> {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + orderColumns() + " FROM orders WHERE id = $1",
                orderId
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToOrder(result[0]);
        });
    }

    std::vector<domain::Order> findByProperty(
        const std::string& propertyId,
        std::optional<domain::OrderStatus> status
    ) override {
        return postgres::guarded(COMPONENT, "findByProperty", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            std::optional<std::string> statusFilter;
            if (status) {
                statusFilter = domain::toString(*status);
            }

            auto result = txn.exec_params(
                "SELECT " + orderColumns() + " FROM orders "
                "WHERE property_id = $1 AND ($2::varchar IS NULL OR status = $2) "
                "ORDER BY created_at DESC",
                propertyId,
                statusFilter
            );

            std::vector<domain::Order> orders;
            for (const auto& row : result) {
                orders.push_back(rowToOrder(row));
            }
            return orders;
        });
    }

    std::vector<domain::OrderStatusHistoryEntry> findHistory(const std::string& orderId) override {
        return postgres::guarded(COMPONENT, "findHistory", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT order_id, previous_status, status, actor, notes, seq, " +
                postgres::micros("created_at") + " FROM order_status_history "
                "WHERE order_id = $1 ORDER BY seq",
                orderId
            );

            std::vector<domain::OrderStatusHistoryEntry> history;
            for (const auto& row : result) {
                domain::OrderStatusHistoryEntry entry;
                entry.orderId = row["order_id"].as<std::string>();
                if (!row["previous_status"].is_null()) {
                    entry.previousStatus = domain::orderStatusFromString(row["previous_status"].as<std::string>());
                }
                entry.status = domain::orderStatusFromString(row["status"].as<std::string>());
                entry.actor = row["actor"].as<std::string>();
                entry.notes = row["notes"].as<std::string>();
                entry.createdAt = postgres::readTimestamp(row, "created_at");
                entry.sequence = row["seq"].as<int64_t>();
                history.push_back(entry);
            }
            return history;
        });
    }

    std::unique_ptr<ports::output::IOrderUnitOfWork> lockOrder(const std::string& orderId) override {
        return postgres::guarded(COMPONENT, "lockOrder",
            [&]() -> std::unique_ptr<ports::output::IOrderUnitOfWork> {
                auto unit = std::make_unique<UnitOfWork>(*settings_);
                if (!unit->lock(orderId)) {
                    return nullptr;
                }
                return unit;
            });
    }

private:
    static constexpr const char* COMPONENT = "PostgresOrderRepository";

    std::shared_ptr<settings::DbSettings> settings_;

    class UnitOfWork : public ports::output::IOrderUnitOfWork {
    public:
        explicit UnitOfWork(const settings::DbSettings& settings)
            : conn_(settings.getConnectionString())
            , txn_(conn_)
        {
            postgres::applyLockTimeout(txn_, settings);
        }

        bool lock(const std::string& orderId) {
            auto result = txn_.exec_params(
                "SELECT " + orderColumns() + " FROM orders WHERE id = $1 FOR UPDATE",
                orderId
            );
            if (result.empty()) {
                return false;
            }
            order_ = rowToOrder(result[0]);
            return true;
        }

        const domain::Order& order() const override {
            return order_;
        }

        void update(const domain::Order& order) override {
            postgres::guarded(COMPONENT, "update", [&] {
                auto result = txn_.exec_params(
                    "UPDATE orders SET status = $3, items = $4::jsonb, "
                    "subtotal_cents = $5, tax_cents = $6, tip_cents = $7, delivery_fee_cents = $8, "
                    "total_cents = $9, currency = $10, updated_at = $11::timestamptz "
                    "WHERE id = $1 AND status = $2",
                    order.id,
                    domain::toString(order_.status),
                    domain::toString(order.status),
                    itemsToJson(order.items).dump(),
                    order.totals.subtotal.toCents(),
                    order.totals.taxAmount.toCents(),
                    order.totals.tipAmount.toCents(),
                    order.totals.deliveryFee.toCents(),
                    order.totals.total.toCents(),
                    order.totals.total.currency,
                    order.updatedAt.toString()
                );
                if (result.affected_rows() == 0) {
                    throw domain::InvalidTransitionException(
                        order.id, domain::toString(order_.status), domain::toString(order.status));
                }
            });
        }

        void appendHistory(const domain::OrderStatusHistoryEntry& entry) override {
            postgres::guarded(COMPONENT, "appendHistory", [&] {
                insertHistory(txn_, entry);
            });
        }

        void commit() override {
            postgres::guarded(COMPONENT, "commit", [&] {
                txn_.commit();
            });
        }

    private:
        pqxx::connection conn_;
        pqxx::work txn_;
        domain::Order order_;
    };

    static std::string orderColumns() {
        return "id, order_number, property_id, customer_id, order_type, status, items::text AS items, "
               "subtotal_cents, tax_cents, tip_cents, delivery_fee_cents, total_cents, currency, " +
               postgres::micros("created_at") + ", " + postgres::micros("updated_at");
    }

    static void insertHistory(pqxx::work& txn, const domain::OrderStatusHistoryEntry& entry) {
        std::optional<std::string> previous;
        if (entry.previousStatus) {
            previous = domain::toString(*entry.previousStatus);
        }

        txn.exec_params(
            "INSERT INTO order_status_history (order_id, previous_status, status, actor, notes, created_at) "
            "VALUES ($1, $2, $3, $4, $5, $6::timestamptz)",
            entry.orderId,
            previous,
            domain::toString(entry.status),
            entry.actor,
            entry.notes,
            entry.createdAt.toString()
        );
    }

    static nlohmann::json itemsToJson(const std::vector<domain::OrderLineItem>& items) {
        auto json = nlohmann::json::array();
        for (const auto& item : items) {
            json.push_back({
                {"id", item.id},
                {"menuItemId", item.menuItemId},
                {"name", item.name},
                {"quantity", item.quantity},
                {"unitPrice", {
                    {"units", item.unitPrice.units},
                    {"nano", item.unitPrice.nano},
                    {"currency", item.unitPrice.currency}
                }},
                {"specialInstructions", item.specialInstructions}
            });
        }
        return json;
    }

    static std::vector<domain::OrderLineItem> itemsFromJson(const std::string& text) {
        std::vector<domain::OrderLineItem> items;
        for (const auto& json : nlohmann::json::parse(text)) {
            domain::OrderLineItem item;
            item.id = json.at("id").get<std::string>();
            item.menuItemId = json.at("menuItemId").get<std::string>();
            item.name = json.at("name").get<std::string>();
            item.quantity = json.at("quantity").get<int64_t>();
            const auto& price = json.at("unitPrice");
            item.unitPrice = domain::Money(
                price.at("units").get<int64_t>(),
                price.at("nano").get<int32_t>(),
                price.at("currency").get<std::string>());
            item.specialInstructions = json.value("specialInstructions", "");
            items.push_back(item);
        }
        return items;
    }

    static domain::Order rowToOrder(const pqxx::row& row) {
        domain::Order order;
        order.id = row["id"].as<std::string>();
        order.orderNumber = row["order_number"].as<std::string>();
        order.propertyId = row["property_id"].as<std::string>();
        order.customerId = row["customer_id"].as<std::string>();
        order.type = domain::orderTypeFromString(row["order_type"].as<std::string>());
        order.status = domain::orderStatusFromString(row["status"].as<std::string>());
        order.items = itemsFromJson(row["items"].as<std::string>());

        auto currency = row["currency"].as<std::string>();
        order.totals.subtotal = domain::Money::fromCents(row["subtotal_cents"].as<int64_t>(), currency);
        order.totals.taxAmount = domain::Money::fromCents(row["tax_cents"].as<int64_t>(), currency);
        order.totals.tipAmount = domain::Money::fromCents(row["tip_cents"].as<int64_t>(), currency);
        order.totals.deliveryFee = domain::Money::fromCents(row["delivery_fee_cents"].as<int64_t>(), currency);
        order.totals.total = domain::Money::fromCents(row["total_cents"].as<int64_t>(), currency);
        order.tipAmount = order.totals.tipAmount;
        order.deliveryFee = order.totals.deliveryFee;

        order.createdAt = postgres::readTimestamp(row, "created_at");
        order.updatedAt = postgres::readTimestamp(row, "updated_at");
        return order;
    }

    void initSchema() {
        postgres::guarded(COMPONENT, "initSchema", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS orders (
                    id VARCHAR(64) PRIMARY KEY,
                    order_number VARCHAR(64) NOT NULL UNIQUE,
                    property_id VARCHAR(64) NOT NULL,
                    customer_id VARCHAR(64) NOT NULL,
                    order_type VARCHAR(16) NOT NULL,
                    status VARCHAR(16) NOT NULL,
                    items JSONB NOT NULL DEFAULT '[]',
                    subtotal_cents BIGINT NOT NULL DEFAULT 0,
                    tax_cents BIGINT NOT NULL DEFAULT 0,
                    tip_cents BIGINT NOT NULL DEFAULT 0,
                    delivery_fee_cents BIGINT NOT NULL DEFAULT 0,
                    total_cents BIGINT NOT NULL DEFAULT 0,
                    currency VARCHAR(3) NOT NULL DEFAULT 'NAD',
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS order_status_history (
                    seq BIGSERIAL PRIMARY KEY,
                    order_id VARCHAR(64) NOT NULL REFERENCES orders(id),
                    previous_status VARCHAR(16),
                    status VARCHAR(16) NOT NULL,
                    actor VARCHAR(64) NOT NULL DEFAULT '',
                    notes TEXT NOT NULL DEFAULT '',
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_orders_property ON orders (property_id, created_at DESC)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_order_history_order ON order_status_history (order_id, seq)");

            txn.commit();
            std::cout << "[" << COMPONENT << "] Schema initialized" << std::endl;
        });
    }
};

} // namespace hospitality::adapters::secondary
