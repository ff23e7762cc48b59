#pragma once

#include "enums/OrderStatus.hpp"
#include "enums/OrderType.hpp"
#include "OrderLineItem.hpp"
#include "OrderTotals.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace hospitality::domain {

/**
 * @brief Заказ ресторана / room service
 *
 * Позиции меняются только в PENDING, итоги фиксируются при подтверждении.
 */
struct Order {
    std::string id;             ///< UUID заказа
    std::string orderNumber;    ///< ORD-YYYYMMDDHHMMSS-XXXXXXXX
    std::string propertyId;
    std::string customerId;
    OrderType type = OrderType::DINE_IN;
    OrderStatus status = OrderStatus::PENDING;
    std::vector<OrderLineItem> items;
    Money tipAmount;
    Money deliveryFee;
    OrderTotals totals;
    Timestamp createdAt;
    Timestamp updatedAt;

    /**
     * @brief Проверить, является ли статус финальным
     */
    bool isFinal() const {
        return isFinalStatus(status);
    }

    bool areItemsEditable() const {
        return domain::areItemsEditable(status);
    }

    OrderLineItem* findItem(const std::string& lineId) {
        auto it = std::find_if(items.begin(), items.end(),
            [&lineId](const OrderLineItem& item) { return item.id == lineId; });
        return it != items.end() ? &(*it) : nullptr;
    }
};

/**
 * @brief Запись журнала статусов заказа (append-only)
 */
struct OrderStatusHistoryEntry {
    std::string orderId;
    std::optional<OrderStatus> previousStatus;  ///< Пусто для записи о создании
    OrderStatus status = OrderStatus::PENDING;
    std::string actor;
    std::string notes;
    Timestamp createdAt;
    int64_t sequence = 0;   ///< Порядок вставки, задаётся хранилищем
};

} // namespace hospitality::domain
