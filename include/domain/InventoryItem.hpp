#pragma once

#include "enums/ItemStatus.hpp"
#include "enums/UnitOfMeasure.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace hospitality::domain {

/**
 * @brief Складская позиция
 *
 * currentStock - кэш суммы дельт всех StockTransaction позиции.
 * Пишется только вместе с вставкой транзакции.
 */
struct InventoryItem {
    std::string id;
    std::string propertyId;
    std::string sku;
    std::string name;
    UnitOfMeasure unit = UnitOfMeasure::PIECE;
    int64_t currentStock = 0;
    int64_t minStock = 0;
    std::optional<int64_t> maxStock;
    int64_t reorderPoint = 0;
    int64_t reorderQuantity = 0;
    Money unitCost;
    ItemStatus status = ItemStatus::ACTIVE;
    Timestamp createdAt;
    Timestamp updatedAt;

    bool isActive() const {
        return status == ItemStatus::ACTIVE;
    }

    bool isLowStock() const {
        return currentStock <= minStock;
    }

    bool isOutOfStock() const {
        return currentStock == 0;
    }

    bool isOverstock() const {
        return maxStock.has_value() && currentStock >= *maxStock;
    }

    bool needsReorder() const {
        return currentStock <= reorderPoint;
    }

    /**
     * @brief Стоимость остатка по учётной цене
     */
    Money stockValue() const {
        return unitCost * currentStock;
    }
};

} // namespace hospitality::domain
