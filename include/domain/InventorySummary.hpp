#pragma once

#include "Money.hpp"
#include <cstddef>
#include <string>

namespace hospitality::domain {

/**
 * @brief Сводка по складу объекта
 */
struct InventorySummary {
    std::string propertyId;
    size_t totalItems = 0;
    size_t activeItems = 0;
    size_t lowStockItems = 0;
    size_t outOfStockItems = 0;
    size_t reorderItems = 0;        // остаток <= reorderPoint
    size_t overstockItems = 0;      // остаток >= maxStock
    Money totalValue;
    double averageStockLevel = 0.0;
};

} // namespace hospitality::domain
