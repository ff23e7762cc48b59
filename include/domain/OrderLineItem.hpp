#pragma once

#include "Money.hpp"
#include <cstdint>
#include <string>

namespace hospitality::domain {

/**
 * @brief Позиция заказа
 */
struct OrderLineItem {
    std::string id;             ///< ID строки внутри заказа
    std::string menuItemId;
    std::string name;
    int64_t quantity = 1;
    Money unitPrice;
    std::string specialInstructions;

    Money lineTotal() const {
        return unitPrice * quantity;
    }
};

} // namespace hospitality::domain
