#pragma once

#include <string>
#include <stdexcept>

namespace hospitality::domain {

/**
 * @brief Способ обслуживания заказа
 */
enum class OrderType {
    DINE_IN,    ///< В зале
    TAKEAWAY,   ///< С собой
    DELIVERY,   ///< Доставка
    PICKUP      ///< Самовывоз
};

inline std::string toString(OrderType type) {
    switch (type) {
        case OrderType::DINE_IN:  return "DINE_IN";
        case OrderType::TAKEAWAY: return "TAKEAWAY";
        case OrderType::DELIVERY: return "DELIVERY";
        case OrderType::PICKUP:   return "PICKUP";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderType orderTypeFromString(const std::string& str) {
    if (str == "DINE_IN")  return OrderType::DINE_IN;
    if (str == "TAKEAWAY") return OrderType::TAKEAWAY;
    if (str == "DELIVERY") return OrderType::DELIVERY;
    if (str == "PICKUP")   return OrderType::PICKUP;
    throw std::invalid_argument("Unknown OrderType: " + str);
}

} // namespace hospitality::domain
