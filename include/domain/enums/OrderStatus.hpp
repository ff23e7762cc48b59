#pragma once

#include <string>
#include <stdexcept>

namespace hospitality::domain {

/**
 * @brief Статус заказа
 *
 * PENDING -> CONFIRMED -> PREPARING -> READY -> COMPLETED
 * CANCELLED достижим из PENDING, CONFIRMED, PREPARING.
 */
enum class OrderStatus {
    PENDING,    ///< Создан, состав можно менять
    CONFIRMED,  ///< Подтверждён, состав и итоги заморожены
    PREPARING,  ///< Готовится
    READY,      ///< Готов к выдаче
    COMPLETED,  ///< Выдан (финальный)
    CANCELLED   ///< Отменён (финальный)
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING:   return "PENDING";
        case OrderStatus::CONFIRMED: return "CONFIRMED";
        case OrderStatus::PREPARING: return "PREPARING";
        case OrderStatus::READY:     return "READY";
        case OrderStatus::COMPLETED: return "COMPLETED";
        case OrderStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderStatus orderStatusFromString(const std::string& str) {
    if (str == "PENDING")   return OrderStatus::PENDING;
    if (str == "CONFIRMED") return OrderStatus::CONFIRMED;
    if (str == "PREPARING") return OrderStatus::PREPARING;
    if (str == "READY")     return OrderStatus::READY;
    if (str == "COMPLETED") return OrderStatus::COMPLETED;
    if (str == "CANCELLED") return OrderStatus::CANCELLED;
    throw std::invalid_argument("Unknown OrderStatus: " + str);
}

/**
 * @brief Является ли статус финальным (заказ больше не может измениться)
 */
inline bool isFinalStatus(OrderStatus status) {
    return status == OrderStatus::COMPLETED || status == OrderStatus::CANCELLED;
}

/**
 * @brief Разрешён ли переход from -> to
 *
 * Таблица переходов фиксирована. Переход в тот же статус запрещён.
 */
inline bool canTransition(OrderStatus from, OrderStatus to) {
    switch (from) {
        case OrderStatus::PENDING:
            return to == OrderStatus::CONFIRMED || to == OrderStatus::CANCELLED;
        case OrderStatus::CONFIRMED:
            return to == OrderStatus::PREPARING || to == OrderStatus::CANCELLED;
        case OrderStatus::PREPARING:
            return to == OrderStatus::READY || to == OrderStatus::CANCELLED;
        case OrderStatus::READY:
            return to == OrderStatus::COMPLETED;
        case OrderStatus::COMPLETED:
        case OrderStatus::CANCELLED:
            return false;
    }
    return false;
}

/**
 * @brief Можно ли менять позиции заказа в данном статусе
 */
inline bool areItemsEditable(OrderStatus status) {
    return status == OrderStatus::PENDING;
}

} // namespace hospitality::domain
