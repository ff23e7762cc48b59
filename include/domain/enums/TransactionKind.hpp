#pragma once

#include <string>
#include <stdexcept>
#include <cstdint>

namespace hospitality::domain {

/**
 * @brief Вид движения по складу
 */
enum class TransactionKind {
    PURCHASE,   ///< Поступление от поставщика
    SALE,       ///< Списание в продажу
    ADJUSTMENT, ///< Ручная корректировка (инвентаризация)
    WASTE,      ///< Порча / утилизация
    RETURN      ///< Возврат на склад
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::PURCHASE:   return "PURCHASE";
        case TransactionKind::SALE:       return "SALE";
        case TransactionKind::ADJUSTMENT: return "ADJUSTMENT";
        case TransactionKind::WASTE:      return "WASTE";
        case TransactionKind::RETURN:     return "RETURN";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionKind transactionKindFromString(const std::string& str) {
    if (str == "PURCHASE")   return TransactionKind::PURCHASE;
    if (str == "SALE")       return TransactionKind::SALE;
    if (str == "ADJUSTMENT") return TransactionKind::ADJUSTMENT;
    if (str == "WASTE")      return TransactionKind::WASTE;
    if (str == "RETURN")     return TransactionKind::RETURN;
    throw std::invalid_argument("Unknown TransactionKind: " + str);
}

/**
 * @brief Увеличивает ли движение остаток
 */
inline bool isIncrease(TransactionKind kind) {
    return kind == TransactionKind::PURCHASE || kind == TransactionKind::RETURN;
}

/**
 * @brief Уменьшает ли движение остаток
 */
inline bool isDecrease(TransactionKind kind) {
    return kind == TransactionKind::SALE || kind == TransactionKind::WASTE;
}

/**
 * @brief Знаковая дельта для модуля количества
 *
 * Для ADJUSTMENT знак задаёт вызывающий, здесь он не определён.
 * @throws std::invalid_argument для ADJUSTMENT
 */
inline int64_t signedDelta(TransactionKind kind, int64_t quantity) {
    if (isIncrease(kind)) return quantity;
    if (isDecrease(kind)) return -quantity;
    throw std::invalid_argument("Signed delta is undefined for " + toString(kind));
}

} // namespace hospitality::domain
