#pragma once

#include "enums/TransactionKind.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace hospitality::domain {

/**
 * @brief Запись складского журнала (append-only)
 *
 * quantity - модуль движения, delta - знаковое изменение остатка.
 * Для ADJUSTMENT quantity == |delta|.
 */
struct StockTransaction {
    std::string id;
    std::string itemId;
    TransactionKind kind = TransactionKind::PURCHASE;
    int64_t quantity = 0;
    int64_t delta = 0;
    int64_t balanceAfter = 0;           ///< Остаток сразу после записи
    std::string reason;
    std::string actor;                  ///< Кто провёл движение
    std::optional<std::string> referenceId;  ///< Заказ, накладная и т.п.
    std::optional<Timestamp> expiryDate;     ///< Срок годности поступившей партии
    Timestamp createdAt;
    int64_t sequence = 0;               ///< Порядок вставки, задаётся хранилищем
};

/**
 * @brief Результат сверки кэша остатка с журналом
 */
struct LedgerCheck {
    std::string itemId;
    int64_t cachedStock = 0;
    int64_t replayedStock = 0;
    size_t transactionCount = 0;

    bool isConsistent() const {
        return cachedStock == replayedStock && replayedStock >= 0;
    }
};

/**
 * @brief Партия с истекающим сроком годности
 */
struct ExpiringStock {
    std::string itemId;
    std::string itemName;
    std::string transactionId;
    int64_t quantity = 0;
    Timestamp expiryDate;
};

} // namespace hospitality::domain
