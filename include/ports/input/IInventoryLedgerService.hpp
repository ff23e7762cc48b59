#pragma once

#include "domain/InventoryItem.hpp"
#include "domain/InventorySummary.hpp"
#include "domain/StockTransaction.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hospitality::ports::input {

/**
 * @brief Запрос на заведение складской позиции
 */
struct RegisterItemRequest {
    std::string propertyId;
    std::string sku;
    std::string name;
    domain::UnitOfMeasure unit = domain::UnitOfMeasure::PIECE;
    int64_t minStock = 0;
    std::optional<int64_t> maxStock;
    int64_t reorderPoint = 0;
    int64_t reorderQuantity = 0;
    domain::Money unitCost;
};

/**
 * @brief Запрос на движение по складу
 */
struct RecordTransactionRequest {
    std::string itemId;
    domain::TransactionKind kind = domain::TransactionKind::PURCHASE;
    int64_t quantity = 0;       ///< Модуль, знак задаёт kind
    std::string reason;
    std::string actor;
    std::optional<std::string> referenceId;
    std::optional<domain::Timestamp> expiryDate;
};

/**
 * @brief Интерфейс складского журнала
 */
class IInventoryLedgerService {
public:
    virtual ~IInventoryLedgerService() = default;

    virtual domain::InventoryItem registerItem(const RegisterItemRequest& request) = 0;

    /**
     * @brief Провести движение и обновить кэш остатка в одной транзакции
     * @throws domain::InsufficientStockException если остаток ушёл бы в минус
     */
    virtual domain::StockTransaction recordTransaction(const RecordTransactionRequest& request) = 0;

    /**
     * @brief Корректировка до целевого остатка синтетической записью ADJUSTMENT
     */
    virtual domain::StockTransaction adjustStock(
        const std::string& itemId,
        int64_t targetLevel,
        const std::string& reason,
        const std::string& actor
    ) = 0;

    /**
     * @brief Журнал позиции, новые первыми
     */
    virtual std::vector<domain::StockTransaction> getTransactionHistory(
        const std::string& itemId,
        size_t limit
    ) = 0;

    virtual std::optional<domain::InventoryItem> getItem(const std::string& itemId) = 0;

    virtual std::vector<domain::InventoryItem> listItems(const std::string& propertyId) = 0;

    virtual std::vector<domain::InventoryItem> getLowStockItems(const std::string& propertyId) = 0;

    virtual std::vector<domain::ExpiringStock> getExpiringStock(
        const std::string& propertyId,
        std::chrono::hours horizon
    ) = 0;

    virtual domain::InventorySummary getInventorySummary(const std::string& propertyId) = 0;

    /**
     * @brief Сверить кэш остатка с суммой журнала
     */
    virtual domain::LedgerCheck verifyLedger(const std::string& itemId) = 0;
};

} // namespace hospitality::ports::input
