#pragma once

#include "domain/InventoryItem.hpp"
#include "domain/StockTransaction.hpp"
#include "domain/Timestamp.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hospitality::ports::output {

/**
 * @brief Единица работы над агрегатом "позиция + журнал движений"
 *
 * Пока объект жив, строка позиции заблокирована (SELECT ... FOR UPDATE).
 * Уничтожение без commit() = откат.
 */
class IStockUnitOfWork {
public:
    virtual ~IStockUnitOfWork() = default;

    /**
     * @brief Позиция в состоянии на момент блокировки (с учётом append)
     */
    virtual const domain::InventoryItem& item() const = 0;

    /**
     * @brief Вставить запись журнала и выставить кэш остатка в balanceAfter
     * @return Порядковый номер вставки, назначенный хранилищем
     * @throws domain::InsufficientStockException если хранилище отвергло отрицательный остаток
     */
    virtual int64_t append(const domain::StockTransaction& transaction) = 0;

    /**
     * @throws domain::InsufficientStockException если хранилище отвергло отрицательный остаток
     */
    virtual void commit() = 0;
};

/**
 * @brief Интерфейс хранилища складских позиций и журнала
 */
class IInventoryRepository {
public:
    virtual ~IInventoryRepository() = default;

    virtual void saveItem(const domain::InventoryItem& item) = 0;

    virtual std::optional<domain::InventoryItem> findItem(const std::string& itemId) = 0;

    virtual std::vector<domain::InventoryItem> findItemsByProperty(const std::string& propertyId) = 0;

    /**
     * @brief Журнал позиции: новые первыми (время, затем порядок вставки)
     */
    virtual std::vector<domain::StockTransaction> findTransactions(const std::string& itemId, size_t limit) = 0;

    /**
     * @brief Полный журнал позиции в порядке вставки (для сверки)
     */
    virtual std::vector<domain::StockTransaction> findAllTransactions(const std::string& itemId) = 0;

    /**
     * @brief Поступления с expiryDate <= before по позициям объекта
     */
    virtual std::vector<domain::StockTransaction> findExpiringReceipts(
        const std::string& propertyId,
        const domain::Timestamp& before
    ) = 0;

    /**
     * @brief Эксклюзивно заблокировать позицию
     * @return nullptr если позиция не найдена
     */
    virtual std::unique_ptr<IStockUnitOfWork> lockItem(const std::string& itemId) = 0;
};

} // namespace hospitality::ports::output
